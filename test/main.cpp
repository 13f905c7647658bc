/*
 * Copyright (C) 2017 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#define LOG_TAG "LibDeviationTest"

#include <set>
#include <vector>

#include <deviation/DiagnosticsLedger.h>
#include <deviation/NodeKind.h>
#include <deviation/parse_string.h>
#include <deviation/parse_xml.h>

#include <android-base/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "utils-fake.h"

namespace dbus {
namespace deviation {

using ::testing::NiceMock;

static const std::string kSourceId = "test.xml";

// Opening <node> tag binding the tp: and doc: prefixes.
static const std::string kNodeWithNamespaces =
    "<node xmlns:tp='http://telepathy.freedesktop.org/wiki/DbusSpec#extensions-v0'"
    " xmlns:doc='http://www.freedesktop.org/dbus/1.0/doc.dtd'>";

static const std::string kDocElements =
    "<tp:docstring>Ignore me.</tp:docstring>"
    "<doc:doc>Ignore me.</doc:doc>";

struct LibDeviationTest : public ::testing::Test {
   public:
    virtual void SetUp() override { mLedger.reset(); }
    virtual void TearDown() override {}

    bool parseXml(const std::string& xml, bool recover, InterfaceMap* out,
                  ParseError* error = nullptr) {
        InterfaceParser parser(&mLedger);
        return parser.parse(xml, kSourceId, recover, out, error);
    }

    // Parse a valid document; fail the test otherwise.
    InterfaceMap parseValid(const std::string& xml) {
        InterfaceMap interfaces;
        ParseError error;
        EXPECT_TRUE(parseXml(xml, false, &interfaces, &error)) << error.message;
        return interfaces;
    }

    // Parse an invalid document in fail-fast mode and return the error.
    ParseError parseInvalid(const std::string& xml) {
        InterfaceMap interfaces;
        ParseError error;
        EXPECT_FALSE(parseXml(xml, false, &interfaces, &error)) << dump(interfaces);
        EXPECT_TRUE(interfaces.empty());
        EXPECT_TRUE(mLedger.empty());
        return error;
    }

    // Parse an invalid document in recovery mode and compare the ledger to
    // the expected (code, message) pairs.
    void expectRecovered(const std::string& xml,
                         const std::vector<std::pair<std::string, std::string>>& expected) {
        mLedger.reset();
        InterfaceMap interfaces;
        EXPECT_FALSE(parseXml(xml, true, &interfaces));
        EXPECT_TRUE(interfaces.empty());
        std::vector<LedgerEntry> entries;
        for (const auto& pair : expected) {
            entries.push_back(LedgerEntry{kSourceId, kParserStage, pair.first, pair.second});
        }
        EXPECT_EQ(entries, mLedger.entries());
    }

    DiagnosticsLedger mLedger;
};

TEST_F(LibDeviationTest, UnknownRootNode) {
    ParseError error = parseInvalid("<notnode><irrelevant/></notnode>");
    EXPECT_EQ(ErrorKind::UNKNOWN_NODE, error.kind);
    EXPECT_EQ("unknown-root-node", error.code);
    EXPECT_EQ("Unknown root node 'notnode'.", error.message);
}

TEST_F(LibDeviationTest, DuplicateInterface) {
    ParseError error = parseInvalid("<node><interface name='I'/><interface name='I'/></node>");
    EXPECT_EQ(ErrorKind::DUPLICATE_NODE, error.kind);
    EXPECT_EQ("duplicate-node", error.code);
    EXPECT_EQ("Duplicate interface definition 'I'.", error.message);
}

TEST_F(LibDeviationTest, UnknownInterfaceNode) {
    ParseError error = parseInvalid("<node><badnode/></node>");
    EXPECT_EQ(ErrorKind::UNKNOWN_NODE, error.kind);
    EXPECT_EQ("unknown-node", error.code);
    EXPECT_EQ("Unknown node 'badnode' in root.", error.message);
}

TEST_F(LibDeviationTest, InterfaceMissingName) {
    ParseError error = parseInvalid("<node><interface/></node>");
    EXPECT_EQ(ErrorKind::MISSING_ATTRIBUTE, error.kind);
    EXPECT_EQ("missing-attribute", error.code);
    EXPECT_EQ("Missing required attribute 'name' in interface.", error.message);
}

TEST_F(LibDeviationTest, DuplicateMembers) {
    EXPECT_EQ("Duplicate method definition 'I.M'.",
              parseInvalid("<node><interface name='I'>"
                           "<method name='M'/><method name='M'/>"
                           "</interface></node>")
                  .message);
    EXPECT_EQ("Duplicate signal definition 'I.S'.",
              parseInvalid("<node><interface name='I'>"
                           "<signal name='S'/><signal name='S'/>"
                           "</interface></node>")
                  .message);
    EXPECT_EQ("Duplicate property definition 'I.P'.",
              parseInvalid("<node><interface name='I'>"
                           "<property name='P' type='s' access='readwrite'/>"
                           "<property name='P' type='s' access='readwrite'/>"
                           "</interface></node>")
                  .message);
}

TEST_F(LibDeviationTest, MethodAndSignalMayShareName) {
    InterfaceMap interfaces = parseValid(
        "<node><interface name='I'>"
        "<method name='Changed'/><signal name='Changed'/>"
        "</interface></node>");
    const Interface* interface = interfaces.get("I");
    ASSERT_NE(nullptr, interface);
    EXPECT_TRUE(interface->methods.has("Changed"));
    EXPECT_TRUE(interface->signals.has("Changed"));
}

TEST_F(LibDeviationTest, UnknownNodeContexts) {
    EXPECT_EQ("Unknown node 'badnode' in interface 'I'.",
              parseInvalid("<node><interface name='I'><badnode/></interface></node>").message);
    EXPECT_EQ("Unknown node 'badnode' in method 'M'.",
              parseInvalid("<node><interface name='I'>"
                           "<method name='M'><badnode/></method>"
                           "</interface></node>")
                  .message);
    EXPECT_EQ("Unknown node 'badnode' in signal 'S'.",
              parseInvalid("<node><interface name='I'>"
                           "<signal name='S'><badnode/></signal>"
                           "</interface></node>")
                  .message);
    EXPECT_EQ("Unknown node 'badnode' in property 'P'.",
              parseInvalid("<node><interface name='I'>"
                           "<property name='P' type='s' access='readwrite'><badnode/></property>"
                           "</interface></node>")
                  .message);
    EXPECT_EQ("Unknown node 'badnode' in argument 'unnamed'.",
              parseInvalid("<node><interface name='I'>"
                           "<method name='M'><arg type='s'><badnode/></arg></method>"
                           "</interface></node>")
                  .message);
    EXPECT_EQ("Unknown node 'badnode' in argument 'foo'.",
              parseInvalid("<node><interface name='I'>"
                           "<method name='M'><arg name='foo' type='s'><badnode/></arg></method>"
                           "</interface></node>")
                  .message);
    EXPECT_EQ("Unknown node 'badnode' in annotation 'N'.",
              parseInvalid("<node><interface name='I'>"
                           "<annotation name='N' value='V'><badnode/></annotation>"
                           "</interface></node>")
                  .message);
}

TEST_F(LibDeviationTest, MisplacedNode) {
    // An element valid elsewhere is still unknown in the wrong place.
    EXPECT_EQ("Unknown node 'method' in root.",
              parseInvalid("<node><method name='M'/></node>").message);
    EXPECT_EQ("Unknown node 'arg' in property 'P'.",
              parseInvalid("<node><interface name='I'>"
                           "<property name='P' type='s' access='read'><arg type='s'/></property>"
                           "</interface></node>")
                  .message);
    EXPECT_EQ("Unknown node 'Interface' in root.",
              parseInvalid("<node><Interface name='I'/></node>").message);
}

TEST_F(LibDeviationTest, MissingAttributes) {
    EXPECT_EQ("Missing required attribute 'name' in method.",
              parseInvalid("<node><interface name='I'><method/></interface></node>").message);
    EXPECT_EQ("Missing required attribute 'name' in signal.",
              parseInvalid("<node><interface name='I'><signal/></interface></node>").message);
    EXPECT_EQ("Missing required attribute 'name' in property.",
              parseInvalid("<node><interface name='I'>"
                           "<property type='s' access='readwrite'/>"
                           "</interface></node>")
                  .message);
    EXPECT_EQ("Missing required attribute 'type' in property.",
              parseInvalid("<node><interface name='I'>"
                           "<property name='P' access='readwrite'/>"
                           "</interface></node>")
                  .message);
    EXPECT_EQ("Missing required attribute 'access' in property.",
              parseInvalid("<node><interface name='I'>"
                           "<property name='P' type='s'/>"
                           "</interface></node>")
                  .message);
    EXPECT_EQ("Missing required attribute 'type' in arg.",
              parseInvalid("<node><interface name='I'>"
                           "<method name='M'><arg/></method>"
                           "</interface></node>")
                  .message);
    EXPECT_EQ("Missing required attribute 'name' in annotation.",
              parseInvalid("<node><interface name='I'>"
                           "<annotation value='V'/>"
                           "</interface></node>")
                  .message);
    EXPECT_EQ("Missing required attribute 'value' in annotation.",
              parseInvalid("<node><interface name='I'>"
                           "<annotation name='N'/>"
                           "</interface></node>")
                  .message);
}

TEST_F(LibDeviationTest, InvalidAttributes) {
    ParseError error = parseInvalid(
        "<node><interface name='I'>"
        "<property name='P' type='s' access='rw'/>"
        "</interface></node>");
    EXPECT_EQ(ErrorKind::INVALID_ATTRIBUTE, error.kind);
    EXPECT_EQ("invalid-attribute", error.code);
    EXPECT_EQ("Invalid value 'rw' for attribute 'access' in property.", error.message);

    error = parseInvalid(
        "<node><interface name='I'>"
        "<method name='M'><arg type='s' direction='sideways'/></method>"
        "</interface></node>");
    EXPECT_EQ(ErrorKind::INVALID_ATTRIBUTE, error.kind);
    EXPECT_EQ("Invalid value 'sideways' for attribute 'direction' in arg.", error.message);

    error = parseInvalid(
        "<node><interface name='I'>"
        "<method name='M'><arg type='s' direction=''/></method>"
        "</interface></node>");
    EXPECT_EQ("Invalid value '' for attribute 'direction' in arg.", error.message);
}

TEST_F(LibDeviationTest, MalformedDocument) {
    ParseError error = parseInvalid("<node><interface name='I'>");
    EXPECT_EQ(ErrorKind::MALFORMED_DOCUMENT, error.kind);
    EXPECT_EQ("malformed-document", error.code);
    EXPECT_EQ(0u, error.message.find("Malformed document: ")) << error.message;

    error = parseInvalid("");
    EXPECT_EQ(ErrorKind::MALFORMED_DOCUMENT, error.kind);
}

TEST_F(LibDeviationTest, FailureLeavesOutputUnchanged) {
    InterfaceMap interfaces = parseValid("<node><interface name='Kept'/></node>");
    ParseError error;
    EXPECT_FALSE(parseXml("<node><interface name='I'/><interface name='I'/></node>", false,
                          &interfaces, &error));
    EXPECT_EQ(1u, interfaces.size());
    EXPECT_TRUE(interfaces.has("Kept"));

    EXPECT_FALSE(parseXml("<node><interface name='I'/><interface name='I'/></node>", true,
                          &interfaces));
    EXPECT_EQ(1u, interfaces.size());
    EXPECT_TRUE(interfaces.has("Kept"));
}

TEST_F(LibDeviationTest, ParseModel) {
    InterfaceMap interfaces = parseValid(
        "<node>\n"
        "    <interface name='org.example.Foo'>\n"
        "        <method name='Frobnicate'>\n"
        "            <arg name='input' type='s' direction='in'/>\n"
        "            <arg type='a{sv}' direction='out'>\n"
        "                <annotation name='org.freedesktop.DBus.Deprecated' value='true'/>\n"
        "            </arg>\n"
        "            <annotation name='org.freedesktop.DBus.Method.NoReply' value='true'/>\n"
        "        </method>\n"
        "        <signal name='Frobnicated'>\n"
        "            <arg name='count' type='u'/>\n"
        "        </signal>\n"
        "        <property name='Size' type='t' access='readwrite'/>\n"
        "    </interface>\n"
        "    <interface name='org.example.Bar'/>\n"
        "</node>\n");
    EXPECT_EQ(2u, interfaces.size());
    EXPECT_EQ("org.example.Foo{m Frobnicate(in s input,out a{sv});s Frobnicated(u count);"
              "p Size t readwrite}:"
              "org.example.Bar{}",
              dump(interfaces));

    const Interface* foo = interfaces.get("org.example.Foo");
    ASSERT_NE(nullptr, foo);
    EXPECT_EQ("org.example.Foo", foo->formatName());
    EXPECT_EQ("", foo->parent);

    const Method* method = foo->methods.get("Frobnicate");
    ASSERT_NE(nullptr, method);
    EXPECT_EQ("org.example.Foo", method->parent);
    EXPECT_EQ("org.example.Foo.Frobnicate", method->formatName());
    EXPECT_TRUE(method->getBoolAnnotation(kNoReplyAnnotation, false));
    EXPECT_EQ("org.example.Foo.Frobnicate.@org.freedesktop.DBus.Method.NoReply",
              method->getAnnotation(kNoReplyAnnotation)->formatName());

    ASSERT_EQ(2u, method->arguments.size());
    const Argument& input = method->arguments[0];
    EXPECT_EQ(0u, input.index);
    EXPECT_EQ("input", input.name);
    EXPECT_EQ(Direction::IN, input.direction);
    EXPECT_EQ("org.example.Foo.Frobnicate", input.parent);
    EXPECT_EQ("0 ('input')", input.formatName());
    const Argument& output = method->arguments[1];
    EXPECT_EQ(1u, output.index);
    EXPECT_EQ("", output.name);
    EXPECT_EQ("unnamed", output.displayName());
    EXPECT_EQ("1", output.formatName());
    EXPECT_EQ(Direction::OUT, output.direction);
    EXPECT_TRUE(output.getBoolAnnotation(kDeprecatedAnnotation, false));

    const Signal* signal = foo->signals.get("Frobnicated");
    ASSERT_NE(nullptr, signal);
    ASSERT_EQ(1u, signal->arguments.size());
    EXPECT_EQ(Direction::UNSPECIFIED, signal->arguments[0].direction);

    const Property* property = foo->properties.get("Size");
    ASSERT_NE(nullptr, property);
    EXPECT_EQ("t", property->type);
    EXPECT_EQ(Access::READWRITE, property->access);
    EXPECT_EQ("org.example.Foo.Size", property->formatName());
    EXPECT_FALSE(property->getBoolAnnotation(kDeprecatedAnnotation, false));
    EXPECT_EQ("fallback", property->getStringAnnotation(kCSymbolAnnotation, "fallback"));
}

TEST_F(LibDeviationTest, DocumentOrder) {
    InterfaceMap interfaces = parseValid(
        "<node>"
        "<interface name='Zeta'>"
        "<method name='Z'/><method name='A'/><method name='M'/>"
        "<property name='Q' type='s' access='read'/><property name='B' type='s' access='read'/>"
        "</interface>"
        "<interface name='Alpha'/>"
        "</node>");
    std::vector<std::string> names;
    for (const auto& interface : interfaces) {
        names.push_back(interface.name);
    }
    EXPECT_EQ(std::vector<std::string>({"Zeta", "Alpha"}), names);

    names.clear();
    for (const auto& method : interfaces.get("Zeta")->methods) {
        names.push_back(method.name);
    }
    EXPECT_EQ(std::vector<std::string>({"Z", "A", "M"}), names);
    EXPECT_EQ("Zeta{m Z();m A();m M();p Q s read;p B s read}:Alpha{}", dump(interfaces));
}

TEST_F(LibDeviationTest, NodeGroup) {
    NodeGroup<Method> methods;
    Method second;
    second.name = "Second";
    Method first;
    first.name = "First";
    EXPECT_TRUE(methods.add(std::move(second)));
    EXPECT_TRUE(methods.add(std::move(first)));

    Method duplicate;
    duplicate.name = "Second";
    duplicate.comment = "rejected";
    EXPECT_FALSE(methods.add(std::move(duplicate)));

    ASSERT_EQ(2u, methods.size());
    EXPECT_EQ("Second", methods.begin()->name);
    ASSERT_NE(nullptr, methods.get("Second"));
    EXPECT_EQ("", methods.get("Second")->comment);
    EXPECT_NE(nullptr, methods.get("First"));
    EXPECT_EQ(nullptr, methods.get("Third"));

    NodeGroup<Method> reordered;
    Method a;
    a.name = "First";
    Method b;
    b.name = "Second";
    EXPECT_TRUE(reordered.add(std::move(a)));
    EXPECT_TRUE(reordered.add(std::move(b)));
    EXPECT_TRUE(methods != reordered);
}

TEST_F(LibDeviationTest, EmptyNode) {
    EXPECT_TRUE(parseValid("<node/>").empty());
}

TEST_F(LibDeviationTest, TpSpecRoot) {
    std::string node =
        "<node><interface name='I'><method name='M'><arg type='s'/></method></interface>"
        "<interface name='J'/></node>";
    InterfaceMap direct = parseValid(node);
    InterfaceMap wrapped = parseValid(
        "<tp:spec xmlns:tp='http://telepathy.freedesktop.org/wiki/DbusSpec#extensions-v0'>"
        "<tp:title>Title</tp:title>" +
        node + "</tp:spec>");
    EXPECT_EQ(2u, wrapped.size());
    EXPECT_TRUE(direct == wrapped) << dump(direct) << " vs " << dump(wrapped);
}

TEST_F(LibDeviationTest, TpSpecRootNeedsNamespace) {
    EXPECT_EQ("Unknown root node 'tp:spec'.",
              parseInvalid("<tp:spec><node/></tp:spec>").message);
    EXPECT_EQ("Unknown root node 'tp:spec'.",
              parseInvalid("<tp:spec xmlns:tp='http://example.com/other'><node/></tp:spec>")
                  .message);
}

TEST_F(LibDeviationTest, TpSpecRootNeedsOneNode) {
    std::string open =
        "<tp:spec xmlns:tp='http://telepathy.freedesktop.org/wiki/DbusSpec#extensions-v0'>";
    EXPECT_EQ("Unknown root node 'tp:spec'.", parseInvalid(open + "</tp:spec>").message);
    EXPECT_EQ("Unknown root node 'tp:spec'.",
              parseInvalid(open + "<node/><node/></tp:spec>").message);
}

TEST_F(LibDeviationTest, DocElementsIgnored) {
    parseValid(kNodeWithNamespaces + kDocElements + "</node>");
    parseValid(kNodeWithNamespaces + "<interface name='I'>" + kDocElements +
               "</interface></node>");
    parseValid(kNodeWithNamespaces + "<interface name='I'><method name='M'>" + kDocElements +
               "</method></interface></node>");
    parseValid(kNodeWithNamespaces + "<interface name='I'><signal name='S'>" + kDocElements +
               "</signal></interface></node>");
    parseValid(kNodeWithNamespaces + "<interface name='I'><property name='P' type='s' access='read'>" +
               kDocElements + "</property></interface></node>");
    parseValid(kNodeWithNamespaces + "<interface name='I'><method name='M'><arg type='s'>" +
               kDocElements + "</arg></method></interface></node>");
    parseValid(kNodeWithNamespaces + "<interface name='I'><annotation name='A' value='V'>" +
               kDocElements + "</annotation></interface></node>");
}

TEST_F(LibDeviationTest, DocElementsNeedNamespace) {
    // Without its xmlns binding, the prefix means nothing.
    EXPECT_EQ("Unknown node 'doc:doc' in root.",
              parseInvalid("<node><doc:doc>Not ignored.</doc:doc></node>").message);
}

TEST_F(LibDeviationTest, DocNamespaceOnElement) {
    // A binding on the element itself counts too.
    parseValid(
        "<node><interface name='I'>"
        "<d:doc xmlns:d='http://www.freedesktop.org/dbus/1.0/doc.dtd'>Ignore me.</d:doc>"
        "</interface></node>");
}

TEST_F(LibDeviationTest, Comments) {
    InterfaceMap interfaces = parseValid(kNodeWithNamespaces +
                                         "<!--Please consider me-->"
                                         "<interface name='I'>"
                                         "<!--Notice me too-->"
                                         "<method name='foo'>"
                                         "<!--And me!-->"
                                         "<arg name='bar' type='s'/>"
                                         "</method>"
                                         "</interface></node>");
    const Interface* interface = interfaces.get("I");
    ASSERT_NE(nullptr, interface);
    EXPECT_EQ("Please consider me", interface->comment);
    const Method* method = interface->methods.get("foo");
    ASSERT_NE(nullptr, method);
    EXPECT_EQ("Notice me too", method->comment);
    ASSERT_EQ(1u, method->arguments.size());
    EXPECT_EQ("And me!", method->arguments[0].comment);
}

TEST_F(LibDeviationTest, MultilineComments) {
    InterfaceMap interfaces = parseValid(kNodeWithNamespaces +
                                         "<!--"
                                         "    Please consider that\n"
                                         "    multiline comment"
                                         "-->"
                                         "<interface name='I'>"
                                         "</interface></node>");
    const Interface* interface = interfaces.get("I");
    ASSERT_NE(nullptr, interface);
    EXPECT_EQ("    Please consider that\n    multiline comment", interface->comment);
}

TEST_F(LibDeviationTest, IgnoredComments) {
    InterfaceMap interfaces = parseValid(kNodeWithNamespaces +
                                         "<!--Please ignore that comment-->"
                                         "<tp:copyright>"
                                         "</tp:copyright>"
                                         "<interface name='I'>"
                                         "</interface></node>");
    const Interface* interface = interfaces.get("I");
    ASSERT_NE(nullptr, interface);
    EXPECT_EQ("", interface->comment);
}

TEST_F(LibDeviationTest, CommentsDoNotCarryOver) {
    InterfaceMap interfaces = parseValid(
        "<node><interface name='I'>"
        "<!--first--><!--second-->"
        "<method name='A'/>"
        "<method name='B'/>"
        "</interface></node>");
    const Interface* interface = interfaces.get("I");
    ASSERT_NE(nullptr, interface);
    EXPECT_EQ("", interface->comment);
    EXPECT_EQ("second", interface->methods.get("A")->comment);
    EXPECT_EQ("", interface->methods.get("B")->comment);
}

TEST_F(LibDeviationTest, DocStringAnnotation) {
    InterfaceMap interfaces = parseValid(kNodeWithNamespaces +
                                         "<interface name='I'>"
                                         "<annotation name='org.gtk.GDBus.DocString' value='bla'/>"
                                         "</interface></node>");
    const Interface* interface = interfaces.get("I");
    ASSERT_NE(nullptr, interface);
    EXPECT_EQ("bla", interface->comment);
}

TEST_F(LibDeviationTest, DocStringOverridesComment) {
    InterfaceMap interfaces = parseValid(
        "<node><interface name='I'>"
        "<!--from the comment-->"
        "<method name='M'>"
        "<annotation name='org.gtk.GDBus.DocString' value='from the annotation'/>"
        "</method>"
        "</interface></node>");
    const Method* method = interfaces.get("I")->methods.get("M");
    ASSERT_NE(nullptr, method);
    EXPECT_EQ("from the annotation", method->comment);
}

TEST_F(LibDeviationTest, ErrorCodes) {
    std::vector<std::string> codes = DiagnosticsLedger::registeredCodes();
    EXPECT_FALSE(codes.empty());
    std::set<std::string> unique(codes.begin(), codes.end());
    EXPECT_EQ(codes.size(), unique.size());
    for (const auto& code : codes) {
        EXPECT_FALSE(code.empty());
    }
}

TEST_F(LibDeviationTest, EveryErrorCodeIsReachable) {
    const std::vector<std::string> inputs = {
        "<node>",
        "<notnode/>",
        "<node><badnode/></node>",
        "<node><interface/></node>",
        "<node><interface name='I'><property name='P' type='s' access='x'/></interface></node>",
        "<node><interface name='I'/><interface name='I'/></node>",
    };
    std::set<std::string> reached;
    for (const auto& xml : inputs) {
        reached.insert(parseInvalid(xml).code);
    }
    for (const auto& code : DiagnosticsLedger::registeredCodes()) {
        EXPECT_EQ(1u, reached.count(code)) << code << " is not reachable";
    }
}

TEST_F(LibDeviationTest, RecoverAnnotationInterface) {
    expectRecovered(
        "<node><interface name='I'>"
        "<annotation/><method/>"
        "</interface></node>",
        {
            {"missing-attribute", "Missing required attribute 'name' in annotation."},
            {"missing-attribute", "Missing required attribute 'value' in annotation."},
            {"missing-attribute", "Missing required attribute 'name' in method."},
        });
}

TEST_F(LibDeviationTest, RecoverAnnotationMethod) {
    expectRecovered(
        "<node><interface name='I'><method name='M'>"
        "<annotation/><arg/>"
        "</method></interface></node>",
        {
            {"missing-attribute", "Missing required attribute 'name' in annotation."},
            {"missing-attribute", "Missing required attribute 'value' in annotation."},
            {"missing-attribute", "Missing required attribute 'type' in arg."},
        });
}

TEST_F(LibDeviationTest, RecoverAnnotationSignal) {
    expectRecovered(
        "<node><interface name='I'><signal name='S'>"
        "<annotation/><arg/>"
        "</signal></interface></node>",
        {
            {"missing-attribute", "Missing required attribute 'name' in annotation."},
            {"missing-attribute", "Missing required attribute 'value' in annotation."},
            {"missing-attribute", "Missing required attribute 'type' in arg."},
        });
}

TEST_F(LibDeviationTest, RecoverAnnotationProperty) {
    expectRecovered(
        "<node><interface name='I'>"
        "<property name='P' type='s' access='read'>"
        "<annotation/><badnode/>"
        "</property>"
        "</interface></node>",
        {
            {"missing-attribute", "Missing required attribute 'name' in annotation."},
            {"missing-attribute", "Missing required attribute 'value' in annotation."},
            {"unknown-node", "Unknown node 'badnode' in property 'P'."},
        });
}

TEST_F(LibDeviationTest, RecoverAnnotationArg) {
    expectRecovered(
        "<node><interface name='I'><method name='M'><arg type='s'>"
        "<annotation/><badnode/>"
        "</arg></method></interface></node>",
        {
            {"missing-attribute", "Missing required attribute 'name' in annotation."},
            {"missing-attribute", "Missing required attribute 'value' in annotation."},
            {"unknown-node", "Unknown node 'badnode' in argument 'unnamed'."},
        });
}

TEST_F(LibDeviationTest, RecoverIndependentErrors) {
    expectRecovered(
        "<node>"
        "<interface name='I'><method/><badnode/></interface>"
        "<interface name='J'/>"
        "<interface name='J'/>"
        "</node>",
        {
            {"missing-attribute", "Missing required attribute 'name' in method."},
            {"unknown-node", "Unknown node 'badnode' in interface 'I'."},
            {"duplicate-node", "Duplicate interface definition 'J'."},
        });
}

TEST_F(LibDeviationTest, RecoverAllPropertyAttributes) {
    expectRecovered(
        "<node><interface name='I'><property/></interface></node>",
        {
            {"missing-attribute", "Missing required attribute 'name' in property."},
            {"missing-attribute", "Missing required attribute 'type' in property."},
            {"missing-attribute", "Missing required attribute 'access' in property."},
        });
}

TEST_F(LibDeviationTest, RecoverDocumentErrors) {
    expectRecovered("<notnode/>", {{"unknown-root-node", "Unknown root node 'notnode'."}});

    mLedger.reset();
    InterfaceMap interfaces;
    EXPECT_FALSE(parseXml("<node>", true, &interfaces));
    ASSERT_EQ(1u, mLedger.size());
    EXPECT_EQ("malformed-document", mLedger.entries()[0].code);
}

TEST_F(LibDeviationTest, RecoverValidDocument) {
    InterfaceMap interfaces;
    EXPECT_TRUE(parseXml("<node><interface name='I'/></node>", true, &interfaces));
    EXPECT_TRUE(mLedger.empty());
    EXPECT_EQ(1u, interfaces.size());
}

TEST_F(LibDeviationTest, GrammarTable) {
    const auto& table = grammarTable();
    for (size_t i = 0; i < table.size(); ++i) {
        EXPECT_EQ(i, static_cast<size_t>(table[i].kind));
    }
    EXPECT_EQ("arg", grammarOf(NodeKind::ARGUMENT).tag);
    EXPECT_EQ("argument", to_string(NodeKind::ARGUMENT));
    EXPECT_EQ(std::vector<std::string>({"name", "type", "access"}),
              grammarOf(NodeKind::PROPERTY).requiredAttributes);
    EXPECT_TRUE(grammarOf(NodeKind::ROOT).requiredAttributes.empty());
    EXPECT_TRUE(grammarOf(NodeKind::ANNOTATION).permittedChildren.empty());

    NodeKind kind;
    EXPECT_TRUE(lookupChildKind(NodeKind::ROOT, "interface", &kind));
    EXPECT_EQ(NodeKind::INTERFACE, kind);
    EXPECT_TRUE(lookupChildKind(NodeKind::SIGNAL, "arg", &kind));
    EXPECT_EQ(NodeKind::ARGUMENT, kind);
    EXPECT_FALSE(lookupChildKind(NodeKind::ROOT, "method", &kind));
    EXPECT_FALSE(lookupChildKind(NodeKind::PROPERTY, "arg", &kind));
    EXPECT_FALSE(lookupChildKind(NodeKind::ANNOTATION, "annotation", &kind));
}

TEST_F(LibDeviationTest, Ledger) {
    DiagnosticsLedger ledger;
    EXPECT_TRUE(ledger.empty());
    ledger.log("a.xml", "parser", "unknown-node", "first");
    ledger.log("b.xml", "parser", "duplicate-node", "second");
    ASSERT_EQ(2u, ledger.size());
    EXPECT_EQ((LedgerEntry{"a.xml", "parser", "unknown-node", "first"}), ledger.entries()[0]);
    EXPECT_EQ("b.xml", ledger.entries()[1].sourceId);
    ledger.reset();
    EXPECT_TRUE(ledger.empty());
}

TEST_F(LibDeviationTest, LedgerAccumulatesAcrossParses) {
    InterfaceMap interfaces;
    EXPECT_FALSE(parseXml("<node><interface/></node>", true, &interfaces));
    EXPECT_FALSE(parseXml("<node><badnode/></node>", true, &interfaces));
    ASSERT_EQ(2u, mLedger.size());
    EXPECT_EQ("missing-attribute", mLedger.entries()[0].code);
    EXPECT_EQ("unknown-node", mLedger.entries()[1].code);
}

TEST_F(LibDeviationTest, ErrorCodeRegistry) {
    EXPECT_EQ("unknown-root-node", errorCodeOf(ErrorCondition::UNKNOWN_ROOT_NODE).code);
    EXPECT_EQ(ErrorKind::UNKNOWN_NODE, errorCodeOf(ErrorCondition::UNKNOWN_ROOT_NODE).kind);
    EXPECT_EQ(ErrorKind::UNKNOWN_NODE, errorCodeOf(ErrorCondition::UNKNOWN_NODE).kind);
    EXPECT_EQ("duplicate-node", errorCodeOf(ErrorCondition::DUPLICATE_NODE).code);
    EXPECT_EQ("missing attribute", to_string(ErrorKind::MISSING_ATTRIBUTE));
}

TEST_F(LibDeviationTest, ParseFile) {
    NiceMock<details::MockFileSystem> fileSystem;
    fileSystem.setFile("/data/good.xml", "<node><interface name='I'/></node>");
    fileSystem.setFile("/data/bad.xml", "<node><interface/><method/></node>");
    InterfaceParser parser(&mLedger, fileSystem);

    InterfaceMap interfaces;
    EXPECT_EQ(::android::OK, parser.parseFile("/data/good.xml", false, &interfaces));
    EXPECT_TRUE(interfaces.has("I"));

    InterfaceMap missing;
    EXPECT_EQ(::android::NAME_NOT_FOUND, parser.parseFile("/data/missing.xml", false, &missing));
    EXPECT_TRUE(missing.empty());

    ParseError error;
    InterfaceMap bad;
    EXPECT_EQ(::android::BAD_VALUE, parser.parseFile("/data/bad.xml", false, &bad, &error));
    EXPECT_EQ("Missing required attribute 'name' in interface.", error.message);
    EXPECT_TRUE(mLedger.empty());

    EXPECT_EQ(::android::BAD_VALUE, parser.parseFile("/data/bad.xml", true, &bad));
    std::vector<LedgerEntry> expected{
        {"/data/bad.xml", "parser", "missing-attribute",
         "Missing required attribute 'name' in interface."},
        {"/data/bad.xml", "parser", "unknown-node", "Unknown node 'method' in root."},
    };
    EXPECT_EQ(expected, mLedger.entries());
}

TEST_F(LibDeviationTest, ParseFileFromDisk) {
    InterfaceParser parser(&mLedger);
    InterfaceMap interfaces;
    EXPECT_EQ(::android::NAME_NOT_FOUND,
              parser.parseFile("/nonexistent/dbus-deviation/test.xml", false, &interfaces));
}

}  // namespace deviation
}  // namespace dbus

int main(int argc, char** argv) {
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
