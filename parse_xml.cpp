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

// Convert introspection xml into objects.

#define LOG_TAG "libdeviation"
#include <android-base/logging.h>

#include <tinyxml2.h>

#include <map>
#include <utility>

#include "NodeKind.h"
#include "parse_string.h"
#include "parse_xml.h"

namespace dbus {
namespace deviation {

const std::string kParserStage = "parser";

static const std::string kDocNamespace = "http://www.freedesktop.org/dbus/1.0/doc.dtd";
static const std::string kTelepathyNamespace =
    "http://telepathy.freedesktop.org/wiki/DbusSpec#extensions-v0";
static const std::string kTelepathySpecElement = "spec";

// --------------- tinyxml2 details

using NodeType = tinyxml2::XMLElement;
using DocType = tinyxml2::XMLDocument;

inline std::string nameOf(const NodeType* root) {
    return root->Name() == NULL ? "" : root->Name();
}

inline bool getAttr(const NodeType* root, const std::string& attrName, std::string* s) {
    const char* c = root->Attribute(attrName.c_str());
    if (c == NULL) return false;
    *s = c;
    return true;
}

// "tp:docstring" -> "tp", "node" -> ""
inline std::string prefixOf(const std::string& qualifiedName) {
    size_t colon = qualifiedName.find(':');
    return colon == std::string::npos ? "" : qualifiedName.substr(0, colon);
}

// "tp:docstring" -> "docstring"
inline std::string localNameOf(const std::string& qualifiedName) {
    size_t colon = qualifiedName.find(':');
    return colon == std::string::npos ? qualifiedName : qualifiedName.substr(colon + 1);
}

// Namespace URI of the element, from the nearest xmlns declaration of its
// prefix on the element or an ancestor. Empty if the prefix is unbound.
inline std::string namespaceOf(const NodeType* element) {
    std::string prefix = prefixOf(nameOf(element));
    std::string attrName = prefix.empty() ? "xmlns" : "xmlns:" + prefix;
    for (const tinyxml2::XMLNode* n = element; n != nullptr; n = n->Parent()) {
        const NodeType* e = n->ToElement();
        if (e == nullptr) {
            break;
        }
        std::string uri;
        if (getAttr(e, attrName, &uri)) {
            return uri;
        }
    }
    return "";
}

// <doc:doc>, <tp:docstring>, <tp:copyright> and the like.
inline bool isDocumentation(const NodeType* element) {
    std::string ns = namespaceOf(element);
    return ns == kDocNamespace || ns == kTelepathyNamespace;
}

// <tp:spec>
inline bool isVendorWrapper(const NodeType* element) {
    return namespaceOf(element) == kTelepathyNamespace &&
           localNameOf(nameOf(element)) == kTelepathySpecElement;
}

// --------------- tinyxml2 details end.

// State of one parse() call.
struct ParseContext {
    ParseContext(const std::string& sourceId, bool recover, DiagnosticsLedger* ledger,
                 ParseError* error)
        : mSourceId(sourceId), mRecover(recover), mLedger(ledger), mError(error) {}

    // Record a violation. Return false if parsing must stop.
    bool report(ErrorCondition condition, const std::string& message) {
        const ErrorCodeEntry& entry = errorCodeOf(condition);
        ++mNumErrors;
        if (mRecover) {
            if (mLedger != nullptr) {
                mLedger->log(mSourceId, kParserStage, entry.code, message);
            } else {
                LOG(DEBUG) << mSourceId << ": " << entry.code << ": " << message;
            }
            return true;
        }
        if (mError != nullptr) {
            mError->kind = entry.kind;
            mError->code = entry.code;
            mError->message = message;
        }
        mAborted = true;
        return false;
    }

    bool aborted() const { return mAborted; }
    size_t numErrors() const { return mNumErrors; }

   private:
    const std::string& mSourceId;
    bool mRecover;
    DiagnosticsLedger* mLedger;
    ParseError* mError;
    size_t mNumErrors = 0;
    bool mAborted = false;
};

using Attributes = std::map<std::string, std::string>;

// ---------------------- XmlNodeConverter definitions

// Builds one node kind. The grammar of the kind comes from the grammar table.
template <typename Object>
struct XmlNodeConverter {
    XmlNodeConverter() {}
    virtual ~XmlNodeConverter() {}

    // sub-types should implement these.
    virtual NodeKind kind() const = 0;
    // Copy attributes into object. Missing required attributes are absent
    // from attrs. Return false if object is incomplete.
    virtual bool buildObject(Object* object, const NodeType* root, const Attributes& attrs,
                             ParseContext* ctx) const = 0;
    // Build a permitted child and attach it to object. Return false if
    // parsing must stop.
    virtual bool addChild(Object* object, NodeKind childKind, const NodeType* child,
                          const std::string& comment, ParseContext* ctx) const = 0;

    // "interface 'I'"; used as the context of unknown-node errors.
    virtual std::string describe(const Object& object) const = 0;

    // Build object from root. Return true if object is complete and may be
    // added to its parent. An incomplete object has been reported already.
    // Check ctx->aborted() to tell whether parsing must stop.
    bool deserialize(Object* object, const NodeType* root, ParseContext* ctx) const {
        Attributes attrs;
        bool complete = parseRequiredAttrs(root, &attrs, ctx);
        if (ctx->aborted()) return false;
        complete = buildObject(object, root, attrs, ctx) && complete;
        if (ctx->aborted()) return false;
        if (!parseChildren(object, root, ctx)) return false;
        return complete;
    }

   protected:
    // convenience methods for implementor.

    std::string describeAs(const std::string& name) const {
        return grammarOf(kind()).displayName + " '" + name + "'";
    }

    // All required attributes are checked, even after one is found missing.
    bool parseRequiredAttrs(const NodeType* root, Attributes* attrs, ParseContext* ctx) const {
        const NodeGrammar& grammar = grammarOf(kind());
        bool complete = true;
        for (const std::string& attrName : grammar.requiredAttributes) {
            std::string value;
            if (getAttr(root, attrName, &value)) {
                attrs->emplace(attrName, std::move(value));
                continue;
            }
            complete = false;
            if (!ctx->report(ErrorCondition::MISSING_ATTRIBUTE, "Missing required attribute '" +
                                                                    attrName + "' in " +
                                                                    grammar.tag + ".")) {
                return false;
            }
        }
        return complete;
    }

    // Return true if the attribute is absent or parses; false after
    // reporting an invalid value.
    template <typename T>
    bool parseOptionalAttr(const NodeType* root, const std::string& attrName, T* attr,
                           ParseContext* ctx) const {
        std::string attrText;
        if (!getAttr(root, attrName, &attrText)) {
            return true;
        }
        return parseValue(attrName, attrText, attr, ctx);
    }

    template <typename T>
    bool parseValue(const std::string& attrName, const std::string& attrText, T* attr,
                    ParseContext* ctx) const {
        if (::dbus::deviation::parse(attrText, attr)) {
            return true;
        }
        ctx->report(ErrorCondition::INVALID_ATTRIBUTE, "Invalid value '" + attrText +
                                                           "' for attribute '" + attrName +
                                                           "' in " + grammarOf(kind()).tag + ".");
        return false;
    }

    static std::string attrOrEmpty(const Attributes& attrs, const std::string& attrName) {
        auto it = attrs.find(attrName);
        return it == attrs.end() ? "" : it->second;
    }

   private:
    // A comment attaches to the next element if nothing but text lies
    // between them. Return false if parsing must stop.
    bool parseChildren(Object* object, const NodeType* root, ParseContext* ctx) const {
        std::string comment;
        for (const tinyxml2::XMLNode* node = root->FirstChild(); node != nullptr;
             node = node->NextSibling()) {
            const tinyxml2::XMLComment* xmlComment = node->ToComment();
            if (xmlComment != nullptr) {
                comment = xmlComment->Value() == NULL ? "" : xmlComment->Value();
                continue;
            }
            const NodeType* child = node->ToElement();
            if (child == nullptr) {
                continue;
            }
            std::string childComment;
            childComment.swap(comment);
            if (isDocumentation(child)) {
                continue;
            }
            NodeKind childKind;
            if (!lookupChildKind(kind(), nameOf(child), &childKind)) {
                if (!ctx->report(ErrorCondition::UNKNOWN_NODE, "Unknown node '" + nameOf(child) +
                                                                   "' in " + describe(*object) +
                                                                   ".")) {
                    return false;
                }
                continue;
            }
            if (!addChild(object, childKind, child, childComment, ctx)) {
                return false;
            }
        }
        return true;
    }
};

struct AnnotationConverter : public XmlNodeConverter<Annotation> {
    NodeKind kind() const override { return NodeKind::ANNOTATION; }
    std::string describe(const Annotation& object) const override {
        return describeAs(object.name);
    }
    bool buildObject(Annotation* object, const NodeType*, const Attributes& attrs,
                     ParseContext*) const override {
        object->name = attrOrEmpty(attrs, "name");
        object->value = attrOrEmpty(attrs, "value");
        return true;
    }
    bool addChild(Annotation*, NodeKind, const NodeType*, const std::string&,
                  ParseContext*) const override {
        // Only documentation is permitted; the grammar never gets here.
        return true;
    }
};

const AnnotationConverter annotationConverter{};

// Converters of nodes that can carry annotations.
template <typename Object>
struct AnnotatedNodeConverter : public XmlNodeConverter<Object> {
    std::string describe(const Object& object) const override {
        return this->describeAs(object.name);
    }

   protected:
    bool addAnnotation(Object* object, const NodeType* child, const std::string& comment,
                       ParseContext* ctx) const {
        Annotation annotation;
        annotation.comment = comment;
        bool complete = annotationConverter.deserialize(&annotation, child, ctx);
        if (ctx->aborted()) return false;
        if (complete) {
            object->addAnnotation(std::move(annotation), object->formatName());
        }
        return true;
    }
};

struct ArgumentConverter : public AnnotatedNodeConverter<Argument> {
    NodeKind kind() const override { return NodeKind::ARGUMENT; }
    std::string describe(const Argument& object) const override {
        return describeAs(object.displayName());
    }
    bool buildObject(Argument* object, const NodeType* root, const Attributes& attrs,
                     ParseContext* ctx) const override {
        object->type = attrOrEmpty(attrs, "type");
        getAttr(root, "name", &object->name);
        return parseOptionalAttr(root, "direction", &object->direction, ctx);
    }
    bool addChild(Argument* object, NodeKind childKind, const NodeType* child,
                  const std::string& comment, ParseContext* ctx) const override {
        CHECK(childKind == NodeKind::ANNOTATION);
        return addAnnotation(object, child, comment, ctx);
    }
};

const ArgumentConverter argumentConverter{};

// Methods and signals.
template <typename Object>
struct MemberConverter : public AnnotatedNodeConverter<Object> {
    bool buildObject(Object* object, const NodeType*, const Attributes& attrs,
                     ParseContext*) const override {
        object->name = this->attrOrEmpty(attrs, "name");
        return true;
    }
    bool addChild(Object* object, NodeKind childKind, const NodeType* child,
                  const std::string& comment, ParseContext* ctx) const override {
        if (childKind == NodeKind::ANNOTATION) {
            return this->addAnnotation(object, child, comment, ctx);
        }
        Argument argument;
        argument.comment = comment;
        argument.parent = object->formatName();
        argument.index = object->arguments.size();
        bool complete = argumentConverter.deserialize(&argument, child, ctx);
        if (ctx->aborted()) return false;
        if (complete) {
            object->addArgument(std::move(argument));
        }
        return true;
    }
};

struct MethodConverter : public MemberConverter<Method> {
    NodeKind kind() const override { return NodeKind::METHOD; }
};

struct SignalConverter : public MemberConverter<Signal> {
    NodeKind kind() const override { return NodeKind::SIGNAL; }
};

const MethodConverter methodConverter{};
const SignalConverter signalConverter{};

struct PropertyConverter : public AnnotatedNodeConverter<Property> {
    NodeKind kind() const override { return NodeKind::PROPERTY; }
    bool buildObject(Property* object, const NodeType*, const Attributes& attrs,
                     ParseContext* ctx) const override {
        object->name = attrOrEmpty(attrs, "name");
        object->type = attrOrEmpty(attrs, "type");
        auto it = attrs.find("access");
        if (it == attrs.end()) {
            return false;
        }
        return parseValue("access", it->second, &object->access, ctx);
    }
    bool addChild(Property* object, NodeKind childKind, const NodeType* child,
                  const std::string& comment, ParseContext* ctx) const override {
        CHECK(childKind == NodeKind::ANNOTATION);
        return addAnnotation(object, child, comment, ctx);
    }
};

const PropertyConverter propertyConverter{};

struct InterfaceConverter : public AnnotatedNodeConverter<Interface> {
    NodeKind kind() const override { return NodeKind::INTERFACE; }
    bool buildObject(Interface* object, const NodeType*, const Attributes& attrs,
                     ParseContext*) const override {
        object->name = attrOrEmpty(attrs, "name");
        return true;
    }
    bool addChild(Interface* object, NodeKind childKind, const NodeType* child,
                  const std::string& comment, ParseContext* ctx) const override {
        switch (childKind) {
            case NodeKind::METHOD:
                return addMember(object, methodConverter, "method", child, comment, ctx);
            case NodeKind::SIGNAL:
                return addMember(object, signalConverter, "signal", child, comment, ctx);
            case NodeKind::PROPERTY:
                return addMember(object, propertyConverter, "property", child, comment, ctx);
            default:
                CHECK(childKind == NodeKind::ANNOTATION);
                return addAnnotation(object, child, comment, ctx);
        }
    }

   private:
    template <typename T>
    bool addMember(Interface* object, const XmlNodeConverter<T>& conv, const std::string& kindName,
                   const NodeType* child, const std::string& comment, ParseContext* ctx) const {
        T member;
        member.comment = comment;
        member.parent = object->formatName();
        bool complete = conv.deserialize(&member, child, ctx);
        if (ctx->aborted()) return false;
        if (!complete) return true;
        std::string qualifiedName = member.formatName();
        if (!object->add(std::move(member))) {
            return ctx->report(ErrorCondition::DUPLICATE_NODE, "Duplicate " + kindName +
                                                                   " definition '" +
                                                                   qualifiedName + "'.");
        }
        return true;
    }
};

const InterfaceConverter interfaceConverter{};

// The <node> element.
struct InterfaceSetConverter : public XmlNodeConverter<InterfaceMap> {
    NodeKind kind() const override { return NodeKind::ROOT; }
    std::string describe(const InterfaceMap&) const override {
        return grammarOf(kind()).displayName;
    }
    bool buildObject(InterfaceMap*, const NodeType*, const Attributes&,
                     ParseContext*) const override {
        return true;
    }
    bool addChild(InterfaceMap* object, NodeKind childKind, const NodeType* child,
                  const std::string& comment, ParseContext* ctx) const override {
        CHECK(childKind == NodeKind::INTERFACE);
        Interface interface;
        interface.comment = comment;
        bool complete = interfaceConverter.deserialize(&interface, child, ctx);
        if (ctx->aborted()) return false;
        if (!complete) return true;
        std::string name = interface.name;
        if (!object->add(std::move(interface))) {
            return ctx->report(ErrorCondition::DUPLICATE_NODE,
                               "Duplicate interface definition '" + name + "'.");
        }
        return true;
    }
};

const InterfaceSetConverter interfaceSetConverter{};

// ---------------------- XmlNodeConverter definitions end

// Find the <node> element of a document: the root itself, or the single
// <node> inside a <tp:spec> root.
static const NodeType* findInterfaceSet(const NodeType* root) {
    const std::string& setTag = grammarOf(NodeKind::ROOT).tag;
    if (nameOf(root) == setTag) {
        return root;
    }
    if (!isVendorWrapper(root)) {
        return nullptr;
    }
    const NodeType* found = nullptr;
    for (const NodeType* child = root->FirstChildElement(setTag.c_str()); child != nullptr;
         child = child->NextSiblingElement(setTag.c_str())) {
        if (found != nullptr) {
            return nullptr;
        }
        found = child;
    }
    return found;
}

static bool parseDocument(const std::string& xml, InterfaceMap* out, ParseContext* ctx) {
    DocType doc;
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
        std::string detail = doc.ErrorStr() == NULL ? "" : doc.ErrorStr();
        ctx->report(ErrorCondition::MALFORMED_DOCUMENT, "Malformed document: " + detail + ".");
        return false;
    }
    const NodeType* root = doc.RootElement();
    if (root == nullptr) {
        ctx->report(ErrorCondition::MALFORMED_DOCUMENT, "Malformed document: no root element.");
        return false;
    }
    const NodeType* interfaceSet = findInterfaceSet(root);
    if (interfaceSet == nullptr) {
        ctx->report(ErrorCondition::UNKNOWN_ROOT_NODE,
                    "Unknown root node '" + nameOf(root) + "'.");
        return false;
    }
    if (!interfaceSetConverter.deserialize(out, interfaceSet, ctx)) {
        return false;
    }
    return ctx->numErrors() == 0;
}

InterfaceParser::InterfaceParser(DiagnosticsLedger* ledger, const FileSystem& fileSystem)
    : mLedger(ledger), mFileSystem(fileSystem) {}

bool InterfaceParser::parse(const std::string& xml, const std::string& sourceId, bool recover,
                            InterfaceMap* out, ParseError* error) const {
    ParseContext ctx(sourceId, recover, mLedger, error);
    InterfaceMap interfaces;
    if (!parseDocument(xml, &interfaces, &ctx)) {
        return false;
    }
    *out = std::move(interfaces);
    return true;
}

::android::status_t InterfaceParser::parseFile(const std::string& path, bool recover,
                                               InterfaceMap* out, ParseError* error) const {
    std::string xml;
    std::string fetchError;
    status_t err = mFileSystem.fetch(path, &xml, &fetchError);
    if (err != ::android::OK) {
        LOG(WARNING) << "Cannot read " << path << ": " << fetchError;
        return err;
    }
    ParseError parseError;
    if (!parse(xml, path, recover, out, &parseError)) {
        if (!recover) {
            LOG(ERROR) << "Illformed file: " << path << ": " << parseError.message;
            if (error != nullptr) {
                *error = parseError;
            }
        }
        return ::android::BAD_VALUE;
    }
    return ::android::OK;
}

}  // namespace deviation
}  // namespace dbus
