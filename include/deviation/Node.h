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

#ifndef DBUS_DEVIATION_NODE_H
#define DBUS_DEVIATION_NODE_H

#include <map>
#include <string>

namespace dbus {
namespace deviation {

// Annotation names with a meaning to the comparator or the parser.
// https://dbus.freedesktop.org/doc/dbus-specification.html#introspection-format
extern const std::string kDeprecatedAnnotation;
extern const std::string kCSymbolAnnotation;
extern const std::string kNoReplyAnnotation;
extern const std::string kEmitsChangedSignalAnnotation;
extern const std::string kDocStringAnnotation;

// <annotation name="..." value="..."/>
struct Annotation {
    std::string name;
    std::string value;
    // formatName() of the owning node.
    std::string parent;
    std::string comment;

    // e.g. "I.M.@org.freedesktop.DBus.Deprecated"
    std::string formatName() const;
};

bool operator==(const Annotation& lft, const Annotation& rgt);

// State shared by interfaces, methods, signals, properties and arguments.
struct Node {
    std::string name;
    // formatName() of the enclosing node; empty for interfaces, whose parent
    // is the document root. Set once, when the node is added to its parent.
    std::string parent;
    // Empty if the node is undocumented.
    std::string comment;
    // Keyed by annotation name. A repeated name replaces the earlier value.
    std::map<std::string, Annotation> annotations;

    // Return nullptr if no annotation with this name is attached.
    const Annotation* getAnnotation(const std::string& annotationName) const;
    std::string getStringAnnotation(const std::string& annotationName,
                                    const std::string& defaultValue) const;
    // Any value other than "true" reads as false.
    bool getBoolAnnotation(const std::string& annotationName, bool defaultValue) const;

    // Attach an annotation. A DocString annotation also becomes the
    // comment, overriding a preceding XML comment.
    void addAnnotation(Annotation&& annotation, const std::string& owner);
};

bool operator==(const Node& lft, const Node& rgt);

}  // namespace deviation
}  // namespace dbus

#endif  // DBUS_DEVIATION_NODE_H
