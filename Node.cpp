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

#include "Node.h"

#include <utility>

namespace dbus {
namespace deviation {

const std::string kDeprecatedAnnotation = "org.freedesktop.DBus.Deprecated";
const std::string kCSymbolAnnotation = "org.freedesktop.DBus.GLib.CSymbol";
const std::string kNoReplyAnnotation = "org.freedesktop.DBus.Method.NoReply";
const std::string kEmitsChangedSignalAnnotation =
    "org.freedesktop.DBus.Property.EmitsChangedSignal";
const std::string kDocStringAnnotation = "org.gtk.GDBus.DocString";

std::string Annotation::formatName() const {
    return parent + ".@" + name;
}

bool operator==(const Annotation& lft, const Annotation& rgt) {
    return lft.name == rgt.name && lft.value == rgt.value && lft.parent == rgt.parent &&
           lft.comment == rgt.comment;
}

const Annotation* Node::getAnnotation(const std::string& annotationName) const {
    auto it = annotations.find(annotationName);
    if (it == annotations.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string Node::getStringAnnotation(const std::string& annotationName,
                                      const std::string& defaultValue) const {
    const Annotation* annotation = getAnnotation(annotationName);
    return annotation == nullptr ? defaultValue : annotation->value;
}

bool Node::getBoolAnnotation(const std::string& annotationName, bool defaultValue) const {
    const Annotation* annotation = getAnnotation(annotationName);
    return annotation == nullptr ? defaultValue : annotation->value == "true";
}

void Node::addAnnotation(Annotation&& annotation, const std::string& owner) {
    annotation.parent = owner;
    if (annotation.name == kDocStringAnnotation) {
        comment = annotation.value;
    }
    std::string key = annotation.name;
    annotations[key] = std::move(annotation);
}

bool operator==(const Node& lft, const Node& rgt) {
    return lft.name == rgt.name && lft.parent == rgt.parent && lft.comment == rgt.comment &&
           lft.annotations == rgt.annotations;
}

}  // namespace deviation
}  // namespace dbus
