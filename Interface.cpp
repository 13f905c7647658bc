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

#include "Interface.h"

#include <utility>

namespace dbus {
namespace deviation {

// Point the annotations of node at owner.
static void adoptAnnotations(Node* node, const std::string& owner) {
    for (auto& pair : node->annotations) {
        pair.second.parent = owner;
    }
}

// Set the parent of member and re-point everything below it.
static void adoptMember(Member* member, const std::string& interfaceName) {
    member->parent = interfaceName;
    const std::string memberName = member->formatName();
    adoptAnnotations(member, memberName);
    for (auto& argument : member->arguments) {
        argument.parent = memberName;
        adoptAnnotations(&argument, argument.formatName());
    }
}

std::string Interface::formatName() const {
    return name;
}

bool Interface::add(Method&& method) {
    if (methods.has(method.name)) {
        return false;
    }
    adoptMember(&method, formatName());
    return methods.add(std::move(method));
}

bool Interface::add(Signal&& signal) {
    if (signals.has(signal.name)) {
        return false;
    }
    adoptMember(&signal, formatName());
    return signals.add(std::move(signal));
}

bool Interface::add(Property&& property) {
    if (properties.has(property.name)) {
        return false;
    }
    property.parent = formatName();
    adoptAnnotations(&property, property.formatName());
    return properties.add(std::move(property));
}

bool operator==(const Interface& lft, const Interface& rgt) {
    return static_cast<const Node&>(lft) == static_cast<const Node&>(rgt) &&
           lft.methods == rgt.methods && lft.signals == rgt.signals &&
           lft.properties == rgt.properties;
}

}  // namespace deviation
}  // namespace dbus
