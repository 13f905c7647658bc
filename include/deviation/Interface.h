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

#ifndef DBUS_DEVIATION_INTERFACE_H
#define DBUS_DEVIATION_INTERFACE_H

#include <string>

#include "Member.h"
#include "Node.h"
#include "NodeGroup.h"
#include "Property.h"

namespace dbus {
namespace deviation {

// <interface name="...">. Methods and signals live in separate namespaces, so
// a method and a signal may share a name.
struct Interface : public Node {
    NodeGroup<Method> methods;
    NodeGroup<Signal> signals;
    NodeGroup<Property> properties;

    std::string formatName() const;

    // Add a member so that the interface can be constructed programatically.
    // Sets the member's parent. Return false if a member of the same kind
    // with the same name exists already.
    bool add(Method&& method);
    bool add(Signal&& signal);
    bool add(Property&& property);
};

bool operator==(const Interface& lft, const Interface& rgt);

// All interfaces of one document, keyed by interface name.
using InterfaceMap = NodeGroup<Interface>;

}  // namespace deviation
}  // namespace dbus

#endif  // DBUS_DEVIATION_INTERFACE_H
