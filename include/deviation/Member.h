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

#ifndef DBUS_DEVIATION_MEMBER_H
#define DBUS_DEVIATION_MEMBER_H

#include <string>
#include <vector>

#include "Argument.h"
#include "Node.h"

namespace dbus {
namespace deviation {

// Methods and signals: a named, ordered argument list.
struct Member : public Node {
    std::vector<Argument> arguments;

    // "Interface.Member"
    std::string formatName() const;

    // Append an argument, assigning its index and parent.
    void addArgument(Argument&& argument);
};

bool operator==(const Member& lft, const Member& rgt);

struct Method : public Member {};

struct Signal : public Member {};

}  // namespace deviation
}  // namespace dbus

#endif  // DBUS_DEVIATION_MEMBER_H
