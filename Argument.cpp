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

#include "Argument.h"

namespace dbus {
namespace deviation {

std::string Argument::formatName() const {
    if (name.empty()) {
        return std::to_string(index);
    }
    return std::to_string(index) + " ('" + name + "')";
}

std::string Argument::displayName() const {
    return name.empty() ? "unnamed" : name;
}

bool operator==(const Argument& lft, const Argument& rgt) {
    return static_cast<const Node&>(lft) == static_cast<const Node&>(rgt) &&
           lft.type == rgt.type && lft.direction == rgt.direction && lft.index == rgt.index;
}

}  // namespace deviation
}  // namespace dbus
