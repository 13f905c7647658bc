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

#ifndef DBUS_DEVIATION_ARGUMENT_H
#define DBUS_DEVIATION_ARGUMENT_H

#include <array>
#include <string>

#include "Node.h"

namespace dbus {
namespace deviation {

enum class Direction : size_t {
    UNSPECIFIED = 0,
    IN,
    OUT,
};

static const std::array<std::string, 3> gDirectionStrings = {
    {
        "",
        "in",
        "out",
    }
};

// <arg type="..." name="..." direction="..."/>
// The name is optional.
struct Argument : public Node {
    // D-Bus type signature, not validated.
    std::string type;
    Direction direction = Direction::UNSPECIFIED;
    // Position in the parent's argument list.
    size_t index = 0;

    // "0" for an unnamed argument, "0 ('foo')" otherwise.
    std::string formatName() const;
    // Name used in parse errors: the name, or "unnamed".
    std::string displayName() const;
};

bool operator==(const Argument& lft, const Argument& rgt);

}  // namespace deviation
}  // namespace dbus

#endif  // DBUS_DEVIATION_ARGUMENT_H
