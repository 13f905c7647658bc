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

#ifndef DBUS_DEVIATION_PROPERTY_H
#define DBUS_DEVIATION_PROPERTY_H

#include <array>
#include <string>

#include "Node.h"

namespace dbus {
namespace deviation {

enum class Access : size_t {
    READ = 0,
    WRITE,
    READWRITE,
};

static const std::array<std::string, 3> gAccessStrings = {
    {
        "read",
        "write",
        "readwrite",
    }
};

// <property name="..." type="..." access="..."/>
struct Property : public Node {
    std::string type;
    Access access = Access::READ;

    // "Interface.Property"
    std::string formatName() const;
};

bool operator==(const Property& lft, const Property& rgt);

}  // namespace deviation
}  // namespace dbus

#endif  // DBUS_DEVIATION_PROPERTY_H
