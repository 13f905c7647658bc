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

#ifndef DBUS_DEVIATION_PARSE_STRING_H
#define DBUS_DEVIATION_PARSE_STRING_H

#include <iostream>
#include <sstream>
#include <string>

#include "Argument.h"
#include "DiagnosticsLedger.h"
#include "Interface.h"
#include "InterfaceComparator.h"
#include "NodeKind.h"
#include "Property.h"
#include "WarningFlags.h"

namespace dbus {
namespace deviation {

std::ostream& operator<<(std::ostream& os, Access access);
std::ostream& operator<<(std::ostream& os, Direction direction);
// Category name: "info", "forwards-compatibility" or "backwards-compatibility".
std::ostream& operator<<(std::ostream& os, Severity severity);
std::ostream& operator<<(std::ostream& os, NodeKind kind);
std::ostream& operator<<(std::ostream& os, ErrorKind kind);

template <typename T>
std::string to_string(const T& obj) {
    std::ostringstream oss;
    oss << obj;
    return oss.str();
}

bool parse(const std::string& s, Access* access);
// Does not accept the empty string; UNSPECIFIED is the absence of the attribute.
bool parse(const std::string& s, Direction* direction);
bool parse(const std::string& s, Severity* severity);
// Comma separated category names, e.g. "info,backwards-compatibility".
// Categories not named are disabled.
bool parse(const std::string& s, WarningFlags* flags);

// A string that describes the whole model, with the signature of every member.
// For debugging and testing purposes only. This is not the XML string.
std::string dump(const InterfaceMap& interfaces);

}  // namespace deviation
}  // namespace dbus

#endif  // DBUS_DEVIATION_PARSE_STRING_H
