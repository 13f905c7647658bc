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

// Convert objects from and to strings.

#include "parse_string.h"

#include <array>
#include <vector>

#include <android-base/strings.h>

namespace dbus {
namespace deviation {

static const std::array<std::string, 3> gSeverityStrings = {
    {
        "info",
        "forwards-compatibility",
        "backwards-compatibility",
    }
};

static const std::array<std::string, 5> gErrorKindStrings = {
    {
        "malformed document",
        "unknown node",
        "missing attribute",
        "invalid attribute",
        "duplicate node",
    }
};

template <typename E, typename Array>
bool parseEnum(const std::string& s, E* e, const Array& strings) {
    for (size_t i = 0; i < strings.size(); ++i) {
        if (s == strings.at(i)) {
            *e = static_cast<E>(i);
            return true;
        }
    }
    return false;
}

bool parse(const std::string& s, Access* access) {
    return parseEnum(s, access, gAccessStrings);
}

std::ostream& operator<<(std::ostream& os, Access access) {
    return os << gAccessStrings.at(static_cast<size_t>(access));
}

bool parse(const std::string& s, Direction* direction) {
    if (s.empty()) {
        return false;
    }
    return parseEnum(s, direction, gDirectionStrings);
}

std::ostream& operator<<(std::ostream& os, Direction direction) {
    return os << gDirectionStrings.at(static_cast<size_t>(direction));
}

bool parse(const std::string& s, Severity* severity) {
    return parseEnum(s, severity, gSeverityStrings);
}

std::ostream& operator<<(std::ostream& os, Severity severity) {
    return os << gSeverityStrings.at(static_cast<size_t>(severity));
}

std::ostream& operator<<(std::ostream& os, NodeKind kind) {
    return os << grammarOf(kind).displayName;
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
    return os << gErrorKindStrings.at(static_cast<size_t>(kind));
}

bool parse(const std::string& s, WarningFlags* flags) {
    WarningFlags ret = WarningFlags::NOTHING;
    for (const std::string& item : android::base::Split(s, ",")) {
        std::string category = android::base::Trim(item);
        if (category.empty()) {
            continue;
        }
        Severity severity;
        if (!parse(category, &severity)) {
            return false;
        }
        switch (severity) {
            case Severity::INFO:
                ret = ret.enableInfo();
                break;
            case Severity::FORWARDS_INCOMPATIBLE:
                ret = ret.enableForwardsCompatibility();
                break;
            case Severity::BACKWARDS_INCOMPATIBLE:
                ret = ret.enableBackwardsCompatibility();
                break;
        }
    }
    *flags = ret;
    return true;
}

static std::string dumpArguments(const std::vector<Argument>& arguments) {
    std::vector<std::string> items;
    for (const auto& argument : arguments) {
        std::string item = to_string(argument.direction);
        if (!item.empty()) {
            item += " ";
        }
        item += argument.type;
        if (!argument.name.empty()) {
            item += " " + argument.name;
        }
        items.push_back(item);
    }
    return "(" + android::base::Join(items, ",") + ")";
}

std::string dump(const InterfaceMap& interfaces) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& interface : interfaces) {
        if (!first) {
            oss << ":";
        }
        first = false;

        std::vector<std::string> members;
        for (const auto& method : interface.methods) {
            members.push_back("m " + method.name + dumpArguments(method.arguments));
        }
        for (const auto& signal : interface.signals) {
            members.push_back("s " + signal.name + dumpArguments(signal.arguments));
        }
        for (const auto& property : interface.properties) {
            members.push_back("p " + property.name + " " + property.type + " " +
                              to_string(property.access));
        }
        oss << interface.name << "{" << android::base::Join(members, ";") << "}";
    }
    return oss.str();
}

}  // namespace deviation
}  // namespace dbus
