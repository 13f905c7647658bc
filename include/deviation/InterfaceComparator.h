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

#ifndef DBUS_DEVIATION_INTERFACE_COMPARATOR_H
#define DBUS_DEVIATION_INTERFACE_COMPARATOR_H

#include <string>
#include <vector>

#include "Interface.h"
#include "WarningFlags.h"

namespace dbus {
namespace deviation {

// Impact of a difference, in increasing order.
enum class Severity : size_t {
    // Purely decorative, e.g. an argument was renamed.
    INFO = 0,
    // Code written against the new interfaces may not work against the old ones,
    // e.g. because it uses a newly added method.
    FORWARDS_INCOMPATIBLE,
    // Code written against the old interfaces may not work against the new ones,
    // e.g. because a property changed type.
    BACKWARDS_INCOMPATIBLE,
};

struct Difference {
    Severity severity;
    std::string message;
};

bool operator==(const Difference& lft, const Difference& rgt);

// Compares two versions of a set of D-Bus interfaces and classifies every
// difference between them by its compatibility impact.
//
// compare() always computes every difference. Filtering by category happens
// when the result is read, so it can be read with several filters without
// comparing again.
//
// Both interface maps must outlive the comparator. Neither is modified.
class InterfaceComparator {
   public:
    InterfaceComparator(const InterfaceMap& oldInterfaces, const InterfaceMap& newInterfaces);

    // Compare the two interface maps and store the result, replacing the
    // result of any earlier call. Return all differences.
    const std::vector<Difference>& compare();

    // Differences found by the most recent compare() whose category is enabled
    // in flags, in the order they were found.
    std::vector<Difference> getOutput(const WarningFlags& flags = WarningFlags::EVERYTHING) const;

    // Whether the most recent compare() found an enabled difference of the
    // given severity.
    bool hasOutput(Severity severity, const WarningFlags& flags = WarningFlags::EVERYTHING) const;

   private:
    void issueOutput(Severity severity, const std::string& message);

    void compareInterfaces(const Interface& oldInterface, const Interface& newInterface);
    void compareMembers(const std::string& kind, const Member& oldMember,
                        const Member& newMember);
    void compareProperties(const Property& oldProperty, const Property& newProperty,
                           const Interface& oldInterface, const Interface& newInterface);
    void compareArguments(const Argument& oldArgument, const Argument& newArgument);

    // Declaring interfaces are needed to resolve EmitsChangedSignal on
    // properties; they are null for every other node kind.
    template <typename T>
    void compareAnnotations(const T& oldNode, const T& newNode,
                            const Interface* oldInterface = nullptr,
                            const Interface* newInterface = nullptr);

    const InterfaceMap& mOldInterfaces;
    const InterfaceMap& mNewInterfaces;
    std::vector<Difference> mOutput;
};

}  // namespace deviation
}  // namespace dbus

#endif  // DBUS_DEVIATION_INTERFACE_COMPARATOR_H
