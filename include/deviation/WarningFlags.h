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

#ifndef DBUS_DEVIATION_WARNING_FLAGS_H
#define DBUS_DEVIATION_WARNING_FLAGS_H

#include <stddef.h>
#include <stdint.h>

namespace dbus {
namespace deviation {

enum class Severity : size_t;

// Which difference categories a reader of comparator output wants to see.
class WarningFlags {
   public:
    WarningFlags(const WarningFlags& other);
    WarningFlags& operator=(const WarningFlags& other) = default;

#define DEVIATION_WARNING_FLAGS_FIELD_DECLARE(name) \
    WarningFlags enable##name() const;              \
    WarningFlags disable##name() const;             \
    bool is##name##Enabled() const;

    DEVIATION_WARNING_FLAGS_FIELD_DECLARE(Info)
    DEVIATION_WARNING_FLAGS_FIELD_DECLARE(ForwardsCompatibility)
    DEVIATION_WARNING_FLAGS_FIELD_DECLARE(BackwardsCompatibility)

#undef DEVIATION_WARNING_FLAGS_FIELD_DECLARE

    // Whether differences of this severity are enabled.
    bool isEnabled(Severity severity) const;

    bool operator==(const WarningFlags& other) const { return mValue == other.mValue; }

    static const WarningFlags EVERYTHING;
    static const WarningFlags NOTHING;

   private:
    uint32_t mValue;

    WarningFlags(uint32_t value);
};

}  // namespace deviation
}  // namespace dbus

#endif  // DBUS_DEVIATION_WARNING_FLAGS_H
