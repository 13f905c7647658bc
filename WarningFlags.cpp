/*
 * Copyright (C) 2018 The Android Open Source Project
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

#include <deviation/WarningFlags.h>

#include <deviation/InterfaceComparator.h>

namespace dbus {
namespace deviation {

WarningFlags::WarningFlags(uint32_t value) : mValue(value) {}

WarningFlags::WarningFlags(const WarningFlags& other) : mValue(other.mValue) {}

// Bit i is the category of Severity i.
#define DEVIATION_WARNING_FLAGS_FIELD_DEFINE(name, bit)  \
    WarningFlags WarningFlags::enable##name() const {    \
        WarningFlags ret(*this);                         \
        ret.mValue |= 1 << bit;                          \
        return ret;                                      \
    }                                                    \
    WarningFlags WarningFlags::disable##name() const {   \
        WarningFlags ret(*this);                         \
        ret.mValue &= ~(1 << bit);                       \
        return ret;                                      \
    }                                                    \
    bool WarningFlags::is##name##Enabled() const { return mValue & (1 << bit); }

DEVIATION_WARNING_FLAGS_FIELD_DEFINE(Info, 0)
DEVIATION_WARNING_FLAGS_FIELD_DEFINE(ForwardsCompatibility, 1)
DEVIATION_WARNING_FLAGS_FIELD_DEFINE(BackwardsCompatibility, 2)

#undef DEVIATION_WARNING_FLAGS_FIELD_DEFINE

bool WarningFlags::isEnabled(Severity severity) const {
    return mValue & (1 << static_cast<size_t>(severity));
}

const WarningFlags WarningFlags::EVERYTHING = WarningFlags(~0u);
const WarningFlags WarningFlags::NOTHING = WarningFlags(0u);

}  // namespace deviation
}  // namespace dbus
