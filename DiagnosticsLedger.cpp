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

#define LOG_TAG "libdeviation"
#include <android-base/logging.h>

#include "DiagnosticsLedger.h"

#include <array>

namespace dbus {
namespace deviation {

static const std::array<ErrorCodeEntry, 6> kErrorCodes{{
    {ErrorCondition::MALFORMED_DOCUMENT, ErrorKind::MALFORMED_DOCUMENT, "malformed-document"},
    {ErrorCondition::UNKNOWN_ROOT_NODE, ErrorKind::UNKNOWN_NODE, "unknown-root-node"},
    {ErrorCondition::UNKNOWN_NODE, ErrorKind::UNKNOWN_NODE, "unknown-node"},
    {ErrorCondition::MISSING_ATTRIBUTE, ErrorKind::MISSING_ATTRIBUTE, "missing-attribute"},
    {ErrorCondition::INVALID_ATTRIBUTE, ErrorKind::INVALID_ATTRIBUTE, "invalid-attribute"},
    {ErrorCondition::DUPLICATE_NODE, ErrorKind::DUPLICATE_NODE, "duplicate-node"},
}};

const ErrorCodeEntry& errorCodeOf(ErrorCondition condition) {
    return kErrorCodes.at(static_cast<size_t>(condition));
}

bool operator==(const LedgerEntry& lft, const LedgerEntry& rgt) {
    return lft.sourceId == rgt.sourceId && lft.stage == rgt.stage && lft.code == rgt.code &&
           lft.message == rgt.message;
}

void DiagnosticsLedger::log(const std::string& sourceId, const std::string& stage,
                            const std::string& code, const std::string& message) {
    LOG(DEBUG) << sourceId << ": " << stage << ": " << code << ": " << message;
    mEntries.push_back(LedgerEntry{sourceId, stage, code, message});
}

void DiagnosticsLedger::reset() {
    mEntries.clear();
}

std::vector<std::string> DiagnosticsLedger::registeredCodes() {
    std::vector<std::string> codes;
    for (const auto& entry : kErrorCodes) {
        codes.push_back(entry.code);
    }
    return codes;
}

}  // namespace deviation
}  // namespace dbus
