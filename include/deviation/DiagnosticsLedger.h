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

#ifndef DBUS_DEVIATION_DIAGNOSTICS_LEDGER_H
#define DBUS_DEVIATION_DIAGNOSTICS_LEDGER_H

#include <string>
#include <vector>

namespace dbus {
namespace deviation {

// Class of a parse failure.
enum class ErrorKind : size_t {
    MALFORMED_DOCUMENT = 0,
    UNKNOWN_NODE,
    MISSING_ATTRIBUTE,
    INVALID_ATTRIBUTE,
    DUPLICATE_NODE,
};

// Every distinct error condition the parser can report. The code of a
// condition is stable and independent of the message text.
enum class ErrorCondition : size_t {
    MALFORMED_DOCUMENT = 0,
    UNKNOWN_ROOT_NODE,
    UNKNOWN_NODE,
    MISSING_ATTRIBUTE,
    INVALID_ATTRIBUTE,
    DUPLICATE_NODE,
};

struct ErrorCodeEntry {
    ErrorCondition condition;
    ErrorKind kind;
    std::string code;
};

// Registry row for a condition.
const ErrorCodeEntry& errorCodeOf(ErrorCondition condition);

struct LedgerEntry {
    // e.g. the path of the parsed file.
    std::string sourceId;
    // Processing stage that logged the entry, e.g. "parser".
    std::string stage;
    std::string code;
    std::string message;
};

bool operator==(const LedgerEntry& lft, const LedgerEntry& rgt);

// Append-only record of the errors found while processing documents.
// Not thread-safe; give each concurrent parse its own ledger.
class DiagnosticsLedger {
   public:
    void log(const std::string& sourceId, const std::string& stage, const std::string& code,
             const std::string& message);
    // Drop all entries, e.g. between unrelated input files.
    void reset();

    const std::vector<LedgerEntry>& entries() const { return mEntries; }
    bool empty() const { return mEntries.empty(); }
    size_t size() const { return mEntries.size(); }

    // All codes any error condition can produce, in registry order.
    static std::vector<std::string> registeredCodes();

   private:
    std::vector<LedgerEntry> mEntries;
};

}  // namespace deviation
}  // namespace dbus

#endif  // DBUS_DEVIATION_DIAGNOSTICS_LEDGER_H
