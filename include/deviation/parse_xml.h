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

#ifndef DBUS_DEVIATION_PARSE_XML_H
#define DBUS_DEVIATION_PARSE_XML_H

#include <string>

#include <utils/Errors.h>

#include "DiagnosticsLedger.h"
#include "FileSystem.h"
#include "Interface.h"

namespace dbus {
namespace deviation {

// Stage recorded in ledger entries written by the parser.
extern const std::string kParserStage;

// The first error of a parse in fail-fast mode.
struct ParseError {
    ErrorKind kind = ErrorKind::MALFORMED_DOCUMENT;
    // Stable code from the error registry, e.g. "missing-attribute".
    std::string code;
    // e.g. "Missing required attribute 'access' in property."
    std::string message;
};

// Parses D-Bus introspection XML into an InterfaceMap, accepting only the
// <node>/<interface>/<method>/<signal>/<property>/<arg>/<annotation> grammar.
// A <tp:spec> wrapper around the <node> root is accepted. Documentation
// elements (doc: and tp: namespaces) are ignored.
//
// In fail-fast mode (recover == false) the first violation stops the parse
// and is returned through |error|. In recovery mode every violation is logged
// to the ledger and parsing goes on to find the next one; the parse still
// fails. Either way |out| is only written when the whole document is valid.
class InterfaceParser {
   public:
    // |ledger| receives the errors of recovery-mode parses. It may be null if
    // only fail-fast mode is used.
    explicit InterfaceParser(DiagnosticsLedger* ledger,
                             const FileSystem& fileSystem = details::defaultFileSystem());

    // |sourceId| identifies the document in ledger entries.
    bool parse(const std::string& xml, const std::string& sourceId, bool recover,
               InterfaceMap* out, ParseError* error = nullptr) const;

    // Return OK on success, the error of the FileSystem if the file cannot be
    // read, or BAD_VALUE if the file does not parse. |path| is the sourceId.
    ::android::status_t parseFile(const std::string& path, bool recover, InterfaceMap* out,
                                  ParseError* error = nullptr) const;

   private:
    DiagnosticsLedger* mLedger;
    const FileSystem& mFileSystem;
};

}  // namespace deviation
}  // namespace dbus

#endif  // DBUS_DEVIATION_PARSE_XML_H
