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

#include <string.h>

#include <iostream>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>

#include <deviation/DiagnosticsLedger.h>
#include <deviation/InterfaceComparator.h>
#include <deviation/parse_string.h>
#include <deviation/parse_xml.h>

namespace dbus {
namespace deviation {

static const std::string kWarningsOption = "--warnings=";
static const std::string kFatalWarningsOption = "--fatal-warnings";

struct Options {
    WarningFlags warnings = WarningFlags::EVERYTHING;
    bool fatalWarnings = false;
    std::vector<std::string> files;
};

static void usage(const char* me) {
    std::cerr << "usage: " << me << " [--warnings=<categories>] [--fatal-warnings]"
              << " <old.xml> <new.xml>" << std::endl
              << "    Compares two versions of a set of D-Bus interfaces and reports every"
              << std::endl
              << "    difference between them by its compatibility impact." << std::endl
              << "    --warnings=<categories>" << std::endl
              << "        Comma separated list of: info, forwards-compatibility," << std::endl
              << "        backwards-compatibility. Default is all of them." << std::endl
              << "    --fatal-warnings" << std::endl
              << "        Also fail if forwards-incompatible differences are found." << std::endl;
}

static bool parseOptions(int argc, char** argv, Options* options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (android::base::StartsWith(arg, kWarningsOption)) {
            std::string value = arg.substr(kWarningsOption.size());
            if (!parse(value, &options->warnings)) {
                std::cerr << "Error: Unrecognized warning categories '" << value << "'"
                          << std::endl;
                return false;
            }
        } else if (arg == kFatalWarningsOption) {
            options->fatalWarnings = true;
        } else if (android::base::StartsWith(arg, "--")) {
            std::cerr << "Error: Unrecognized option '" << arg << "'" << std::endl;
            return false;
        } else {
            options->files.push_back(arg);
        }
    }
    return options->files.size() == 2;
}

// Print the entries of the ledger and return whether the file parsed.
static bool readInterfaces(const InterfaceParser& parser, const DiagnosticsLedger& ledger,
                           const std::string& path, InterfaceMap* out) {
    size_t numEntries = ledger.size();
    android::status_t err = parser.parseFile(path, true /* recover */, out);
    for (size_t i = numEntries; i < ledger.size(); ++i) {
        const LedgerEntry& entry = ledger.entries()[i];
        std::cerr << entry.sourceId << ": " << entry.code << ": " << entry.message << std::endl;
    }
    if (err == android::OK) {
        return true;
    }
    if (err != android::BAD_VALUE) {
        std::cerr << "Error: Cannot read '" << path << "' (" << strerror(-err) << ")"
                  << std::endl;
    } else {
        std::cerr << "Error: Cannot parse '" << path << "'" << std::endl;
    }
    return false;
}

static std::string levelOf(Severity severity) {
    switch (severity) {
        case Severity::INFO:
            return " INFO";
        case Severity::FORWARDS_INCOMPATIBLE:
            return " WARN";
        case Severity::BACKWARDS_INCOMPATIBLE:
            return "ERROR";
    }
    return "";
}

}  // namespace deviation
}  // namespace dbus

int main(int argc, char** argv) {
    using namespace dbus::deviation;
    android::base::InitLogging(argv, android::base::StderrLogger);

    Options options;
    if (!parseOptions(argc, argv, &options)) {
        usage(argv[0]);
        return -1;
    }

    DiagnosticsLedger ledger;
    InterfaceParser parser(&ledger);
    InterfaceMap oldInterfaces;
    InterfaceMap newInterfaces;
    bool oldOk = readInterfaces(parser, ledger, options.files[0], &oldInterfaces);
    bool newOk = readInterfaces(parser, ledger, options.files[1], &newInterfaces);
    if (!oldOk || !newOk) {
        return -1;
    }

    InterfaceComparator comparator(oldInterfaces, newInterfaces);
    comparator.compare();
    for (const Difference& difference : comparator.getOutput(options.warnings)) {
        std::ostream& os = difference.severity == Severity::INFO ? std::cout : std::cerr;
        os << levelOf(difference.severity) << ": " << difference.message << std::endl;
    }

    if (comparator.hasOutput(Severity::BACKWARDS_INCOMPATIBLE, options.warnings)) {
        return 1;
    }
    if (options.fatalWarnings &&
        comparator.hasOutput(Severity::FORWARDS_INCOMPATIBLE, options.warnings)) {
        return 1;
    }
    return 0;
}
