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

#ifndef DBUS_DEVIATION_FILE_SYSTEM_H
#define DBUS_DEVIATION_FILE_SYSTEM_H

#include <string>

#include <utils/Errors.h>

namespace dbus {
namespace deviation {

using ::android::status_t;

// Source of document contents. Tests substitute a mock.
class FileSystem {
   public:
    virtual ~FileSystem() {}
    // Return NAME_NOT_FOUND if file is not found,
    //        non-zero if there is any other error and error is set,
    //        OK otherwise, with the whole file in fetched.
    virtual status_t fetch(const std::string& path, std::string* fetched,
                           std::string* error) const = 0;
};

namespace details {

// Reads files from the local file system.
class FileSystemImpl : public FileSystem {
   public:
    status_t fetch(const std::string& path, std::string* fetched,
                   std::string* error) const override;
};

// The FileSystem used when the caller supplies none.
const FileSystem& defaultFileSystem();

}  // namespace details
}  // namespace deviation
}  // namespace dbus

#endif  // DBUS_DEVIATION_FILE_SYSTEM_H
