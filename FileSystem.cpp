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

#include <deviation/FileSystem.h>

#include <errno.h>
#include <string.h>

#include <fstream>
#include <sstream>

namespace dbus {
namespace deviation {
namespace details {

status_t FileSystemImpl::fetch(const std::string& path, std::string* fetched,
                               std::string* error) const {
    std::ifstream in;

    errno = 0;
    in.open(path);
    if (!in || errno != 0) {
        int savedErrno = errno == 0 ? ENOENT : errno;
        if (error) {
            *error = "Cannot open " + path + ": " + strerror(savedErrno);
        }
        return savedErrno == ENOENT ? ::android::NAME_NOT_FOUND : -savedErrno;
    }

    std::stringstream ss;
    ss << in.rdbuf();
    *fetched = ss.str();

    return -errno;
}

const FileSystem& defaultFileSystem() {
    static const FileSystemImpl sFileSystem{};
    return sFileSystem;
}

}  // namespace details
}  // namespace deviation
}  // namespace dbus
