/*
 * Copyright 2025 Rotor Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Rotor Filesystem Helpers - Implementation

#include "filesystem.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>

#include "errors.hpp"

namespace rotor::core {

namespace fs = std::filesystem;

static bool is_executable_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> find_executable(std::string_view name) {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string_view::npos) {
        std::string path{name};
        if (!is_executable_file(path)) {
            return std::nullopt;
        }
        std::error_code ec;
        auto absolute = fs::absolute(path, ec);
        return ec ? path : absolute.string();
    }

    const char* env_path = std::getenv("PATH");
    std::string_view search = env_path ? env_path : "/usr/local/bin:/usr/bin:/bin";

    while (!search.empty()) {
        size_t colon = search.find(':');
        std::string_view dir = search.substr(0, colon);
        search = colon == std::string_view::npos ? std::string_view{} : search.substr(colon + 1);

        // Empty PATH element means current directory
        fs::path candidate = dir.empty() ? fs::path(".") : fs::path(dir);
        candidate /= name;

        if (is_executable_file(candidate.string())) {
            return candidate.string();
        }
    }

    return std::nullopt;
}

std::error_code make_work_dir(const fs::path& dir, fs::perms perms) {
    std::error_code ec;
    bool created = fs::create_directories(dir, ec);
    if (ec || !created) {
        return ec;
    }
    fs::permissions(dir, perms, fs::perm_options::replace, ec);
    return ec;
}

std::error_code remove_work_dir(const fs::path& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    return ec;
}

std::error_code write_file_atomic(const fs::path& path, std::string_view content) {
    std::string tmp_template = (path.parent_path() / ("." + path.filename().string() + ".XXXXXX"))
                                   .string();

    int fd = ::mkostemp(tmp_template.data(), O_CLOEXEC);
    if (fd < 0) {
        return last_system_error();
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto ec = last_system_error();
            ::close(fd);
            ::unlink(tmp_template.c_str());
            return ec;
        }
        written += static_cast<size_t>(n);
    }

    // mkstemp creates 0600; collaborator processes may run as another user
    if (::fchmod(fd, 0644) < 0 || ::fsync(fd) < 0) {
        auto ec = last_system_error();
        ::close(fd);
        ::unlink(tmp_template.c_str());
        return ec;
    }

    if (::close(fd) < 0) {
        auto ec = last_system_error();
        ::unlink(tmp_template.c_str());
        return ec;
    }

    if (::rename(tmp_template.c_str(), path.c_str()) < 0) {
        auto ec = last_system_error();
        ::unlink(tmp_template.c_str());
        return ec;
    }

    return {};
}

}  // namespace rotor::core
