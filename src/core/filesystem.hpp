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

// Rotor Filesystem Helpers - Header
// Executable lookup, working directories and atomic file replacement

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace rotor::core {

/// Resolve a program name against PATH (names containing '/' are checked as-is)
/// @return Absolute path of the executable, or nullopt if not found
[[nodiscard]] std::optional<std::string> find_executable(std::string_view name);

/// Create a working directory (and parents) with the given permissions
/// A directory that already exists is left as it is.
[[nodiscard]] std::error_code make_work_dir(const std::filesystem::path& dir,
                                            std::filesystem::perms perms);

/// Recursively remove a working directory; a missing directory is not an error
[[nodiscard]] std::error_code remove_work_dir(const std::filesystem::path& dir);

/// Replace a file's content atomically
/// Writes to a temporary file in the same directory, then renames it over the target,
/// so a concurrent reader sees either the old or the new content, never a partial write.
[[nodiscard]] std::error_code write_file_atomic(const std::filesystem::path& path,
                                                std::string_view content);

}  // namespace rotor::core
