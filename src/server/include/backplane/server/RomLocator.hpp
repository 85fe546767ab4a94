// Copyright © 2025 Robert Smallshire <robert@smallshire.org.uk>
//
// This file is part of Backplane.
//
// Backplane is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Backplane is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Backplane.
// If not, see <https://www.gnu.org/licenses/>.

#ifndef BACKPLANE_SERVER_ROM_LOCATOR_HPP
#define BACKPLANE_SERVER_ROM_LOCATOR_HPP

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <climits>
#include <unistd.h>

namespace backplane::server {

// Finds ROM image files for one machine model.
//
// Directories searched, in order:
//   1. The explicit directory given on the command line (must exist)
//   2. $BACKPLANE_ROM_DIR
//   3. ../../roms relative to the executable (build tree)
//   4. ../share/backplane/roms relative to the executable (installed)
//   5. BACKPLANE_DEFAULT_ROM_DIR, if compiled in
//
// Within each directory a machine-specific subdirectory named after the
// machine type (e.g. roms/apple2plus/) is tried before the directory itself.
// Names with a directory component are taken relative to the working
// directory and not searched for.
class RomLocator {
public:
    explicit RomLocator(std::string machine_type,
                        std::optional<std::filesystem::path> explicit_dirpath = std::nullopt)
        : machine_type_(std::move(machine_type))
        , explicit_dirpath_(std::move(explicit_dirpath))
    {
        if (explicit_dirpath_ && !std::filesystem::is_directory(*explicit_dirpath_)) {
            throw std::runtime_error("ROM directory does not exist: " + explicit_dirpath_->string());
        }
    }

    // Existing directories in search order, machine subdirectories included
    std::vector<std::filesystem::path> search_path() const {
        std::vector<std::filesystem::path> roots;
        if (explicit_dirpath_) {
            roots.push_back(*explicit_dirpath_);
        }
        if (const char* env_dirpath = std::getenv("BACKPLANE_ROM_DIR")) {
            roots.emplace_back(env_dirpath);
        }
        const auto exe_dirpath = executable_directory();
        roots.push_back(exe_dirpath.parent_path().parent_path() / "roms");
        roots.push_back(exe_dirpath.parent_path() / "share" / "backplane" / "roms");
#ifdef BACKPLANE_DEFAULT_ROM_DIR
        roots.emplace_back(BACKPLANE_DEFAULT_ROM_DIR);
#endif

        std::vector<std::filesystem::path> result;
        for (const auto& root : roots) {
            for (const auto& candidate : {root / machine_type_, root}) {
                if (std::filesystem::is_directory(candidate)) {
                    result.push_back(candidate);
                }
            }
        }
        return result;
    }

    // Throws std::runtime_error naming every place looked in
    std::filesystem::path find(std::string_view name) const {
        const std::filesystem::path filepath(name);

        if (filepath.is_absolute() || filepath.has_parent_path()) {
            const auto resolved = filepath.is_absolute() ? filepath
                                                         : std::filesystem::current_path() / filepath;
            if (!std::filesystem::is_regular_file(resolved)) {
                throw std::runtime_error("ROM file not found: " + resolved.string());
            }
            return resolved;
        }

        std::string searched;
        for (const auto& dirpath : search_path()) {
            const auto candidate = dirpath / filepath;
            if (std::filesystem::is_regular_file(candidate)) {
                return candidate;
            }
            searched += searched.empty() ? "" : ", ";
            searched += dirpath.string();
        }
        throw std::runtime_error(
            "ROM file '" + std::string(name) + "' not found" +
            (searched.empty() ? std::string(" (no ROM directory; set BACKPLANE_ROM_DIR or use --rom-dir)")
                              : " (searched " + searched + ")"));
    }

private:
    static std::filesystem::path executable_directory() {
        char path[PATH_MAX];
        const ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
        if (len != -1) {
            path[len] = '\0';
            return std::filesystem::path(path).parent_path();
        }
        return std::filesystem::current_path();
    }

    std::string machine_type_;
    std::optional<std::filesystem::path> explicit_dirpath_;
};

} // namespace backplane::server

#endif // BACKPLANE_SERVER_ROM_LOCATOR_HPP
