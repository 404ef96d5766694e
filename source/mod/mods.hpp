#pragma once

#include "mod/manifest.hpp"

#include <string>
#include <vector>

namespace mods {

static constexpr const char* kDisabledSuffix = ".disabled";

enum class Error {
    None,
    NotFound,
    AlreadyExists,
    AccessDenied,
    InvalidArchive,
    NotAnArchive,
    NotADirectory,
    ParseFailure,
    NetworkFailure,
    Io,
};

const char* error_name(Error e);

struct InstalledMod : ModDescriptor {
    std::string path;         // folder on disk, suffix included
    std::string folder_name;  // folder name without kDisabledSuffix
    bool enabled=true;
};

bool is_disabled_name(const std::string& folder);
std::string strip_disabled(const std::string& folder);

// Missing root: true with an empty list. Order: case-insensitive name,
// ties in path order.
bool scan_root(const std::string& root, std::vector<InstalledMod>& out, Error& err, std::string& log);

// enabled receives the new state, or the unchanged previous state on failure.
bool toggle_mod(const std::string& mod_path, bool& enabled, Error& err, std::string& log);

bool install_from_archive(const std::string& archive_path,
                          const std::string& target_dir,
                          std::string& mod_name,
                          Error& err,
                          std::string& log);

bool uninstall_mod(const std::string& mod_path,
                   bool delete_configs,
                   const std::string& config_dir,
                   std::string& message,
                   Error& err,
                   std::string& log);

} // namespace mods
