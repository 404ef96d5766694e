#pragma once

#include "mod/deps.hpp"
#include "mod/mods.hpp"
#include "ts/thunderstore.hpp"

#include <string>
#include <vector>

namespace textx {

// Case-insensitive substring match on the display name; an empty term keeps all.
std::vector<mods::InstalledMod> filter_mods_by_name(const std::vector<mods::InstalledMod>& list, const std::string& term);

std::string format_mod_info(const mods::InstalledMod& mod);
std::string format_dependency_tree(const mods::DependencyTree& tree, int indent=0);
std::string format_check_result(const mods::DependencyCheckResult& r);
std::string format_package_info(const ts::Package& pkg);
std::string format_file_size(double bytes);
std::string truncate(const std::string& text, size_t max_len, const std::string& suffix="...");

} // namespace textx
