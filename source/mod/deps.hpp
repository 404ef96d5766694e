#pragma once

#include "mod/mods.hpp"

#include <string>
#include <utility>
#include <vector>

namespace mods {

// "Author-Name-Version"; Name may itself contain '-'.
struct DependencyIdentifier {
    std::string author;
    std::string name;
    std::string version;
    std::string raw;
};

enum class DepStatus { Found, Missing, Invalid, Error };
const char* dep_status_name(DepStatus s);

struct DependencyDetail {
    std::string dependency;
    DepStatus status=DepStatus::Invalid;
    bool has_parsed=false;
    DependencyIdentifier parsed;
    std::string message;
};

struct DependencyCheckResult {
    bool satisfied=true;
    std::vector<std::string> missing;
    std::vector<std::string> found;
    std::vector<DependencyDetail> details;
};

enum class TreeStatus { Root, Installed, Missing, Invalid, Truncated };
const char* tree_status_name(TreeStatus s);

struct DependencyTree {
    std::string name;
    std::string version;
    TreeStatus status=TreeStatus::Root;
    std::vector<DependencyTree> children;
};

using MissingDependencies = std::vector<std::pair<std::string, std::vector<std::string>>>;

bool parse_dependency(const std::string& token, DependencyIdentifier& out);

// Matching is by name only; the version segment is parsed but never compared.
DependencyCheckResult check_dependencies(const ModDescriptor& mod,
                                         const std::vector<InstalledMod>& installed,
                                         std::string& log);

// Unsatisfied mods only, in registry order.
MissingDependencies find_missing_dependencies(const std::vector<InstalledMod>& installed, std::string& log);

DependencyTree build_dependency_tree(const ModDescriptor& mod,
                                     const std::vector<InstalledMod>& all,
                                     int max_depth=10);

} // namespace mods
