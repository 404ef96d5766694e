#include "format.hpp"

#include <cctype>
#include <cstdio>

namespace textx {

namespace {
std::string lower(std::string s){
    for(char& c : s) c=(char)tolower((unsigned char)c);
    return s;
}
} // namespace

std::vector<mods::InstalledMod> filter_mods_by_name(const std::vector<mods::InstalledMod>& list, const std::string& term){
    if(term.empty()) return list;
    const std::string t = lower(term);
    std::vector<mods::InstalledMod> out;
    for(const auto& m : list) if(lower(m.name).find(t)!=std::string::npos) out.push_back(m);
    return out;
}

std::string format_mod_info(const mods::InstalledMod& mod){
    std::string s;
    s += "Name: " + mod.name + "\n";
    s += "Version: " + mod.version + "\n";
    s += std::string("Status: ") + (mod.enabled ? "✓ Enabled" : "✗ Disabled") + "\n";
    s += "Description: " + mod.description;
    if(!mod.dependencies.empty()){
        s += "\nDependencies (" + std::to_string(mod.dependencies.size()) + "):";
        for(const auto& d : mod.dependencies) s += "\n  - " + d;
    }
    if(!mod.website_url.empty()) s += "\nWebsite: " + mod.website_url;
    if(!mod.path.empty()) s += "\nPath: " + mod.path;
    return s;
}

std::string format_dependency_tree(const mods::DependencyTree& tree, int indent){
    const std::string prefix((size_t)indent * 2, ' ');
    std::string s;
    switch(tree.status){
        case mods::TreeStatus::Missing:
            s = prefix + "✗ " + tree.name + " v" + tree.version + " (MISSING)";
            break;
        case mods::TreeStatus::Installed:
            s = prefix + "✓ " + tree.name + " v" + tree.version;
            break;
        case mods::TreeStatus::Invalid:
            s = prefix + "• " + tree.name + " (INVALID)";
            break;
        default:
            s = prefix + "• " + tree.name;
            if(!tree.version.empty()) s += " v" + tree.version;
            break;
    }
    if(tree.status == mods::TreeStatus::Truncated) s += "\n" + prefix + "  ... (truncated)";
    for(const auto& child : tree.children) s += "\n" + format_dependency_tree(child, indent+1);
    return s;
}

std::string format_check_result(const mods::DependencyCheckResult& r){
    std::string s = r.satisfied ? "All dependencies satisfied" : "Missing dependencies: " + std::to_string(r.missing.size());
    for(const auto& d : r.details){
        s += "\n  [" + std::string(mods::dep_status_name(d.status)) + "] " + d.dependency;
        if(!d.message.empty()) s += " (" + d.message + ")";
    }
    return s;
}

std::string format_package_info(const ts::Package& pkg){
    std::string s;
    s += "Name: " + pkg.full_name + "\n";
    s += "Version: " + pkg.version + "\n";
    s += "Owner: " + pkg.owner + "\n";
    s += "Downloads: " + std::to_string(pkg.downloads) + "\n";
    s += "Rating: " + std::to_string(pkg.rating) + "\n";
    if(!pkg.categories.empty()){
        s += "Categories: ";
        for(size_t i=0;i<pkg.categories.size();++i){ if(i) s += ", "; s += pkg.categories[i]; }
        s += "\n";
    }
    if(!pkg.date_updated.empty()) s += "Updated: " + pkg.date_updated.substr(0, 10) + "\n";
    if(pkg.is_deprecated) s += "Status: DEPRECATED\n";
    s += "Description: " + pkg.description;
    if(!pkg.dependencies.empty()){
        s += "\nDependencies (" + std::to_string(pkg.dependencies.size()) + "):";
        const size_t shown = pkg.dependencies.size() < 10 ? pkg.dependencies.size() : 10;
        for(size_t i=0;i<shown;++i) s += "\n  - " + pkg.dependencies[i];
        if(pkg.dependencies.size() > shown)
            s += "\n  ... and " + std::to_string(pkg.dependencies.size() - shown) + " more";
    }
    return s;
}

std::string format_file_size(double bytes){
    static const char* units[] = {"B", "KB", "MB", "GB"};
    char buf[48];
    for(const char* u : units){
        if(bytes < 1024.0){
            snprintf(buf, sizeof(buf), "%.1f %s", bytes, u);
            return buf;
        }
        bytes /= 1024.0;
    }
    snprintf(buf, sizeof(buf), "%.1f TB", bytes);
    return buf;
}

std::string truncate(const std::string& text, size_t max_len, const std::string& suffix){
    if(text.size() <= max_len) return text;
    if(max_len <= suffix.size()) return suffix.substr(0, max_len);
    size_t cut = max_len - suffix.size();
    // back up to a UTF-8 lead byte so no code point is split
    while(cut > 0 && ((unsigned char)text[cut] & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + suffix;
}

} // namespace textx
