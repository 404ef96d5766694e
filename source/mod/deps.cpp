#include "deps.hpp"

#include <cctype>
#include <exception>
#include <unordered_set>

namespace mods {

namespace {
std::string lower(std::string s){
    for(char& c : s) c=(char)tolower((unsigned char)c);
    return s;
}

std::string trim(const std::string& s){
    size_t a=0, b=s.size();
    while(a<b && isspace((unsigned char)s[a])) ++a;
    while(b>a && isspace((unsigned char)s[b-1])) --b;
    return s.substr(a, b-a);
}

std::unordered_set<std::string> identifier_set(const std::vector<InstalledMod>& installed){
    std::unordered_set<std::string> ids;
    for(const auto& m : installed){
        ids.insert(lower(m.folder_name));
        ids.insert(lower(m.name));
        size_t dash = m.folder_name.find('-');
        if(dash!=std::string::npos) ids.insert(lower(m.folder_name.substr(dash+1)));
    }
    return ids;
}

const InstalledMod* find_installed(const DependencyIdentifier& dep, const std::vector<InstalledMod>& all){
    const std::string needle = lower(dep.name);
    for(const auto& m : all){
        if(lower(m.folder_name).find(needle)!=std::string::npos || lower(m.name)==needle) return &m;
    }
    return nullptr;
}

DependencyTree tree_at(const ModDescriptor& mod, const std::vector<InstalledMod>& all, int depth, int max_depth){
    DependencyTree node;
    node.name = mod.name;
    node.version = mod.version;
    if(depth >= max_depth){ node.status = TreeStatus::Truncated; return node; }

    for(const auto& token : mod.dependencies){
        DependencyIdentifier dep;
        if(!parse_dependency(token, dep)){
            DependencyTree leaf;
            leaf.name = token;
            leaf.status = TreeStatus::Invalid;
            node.children.push_back(std::move(leaf));
            continue;
        }
        if(const InstalledMod* hit = find_installed(dep, all)){
            DependencyTree sub = tree_at(*hit, all, depth+1, max_depth);
            if(sub.status != TreeStatus::Truncated) sub.status = TreeStatus::Installed;
            node.children.push_back(std::move(sub));
        }else{
            DependencyTree leaf;
            leaf.name = dep.author + "-" + dep.name;
            leaf.version = dep.version;
            leaf.status = TreeStatus::Missing;
            node.children.push_back(std::move(leaf));
        }
    }
    return node;
}
} // namespace

const char* dep_status_name(DepStatus s){
    switch(s){
        case DepStatus::Found:   return "found";
        case DepStatus::Missing: return "missing";
        case DepStatus::Invalid: return "invalid";
        case DepStatus::Error:   return "error";
    }
    return "unknown";
}

const char* tree_status_name(TreeStatus s){
    switch(s){
        case TreeStatus::Root:      return "root";
        case TreeStatus::Installed: return "installed";
        case TreeStatus::Missing:   return "missing";
        case TreeStatus::Invalid:   return "invalid";
        case TreeStatus::Truncated: return "truncated";
    }
    return "unknown";
}

bool parse_dependency(const std::string& token, DependencyIdentifier& out){
    const std::string s = trim(token);
    if(s.empty()) return false;
    std::vector<std::string> parts;
    size_t beg=0;
    for(;;){
        size_t dash = s.find('-', beg);
        if(dash==std::string::npos){ parts.push_back(s.substr(beg)); break; }
        parts.push_back(s.substr(beg, dash-beg));
        beg = dash+1;
    }
    if(parts.size() < 3) return false;

    std::string name = parts[1];
    for(size_t i=2;i+1<parts.size();++i) name += "-" + parts[i];

    DependencyIdentifier d;
    d.author = trim(parts.front());
    d.name = trim(name);
    d.version = trim(parts.back());
    d.raw = token;
    if(d.author.empty() || d.name.empty() || d.version.empty()) return false;
    out = std::move(d);
    return true;
}

DependencyCheckResult check_dependencies(const ModDescriptor& mod,
                                         const std::vector<InstalledMod>& installed,
                                         std::string& log){
    DependencyCheckResult r;
    if(mod.dependencies.empty()) return r;

    const auto ids = identifier_set(installed);
    for(const auto& token : mod.dependencies){
        DependencyDetail d;
        d.dependency = token;
        try {
            DependencyIdentifier dep;
            if(!parse_dependency(token, dep)){
                d.status = DepStatus::Invalid;
                d.message = "Could not parse dependency string";
                r.details.push_back(std::move(d));
                continue;
            }
            const bool hit = ids.count(lower(dep.name)) || ids.count(lower(dep.author + "-" + dep.name));
            d.has_parsed = true;
            d.parsed = dep;
            if(hit){ d.status = DepStatus::Found;   r.found.push_back(token); }
            else   { d.status = DepStatus::Missing; r.missing.push_back(token); }
        }
        catch (const std::exception& e) {
            d.status = DepStatus::Error;
            d.has_parsed = false;
            d.message = e.what();
            log += "[deps] error checking " + token + ": " + e.what() + "\n";
        }
        r.details.push_back(std::move(d));
    }
    r.satisfied = r.missing.empty();
    return r;
}

MissingDependencies find_missing_dependencies(const std::vector<InstalledMod>& installed, std::string& log){
    MissingDependencies out;
    for(const auto& m : installed){
        try {
            DependencyCheckResult r = check_dependencies(m, installed, log);
            if(r.satisfied) continue;
            bool merged=false;
            for(auto& slot : out){
                if(slot.first==m.name){ slot.second = std::move(r.missing); merged=true; break; }
            }
            if(!merged) out.emplace_back(m.name, std::move(r.missing));
        }
        catch (const std::exception& e) {
            log += "[deps] error checking dependencies for " + m.name + ": " + e.what() + "\n";
        }
    }
    if(!out.empty()) log += "[deps] mods with missing dependencies: " + std::to_string(out.size()) + "\n";
    return out;
}

DependencyTree build_dependency_tree(const ModDescriptor& mod, const std::vector<InstalledMod>& all, int max_depth){
    DependencyTree root = tree_at(mod, all, 0, max_depth);
    if(root.status != TreeStatus::Truncated) root.status = TreeStatus::Root;
    return root;
}

} // namespace mods
