#include "mods.hpp"

#include "fs/fs_utils.hpp"
#include "zip/zip_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <strings.h>

namespace mods {

namespace {
std::string lower(std::string s){
    for(char& c : s) c=(char)tolower((unsigned char)c);
    return s;
}

bool ends_with(const std::string& s, const char* suffix){
    size_t n=s.size(), m=strlen(suffix); if(m>n) return false;
    return s.compare(n-m, m, suffix)==0;
}

Error errno_kind(int e){
    if(e==EACCES || e==EPERM || e==EROFS) return Error::AccessDenied;
    if(e==ENOENT) return Error::NotFound;
    if(e==ENOTDIR) return Error::NotADirectory;
    return Error::Io;
}

bool is_manifest_entry(const std::string& entry){
    std::string n=entry; std::replace(n.begin(), n.end(), '\\', '/');
    if(n.empty() || n.back()=='/') return false;
    return strcasecmp(fsx::base_name(n).c_str(), kManifestName)==0;
}

std::string display_name_for(const std::string& mod_path){
    std::string name = strip_disabled(fsx::base_name(mod_path));
    ModDescriptor m;
    std::string ignored;
    if(parse_manifest(fsx::join(mod_path, kManifestName), m, ignored)) name = m.name;
    return name;
}
} // namespace

const char* error_name(Error e){
    switch(e){
        case Error::None:           return "ok";
        case Error::NotFound:       return "not found";
        case Error::AlreadyExists:  return "already exists";
        case Error::AccessDenied:   return "access denied";
        case Error::InvalidArchive: return "invalid archive";
        case Error::NotAnArchive:   return "not a .zip archive";
        case Error::NotADirectory:  return "not a directory";
        case Error::ParseFailure:   return "parse failure";
        case Error::NetworkFailure: return "network failure";
        case Error::Io:             return "i/o error";
    }
    return "unknown";
}

bool is_disabled_name(const std::string& folder){
    return ends_with(folder, kDisabledSuffix);
}

std::string strip_disabled(const std::string& folder){
    if(!is_disabled_name(folder)) return folder;
    return folder.substr(0, folder.size() - strlen(kDisabledSuffix));
}

bool scan_root(const std::string& root, std::vector<InstalledMod>& out, Error& err, std::string& log){
    out.clear();
    err = Error::None;
    if(!fsx::exists(root)){ log += "[scan] plugins dir missing: " + root + "\n"; return true; }
    if(!fsx::isdir(root)){
        err = Error::NotADirectory;
        log += "[scan] not a directory: " + root + "\n";
        return false;
    }
    std::vector<fsx::DirEnt> ents;
    int e=0;
    if(!fsx::list_dirents_checked(root, ents, e)){
        err = errno_kind(e);
        if(err==Error::NotFound) err = Error::Io;
        log += "[scan] cannot list " + root + ": " + strerror(e) + "\n";
        return false;
    }

    std::vector<InstalledMod> found;
    for(const auto& de : ents){
        if(!de.is_dir) continue;
        std::string manifest = fsx::join(de.path, kManifestName);
        if(!fsx::exists(manifest)){
            log += "[scan] skip (no manifest): " + de.path + "\n";
            continue;
        }
        ModDescriptor desc;
        if(!parse_manifest(manifest, desc, log)){
            log += "[scan] skip (bad manifest): " + de.path + "\n";
            continue;
        }
        InstalledMod m{};
        static_cast<ModDescriptor&>(m) = std::move(desc);
        std::string base = fsx::base_name(de.path);
        m.path = de.path;
        m.enabled = !is_disabled_name(base);
        m.folder_name = strip_disabled(base);
        found.push_back(std::move(m));
    }
    std::stable_sort(found.begin(), found.end(), [](const InstalledMod& a, const InstalledMod& b){
        return lower(a.name) < lower(b.name);
    });
    out = std::move(found);
    log += "[scan] found=" + std::to_string(out.size()) + " in " + root + "\n";
    return true;
}

bool toggle_mod(const std::string& mod_path, bool& enabled, Error& err, std::string& log){
    err = Error::None;
    if(!fsx::exists(mod_path)){
        err = Error::NotFound;
        log += "[toggle] mod folder not found: " + mod_path + "\n";
        return false;
    }
    const std::string base = fsx::base_name(mod_path);
    const std::string parent = fsx::parent_dir(mod_path);
    const bool was_enabled = !is_disabled_name(base);
    enabled = was_enabled;

    std::string target = fsx::join(parent, was_enabled ? base + kDisabledSuffix : strip_disabled(base));
    if(fsx::exists(target)){
        err = Error::AlreadyExists;
        log += "[toggle] cannot " + std::string(was_enabled ? "disable" : "enable") + ": " + target + " already exists\n";
        return false;
    }
    if(::rename(mod_path.c_str(), target.c_str())!=0){
        int e = errno;
        err = errno_kind(e);
        log += "[toggle] rename " + mod_path + " -> " + target + " failed: " + strerror(e) + "\n";
        return false;
    }
    enabled = !was_enabled;
    log += std::string(enabled ? "[toggle] enabled: " : "[toggle] disabled: ") + strip_disabled(base) + "\n";
    return true;
}

bool install_from_archive(const std::string& archive_path,
                          const std::string& target_dir,
                          std::string& mod_name,
                          Error& err,
                          std::string& log){
    err = Error::None;
    if(!fsx::isfile(archive_path)){
        err = Error::NotFound;
        log += "[install] file not found: " + archive_path + "\n";
        return false;
    }
    if(fsx::ext_lower(archive_path) != ".zip"){
        err = Error::NotAnArchive;
        log += "[install] not a .zip archive: " + archive_path + "\n";
        return false;
    }
    std::vector<std::string> entries;
    if(!zipx::list_entries(archive_path, entries, log)){
        err = Error::InvalidArchive;
        log += "[install] invalid or corrupted zip: " + archive_path + "\n";
        return false;
    }
    if(std::none_of(entries.begin(), entries.end(), is_manifest_entry)){
        err = Error::InvalidArchive;
        log += std::string("[install] no ") + kManifestName + " in archive: " + archive_path + "\n";
        return false;
    }

    const std::string folder = fsx::base_name(fsx::strip_ext(archive_path));
    const std::string dest = fsx::join(target_dir, folder);
    if(fsx::exists(dest)){
        err = Error::AlreadyExists;
        log += "[install] mod folder already exists: " + folder + "\n";
        return false;
    }
    if(fsx::exists(dest + kDisabledSuffix)){
        err = Error::AlreadyExists;
        log += "[install] mod already exists (disabled): " + folder + "\n";
        return false;
    }

    if(!fsx::makedirs(dest)){
        int e = errno;
        err = errno_kind(e);
        if(err==Error::NotFound) err = Error::Io;
        log += "[install] mkdir fail: " + dest + "\n";
        return false;
    }
    log += "[install] extracting " + archive_path + " -> " + dest + "\n";
    if(!zipx::unzip_to(archive_path, dest, log)){
        err = Error::Io;
        log += "[install] extraction incomplete, left in place: " + dest + "\n";
        return false;
    }

    mod_name = folder;
    ModDescriptor desc;
    if(parse_manifest(fsx::join(dest, kManifestName), desc, log)) mod_name = desc.name;
    log += "[install] installed: " + mod_name + "\n";
    return true;
}

bool uninstall_mod(const std::string& mod_path,
                   bool delete_configs,
                   const std::string& config_dir,
                   std::string& message,
                   Error& err,
                   std::string& log){
    err = Error::None;
    if(!fsx::exists(mod_path)){
        err = Error::NotFound;
        log += "[uninstall] mod folder not found: " + mod_path + "\n";
        return false;
    }
    if(!fsx::isdir(mod_path)){
        err = Error::NotADirectory;
        log += "[uninstall] not a directory: " + mod_path + "\n";
        return false;
    }

    const std::string folder = strip_disabled(fsx::base_name(mod_path));
    const std::string mod_name = display_name_for(mod_path);

    int e=0;
    if(!fsx::rmtree(mod_path, &e)){
        err = errno_kind(e);
        if(err==Error::NotFound) err = Error::Io;
        log += "[uninstall] delete failed for " + mod_path + ": " + strerror(e) + "\n";
        return false;
    }
    log += "[uninstall] removed " + mod_path + "\n";

    std::vector<std::string> removed;
    if(delete_configs && !config_dir.empty() && fsx::isdir(config_dir)){
        const std::string folder_l = lower(folder);
        const std::string name_l = lower(mod_name);
        for(const auto& de : fsx::list_dirents(config_dir)){
            if(!de.is_file || fsx::ext_lower(de.path) != ".cfg") continue;
            std::string file = fsx::base_name(de.path);
            std::string stem = lower(fsx::strip_ext(file));
            bool match = (!folder_l.empty() && stem.find(folder_l)!=std::string::npos) ||
                         (!name_l.empty() && stem.find(name_l)!=std::string::npos);
            if(!match) continue;
            if(::remove(de.path.c_str())==0){
                removed.push_back(file);
                log += "[uninstall] deleted config: " + file + "\n";
            }else{
                log += "[uninstall] failed to delete config " + de.path + ": " + strerror(errno) + "\n";
            }
        }
    }

    if(removed.empty()){
        message = "Successfully uninstalled: " + mod_name;
    }else{
        message = "Uninstalled " + mod_name + " and removed config(s): ";
        for(size_t i=0;i<removed.size();++i){
            if(i) message += ", ";
            message += removed[i];
        }
    }
    log += "[uninstall] " + message + "\n";
    return true;
}

} // namespace mods
