#include "settings.hpp"

#include "fs/fs_utils.hpp"
#include "ts/thunderstore.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace settings {

namespace {
constexpr const char* kAppDir = "ror2mgr";

std::string env_or_home(const char* var, const char* home_rel){
    const char* v = getenv(var);
    if(v && *v) return v;
    const char* home = getenv("HOME");
    return fsx::join(home && *home ? home : ".", home_rel);
}

std::string trim(const std::string& s){
    size_t a=0, b=s.size();
    while(a<b && isspace((unsigned char)s[a])) ++a;
    while(b>a && isspace((unsigned char)s[b-1])) --b;
    return s.substr(a, b-a);
}
} // namespace

std::string data_dir(){
    return fsx::join(env_or_home("XDG_DATA_HOME", ".local/share"), kAppDir);
}

std::string default_settings_path(){
    return fsx::join(fsx::join(env_or_home("XDG_CONFIG_HOME", ".config"), kAppDir), "settings.txt");
}

std::string config_dir_for(const std::string& plugins_path){
    if(plugins_path.empty()) return {};
    return fsx::join(fsx::parent_dir(plugins_path), "config");
}

Settings defaults(){
    Settings s;
    s.downloads_dir = fsx::join(data_dir(), "downloads");
    s.catalog_url = ts::kDefaultApiUrl;
    return s;
}

bool load(const std::string& path, Settings& s, std::string& log){
    if(!fsx::exists(path)) return true;
    std::string text;
    if(!fsx::read_file(path, text)){
        log += "[settings] read fail: " + path + "\n";
        return false;
    }
    size_t pos=0, lineno=0;
    while(pos <= text.size()){
        size_t nl = text.find('\n', pos);
        std::string line = trim(text.substr(pos, nl==std::string::npos ? std::string::npos : nl-pos));
        ++lineno;
        pos = (nl==std::string::npos) ? text.size()+1 : nl+1;
        if(line.empty() || line[0]=='#') continue;
        size_t eq = line.find('=');
        if(eq==std::string::npos){
            log += "[settings] " + path + ":" + std::to_string(lineno) + ": missing '='\n";
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq+1));
        if(key=="plugins_path"){
            if(!value.empty() && !fsx::isdir(value)){
                log += "[settings] saved plugins_path no longer exists: " + value + "\n";
                continue;
            }
            s.plugins_path = value;
        }
        else if(key=="config_dir")    s.config_dir = value;
        else if(key=="downloads_dir"){ if(!value.empty()) s.downloads_dir = value; }
        else if(key=="catalog_url"){   if(!value.empty()) s.catalog_url = value; }
        else log += "[settings] unknown key: " + key + "\n";
    }
    return true;
}

bool save(const std::string& path, const Settings& s, std::string& log){
    if(!fsx::makedirs(fsx::parent_dir(path))){
        log += "[settings] mkdir fail: " + fsx::parent_dir(path) + "\n";
        return false;
    }
    std::string text = "# ror2mgr settings\n";
    text += "plugins_path=" + s.plugins_path + "\n";
    text += "config_dir=" + s.config_dir + "\n";
    text += "downloads_dir=" + s.downloads_dir + "\n";
    text += "catalog_url=" + s.catalog_url + "\n";

    FILE* f = fopen(path.c_str(), "wb");
    if(!f){ log += "[settings] open fail: " + path + "\n"; return false; }
    bool ok = fwrite(text.data(), 1, text.size(), f)==text.size();
    ok = fclose(f)==0 && ok;
    if(!ok){ log += "[settings] write fail: " + path + "\n"; return false; }
    log += "[settings] saved " + path + "\n";
    return true;
}

std::string effective_config_dir(const Settings& s){
    return s.config_dir.empty() ? config_dir_for(s.plugins_path) : s.config_dir;
}

} // namespace settings
