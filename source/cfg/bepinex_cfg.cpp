#include "bepinex_cfg.hpp"

#include "fs/fs_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace bepcfg {

namespace {
std::string trim(const std::string& s){
    size_t a=0, b=s.size();
    while(a<b && isspace((unsigned char)s[a])) ++a;
    while(b>a && isspace((unsigned char)s[b-1])) --b;
    return s.substr(a, b-a);
}

// Splits a setting line; false for blanks, comments, headers and lines without '='.
bool split_setting(const std::string& line, std::string& key, std::string& value){
    std::string t = trim(line);
    if(t.empty() || t[0]=='#' || t[0]=='[') return false;
    size_t eq = t.find('=');
    if(eq==std::string::npos) return false;
    key = trim(t.substr(0, eq));
    value = trim(t.substr(eq+1));
    return !key.empty();
}

std::vector<std::string> split_lines(const std::string& text){
    std::vector<std::string> lines;
    size_t pos=0;
    while(pos < text.size()){
        size_t nl = text.find('\n', pos);
        if(nl==std::string::npos){ lines.push_back(text.substr(pos)); break; }
        lines.push_back(text.substr(pos, nl-pos+1));
        pos = nl+1;
    }
    return lines;
}
} // namespace

bool parse_config_file(const std::string& path,
                       std::vector<std::pair<std::string, std::string>>& out,
                       std::string& log){
    out.clear();
    std::string text;
    if(!fsx::read_file(path, text)){
        log += "[cfg] read fail: " + path + "\n";
        return false;
    }
    for(const auto& line : split_lines(text)){
        std::string key, value;
        if(split_setting(line, key, value)) out.emplace_back(std::move(key), std::move(value));
    }
    log += "[cfg] " + fsx::base_name(path) + ": " + std::to_string(out.size()) + " settings\n";
    return true;
}

bool save_config_file(const std::string& path,
                      const std::map<std::string, std::string>& updates,
                      std::string& log){
    std::string text;
    if(!fsx::read_file(path, text)){
        log += "[cfg] read fail: " + path + "\n";
        return false;
    }

    std::string result;
    result.reserve(text.size() + 64);
    size_t changed=0;
    for(const auto& line : split_lines(text)){
        std::string key, value;
        auto it = split_setting(line, key, value) ? updates.find(key) : updates.end();
        if(it==updates.end()){ result += line; continue; }

        size_t body_end = line.size();
        while(body_end>0 && (line[body_end-1]=='\n' || line[body_end-1]=='\r')) --body_end;
        size_t indent=0;
        while(indent<body_end && (line[indent]==' ' || line[indent]=='\t')) ++indent;
        result += line.substr(0, indent) + key + " = " + it->second + line.substr(body_end);
        ++changed;
    }

    const std::string tmp = path + ".tmp";
    FILE* f = fopen(tmp.c_str(), "wb");
    if(!f){ log += "[cfg] open fail: " + tmp + "\n"; return false; }
    bool ok = fwrite(result.data(), 1, result.size(), f)==result.size();
    ok = fclose(f)==0 && ok;
    if(!ok || rename(tmp.c_str(), path.c_str())!=0){
        remove(tmp.c_str());
        log += "[cfg] write fail: " + path + "\n";
        return false;
    }
    log += "[cfg] saved " + fsx::base_name(path) + " (" + std::to_string(changed) + " changed)\n";
    return true;
}

std::vector<std::string> list_config_files(const std::string& dir){
    std::vector<std::string> out;
    for(const auto& de : fsx::list_dirents(dir)){
        if(de.is_file && fsx::ext_lower(de.path)==".cfg") out.push_back(de.path);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace bepcfg
