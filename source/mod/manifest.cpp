#include "manifest.hpp"

#include "fs/fs_utils.hpp"

#include <nlohmann/json.hpp>

namespace mods {

namespace {
using json = nlohmann::json;

void read_string(const json& data, const char* key, std::string& out){
    auto it = data.find(key);
    if(it == data.end() || !it->is_string()) return;
    out = it->get<std::string>();
}
} // namespace

bool parse_manifest_text(const std::string& text, const std::string& origin, ModDescriptor& out, std::string& log){
    json data;
    try {
        data = json::parse(text);
    }
    catch (const json::parse_error& e) {
        log += "[manifest] invalid JSON in " + origin + ": " + e.what() + "\n";
        return false;
    }
    if(!data.is_object()){
        log += "[manifest] not a JSON object: " + origin + "\n";
        return false;
    }

    ModDescriptor m{};
    read_string(data, "name", m.name);
    read_string(data, "version_number", m.version);
    read_string(data, "website_url", m.website_url);
    read_string(data, "description", m.description);

    auto deps = data.find("dependencies");
    if(deps != data.end() && deps->is_array()){
        for(const json& d : *deps){
            if(!d.is_string()){
                log += "[manifest] skip non-string dependency in " + origin + "\n";
                continue;
            }
            m.dependencies.push_back(d.get<std::string>());
        }
    }
    out = std::move(m);
    return true;
}

bool parse_manifest(const std::string& path, ModDescriptor& out, std::string& log){
    if(!fsx::exists(path)) return false;
    std::string text;
    if(!fsx::isfile(path) || !fsx::read_file(path, text)){
        log += "[manifest] read fail: " + path + "\n";
        return false;
    }
    return parse_manifest_text(text, path, out, log);
}

} // namespace mods
