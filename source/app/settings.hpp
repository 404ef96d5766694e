#pragma once

#include <string>

namespace settings {

struct Settings {
    std::string plugins_path;   // BepInEx/plugins
    std::string config_dir;     // empty: sibling "config" of plugins_path
    std::string downloads_dir;
    std::string catalog_url;
};

std::string data_dir();               // $XDG_DATA_HOME/ror2mgr
std::string default_settings_path();  // $XDG_CONFIG_HOME/ror2mgr/settings.txt
std::string config_dir_for(const std::string& plugins_path);

Settings defaults();

// Missing file: true, s keeps its values. Unknown keys are logged and ignored.
bool load(const std::string& path, Settings& s, std::string& log);
bool save(const std::string& path, const Settings& s, std::string& log);

// config_dir, falling back to the one derived from plugins_path.
std::string effective_config_dir(const Settings& s);

} // namespace settings
