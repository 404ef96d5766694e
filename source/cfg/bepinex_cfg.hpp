#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace bepcfg {

// key/value pairs in file order; comments, blank lines and [section] headers
// are not reported.
bool parse_config_file(const std::string& path,
                       std::vector<std::pair<std::string, std::string>>& out,
                       std::string& log);

// Rewrites the lines whose key appears in updates as "<indent><key> = <value>".
// All other lines, line endings included, are written back unchanged.
bool save_config_file(const std::string& path,
                      const std::map<std::string, std::string>& updates,
                      std::string& log);

std::vector<std::string> list_config_files(const std::string& dir);

} // namespace bepcfg
