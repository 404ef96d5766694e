#pragma once

#include <string>
#include <vector>

namespace zipx {

// Reads the end-of-central-directory record and the central directory.
// false means the file is not a readable zip container.
bool list_entries(const std::string& zip_path, std::vector<std::string>& names, std::string& log);

// Extracts every entry below out_root. Entries with unsafe paths are skipped
// (logged); any I/O, inflate or CRC failure makes the call return false.
// Files already written are not removed.
bool unzip_to(const std::string& zip_path, const std::string& out_root, std::string& log);

} // namespace zipx
