#pragma once

#include <string>
#include <vector>

namespace mods {

static constexpr const char* kManifestName = "manifest.json";

struct ModDescriptor {
    std::string name = "Unknown";
    std::string version = "0.0.0";
    std::string description = "No description";
    std::string website_url;
    std::vector<std::string> dependencies; // raw "Author-Name-Version", declared order
};

// false when the file is absent (nothing logged) or cannot be read/decoded
// as a JSON object (one [manifest] line logged). Missing keys keep the
// ModDescriptor defaults.
bool parse_manifest(const std::string& path, ModDescriptor& out, std::string& log);

// Same as parse_manifest but from an in-memory document; origin is only used in log lines.
bool parse_manifest_text(const std::string& text, const std::string& origin, ModDescriptor& out, std::string& log);

} // namespace mods
