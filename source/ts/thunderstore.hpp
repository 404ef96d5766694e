#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace ts {

static constexpr const char* kDefaultApiUrl = "https://thunderstore.io/c/riskofrain2/api/v1/package/";

struct Package {
    std::string name;
    std::string full_name;    // Owner-Name
    std::string owner;
    std::string description;  // latest version
    std::string version;
    std::string download_url;
    long long downloads=0;
    long long rating=0;
    std::vector<std::string> categories;
    std::vector<std::string> dependencies;
    std::string date_updated;
    bool is_deprecated=false;
};

struct DlProg {
    std::atomic<long long> now{0};
    std::atomic<long long> total{0};
    std::atomic<bool>      cancel{false};
};

bool http_get(const std::string& url, std::string& body, std::string& log);

// The whole package index; out is a JSON array on success, error holds a
// one-line reason otherwise.
bool fetch_all_packages(const std::string& api_url, nlohmann::json& out, std::string& error, std::string& log);

// false for records that are not objects or have no versions. Fields of the
// wrong JSON type keep their defaults.
bool parse_package(const nlohmann::json& data, Package& out);

std::vector<Package> search_packages(const nlohmann::json& packages, const std::string& query, size_t limit=20);
std::vector<Package> popular_packages(const nlohmann::json& packages, size_t limit=20);
std::vector<Package> recently_updated(const nlohmann::json& packages, size_t limit=20);
bool find_package(const nlohmann::json& packages, const std::string& full_name, Package& out);

// Maps anything outside [A-Za-z0-9 ._-] to '_' and trims leading/trailing
// dots and spaces; never empty.
std::string safe_name(std::string s);
// <full_name>-<version>.zip with both parts passed through safe_name.
std::string download_file_name(const Package& pkg);

// Saves download_file_name(pkg) below dest_dir, going through a .part file.
bool download_package(const Package& pkg,
                      const std::string& dest_dir,
                      std::string& saved_path,
                      std::string& error,
                      std::string& log,
                      DlProg* prog=nullptr);

class PackageCache {
public:
    explicit PackageCache(std::string api_url = kDefaultApiUrl) : api_url_(std::move(api_url)) {}

    bool refresh(std::string& error, std::string& log);
    void assign(nlohmann::json packages);
    const nlohmann::json& get() const { return packages_; }
    bool loaded() const { return loaded_; }
    size_t size() const { return loaded_ ? packages_.size() : 0; }
    void clear();
    const std::string& api_url() const { return api_url_; }

private:
    std::string api_url_;
    nlohmann::json packages_ = nlohmann::json::array();
    bool loaded_=false;
};

} // namespace ts
