#include "thunderstore.hpp"

#include "fs/fs_utils.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <limits>

namespace ts {

namespace {
using json = nlohmann::json;

constexpr long kCurlBufferSize = 128 * 1024;
constexpr const char* kUserAgent = "ror2mgr/1.0";

size_t curl_write_str(void* ptr, size_t sz, size_t nm, void* userdata){
    auto* out = static_cast<std::string*>(userdata);
    out->append(static_cast<const char*>(ptr), sz*nm);
    return sz*nm;
}
size_t curl_write_file(void* ptr, size_t sz, size_t nm, void* userdata){
    FILE* f = static_cast<FILE*>(userdata);
    if(!f) return 0;
    return fwrite(ptr, sz, nm, f);
}

int curl_xfer_cb(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t){
    auto* p = static_cast<DlProg*>(clientp);
    if(!p) return 0;
    p->total.store((long long)dltotal, std::memory_order_relaxed);
    p->now.store((long long)dlnow,     std::memory_order_relaxed);
    return p->cancel.load(std::memory_order_relaxed) ? 1 : 0;
}
void set_progress_opts(CURL* curl, DlProg* prog){
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &curl_xfer_cb);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA,    prog);
}

void set_common_opts(CURL* curl, const std::string& url){
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, kCurlBufferSize);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 15000L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 8L);
}

// rc/http are both reported so callers can phrase the failure.
CURLcode http_get_status(const std::string& url, std::string& body, long& http_code, std::string& log){
    body.clear();
    http_code = 0;
    CURL* curl = curl_easy_init();
    if(!curl){ log += "[net] curl_easy_init failed\n"; return CURLE_FAILED_INIT; }

    set_common_opts(curl, url);
    // the full index is tens of MB; allow compressed transfer
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &curl_write_str);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 15L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 120000L);

    log += "[ts] url=" + url + "\n";
    CURLcode rc = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if(rc != CURLE_OK){
        log += std::string("[net] curl: ") + curl_easy_strerror(rc) + "\n";
        return rc;
    }
    char buf[96];
    snprintf(buf,sizeof(buf),"[ts] http=%ld bytes=%zu\n", http_code, body.size());
    log += buf;
    return rc;
}

std::string lower(std::string s){
    for(char& c : s) c=(char)tolower((unsigned char)c);
    return s;
}

std::string str_field(const json& o, const char* key, const char* def=""){
    auto it = o.find(key);
    if(it==o.end() || !it->is_string()) return def;
    return it->get<std::string>();
}

long long int_field(const json& o, const char* key){
    auto it = o.find(key);
    if(it==o.end() || !it->is_number()) return 0;
    if(!it->is_number_float()) return it->get<long long>();
    const double d = it->get<double>();
    if(d != d) return 0;
    if(d >= 9.2e18) return std::numeric_limits<long long>::max();
    if(d <= -9.2e18) return std::numeric_limits<long long>::min();
    return (long long)d;
}

std::vector<std::string> str_list(const json& o, const char* key){
    std::vector<std::string> out;
    auto it = o.find(key);
    if(it==o.end() || !it->is_array()) return out;
    for(const json& v : *it) if(v.is_string()) out.push_back(v.get<std::string>());
    return out;
}

const json* latest_version(const json& data){
    if(!data.is_object()) return nullptr;
    auto it = data.find("versions");
    if(it==data.end() || !it->is_array() || it->empty() || !it->front().is_object()) return nullptr;
    return &it->front();
}

std::vector<Package> live_packages(const json& packages){
    std::vector<Package> out;
    if(!packages.is_array()) return out;
    for(const json& d : packages){
        Package p;
        if(parse_package(d, p) && !p.is_deprecated) out.push_back(std::move(p));
    }
    return out;
}
} // namespace

bool http_get(const std::string& url, std::string& body, std::string& log){
    long http_code=0;
    CURLcode rc = http_get_status(url, body, http_code, log);
    return rc==CURLE_OK && http_code==200 && !body.empty();
}

bool fetch_all_packages(const std::string& api_url, json& out, std::string& error, std::string& log){
    std::string body;
    long http_code=0;
    CURLcode rc = http_get_status(api_url, body, http_code, log);
    if(rc != CURLE_OK){
        error = rc==CURLE_OPERATION_TIMEDOUT ? std::string("Connection timed out")
                                             : std::string("Connection failed: ") + curl_easy_strerror(rc);
        return false;
    }
    if(http_code != 200){
        error = "HTTP Error " + std::to_string(http_code);
        log += "[ts] " + error + "\n";
        return false;
    }
    try {
        out = json::parse(body);
    }
    catch (const json::parse_error& e) {
        error = std::string("Failed to parse API response: ") + e.what();
        log += "[ts] " + error + "\n";
        return false;
    }
    if(!out.is_array()){
        error = "Failed to parse API response: expected a package array";
        log += "[ts] " + error + "\n";
        out = json::array();
        return false;
    }
    log += "[ts] fetched " + std::to_string(out.size()) + " packages\n";
    return true;
}

bool parse_package(const json& data, Package& out){
    const json* latest = latest_version(data);
    if(!latest) return false;

    Package p;
    p.name = str_field(data, "name", "Unknown");
    p.full_name = str_field(data, "full_name");
    p.owner = str_field(data, "owner");
    p.description = str_field(*latest, "description");
    p.version = str_field(*latest, "version_number", "0.0.0");
    p.download_url = str_field(*latest, "download_url");
    p.downloads = int_field(*latest, "downloads");
    p.rating = int_field(data, "rating_score");
    p.categories = str_list(data, "categories");
    p.dependencies = str_list(*latest, "dependencies");
    p.date_updated = str_field(data, "date_updated");
    auto dep = data.find("is_deprecated");
    p.is_deprecated = dep!=data.end() && dep->is_boolean() && dep->get<bool>();
    out = std::move(p);
    return true;
}

std::vector<Package> search_packages(const json& packages, const std::string& query, size_t limit){
    std::vector<Package> out;
    if(query.empty() || !packages.is_array()) return out;
    const std::string q = lower(query);
    for(const json& d : packages){
        if(out.size() >= limit) break;
        if(!d.is_object()) continue;
        const json* latest = latest_version(d);
        std::string desc = latest ? lower(str_field(*latest, "description")) : std::string();
        if(lower(str_field(d, "name")).find(q)==std::string::npos &&
           lower(str_field(d, "full_name")).find(q)==std::string::npos &&
           desc.find(q)==std::string::npos) continue;
        Package p;
        if(parse_package(d, p) && !p.is_deprecated) out.push_back(std::move(p));
    }
    return out;
}

std::vector<Package> popular_packages(const json& packages, size_t limit){
    std::vector<Package> out = live_packages(packages);
    std::stable_sort(out.begin(), out.end(), [](const Package& a, const Package& b){ return a.downloads > b.downloads; });
    if(out.size() > limit) out.resize(limit);
    return out;
}

std::vector<Package> recently_updated(const json& packages, size_t limit){
    std::vector<Package> out = live_packages(packages);
    std::stable_sort(out.begin(), out.end(), [](const Package& a, const Package& b){ return a.date_updated > b.date_updated; });
    if(out.size() > limit) out.resize(limit);
    return out;
}

bool find_package(const json& packages, const std::string& full_name, Package& out){
    if(!packages.is_array()) return false;
    const std::string want = lower(full_name);
    for(const json& d : packages){
        if(!d.is_object() || lower(str_field(d, "full_name"))!=want) continue;
        if(parse_package(d, out)) return true;
    }
    return false;
}

std::string safe_name(std::string s){
    for(char& c: s){ if(!( (c>='a'&&c<='z')||(c>='A'&&c<='Z')||(c>='0'&&c<='9')||c=='-'||c=='_'||c==' '||c=='.')) c='_'; }
    while(!s.empty() && (s.back()=='.'||s.back()==' ')) s.pop_back();
    size_t lead=0; while(lead<s.size() && (s[lead]=='.'||s[lead]==' ')) ++lead;
    s.erase(0, lead);
    if(s.empty()) s = "mod";
    return s;
}

std::string download_file_name(const Package& pkg){
    return safe_name(pkg.full_name) + "-" + safe_name(pkg.version) + ".zip";
}

bool download_package(const Package& pkg,
                      const std::string& dest_dir,
                      std::string& saved_path,
                      std::string& error,
                      std::string& log,
                      DlProg* prog){
    if(pkg.download_url.empty()){
        error = "No download URL available";
        log += "[ts] " + error + " for " + pkg.full_name + "\n";
        return false;
    }
    if(!fsx::makedirs(dest_dir)){
        error = "Cannot create download folder: " + dest_dir;
        log += "[ts] " + error + "\n";
        return false;
    }
    const std::string final_path = fsx::join(dest_dir, download_file_name(pkg));
    const std::string tmp_path = final_path + ".part";

    CURL* curl = curl_easy_init();
    if(!curl){ error = "curl_easy_init failed"; log += "[net] curl_easy_init failed\n"; return false; }
    FILE* f = fopen(tmp_path.c_str(), "wb");
    if(!f){
        error = "Cannot write " + tmp_path;
        log += "[net] fopen failed for tmp\n";
        curl_easy_cleanup(curl);
        return false;
    }

    set_common_opts(curl, pkg.download_url);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "identity");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &curl_write_file);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, f);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 30L);
    if (prog) { set_progress_opts(curl, prog); }
    else      { curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L); }

    log += "[ts] download url: " + pkg.download_url + "\n";
    CURLcode rc = curl_easy_perform(curl);
    long http=0; curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http);
    curl_off_t avg_speed=0; curl_easy_getinfo(curl, CURLINFO_SPEED_DOWNLOAD_T, &avg_speed);
    curl_easy_cleanup(curl);
    bool write_ok = fflush(f)==0;
    write_ok = fclose(f)==0 && write_ok;

    if(rc!=CURLE_OK || http!=200 || !write_ok){
        remove(tmp_path.c_str());
        if(rc==CURLE_ABORTED_BY_CALLBACK) error = "Download cancelled";
        else if(rc!=CURLE_OK)             error = std::string("Download failed: ") + curl_easy_strerror(rc);
        else if(http!=200)                error = "HTTP Error " + std::to_string(http);
        else                              error = "Write failed: " + tmp_path;
        char buf[128]; snprintf(buf,sizeof(buf),"[ts] download rc=%d http=%ld\n",(int)rc,http);
        log += buf;
        return false;
    }
    if(avg_speed > 0){
        char buf[128];
        snprintf(buf,sizeof(buf),"[ts] avg speed %.1f KB/s\n", (double)avg_speed / 1024.0);
        log += buf;
    }
    if(rename(tmp_path.c_str(), final_path.c_str()) != 0){
        remove(tmp_path.c_str());
        error = "Cannot rename " + tmp_path;
        log += "[ts] rename failed\n";
        return false;
    }
    saved_path = final_path;
    log += "[ts] saved -> " + final_path + "\n";
    return true;
}

bool PackageCache::refresh(std::string& error, std::string& log){
    json fresh;
    if(!fetch_all_packages(api_url_, fresh, error, log)) return false;
    assign(std::move(fresh));
    return true;
}

void PackageCache::assign(json packages){
    if(!packages.is_array()) packages = json::array();
    packages_ = std::move(packages);
    loaded_ = true;
}

void PackageCache::clear(){
    packages_ = json::array();
    loaded_ = false;
}

} // namespace ts
