#include "app/settings.hpp"
#include "cfg/bepinex_cfg.hpp"
#include "fs/fs_utils.hpp"
#include "log/log_sink.hpp"
#include "mod/deps.hpp"
#include "mod/mods.hpp"
#include "ts/thunderstore.hpp"
#include "util/format.hpp"

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace cli {

static constexpr int EXIT_OK = 0;
static constexpr int EXIT_FAIL = 1;
static constexpr int EXIT_USAGE = 2;

static const char* kUsage =
    "usage: ror2mgr [--settings FILE] [--verbose] <command> [args]\n"
    "  path [DIR]                      show / set the plugins folder\n"
    "  list                            numbered list of installed mods\n"
    "  info <N|name>                   details of one mod\n"
    "  find <text>                     filter installed mods by name\n"
    "  toggle <N|name>                 enable/disable\n"
    "  install <archive.zip>           install from a zip\n"
    "  uninstall <N|name> [--configs]  delete a mod (and its .cfg files)\n"
    "  deps [<N|name>] [--tree]        missing deps for all mods, or one mod's check/tree\n"
    "  cfg list | cfg show <file> | cfg set <file> <key> <value>\n"
    "  catalog search <text> | popular | recent | show <Owner-Name>\n"
    "  catalog get <Owner-Name> [--install]\n";

struct App {
    std::string settings_path = settings::default_settings_path();
    settings::Settings cfg = settings::defaults();
    logx::LogSink sink{fsx::join(settings::data_dir(), "log.txt")};
    ts::PackageCache cache;
    std::vector<mods::InstalledMod> modlist;

    std::atomic<bool> downloading{false};
    std::atomic<bool> dl_done{false};
    std::atomic<bool> dl_failed{false};
    ts::DlProg dl_prog{};
    std::thread dl_thread;
    ts::Package dl_item;
    std::string dl_saved, dl_error, dl_thread_log;

    std::string& log = sink.log;

    ~App(){ shutdown(); }

    void shutdown(){
        if(downloading.load()) dl_prog.cancel = true;
        if(dl_thread.joinable()) dl_thread.join();
        if(!dl_thread_log.empty()){ log += dl_thread_log; dl_thread_log.clear(); }
        sink.drain();
        sink.flush(true);
    }

    static std::string lower(std::string s){
        for(char& c : s) c=(char)tolower((unsigned char)c);
        return s;
    }

    bool requirePlugins(){
        if(!cfg.plugins_path.empty()) return true;
        fprintf(stderr, "No plugins folder configured. Run: ror2mgr path <BepInEx/plugins>\n");
        return false;
    }

    bool rescanMods(){
        mods::Error err = mods::Error::None;
        log += "[scan] root=" + cfg.plugins_path + "\n";
        if(!mods::scan_root(cfg.plugins_path, modlist, err, log)){
            fprintf(stderr, "Cannot scan %s: %s\n", cfg.plugins_path.c_str(), mods::error_name(err));
            return false;
        }
        return true;
    }

    // 1-based index into the scan order, exact name, or folder name.
    const mods::InstalledMod* pickMod(const std::string& key){
        char* end=nullptr;
        long n = strtol(key.c_str(), &end, 10);
        if(!key.empty() && end && *end=='\0'){
            if(n>=1 && (size_t)n<=modlist.size()) return &modlist[(size_t)n-1];
            return nullptr;
        }
        const std::string k = lower(key);
        for(const auto& m : modlist) if(lower(m.name)==k) return &m;
        for(const auto& m : modlist) if(lower(m.folder_name)==k) return &m;
        return nullptr;
    }

    const mods::InstalledMod* loadAndPick(const std::string& key){
        if(!requirePlugins() || !rescanMods()) return nullptr;
        const mods::InstalledMod* m = pickMod(key);
        if(!m) fprintf(stderr, "No installed mod matches '%s'\n", key.c_str());
        return m;
    }

    void printModLine(size_t idx, const mods::InstalledMod& m){
        printf("%3zu. [%c] %s v%s\n", idx, m.enabled ? 'x' : ' ', textx::truncate(m.name, 48).c_str(), m.version.c_str());
    }

    int cmdPath(const std::vector<std::string>& a){
        if(a.empty()){
            if(cfg.plugins_path.empty()){ printf("(not set)\n"); return EXIT_OK; }
            printf("plugins:   %s\nconfig:    %s\ndownloads: %s\n", cfg.plugins_path.c_str(),
                   settings::effective_config_dir(cfg).c_str(), cfg.downloads_dir.c_str());
            return EXIT_OK;
        }
        if(!fsx::isdir(a[0])){
            fprintf(stderr, "Path does not exist or is not a directory: %s\n", a[0].c_str());
            return EXIT_FAIL;
        }
        cfg.plugins_path = a[0];
        if(!settings::save(settings_path, cfg, log)){
            fprintf(stderr, "Failed to save settings to %s\n", settings_path.c_str());
            return EXIT_FAIL;
        }
        printf("Plugins folder set to %s\n", a[0].c_str());
        return EXIT_OK;
    }

    int cmdList(){
        if(!requirePlugins() || !rescanMods()) return EXIT_FAIL;
        if(modlist.empty()){ printf("No mods installed in %s\n", cfg.plugins_path.c_str()); return EXIT_OK; }
        size_t enabled=0;
        for(size_t i=0;i<modlist.size();++i){
            printModLine(i+1, modlist[i]);
            if(modlist[i].enabled) ++enabled;
        }
        printf("%zu mods, %zu enabled\n", modlist.size(), enabled);
        return EXIT_OK;
    }

    int cmdInfo(const std::vector<std::string>& a){
        if(a.size()!=1) return usage();
        const mods::InstalledMod* m = loadAndPick(a[0]);
        if(!m) return EXIT_FAIL;
        printf("%s\n", textx::format_mod_info(*m).c_str());
        return EXIT_OK;
    }

    int cmdFind(const std::vector<std::string>& a){
        if(a.size()!=1) return usage();
        if(!requirePlugins() || !rescanMods()) return EXIT_FAIL;
        auto hits = textx::filter_mods_by_name(modlist, a[0]);
        for(const auto& h : hits){
            for(size_t i=0;i<modlist.size();++i){
                if(modlist[i].path==h.path){ printModLine(i+1, h); break; }
            }
        }
        printf("%zu match(es)\n", hits.size());
        return EXIT_OK;
    }

    int cmdToggle(const std::vector<std::string>& a){
        if(a.size()!=1) return usage();
        const mods::InstalledMod* m = loadAndPick(a[0]);
        if(!m) return EXIT_FAIL;
        bool enabled = m->enabled;
        mods::Error err = mods::Error::None;
        if(!mods::toggle_mod(m->path, enabled, err, log)){
            fprintf(stderr, "Cannot toggle %s: %s\n", m->name.c_str(), mods::error_name(err));
            return EXIT_FAIL;
        }
        printf("%s %s\n", enabled ? "Enabled" : "Disabled", m->name.c_str());
        return EXIT_OK;
    }

    bool installArchive(const std::string& archive, std::string& mod_name){
        mods::Error err = mods::Error::None;
        if(!fsx::isdir(cfg.plugins_path) && !fsx::makedirs(cfg.plugins_path)){
            fprintf(stderr, "Cannot create %s\n", cfg.plugins_path.c_str());
            return false;
        }
        if(!mods::install_from_archive(archive, cfg.plugins_path, mod_name, err, log)){
            fprintf(stderr, "Install failed: %s (%s)\n", mods::error_name(err), archive.c_str());
            return false;
        }
        printf("Successfully installed: %s\n", mod_name.c_str());
        return true;
    }

    void reportMissingFor(const std::string& folder){
        if(!rescanMods()) return;
        for(const auto& m : modlist){
            if(m.folder_name!=folder) continue;
            auto r = mods::check_dependencies(m, modlist, log);
            if(!r.satisfied){
                printf("Missing dependencies for %s:\n", m.name.c_str());
                for(const auto& d : r.missing) printf("  - %s\n", d.c_str());
            }
            return;
        }
    }

    int cmdInstall(const std::vector<std::string>& a){
        if(a.size()!=1) return usage();
        if(!requirePlugins()) return EXIT_FAIL;
        std::string name;
        if(!installArchive(a[0], name)) return EXIT_FAIL;
        reportMissingFor(fsx::base_name(fsx::strip_ext(a[0])));
        return EXIT_OK;
    }

    int cmdUninstall(const std::vector<std::string>& a){
        std::string key; bool configs=false;
        for(const auto& s : a){
            if(s=="--configs") configs=true;
            else if(key.empty()) key=s;
            else return usage();
        }
        if(key.empty()) return usage();
        const mods::InstalledMod* m = loadAndPick(key);
        if(!m) return EXIT_FAIL;
        std::string message;
        mods::Error err = mods::Error::None;
        if(!mods::uninstall_mod(m->path, configs, settings::effective_config_dir(cfg), message, err, log)){
            fprintf(stderr, "Uninstall failed: %s\n", mods::error_name(err));
            return EXIT_FAIL;
        }
        printf("%s\n", message.c_str());
        return EXIT_OK;
    }

    int cmdDeps(const std::vector<std::string>& a){
        std::string key; bool tree=false;
        for(const auto& s : a){
            if(s=="--tree") tree=true;
            else if(key.empty()) key=s;
            else return usage();
        }
        if(key.empty()){
            if(tree) return usage();
            if(!requirePlugins() || !rescanMods()) return EXIT_FAIL;
            auto missing = mods::find_missing_dependencies(modlist, log);
            if(missing.empty()){ printf("All dependencies satisfied.\n"); return EXIT_OK; }
            for(const auto& entry : missing){
                printf("%s:\n", entry.first.c_str());
                for(const auto& d : entry.second) printf("  - %s\n", d.c_str());
            }
            return EXIT_OK;
        }
        const mods::InstalledMod* m = loadAndPick(key);
        if(!m) return EXIT_FAIL;
        if(tree) printf("%s\n", textx::format_dependency_tree(mods::build_dependency_tree(*m, modlist)).c_str());
        else     printf("%s\n", textx::format_check_result(mods::check_dependencies(*m, modlist, log)).c_str());
        return EXIT_OK;
    }

    std::string cfgPath(const std::string& file){
        if(file.find('/')!=std::string::npos) return file;
        std::string name = file;
        if(fsx::ext_lower(name)!=".cfg") name += ".cfg";
        return fsx::join(settings::effective_config_dir(cfg), name);
    }

    int cmdCfg(const std::vector<std::string>& a){
        if(a.empty()) return usage();
        if(a[0]!="list" && a[0]!="show" && a[0]!="set") return usage();
        if(cfg.config_dir.empty() && !requirePlugins()) return EXIT_FAIL;
        const std::string dir = settings::effective_config_dir(cfg);
        if(a[0]=="list"){
            if(a.size()!=1) return usage();
            auto files = bepcfg::list_config_files(dir);
            for(const auto& f : files) printf("%s  (%s)\n", fsx::base_name(f).c_str(), textx::format_file_size((double)fsx::file_size(f)).c_str());
            printf("%zu config file(s) in %s\n", files.size(), dir.c_str());
            return EXIT_OK;
        }
        if(a[0]=="show"){
            if(a.size()!=2) return usage();
            std::vector<std::pair<std::string, std::string>> kv;
            if(!bepcfg::parse_config_file(cfgPath(a[1]), kv, log)){
                fprintf(stderr, "Cannot read %s\n", cfgPath(a[1]).c_str());
                return EXIT_FAIL;
            }
            for(const auto& p : kv) printf("%s = %s\n", p.first.c_str(), p.second.c_str());
            return EXIT_OK;
        }
        if(a.size()!=4) return usage();
        const std::string path = cfgPath(a[1]);
        std::vector<std::pair<std::string, std::string>> kv;
        if(!bepcfg::parse_config_file(path, kv, log)){
            fprintf(stderr, "Cannot read %s\n", path.c_str());
            return EXIT_FAIL;
        }
        bool known=false;
        for(const auto& p : kv) if(p.first==a[2]){ known=true; break; }
        if(!known){
            fprintf(stderr, "No setting '%s' in %s\n", a[2].c_str(), path.c_str());
            return EXIT_FAIL;
        }
        if(!bepcfg::save_config_file(path, {{a[2], a[3]}}, log)){
            fprintf(stderr, "Failed to save %s\n", path.c_str());
            return EXIT_FAIL;
        }
        printf("%s = %s\n", a[2].c_str(), a[3].c_str());
        return EXIT_OK;
    }

    bool ensureCatalog(){
        if(cache.loaded()) return true;
        cache = ts::PackageCache(cfg.catalog_url);
        fprintf(stderr, "Fetching package list...\n");
        std::string error;
        if(!cache.refresh(error, log)){
            fprintf(stderr, "Catalog unavailable: %s\n", error.c_str());
            return false;
        }
        return true;
    }

    void printPackages(const std::vector<ts::Package>& list){
        if(list.empty()){ printf("No packages found.\n"); return; }
        size_t i=0;
        for(const auto& p : list){
            printf("%3zu. %s v%s  (%lld downloads)\n     %s\n", ++i, p.full_name.c_str(), p.version.c_str(),
                   p.downloads, textx::truncate(p.description, 72).c_str());
        }
    }

    void dl_worker(){
        std::string tlog, saved, error;
        bool ok = ts::download_package(dl_item, cfg.downloads_dir, saved, error, tlog, &dl_prog);
        dl_thread_log = std::move(tlog);
        if (ok) { dl_saved = saved; dl_done = true; }
        else    { dl_error = error; dl_failed = true; }
        downloading = false;
    }

    bool startDownload(const ts::Package& pkg){
        if(downloading.load()) return false;
        dl_item = pkg;
        dl_saved.clear(); dl_error.clear();
        dl_done = false; dl_failed = false;
        dl_prog.now = 0; dl_prog.total = 0; dl_prog.cancel = false;
        downloading = true;
        dl_thread = std::thread(&App::dl_worker, this);
        return true;
    }

    void waitDownload(){
        while(downloading.load()){
            long long now = dl_prog.now.load(), total = dl_prog.total.load();
            if(total > 0) fprintf(stderr, "\r  %s / %s", textx::format_file_size((double)now).c_str(), textx::format_file_size((double)total).c_str());
            else          fprintf(stderr, "\r  %s", textx::format_file_size((double)now).c_str());
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        if(dl_thread.joinable()) dl_thread.join();
        fprintf(stderr, "\n");
        log += dl_thread_log;
        dl_thread_log.clear();
    }

    int cmdCatalog(const std::vector<std::string>& a){
        if(a.empty()) return usage();
        const std::string& sub = a[0];
        if(sub=="search"){
            if(a.size()<2) return usage();
            std::string q = a[1];
            for(size_t i=2;i<a.size();++i) q += " " + a[i];
            if(!ensureCatalog()) return EXIT_FAIL;
            printPackages(ts::search_packages(cache.get(), q));
            return EXIT_OK;
        }
        if(sub=="popular" || sub=="recent"){
            if(a.size()!=1) return usage();
            if(!ensureCatalog()) return EXIT_FAIL;
            printPackages(sub=="popular" ? ts::popular_packages(cache.get()) : ts::recently_updated(cache.get()));
            return EXIT_OK;
        }
        if(sub=="show"){
            if(a.size()!=2) return usage();
            if(!ensureCatalog()) return EXIT_FAIL;
            ts::Package pkg;
            if(!ts::find_package(cache.get(), a[1], pkg)){ fprintf(stderr, "Package not found: %s\n", a[1].c_str()); return EXIT_FAIL; }
            printf("%s\n", textx::format_package_info(pkg).c_str());
            return EXIT_OK;
        }
        if(sub=="get"){
            std::string name; bool install=false;
            for(size_t i=1;i<a.size();++i){
                if(a[i]=="--install") install=true;
                else if(name.empty()) name=a[i];
                else return usage();
            }
            if(name.empty()) return usage();
            if(install && !requirePlugins()) return EXIT_FAIL;
            if(!ensureCatalog()) return EXIT_FAIL;
            ts::Package pkg;
            if(!ts::find_package(cache.get(), name, pkg)){ fprintf(stderr, "Package not found: %s\n", name.c_str()); return EXIT_FAIL; }
            printf("Downloading %s v%s...\n", pkg.full_name.c_str(), pkg.version.c_str());
            startDownload(pkg);
            waitDownload();
            if(dl_failed.load()){ fprintf(stderr, "Download failed: %s\n", dl_error.c_str()); return EXIT_FAIL; }
            printf("Saved %s\n", dl_saved.c_str());
            if(!install) return EXIT_OK;
            std::string mod_name;
            if(!installArchive(dl_saved, mod_name)) return EXIT_FAIL;
            reportMissingFor(fsx::base_name(fsx::strip_ext(dl_saved)));
            return EXIT_OK;
        }
        return usage();
    }

    int usage(){
        fputs(kUsage, stderr);
        return EXIT_USAGE;
    }

    int run(int argc, char** argv){
        std::vector<std::string> args;
        bool verbose=false;
        for(int i=1;i<argc;++i){
            std::string s = argv[i];
            if(s=="--verbose" || s=="-v"){ verbose=true; continue; }
            if(s=="--settings"){
                if(i+1>=argc) return usage();
                settings_path = argv[++i];
                continue;
            }
            if(s=="--help" || s=="-h"){ fputs(kUsage, stdout); return EXIT_OK; }
            args.push_back(s);
        }
        sink.setEcho(verbose);
        if(args.empty()) return usage();
        if(!settings::load(settings_path, cfg, log)) fprintf(stderr, "Warning: could not read %s\n", settings_path.c_str());

        const std::string cmd = args[0];
        std::vector<std::string> rest(args.begin()+1, args.end());
        int rc;
        if(cmd=="path")           rc = cmdPath(rest);
        else if(cmd=="list")      rc = rest.empty() ? cmdList() : usage();
        else if(cmd=="info")      rc = cmdInfo(rest);
        else if(cmd=="find")      rc = cmdFind(rest);
        else if(cmd=="toggle")    rc = cmdToggle(rest);
        else if(cmd=="install")   rc = cmdInstall(rest);
        else if(cmd=="uninstall") rc = cmdUninstall(rest);
        else if(cmd=="deps")      rc = cmdDeps(rest);
        else if(cmd=="cfg")       rc = cmdCfg(rest);
        else if(cmd=="catalog")   rc = cmdCatalog(rest);
        else                      rc = usage();
        sink.maybeFlush();
        return rc;
    }
};

} // namespace cli

int main(int argc, char** argv){
    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc;
    {
        cli::App app;
        rc = app.run(argc, argv);
        app.shutdown();
    }
    curl_global_cleanup();
    return rc;
}
