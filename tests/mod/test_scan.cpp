/*
 * Registry scan: enabled state from folder names, ordering, failure kinds.
 */

#include <catch2/catch.hpp>

#include "mod/mods.hpp"
#include "support/temp_dir.hpp"

#include <sys/stat.h>
#include <unistd.h>

TEST_CASE("Disabled suffix helpers", "[scan]") {
    REQUIRE(mods::is_disabled_name("Foo.disabled"));
    REQUIRE_FALSE(mods::is_disabled_name("Foo"));
    REQUIRE_FALSE(mods::is_disabled_name("Foo.disabled.bak"));
    REQUIRE(mods::strip_disabled("Foo.disabled") == "Foo");
    REQUIRE(mods::strip_disabled("Foo") == "Foo");
    REQUIRE(mods::strip_disabled(".disabled").empty());
}

TEST_CASE("Scanning a plugins folder", "[scan]") {
    testx::TempDir tmp;
    const std::string root = tmp.sub("plugins");
    std::vector<mods::InstalledMod> out;
    mods::Error err = mods::Error::None;
    std::string log;

    SECTION("Missing root is an empty registry") {
        REQUIRE(mods::scan_root(root, out, err, log));
        REQUIRE(out.empty());
        REQUIRE(err == mods::Error::None);
        REQUIRE(log.find("[scan] plugins dir missing") != std::string::npos);
    }

    SECTION("Root that is a file") {
        testx::write_text(root, "not a folder");
        REQUIRE_FALSE(mods::scan_root(root, out, err, log));
        REQUIRE(err == mods::Error::NotADirectory);
    }

    SECTION("Enabled and disabled mods") {
        testx::write_manifest(root + "/Author-Zeta", R"({"name": "Zeta"})");
        testx::write_manifest(root + "/Author-alpha.disabled", R"({"name": "alpha", "version_number": "1.2.0"})");
        testx::write_manifest(root + "/Author-Mid", R"({"name": "Mid"})");
        testx::write_text(root + "/NoManifest/readme.txt", "x");
        testx::write_manifest(root + "/Broken", "{ nope");
        testx::write_text(root + "/loose.dll", "binary");

        REQUIRE(mods::scan_root(root, out, err, log));
        REQUIRE(out.size() == 3);

        REQUIRE(out[0].name == "alpha");
        REQUIRE_FALSE(out[0].enabled);
        REQUIRE(out[0].folder_name == "Author-alpha");
        REQUIRE(out[0].path == root + "/Author-alpha.disabled");
        REQUIRE(out[0].version == "1.2.0");

        REQUIRE(out[1].name == "Mid");
        REQUIRE(out[1].enabled);
        REQUIRE(out[2].name == "Zeta");
        REQUIRE(out[2].folder_name == "Author-Zeta");

        REQUIRE(log.find("skip (no manifest)") != std::string::npos);
        REQUIRE(log.find("skip (bad manifest)") != std::string::npos);
    }

    SECTION("Equal names keep path order") {
        testx::write_manifest(root + "/B-Same", R"({"name": "Same"})");
        testx::write_manifest(root + "/A-Same", R"({"name": "same"})");
        REQUIRE(mods::scan_root(root, out, err, log));
        REQUIRE(out.size() == 2);
        REQUIRE(out[0].folder_name == "A-Same");
        REQUIRE(out[1].folder_name == "B-Same");

        std::vector<mods::InstalledMod> again;
        REQUIRE(mods::scan_root(root, again, err, log));
        REQUIRE(again[0].path == out[0].path);
        REQUIRE(again[1].path == out[1].path);
    }

    SECTION("Unreadable root") {
        if(geteuid() == 0) {
            WARN("running as root; permission checks are bypassed");
            return;
        }
        testx::write_manifest(root + "/Mod", R"({"name": "Mod"})");
        REQUIRE(chmod(root.c_str(), 0) == 0);
        bool ok = mods::scan_root(root, out, err, log);
        chmod(root.c_str(), 0755);
        REQUIRE_FALSE(ok);
        REQUIRE(err == mods::Error::AccessDenied);
        REQUIRE(out.empty());
    }
}
