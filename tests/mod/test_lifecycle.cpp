/*
 * Toggle, install and uninstall against real temporary folders.
 */

#include <catch2/catch.hpp>

#include "fs/fs_utils.hpp"
#include "mod/mods.hpp"
#include "support/temp_dir.hpp"
#include "support/zip_writer.hpp"

#include <algorithm>

namespace {
std::vector<std::string> names_in(const std::string& dir){
    std::vector<std::string> out;
    for(const auto& de : fsx::list_dirents(dir)) out.push_back(fsx::base_name(de.path));
    return out;
}
} // namespace

TEST_CASE("Toggling a mod", "[lifecycle][toggle]") {
    testx::TempDir tmp;
    const std::string root = tmp.sub("plugins");
    testx::write_manifest(root + "/Dev-Mod", R"({"name": "Mod"})");
    testx::write_text(root + "/Dev-Mod/Mod.dll", "payload");
    mods::Error err = mods::Error::None;
    std::string log;
    bool enabled = false;

    SECTION("Twice restores the initial folder") {
        REQUIRE(mods::toggle_mod(root + "/Dev-Mod", enabled, err, log));
        REQUIRE_FALSE(enabled);
        REQUIRE(names_in(root) == std::vector<std::string>{"Dev-Mod.disabled"});
        REQUIRE(testx::read_text(root + "/Dev-Mod.disabled/Mod.dll") == "payload");

        REQUIRE(mods::toggle_mod(root + "/Dev-Mod.disabled", enabled, err, log));
        REQUIRE(enabled);
        REQUIRE(names_in(root) == std::vector<std::string>{"Dev-Mod"});
        REQUIRE(err == mods::Error::None);
    }

    SECTION("Scan reflects the new state") {
        REQUIRE(mods::toggle_mod(root + "/Dev-Mod", enabled, err, log));
        std::vector<mods::InstalledMod> list;
        REQUIRE(mods::scan_root(root, list, err, log));
        REQUIRE(list.size() == 1);
        REQUIRE_FALSE(list[0].enabled);
        REQUIRE(list[0].folder_name == "Dev-Mod");
    }

    SECTION("Missing folder") {
        enabled = true;
        REQUIRE_FALSE(mods::toggle_mod(root + "/Nope", enabled, err, log));
        REQUIRE(err == mods::Error::NotFound);
        REQUIRE(enabled);
    }

    SECTION("Target already exists") {
        testx::write_manifest(root + "/Dev-Mod.disabled", R"({"name": "Old"})");
        REQUIRE_FALSE(mods::toggle_mod(root + "/Dev-Mod", enabled, err, log));
        REQUIRE(err == mods::Error::AlreadyExists);
        REQUIRE(enabled);
        REQUIRE(fsx::isdir(root + "/Dev-Mod"));
        REQUIRE(testx::read_text(root + "/Dev-Mod.disabled/manifest.json") == R"({"name": "Old"})");
    }
}

TEST_CASE("Installing from an archive", "[lifecycle][install]") {
    testx::TempDir tmp;
    const std::string root = tmp.sub("plugins");
    fsx::makedirs(root);
    mods::Error err = mods::Error::None;
    std::string log, name;

    SECTION("Nested manifest, deflated entries") {
        const std::string zip = tmp.sub("Dev-Cool-1.0.0.zip");
        testx::ZipWriter()
            .add_dir("Cool/")
            .add("Cool/manifest.json", R"({"name": "Cool", "version_number": "1.0.0"})", true)
            .add("Cool/plugins/Cool.dll", std::string(4096, 'z'), true)
            .add("README.md", "# Cool")
            .write(zip);

        REQUIRE(mods::install_from_archive(zip, root, name, err, log));
        REQUIRE(err == mods::Error::None);
        REQUIRE(testx::read_text(root + "/Dev-Cool-1.0.0/Cool/plugins/Cool.dll") == std::string(4096, 'z'));
        REQUIRE(testx::read_text(root + "/Dev-Cool-1.0.0/README.md") == "# Cool");
        // no top-level manifest: the folder name is reported
        REQUIRE(name == "Dev-Cool-1.0.0");
    }

    SECTION("Top-level manifest gives the display name") {
        const std::string zip = tmp.sub("Pack.ZIP");
        testx::ZipWriter().add("manifest.json", R"({"name": "Packed"})").write(zip);
        REQUIRE(mods::install_from_archive(zip, root, name, err, log));
        REQUIRE(name == "Packed");

        std::vector<mods::InstalledMod> list;
        REQUIRE(mods::scan_root(root, list, err, log));
        REQUIRE(list.size() == 1);
        REQUIRE(list[0].folder_name == "Pack");
    }

    SECTION("No manifest anywhere") {
        const std::string zip = tmp.sub("Empty-Mod.zip");
        testx::ZipWriter().add("plugins/thing.dll", "dll").add("notmanifest.json.txt", "{}").write(zip);
        REQUIRE_FALSE(mods::install_from_archive(zip, root, name, err, log));
        REQUIRE(err == mods::Error::InvalidArchive);
        REQUIRE_FALSE(fsx::exists(root + "/Empty-Mod"));
    }

    SECTION("Not a zip by extension") {
        const std::string rar = tmp.sub("Mod.rar");
        testx::write_text(rar, "Rar!");
        REQUIRE_FALSE(mods::install_from_archive(rar, root, name, err, log));
        REQUIRE(err == mods::Error::NotAnArchive);
    }

    SECTION("Corrupt zip") {
        const std::string zip = tmp.sub("Junk.zip");
        testx::write_text(zip, std::string(200, 'j'));
        REQUIRE_FALSE(mods::install_from_archive(zip, root, name, err, log));
        REQUIRE(err == mods::Error::InvalidArchive);
        REQUIRE_FALSE(fsx::exists(root + "/Junk"));
    }

    SECTION("Missing archive") {
        REQUIRE_FALSE(mods::install_from_archive(tmp.sub("gone.zip"), root, name, err, log));
        REQUIRE(err == mods::Error::NotFound);
    }

    SECTION("Existing folder, enabled or disabled") {
        const std::string zip = tmp.sub("Dup.zip");
        testx::ZipWriter().add("manifest.json", R"({"name": "Dup"})").write(zip);

        testx::write_text(root + "/Dup.disabled/keep.txt", "old");
        REQUIRE_FALSE(mods::install_from_archive(zip, root, name, err, log));
        REQUIRE(err == mods::Error::AlreadyExists);
        REQUIRE_FALSE(fsx::exists(root + "/Dup"));

        fsx::rmtree(root + "/Dup.disabled");
        testx::write_text(root + "/Dup/keep.txt", "old");
        REQUIRE_FALSE(mods::install_from_archive(zip, root, name, err, log));
        REQUIRE(err == mods::Error::AlreadyExists);
        REQUIRE(testx::read_text(root + "/Dup/keep.txt") == "old");
    }

    SECTION("Unsafe entries are skipped") {
        const std::string zip = tmp.sub("Sneaky.zip");
        testx::ZipWriter()
            .add("manifest.json", R"({"name": "Sneaky"})")
            .add("../escape.txt", "out")
            .add("/abs.txt", "abs")
            .write(zip);
        REQUIRE(mods::install_from_archive(zip, root, name, err, log));
        REQUIRE_FALSE(fsx::exists(tmp.sub("escape.txt")));
        REQUIRE_FALSE(fsx::exists("/abs.txt"));
        REQUIRE(log.find("[zip] skip unsafe path") != std::string::npos);
    }

    SECTION("CRC mismatch leaves partial output") {
        const std::string zip = tmp.sub("Bad.zip");
        testx::ZipWriter()
            .add("manifest.json", R"({"name": "Bad"})")
            .add("data.bin", "abcdef").break_last_crc()
            .write(zip);
        REQUIRE_FALSE(mods::install_from_archive(zip, root, name, err, log));
        REQUIRE(err == mods::Error::Io);
        REQUIRE(fsx::isfile(root + "/Bad/manifest.json"));
        REQUIRE(log.find("[zip] crc mismatch: data.bin") != std::string::npos);
    }
}

TEST_CASE("Uninstalling a mod", "[lifecycle][uninstall]") {
    testx::TempDir tmp;
    const std::string root = tmp.sub("BepInEx/plugins");
    const std::string cfg = tmp.sub("BepInEx/config");
    mods::Error err = mods::Error::None;
    std::string log, message;

    testx::write_manifest(root + "/Dev-AddOn", R"({"name": "AddOn"})");
    testx::write_text(root + "/Dev-AddOn/sub/AddOn.dll", "dll");
    testx::write_text(cfg + "/dev.addon.cfg", "[General]\nEnabled = true\n");
    testx::write_text(cfg + "/com.other.mod.cfg", "x = 1\n");
    testx::write_text(cfg + "/addon.notes.txt", "keep");

    SECTION("With configs") {
        REQUIRE(mods::uninstall_mod(root + "/Dev-AddOn", true, cfg, message, err, log));
        REQUIRE_FALSE(fsx::exists(root + "/Dev-AddOn"));
        REQUIRE_FALSE(fsx::exists(cfg + "/dev.addon.cfg"));
        REQUIRE(fsx::isfile(cfg + "/com.other.mod.cfg"));
        REQUIRE(fsx::isfile(cfg + "/addon.notes.txt"));
        REQUIRE(message == "Uninstalled AddOn and removed config(s): dev.addon.cfg");
    }

    SECTION("Without configs") {
        REQUIRE(mods::uninstall_mod(root + "/Dev-AddOn", false, cfg, message, err, log));
        REQUIRE(fsx::isfile(cfg + "/dev.addon.cfg"));
        REQUIRE(message == "Successfully uninstalled: AddOn");
    }

    SECTION("Disabled mod matches by stripped folder name") {
        bool enabled = true;
        REQUIRE(mods::toggle_mod(root + "/Dev-AddOn", enabled, err, log));
        testx::write_text(cfg + "/Dev-AddOn.Extra.cfg", "k = v\n");
        REQUIRE(mods::uninstall_mod(root + "/Dev-AddOn.disabled", true, cfg, message, err, log));
        REQUIRE_FALSE(fsx::exists(cfg + "/Dev-AddOn.Extra.cfg"));
        REQUIRE_FALSE(fsx::exists(cfg + "/dev.addon.cfg"));
        REQUIRE(message.find("Uninstalled AddOn and removed config(s): ") == 0);
        REQUIRE(message.find("Dev-AddOn.Extra.cfg") != std::string::npos);
        REQUIRE(message.find("dev.addon.cfg") != std::string::npos);
    }

    SECTION("Falls back to the folder name without a manifest") {
        testx::write_text(root + "/Loose-Thing/file.txt", "x");
        REQUIRE(mods::uninstall_mod(root + "/Loose-Thing", true, cfg, message, err, log));
        REQUIRE(message == "Successfully uninstalled: Loose-Thing");
    }

    SECTION("Missing config folder is not an error") {
        REQUIRE(mods::uninstall_mod(root + "/Dev-AddOn", true, tmp.sub("nowhere"), message, err, log));
        REQUIRE(message == "Successfully uninstalled: AddOn");
    }

    SECTION("Failures") {
        REQUIRE_FALSE(mods::uninstall_mod(root + "/Nope", true, cfg, message, err, log));
        REQUIRE(err == mods::Error::NotFound);
        REQUIRE_FALSE(mods::uninstall_mod(cfg + "/dev.addon.cfg", true, cfg, message, err, log));
        REQUIRE(err == mods::Error::NotADirectory);
        REQUIRE(fsx::isfile(cfg + "/dev.addon.cfg"));
    }
}
