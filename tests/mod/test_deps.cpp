/*
 * Dependency parsing, checking, aggregation and trees.
 */

#include <catch2/catch.hpp>

#include "mod/deps.hpp"

using namespace mods;

namespace {
InstalledMod make_mod(const std::string& name, const std::string& folder, std::vector<std::string> deps = {}){
    InstalledMod m;
    m.name = name;
    m.version = "1.0.0";
    m.folder_name = folder;
    m.path = "/plugins/" + folder;
    m.dependencies = std::move(deps);
    return m;
}
} // namespace

TEST_CASE("Dependency token parsing", "[deps][parse]") {
    DependencyIdentifier d;

    SECTION("Three segments") {
        REQUIRE(parse_dependency("bbepis-BepInExPack-5.4.2100", d));
        REQUIRE(d.author == "bbepis");
        REQUIRE(d.name == "BepInExPack");
        REQUIRE(d.version == "5.4.2100");
        REQUIRE(d.raw == "bbepis-BepInExPack-5.4.2100");
    }

    SECTION("Hyphenated name") {
        REQUIRE(parse_dependency("Auth-Some-Long-Name-1.0.0", d));
        REQUIRE(d.author == "Auth");
        REQUIRE(d.name == "Some-Long-Name");
        REQUIRE(d.version == "1.0.0");
    }

    SECTION("Surrounding whitespace") {
        REQUIRE(parse_dependency("  A-B-1.0 ", d));
        REQUIRE(d.author == "A");
        REQUIRE(d.version == "1.0");
        REQUIRE(d.raw == "  A-B-1.0 ");
    }

    SECTION("Invalid tokens") {
        REQUIRE_FALSE(parse_dependency("justaname", d));
        REQUIRE_FALSE(parse_dependency("two-parts", d));
        REQUIRE_FALSE(parse_dependency("", d));
        REQUIRE_FALSE(parse_dependency("-B-1.0", d));
        REQUIRE_FALSE(parse_dependency("A--1.0", d));
        REQUIRE_FALSE(parse_dependency("A-B-", d));
        REQUIRE_FALSE(parse_dependency("A- -1.0", d));
    }
}

TEST_CASE("Checking dependencies", "[deps][check]") {
    std::string log;
    std::vector<InstalledMod> installed = {
        make_mod("BepInExPack", "bbepis-BepInExPack"),
        make_mod("R2API", "tristanmcpherson-R2API"),
        make_mod("Standalone", "Standalone"),
    };

    SECTION("No dependencies") {
        auto r = check_dependencies(make_mod("Solo", "Solo"), installed, log);
        REQUIRE(r.satisfied);
        REQUIRE(r.missing.empty());
        REQUIRE(r.found.empty());
        REQUIRE(r.details.empty());
    }

    SECTION("Folder name match") {
        std::vector<InstalledMod> one = { make_mod("Whatever", "A-B") };
        auto r = check_dependencies(make_mod("X", "X", {"A-B-1.0.0"}), one, log);
        REQUIRE(r.satisfied);
        REQUIRE(r.found == std::vector<std::string>{"A-B-1.0.0"});
        REQUIRE(r.details.size() == 1);
        REQUIRE(r.details[0].status == DepStatus::Found);
        REQUIRE(r.details[0].has_parsed);
        REQUIRE(r.details[0].parsed.name == "B");
    }

    SECTION("Mixed results keep declared order") {
        auto mod = make_mod("X", "X", {
            "tristanmcpherson-R2API-5.0.0",
            "Someone-Missing-1.0.0",
            "justaname",
            "bbepis-bepinexpack-5.4.0",
            "Other-Gone-2.0.0",
        });
        auto r = check_dependencies(mod, installed, log);
        REQUIRE_FALSE(r.satisfied);
        REQUIRE(r.found == std::vector<std::string>{"tristanmcpherson-R2API-5.0.0", "bbepis-bepinexpack-5.4.0"});
        REQUIRE(r.missing == std::vector<std::string>{"Someone-Missing-1.0.0", "Other-Gone-2.0.0"});
        REQUIRE(r.details.size() == 5);
        REQUIRE(r.details[2].status == DepStatus::Invalid);
        REQUIRE_FALSE(r.details[2].has_parsed);
        REQUIRE(r.details[2].message == "Could not parse dependency string");
        REQUIRE(r.details[1].status == DepStatus::Missing);
        REQUIRE(r.details[1].parsed.author == "Someone");
    }

    SECTION("Only invalid tokens still satisfy") {
        auto r = check_dependencies(make_mod("X", "X", {"justaname"}), installed, log);
        REQUIRE(r.satisfied);
        REQUIRE(r.found.empty());
        REQUIRE(r.missing.empty());
        REQUIRE(r.details.size() == 1);
    }

    SECTION("Versions are not compared") {
        auto r = check_dependencies(make_mod("X", "X", {"bbepis-BepInExPack-99.0.0"}), installed, log);
        REQUIRE(r.satisfied);
    }
}

TEST_CASE("Missing dependencies across the registry", "[deps][missing]") {
    std::string log;

    SECTION("Satisfied registry") {
        std::vector<InstalledMod> reg = {
            make_mod("Core", "Dev-Core"),
            make_mod("AddOn", "Dev-AddOn", {"Dev-Core-1.0.0"}),
        };
        REQUIRE(find_missing_dependencies(reg, log).empty());
    }

    SECTION("Unsatisfied mods in registry order") {
        std::vector<InstalledMod> reg = {
            make_mod("Alpha", "Dev-Alpha", {"Dev-Nothing-1.0.0", "Dev-Beta-1.0.0"}),
            make_mod("Beta", "Dev-Beta"),
            make_mod("Gamma", "Dev-Gamma", {"Dev-Void-2.0.0"}),
        };
        auto missing = find_missing_dependencies(reg, log);
        REQUIRE(missing.size() == 2);
        REQUIRE(missing[0].first == "Alpha");
        REQUIRE(missing[0].second == std::vector<std::string>{"Dev-Nothing-1.0.0"});
        REQUIRE(missing[1].first == "Gamma");
        REQUIRE(missing[1].second == std::vector<std::string>{"Dev-Void-2.0.0"});
    }

    SECTION("Repeated names keep the first slot") {
        std::vector<InstalledMod> reg = {
            make_mod("Twin", "A-Twin", {"X-One-1.0.0"}),
            make_mod("Other", "A-Other", {"X-Two-1.0.0"}),
            make_mod("Twin", "B-Twin", {"X-Three-1.0.0"}),
        };
        auto missing = find_missing_dependencies(reg, log);
        REQUIRE(missing.size() == 2);
        REQUIRE(missing[0].first == "Twin");
        REQUIRE(missing[0].second == std::vector<std::string>{"X-Three-1.0.0"});
        REQUIRE(missing[1].first == "Other");
    }
}

TEST_CASE("Dependency trees", "[deps][tree]") {
    SECTION("Installed, missing and invalid children") {
        std::vector<InstalledMod> reg = {
            make_mod("Core", "Dev-Core"),
            make_mod("AddOn", "Dev-AddOn", {"Dev-Core-1.0.0", "Dev-Ghost-3.1.0", "broken"}),
        };
        auto tree = build_dependency_tree(reg[1], reg);
        REQUIRE(tree.name == "AddOn");
        REQUIRE(tree.status == TreeStatus::Root);
        REQUIRE(tree.children.size() == 3);

        REQUIRE(tree.children[0].name == "Core");
        REQUIRE(tree.children[0].status == TreeStatus::Installed);
        REQUIRE(tree.children[0].children.empty());

        REQUIRE(tree.children[1].name == "Dev-Ghost");
        REQUIRE(tree.children[1].version == "3.1.0");
        REQUIRE(tree.children[1].status == TreeStatus::Missing);

        REQUIRE(tree.children[2].name == "broken");
        REQUIRE(tree.children[2].status == TreeStatus::Invalid);
    }

    SECTION("Circular graph is cut at the depth limit") {
        std::vector<InstalledMod> reg = {
            make_mod("Alpha", "Dev-Alpha", {"Dev-Beta-1.0.0"}),
            make_mod("Beta", "Dev-Beta", {"Dev-Alpha-1.0.0"}),
        };
        auto tree = build_dependency_tree(reg[0], reg, 4);
        const DependencyTree* node = &tree;
        int depth = 0;
        while(!node->children.empty()){
            REQUIRE(node->children.size() == 1);
            node = &node->children[0];
            ++depth;
        }
        REQUIRE(depth == 4);
        REQUIRE(node->status == TreeStatus::Truncated);
        REQUIRE(node->name == "Alpha");
        REQUIRE(tree.children[0].status == TreeStatus::Installed);
        REQUIRE(tree.children[0].name == "Beta");
    }

    SECTION("Default limit also terminates") {
        std::vector<InstalledMod> reg = {
            make_mod("Alpha", "Dev-Alpha", {"Dev-Beta-1.0.0"}),
            make_mod("Beta", "Dev-Beta", {"Dev-Alpha-1.0.0"}),
        };
        auto tree = build_dependency_tree(reg[0], reg);
        const DependencyTree* node = &tree;
        int depth = 0;
        while(!node->children.empty()){ node = &node->children[0]; ++depth; }
        REQUIRE(depth == 10);
        REQUIRE(node->status == TreeStatus::Truncated);
    }

    SECTION("Zero limit truncates the root") {
        auto tree = build_dependency_tree(make_mod("Solo", "Solo", {"A-B-1.0"}), {}, 0);
        REQUIRE(tree.status == TreeStatus::Truncated);
        REQUIRE(tree.children.empty());
    }
}
