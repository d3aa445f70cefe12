#include <catch2/catch_test_macros.hpp>

#include <spdlog/spdlog.h>

#include "videoml/core/config.h"
#include "videoml/core/errors.h"
#include "test_helpers.h"

using namespace videoml;

static const bool _init = [] {
    spdlog::set_level(spdlog::level::warn);
    return true;
}();

// ─── Project Root ─────────────────────────────────────────────────

TEST_CASE("find_project_root — nearest package.json wins", "[config]") {
    test::TempDir tmp;
    test::write_file(tmp.path / "package.json", "{}");
    auto source = test::write_file(tmp.path / "content" / "deep" / "intro.babulus.xml");

    REQUIRE(find_project_root(source) == tmp.path);
}

TEST_CASE("find_project_root — .videoml directory is a marker", "[config]") {
    test::TempDir tmp;
    fs::create_directories(tmp.path / "app" / ".videoml");
    auto source = test::write_file(tmp.path / "app" / "content" / "a.babulus.ts");

    REQUIRE(find_project_root(source) == tmp.path / "app");
}

TEST_CASE("find_project_root — directory start is checked itself", "[config]") {
    test::TempDir tmp;
    fs::create_directories(tmp.path / ".babulus");
    REQUIRE(find_project_root(tmp.path) == tmp.path);
}

// ─── Config Discovery ─────────────────────────────────────────────

TEST_CASE("find_config_path prefers .videoml over .babulus", "[config]") {
    test::TempDir tmp;
    test::write_file(tmp.path / ".babulus" / "config.yml", "a: 1\n");
    REQUIRE(find_config_path(tmp.path) == tmp.path / ".babulus" / "config.yml");

    test::write_file(tmp.path / ".videoml" / "config.yml", "a: 2\n");
    REQUIRE(find_config_path(tmp.path) == tmp.path / ".videoml" / "config.yml");
}

TEST_CASE("find_config_path — none present", "[config]") {
    test::TempDir tmp;
    REQUIRE_FALSE(find_config_path(tmp.path).has_value());
}

TEST_CASE("ProjectConfig::discover — project_dir wins over the source location", "[config]") {
    test::TempDir tmp;
    test::write_file(tmp.path / "elsewhere" / ".videoml" / "config.yml", "voice: elsewhere\n");
    test::write_file(tmp.path / "project" / ".videoml" / "config.yml", "voice: project\n");
    auto source = test::write_file(tmp.path / "project" / "content" / "a.babulus.xml");

    auto from_source = ProjectConfig::discover(std::nullopt, source);
    REQUIRE(from_source.settings["voice"] == "project");

    auto explicit_dir = ProjectConfig::discover(tmp.path / "elsewhere", source);
    REQUIRE(explicit_dir.settings["voice"] == "elsewhere");
    REQUIRE(explicit_dir.path == tmp.path / "elsewhere" / ".videoml" / "config.yml");
}

TEST_CASE("ProjectConfig::discover — no config yields defaults", "[config]") {
    test::TempDir tmp;
    auto source = test::write_file(tmp.path / "a.babulus.xml");

    auto config = ProjectConfig::discover(std::nullopt, source);
    REQUIRE_FALSE(config.path.has_value());
    REQUIRE(config.settings.empty());
    REQUIRE(config.tooling.loader == std::vector<std::string>{"vml-load"});
}

// ─── YAML → JSON ──────────────────────────────────────────────────

TEST_CASE("yaml_to_json — scalar typing", "[config]") {
    auto node = YAML::Load(R"(
count: 3
ratio: 0.5
enabled: true
name: narrator
quoted: "42"
empty: ~
list: [1, two]
nested:
  key: value
)");
    auto j = yaml_to_json(node);
    REQUIRE(j["count"] == 3);
    REQUIRE(j["ratio"] == 0.5);
    REQUIRE(j["enabled"] == true);
    REQUIRE(j["name"] == "narrator");
    REQUIRE(j["quoted"] == "42");
    REQUIRE(j["empty"].is_null());
    REQUIRE(j["list"][0] == 1);
    REQUIRE(j["list"][1] == "two");
    REQUIRE(j["nested"]["key"] == "value");
}

// ─── Tooling ──────────────────────────────────────────────────────

TEST_CASE("ProjectConfig — tooling commands as scalar or list", "[config]") {
    auto config = ProjectConfig::from_string(R"(
tooling:
  loader: my-loader
  generator: [node, scripts/generate.js]
providers:
  tts: elevenlabs
)");
    REQUIRE(config.tooling.loader == std::vector<std::string>{"my-loader"});
    REQUIRE(config.tooling.generator == std::vector<std::string>{"node", "scripts/generate.js"});
    REQUIRE(config.tooling.renderer == std::vector<std::string>{"vml-frames"});
    REQUIRE(config.settings["providers"]["tts"] == "elevenlabs");
}

TEST_CASE("ProjectConfig — empty document is valid", "[config]") {
    auto config = ProjectConfig::from_string("");
    REQUIRE(config.settings.is_object());
    REQUIRE(config.settings.empty());
}

TEST_CASE("ProjectConfig — non-mapping document is rejected", "[config]") {
    REQUIRE_THROWS_AS(ProjectConfig::from_string("- a\n- b\n"), ValidationError);
}

TEST_CASE("ProjectConfig — empty tooling list is rejected", "[config]") {
    REQUIRE_THROWS_AS(ProjectConfig::from_string("tooling:\n  renderer: []\n"), ValidationError);
}

TEST_CASE("ProjectConfig::from_file — malformed YAML is a validation error", "[config]") {
    test::TempDir tmp;
    auto path = test::write_file(tmp.path / "config.yml", "a: [1, 2\n");
    REQUIRE_THROWS_AS(ProjectConfig::from_file(path), ValidationError);
}

TEST_CASE("ProjectConfig::from_file — missing file", "[config]") {
    REQUIRE_THROWS_AS(ProjectConfig::from_file("/nonexistent/config.yml"), NotFoundError);
}
