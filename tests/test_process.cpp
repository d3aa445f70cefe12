#include <catch2/catch_test_macros.hpp>

#include <spdlog/spdlog.h>

#include "videoml/core/process.h"
#include "test_helpers.h"

using namespace videoml;

static const bool _init = [] {
    spdlog::set_level(spdlog::level::warn);
    return true;
}();

TEST_CASE("shell_quote — plain and embedded quotes", "[process]") {
    REQUIRE(shell_quote("abc") == "'abc'");
    REQUIRE(shell_quote("it's") == "'it'\\''s'");
    REQUIRE(shell_quote("") == "''");
}

TEST_CASE("join_command — env assignments come first", "[process]") {
    auto cmd = join_command({"vml-generate", "/p/req.json"}, {{"VIDEOML_ENV", "prod"}});
    REQUIRE(cmd == "VIDEOML_ENV='prod' 'vml-generate' '/p/req.json'");
}

TEST_CASE("run_command — captures stdout line by line", "[process]") {
    std::vector<std::string> lines;
    auto result = run_command({"sh", "-c", "echo one; echo two; printf three"},
                              [&](const std::string& line) { lines.push_back(line); });

    REQUIRE(result.ok());
    REQUIRE(result.output == "one\ntwo\nthree");
    REQUIRE(lines == std::vector<std::string>{"one", "two", "three"});
}

TEST_CASE("run_command — arguments with spaces stay intact", "[process]") {
    auto result = run_command({"printf", "%s|", "a b", "c'd"});
    REQUIRE(result.ok());
    REQUIRE(result.output == "a b|c'd|");
}

TEST_CASE("run_command — non-zero exit status is reported", "[process]") {
    auto result = run_command({"sh", "-c", "exit 3"});
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.exit_status == 3);
}

TEST_CASE("run_command — environment overrides reach the child", "[process]") {
    auto result = run_command({"sh", "-c", "printf \"$VIDEOML_ENV\""}, {},
                              {{"VIDEOML_ENV", "staging"}});
    REQUIRE(result.output == "staging");
}

TEST_CASE("run_command — empty argv throws", "[process]") {
    REQUIRE_THROWS_AS(run_command({}), std::runtime_error);
}
