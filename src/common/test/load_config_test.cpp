#include <catch2/catch.hpp>

#include "common/load_config/load_config.hpp"
#include "testing/test_support.hpp"

#include <cstdlib>

TEST_CASE("Config load fails loudly on a missing or broken file")
{
    test_support::TempDir dir;
    REQUIRE_THROWS_AS(ConfigReader::load((dir / "absent.json").string()), std::runtime_error);

    test_support::write_file(dir / "broken.json", "{ not json");
    REQUIRE_THROWS_AS(ConfigReader::load((dir / "broken.json").string()), std::runtime_error);
}

TEST_CASE("Config load returns the file contents")
{
    test_support::TempDir dir;
    test_support::write_file(dir / "cfg.json", R"({"server_port": 5000, "data_dir": "/data"})");
    json loaded = ConfigReader::load((dir / "cfg.json").string());
    REQUIRE(loaded["server_port"].get<int>() == 5000);
    REQUIRE(loaded["data_dir"].get<std::string>() == "/data");
}

TEST_CASE("Typed getters fall back on missing or mistyped keys")
{
    json j = {{"port", 8001}, {"name", "node"}, {"ratio", 2.5}, {"negative", -3}, {"huge", 70000}};

    REQUIRE(ConfigReader::get_config_value("port", j, 1) == 8001);
    REQUIRE(ConfigReader::get_config_value("missing", j, 1) == 1);
    REQUIRE(ConfigReader::get_config_value("name", j, 1) == 1);

    REQUIRE(ConfigReader::get_config_string("name", j, "x") == "node");
    REQUIRE(ConfigReader::get_config_string("port", j, "x") == "x");

    REQUIRE(ConfigReader::get_config_double("ratio", j, 0.0) == Approx(2.5));
    REQUIRE(ConfigReader::get_config_double("port", j, 0.0) == Approx(8001.0));

    REQUIRE(ConfigReader::get_config_u64("negative", j, 9) == 9);
    REQUIRE(ConfigReader::get_config_short("huge", j, 5) == 5);
    REQUIRE(ConfigReader::get_config_short("port", j, 5) == 8001);
}

TEST_CASE("Environment overrides only when set and non-empty")
{
    ::setenv("DFS_TEST_OVERRIDE", "from-env", 1);
    REQUIRE(ConfigReader::env_or("DFS_TEST_OVERRIDE", "fallback") == "from-env");
    ::setenv("DFS_TEST_OVERRIDE", "", 1);
    REQUIRE(ConfigReader::env_or("DFS_TEST_OVERRIDE", "fallback") == "fallback");
    ::unsetenv("DFS_TEST_OVERRIDE");
    REQUIRE(ConfigReader::env_or("DFS_TEST_OVERRIDE", "fallback") == "fallback");
}
