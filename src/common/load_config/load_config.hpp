#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace ConfigReader
{
    // Throws std::runtime_error when the file cannot be opened or parsed.
    json load(const std::string &filepath);

    // Typed accessors. A missing key yields the fallback silently; a key of the
    // wrong type is logged and also yields the fallback.
    int get_config_value(const std::string &key, const json &j, int fallback = 0);
    std::uint64_t get_config_u64(const std::string &key, const json &j, std::uint64_t fallback = 0);
    double get_config_double(const std::string &key, const json &j, double fallback = 0.0);
    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback = "");
    unsigned short get_config_short(const std::string &key, const json &j, unsigned short fallback = 0);

    // Value of an environment variable, or the fallback when unset or empty.
    std::string env_or(const char *name, const std::string &fallback);
}
