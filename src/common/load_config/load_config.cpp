#include "load_config.hpp"
#include "../logger/Mylogger.h"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace ConfigReader
{
    json load(const std::string &filepath)
    {
        std::ifstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file: " + filepath);
            throw std::runtime_error("Could not open config file: " + filepath);
        }

        try
        {
            json j;
            config_file >> j;
            MyLogger::info("Configuration file loaded successfully: " + filepath);
            MyLogger::debug("Loaded JSON: " + j.dump(4));
            return j;
        }
        catch (const json::parse_error &e)
        {
            MyLogger::error("JSON parse error in file " + filepath + ": " + e.what());
            throw std::runtime_error("Could not parse config file: " + filepath);
        }
    }

    int get_config_value(const std::string &key, const json &j, int fallback)
    {
        if (!j.contains(key))
            return fallback;
        if (!j[key].is_number_integer())
        {
            MyLogger::error("Key is not an integer: " + key);
            return fallback;
        }
        return j[key].get<int>();
    }

    std::uint64_t get_config_u64(const std::string &key, const json &j, std::uint64_t fallback)
    {
        if (!j.contains(key))
            return fallback;
        if (!j[key].is_number_unsigned())
        {
            MyLogger::error("Key is not an unsigned integer: " + key);
            return fallback;
        }
        return j[key].get<std::uint64_t>();
    }

    double get_config_double(const std::string &key, const json &j, double fallback)
    {
        if (!j.contains(key))
            return fallback;
        if (!j[key].is_number())
        {
            MyLogger::error("Key is not a number: " + key);
            return fallback;
        }
        return j[key].get<double>();
    }

    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback)
    {
        if (!j.contains(key))
            return fallback;
        if (!j[key].is_string())
        {
            MyLogger::error("Key is not a string: " + key);
            return fallback;
        }
        return j[key].get<std::string>();
    }

    unsigned short get_config_short(const std::string &key, const json &j, unsigned short fallback)
    {
        if (!j.contains(key))
            return fallback;
        if (!j[key].is_number_unsigned())
        {
            MyLogger::error("Key is not an unsigned integer: " + key);
            return fallback;
        }
        auto val = j[key].get<unsigned int>();
        if (val > std::numeric_limits<unsigned short>::max())
        {
            MyLogger::error("Value for key '" + key + "' exceeds unsigned short limit");
            return fallback;
        }
        return static_cast<unsigned short>(val);
    }

    std::string env_or(const char *name, const std::string &fallback)
    {
        const char *value = std::getenv(name);
        if (value == nullptr || *value == '\0')
            return fallback;
        return value;
    }
}
