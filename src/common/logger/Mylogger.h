#pragma once

#include <string>

// Thin facade over Boost.Log used by every service. Call init() once from
// main(); before that, messages go to Boost.Log's default console sink.
class MyLogger
{
public:
    static void init(const std::string &log_file = "", const std::string &level = "info");

    static void debug(const std::string &msg);
    static void info(const std::string &msg);
    static void warning(const std::string &msg);
    static void error(const std::string &msg);
};
