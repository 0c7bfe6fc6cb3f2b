#include "clock.hpp"

#include <chrono>

namespace dfs_clock
{
    double wall_seconds()
    {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(now).count();
    }

    double steady_millis()
    {
        auto now = std::chrono::steady_clock::now().time_since_epoch();
        return std::chrono::duration<double, std::milli>(now).count();
    }
}
