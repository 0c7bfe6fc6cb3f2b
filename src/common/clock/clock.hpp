#pragma once

#include <functional>

namespace dfs_clock
{
    // Seconds since the epoch, the unit used for every timestamp on the wire
    // and in the checkpoint.
    using Clock = std::function<double()>;

    double wall_seconds();
    double steady_millis();
}
