#pragma once

#include "../coordinator/coordinator.hpp"

#include <httplib.h>

namespace master_routes
{
    // Installs the coordination endpoints:
    //   POST /register, POST /heartbeat, POST /file, GET /file/{filename},
    //   GET /files, GET /nodes, POST /stats, GET / (health)
    void register_routes(httplib::Server &svr, coordinator::Coordinator &coord);
}
