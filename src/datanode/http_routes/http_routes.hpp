#pragma once

#include "../chunk_service/chunk_service.hpp"

#include <httplib.h>

namespace datanode_routes
{
    // PUT /chunk/{chunk_id}, GET /chunk/{chunk_id}, GET /metrics
    void register_routes(httplib::Server &svr, chunk_service::ChunkService &service);
}
