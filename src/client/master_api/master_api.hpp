#pragma once

#include "../../common/errors/errors.hpp"
#include "../../common/schema/schema.hpp"
#include "../transfer/transfer_engine.hpp"

#include <string>
#include <vector>

namespace master_api
{
    // Client for the coordination service's HTTP surface.
    class MasterClient : public transfer::PlanSource
    {
    public:
        MasterClient(const std::string &master_url, long timeout_ms);

        errors::Result<schema::FileRecord> createFile(const std::string &filename, std::uint64_t filesize) override;
        errors::Result<schema::FileRecord> getFile(const std::string &filename) override;
        errors::Result<std::vector<schema::FileSummary>> listFiles();
        errors::Result<std::vector<schema::NodeStatus>> listNodes();

    private:
        std::string base_url_;
        long timeout_ms_;
    };
}
