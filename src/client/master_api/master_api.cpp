#include "master_api.hpp"
#include "../../common/http_util/http_util.hpp"

namespace master_api
{
    using errors::ErrorCode;

    namespace
    {
        // Turns a transport failure or a non-200 reply into a failed result.
        template <typename T>
        bool failed(const http_util::Response &resp, errors::Result<T> &out)
        {
            if (!resp.success)
            {
                out = errors::Result<T>::fail(ErrorCode::Transport, "Master unreachable: " + resp.err);
                return true;
            }
            if (resp.status != 200)
            {
                out = errors::Result<T>::fail(errors::from_http_status(resp.status), schema::errorMessage(resp.body));
                return true;
            }
            return false;
        }
    } // namespace

    MasterClient::MasterClient(const std::string &master_url, long timeout_ms)
        : base_url_(http_util::trim_base(master_url)), timeout_ms_(timeout_ms)
    {
    }

    errors::Result<schema::FileRecord> MasterClient::createFile(const std::string &filename, std::uint64_t filesize)
    {
        schema::CreateFileRequest req{filename, filesize};
        auto resp = http_util::postJson(base_url_ + "/file", schema::toJson(req).dump(), timeout_ms_);
        errors::Result<schema::FileRecord> out;
        if (failed(resp, out))
            return out;
        return schema::parseFileRecord(filename, resp.body);
    }

    errors::Result<schema::FileRecord> MasterClient::getFile(const std::string &filename)
    {
        auto resp = http_util::get(base_url_ + "/file/" + http_util::escape(filename), timeout_ms_);
        errors::Result<schema::FileRecord> out;
        if (failed(resp, out))
            return out;
        return schema::parseFileRecord(filename, resp.body);
    }

    errors::Result<std::vector<schema::FileSummary>> MasterClient::listFiles()
    {
        auto resp = http_util::get(base_url_ + "/files", timeout_ms_);
        errors::Result<std::vector<schema::FileSummary>> out;
        if (failed(resp, out))
            return out;
        return schema::parseFileListing(resp.body);
    }

    errors::Result<std::vector<schema::NodeStatus>> MasterClient::listNodes()
    {
        auto resp = http_util::get(base_url_ + "/nodes", timeout_ms_);
        errors::Result<std::vector<schema::NodeStatus>> out;
        if (failed(resp, out))
            return out;
        return schema::parseNodeListing(resp.body);
    }
}
