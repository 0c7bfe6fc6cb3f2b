#include "errors.hpp"

namespace errors
{
    std::string to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::UnknownNode:
            return "UnknownNode";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::NoNodesAvailable:
            return "NoNodesAvailable";
        case ErrorCode::Transport:
            return "Transport";
        case ErrorCode::Internal:
            return "Internal";
        }
        return "Unknown";
    }

    int http_status(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::None:
            return 200;
        case ErrorCode::InvalidArgument:
        case ErrorCode::UnknownNode:
            return 400;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::NoNodesAvailable:
            return 503;
        case ErrorCode::Transport:
            return 502;
        case ErrorCode::Internal:
            return 500;
        }
        return 500;
    }

    ErrorCode from_http_status(long status)
    {
        switch (status)
        {
        case 400:
            return ErrorCode::InvalidArgument;
        case 404:
            return ErrorCode::NotFound;
        case 502:
            return ErrorCode::Transport;
        case 503:
            return ErrorCode::NoNodesAvailable;
        default:
            return ErrorCode::Internal;
        }
    }

} // namespace errors
