#pragma once

#include <string>
#include <utility>

namespace errors
{
    // Failure classes surfaced to callers; each maps to one HTTP status.
    enum class ErrorCode
    {
        None,
        InvalidArgument,
        UnknownNode,
        NotFound,
        NoNodesAvailable,
        Transport,
        Internal
    };

    std::string to_string(ErrorCode code);
    int http_status(ErrorCode code);
    // Inverse of http_status for non-2xx replies seen by a client.
    ErrorCode from_http_status(long status);

    struct Status
    {
        bool success = true;
        ErrorCode code = ErrorCode::None;
        std::string err;

        static Status ok() { return Status{}; }
        static Status fail(ErrorCode code, std::string err) { return Status{false, code, std::move(err)}; }
    };

    template <typename T>
    struct Result
    {
        bool success = false;
        T value{};
        ErrorCode code = ErrorCode::None;
        std::string err;

        static Result ok(T value)
        {
            Result r;
            r.success = true;
            r.value = std::move(value);
            return r;
        }

        static Result fail(ErrorCode code, std::string err)
        {
            Result r;
            r.code = code;
            r.err = std::move(err);
            return r;
        }

        static Result fail(const Status &status) { return fail(status.code, status.err); }

        Status status() const { return success ? Status::ok() : Status::fail(code, err); }
    };

} // namespace errors
