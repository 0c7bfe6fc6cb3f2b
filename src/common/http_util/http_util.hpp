#pragma once

#include <string>

// Blocking HTTP calls over libcurl. Call global_init() from main() before any
// thread issues a request; later calls are no-ops. It throws
// std::runtime_error if libcurl cannot be initialized.
namespace http_util
{
    struct Response
    {
        bool success = false; // transport succeeded; says nothing about the status code
        long status = 0;
        std::string body;
        std::string err;
    };

    void global_init();
    void global_cleanup();

    Response request(const std::string &method,
                     const std::string &url,
                     const std::string &body,
                     const std::string &content_type,
                     long timeout_ms);

    Response get(const std::string &url, long timeout_ms);
    Response head(const std::string &url, long timeout_ms);
    Response postJson(const std::string &url, const std::string &json_body, long timeout_ms);
    Response putBytes(const std::string &url, const std::string &bytes, long timeout_ms);

    // Percent-encodes a single path segment.
    std::string escape(const std::string &segment);

    // Strips trailing slashes so "http://host:5000/" + "/file" stays well formed.
    std::string trim_base(const std::string &base_url);
}
