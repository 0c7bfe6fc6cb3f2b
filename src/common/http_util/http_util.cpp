#include "http_util.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace http_util
{
    namespace
    {
        size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp)
        {
            std::string *s = static_cast<std::string *>(userp);
            size_t totalSize = size * nmemb;
            s->append(static_cast<char *>(contents), totalSize);
            return totalSize;
        }

        struct CurlDeleter
        {
            void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
        };

        struct SlistDeleter
        {
            void operator()(curl_slist *list) const { curl_slist_free_all(list); }
        };
    }

    void global_init()
    {
        static std::once_flag once;
        std::call_once(once, []()
                       {
            CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
            if (rc != CURLE_OK)
                throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc)); });
    }

    void global_cleanup()
    {
        curl_global_cleanup();
    }

    Response request(const std::string &method,
                     const std::string &url,
                     const std::string &body,
                     const std::string &content_type,
                     long timeout_ms)
    {
        Response res;
        std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
        if (!curl)
        {
            res.err = "Failed to initialize CURL";
            return res;
        }

        std::string readBuffer;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &readBuffer);

        std::unique_ptr<curl_slist, SlistDeleter> headers;
        if (!content_type.empty())
        {
            std::string header = "Content-Type: " + content_type;
            headers.reset(curl_slist_append(nullptr, header.c_str()));
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        }

        if (method == "HEAD")
        {
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        }
        else if (method != "GET")
        {
            curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
            // POSTFIELDSIZE keeps binary chunk payloads intact.
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
        }

        CURLcode curlRes = curl_easy_perform(curl.get());
        if (curlRes != CURLE_OK)
        {
            res.err = curl_easy_strerror(curlRes);
            return res;
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &res.status);
        res.body = std::move(readBuffer);
        res.success = true;
        return res;
    }

    Response get(const std::string &url, long timeout_ms)
    {
        return request("GET", url, "", "", timeout_ms);
    }

    Response head(const std::string &url, long timeout_ms)
    {
        return request("HEAD", url, "", "", timeout_ms);
    }

    Response postJson(const std::string &url, const std::string &json_body, long timeout_ms)
    {
        return request("POST", url, json_body, "application/json", timeout_ms);
    }

    Response putBytes(const std::string &url, const std::string &bytes, long timeout_ms)
    {
        return request("PUT", url, bytes, "application/octet-stream", timeout_ms);
    }

    std::string escape(const std::string &segment)
    {
        std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
        if (!curl)
            return segment;
        char *escaped = curl_easy_escape(curl.get(), segment.c_str(), static_cast<int>(segment.size()));
        if (escaped == nullptr)
            return segment;
        std::string out(escaped);
        curl_free(escaped);
        return out;
    }

    std::string trim_base(const std::string &base_url)
    {
        std::string out = base_url;
        while (!out.empty() && out.back() == '/')
            out.pop_back();
        return out;
    }
}
