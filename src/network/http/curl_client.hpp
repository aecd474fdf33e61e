#pragma once
#include <curl/curl.h>
#include <memory>
#include <string>
#include <vector>
#include "http_client.hpp"

namespace XRobots {
namespace Network {
namespace Http {

class CurlClient : public HttpClient {
public:
    CurlClient();
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void     set_user_agent(const std::string& user_agent) override;
    void     set_timeout(std::chrono::seconds timeout) override;
    Response head(const std::string& url) override;

private:
    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    std::unique_ptr<CURL, CurlDeleter> curl_;
    std::string                        user_agent_;
    long                               timeout_seconds_;

    void     setup_curl_options(CURL* curl, const std::string& url, std::vector<std::string>& headers) const;
    Response handle_response(CURLcode res, long response_code, const std::string& effective_url,
                             std::vector<std::string> headers) const;
    Response create_error_response(const std::string& msg) const;

    // userp is always the std::vector<std::string> collecting header lines.
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
    static size_t discard_callback(void* contents, size_t size, size_t nmemb, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace XRobots
