#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace XRobots {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, Status, Other };

struct Response {
    std::string              effective_url;
    long                     status_code = 0;
    std::vector<std::string> headers;  // raw lines of the final response, status line first
    std::string              error;
    bool                     success    = false;
    ErrorType                error_type = ErrorType::None;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void     set_user_agent(const std::string& user_agent) = 0;
    virtual void     set_timeout(std::chrono::seconds timeout)     = 0;
    virtual Response head(const std::string& url)                  = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace XRobots
