#include "curl_client.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"

namespace XRobots {
namespace Network {
namespace Http {

namespace {

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR: return ErrorType::Network;
        default: return ErrorType::Other;
    }
}

}  // namespace

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* headers = static_cast<std::vector<std::string>*>(userp);
    if (!headers)
        return size * nitems;

    std::string line = Utils::Text::trim(std::string(buffer, size * nitems));
    if (line.empty())
        return size * nitems;

    // Redirects deliver several header blocks; only the last one is kept.
    if (Utils::Text::starts_with(line, "HTTP/"))
        headers->clear();
    headers->push_back(std::move(line));
    return size * nitems;
}

size_t CurlClient::discard_callback(void* /*contents*/, size_t size, size_t nmemb, void* /*userp*/) {
    return size * nmemb;
}

CurlClient::CurlClient()
    : curl_(curl_easy_init()),
      user_agent_(Core::Constants::USER_AGENT),
      timeout_seconds_(Core::Constants::REQUEST_TIMEOUT_SECONDS) {}

void CurlClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

void CurlClient::set_timeout(std::chrono::seconds timeout) {
    timeout_seconds_ = static_cast<long>(timeout.count());
}

Response CurlClient::create_error_response(const std::string& msg) const {
    Response r;
    r.success    = false;
    r.error      = msg;
    r.error_type = ErrorType::Other;
    return r;
}

void CurlClient::setup_curl_options(CURL*                     curl,
                                    const std::string&        url,
                                    std::vector<std::string>& headers) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_callback);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(Core::Constants::MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    if (!user_agent_.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
}

Response CurlClient::handle_response(CURLcode                 res,
                                     long                     response_code,
                                     const std::string&       effective_url,
                                     std::vector<std::string> headers) const {
    Response response;
    response.effective_url = effective_url;
    response.status_code   = response_code;

    if (res != CURLE_OK) {
        response.success    = false;
        response.error      = curl_easy_strerror(res);
        response.error_type = map_curl_code_to_error_type(res);
        return response;
    }

    response.headers = std::move(headers);
    // X-Robots-Tag is meaningful on any response, so only a missing status is a failure.
    response.success = response_code > 0;
    if (!response.success) {
        response.error      = "No HTTP status received";
        response.error_type = ErrorType::Status;
    }
    return response;
}

Response CurlClient::head(const std::string& url) {
    if (!curl_)
        return create_error_response("Failed to initialize CURL handle");

    std::vector<std::string> headers;
    setup_curl_options(curl_.get(), url, headers);

    CURLcode res           = curl_easy_perform(curl_.get());
    long     response_code = 0;
    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &response_code);
    char* eff_url_ptr = nullptr;
    curl_easy_getinfo(curl_.get(), CURLINFO_EFFECTIVE_URL, &eff_url_ptr);
    std::string effective_url = eff_url_ptr ? std::string(eff_url_ptr) : url;

    return handle_response(res, response_code, effective_url, std::move(headers));
}

}  // namespace Http
}  // namespace Network
}  // namespace XRobots
