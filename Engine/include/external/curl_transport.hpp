#pragma once

#include <external/http_transport.hpp>
#include <string>

namespace Armory {

/**
 * @brief HttpTransport on libcurl: fixed user agent, gzip, redirects followed,
 * hard per-request timeout.
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::string user_agent);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse get(const std::string& url, std::chrono::seconds timeout) override;

private:
    std::string user_agent_;
    void* curl_ = nullptr;  // CURL*, reused across requests for keep-alive
};

} // namespace Armory
