/**
 * @file http_transport.hpp
 * @brief Minimal GET transport seam for the catalog client
 */

#pragma once

#include <chrono>
#include <map>
#include <string>

namespace Armory {

struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers;  // names lowercased

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Performs one GET. Throws TransportError when no HTTP response was
 * received (DNS, connect, timeout); any HTTP status is returned, not thrown.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const std::string& url, std::chrono::seconds timeout) = 0;
};

} // namespace Armory
