#pragma once

#include <string>
#include <utility>
#include <vector>
#include <curl/curl.h>

namespace sb::http {

enum class Method { Get, Post };

std::string to_string(Method method);

struct Request {
    Method method{Method::Get};
    std::string url;
    std::vector<std::string> headers;   // "Name: value"
    std::string body;
    unsigned int timeout_seconds{30};
};

struct HttpResponse {
    CURLcode curl = CURLE_OK;
    long http = 0;
    std::string body;

    [[nodiscard]] bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
};

using Query = std::vector<std::pair<std::string, std::string>>;

// One blocking round trip. Network failures come back in HttpResponse::curl,
// HTTP failures in HttpResponse::http; implementations do not throw for them.
class Transport {
public:
    virtual ~Transport() = default;
    virtual HttpResponse perform(const Request& request) = 0;
};

class CurlTransport : public Transport {
public:
    CurlTransport();
    HttpResponse perform(const Request& request) override;
};

// "?a=1&b=x%20y", or "" for an empty query
std::string encodeQuery(const Query& query);

}
