#pragma once

#include "http/Transport.hpp"

#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace sb::http {

// Bearer-authenticated JSON endpoint shared by both ledger clients.
// Every failure surfaces as TransportError carrying the HTTP status.
class JsonApi {
public:
    JsonApi(std::shared_ptr<Transport> transport, std::string baseUrl, std::string bearerToken,
            unsigned int timeoutSeconds, std::string label);

    [[nodiscard]] nlohmann::json get(const std::string& path, const Query& query = {}) const;

    // POST without status checking; the caller interprets 4xx itself.
    [[nodiscard]] HttpResponse postRaw(const std::string& path, const nlohmann::json& body) const;

    [[nodiscard]] nlohmann::json parse(const HttpResponse& resp, const std::string& what) const;

    [[noreturn]] void fail(const HttpResponse& resp, const std::string& what) const;

    [[nodiscard]] const std::string& label() const { return label_; }

private:
    std::shared_ptr<Transport> transport_;
    std::string base_url_;
    std::string bearer_token_;
    unsigned int timeout_seconds_;
    std::string label_;

    [[nodiscard]] Request makeRequest(Method method, const std::string& path, const Query& query = {}) const;
};

// First message found in a JSON error body ({"error":{"detail":...}} or {"errors":...}).
std::string extractErrorDetail(const std::string& body);

}
