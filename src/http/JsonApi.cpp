#include "http/JsonApi.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>

using namespace sb::http;

namespace {
constexpr std::size_t kBodyExcerpt = 300;

std::string rstrip(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}
}

JsonApi::JsonApi(std::shared_ptr<Transport> transport, std::string baseUrl, std::string bearerToken,
                 const unsigned int timeoutSeconds, std::string label)
    : transport_(std::move(transport)),
      base_url_(rstrip(std::move(baseUrl))),
      bearer_token_(std::move(bearerToken)),
      timeout_seconds_(timeoutSeconds),
      label_(std::move(label)) {
    if (!transport_) throw std::invalid_argument("JsonApi requires a transport");
}

Request JsonApi::makeRequest(const Method method, const std::string& path, const Query& query) const {
    Request req;
    req.method = method;
    req.url = base_url_ + path + encodeQuery(query);
    req.timeout_seconds = timeout_seconds_;
    req.headers = {
        "Authorization: Bearer " + bearer_token_,
        "Accept: application/json",
        "Content-Type: application/json"
    };
    return req;
}

nlohmann::json JsonApi::get(const std::string& path, const Query& query) const {
    const auto resp = transport_->perform(makeRequest(Method::Get, path, query));
    if (!resp.ok()) fail(resp, "GET " + path);
    return parse(resp, "GET " + path);
}

HttpResponse JsonApi::postRaw(const std::string& path, const nlohmann::json& body) const {
    auto req = makeRequest(Method::Post, path);
    req.body = body.dump();
    return transport_->perform(req);
}

nlohmann::json JsonApi::parse(const HttpResponse& resp, const std::string& what) const {
    try {
        return nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw TransportError(fmt::format("{}: invalid JSON response to {}", label_, what), e.what(), resp.http);
    }
}

void JsonApi::fail(const HttpResponse& resp, const std::string& what) const {
    if (resp.curl != CURLE_OK)
        throw TransportError(fmt::format("{}: network error during {}", label_, what),
                             curl_easy_strerror(resp.curl));

    auto detail = extractErrorDetail(resp.body);
    if (detail.empty()) detail = resp.body.substr(0, kBodyExcerpt);
    throw TransportError(fmt::format("{}: HTTP error {} during {}", label_, resp.http, what), detail, resp.http);
}

std::string sb::http::extractErrorDetail(const std::string& body) {
    const auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return "";

    if (const auto it = j.find("error"); it != j.end()) {
        if (it->is_string()) return it->get<std::string>();
        if (it->is_object()) {
            if (it->contains("detail") && (*it)["detail"].is_string()) return (*it)["detail"].get<std::string>();
            if (it->contains("name") && (*it)["name"].is_string()) return (*it)["name"].get<std::string>();
        }
    }

    if (const auto it = j.find("errors"); it != j.end() && !it->empty()) {
        if (it->is_string()) return it->get<std::string>();
        return it->dump();
    }
    return "";
}
