#include "http/Transport.hpp"
#include "logging/LogRegistry.hpp"

#include <mutex>
#include <stdexcept>

using namespace sb::http;
using namespace sb::logging;

namespace {

constexpr long kConnectTimeoutSeconds = 10;

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t appendToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

// Owns one easy handle for the duration of a request
class EasyHandle {
public:
    EasyHandle() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    ~EasyHandle() { curl_easy_cleanup(h_); }

    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;

    CURL* get() const { return h_; }

    std::string escape(const std::string& s) const {
        char* out = curl_easy_escape(h_, s.c_str(), static_cast<int>(s.length()));
        if (!out) throw std::runtime_error("curl_easy_escape failed");
        std::string escaped(out);
        curl_free(out);
        return escaped;
    }

private:
    CURL* h_;
};

// curl_slist over strings that outlive the request
struct HeaderList {
    std::vector<std::string> store;
    curl_slist* list = nullptr;

    HeaderList() = default;
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;
    ~HeaderList() { if (list) curl_slist_free_all(list); }

    void add(const std::string& h) {
        store.push_back(h);
        list = curl_slist_append(list, store.back().c_str());
    }
};

}

std::string sb::http::to_string(const Method method) {
    switch (method) {
        case Method::Get: return "GET";
        case Method::Post: return "POST";
        default: throw std::invalid_argument("Unknown Method enum value");
    }
}

std::string sb::http::encodeQuery(const Query& query) {
    if (query.empty()) return "";

    const EasyHandle handle;
    std::string out = "?";
    for (const auto& [key, value] : query) {
        if (out.size() > 1) out += '&';
        out += handle.escape(key) + '=' + handle.escape(value);
    }
    return out;
}

CurlTransport::CurlTransport() { ensureCurlGlobalInit(); }

HttpResponse CurlTransport::perform(const Request& request) {
    LogRegistry::http()->debug("[CurlTransport] {} {}", to_string(request.method), request.url);

    const EasyHandle handle;
    CURL* h = handle.get();

    HeaderList headers;
    for (const auto& hdr : request.headers) headers.add(hdr);

    HttpResponse resp;
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(request.timeout_seconds));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, appendToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);

    if (request.method == Method::Post) {
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    } else {
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    }

    resp.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.http);

    if (resp.curl != CURLE_OK)
        LogRegistry::http()->warn("[CurlTransport] {} {} failed: {}",
                                  to_string(request.method), request.url, curl_easy_strerror(resp.curl));
    else if (!resp.ok())
        LogRegistry::http()->warn("[CurlTransport] {} {} returned HTTP {}",
                                  to_string(request.method), request.url, resp.http);

    return resp;
}
