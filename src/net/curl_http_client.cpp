#include <lexsearch/net/http_client.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <mutex>

namespace lexsearch::net {

namespace {

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr) {
        return 0;
    }
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

// Helper to build curl_slist from headers
curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = curl_slist_append(nullptr, "Content-Type: application/json");
    list = curl_slist_append(list, "Accept: application/json");
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

struct CurlHandle {
    CURL* curl = curl_easy_init();
    curl_slist* headers = nullptr;

    ~CurlHandle() {
        if (headers)
            curl_slist_free_all(headers);
        if (curl)
            curl_easy_cleanup(curl);
    }
};

class CurlHttpClient final : public IHttpClient {
public:
    Result<HttpResponse> postJson(std::string_view url, const std::string& body,
                                  const std::vector<Header>& headers,
                                  std::chrono::milliseconds timeout) override {
        CurlHandle handle;
        if (!handle.curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        CURL* curl = handle.curl;
        handle.headers = build_header_list(headers);

        const std::string target(url);
        HttpResponse response;

        curl_easy_setopt(curl, CURLOPT_URL, target.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, handle.headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
        if (timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                             static_cast<long>(std::min<long long>(timeout.count(), 10000)));
        }

        CURLcode rc = curl_easy_perform(curl);
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "POST " + target);
        }
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        spdlog::debug("POST {} -> {} ({} bytes)", target, response.status, response.body.size());
        return response;
    }
};

} // namespace

std::shared_ptr<IHttpClient> makeCurlHttpClient() {
    static std::once_flag globalInit;
    std::call_once(globalInit, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    return std::make_shared<CurlHttpClient>();
}

} // namespace lexsearch::net
