#include <lexsearch/net/http_client.h>

namespace lexsearch::net {

Result<nlohmann::json> parseJsonResponse(const HttpResponse& response, std::string_view what) {
    if (response.status >= 400) {
        std::string message = std::string(what) + " returned HTTP " + std::to_string(response.status);
        if (!response.body.empty()) {
            message += ": " + response.body.substr(0, 200);
        }
        ErrorCode code = ErrorCode::NetworkError;
        if (response.status == 404) {
            code = ErrorCode::NotFound;
        } else if (response.status < 500) {
            code = ErrorCode::InvalidArgument;
        }
        return Error{code, std::move(message)};
    }

    auto parsed = nlohmann::json::parse(response.body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::InvalidData, std::string(what) + " returned malformed JSON"};
    }
    return Result<nlohmann::json>(std::move(parsed));
}

std::string joinUrl(std::string_view base, std::string_view path) {
    while (!base.empty() && base.back() == '/') {
        base.remove_suffix(1);
    }
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    std::string out(base);
    out += '/';
    out.append(path);
    return out;
}

} // namespace lexsearch::net
