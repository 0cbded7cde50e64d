#include <mcpbridge/gateway/http_types.h>

#include <boost/algorithm/string.hpp>

#include <cctype>
#include <vector>

namespace mcpbridge::gateway {

Response makeJsonResponse(http::status status, const json& body, unsigned version) {
    Response res{status, version};
    res.set(http::field::server, "mcpd-gateway");
    res.set(http::field::content_type, "application/json; charset=utf-8");
    // Invalid UTF-8 from the daemon becomes U+FFFD instead of failing the response
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

std::optional<std::string> getQueryParam(const std::string& target, const std::string& key) {
    auto pos = target.find('?');
    if (pos == std::string::npos)
        return std::nullopt;
    auto q = target.substr(pos + 1);
    std::vector<std::string> parts;
    boost::split(parts, q, boost::is_any_of("&"));
    for (auto& p : parts) {
        auto eq = p.find('=');
        if (eq == std::string::npos)
            continue;
        if (p.substr(0, eq) == key)
            return p.substr(eq + 1);
    }
    return std::nullopt;
}

std::string stripQuery(const std::string& target) {
    auto pos = target.find('?');
    return pos == std::string::npos ? target : target.substr(0, pos);
}

std::string decodePathSegment(const std::string& segment) {
    std::string out;
    out.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i) {
        const char c = segment[i];
        if (c == '%' && i + 2 < segment.size() &&
            std::isxdigit(static_cast<unsigned char>(segment[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(segment[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(segment.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace mcpbridge::gateway
