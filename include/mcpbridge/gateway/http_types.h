#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace mcpbridge::gateway {

namespace http = boost::beast::http;
using json = nlohmann::json;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// JSON body with content type and length set
Response makeJsonResponse(http::status status, const json& body, unsigned version = 11);

// Value of one query-string parameter of a request target (no percent-decoding)
std::optional<std::string> getQueryParam(const std::string& target, const std::string& key);

// Target without its query string
std::string stripQuery(const std::string& target);

// Decode %XX escapes of one path segment
std::string decodePathSegment(const std::string& segment);

} // namespace mcpbridge::gateway
