/*
 * backend_client.cpp
 *
 * Notes
 * - Blocking libcurl easy API, one handle per request so concurrent callers never share state.
 * - Every request is bounded by CURLOPT_TIMEOUT_MS / CURLOPT_CONNECTTIMEOUT_MS.
 * - No retries: a failed call is reported once and the caller decides.
 */

#include <mcpbridge/backend/backend_client.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <mutex>
#include <string_view>

namespace mcpbridge::backend {

namespace {

void ensureCurlGlobalInit() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    std::string message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return Error{ErrorCode::Timeout, std::move(message)};
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            return Error{ErrorCode::NetworkError, std::move(message)};
        default:
            return Error{ErrorCode::BackendCallFailed, std::move(message)};
    }
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

std::vector<std::string> stringArray(const json& j, const char* camel, const char* snake) {
    std::vector<std::string> out;
    const json* src = nullptr;
    if (j.contains(camel)) {
        src = &j[camel];
    } else if (snake && j.contains(snake)) {
        src = &j[snake];
    }
    if (!src || !src->is_array()) {
        return out;
    }
    for (const auto& v : *src) {
        if (v.is_string()) {
            out.push_back(v.get<std::string>());
        }
    }
    return out;
}

// Non-string values count as missing
std::string stringField(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return {};
}

// Keep the first part of a body for error messages
std::string clip(const std::string& body) {
    constexpr size_t kMax = 512;
    if (body.size() <= kMax)
        return body;
    return body.substr(0, kMax) + "...";
}

} // namespace

ServerDescriptor ServerDescriptor::fromJson(const json& j) {
    ServerDescriptor d;
    if (j.is_string()) {
        d.name = j.get<std::string>();
        return d;
    }
    if (!j.is_object()) {
        return d;
    }
    d.name = stringField(j, "name");
    d.packageReference = stringField(j, "package");
    d.declaredTools = stringArray(j, "tools", nullptr);
    d.requiredEnvVars = stringArray(j, "requiredEnv", "required_env");
    d.requiredArgs = stringArray(j, "requiredArgs", "required_args");
    return d;
}

json ServerDescriptor::toJson() const {
    return json{{"name", name},
                {"package", packageReference},
                {"tools", declaredTools},
                {"requiredEnv", requiredEnvVars},
                {"requiredArgs", requiredArgs}};
}

ToolDescriptor ToolDescriptor::fromJson(const json& j, const std::string& server) {
    ToolDescriptor t;
    t.rawName = stringField(j, "name");
    if (j.contains("description") && j["description"].is_string() &&
        !j["description"].get<std::string>().empty()) {
        t.description = j["description"].get<std::string>();
    } else {
        t.description = t.rawName + " from " + server;
    }
    if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
        t.inputSchema = j["inputSchema"];
    } else {
        t.inputSchema = json{{"type", "object"}, {"properties", json::object()}};
    }
    return t;
}

json ToolDescriptor::toJson() const {
    return json{{"name", rawName}, {"description", description}, {"inputSchema", inputSchema}};
}

std::vector<ServerDescriptor> parseServerList(const json& body) {
    const json* arr = nullptr;
    if (body.is_array()) {
        arr = &body;
    } else if (body.is_object() && body.contains("servers") && body["servers"].is_array()) {
        arr = &body["servers"];
    }
    std::vector<ServerDescriptor> out;
    if (!arr) {
        return out;
    }
    for (const auto& entry : *arr) {
        auto d = ServerDescriptor::fromJson(entry);
        if (!d.name.empty()) {
            out.push_back(std::move(d));
        }
    }
    return out;
}

std::vector<ToolDescriptor> parseToolList(const json& body, const std::string& server) {
    std::vector<ToolDescriptor> out;
    if (!body.is_object() || !body.contains("tools") || !body["tools"].is_array()) {
        return out;
    }
    for (const auto& entry : body["tools"]) {
        if (!entry.is_object()) {
            continue;
        }
        auto t = ToolDescriptor::fromJson(entry, server);
        if (!t.rawName.empty()) {
            out.push_back(std::move(t));
        }
    }
    return out;
}

Result<std::vector<ServerDescriptor>> IBackendClient::listServers() {
    auto r = getServers();
    if (!r) {
        return r.error();
    }
    return parseServerList(r.value());
}

Result<std::vector<ToolDescriptor>> IBackendClient::listTools(const std::string& server) {
    auto r = getServerTools(server);
    if (!r) {
        return r.error();
    }
    return parseToolList(r.value(), server);
}

std::string encodePathSegment(const std::string& segment) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

BackendClient::BackendClient(BackendClientConfig config) : config_(std::move(config)) {
    ensureCurlGlobalInit();
    while (!config_.baseUrl.empty() && config_.baseUrl.back() == '/') {
        config_.baseUrl.pop_back();
    }
}

BackendClient::~BackendClient() = default;

Result<BackendClient::HttpReply>
BackendClient::perform(const std::string& method, const std::string& path,
                       const std::optional<std::string>& body) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    const std::string url = config_.baseUrl + config_.apiPrefix + path;
    HttpReply reply;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
    }
    if (config_.apiKey && !config_.apiKey->empty()) {
        const std::string keyHeader = "X-API-Key: " + *config_.apiKey;
        headers = curl_slist_append(headers, keyHeader.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.connectTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);
    // POSTFIELDS is not copied; payload must outlive curl_easy_perform
    const std::string payload = body ? *body : std::string();
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    spdlog::debug("BackendClient: {} {}", method, url);
    CURLcode code = curl_easy_perform(curl);
    if (code == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &reply.status);
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (code != CURLE_OK) {
        return makeCurlError(code, method + " " + url);
    }
    return reply;
}

Result<json> BackendClient::performJson(const std::string& method, const std::string& path,
                                        const std::optional<std::string>& body,
                                        const std::optional<std::string>& server) const {
    auto r = perform(method, path, body);
    if (!r) {
        return r.error();
    }
    const auto& reply = r.value();
    if (reply.status == 404 && server) {
        return Error{ErrorCode::ServerNotFound,
                     "Server '" + *server + "' not found (HTTP 404): " + clip(reply.body)};
    }
    if (reply.status >= 400) {
        return Error{ErrorCode::BackendCallFailed, "Request failed with status code " +
                                                       std::to_string(reply.status) + ": " +
                                                       clip(reply.body)};
    }
    if (reply.body.empty()) {
        return json(nullptr);
    }
    try {
        return json::parse(reply.body);
    } catch (const json::parse_error&) {
        // Plain-text replies are passed through as a JSON string
        return json(reply.body);
    }
}

Result<void> BackendClient::health() {
    auto r = perform("GET", "/health", std::nullopt);
    if (!r) {
        return r.error();
    }
    if (r.value().status >= 400) {
        return Error{ErrorCode::BackendCallFailed,
                     "Health check failed with status code " + std::to_string(r.value().status)};
    }
    return {};
}

Result<void> BackendClient::serversHealth() {
    auto primary = perform("GET", "/health/servers", std::nullopt);
    if (primary && primary.value().status < 400) {
        return {};
    }
    auto fallback = perform("GET", "/servers", std::nullopt);
    if (!fallback) {
        return fallback.error();
    }
    if (fallback.value().status >= 400) {
        return Error{ErrorCode::BackendCallFailed, "Daemon health probe failed with status code " +
                                                       std::to_string(fallback.value().status)};
    }
    return {};
}

Result<json> BackendClient::getServers() {
    return performJson("GET", "/servers", std::nullopt, std::nullopt);
}

Result<json> BackendClient::getServerTools(const std::string& server) {
    return performJson("GET", "/servers/" + encodePathSegment(server) + "/tools", std::nullopt,
                       server);
}

Result<json> BackendClient::invokeTool(const std::string& server, const std::string& tool,
                                       const json& arguments) {
    json payload = {{"arguments", arguments.is_null() ? json::object() : arguments}};
    return performJson("POST",
                       "/servers/" + encodePathSegment(server) + "/tools/" +
                           encodePathSegment(tool) + "/call",
                       payload.dump(), std::nullopt);
}

} // namespace mcpbridge::backend
