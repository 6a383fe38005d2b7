#include "CloudDirectory.hpp"
#include "Errors.hpp"
#include "JsonCodec.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <iostream>

namespace nrfsim {

namespace {

constexpr std::size_t kLoggedBodyLimit = 300;

std::string trimTrailing(std::string value, char c) {
    while (!value.empty() && value.back() == c) {
        value.pop_back();
    }
    return value;
}

std::string trimWhitespace(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string stringField(const nlohmann::json& json, const char* key, const std::string& fallback = "") {
    auto it = json.find(key);
    if (it == json.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

// RFC 3986 path segment: everything but unreserved characters is escaped
std::string percentEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string devicePath(const std::string& deviceId) {
    return "/v1/devices/" + percentEncode(deviceId);
}

nlohmann::json parseBody(const HttpResponse& response, const std::string& label) {
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        throw DirectoryError(response.statusCode, response.body,
                             label + " returned invalid JSON: " + e.what());
    }
}

} // namespace

CloudDirectory::CloudDirectory(std::string apiHost,
                               std::string apiKey,
                               std::shared_ptr<IHttpClient> http,
                               std::chrono::milliseconds timeout)
    : apiHost_(trimTrailing(std::move(apiHost), '/'))
    , apiKey_(std::move(apiKey))
    , http_(std::move(http))
    , timeout_(timeout) {
}

std::string CloudDirectory::url(const std::string& path) const {
    return apiHost_ + path;
}

HttpResponse CloudDirectory::execute(HttpRequest request, const std::string& label) {
    request.headers["Authorization"] = "Bearer " + apiKey_;
    if (request.headers.find("Content-Type") == request.headers.end()) {
        request.headers["Content-Type"] = "application/json";
    }
    request.timeout = timeout_;

    auto response = http_->send(request);
    if (!response) {
        std::cerr << "[API] " << label << " -> no response: " << http_->lastError() << std::endl;
        throw DirectoryError(0, "", label + " failed: " + http_->lastError());
    }
    if (!response->ok()) {
        std::cerr << "[API] " << label << " -> HTTP " << response->statusCode << ": "
                  << response->body.substr(0, kLoggedBodyLimit) << std::endl;
    }
    return *response;
}

AccountInfo CloudDirectory::fetchAccount() {
    HttpRequest request;
    request.method = "GET";
    request.url = url("/v1/account");

    HttpResponse response = execute(request, "GET /v1/account");
    if (!response.ok()) {
        throw DirectoryError(response.statusCode, response.body, "Account lookup failed");
    }

    nlohmann::json json = parseBody(response, "GET /v1/account");
    AccountInfo account;
    account.mqttEndpoint = stringField(json, "mqttEndpoint", "mqtt.nrfcloud.com");
    account.mqttTopicPrefix = stringField(json, "mqttTopicPrefix");

    std::cout << "[API] MQTT endpoint: " << account.mqttEndpoint << std::endl;
    std::cout << "[API] MQTT prefix: " << account.mqttTopicPrefix << std::endl;
    return account;
}

ConnectionInfo CloudDirectory::registerDevice(const std::string& deviceId, const std::string& certificatePem) {
    AccountInfo account = fetchAccount();

    // CSV onboarding row: deviceId,[subType],[tags],[fwTypes],"certPem"
    HttpRequest request;
    request.method = "POST";
    request.url = url("/v1/devices");
    request.headers["Content-Type"] = "application/octet-stream";
    request.body = deviceId + ",,simulator,,\"" + trimWhitespace(certificatePem) + "\n\"";

    std::cout << "[API] Uploading certificate for " << deviceId << "..." << std::endl;
    HttpResponse response = execute(request, "POST /v1/devices");
    if (response.statusCode == 409) {
        std::cout << "[API] Device already exists, treating as re-registration" << std::endl;
    } else if (!response.ok()) {
        throw DirectoryError(response.statusCode, response.body, "Device registration failed");
    } else {
        std::cout << "[API] Device onboarded" << std::endl;
    }

    return resolveRouting(deviceId, account);
}

ConnectionInfo CloudDirectory::resolveRouting(const std::string& deviceId, const AccountInfo& account) {
    std::string prefix = trimTrailing(account.mqttTopicPrefix, '/');

    ConnectionInfo info;
    info.brokerHost = account.mqttEndpoint;
    info.brokerPort = kBrokerPort;
    info.topicPrefix = account.mqttTopicPrefix;
    info.stage = stageFromPrefix(account.mqttTopicPrefix);

    HttpRequest request;
    request.method = "GET";
    request.url = url(devicePath(deviceId));

    HttpResponse response = execute(request, "GET " + devicePath(deviceId));
    if (!response.ok()) {
        throw DirectoryError(response.statusCode, response.body, "Device lookup after registration failed");
    }

    nlohmann::json device = parseBody(response, "GET " + devicePath(deviceId));
    const nlohmann::json* node = &device;
    for (const char* key : {"state", "desired", "pairing", "topics"}) {
        if (!node->is_object() || !node->contains(key)) {
            node = nullptr;
            break;
        }
        node = &(*node)[key];
    }
    if (node != nullptr && node->is_object()) {
        info.telemetryTopic = stringField(*node, "d2c");
        info.controlTopic = stringField(*node, "c2d");
    }

    if (info.telemetryTopic.empty() || info.controlTopic.empty()) {
        info.telemetryTopic = prefix + "/m/d/" + deviceId + "/d2c";
        info.controlTopic = prefix + "/m/d/" + deviceId + "/+/r";
        std::cout << "[API] Topics not in device shadow, using fallback" << std::endl;
    }

    std::cout << "[API] d2c topic: " << info.telemetryTopic << std::endl;
    std::cout << "[API] c2d topic: " << info.controlTopic << std::endl;
    return info;
}

DeviceStatus CloudDirectory::fetchStatus(const std::string& deviceId) {
    HttpRequest request;
    request.method = "GET";
    request.url = url(devicePath(deviceId));

    HttpResponse response = execute(request, "GET " + devicePath(deviceId));
    if (response.statusCode == 404) {
        throw DirectoryError(404, response.body, "Device " + deviceId + " not found on nRF Cloud");
    }
    if (!response.ok()) {
        throw DirectoryError(response.statusCode, response.body, "Device status request failed");
    }

    try {
        return JsonCodec::jsonToDeviceStatus(deviceId, response.body);
    } catch (const nlohmann::json::exception& e) {
        throw DirectoryError(response.statusCode, response.body,
                             std::string("Device status body invalid: ") + e.what());
    }
}

std::string CloudDirectory::stageFromPrefix(const std::string& topicPrefix) {
    auto slash = topicPrefix.find('/');
    return slash == std::string::npos ? topicPrefix : topicPrefix.substr(0, slash);
}

} // namespace nrfsim
