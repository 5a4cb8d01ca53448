#include "models/netcast_types.hpp"

#include <curl/curl.h>

#include <arpa/inet.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace netcast {

static char lowerChar(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

static std::string trim(const std::string& value) {
    size_t begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](char a, char b) { return lowerChar(a) < lowerChar(b); });
}

std::string DeviceRecord::header(const std::string& key) const {
    auto it = headers.find(key);
    return it != headers.end() ? it->second : "";
}

std::string DeviceRecord::host() const {
    return hostnameFromUrl(location());
}

std::string DeviceRecord::displayName() const {
    auto it = upnp.find("modelName");
    if (it != upnp.end()) {
        return it->second;
    }
    return DEFAULT_NAME;
}

std::string uniqueIdFromUsn(const std::string& usn) {
    size_t first = usn.find(':');
    if (first == std::string::npos) return "";
    size_t second = usn.find(':', first + 1);
    return usn.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
}

std::string hostnameFromUrl(const std::string& url) {
    CURLU* handle = curl_url();
    if (!handle) return "";

    std::string host;
    if (curl_url_set(handle, CURLUPART_URL, url.c_str(), 0) == CURLUE_OK) {
        char* part = nullptr;
        if (curl_url_get(handle, CURLUPART_HOST, &part, 0) == CURLUE_OK && part) {
            host = part;
            curl_free(part);
        }
    }
    curl_url_cleanup(handle);

    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    std::transform(host.begin(), host.end(), host.begin(), lowerChar);
    return host;
}

static bool isValidLabel(const std::string& label) {
    if (label.empty() || label.size() > 63) return false;
    if (label.front() == '-' || label.back() == '-') return false;
    return std::all_of(label.begin(), label.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
    });
}

bool isHostValid(const std::string& host) {
    if (host.empty()) return false;

    unsigned char buffer[sizeof(struct in6_addr)];
    if (inet_pton(AF_INET, host.c_str(), buffer) == 1 ||
        inet_pton(AF_INET6, host.c_str(), buffer) == 1) {
        return true;
    }

    if (host.size() > 255) return false;

    // Dotted digits that did not parse as IPv4 above.
    if (host.find_first_not_of("0123456789.") == std::string::npos) return false;

    std::string name = host;
    if (name.back() == '.') name.pop_back();

    std::istringstream stream(name);
    std::string label;
    size_t labels = 0;
    while (std::getline(stream, label, '.')) {
        if (!isValidLabel(label)) return false;
        labels++;
    }
    // getline drops a trailing empty label, e.g. "a..".
    return labels > 0 && name.back() != '.';
}

std::optional<SsdpHeaders> parseSsdpResponse(const char* data, size_t len) {
    std::string responseStr(data, len);
    std::istringstream stream(responseStr);
    std::string line;

    if (!std::getline(stream, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.rfind("HTTP/", 0) != 0 || line.find(" 200") == std::string::npos) {
        return std::nullopt;
    }

    SsdpHeaders headers;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) break;

        size_t colonPos = line.find(':');
        if (colonPos == std::string::npos) continue;

        std::string key = trim(line.substr(0, colonPos));
        if (key.empty()) continue;
        headers[key] = trim(line.substr(colonPos + 1));
    }

    return headers;
}

void to_json(nlohmann::json& j, const DeviceRecord& record) {
    j = nlohmann::json::object();
    for (const auto& [key, value] : record.headers) {
        j[key] = value;
    }
    j["upnp"] = record.upnp;
}

void to_json(nlohmann::json& j, const DeviceSummary& summary) {
    j = nlohmann::json{
        {CONF_ID, summary.id},
        {CONF_HOST, summary.host},
        {CONF_NAME, summary.name}
    };
}

void to_json(nlohmann::json& j, const DeviceConfig& config) {
    j = nlohmann::json{{CONF_HOST, config.host}};
    if (config.accessToken) j[CONF_ACCESS_TOKEN] = *config.accessToken;
    if (config.name) j[CONF_NAME] = *config.name;
    if (config.id) j[CONF_ID] = *config.id;
}

static std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) return std::nullopt;
    return j[key].get<std::string>();
}

void from_json(const nlohmann::json& j, DeviceConfig& config) {
    config.host = j.value(CONF_HOST, "");
    config.accessToken = optionalString(j, CONF_ACCESS_TOKEN);
    config.name = optionalString(j, CONF_NAME);
    config.id = optionalString(j, CONF_ID);
}

bool operator==(const DeviceConfig& lhs, const DeviceConfig& rhs) {
    return lhs.host == rhs.host &&
           lhs.accessToken == rhs.accessToken &&
           lhs.name == rhs.name &&
           lhs.id == rhs.id;
}

}
