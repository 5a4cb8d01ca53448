#ifndef NETCAST_NETCAST_TYPES_HPP
#define NETCAST_NETCAST_TYPES_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace netcast {

constexpr const char* DEFAULT_NAME = "LG Netcast TV";

constexpr const char* SSDP_ST = "urn:schemas-udap:service:netrcu:1";
constexpr const char* SSDP_TARGET_ADDRESS = "239.255.255.250";
constexpr int SSDP_TARGET_PORT = 1900;
constexpr int SSDP_MX = 4;

constexpr int DISCOVERY_ATTEMPTS = 3;
constexpr int DISCOVERY_SEARCH_INTERVAL_MS = 2000;

constexpr long DESCRIPTION_TIMEOUT_SECONDS = 10;
constexpr const char* UDAP_USER_AGENT = "UDAP/2.0";

constexpr int NETCAST_PORT = 8080;
constexpr size_t ACCESS_TOKEN_MAX_LENGTH = 6;

constexpr const char* WILDCARD_SOURCE = "0.0.0.0";

// Field names shared by flow input, flow data and persisted entries.
constexpr const char* CONF_HOST = "host";
constexpr const char* CONF_ACCESS_TOKEN = "access_token";
constexpr const char* CONF_NAME = "name";
constexpr const char* CONF_ID = "id";
constexpr const char* CONF_DEVICE = "device";

struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

// Header fields of one SSDP search response. Keys compare case-insensitively.
using SsdpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

// Leaf fields of the <device> element of a description document.
using DeviceDescription = std::map<std::string, std::string>;

struct DeviceRecord {
    std::string uniqueId;
    SsdpHeaders headers;
    DeviceDescription upnp;

    std::string header(const std::string& key) const;
    std::string st() const { return header("ST"); }
    std::string usn() const { return header("USN"); }
    std::string location() const { return header("LOCATION"); }
    std::string host() const;

    // modelName from the description, or DEFAULT_NAME.
    std::string displayName() const;
};

struct DeviceSummary {
    std::string id;
    std::string host;
    std::string name;
};

struct DeviceConfig {
    std::string host;
    std::optional<std::string> accessToken;
    std::optional<std::string> name;
    std::optional<std::string> id;
};

struct ConfigEntry {
    std::string title;
    DeviceConfig data;
};

// "uuid:1234:urn:schemas-udap:service:netrcu:1" -> "1234"
std::string uniqueIdFromUsn(const std::string& usn);

// Lowercased host component of a URL, empty when there is none.
std::string hostnameFromUrl(const std::string& url);

// Accepts IPv4/IPv6 literals and RFC 1123 host names.
bool isHostValid(const std::string& host);

std::optional<SsdpHeaders> parseSsdpResponse(const char* data, size_t len);

void to_json(nlohmann::json& j, const DeviceRecord& record);
void to_json(nlohmann::json& j, const DeviceSummary& summary);
void to_json(nlohmann::json& j, const DeviceConfig& config);
void from_json(const nlohmann::json& j, DeviceConfig& config);

bool operator==(const DeviceConfig& lhs, const DeviceConfig& rhs);

}

#endif
