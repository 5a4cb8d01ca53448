#include "core/settings_manager.hpp"

#include <borealis/core/logger.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sys/stat.h>

SettingsManager::SettingsManager(std::string configPath)
    : m_configPath(std::move(configPath)) {
}

std::string SettingsManager::defaultConfigPath() {
    std::string base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::string(home) + "/.config";
    } else {
        base = ".";
    }
    return base + "/" + CONFIG_DIR_NAME + "/" + TOML_CONFIG_FILE_NAME;
}

bool SettingsManager::ensureConfigDir() {
    size_t slash = m_configPath.rfind('/');
    if (slash == std::string::npos || slash == 0) {
        return true;
    }
    std::string dir = m_configPath.substr(0, slash);

    for (size_t pos = dir.find('/', 1); ; pos = dir.find('/', pos + 1)) {
        std::string partial = dir.substr(0, pos);
        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            brls::Logger::error("SettingsManager: cannot create {}", partial);
            return false;
        }
        if (pos == std::string::npos) break;
    }
    return true;
}

bool SettingsManager::fileExists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0);
}

std::string SettingsManager::entryKey(const netcast::DeviceConfig& config) {
    if (config.id && !config.id->empty()) {
        return *config.id;
    }
    std::string key = config.host;
    std::replace_if(key.begin(), key.end(), [](char c) { return c == '.' || c == ':'; }, '_');
    return key;
}

bool SettingsManager::parseFile(std::string& outError) {
    if (!fileExists(m_configPath)) {
        return true;
    }
    return parseTomlFile(outError);
}

bool SettingsManager::parseTomlFile(std::string& outError) {
    try {
        auto config = toml::parse_file(m_configPath);

        if (auto val = config["log_level"].value<std::string>())
            m_logLevel = *val;
        if (auto val = config["discovery_attempts"].value<int>()) {
            if (!setDiscoveryAttempts(*val))
                brls::Logger::warning("SettingsManager: ignoring discovery_attempts = {}", *val);
        }
        if (auto val = config["discovery_interval_ms"].value<int>()) {
            if (!setDiscoveryIntervalMs(*val))
                brls::Logger::warning("SettingsManager: ignoring discovery_interval_ms = {}", *val);
        }
        if (auto val = config["http_timeout"].value<int64_t>()) {
            if (!setHttpTimeout(static_cast<long>(*val)))
                brls::Logger::warning("SettingsManager: ignoring http_timeout = {}", *val);
        }

        if (auto* adapters = config["adapters"].as_array()) {
            m_adapters.clear();
            for (auto& adapter : *adapters) {
                if (auto name = adapter.value<std::string>())
                    m_adapters.push_back(*name);
            }
        }

        m_entries.clear();
        for (auto& [key, value] : config) {
            if (!value.is_table()) continue;

            std::string keyStr(key.str());
            if (keyStr.rfind(ENTRY_PREFIX, 0) != 0) continue;

            auto* table = value.as_table();

            netcast::ConfigEntry entry;
            if (auto val = (*table)["host"].value<std::string>())
                entry.data.host = *val;
            if (auto val = (*table)["access_token"].value<std::string>())
                entry.data.accessToken = *val;
            if (auto val = (*table)["name"].value<std::string>())
                entry.data.name = *val;
            if (auto val = (*table)["id"].value<std::string>())
                entry.data.id = *val;

            if (entry.data.host.empty()) {
                brls::Logger::warning("SettingsManager: skipping {} without host", keyStr);
                continue;
            }

            entry.title = entry.data.name.value_or(netcast::DEFAULT_NAME);
            m_entries[keyStr.substr(std::char_traits<char>::length(ENTRY_PREFIX))] = entry;
        }

    } catch (const toml::parse_error& err) {
        outError = std::string(err.description());
        brls::Logger::error("SettingsManager: failed to parse {}: {}", m_configPath, outError);
        return false;
    }
    return true;
}

int SettingsManager::writeFile() {
    if (!ensureConfigDir()) {
        return -1;
    }

    toml::table config;

    config.insert("log_level", m_logLevel);
    config.insert("discovery_attempts", m_discoveryAttempts);
    config.insert("discovery_interval_ms", m_discoveryIntervalMs);
    config.insert("http_timeout", static_cast<int64_t>(m_httpTimeout));

    toml::array adapters;
    for (const auto& adapter : m_adapters) {
        adapters.push_back(adapter);
    }
    config.insert("adapters", adapters);

    for (const auto& [key, entry] : m_entries) {
        toml::table entryTable;
        entryTable.insert("host", entry.data.host);
        if (entry.data.accessToken)
            entryTable.insert("access_token", *entry.data.accessToken);
        entryTable.insert("name", entry.data.name.value_or(entry.title));
        if (entry.data.id)
            entryTable.insert("id", *entry.data.id);

        config.insert(ENTRY_PREFIX + key, entryTable);
    }

    std::ofstream configFile(m_configPath, std::ios::out | std::ios::trunc);
    if (!configFile.is_open()) {
        brls::Logger::error("SettingsManager: cannot write {}", m_configPath);
        return -1;
    }

    configFile << config;
    configFile.close();
    return 0;
}

std::vector<netcast::ConfigEntry> SettingsManager::entries() const {
    std::vector<netcast::ConfigEntry> result;
    for (const auto& [key, entry] : m_entries) {
        result.push_back(entry);
    }
    return result;
}

bool SettingsManager::addEntry(const std::string& title, const netcast::DeviceConfig& config) {
    std::string key = entryKey(config);
    if (key.empty()) {
        return false;
    }
    if (m_entries.find(key) != m_entries.end()) {
        brls::Logger::warning("SettingsManager: entry {} already exists", key);
        return false;
    }

    m_entries[key] = netcast::ConfigEntry{title, config};
    brls::Logger::info("SettingsManager: added {} ({})", title, config.host);
    return true;
}

bool SettingsManager::removeEntry(const std::string& id) {
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        const auto& data = it->second.data;
        if (it->first == id || (data.id && *data.id == id) || data.host == id) {
            brls::Logger::info("SettingsManager: removed {}", it->second.title);
            m_entries.erase(it);
            return true;
        }
    }
    return false;
}

ScannerOptions SettingsManager::getScannerOptions() const {
    ScannerOptions options;
    options.attempts = m_discoveryAttempts;
    options.searchIntervalMs = m_discoveryIntervalMs;
    options.adapters = m_adapters;
    return options;
}

std::string SettingsManager::getLogLevel() const {
    return m_logLevel;
}

void SettingsManager::setLogLevel(const std::string& level) {
    m_logLevel = level;
}

int SettingsManager::getDiscoveryAttempts() const {
    return m_discoveryAttempts;
}

bool SettingsManager::setDiscoveryAttempts(int attempts) {
    if (!(attempts > 0)) {
        return false;
    }
    m_discoveryAttempts = attempts;
    return true;
}

int SettingsManager::getDiscoveryIntervalMs() const {
    return m_discoveryIntervalMs;
}

bool SettingsManager::setDiscoveryIntervalMs(int intervalMs) {
    if (!(intervalMs >= 0)) {
        return false;
    }
    m_discoveryIntervalMs = intervalMs;
    return true;
}

long SettingsManager::getHttpTimeout() const {
    return m_httpTimeout;
}

bool SettingsManager::setHttpTimeout(long seconds) {
    if (!(seconds > 0)) {
        return false;
    }
    m_httpTimeout = seconds;
    return true;
}

std::vector<std::string> SettingsManager::getAdapters() const {
    return m_adapters;
}

void SettingsManager::setAdapters(const std::vector<std::string>& adapters) {
    m_adapters = adapters;
}
