#ifndef NETCAST_SETTINGS_MANAGER_HPP
#define NETCAST_SETTINGS_MANAGER_HPP

#include "core/config_flow.hpp"
#include "core/netcast_scanner.hpp"
#include "models/netcast_types.hpp"

#include <map>
#include <string>
#include <vector>

class SettingsManager : public ConfigEntries {
private:
    static constexpr const char* CONFIG_DIR_NAME = "netcast";
    static constexpr const char* TOML_CONFIG_FILE_NAME = "config.toml";
    static constexpr const char* ENTRY_PREFIX = "entry_";

    std::string m_configPath;

    std::map<std::string, netcast::ConfigEntry> m_entries;

    std::string m_logLevel = "info";
    int m_discoveryAttempts = netcast::DISCOVERY_ATTEMPTS;
    int m_discoveryIntervalMs = netcast::DISCOVERY_SEARCH_INTERVAL_MS;
    long m_httpTimeout = netcast::DESCRIPTION_TIMEOUT_SECONDS;
    std::vector<std::string> m_adapters;

    bool parseTomlFile(std::string& outError);
    static bool fileExists(const std::string& path);
    static std::string entryKey(const netcast::DeviceConfig& config);

public:
    explicit SettingsManager(std::string configPath = defaultConfigPath());

    SettingsManager(const SettingsManager&) = delete;
    void operator=(const SettingsManager&) = delete;

    // $XDG_CONFIG_HOME/netcast/config.toml, or ~/.config/netcast/config.toml.
    static std::string defaultConfigPath();

    const std::string& getConfigPath() const { return m_configPath; }

    bool parseFile(std::string& outError);
    int writeFile();
    bool ensureConfigDir();

    std::vector<netcast::ConfigEntry> entries() const override;
    bool addEntry(const std::string& title, const netcast::DeviceConfig& config);
    bool removeEntry(const std::string& id);

    ScannerOptions getScannerOptions() const;

    std::string getLogLevel() const;
    void setLogLevel(const std::string& level);

    // Out-of-range values are refused and leave the current setting.
    int getDiscoveryAttempts() const;
    bool setDiscoveryAttempts(int attempts);

    int getDiscoveryIntervalMs() const;
    bool setDiscoveryIntervalMs(int intervalMs);

    long getHttpTimeout() const;
    bool setHttpTimeout(long seconds);

    std::vector<std::string> getAdapters() const;
    void setAdapters(const std::vector<std::string>& adapters);
};

#endif
