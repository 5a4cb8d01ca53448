#ifndef NETCAST_NETWORK_SOURCES_HPP
#define NETCAST_NETWORK_SOURCES_HPP

#include <set>
#include <string>
#include <vector>

struct AdapterAddress {
    std::string address;
    int networkPrefix = 0;
};

struct NetworkAdapter {
    std::string name;
    unsigned int index = 0;
    bool isDefault = false;
    bool enabled = false;
    bool loopback = false;
    std::vector<AdapterAddress> ipv4;
    std::vector<AdapterAddress> ipv6;
};

class NetworkSources {
public:
    // Adapters of this host. configuredAdapters names the adapters to enable;
    // when empty the default-route adapter is enabled, or every non-loopback
    // adapter if there is no default route.
    static std::vector<NetworkAdapter> getAdapters(const std::vector<std::string>& configuredAdapters);

    static void enableAdapters(std::vector<NetworkAdapter>& adapters,
                               const std::vector<std::string>& configuredAdapters);

    static bool onlyDefaultInterfaceEnabled(const std::vector<NetworkAdapter>& adapters);

    // IPv4 sources for multicast probing. {0.0.0.0} when only the default
    // interface is enabled.
    static std::set<std::string> buildSourceSet(const std::vector<NetworkAdapter>& adapters);

    static bool isLoopback(const std::string& ipv4);

    // Name of the interface carrying the default IPv4 route, empty if none.
    static std::string defaultRouteInterface();

private:
    static constexpr const char* ROUTE_TABLE = "/proc/net/route";
};

#endif
