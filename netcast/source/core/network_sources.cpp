#include "core/network_sources.hpp"
#include "models/netcast_types.hpp"

#include <borealis/core/logger.hpp>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <bitset>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <sstream>

static int prefixLength(const struct sockaddr* netmask) {
    if (!netmask) return 0;

    int bits = 0;
    if (netmask->sa_family == AF_INET) {
        auto* mask = reinterpret_cast<const struct sockaddr_in*>(netmask);
        bits = static_cast<int>(std::bitset<32>(ntohl(mask->sin_addr.s_addr)).count());
    } else if (netmask->sa_family == AF_INET6) {
        auto* mask = reinterpret_cast<const struct sockaddr_in6*>(netmask);
        for (unsigned char byte : mask->sin6_addr.s6_addr) {
            bits += static_cast<int>(std::bitset<8>(byte).count());
        }
    }
    return bits;
}

std::vector<NetworkAdapter> NetworkSources::getAdapters(const std::vector<std::string>& configuredAdapters) {
    std::vector<NetworkAdapter> adapters;

    struct ifaddrs* ifas = nullptr;
    if (getifaddrs(&ifas) != 0) {
        brls::Logger::warning("NetworkSources: getifaddrs failed: {}", strerror(errno));
        return adapters;
    }

    std::map<std::string, size_t> byName;
    std::string defaultInterface = defaultRouteInterface();

    for (auto* it = ifas; it; it = it->ifa_next) {
        if (!it->ifa_addr || !it->ifa_name) continue;
        if (!(it->ifa_flags & IFF_UP)) continue;

        int family = it->ifa_addr->sa_family;
        if (family != AF_INET && family != AF_INET6) continue;

        auto found = byName.find(it->ifa_name);
        if (found == byName.end()) {
            NetworkAdapter adapter;
            adapter.name = it->ifa_name;
            adapter.index = if_nametoindex(it->ifa_name);
            adapter.loopback = (it->ifa_flags & IFF_LOOPBACK) != 0;
            adapter.isDefault = !defaultInterface.empty() && adapter.name == defaultInterface;
            adapters.push_back(adapter);
            found = byName.emplace(it->ifa_name, adapters.size() - 1).first;
        }
        NetworkAdapter& adapter = adapters[found->second];

        char buf[INET6_ADDRSTRLEN] = {0};
        AdapterAddress address;
        address.networkPrefix = prefixLength(it->ifa_netmask);

        if (family == AF_INET) {
            auto* sin = reinterpret_cast<struct sockaddr_in*>(it->ifa_addr);
            inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
            address.address = buf;
            adapter.ipv4.push_back(address);
        } else {
            auto* sin6 = reinterpret_cast<struct sockaddr_in6*>(it->ifa_addr);
            inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
            address.address = buf;
            adapter.ipv6.push_back(address);
        }
    }

    freeifaddrs(ifas);

    enableAdapters(adapters, configuredAdapters);

    for (const auto& adapter : adapters) {
        brls::Logger::debug("NetworkSources: adapter {} default={} enabled={} ipv4={}",
                            adapter.name, adapter.isDefault, adapter.enabled, adapter.ipv4.size());
    }
    return adapters;
}

void NetworkSources::enableAdapters(std::vector<NetworkAdapter>& adapters,
                                    const std::vector<std::string>& configuredAdapters) {
    if (!configuredAdapters.empty()) {
        for (auto& adapter : adapters) {
            adapter.enabled = std::find(configuredAdapters.begin(), configuredAdapters.end(),
                                        adapter.name) != configuredAdapters.end();
        }
        return;
    }

    bool hasDefault = std::any_of(adapters.begin(), adapters.end(),
                                  [](const NetworkAdapter& a) { return a.isDefault; });
    for (auto& adapter : adapters) {
        adapter.enabled = hasDefault ? adapter.isDefault : !adapter.loopback;
    }
}

bool NetworkSources::onlyDefaultInterfaceEnabled(const std::vector<NetworkAdapter>& adapters) {
    return std::none_of(adapters.begin(), adapters.end(), [](const NetworkAdapter& a) {
        return a.enabled && !a.isDefault;
    });
}

std::set<std::string> NetworkSources::buildSourceSet(const std::vector<NetworkAdapter>& adapters) {
    if (onlyDefaultInterfaceEnabled(adapters)) {
        return {netcast::WILDCARD_SOURCE};
    }

    std::set<std::string> sources;
    for (const auto& adapter : adapters) {
        if (!adapter.enabled) continue;
        for (const auto& address : adapter.ipv4) {
            if (isLoopback(address.address)) continue;
            sources.insert(address.address);
        }
    }
    return sources;
}

bool NetworkSources::isLoopback(const std::string& ipv4) {
    struct in_addr addr;
    if (inet_pton(AF_INET, ipv4.c_str(), &addr) != 1) {
        return false;
    }
    return (ntohl(addr.s_addr) & 0xFF000000u) == 0x7F000000u;
}

std::string NetworkSources::defaultRouteInterface() {
    std::ifstream routes(ROUTE_TABLE);
    if (!routes.is_open()) {
        return "";
    }

    std::string line;
    std::getline(routes, line); // header

    while (std::getline(routes, line)) {
        std::istringstream fields(line);
        std::string iface, destination, gateway, flags, refCnt, use, metric, mask;
        if (!(fields >> iface >> destination >> gateway >> flags >> refCnt >> use >> metric >> mask)) {
            continue;
        }

        unsigned long flagBits = std::strtoul(flags.c_str(), nullptr, 16);
        if (destination == "00000000" && mask == "00000000" && (flagBits & 0x1)) {
            return iface;
        }
    }
    return "";
}
