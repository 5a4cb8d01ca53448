#ifndef NETCAST_NETCAST_SCANNER_HPP
#define NETCAST_NETCAST_SCANNER_HPP

#include "core/network_sources.hpp"
#include "core/ready_event.hpp"
#include "core/reply_channel.hpp"
#include "core/ssdp_listener.hpp"
#include "models/netcast_types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class DescriptionFetcher;

struct ScannerOptions {
    std::string searchTarget = netcast::SSDP_ST;
    std::string targetAddress = netcast::SSDP_TARGET_ADDRESS;
    int targetPort = netcast::SSDP_TARGET_PORT;
    int mx = netcast::SSDP_MX;
    int attempts = netcast::DISCOVERY_ATTEMPTS;
    int searchIntervalMs = netcast::DISCOVERY_SEARCH_INTERVAL_MS;

    // Adapter names to probe from, empty for automatic selection.
    std::vector<std::string> adapters;
};

using AdapterProvider = std::function<std::vector<NetworkAdapter>(const std::vector<std::string>&)>;

// Registry of NetCast devices found by SSDP. One instance is shared by every
// caller in the process; setup() binds the listener pool once and later calls
// reuse it.
class NetcastScanner {
public:
    NetcastScanner(ScannerOptions options,
                   DescriptionFetcher* fetcher,
                   ListenerFactory listenerFactory = nullptr,
                   AdapterProvider adapterProvider = nullptr);
    ~NetcastScanner();

    NetcastScanner(const NetcastScanner&) = delete;
    void operator=(const NetcastScanner&) = delete;

    void setup();
    void scan();

    // Sweeps the network and returns every device known so far. Bounded by
    // attempts * interval plus one description fetch.
    std::vector<netcast::DeviceRecord> discover();

    // Merges replies that arrived since the last sweep.
    void processPending();

    std::vector<netcast::DeviceRecord> devices() const;
    std::vector<netcast::DeviceSummary> deviceSummaries() const;
    size_t activeListenerCount() const;

private:
    struct ListenerBinding {
        std::string source;
        std::unique_ptr<SearchListener> listener;
        std::shared_ptr<ReadyEvent> ready;
    };

    ScannerOptions m_options;
    DescriptionFetcher* m_fetcher = nullptr;
    ListenerFactory m_listenerFactory;
    AdapterProvider m_adapterProvider;

    ReplyChannel<netcast::SsdpHeaders> m_replies;

    std::vector<ListenerBinding> m_bindings;
    mutable std::mutex m_bindingsMutex;
    std::mutex m_setupMutex;

    std::map<std::string, netcast::DeviceRecord> m_devices;
    mutable std::mutex m_devicesMutex;
    std::mutex m_consumerMutex;

    void startListeners(std::vector<ListenerBinding>& bindings);
    void pumpReplies(std::chrono::steady_clock::time_point deadline);
    void processEntry(const netcast::SsdpHeaders& headers);
    void stopAll();
};

#endif
