#include "core/netcast_scanner.hpp"
#include "core/description_fetcher.hpp"

#include <borealis/core/logger.hpp>

#include <exception>
#include <future>

NetcastScanner::NetcastScanner(ScannerOptions options,
                               DescriptionFetcher* fetcher,
                               ListenerFactory listenerFactory,
                               AdapterProvider adapterProvider)
    : m_options(std::move(options)),
      m_fetcher(fetcher),
      m_listenerFactory(std::move(listenerFactory)),
      m_adapterProvider(std::move(adapterProvider)) {
    if (!m_listenerFactory) {
        m_listenerFactory = [](const SearchListenerOptions& listenerOptions) {
            return std::make_unique<SsdpSearchListener>(listenerOptions);
        };
    }
    if (!m_adapterProvider) {
        m_adapterProvider = &NetworkSources::getAdapters;
    }
}

NetcastScanner::~NetcastScanner() {
    stopAll();
}

void NetcastScanner::stopAll() {
    std::lock_guard<std::mutex> lock(m_bindingsMutex);
    for (auto& binding : m_bindings) {
        binding.listener->stop();
    }
    m_bindings.clear();
}

void NetcastScanner::setup() {
    std::lock_guard<std::mutex> setupLock(m_setupMutex);

    std::vector<std::shared_ptr<ReadyEvent>> existing;
    {
        std::lock_guard<std::mutex> lock(m_bindingsMutex);
        for (const auto& binding : m_bindings) {
            existing.push_back(binding.ready);
        }
    }
    if (!existing.empty()) {
        for (auto& ready : existing) {
            ready->wait();
        }
        return;
    }

    auto adapters = m_adapterProvider(m_options.adapters);
    auto sources = NetworkSources::buildSourceSet(adapters);
    brls::Logger::debug("NetcastScanner: probing from {} source(s)", sources.size());

    std::vector<ListenerBinding> bindings;
    for (const auto& source : sources) {
        auto ready = std::make_shared<ReadyEvent>();

        SearchListenerOptions listenerOptions;
        listenerOptions.source = source;
        listenerOptions.searchTarget = m_options.searchTarget;
        listenerOptions.targetAddress = m_options.targetAddress;
        listenerOptions.targetPort = m_options.targetPort;
        listenerOptions.mx = m_options.mx;
        listenerOptions.replies = &m_replies;
        listenerOptions.onConnect = [ready]() { ready->set(); };

        auto listener = m_listenerFactory(listenerOptions);
        if (!listener) {
            brls::Logger::warning("Failed to setup listener for {}: no listener", source);
            continue;
        }
        bindings.push_back({source, std::move(listener), ready});
    }

    startListeners(bindings);

    for (auto& binding : bindings) {
        binding.ready->wait();
    }

    {
        std::lock_guard<std::mutex> lock(m_bindingsMutex);
        m_bindings = std::move(bindings);
    }

    scan();
}

void NetcastScanner::startListeners(std::vector<ListenerBinding>& bindings) {
    struct StartOutcome {
        bool ok = false;
        std::string error;
    };

    std::vector<std::future<StartOutcome>> pending;
    for (auto& binding : bindings) {
        SearchListener* listener = binding.listener.get();
        pending.push_back(std::async(std::launch::async, [listener]() {
            StartOutcome outcome;
            outcome.ok = listener->start(outcome.error);
            return outcome;
        }));
    }

    std::vector<bool> failed(bindings.size(), false);
    for (size_t i = 0; i < pending.size(); i++) {
        StartOutcome outcome;
        try {
            outcome = pending[i].get();
        } catch (const std::exception& e) {
            outcome.ok = false;
            outcome.error = e.what();
        }

        if (!outcome.ok) {
            brls::Logger::warning("Failed to setup listener for {}: {}", bindings[i].source, outcome.error);
            failed[i] = true;
        }
        bindings[i].ready->set();
    }

    std::vector<ListenerBinding> active;
    for (size_t i = 0; i < bindings.size(); i++) {
        if (failed[i]) {
            bindings[i].listener->stop();
        } else {
            active.push_back(std::move(bindings[i]));
        }
    }
    bindings = std::move(active);
}

void NetcastScanner::scan() {
    std::lock_guard<std::mutex> lock(m_bindingsMutex);
    for (auto& binding : m_bindings) {
        binding.listener->search();
    }
}

std::vector<netcast::DeviceRecord> NetcastScanner::discover() {
    setup();

    // Deadlines count from the sweep start; a slow fetch shortens later attempts.
    auto sweepStart = std::chrono::steady_clock::now();
    for (int attempt = 0; attempt < m_options.attempts; attempt++) {
        scan();
        pumpReplies(sweepStart + std::chrono::milliseconds(m_options.searchIntervalMs) * (attempt + 1));
    }

    return devices();
}

void NetcastScanner::processPending() {
    std::lock_guard<std::mutex> consumerLock(m_consumerMutex);
    netcast::SsdpHeaders headers;
    while (m_replies.tryPop(headers)) {
        processEntry(headers);
    }
}

void NetcastScanner::pumpReplies(std::chrono::steady_clock::time_point deadline) {
    netcast::SsdpHeaders headers;
    while (std::chrono::steady_clock::now() < deadline && m_replies.waitUntil(deadline)) {
        std::lock_guard<std::mutex> consumerLock(m_consumerMutex);
        if (m_replies.tryPop(headers)) {
            processEntry(headers);
        }
    }
}

// Caller holds m_consumerMutex, taken before the reply was popped.
void NetcastScanner::processEntry(const netcast::SsdpHeaders& headers) {
    auto usn = headers.find("USN");
    auto location = headers.find("LOCATION");
    if (usn == headers.end() || location == headers.end()) {
        return;
    }

    std::string uniqueId = netcast::uniqueIdFromUsn(usn->second);
    if (uniqueId.empty()) {
        brls::Logger::debug("NetcastScanner: dropping reply with USN {}", usn->second);
        return;
    }

    std::string host = netcast::hostnameFromUrl(location->second);
    if (host.empty()) {
        brls::Logger::debug("NetcastScanner: dropping reply with location {}", location->second);
        return;
    }

    std::optional<netcast::DeviceRecord> previous;
    {
        std::lock_guard<std::mutex> lock(m_devicesMutex);
        auto it = m_devices.find(uniqueId);
        if (it != m_devices.end()) {
            previous = it->second;
        }
    }

    netcast::DeviceRecord record;
    record.uniqueId = uniqueId;
    record.headers = headers;

    if (previous && previous->host() == host) {
        auto description = m_fetcher ? m_fetcher->fetch(previous->location()) : std::nullopt;
        record.upnp = description ? *description : previous->upnp;
    } else {
        if (previous) {
            brls::Logger::info("NetcastScanner: {} moved from {} to {}", uniqueId, previous->host(), host);
        }
        auto description = m_fetcher ? m_fetcher->fetch(location->second) : std::nullopt;
        if (description) {
            record.upnp = *description;
        }
    }

    if (!previous) {
        brls::Logger::info("NetcastScanner: found {} ({}) at {}", record.displayName(), uniqueId, host);
    }

    std::lock_guard<std::mutex> lock(m_devicesMutex);
    m_devices[uniqueId] = std::move(record);
}

std::vector<netcast::DeviceRecord> NetcastScanner::devices() const {
    std::lock_guard<std::mutex> lock(m_devicesMutex);
    std::vector<netcast::DeviceRecord> result;
    result.reserve(m_devices.size());
    for (const auto& [id, record] : m_devices) {
        result.push_back(record);
    }
    return result;
}

std::vector<netcast::DeviceSummary> NetcastScanner::deviceSummaries() const {
    std::vector<netcast::DeviceSummary> summaries;
    for (const auto& record : devices()) {
        summaries.push_back({record.uniqueId, record.host(), record.displayName()});
    }
    return summaries;
}

size_t NetcastScanner::activeListenerCount() const {
    std::lock_guard<std::mutex> lock(m_bindingsMutex);
    return m_bindings.size();
}
