#ifndef NETCAST_SSDP_LISTENER_HPP
#define NETCAST_SSDP_LISTENER_HPP

#include "core/reply_channel.hpp"
#include "models/netcast_types.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

struct SearchListenerOptions {
    std::string source = netcast::WILDCARD_SOURCE;
    std::string searchTarget = netcast::SSDP_ST;
    std::string targetAddress = netcast::SSDP_TARGET_ADDRESS;
    int targetPort = netcast::SSDP_TARGET_PORT;
    int mx = netcast::SSDP_MX;

    // Matching replies are posted here. Not owned.
    ReplyChannel<netcast::SsdpHeaders>* replies = nullptr;

    // Called once the socket is bound and listening.
    std::function<void()> onConnect;
};

class SearchListener {
public:
    virtual ~SearchListener() = default;

    virtual bool start(std::string& outError) = 0;
    virtual void search() = 0;
    virtual void stop() = 0;

    virtual const std::string& source() const = 0;
};

using ListenerFactory = std::function<std::unique_ptr<SearchListener>(const SearchListenerOptions&)>;

// Sends SSDP M-SEARCH requests from one source address and collects the
// unicast responses on a background thread.
class SsdpSearchListener : public SearchListener {
public:
    explicit SsdpSearchListener(SearchListenerOptions options);
    ~SsdpSearchListener() override;

    bool start(std::string& outError) override;
    void search() override;
    void stop() override;

    const std::string& source() const override { return m_options.source; }

    std::string buildSearchMessage() const;

    // True when the response answers our search target and carries the
    // fields needed to identify and describe the device.
    bool acceptsResponse(const netcast::SsdpHeaders& headers) const;

private:
    SearchListenerOptions m_options;
    int m_socket = -1;
    std::atomic<bool> m_running{false};
    std::thread m_thread;

    static constexpr int RECV_TIMEOUT_MS = 500;
    static constexpr int MULTICAST_TTL = 2;

    void listenLoop();
};

#endif
