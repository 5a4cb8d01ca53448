#include "core/ssdp_listener.hpp"

#include <borealis/core/logger.hpp>
#include <fmt/format.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

SsdpSearchListener::SsdpSearchListener(SearchListenerOptions options)
    : m_options(std::move(options)) {
}

SsdpSearchListener::~SsdpSearchListener() {
    stop();
}

bool SsdpSearchListener::start(std::string& outError) {
    if (m_running) {
        return true;
    }

    struct in_addr sourceAddr;
    if (inet_pton(AF_INET, m_options.source.c_str(), &sourceAddr) != 1) {
        outError = "Invalid source address " + m_options.source;
        return false;
    }

    m_socket = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (m_socket < 0) {
        outError = std::string("socket: ") + strerror(errno);
        return false;
    }

    int reuseaddr = 1;
    setsockopt(m_socket, SOL_SOCKET, SO_REUSEADDR, &reuseaddr, sizeof(reuseaddr));

    struct timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = RECV_TIMEOUT_MS * 1000;
    setsockopt(m_socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    struct sockaddr_in bindAddr;
    memset(&bindAddr, 0, sizeof(bindAddr));
    bindAddr.sin_family = AF_INET;
    bindAddr.sin_addr = sourceAddr;
    bindAddr.sin_port = htons(0);

    if (bind(m_socket, (struct sockaddr*)&bindAddr, sizeof(bindAddr)) < 0) {
        outError = std::string("bind: ") + strerror(errno);
        close(m_socket);
        m_socket = -1;
        return false;
    }

    if (sourceAddr.s_addr != htonl(INADDR_ANY)) {
        if (setsockopt(m_socket, IPPROTO_IP, IP_MULTICAST_IF, &sourceAddr, sizeof(sourceAddr)) < 0) {
            outError = std::string("IP_MULTICAST_IF: ") + strerror(errno);
            close(m_socket);
            m_socket = -1;
            return false;
        }
    }

    unsigned char ttl = MULTICAST_TTL;
    setsockopt(m_socket, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

    m_running = true;
    try {
        m_thread = std::thread(&SsdpSearchListener::listenLoop, this);
    } catch (const std::system_error& e) {
        m_running = false;
        outError = e.what();
        close(m_socket);
        m_socket = -1;
        return false;
    }

    brls::Logger::debug("SsdpSearchListener: listening on {}", m_options.source);

    if (m_options.onConnect) {
        m_options.onConnect();
    }
    return true;
}

void SsdpSearchListener::stop() {
    if (!m_running) {
        return;
    }
    m_running = false;

    if (m_thread.joinable()) {
        m_thread.join();
    }

    if (m_socket >= 0) {
        close(m_socket);
        m_socket = -1;
    }
}

std::string SsdpSearchListener::buildSearchMessage() const {
    return fmt::format(
        "M-SEARCH * HTTP/1.1\r\n"
        "HOST: {}:{}\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "MX: {}\r\n"
        "ST: {}\r\n"
        "\r\n",
        m_options.targetAddress, m_options.targetPort, m_options.mx, m_options.searchTarget);
}

bool SsdpSearchListener::acceptsResponse(const netcast::SsdpHeaders& headers) const {
    auto st = headers.find("ST");
    if (st == headers.end() || st->second != m_options.searchTarget) {
        return false;
    }
    return headers.count("USN") > 0 && headers.count("LOCATION") > 0;
}

void SsdpSearchListener::search() {
    if (!m_running || m_socket < 0) {
        return;
    }

    struct sockaddr_in targetAddr;
    memset(&targetAddr, 0, sizeof(targetAddr));
    targetAddr.sin_family = AF_INET;
    targetAddr.sin_port = htons(static_cast<uint16_t>(m_options.targetPort));
    inet_pton(AF_INET, m_options.targetAddress.c_str(), &targetAddr.sin_addr);

    std::string message = buildSearchMessage();
    ssize_t sent = sendto(m_socket, message.data(), message.size(), 0,
                          (struct sockaddr*)&targetAddr, sizeof(targetAddr));
    if (sent < 0) {
        brls::Logger::warning("SsdpSearchListener: search from {} failed: {}",
                              m_options.source, strerror(errno));
    }
}

void SsdpSearchListener::listenLoop() {
    char buffer[4096];
    struct sockaddr_in fromAddr;

    while (m_running) {
        socklen_t fromLen = sizeof(fromAddr);
        ssize_t received = recvfrom(m_socket, buffer, sizeof(buffer) - 1, 0,
                                    (struct sockaddr*)&fromAddr, &fromLen);
        if (received <= 0) {
            continue;
        }

        auto headers = netcast::parseSsdpResponse(buffer, static_cast<size_t>(received));
        if (!headers) {
            continue;
        }

        char fromStr[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &fromAddr.sin_addr, fromStr, sizeof(fromStr));

        if (!acceptsResponse(*headers)) {
            brls::Logger::debug("SsdpSearchListener: ignoring response from {}", fromStr);
            continue;
        }

        (*headers)["_host"] = fromStr;

        if (m_options.replies) {
            m_options.replies->push(std::move(*headers));
        }
    }
}
