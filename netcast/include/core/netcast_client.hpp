#ifndef NETCAST_NETCAST_CLIENT_HPP
#define NETCAST_NETCAST_CLIENT_HPP

#include "models/netcast_types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

class HttpRequester;

enum class SessionResult {
    Success,          // Session id obtained
    AccessTokenError, // No token, or the TV rejected it
    SessionIdError    // Unreachable or unexpected response
};

class SessionClient {
public:
    virtual ~SessionClient() = default;

    virtual SessionResult getSessionId(std::string& outSessionId, std::string& outError) = 0;
};

using SessionClientFactory = std::function<std::unique_ptr<SessionClient>(const netcast::DeviceConfig&)>;

// Client for the ROAP pairing endpoint of LG NetCast TVs.
class NetcastClient : public SessionClient {
public:
    NetcastClient(HttpRequester* requester,
                  std::string host,
                  std::optional<std::string> accessToken,
                  int port = netcast::NETCAST_PORT);

    // Without an access token this asks the TV to display its pairing key and
    // returns AccessTokenError.
    SessionResult getSessionId(std::string& outSessionId, std::string& outError) override;

    bool displayPairingKey(std::string& outError);

    std::string getUrl(const std::string& endpoint) const;

    static std::optional<std::string> parseSessionId(const std::string& xml);

private:
    HttpRequester* m_requester = nullptr;
    std::string m_host;
    std::optional<std::string> m_accessToken;
    int m_port;

    static constexpr const char* PROTOCOL = "roap";
    static constexpr const char* CONTENT_TYPE = "Content-Type: application/atom+xml";
    static constexpr size_t MIN_SESSION_LENGTH = 8;

    bool post(const std::string& endpoint, const std::string& body,
              long& outStatus, std::string& outBody, std::string& outError);
};

#endif
