#include "core/netcast_client.hpp"
#include "core/http_requester.hpp"
#include "util/xml_tree.hpp"

#include <borealis/core/logger.hpp>
#include <fmt/format.h>

static const char* XML_HEADER = "<?xml version=\"1.0\" encoding=\"utf-8\"?>";

NetcastClient::NetcastClient(HttpRequester* requester,
                             std::string host,
                             std::optional<std::string> accessToken,
                             int port)
    : m_requester(requester),
      m_host(std::move(host)),
      m_accessToken(std::move(accessToken)),
      m_port(port) {
}

std::string NetcastClient::getUrl(const std::string& endpoint) const {
    std::string host = m_host;
    if (host.find(':') != std::string::npos) {
        host = "[" + host + "]";
    }
    return fmt::format("http://{}:{}/{}/api/{}", host, m_port, PROTOCOL, endpoint);
}

bool NetcastClient::post(const std::string& endpoint, const std::string& body,
                         long& outStatus, std::string& outBody, std::string& outError) {
    if (!m_requester) {
        outError = "No HTTP requester";
        return false;
    }

    HttpResponse response;
    if (!m_requester->request("POST", getUrl(endpoint), {CONTENT_TYPE}, body, response, outError)) {
        return false;
    }

    outStatus = response.status;
    outBody = std::move(response.body);
    return true;
}

bool NetcastClient::displayPairingKey(std::string& outError) {
    std::string body = std::string(XML_HEADER) + "<auth><type>AuthKeyReq</type></auth>";

    long status = 0;
    std::string response;
    if (!post("auth", body, status, response, outError)) {
        return false;
    }
    if (status != 200) {
        outError = "HTTP " + std::to_string(status);
        return false;
    }
    return true;
}

SessionResult NetcastClient::getSessionId(std::string& outSessionId, std::string& outError) {
    if (!m_accessToken || m_accessToken->empty()) {
        std::string error;
        if (!displayPairingKey(error)) {
            brls::Logger::debug("NetcastClient: pairing key request to {} failed: {}", m_host, error);
        }
        outError = "Access token required";
        return SessionResult::AccessTokenError;
    }

    std::string body = fmt::format("{}<auth><type>AuthReq</type><value>{}</value></auth>",
                                   XML_HEADER, XmlTree::escape(*m_accessToken));

    long status = 0;
    std::string response;
    if (!post("auth", body, status, response, outError)) {
        return SessionResult::SessionIdError;
    }

    if (status == 401) {
        outError = "Access token rejected";
        return SessionResult::AccessTokenError;
    }

    if (status != 200) {
        outError = "Can not get session id from TV (HTTP " + std::to_string(status) + ")";
        return SessionResult::SessionIdError;
    }

    auto session = parseSessionId(response);
    if (!session) {
        outError = "Can not get session id from TV";
        return SessionResult::SessionIdError;
    }

    outSessionId = *session;
    return SessionResult::Success;
}

std::optional<std::string> NetcastClient::parseSessionId(const std::string& xml) {
    std::string error;
    auto root = XmlTree::parse(xml, error);
    if (!root) {
        brls::Logger::debug("NetcastClient: malformed session response: {}", error);
        return std::nullopt;
    }

    const XmlElement* session = root->child("session");
    if (!session || session->text.size() < MIN_SESSION_LENGTH) {
        return std::nullopt;
    }
    return session->text;
}
