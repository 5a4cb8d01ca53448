#ifndef NETCAST_HTTP_REQUESTER_HPP
#define NETCAST_HTTP_REQUESTER_HPP

#include <string>
#include <vector>

struct HttpResponse {
    long status = 0;
    std::string body;
};

class HttpRequester {
public:
    virtual ~HttpRequester() = default;

    // Returns false on transport failure. HTTP error statuses are returned in
    // outResponse and are not a failure here.
    virtual bool request(
        const std::string& method,
        const std::string& url,
        const std::vector<std::string>& headers,
        const std::string& body,
        HttpResponse& outResponse,
        std::string& outError
    ) = 0;
};

class CurlRequester : public HttpRequester {
public:
    CurlRequester(long timeoutSeconds, std::string userAgent);

    bool request(
        const std::string& method,
        const std::string& url,
        const std::vector<std::string>& headers,
        const std::string& body,
        HttpResponse& outResponse,
        std::string& outError
    ) override;

private:
    long m_timeoutSeconds;
    std::string m_userAgent;
};

#endif
