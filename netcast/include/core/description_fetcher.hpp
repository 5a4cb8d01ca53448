#ifndef NETCAST_DESCRIPTION_FETCHER_HPP
#define NETCAST_DESCRIPTION_FETCHER_HPP

#include "models/netcast_types.hpp"

#include <optional>
#include <string>

class HttpRequester;

// Fetches a device description document and extracts the leaf fields of its
// <envelope><device> element. Every failure yields std::nullopt.
class DescriptionFetcher {
public:
    explicit DescriptionFetcher(HttpRequester* requester);

    std::optional<netcast::DeviceDescription> fetch(const std::string& location) const;

    static std::optional<netcast::DeviceDescription> parse(const std::string& xml);

private:
    HttpRequester* m_requester = nullptr;

    static constexpr const char* ROOT_ELEMENT = "envelope";
    static constexpr const char* DEVICE_ELEMENT = "device";
};

#endif
