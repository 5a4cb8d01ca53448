#include "core/description_fetcher.hpp"
#include "core/http_requester.hpp"
#include "util/xml_tree.hpp"

#include <borealis/core/logger.hpp>

DescriptionFetcher::DescriptionFetcher(HttpRequester* requester)
    : m_requester(requester) {
}

std::optional<netcast::DeviceDescription> DescriptionFetcher::fetch(const std::string& location) const {
    if (!m_requester) {
        return std::nullopt;
    }

    HttpResponse response;
    std::string error;
    if (!m_requester->request("GET", location, {}, "", response, error)) {
        brls::Logger::debug("DescriptionFetcher: error fetching {}: {}", location, error);
        return std::nullopt;
    }

    if (response.status != 200) {
        brls::Logger::debug("DescriptionFetcher: HTTP {} for {}", response.status, location);
        return std::nullopt;
    }

    if (response.body.empty()) {
        return std::nullopt;
    }

    return parse(response.body);
}

std::optional<netcast::DeviceDescription> DescriptionFetcher::parse(const std::string& xml) {
    std::string error;
    auto root = XmlTree::parse(xml, error);
    if (!root) {
        brls::Logger::debug("DescriptionFetcher: error parsing {}: {}", xml.substr(0, 200), error);
        return std::nullopt;
    }

    if (root->name != ROOT_ELEMENT) {
        return std::nullopt;
    }

    const XmlElement* device = root->child(DEVICE_ELEMENT);
    if (!device) {
        return std::nullopt;
    }

    netcast::DeviceDescription description;
    for (const auto& field : device->children) {
        if (field.isLeaf()) {
            description[field.name] = field.text;
        }
    }
    return description;
}
