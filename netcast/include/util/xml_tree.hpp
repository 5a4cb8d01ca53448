#ifndef NETCAST_XML_TREE_HPP
#define NETCAST_XML_TREE_HPP

#include <optional>
#include <string>
#include <vector>

struct XmlElement {
    std::string name;
    std::string text;
    std::vector<XmlElement> children;

    // First direct child with the given tag, or nullptr.
    const XmlElement* child(const std::string& tag) const;
    bool isLeaf() const { return children.empty(); }
};

class XmlTree {
public:
    // Parses a complete document into an element tree. Documents that declare
    // entities are refused.
    static std::optional<XmlElement> parse(const std::string& xml, std::string& outError);

    // Escapes text for use as element content.
    static std::string escape(const std::string& text);
};

#endif
