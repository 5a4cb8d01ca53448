#include "util/xml_tree.hpp"

#include <expat.h>

#include <string>

namespace {

// Namespaced names arrive as "<uri>|<local>".
constexpr XML_Char NAMESPACE_SEPARATOR = '|';

struct ParseContext {
    XML_Parser parser = nullptr;
    std::vector<XmlElement> stack;
    std::optional<XmlElement> root;
    bool entityDeclared = false;
};

void XMLCALL onStartElement(void* userData, const XML_Char* name, const XML_Char**) {
    auto* ctx = static_cast<ParseContext*>(userData);
    XmlElement element;
    element.name = name;
    size_t separator = element.name.rfind(NAMESPACE_SEPARATOR);
    if (separator != std::string::npos) {
        element.name.erase(0, separator + 1);
    }
    ctx->stack.push_back(std::move(element));
}

void XMLCALL onEndElement(void* userData, const XML_Char*) {
    auto* ctx = static_cast<ParseContext*>(userData);
    if (ctx->stack.empty()) return;

    XmlElement element = std::move(ctx->stack.back());
    ctx->stack.pop_back();

    size_t begin = element.text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        element.text.clear();
    } else {
        size_t end = element.text.find_last_not_of(" \t\r\n");
        element.text = element.text.substr(begin, end - begin + 1);
    }

    if (ctx->stack.empty()) {
        ctx->root = std::move(element);
    } else {
        ctx->stack.back().children.push_back(std::move(element));
    }
}

void XMLCALL onCharacterData(void* userData, const XML_Char* data, int len) {
    auto* ctx = static_cast<ParseContext*>(userData);
    if (!ctx->stack.empty()) {
        ctx->stack.back().text.append(data, static_cast<size_t>(len));
    }
}

void XMLCALL onEntityDecl(void* userData, const XML_Char*, int, const XML_Char*, int,
                          const XML_Char*, const XML_Char*, const XML_Char*, const XML_Char*) {
    auto* ctx = static_cast<ParseContext*>(userData);
    ctx->entityDeclared = true;
    XML_StopParser(ctx->parser, XML_FALSE);
}

}

const XmlElement* XmlElement::child(const std::string& tag) const {
    for (const auto& element : children) {
        if (element.name == tag) {
            return &element;
        }
    }
    return nullptr;
}

std::optional<XmlElement> XmlTree::parse(const std::string& xml, std::string& outError) {
    XML_Parser parser = XML_ParserCreateNS(nullptr, NAMESPACE_SEPARATOR);
    if (!parser) {
        outError = "Failed to create XML parser";
        return std::nullopt;
    }

    ParseContext ctx;
    ctx.parser = parser;

    XML_SetUserData(parser, &ctx);
    XML_SetElementHandler(parser, onStartElement, onEndElement);
    XML_SetCharacterDataHandler(parser, onCharacterData);
    XML_SetEntityDeclHandler(parser, onEntityDecl);

    XML_Status status = XML_Parse(parser, xml.data(), static_cast<int>(xml.size()), XML_TRUE);

    if (ctx.entityDeclared) {
        outError = "Entity declarations are not allowed";
        XML_ParserFree(parser);
        return std::nullopt;
    }

    if (status != XML_STATUS_OK) {
        outError = std::string(XML_ErrorString(XML_GetErrorCode(parser))) +
                   " at line " + std::to_string(XML_GetCurrentLineNumber(parser));
        XML_ParserFree(parser);
        return std::nullopt;
    }

    XML_ParserFree(parser);

    if (!ctx.root) {
        outError = "Document has no root element";
        return std::nullopt;
    }
    return ctx.root;
}

std::string XmlTree::escape(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c; break;
        }
    }
    return result;
}
