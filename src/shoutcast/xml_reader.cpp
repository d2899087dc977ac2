// StreamProv - Dedicated stream provisioning service
// Minimal XML reader implementation

#include "streamprov/shoutcast/xml_reader.hpp"

#include <cctype>
#include <cstdlib>

namespace streamprov {
namespace shoutcast {

using core::Result;

namespace {

constexpr size_t MAX_DEPTH = 64;

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

void appendUtf8(std::string& out, unsigned long codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

bool isNameChar(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '-' || c == '.' || c == ':' || u >= 0x80;
}

class XmlParser {
public:
    explicit XmlParser(const std::string& input) : input_(input), pos_(0) {}

    Result<XmlElement, XmlError> parse() {
        auto prolog = skipMisc();
        if (prolog.isError()) {
            return Result<XmlElement, XmlError>::error(prolog.error());
        }
        if (peek() != '<') {
            return fail(XmlError::Code::Malformed, "Expected root element");
        }

        XmlElement root;
        auto rootResult = parseElement(root, 0);
        if (rootResult.isError()) {
            return Result<XmlElement, XmlError>::error(rootResult.error());
        }

        auto trailing = skipMisc();
        if (trailing.isError()) {
            return Result<XmlElement, XmlError>::error(trailing.error());
        }
        if (pos_ < input_.size()) {
            return fail(XmlError::Code::Malformed, "Content after root element");
        }
        return Result<XmlElement, XmlError>::success(std::move(root));
    }

private:
    const std::string& input_;
    size_t pos_;

    Result<XmlElement, XmlError> fail(XmlError::Code code, const std::string& message) const {
        return Result<XmlElement, XmlError>::error(XmlError(code, message, pos_));
    }

    Result<void, XmlError> failVoid(XmlError::Code code, const std::string& message) const {
        return Result<void, XmlError>::error(XmlError(code, message, pos_));
    }

    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    bool startsWith(const char* token) const {
        return input_.compare(pos_, std::char_traits<char>::length(token), token) == 0;
    }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
        }
    }

    Result<void, XmlError> skipPast(const char* terminator) {
        size_t end = input_.find(terminator, pos_);
        if (end == std::string::npos) {
            pos_ = input_.size();
            return failVoid(XmlError::Code::UnexpectedEnd,
                            std::string("Missing '") + terminator + "'");
        }
        pos_ = end + std::char_traits<char>::length(terminator);
        return Result<void, XmlError>::success();
    }

    // Whitespace, comments, processing instructions and DOCTYPE.
    Result<void, XmlError> skipMisc() {
        while (true) {
            skipWhitespace();
            if (startsWith("<?")) {
                auto r = skipPast("?>");
                if (r.isError()) return r;
            } else if (startsWith("<!--")) {
                auto r = skipPast("-->");
                if (r.isError()) return r;
            } else if (startsWith("<!DOCTYPE")) {
                auto r = skipPast(">");
                if (r.isError()) return r;
            } else {
                return Result<void, XmlError>::success();
            }
        }
    }

    std::string parseName() {
        size_t start = pos_;
        while (pos_ < input_.size() && isNameChar(input_[pos_])) {
            pos_++;
        }
        return input_.substr(start, pos_ - start);
    }

    Result<void, XmlError> decodeInto(const std::string& raw, std::string& out) const {
        size_t i = 0;
        while (i < raw.size()) {
            char c = raw[i];
            if (c != '&') {
                out += c;
                i++;
                continue;
            }
            size_t semi = raw.find(';', i);
            if (semi == std::string::npos) {
                return failVoid(XmlError::Code::Malformed, "Unterminated entity reference");
            }
            std::string entity = raw.substr(i + 1, semi - i - 1);
            if (entity == "lt") {
                out += '<';
            } else if (entity == "gt") {
                out += '>';
            } else if (entity == "amp") {
                out += '&';
            } else if (entity == "quot") {
                out += '"';
            } else if (entity == "apos") {
                out += '\'';
            } else if (entity.size() > 1 && entity[0] == '#') {
                bool hex = entity[1] == 'x' || entity[1] == 'X';
                std::string digits = entity.substr(hex ? 2 : 1);
                char* end = nullptr;
                unsigned long codepoint = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
                if (digits.empty() || end != digits.c_str() + digits.size() || codepoint > 0x10FFFF) {
                    return failVoid(XmlError::Code::Malformed, "Invalid character reference &" + entity + ";");
                }
                appendUtf8(out, codepoint);
            } else {
                return failVoid(XmlError::Code::Malformed, "Unknown entity &" + entity + ";");
            }
            i = semi + 1;
        }
        return Result<void, XmlError>::success();
    }

    Result<void, XmlError> parseAttributes(XmlElement& element) {
        while (true) {
            skipWhitespace();
            char c = peek();
            if (c == '>' || c == '/' || c == '\0') {
                return Result<void, XmlError>::success();
            }

            std::string name = parseName();
            if (name.empty()) {
                return failVoid(XmlError::Code::Malformed, "Invalid attribute name");
            }
            skipWhitespace();
            if (peek() != '=') {
                return failVoid(XmlError::Code::Malformed, "Expected '=' after attribute " + name);
            }
            pos_++;
            skipWhitespace();

            char quote = peek();
            if (quote != '"' && quote != '\'') {
                return failVoid(XmlError::Code::Malformed, "Expected quoted value for " + name);
            }
            pos_++;
            size_t end = input_.find(quote, pos_);
            if (end == std::string::npos) {
                return failVoid(XmlError::Code::UnexpectedEnd, "Unterminated attribute value");
            }

            std::string value;
            auto decoded = decodeInto(input_.substr(pos_, end - pos_), value);
            if (decoded.isError()) {
                return decoded;
            }
            element.attributes[name] = std::move(value);
            pos_ = end + 1;
        }
    }

    Result<void, XmlError> parseElement(XmlElement& element, size_t depth) {
        if (depth > MAX_DEPTH) {
            return failVoid(XmlError::Code::Malformed, "Document nested too deeply");
        }

        pos_++;  // '<'
        element.name = parseName();
        if (element.name.empty()) {
            return failVoid(XmlError::Code::Malformed, "Invalid element name");
        }

        auto attrs = parseAttributes(element);
        if (attrs.isError()) {
            return attrs;
        }

        if (startsWith("/>")) {
            pos_ += 2;
            return Result<void, XmlError>::success();
        }
        if (peek() != '>') {
            return failVoid(XmlError::Code::UnexpectedEnd, "Unterminated start tag <" + element.name);
        }
        pos_++;

        while (true) {
            if (pos_ >= input_.size()) {
                return failVoid(XmlError::Code::UnexpectedEnd, "Missing </" + element.name + ">");
            }

            if (startsWith("</")) {
                pos_ += 2;
                std::string closing = parseName();
                skipWhitespace();
                if (closing != element.name) {
                    return failVoid(XmlError::Code::MismatchedTag,
                                    "Expected </" + element.name + "> but found </" + closing + ">");
                }
                if (peek() != '>') {
                    return failVoid(XmlError::Code::Malformed, "Malformed end tag </" + closing);
                }
                pos_++;
                return Result<void, XmlError>::success();
            }

            if (startsWith("<!--")) {
                auto r = skipPast("-->");
                if (r.isError()) return r;
                continue;
            }

            if (startsWith("<![CDATA[")) {
                pos_ += 9;
                size_t end = input_.find("]]>", pos_);
                if (end == std::string::npos) {
                    return failVoid(XmlError::Code::UnexpectedEnd, "Unterminated CDATA section");
                }
                element.text += input_.substr(pos_, end - pos_);
                pos_ = end + 3;
                continue;
            }

            if (startsWith("<?")) {
                auto r = skipPast("?>");
                if (r.isError()) return r;
                continue;
            }

            if (peek() == '<') {
                XmlElement child;
                auto r = parseElement(child, depth + 1);
                if (r.isError()) return r;
                element.children.push_back(std::move(child));
                continue;
            }

            size_t next = input_.find('<', pos_);
            if (next == std::string::npos) {
                next = input_.size();
            }
            auto decoded = decodeInto(input_.substr(pos_, next - pos_), element.text);
            if (decoded.isError()) {
                return decoded;
            }
            pos_ = next;
        }
    }
};

void collect(const XmlElement& element, const std::string& name,
             std::vector<const XmlElement*>& out) {
    for (const auto& child : element.children) {
        if (child.name == name) {
            out.push_back(&child);
        }
        collect(child, name, out);
    }
}

} // anonymous namespace

// =============================================================================
// XmlElement
// =============================================================================

const XmlElement* XmlElement::child(const std::string& childName) const {
    for (const auto& c : children) {
        if (c.name == childName) {
            return &c;
        }
    }
    return nullptr;
}

std::string XmlElement::childText(const std::string& childName, const std::string& fallback) const {
    const XmlElement* c = child(childName);
    return c ? trim(c->text) : fallback;
}

std::string XmlElement::attribute(const std::string& attrName, const std::string& fallback) const {
    auto it = attributes.find(attrName);
    return it != attributes.end() ? it->second : fallback;
}

const XmlElement* XmlElement::findFirst(const std::string& elementName) const {
    for (const auto& c : children) {
        if (c.name == elementName) {
            return &c;
        }
        if (const XmlElement* found = c.findFirst(elementName)) {
            return found;
        }
    }
    return nullptr;
}

std::vector<const XmlElement*> XmlElement::findAll(const std::string& elementName) const {
    std::vector<const XmlElement*> out;
    collect(*this, elementName, out);
    return out;
}

// =============================================================================
// Free functions
// =============================================================================

Result<XmlElement, XmlError> parseXml(const std::string& document) {
    XmlParser parser(document);
    return parser.parse();
}

std::string escapeXml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '&': out += "&amp;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

} // namespace shoutcast
} // namespace streamprov
