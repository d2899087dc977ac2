// StreamProv - Dedicated stream provisioning service
// Minimal XML reader for streaming-server status documents
//
// Parses the small, well-formed documents returned by the admin interface
// (server status, stream status, listener list) into an element tree.
// Supports elements, attributes, text, CDATA, comments, processing
// instructions, DOCTYPE and the predefined and numeric entities. No
// namespaces, no DTD validation.

#ifndef STREAMPROV_SHOUTCAST_XML_READER_HPP
#define STREAMPROV_SHOUTCAST_XML_READER_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "streamprov/core/result.hpp"

namespace streamprov {
namespace shoutcast {

struct XmlError {
    enum class Code {
        None,
        Malformed,
        UnexpectedEnd,
        MismatchedTag
    };

    Code code = Code::None;
    std::string message;
    size_t offset = 0;   ///< Byte offset of the failure

    XmlError() = default;
    XmlError(Code c, std::string msg, size_t off)
        : code(c), message(std::move(msg)), offset(off) {}
};

/**
 * @brief One element of a parsed document.
 */
struct XmlElement {
    std::string name;
    std::map<std::string, std::string> attributes;
    std::string text;                  ///< Concatenated, entity-decoded character data
    std::vector<XmlElement> children;

    /**
     * @brief First direct child with the given name, nullptr if none.
     */
    const XmlElement* child(const std::string& childName) const;

    /**
     * @brief Trimmed text of the first direct child, or fallback.
     */
    std::string childText(const std::string& childName, const std::string& fallback = "") const;

    /**
     * @brief Attribute value, or fallback.
     */
    std::string attribute(const std::string& attrName, const std::string& fallback = "") const;

    /**
     * @brief First descendant (depth-first, self excluded) with the name.
     */
    const XmlElement* findFirst(const std::string& elementName) const;

    /**
     * @brief All descendants (document order, self excluded) with the name.
     */
    std::vector<const XmlElement*> findAll(const std::string& elementName) const;
};

/**
 * @brief Parse a document and return its root element.
 */
core::Result<XmlElement, XmlError> parseXml(const std::string& document);

/**
 * @brief Escape text for inclusion in XML character data or attributes.
 */
std::string escapeXml(const std::string& text);

} // namespace shoutcast
} // namespace streamprov

#endif // STREAMPROV_SHOUTCAST_XML_READER_HPP
