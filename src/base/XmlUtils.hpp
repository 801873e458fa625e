#ifndef __LGNC_XML_UTILS__
#define __LGNC_XML_UTILS__

#include "Headers.hpp"
#include "NetCastErrors.hpp"

namespace lgnc {
/**
 * @brief Escapes a value so it can be placed in XML text or attributes.
 */
string xmlEscape(const string& input);

/**
 * @brief Element of a parsed response document.
 *
 * Shares ownership of the document it came from, so it stays valid after the
 * client that produced it is gone. A default constructed element is empty.
 */
class XmlElement {
 public:
  XmlElement() {}

  XmlElement(shared_ptr<pugi::xml_document> _document, pugi::xml_node _node)
      : document(_document), node(_node) {}

  bool empty() const { return !node; }

  string name() const { return node.name(); }

  /** @brief Concatenated text of the element's first PCDATA child. */
  string text() const { return node.child_value(); }

  /** @brief First child element with the given name, empty if missing. */
  XmlElement child(const string& childName) const;

  string childText(const string& childName) const {
    return node.child(childName.c_str()).child_value();
  }

  /** @brief All element children in document order. */
  vector<XmlElement> children() const;

  /** @brief Serialized form of the element and everything below it. */
  string str() const;

  const pugi::xml_node& getNode() const { return node; }

 protected:
  shared_ptr<pugi::xml_document> document;
  pugi::xml_node node;
};

/**
 * @brief Parses a complete document and returns its root element.
 * @throws ParseError when the body is not well-formed XML.
 */
XmlElement parseXmlDocument(const string& body);

/**
 * @brief Collects every descendant of root named elementName that is not
 * itself inside another elementName, in document order.
 */
vector<XmlElement> findOutermost(const XmlElement& root,
                                 const string& elementName);
}  // namespace lgnc

#endif  // __LGNC_XML_UTILS__
