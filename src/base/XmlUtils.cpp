#include "XmlUtils.hpp"

namespace lgnc {
string xmlEscape(const string& input) {
  string output;
  output.reserve(input.size() + 16);
  for (char c : input) {
    switch (c) {
      case '&':
        output += "&amp;";
        break;
      case '<':
        output += "&lt;";
        break;
      case '>':
        output += "&gt;";
        break;
      case '"':
        output += "&quot;";
        break;
      case '\'':
        output += "&apos;";
        break;
      default:
        output += c;
        break;
    }
  }
  return output;
}

XmlElement XmlElement::child(const string& childName) const {
  pugi::xml_node c = node.child(childName.c_str());
  if (!c) {
    return XmlElement();
  }
  return XmlElement(document, c);
}

vector<XmlElement> XmlElement::children() const {
  vector<XmlElement> retval;
  for (pugi::xml_node c = node.first_child(); c; c = c.next_sibling()) {
    if (c.type() == pugi::node_element) {
      retval.push_back(XmlElement(document, c));
    }
  }
  return retval;
}

string XmlElement::str() const {
  if (!node) {
    return "";
  }
  ostringstream ss;
  node.print(ss, "", pugi::format_raw);
  return ss.str();
}

XmlElement parseXmlDocument(const string& body) {
  shared_ptr<pugi::xml_document> document(new pugi::xml_document());
  pugi::xml_parse_result result =
      document->load_buffer(body.data(), body.size(), pugi::parse_default);
  if (!result) {
    LOG(INFO) << "Invalid xml at offset " << result.offset << ": "
              << result.description();
    throw ParseError(string("Malformed XML from TV: ") + result.description(),
                     int64_t(result.offset));
  }
  return XmlElement(document, document->document_element());
}

namespace {
void collectOutermost(const XmlElement& parent, const string& elementName,
                      vector<XmlElement>* out) {
  for (const auto& c : parent.children()) {
    if (c.name() == elementName) {
      out->push_back(c);
    } else {
      collectOutermost(c, elementName, out);
    }
  }
}
}  // namespace

vector<XmlElement> findOutermost(const XmlElement& root,
                                 const string& elementName) {
  vector<XmlElement> retval;
  if (root.empty()) {
    return retval;
  }
  collectOutermost(root, elementName, &retval);
  return retval;
}
}  // namespace lgnc
