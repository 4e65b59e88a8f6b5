//
//   PlistTree Property List (plist) data model and serialization library.
//
//   Copyright (c) 2011 Animetrics Inc. (marc@animetrics.com)
//   
//   Permission is hereby granted, free of charge, to any person obtaining a copy
//   of this software and associated documentation files (the "Software"), to deal
//   in the Software without restriction, including without limitation the rights
//   to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
//   copies of the Software, and to permit persons to whom the Software is
//   furnished to do so, subject to the following conditions:
//   
//   The above copyright notice and this permission notice shall be included in
//   all copies or substantial portions of the Software.
//   
//   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
//   IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
//   FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
//   AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
//   LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
//   OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
//   THE SOFTWARE.

#include "PlistTree.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/locale/encoding_utf.hpp>

#include <pugixml.hpp>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <locale>
#include <ostream>
#include <sstream>

namespace PlistTree {

typedef boost::archive::iterators::base64_from_binary<
    boost::archive::iterators::transform_width<data_type::const_iterator, 6, 8> >
    base64_encoder;
typedef boost::archive::iterators::transform_width<
    boost::archive::iterators::binary_from_base64<std::string::const_iterator>,
    8,
    6>
    base64_decoder;

// xml helper functions

static std::string trimmed(const std::string& text);
static bool isBlank(const char* text);
static std::string base64Encode(const data_type& data);
static data_type base64Decode(const std::string& text);
static std::string realToString(double value);
static bool readReal(const std::string& text, double& result);

// xml parsing

static Value parse(const pugi::xml_node& node, unsigned depth);
static Value parseDictionary(const pugi::xml_node& node, unsigned depth);
static Array parseArray(const pugi::xml_node& node, unsigned depth);
static Integer parseInteger(const pugi::xml_node& node);
static double parseReal(const pugi::xml_node& node);
static Date parseDate(const pugi::xml_node& node);
static data_type parseData(const pugi::xml_node& node);
static std::vector<pugi::xml_node> elementChildren(const pugi::xml_node& node);

// xml writing

static void writeXMLNode(pugi::xml_node& parent,
                         const Value& value,
                         unsigned depth);
static void writeXMLArray(pugi::xml_node& parent,
                          const Array& array,
                          unsigned depth);
static void writeXMLDictionary(pugi::xml_node& parent,
                               const Dictionary& dictionary,
                               unsigned depth);
static void writeXMLText(pugi::xml_node& parent,
                         const char* name,
                         const std::string& text);
static void checkDepth(unsigned depth);
template <typename Node>
static std::string writeXMLDocument(const Node& message);

static DecodeError malformed(const std::string& what) {
  return DecodeError(DecodeError::Malformed, what);
}

} // namespace PlistTree

namespace PlistTree {

Value decodeXML(const char* text, int64_t size) {
  using namespace std;

  try {
    if (!text || size <= 0)
      throw DecodeError(DecodeError::Truncated, "empty XML plist");

    pugi::xml_document doc;
    pugi::xml_parse_result result =
        doc.load_buffer(text,
                        static_cast<size_t>(size),
                        pugi::parse_default | pugi::parse_ws_pcdata_single);
    if (!result) {
      // an error at the last non-blank character means the text was cut off
      int64_t contentEnd = size;
      while (contentEnd > 0 && isspace((unsigned char)text[contentEnd - 1]))
        --contentEnd;
      stringstream ss;
      ss << "XML parsed with error " << result.description() << " at offset "
         << result.offset;
      if (result.offset + 1 >= contentEnd)
        throw DecodeError(DecodeError::Truncated, ss.str());
      throw malformed(ss.str());
    }

    pugi::xml_node plist = doc.document_element();
    if (string("plist") != plist.name())
      throw malformed("XML root element is not plist");

    pugi::xml_attribute version = plist.attribute("version");
    if (version && string(config::xmlVersion) != version.value())
      throw DecodeError(DecodeError::UnsupportedVersion,
                        string("XML plist version '") + version.value() + "'");

    vector<pugi::xml_node> children = elementChildren(plist);
    if (children.size() != 1)
      throw malformed("XML plist must hold exactly one value");

    Value message = parse(children.front(), 0);
    log(LogLevel::Debug, "decodeXML", "decoded a " +
                                          string(kindName(message.kind())) +
                                          " root");
    return message;
  } catch (const DecodeError& e) {
    log(LogLevel::Warn, "decodeXML", e.what());
    throw;
  }
}

Value decodeXML(const std::string& text) {
  return decodeXML(text.data(), static_cast<int64_t>(text.size()));
}

static std::vector<pugi::xml_node> elementChildren(const pugi::xml_node& node) {
  std::vector<pugi::xml_node> children;
  for (pugi::xml_node child = node.first_child(); child;
       child = child.next_sibling()) {
    if (child.type() == pugi::node_element)
      children.push_back(child);
    else if ((child.type() == pugi::node_pcdata ||
              child.type() == pugi::node_cdata) &&
             !isBlank(child.value()))
      throw malformed(std::string("XML unexpected text in ") + node.name());
  }
  return children;
}

// depth counts the containers enclosing node
static Value parse(const pugi::xml_node& node, unsigned depth) {
  using namespace std;

  string nodeName = node.name();

  if ("dict" == nodeName)
    return parseDictionary(node, depth);
  else if ("array" == nodeName)
    return parseArray(node, depth);
  else if ("string" == nodeName)
    return string(node.text().get());
  else if ("integer" == nodeName)
    return parseInteger(node);
  else if ("real" == nodeName)
    return parseReal(node);
  else if ("false" == nodeName)
    return false;
  else if ("true" == nodeName)
    return true;
  else if ("data" == nodeName)
    return parseData(node);
  else if ("date" == nodeName)
    return parseDate(node);

  throw malformed("XML unknown node type " + nodeName);
}

static Value parseDictionary(const pugi::xml_node& node, unsigned depth) {
  using namespace std;

  vector<pugi::xml_node> children = elementChildren(node);
  Dictionary dict;
  for (vector<pugi::xml_node>::const_iterator it = children.begin();
       it != children.end();
       ++it) {
    if (string("key") != it->name())
      throw malformed("XML dictionary key expected but not found");

    string key(it->text().get());
    ++it;

    if (it == children.end())
      throw malformed("XML dictionary value expected for key " + key +
                      " but not found");
    else if (string("key") == it->name())
      throw malformed("XML dictionary value expected for key " + key +
                      " but found another key node");

    dict.insert(key, parse(*it, depth + 1));
  }

  // keyed archives write object references as a one-entry CF$UID dict
  if (dict.size() == 1) {
    boost::optional<Item> reference = dict.get(config::uidKey);
    if (reference) {
      const Integer* id = reference->value().asInteger();
      if (id && !id->isNegative())
        return Uid(id->unsignedValue());
    }
  }

  // a CF$UID reference is a leaf, so only a real dictionary is counted
  if (depth >= config::maxDepth)
    throw malformed("XML containers nested too deeply");
  return dict;
}

static Array parseArray(const pugi::xml_node& node, unsigned depth) {
  if (depth >= config::maxDepth)
    throw malformed("XML containers nested too deeply");

  std::vector<pugi::xml_node> children = elementChildren(node);
  Array array;
  for (std::vector<pugi::xml_node>::const_iterator it = children.begin();
       it != children.end();
       ++it)
    array.append(parse(*it, depth + 1));

  return array;
}

static Integer parseInteger(const pugi::xml_node& node) {
  std::string text = trimmed(node.text().get());

  std::size_t position = 0;
  bool negative = false;
  if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
    negative = text[0] == '-';
    position = 1;
  }

  int base = 10;
  if (text.compare(position, 2, "0x") == 0 ||
      text.compare(position, 2, "0X") == 0) {
    base = 16;
    position += 2;
  }

  if (position >= text.size())
    throw malformed("XML integer '" + text + "' has no digits");
  for (std::size_t i = position; i < text.size(); ++i) {
    unsigned char c = text[i];
    if (base == 10 ? !isdigit(c) : !isxdigit(c))
      throw malformed("XML integer '" + text + "' is not a number");
  }

  errno = 0;
  unsigned long long magnitude = strtoull(text.c_str() + position, 0, base);
  if (errno == ERANGE)
    throw malformed("XML integer '" + text + "' out of range");

  if (!negative)
    return Integer::fromUnsigned(magnitude);

  const unsigned long long minMagnitude = 9223372036854775808ULL;
  if (magnitude > minMagnitude)
    throw malformed("XML integer '" + text + "' out of range");
  if (magnitude == minMagnitude)
    return Integer(std::numeric_limits<int64_t>::min());
  return Integer(-static_cast<int64_t>(magnitude));
}

static double parseReal(const pugi::xml_node& node) {
  std::string text = trimmed(node.text().get());
  if (text.empty())
    throw malformed("XML real is empty");

  double result;
  if (!readReal(text, result))
    throw malformed("XML real '" + text + "' is not a number");
  return result;
}

static Date parseDate(const pugi::xml_node& node) {
  Date date;
  try {
    date.setTimeFromXMLConvention(trimmed(node.text().get()));
  } catch (const Error& e) {
    throw malformed(e.what());
  }

  return date;
}

static data_type parseData(const pugi::xml_node& node) {
  return base64Decode(node.text().get());
}

static std::string trimmed(const std::string& text) {
  std::size_t first = 0;
  std::size_t last = text.size();
  while (first < last && isspace((unsigned char)text[first]))
    ++first;
  while (last > first && isspace((unsigned char)text[last - 1]))
    --last;
  return text.substr(first, last - first);
}

static bool isBlank(const char* text) {
  for (; *text; ++text)
    if (!isspace((unsigned char)*text))
      return false;
  return true;
}

static std::string base64Encode(const data_type& data) {
  std::string encoded(base64_encoder(data.begin()), base64_encoder(data.end()));
  encoded.append((3 - data.size() % 3) % 3, '=');
  return encoded;
}

static data_type base64Decode(const std::string& text) {
  std::string encoded;
  encoded.reserve(text.size());
  for (std::string::const_iterator it = text.begin(); it != text.end(); ++it)
    if (!isspace((unsigned char)*it))
      encoded += *it;

  if (encoded.size() % 4 != 0)
    throw malformed("XML data is not valid base64");

  std::size_t padding = 0;
  while (padding < 2 && padding < encoded.size() &&
         encoded[encoded.size() - 1 - padding] == '=')
    ++padding;
  if (encoded.find('=') < encoded.size() - padding)
    throw malformed("XML data has misplaced base64 padding");
  encoded.replace(encoded.size() - padding, padding, padding, 'A');

  try {
    data_type decoded(base64_decoder(encoded.begin()),
                      base64_decoder(encoded.end()));
    decoded.resize(decoded.size() - padding);
    return decoded;
  } catch (const boost::archive::iterators::dataflow_exception&) {
    throw malformed("XML data is not valid base64");
  }
}

static std::string realToString(double value) {
  if (std::isnan(value))
    return "nan";
  if (std::isinf(value))
    return value > 0 ? "+infinity" : "-infinity";

  // shortest precision that reads back to the same double
  std::string text;
  for (int precision = 15; precision <= 17; ++precision) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::setprecision(precision) << value;
    text = out.str();
    double readBack;
    if (readReal(text, readBack) && readBack == value)
      break;
  }
  return text;
}

// Reals use '.' whatever the global locale. nan, inf and infinity are taken
// in any case, with an optional sign.
static bool readReal(const std::string& text, double& result) {
  std::size_t position = 0;
  if (!text.empty() && (text[0] == '-' || text[0] == '+'))
    position = 1;
  std::string word;
  for (std::size_t i = position; i < text.size(); ++i)
    word += static_cast<char>(tolower((unsigned char)text[i]));
  if (word == "nan" || word == "inf" || word == "infinity") {
    result = word == "nan" ? std::numeric_limits<double>::quiet_NaN()
                           : std::numeric_limits<double>::infinity();
    if (text[0] == '-')
      result = -result;
    return true;
  }

  std::istringstream in(text);
  in.imbue(std::locale::classic());
  in >> result;
  return in && in.peek() == std::char_traits<char>::eof();
}

} // namespace PlistTree

namespace PlistTree {

namespace {

// depth counts the containers enclosing the value being written
struct XMLWriteVisitor : public boost::static_visitor<void> {
  XMLWriteVisitor(pugi::xml_node& parent, unsigned depth)
      : _parent(parent), _depth(depth) {}

  void operator()(const Null&) const {
    throw EncodeError("Plist: a null value cannot be encoded");
  }
  void operator()(bool value) const {
    _parent.append_child(value ? "true" : "false");
  }
  void operator()(const Integer& value) const {
    writeXMLText(_parent, "integer", value.toString());
  }
  void operator()(double value) const {
    writeXMLText(_parent, "real", realToString(value));
  }
  void operator()(const std::string& value) const {
    try {
      boost::locale::conv::utf_to_utf<char>(value, boost::locale::conv::stop);
    } catch (const boost::locale::conv::conversion_error&) {
      throw EncodeError("Plist: string is not valid UTF-8");
    }
    writeXMLText(_parent, "string", value);
  }
  void operator()(const data_type& value) const {
    writeXMLText(_parent, "data", base64Encode(value));
  }
  void operator()(const Date& value) const {
    writeXMLText(_parent, "date", value.timeAsXMLConvention());
  }
  void operator()(const Uid& value) const {
    pugi::xml_node dict = _parent.append_child("dict");
    writeXMLText(dict, "key", config::uidKey);
    writeXMLText(dict, "integer", Integer::fromUnsigned(value.get()).toString());
  }
  void operator()(const Array& value) const {
    writeXMLArray(_parent, value, _depth);
  }
  void operator()(const Dictionary& value) const {
    writeXMLDictionary(_parent, value, _depth);
  }

  pugi::xml_node& _parent;
  unsigned _depth;
};
}

static void writeXMLNode(pugi::xml_node& parent,
                         const Value& value,
                         unsigned depth) {
  boost::apply_visitor(XMLWriteVisitor(parent, depth), value.storage());
}

static void checkDepth(unsigned depth) {
  if (depth >= config::maxDepth)
    throw EncodeError("Plist: containers nested too deeply");
}

static void writeXMLArray(pugi::xml_node& parent,
                          const Array& array,
                          unsigned depth) {
  checkDepth(depth);
  pugi::xml_node node = parent.append_child("array");
  for (Array::const_iterator it = array.begin(); it != array.end(); ++it)
    writeXMLNode(node, *it, depth + 1);
}

static void writeXMLDictionary(pugi::xml_node& parent,
                               const Dictionary& dictionary,
                               unsigned depth) {
  checkDepth(depth);
  pugi::xml_node node = parent.append_child("dict");
  for (Dictionary::const_iterator it = dictionary.begin();
       it != dictionary.end();
       ++it) {
    writeXMLText(node, "key", it->first);
    writeXMLNode(node, it->second, depth + 1);
  }
}

static void writeXMLText(pugi::xml_node& parent,
                         const char* name,
                         const std::string& text) {
  pugi::xml_node node = parent.append_child(name);
  if (!text.empty())
    node.append_child(pugi::node_pcdata).set_value(text.c_str());
}

static void writePlistNode(pugi::xml_node& plist, const Value& message) {
  writeXMLNode(plist, message, 0);
}

static void writePlistNode(pugi::xml_node& plist, const Array& message) {
  writeXMLArray(plist, message, 0);
}

static void writePlistNode(pugi::xml_node& plist, const Dictionary& message) {
  writeXMLDictionary(plist, message, 0);
}

template <typename Node>
static std::string writeXMLDocument(const Node& message) {
  try {
    pugi::xml_document doc;
    pugi::xml_node decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";
    doc.append_child(pugi::node_doctype).set_value(config::xmlDoctype);

    pugi::xml_node plist = doc.append_child("plist");
    plist.append_attribute("version") = config::xmlVersion;
    writePlistNode(plist, message);

    std::stringstream ss;
    doc.save(ss, config::xmlIndent, pugi::format_default, pugi::encoding_utf8);
    std::string xml = ss.str();

    std::stringstream logged;
    logged << xml.size() << " bytes of XML";
    log(LogLevel::Debug, "encodeXML", logged.str());
    return xml;
  } catch (const EncodeError& e) {
    log(LogLevel::Warn, "encodeXML", e.what());
    throw;
  }
}

std::string encodeXML(const Value& message) {
  return writeXMLDocument(message);
}

std::string encodeXML(const Array& message) {
  return writeXMLDocument(message);
}

std::string encodeXML(const Dictionary& message) {
  return writeXMLDocument(message);
}

void writePlistXML(std::ostream& stream, const Value& message) {
  stream << encodeXML(message);
  if (!stream)
    throw Error("Plist: failed writing XML plist to stream");
}

} // namespace PlistTree
