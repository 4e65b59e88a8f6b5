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

#include <iomanip>
#include <locale>
#include <ostream>
#include <sstream>

namespace PlistTree {

namespace {

void writeQuoted(std::ostream& stream, const std::string& text) {
  stream << '"';
  for (std::string::const_iterator it = text.begin(); it != text.end(); ++it) {
    if (*it == '"' || *it == '\\')
      stream << '\\';
    stream << *it;
  }
  stream << '"';
}

// Clean mode renders the semantic value, raw mode the kind and the stored
// representation of every node. Containers deeper than config::maxDepth are
// elided as "...".
struct DebugVisitor : public boost::static_visitor<void> {
  DebugVisitor(std::ostream& stream, bool clean)
      : _stream(stream), _clean(clean), _depth(0) {}

  void operator()(const Null&) const { _stream << (_clean ? "null" : "Null"); }

  void operator()(bool value) const {
    if (_clean)
      _stream << (value ? "true" : "false");
    else
      _stream << "Boolean(" << (value ? "true" : "false") << ")";
  }

  void operator()(const Integer& value) const {
    if (_clean)
      _stream << value.toString();
    else
      _stream << "Integer(" << value.toString() << ", "
              << (value.isUnsigned() ? "unsigned" : "signed") << ")";
  }

  void operator()(double value) const {
    if (_clean)
      _stream << value;
    else
      _stream << "Real(" << std::setprecision(17) << value
              << std::setprecision(6) << ")";
  }

  void operator()(const std::string& value) const {
    if (_clean) {
      writeQuoted(_stream, value);
      return;
    }
    _stream << "String(len=" << value.size() << ", ";
    writeQuoted(_stream, value);
    _stream << ")";
  }

  void operator()(const data_type& value) const {
    if (_clean) {
      _stream << "[";
      for (std::size_t i = 0; i < value.size(); ++i)
        _stream << (i ? ", " : "") << static_cast<int>(value[i]);
      _stream << "]";
      return;
    }
    _stream << "Data(len=" << value.size() << ", " << std::hex
            << std::setfill('0');
    for (std::size_t i = 0; i < value.size(); ++i)
      _stream << std::setw(2) << static_cast<int>(value[i]);
    _stream << std::dec << std::setfill(' ') << ")";
  }

  void operator()(const Date& value) const {
    if (_clean)
      _stream << value.timeAsXMLConvention();
    else
      _stream << "Date(us=" << value.microseconds() << ")";
  }

  void operator()(const Uid& value) const {
    _stream << "Uid(" << value.get() << ")";
  }

  void operator()(const Array& value) const {
    if (!_clean)
      _stream << "Array(len=" << value.size() << ")";
    if (_depth >= config::maxDepth) {
      _stream << "[...]";
      return;
    }
    ++_depth;
    _stream << "[";
    for (Array::const_iterator it = value.begin(); it != value.end(); ++it) {
      if (it != value.begin())
        _stream << ", ";
      boost::apply_visitor(*this, it->storage());
    }
    _stream << "]";
    --_depth;
  }

  void operator()(const Dictionary& value) const {
    if (!_clean)
      _stream << "Dictionary(len=" << value.size() << ")";
    if (_depth >= config::maxDepth) {
      _stream << "{...}";
      return;
    }
    ++_depth;
    _stream << "{";
    for (Dictionary::const_iterator it = value.begin(); it != value.end();
         ++it) {
      if (it != value.begin())
        _stream << ", ";
      writeQuoted(_stream, it->first);
      _stream << ": ";
      boost::apply_visitor(*this, it->second.storage());
    }
    _stream << "}";
    --_depth;
  }

  std::ostream& _stream;
  bool _clean;
  mutable unsigned _depth;
};
}

std::string Value::debugString() const {
  std::stringstream ss;
  ss.imbue(std::locale::classic());
  ss << *this;
  return ss.str();
}

std::ostream& operator<<(std::ostream& stream, const Value& value) {
  boost::apply_visitor(DebugVisitor(stream, cleanDebug()), value.storage());
  return stream;
}

} // namespace PlistTree
