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

#ifndef __PLISTTREE_LOG_H__
#define __PLISTTREE_LOG_H__

#include <iosfwd>
#include <string>

namespace PlistTree {

enum class LogLevel { Debug, Info, Warn, Error };

const char* levelName(LogLevel level);

class Logger {
 public:
  virtual ~Logger() {}
  virtual void log(LogLevel level,
                   const std::string& operation,
                   const std::string& message) = 0;
};

// Writes "[LEVEL] operation: message" lines.
class StreamLogger : public Logger {
 public:
  StreamLogger();
  explicit StreamLogger(std::ostream& stream);

  void log(LogLevel level,
           const std::string& operation,
           const std::string& message);

 private:
  std::ostream* _stream;
};

// The library does not take ownership of the logger; it must outlive its
// installation. Passing nullptr restores the null logger.
void setLogger(Logger* logger);

// Messages below the threshold are dropped. Defaults to LogLevel::Warn.
void setLogLevel(LogLevel level);
LogLevel logLevel();

void log(LogLevel level,
         const std::string& operation,
         const std::string& message);
}

#endif
