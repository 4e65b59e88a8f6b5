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

#include "PlistTreeLog.hpp"

#include <atomic>
#include <iostream>

namespace PlistTree {

namespace {

class NullLogger : public Logger {
 public:
  void log(LogLevel, const std::string&, const std::string&) {}
};

NullLogger nullLogger;
std::atomic<Logger*> currentLogger(&nullLogger);
std::atomic<LogLevel> currentLevel(LogLevel::Warn);
}

const char* levelName(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "?";
}

StreamLogger::StreamLogger() : _stream(&std::cerr) {}

StreamLogger::StreamLogger(std::ostream& stream) : _stream(&stream) {}

void StreamLogger::log(LogLevel level,
                       const std::string& operation,
                       const std::string& message) {
  *_stream << "[" << levelName(level) << "] " << operation << ": " << message
           << std::endl;
}

void setLogger(Logger* logger) {
  currentLogger.store(logger ? logger : &nullLogger, std::memory_order_release);
}

void setLogLevel(LogLevel level) {
  currentLevel.store(level, std::memory_order_release);
}

LogLevel logLevel() {
  return currentLevel.load(std::memory_order_acquire);
}

void log(LogLevel level,
         const std::string& operation,
         const std::string& message) {
  if (static_cast<int>(level) < static_cast<int>(logLevel()))
    return;
  currentLogger.load(std::memory_order_acquire)->log(level, operation, message);
}

} // namespace PlistTree
