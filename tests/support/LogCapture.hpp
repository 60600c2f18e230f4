#pragma once

#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "common/Logger.hpp"

namespace ferry::test {

/// Attaches a ring buffer sink to the ferry logger for the lifetime of the object.
/// Attach before any worker logs and detach after workers have stopped.
class LogCapture {
 public:
  LogCapture() : _spSink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)) {
    common::Logger::get()->sinks().push_back(_spSink);
  }
  ~LogCapture() {
    auto& vSinks = common::Logger::get()->sinks();
    vSinks.erase(std::remove(vSinks.begin(), vSinks.end(), _spSink), vSinks.end());
  }

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  /// True if any captured line contains every fragment.
  bool contains(const std::vector<std::string>& vFragments) const {
    for (const auto& sLine : _spSink->last_formatted()) {
      bool bAll = std::all_of(vFragments.begin(), vFragments.end(), [&](const std::string& s) {
        return sLine.find(s) != std::string::npos;
      });
      if (bAll) {
        return true;
      }
    }
    return false;
  }

 private:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> _spSink;
};

}  // namespace ferry::test
