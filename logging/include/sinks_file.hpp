#pragma once
#include "log.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace warden::log {

// Appends records to a plain-text file with an ISO-8601 UTC timestamp
class FileSink : public ISink {
public:
  explicit FileSink(const std::string& path);

  bool IsOpen() const { return out_.is_open(); }
  void write(const LogRecord& r) noexcept override;

private:
  std::mutex mu_;
  std::ofstream out_;
};

} // namespace warden::log
