#ifndef CODEX_USAGE_READER_HPP
#define CODEX_USAGE_READER_HPP

#include <cstdint>
#include <functional>
#include <string>

#include "../metrics.hpp"

namespace usage {

using LineSink = std::function<void(const std::string&)>;

// Feeds every line of `path` to `sink`. Returns false when the file cannot be
// opened.
bool readLogFile(const std::string& path, const LineSink& sink, Metrics& metrics);

// Follows an append-only file across polls. Only complete lines are handed
// out; a truncated file is read again from the start.
class LogTail {
 public:
  explicit LogTail(std::string path);

  bool poll(const LineSink& sink, Metrics& metrics);

  std::uintmax_t offset() const { return offset_; }

 private:
  std::string path_;
  std::uintmax_t offset_ = 0;
  std::string partial_;
};

} // namespace usage

#endif
