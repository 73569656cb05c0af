#ifndef CODEX_USAGE_EXTRACTOR_HPP
#define CODEX_USAGE_EXTRACTOR_HPP

#include <cstddef>
#include <optional>
#include <string>

#include "metrics.hpp"
#include "types.hpp"

namespace usage {

enum class ExtractStatus {
  Accepted,
  // Not an event this tool tracks.
  Ignored,
  // Names a tracked event but its timestamp or payload does not parse.
  Malformed,
};

constexpr std::size_t kMaxRecordBytes = 1024 * 1024;

std::string stripAnsi(const std::string& line);

// True when the line opens with a `YYYY-MM-DDT...` token.
bool startsWithTimestamp(const std::string& line);

// Joins continuation lines (lines without a leading timestamp) onto the
// record they belong to.
class RecordAssembler {
 public:
  // Returns the previous record once `line` starts a new one.
  std::optional<std::string> push(const std::string& line);
  std::optional<std::string> flush();

 private:
  std::string pending_;
  bool has_pending_ = false;
};

// Extracts one logical record. Never throws.
ExtractStatus extractRecord(const std::string& record, ParsedRecord& out);

// Streams physical log lines into parsed records and attributes token counts
// to the model of the latest SessionConfigured record.
class EventExtractor {
 public:
  explicit EventExtractor(Metrics& metrics);

  std::optional<ParsedRecord> pushLine(const std::string& line);
  std::optional<ParsedRecord> finish();

  const std::optional<std::string>& currentModel() const { return current_model_; }

 private:
  std::optional<ParsedRecord> process(const std::string& record);

  Metrics& metrics_;
  RecordAssembler assembler_;
  std::optional<std::string> current_model_;
};

} // namespace usage

#endif
