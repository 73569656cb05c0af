#ifndef CODEX_USAGE_WRITER_HPP
#define CODEX_USAGE_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "../aggregator.hpp"
#include "../report.hpp"

namespace usage {

enum class OutputFormat {
  Table,
  Tsv,
  Csv,
  Ndjson,
  Json,
};

enum class BorderStyle {
  Unicode,
  Ascii,
};

// What the bar column of the live session row measures.
enum class SessionBar {
  Tokens,
  Cost,
};

constexpr std::size_t kSessionBarWidth = 42;

struct WriterOptions {
  OutputFormat format = OutputFormat::Table;
  BorderStyle border = BorderStyle::Unicode;
  bool header = true;
  bool include_model = false;
  // Appends a "sum" row to the event table.
  bool summary_row = false;
  SessionBar session_bar = SessionBar::Tokens;
};

bool parseOutputFormat(const std::string& value, OutputFormat& out);
bool parseBorderStyle(const std::string& value, BorderStyle& out);
bool parseSessionBar(const std::string& value, SessionBar& out);

// 1234567 -> "1.23M", 4500 -> "4.5k", 999 -> "999".
std::string formatTokens(std::int64_t tokens);

// Two decimals, or an empty string when the cost is absent.
std::string formatCost(const std::optional<double>& cost);

// `value / reference` of `width` cells, at least one cell for any positive value.
// Empty when the reference is not positive.
std::string renderBar(double value, double reference, std::size_t width, BorderStyle border);

// Terminal columns of a UTF-8 string (code points, no wide-glyph handling).
std::size_t displayWidth(const std::string& text);

struct TableLayout {
  std::vector<std::string> headers;
  std::vector<std::vector<std::string>> rows;
  std::set<std::size_t> right_align;
  // Row indices preceded by a horizontal rule.
  std::set<std::size_t> rule_before;
};

void renderTable(std::ostream& out, const TableLayout& layout, BorderStyle border, bool header_row);

nlohmann::json eventRowJson(const EventRow& row, bool include_model);
nlohmann::json dailyRowJson(const DailyRow& row);
nlohmann::json modelRowJson(const ModelRow& row);
nlohmann::json liveSnapshotJson(const LiveSnapshot& snapshot);

void writeEvents(std::ostream& out, const std::vector<EventRow>& rows, const UsageTotals& totals,
                 const WriterOptions& options);
void writeDaily(std::ostream& out, const DailyReport& report, const WriterOptions& options);
void writeModelBreakdown(std::ostream& out, const std::vector<ModelRow>& rows, const WriterOptions& options);
void writeLiveSnapshot(std::ostream& out, const LiveSnapshot& snapshot, const WriterOptions& options);

// `summary\ti(c)=I(C)\to(r)=O(R)\tt=T[\t$=X.XX]`
void writeSummary(std::ostream& out, const UsageTotals& totals);

} // namespace usage

#endif
