#include "writer.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "../timestamp.hpp"

using nlohmann::json;

namespace usage {

namespace {

struct BorderGlyphs {
  const char* top_left;
  const char* top_mid;
  const char* top_right;
  const char* mid_left;
  const char* mid_mid;
  const char* mid_right;
  const char* bottom_left;
  const char* bottom_mid;
  const char* bottom_right;
  const char* vertical;
  const char* horizontal;
};

const BorderGlyphs& glyphsFor(BorderStyle border) {
  static const BorderGlyphs unicode{"┌", "┬", "┐", "├", "┼", "┤", "└", "┴", "┘", "│", "─"};
  static const BorderGlyphs ascii{"+", "+", "+", "+", "+", "+", "+", "+", "+", "|", "-"};
  return border == BorderStyle::Ascii ? ascii : unicode;
}

std::string trimDecimals(std::string text) {
  if (text.find('.') == std::string::npos) {
    return text;
  }
  while (!text.empty() && text.back() == '0') {
    text.pop_back();
  }
  if (!text.empty() && text.back() == '.') {
    text.pop_back();
  }
  return text;
}

std::string fixed2(double value) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(2) << value;
  return stream.str();
}

std::string pairCell(std::int64_t main, std::int64_t sub) {
  return formatTokens(main) + " (" + formatTokens(sub) + ")";
}

std::string csvCell(const std::string& value) {
  if (value.find_first_of(",\"\n") == std::string::npos) {
    return value;
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

void writeDelimited(std::ostream& out, const std::vector<std::string>& cells, OutputFormat format) {
  const char separator = format == OutputFormat::Csv ? ',' : '\t';
  for (std::size_t i = 0; i < cells.size(); i += 1) {
    if (i > 0) {
      out << separator;
    }
    out << (format == OutputFormat::Csv ? csvCell(cells[i]) : cells[i]);
  }
  out << "\n";
}

bool isDelimited(OutputFormat format) {
  return format == OutputFormat::Tsv || format == OutputFormat::Csv;
}

void putTokens(json& object, const TokenCounts& tokens) {
  object["input_tokens"] = tokens.input_tokens;
  object["cached_input_tokens"] = tokens.cached_input_tokens;
  object["output_tokens"] = tokens.output_tokens;
  object["reasoning_output_tokens"] = tokens.reasoning_output_tokens;
  object["total_tokens"] = tokens.total_tokens;
}

std::vector<std::string> tokenCells(const TokenCounts& tokens) {
  return {std::to_string(tokens.input_tokens), std::to_string(tokens.cached_input_tokens),
          std::to_string(tokens.output_tokens), std::to_string(tokens.reasoning_output_tokens),
          std::to_string(tokens.total_tokens)};
}

const std::vector<std::string>& tokenHeaders() {
  static const std::vector<std::string> headers = {"input_tokens", "cached_input_tokens", "output_tokens",
                                                   "reasoning_output_tokens", "total_tokens"};
  return headers;
}

template <typename Row, typename ToJson>
void writeJsonRows(std::ostream& out, const std::vector<Row>& rows, OutputFormat format, ToJson to_json) {
  if (format == OutputFormat::Ndjson) {
    for (const Row& row : rows) {
      out << to_json(row).dump() << "\n";
    }
    return;
  }
  json array = json::array();
  for (const Row& row : rows) {
    array.push_back(to_json(row));
  }
  out << array.dump() << "\n";
}

std::string formatDuration(std::int64_t seconds) {
  const std::int64_t hours = seconds / 3600;
  const std::int64_t minutes = (seconds % 3600) / 60;
  std::ostringstream stream;
  stream << hours << "h " << std::setw(2) << std::setfill('0') << minutes << "m";
  return stream.str();
}

} // namespace

bool parseOutputFormat(const std::string& value, OutputFormat& out) {
  if (value == "table") {
    out = OutputFormat::Table;
  } else if (value == "tsv") {
    out = OutputFormat::Tsv;
  } else if (value == "csv") {
    out = OutputFormat::Csv;
  } else if (value == "ndjson") {
    out = OutputFormat::Ndjson;
  } else if (value == "json") {
    out = OutputFormat::Json;
  } else {
    return false;
  }
  return true;
}

bool parseBorderStyle(const std::string& value, BorderStyle& out) {
  if (value == "unicode") {
    out = BorderStyle::Unicode;
  } else if (value == "ascii") {
    out = BorderStyle::Ascii;
  } else {
    return false;
  }
  return true;
}

bool parseSessionBar(const std::string& value, SessionBar& out) {
  if (value == "tokens") {
    out = SessionBar::Tokens;
  } else if (value == "cost") {
    out = SessionBar::Cost;
  } else {
    return false;
  }
  return true;
}

std::string formatTokens(std::int64_t tokens) {
  if (tokens >= 1000000) {
    return trimDecimals(fixed2(static_cast<double>(tokens) / 1000000.0)) + "M";
  }
  if (tokens >= 1000) {
    return trimDecimals(fixed2(static_cast<double>(tokens) / 1000.0)) + "k";
  }
  return std::to_string(tokens);
}

std::string formatCost(const std::optional<double>& cost) {
  return cost ? fixed2(*cost) : std::string();
}

std::string renderBar(double value, double reference, std::size_t width, BorderStyle border) {
  if (!(reference > 0.0) || width == 0) {
    return std::string();
  }
  std::size_t cells = 0;
  if (value > 0.0) {
    const double scaled = value / reference * static_cast<double>(width);
    cells = scaled >= static_cast<double>(width) ? width : std::max<std::size_t>(1, static_cast<std::size_t>(scaled));
  }
  const char* glyph = border == BorderStyle::Ascii ? "#" : "█";
  std::string bar;
  for (std::size_t i = 0; i < cells; i += 1) {
    bar += glyph;
  }
  return bar;
}

std::size_t displayWidth(const std::string& text) {
  std::size_t width = 0;
  for (const char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      width += 1;
    }
  }
  return width;
}

void renderTable(std::ostream& out, const TableLayout& layout, BorderStyle border, bool header_row) {
  const BorderGlyphs& glyphs = glyphsFor(border);
  const std::size_t columns = layout.headers.size();

  std::vector<std::size_t> widths(columns, 0);
  for (std::size_t i = 0; i < columns; i += 1) {
    widths[i] = displayWidth(layout.headers[i]);
  }
  for (const auto& row : layout.rows) {
    for (std::size_t i = 0; i < columns && i < row.size(); i += 1) {
      widths[i] = std::max(widths[i], displayWidth(row[i]));
    }
  }

  auto rule = [&](const char* left, const char* mid, const char* right) {
    out << left;
    for (std::size_t i = 0; i < columns; i += 1) {
      for (std::size_t n = 0; n < widths[i] + 2; n += 1) {
        out << glyphs.horizontal;
      }
      out << (i + 1 < columns ? mid : right);
    }
    out << "\n";
  };
  auto line = [&](const std::vector<std::string>& cells) {
    out << glyphs.vertical;
    for (std::size_t i = 0; i < columns; i += 1) {
      const std::string cell = i < cells.size() ? cells[i] : std::string();
      const std::string padding(widths[i] - displayWidth(cell), ' ');
      if (layout.right_align.count(i) != 0) {
        out << " " << padding << cell << " ";
      } else {
        out << " " << cell << padding << " ";
      }
      out << glyphs.vertical;
    }
    out << "\n";
  };

  rule(glyphs.top_left, glyphs.top_mid, glyphs.top_right);
  if (header_row) {
    line(layout.headers);
    rule(glyphs.mid_left, glyphs.mid_mid, glyphs.mid_right);
  }
  for (std::size_t r = 0; r < layout.rows.size(); r += 1) {
    if (layout.rule_before.count(r) != 0) {
      rule(glyphs.mid_left, glyphs.mid_mid, glyphs.mid_right);
    }
    line(layout.rows[r]);
  }
  rule(glyphs.bottom_left, glyphs.bottom_mid, glyphs.bottom_right);
}

json eventRowJson(const EventRow& row, bool include_model) {
  json object;
  object["ts"] = formatIsoTimestamp(row.event.timestamp, true);
  putTokens(object, row.event.tokens);
  if (include_model && row.event.model) {
    object["model"] = *row.event.model;
  }
  if (row.cost_usd) {
    object["cost_usd"] = *row.cost_usd;
  }
  return object;
}

json dailyRowJson(const DailyRow& row) {
  json object;
  object["date"] = row.date;
  object["events"] = row.totals.events;
  putTokens(object, row.totals.tokens);
  if (row.totals.cost_usd) {
    object["cost_usd"] = *row.totals.cost_usd;
  }
  return object;
}

json modelRowJson(const ModelRow& row) {
  json object;
  object["model"] = row.model;
  object["events"] = row.totals.events;
  putTokens(object, row.totals.tokens);
  if (row.totals.cost_usd) {
    object["cost_usd"] = *row.totals.cost_usd;
  }
  return object;
}

json liveSnapshotJson(const LiveSnapshot& snapshot) {
  json object;
  object["mode"] = "live";
  object["available"] = snapshot.available;
  if (snapshot.available) {
    object["start"] = formatIsoTimestamp(*snapshot.session.start);
    object["end"] = formatIsoTimestamp(*snapshot.session.end);
  } else {
    object["start"] = nullptr;
    object["end"] = nullptr;
  }
  object["now"] = formatIsoTimestamp(snapshot.now);
  object["duration_sec"] = snapshot.duration_sec;
  putTokens(object, snapshot.totals.tokens);
  if (snapshot.totals.cost_usd) {
    object["cost_usd"] = *snapshot.totals.cost_usd;
  }
  return object;
}

void writeEvents(std::ostream& out, const std::vector<EventRow>& rows, const UsageTotals& totals,
                 const WriterOptions& options) {
  const bool priced = std::any_of(rows.begin(), rows.end(), [](const EventRow& row) { return row.cost_usd.has_value(); });

  if (isDelimited(options.format)) {
    if (options.header) {
      std::vector<std::string> headers = {"ts"};
      headers.insert(headers.end(), tokenHeaders().begin(), tokenHeaders().end());
      if (options.include_model) {
        headers.push_back("model");
      }
      if (priced) {
        headers.push_back("cost_usd");
      }
      writeDelimited(out, headers, options.format);
    }
    for (const EventRow& row : rows) {
      std::vector<std::string> cells = {formatIsoTimestamp(row.event.timestamp, true)};
      const std::vector<std::string> tokens = tokenCells(row.event.tokens);
      cells.insert(cells.end(), tokens.begin(), tokens.end());
      if (options.include_model) {
        cells.push_back(row.event.model.value_or(std::string()));
      }
      if (priced) {
        cells.push_back(formatCost(row.cost_usd));
      }
      writeDelimited(out, cells, options.format);
    }
    return;
  }

  if (options.format != OutputFormat::Table) {
    writeJsonRows(out, rows, options.format,
                  [&](const EventRow& row) { return eventRowJson(row, options.include_model); });
    return;
  }

  TableLayout layout;
  layout.headers = {"ts", "input (cached)", "output (reasoning)", "total"};
  layout.right_align = {1, 2, 3};
  if (priced) {
    layout.headers.push_back("$");
    layout.right_align.insert(4);
  }
  if (options.include_model) {
    layout.headers.push_back("model");
  }
  for (const EventRow& row : rows) {
    const TokenCounts& t = row.event.tokens;
    std::vector<std::string> cells = {formatIsoTimestamp(row.event.timestamp, true),
                                      pairCell(t.input_tokens, t.cached_input_tokens),
                                      pairCell(t.output_tokens, t.reasoning_output_tokens),
                                      formatTokens(t.total_tokens)};
    if (priced) {
      cells.push_back(formatCost(row.cost_usd));
    }
    if (options.include_model) {
      cells.push_back(row.event.model.value_or(std::string()));
    }
    layout.rows.push_back(std::move(cells));
  }
  if (options.summary_row) {
    const TokenCounts& t = totals.tokens;
    layout.rule_before.insert(layout.rows.size());
    std::vector<std::string> cells = {"sum", pairCell(t.input_tokens, t.cached_input_tokens),
                                      pairCell(t.output_tokens, t.reasoning_output_tokens),
                                      formatTokens(t.total_tokens)};
    if (priced) {
      cells.push_back(formatCost(totals.cost_usd));
    }
    if (options.include_model) {
      cells.emplace_back();
    }
    layout.rows.push_back(std::move(cells));
  }
  renderTable(out, layout, options.border, options.header);
}

void writeDaily(std::ostream& out, const DailyReport& report, const WriterOptions& options) {
  const std::vector<DailyRow>& rows = report.rows;
  const bool priced =
    std::any_of(rows.begin(), rows.end(), [](const DailyRow& row) { return row.totals.cost_usd.has_value(); });

  if (isDelimited(options.format)) {
    if (options.header) {
      std::vector<std::string> headers = {"date", "events"};
      headers.insert(headers.end(), tokenHeaders().begin(), tokenHeaders().end());
      if (priced) {
        headers.push_back("cost_usd");
      }
      writeDelimited(out, headers, options.format);
    }
    for (const DailyRow& row : rows) {
      std::vector<std::string> cells = {row.date, std::to_string(row.totals.events)};
      const std::vector<std::string> tokens = tokenCells(row.totals.tokens);
      cells.insert(cells.end(), tokens.begin(), tokens.end());
      if (priced) {
        cells.push_back(formatCost(row.totals.cost_usd));
      }
      writeDelimited(out, cells, options.format);
    }
    return;
  }

  if (options.format != OutputFormat::Table) {
    writeJsonRows(out, rows, options.format, dailyRowJson);
    return;
  }

  TableLayout layout;
  layout.headers = {"date", "input (cached)", "output (reasoning)", "total"};
  layout.right_align = {1, 2, 3};
  if (priced) {
    layout.headers.push_back("$");
    layout.right_align.insert(4);
  }
  auto add_row = [&](const std::string& label, const UsageTotals& totals) {
    const TokenCounts& t = totals.tokens;
    std::vector<std::string> cells = {label, pairCell(t.input_tokens, t.cached_input_tokens),
                                      pairCell(t.output_tokens, t.reasoning_output_tokens),
                                      formatTokens(t.total_tokens)};
    if (priced) {
      cells.push_back(formatCost(totals.cost_usd));
    }
    layout.rows.push_back(std::move(cells));
  };
  for (const DailyRow& row : rows) {
    add_row(row.date, row.totals);
  }
  layout.rule_before.insert(layout.rows.size());
  add_row("sum", report.total);
  renderTable(out, layout, options.border, options.header);
}

void writeModelBreakdown(std::ostream& out, const std::vector<ModelRow>& rows, const WriterOptions& options) {
  const bool priced =
    std::any_of(rows.begin(), rows.end(), [](const ModelRow& row) { return row.totals.cost_usd.has_value(); });

  if (isDelimited(options.format)) {
    if (options.header) {
      std::vector<std::string> headers = {"model", "events"};
      headers.insert(headers.end(), tokenHeaders().begin(), tokenHeaders().end());
      if (priced) {
        headers.push_back("cost_usd");
      }
      writeDelimited(out, headers, options.format);
    }
    for (const ModelRow& row : rows) {
      std::vector<std::string> cells = {row.model, std::to_string(row.totals.events)};
      const std::vector<std::string> tokens = tokenCells(row.totals.tokens);
      cells.insert(cells.end(), tokens.begin(), tokens.end());
      if (priced) {
        cells.push_back(formatCost(row.totals.cost_usd));
      }
      writeDelimited(out, cells, options.format);
    }
    return;
  }

  if (options.format != OutputFormat::Table) {
    writeJsonRows(out, rows, options.format, modelRowJson);
    return;
  }

  TableLayout layout;
  layout.headers = {"model", "events", "input (cached)", "output (reasoning)", "total", "$"};
  layout.right_align = {1, 2, 3, 4, 5};
  for (const ModelRow& row : rows) {
    const TokenCounts& t = row.totals.tokens;
    layout.rows.push_back({row.model, std::to_string(row.totals.events),
                           pairCell(t.input_tokens, t.cached_input_tokens),
                           pairCell(t.output_tokens, t.reasoning_output_tokens), formatTokens(t.total_tokens),
                           formatCost(row.totals.cost_usd)});
  }
  renderTable(out, layout, options.border, options.header);
}

void writeLiveSnapshot(std::ostream& out, const LiveSnapshot& snapshot, const WriterOptions& options) {
  if (options.format == OutputFormat::Json || options.format == OutputFormat::Ndjson) {
    out << liveSnapshotJson(snapshot).dump() << "\n";
    return;
  }

  const bool priced = snapshot.totals.cost_usd.has_value();
  if (isDelimited(options.format)) {
    if (options.header) {
      std::vector<std::string> headers = {"start", "end", "now", "duration_sec"};
      headers.insert(headers.end(), tokenHeaders().begin(), tokenHeaders().end());
      headers.push_back("cost_usd");
      writeDelimited(out, headers, options.format);
    }
    std::vector<std::string> cells;
    if (snapshot.available) {
      cells = {formatIsoTimestamp(*snapshot.session.start), formatIsoTimestamp(*snapshot.session.end)};
    } else {
      cells = {"", ""};
    }
    cells.push_back(formatIsoTimestamp(snapshot.now));
    cells.push_back(std::to_string(snapshot.duration_sec));
    const std::vector<std::string> tokens = tokenCells(snapshot.totals.tokens);
    cells.insert(cells.end(), tokens.begin(), tokens.end());
    cells.push_back(formatCost(snapshot.totals.cost_usd));
    writeDelimited(out, cells, options.format);
    return;
  }

  TableLayout layout;
  layout.headers = {"session (UTC)", "dur", "input (cached)", "output (reasoning)", "total"};
  layout.right_align = {1, 2, 3, 4};
  if (priced) {
    layout.headers.push_back("$");
    layout.right_align.insert(5);
  }
  layout.headers.push_back(options.session_bar == SessionBar::Cost ? "$ of 5h" : "tokens of 5h");
  if (!snapshot.available) {
    std::vector<std::string> cells(layout.headers.size());
    cells[0] = "unavailable";
    layout.rows.push_back(std::move(cells));
  } else {
    const TokenCounts& t = snapshot.totals.tokens;
    std::vector<std::string> cells = {
      formatClock(*snapshot.session.start) + " - " + formatClock(*snapshot.session.end),
      formatDuration(snapshot.duration_sec), pairCell(t.input_tokens, t.cached_input_tokens),
      pairCell(t.output_tokens, t.reasoning_output_tokens), formatTokens(t.total_tokens)};
    if (priced) {
      cells.push_back(formatCost(snapshot.totals.cost_usd));
    }
    std::string bar;
    if (options.session_bar == SessionBar::Cost) {
      if (snapshot.totals.cost_usd && snapshot.rolling.cost_usd) {
        bar = renderBar(*snapshot.totals.cost_usd, *snapshot.rolling.cost_usd, kSessionBarWidth, options.border);
      }
    } else {
      bar = renderBar(static_cast<double>(t.total_tokens), static_cast<double>(snapshot.rolling.tokens.total_tokens),
                      kSessionBarWidth, options.border);
    }
    cells.push_back(bar);
    layout.rows.push_back(std::move(cells));
  }
  renderTable(out, layout, options.border, options.header);
}

void writeSummary(std::ostream& out, const UsageTotals& totals) {
  const TokenCounts& t = totals.tokens;
  out << "summary\ti(c)=" << t.input_tokens << "(" << t.cached_input_tokens << ")"
      << "\to(r)=" << t.output_tokens << "(" << t.reasoning_output_tokens << ")"
      << "\tt=" << t.total_tokens;
  if (totals.cost_usd) {
    out << "\t$=" << fixed2(*totals.cost_usd);
  }
  out << "\n";
}

} // namespace usage
