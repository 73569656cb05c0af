#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "io/writer.hpp"
#include "timestamp.hpp"

namespace usage {
namespace {

using nlohmann::json;

Timestamp at(const std::string& value) {
  Timestamp ts = 0;
  EXPECT_TRUE(parseIsoTimestamp(value, ts)) << value;
  return ts;
}

EventRow eventRow(const std::string& ts, std::int64_t input, std::int64_t cached, std::optional<double> cost) {
  EventRow row;
  row.event.timestamp = at(ts);
  row.event.tokens.input_tokens = input;
  row.event.tokens.cached_input_tokens = cached;
  row.event.tokens.output_tokens = 10;
  row.event.tokens.total_tokens = input + 10;
  row.event.model = std::string("gpt-5");
  row.cost_usd = cost;
  return row;
}

std::vector<std::string> lines(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    out.push_back(line);
  }
  return out;
}

TEST(WriterTest, FormatsTokensCompactly) {
  EXPECT_EQ(formatTokens(999), "999");
  EXPECT_EQ(formatTokens(0), "0");
  EXPECT_EQ(formatTokens(1000), "1k");
  EXPECT_EQ(formatTokens(4500), "4.5k");
  EXPECT_EQ(formatTokens(1234567), "1.23M");
  EXPECT_EQ(formatTokens(2000000), "2M");
}

TEST(WriterTest, FormatsCostOrLeavesItBlank) {
  EXPECT_EQ(formatCost(9.3), "9.30");
  EXPECT_EQ(formatCost(0.0), "0.00");
  EXPECT_EQ(formatCost(std::nullopt), "");
}

TEST(WriterTest, ParsesFormatNames) {
  OutputFormat format = OutputFormat::Table;
  EXPECT_TRUE(parseOutputFormat("ndjson", format));
  EXPECT_EQ(format, OutputFormat::Ndjson);
  EXPECT_FALSE(parseOutputFormat("yaml", format));
  EXPECT_EQ(format, OutputFormat::Ndjson);

  BorderStyle border = BorderStyle::Unicode;
  EXPECT_TRUE(parseBorderStyle("ascii", border));
  EXPECT_EQ(border, BorderStyle::Ascii);
  EXPECT_FALSE(parseBorderStyle("double", border));
}

TEST(WriterTest, TsvEventsCarryRawNumbers) {
  WriterOptions options;
  options.format = OutputFormat::Tsv;
  std::ostringstream out;
  writeEvents(out, {eventRow("2025-08-25T01:00:00Z", 1234567, 100, 0.5)}, UsageTotals{}, options);

  const std::vector<std::string> written = lines(out.str());
  ASSERT_EQ(written.size(), 2u);
  EXPECT_EQ(written[0],
            "ts\tinput_tokens\tcached_input_tokens\toutput_tokens\treasoning_output_tokens\ttotal_tokens\tcost_usd");
  EXPECT_EQ(written[1], "2025-08-25T01:00:00.000Z\t1234567\t100\t10\t0\t1234577\t0.50");
}

TEST(WriterTest, CsvLeavesAbsentCostEmpty) {
  WriterOptions options;
  options.format = OutputFormat::Csv;
  options.include_model = true;
  std::ostringstream out;
  writeEvents(out,
              {eventRow("2025-08-25T01:00:00Z", 100, 0, 0.25), eventRow("2025-08-25T02:00:00Z", 200, 0, std::nullopt)},
              UsageTotals{}, options);

  const std::vector<std::string> written = lines(out.str());
  ASSERT_EQ(written.size(), 3u);
  EXPECT_EQ(written[0],
            "ts,input_tokens,cached_input_tokens,output_tokens,reasoning_output_tokens,total_tokens,model,cost_usd");
  EXPECT_EQ(written[2], "2025-08-25T02:00:00.000Z,200,0,10,0,210,gpt-5,");
}

TEST(WriterTest, HeaderCanBeSuppressed) {
  WriterOptions options;
  options.format = OutputFormat::Tsv;
  options.header = false;
  std::ostringstream out;
  writeEvents(out, {eventRow("2025-08-25T01:00:00Z", 100, 0, std::nullopt)}, UsageTotals{}, options);
  EXPECT_EQ(out.str(), "2025-08-25T01:00:00.000Z\t100\t0\t10\t0\t110\n");
}

TEST(WriterTest, NdjsonEventsOmitAbsentCost) {
  WriterOptions options;
  options.format = OutputFormat::Ndjson;
  std::ostringstream out;
  writeEvents(out,
              {eventRow("2025-08-25T01:00:00Z", 100, 0, 0.25), eventRow("2025-08-25T02:00:00Z", 200, 0, std::nullopt)},
              UsageTotals{}, options);

  const std::vector<std::string> written = lines(out.str());
  ASSERT_EQ(written.size(), 2u);
  const json first = json::parse(written[0]);
  const json second = json::parse(written[1]);
  EXPECT_EQ(first["ts"], "2025-08-25T01:00:00.000Z");
  EXPECT_DOUBLE_EQ(first["cost_usd"].get<double>(), 0.25);
  EXPECT_FALSE(second.contains("cost_usd"));
  EXPECT_FALSE(second.contains("model"));
}

TEST(WriterTest, TableEndsWithSumRow) {
  DailyReport report;
  report.rows.resize(1);
  report.rows[0].date = "2025-08-25";
  report.rows[0].totals.tokens.input_tokens = 4500;
  report.rows[0].totals.cost_usd = 1.0;
  report.total = report.rows[0].totals;

  WriterOptions options;
  options.border = BorderStyle::Ascii;
  std::ostringstream out;
  writeDaily(out, report, options);

  const std::vector<std::string> written = lines(out.str());
  // top rule, header, rule, one row, rule, sum, bottom rule
  ASSERT_EQ(written.size(), 7u);
  EXPECT_EQ(written.front().front(), '+');
  EXPECT_NE(written[1].find("date"), std::string::npos);
  EXPECT_NE(written[3].find("4.5k (0)"), std::string::npos);
  EXPECT_NE(written[5].find("sum"), std::string::npos);
  EXPECT_NE(written[5].find("1.00"), std::string::npos);
}

TEST(WriterTest, EventTableShowsCostColumnOnlyWhenPriced) {
  WriterOptions options;
  options.border = BorderStyle::Ascii;

  std::ostringstream unpriced;
  writeEvents(unpriced, {eventRow("2025-08-25T01:00:00Z", 100, 0, std::nullopt)}, UsageTotals{}, options);
  const std::vector<std::string> plain = lines(unpriced.str());
  ASSERT_GE(plain.size(), 2u);
  EXPECT_EQ(plain[1].find("$"), std::string::npos);
  EXPECT_NE(plain[1].find("total"), std::string::npos);

  std::ostringstream priced;
  writeEvents(priced, {eventRow("2025-08-25T01:00:00Z", 100, 0, 0.25)}, UsageTotals{}, options);
  const std::vector<std::string> costed = lines(priced.str());
  ASSERT_GE(costed.size(), 4u);
  EXPECT_NE(costed[1].find("$"), std::string::npos);
  EXPECT_NE(costed[3].find("0.25"), std::string::npos);
}

TEST(WriterTest, LiveJsonUsesNullsWhenUnavailable) {
  LiveSnapshot snapshot;
  snapshot.now = at("2025-08-25T11:00:00Z");
  snapshot.available = false;

  WriterOptions options;
  options.format = OutputFormat::Json;
  std::ostringstream out;
  writeLiveSnapshot(out, snapshot, options);

  const json object = json::parse(out.str());
  EXPECT_EQ(object["mode"], "live");
  EXPECT_EQ(object["available"], false);
  EXPECT_TRUE(object["start"].is_null());
  EXPECT_TRUE(object["end"].is_null());
  EXPECT_EQ(object["now"], "2025-08-25T11:00:00Z");
  EXPECT_EQ(object["total_tokens"], 0);
  EXPECT_FALSE(object.contains("cost_usd"));
}

TEST(WriterTest, LiveJsonDescribesActiveWindow) {
  LiveSnapshot snapshot;
  snapshot.now = at("2025-08-25T11:00:00Z");
  snapshot.available = true;
  snapshot.session.start = at("2025-08-25T07:45:00Z");
  snapshot.session.end = at("2025-08-25T12:45:00Z");
  snapshot.session.status = SessionStatus::Active;
  snapshot.duration_sec = 11700;
  snapshot.totals.tokens.input_tokens = 3000;
  snapshot.totals.cost_usd = 0.018;

  const json object = liveSnapshotJson(snapshot);
  EXPECT_EQ(object["start"], "2025-08-25T07:45:00Z");
  EXPECT_EQ(object["end"], "2025-08-25T12:45:00Z");
  EXPECT_EQ(object["duration_sec"], 11700);
  EXPECT_EQ(object["input_tokens"], 3000);
  EXPECT_DOUBLE_EQ(object["cost_usd"].get<double>(), 0.018);

  WriterOptions options;
  std::ostringstream out;
  writeLiveSnapshot(out, snapshot, options);
  EXPECT_NE(out.str().find("07:45 - 12:45"), std::string::npos);
  EXPECT_NE(out.str().find("3h 15m"), std::string::npos);
}

TEST(WriterTest, BarScalesAgainstReference) {
  EXPECT_EQ(renderBar(21.0, 42.0, 42, BorderStyle::Ascii), std::string(21, '#'));
  EXPECT_EQ(renderBar(42.0, 42.0, 42, BorderStyle::Ascii), std::string(42, '#'));
  EXPECT_EQ(renderBar(100.0, 42.0, 42, BorderStyle::Ascii), std::string(42, '#'));
  EXPECT_EQ(renderBar(0.001, 1000.0, 42, BorderStyle::Ascii), "#");
  EXPECT_EQ(renderBar(0.0, 1000.0, 42, BorderStyle::Ascii), "");
  EXPECT_EQ(renderBar(5.0, 0.0, 42, BorderStyle::Ascii), "");
  EXPECT_EQ(renderBar(1.0, 2.0, 4, BorderStyle::Unicode), "██");
  EXPECT_EQ(displayWidth("██"), 2u);
}

TEST(WriterTest, SessionBarOptionNames) {
  SessionBar bar = SessionBar::Tokens;
  EXPECT_TRUE(parseSessionBar("cost", bar));
  EXPECT_EQ(bar, SessionBar::Cost);
  EXPECT_TRUE(parseSessionBar("tokens", bar));
  EXPECT_EQ(bar, SessionBar::Tokens);
  EXPECT_FALSE(parseSessionBar("usd", bar));
}

TEST(WriterTest, LiveTableDrawsSessionBar) {
  LiveSnapshot snapshot;
  snapshot.now = at("2025-08-25T11:00:00Z");
  snapshot.available = true;
  snapshot.session.start = at("2025-08-25T07:45:00Z");
  snapshot.session.end = at("2025-08-25T12:45:00Z");
  snapshot.session.status = SessionStatus::Active;
  snapshot.totals.tokens.total_tokens = 500;
  snapshot.totals.cost_usd = 1.0;
  snapshot.rolling.tokens.total_tokens = 1000;
  snapshot.rolling.cost_usd = 4.0;

  WriterOptions options;
  options.border = BorderStyle::Ascii;
  std::ostringstream tokens;
  writeLiveSnapshot(tokens, snapshot, options);
  const std::vector<std::string> token_lines = lines(tokens.str());
  ASSERT_GE(token_lines.size(), 4u);
  EXPECT_NE(token_lines[1].find("tokens of 5h"), std::string::npos);
  EXPECT_NE(token_lines[3].find(std::string(21, '#') + " |"), std::string::npos);
  EXPECT_EQ(token_lines[3].find(std::string(22, '#')), std::string::npos);

  options.session_bar = SessionBar::Cost;
  std::ostringstream cost;
  writeLiveSnapshot(cost, snapshot, options);
  const std::vector<std::string> cost_lines = lines(cost.str());
  ASSERT_GE(cost_lines.size(), 4u);
  EXPECT_NE(cost_lines[1].find("$ of 5h"), std::string::npos);
  EXPECT_NE(cost_lines[3].find(std::string(10, '#') + " |"), std::string::npos);
  EXPECT_EQ(cost_lines[3].find(std::string(11, '#')), std::string::npos);
}

TEST(WriterTest, UnicodeBarKeepsColumnsAligned) {
  LiveSnapshot snapshot;
  snapshot.now = at("2025-08-25T11:00:00Z");
  snapshot.available = true;
  snapshot.session.start = at("2025-08-25T07:45:00Z");
  snapshot.session.end = at("2025-08-25T12:45:00Z");
  snapshot.session.status = SessionStatus::Active;
  snapshot.totals.tokens.total_tokens = 1000;
  snapshot.rolling.tokens.total_tokens = 1000;

  WriterOptions options;
  std::ostringstream out;
  writeLiveSnapshot(out, snapshot, options);
  const std::vector<std::string> rendered = lines(out.str());
  ASSERT_EQ(rendered.size(), 5u);
  for (const std::string& line : rendered) {
    EXPECT_EQ(displayWidth(line), displayWidth(rendered[0])) << line;
  }
}

TEST(WriterTest, SummaryLineUsesRawCounts) {
  UsageTotals totals;
  totals.tokens.input_tokens = 3000;
  totals.tokens.cached_input_tokens = 500;
  totals.tokens.output_tokens = 200;
  totals.tokens.reasoning_output_tokens = 50;
  totals.tokens.total_tokens = 3200;

  std::ostringstream unpriced;
  writeSummary(unpriced, totals);
  EXPECT_EQ(unpriced.str(), "summary\ti(c)=3000(500)\to(r)=200(50)\tt=3200\n");

  totals.cost_usd = 9.3;
  std::ostringstream priced;
  writeSummary(priced, totals);
  EXPECT_EQ(priced.str(), "summary\ti(c)=3000(500)\to(r)=200(50)\tt=3200\t$=9.30\n");
}

} // namespace
} // namespace usage
