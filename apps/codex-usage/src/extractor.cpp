#include "extractor.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <utility>
#include <vector>

#include "timestamp.hpp"

namespace usage
{

  namespace
  {

    constexpr const char *kEventTarget = "handle_codex_event:";

    struct PayloadField
    {
      std::string key;
      std::string value;
    };

    bool isSpace(char c)
    {
      return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    bool isIdentChar(char c)
    {
      return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    }

    std::size_t skipSpaces(const std::string &text, std::size_t pos)
    {
      while (pos < text.size() && isSpace(text[pos]))
      {
        pos += 1;
      }
      return pos;
    }

    std::string trim(const std::string &text)
    {
      const std::size_t begin = skipSpaces(text, 0);
      std::size_t end = text.size();
      while (end > begin && isSpace(text[end - 1]))
      {
        end -= 1;
      }
      return text.substr(begin, end - begin);
    }

    std::string toLower(std::string text)
    {
      for (char &c : text)
      {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      }
      return text;
    }

    // Finds the '}' closing the '{' at `open`, honouring nested brackets and
    // quoted strings. Returns npos when the structure is unbalanced.
    std::size_t findClosingBrace(const std::string &text, std::size_t open)
    {
      std::vector<char> stack;
      bool in_string = false;
      for (std::size_t i = open; i < text.size(); i += 1)
      {
        const char c = text[i];
        if (in_string)
        {
          if (c == '\\')
          {
            i += 1;
          }
          else if (c == '"')
          {
            in_string = false;
          }
          continue;
        }
        switch (c)
        {
        case '"':
          in_string = true;
          break;
        case '{':
          stack.push_back('}');
          break;
        case '(':
          stack.push_back(')');
          break;
        case '[':
          stack.push_back(']');
          break;
        case '}':
        case ')':
        case ']':
          if (stack.empty() || stack.back() != c)
          {
            return std::string::npos;
          }
          stack.pop_back();
          if (stack.empty())
          {
            return c == '}' ? i : std::string::npos;
          }
          break;
        default:
          break;
        }
      }
      return std::string::npos;
    }

    // Splits `key: value, key: value` on top-level commas.
    bool splitFields(const std::string &body, std::vector<PayloadField> &out)
    {
      std::vector<std::string> parts;
      std::string current;
      int depth = 0;
      bool in_string = false;
      for (std::size_t i = 0; i < body.size(); i += 1)
      {
        const char c = body[i];
        if (in_string)
        {
          current.push_back(c);
          if (c == '\\' && i + 1 < body.size())
          {
            current.push_back(body[i + 1]);
            i += 1;
          }
          else if (c == '"')
          {
            in_string = false;
          }
          continue;
        }
        if (c == '"')
        {
          in_string = true;
        }
        else if (c == '{' || c == '(' || c == '[')
        {
          depth += 1;
        }
        else if (c == '}' || c == ')' || c == ']')
        {
          depth -= 1;
        }
        else if (c == ',' && depth == 0)
        {
          parts.push_back(current);
          current.clear();
          continue;
        }
        current.push_back(c);
      }
      if (in_string || depth != 0)
      {
        return false;
      }
      parts.push_back(current);

      for (const std::string &part : parts)
      {
        const std::string field = trim(part);
        if (field.empty())
        {
          continue;
        }
        const std::size_t colon = field.find(':');
        if (colon == std::string::npos)
        {
          return false;
        }
        PayloadField parsed;
        parsed.key = trim(field.substr(0, colon));
        parsed.value = trim(field.substr(colon + 1));
        if (parsed.key.empty())
        {
          return false;
        }
        for (char c : parsed.key)
        {
          if (!isIdentChar(c))
          {
            return false;
          }
        }
        out.push_back(std::move(parsed));
      }
      return true;
    }

    // Strips one `Some(...)` wrapper.
    std::string unwrapSome(const std::string &value)
    {
      if (value.size() >= 6 && value.compare(0, 5, "Some(") == 0 && value.back() == ')')
      {
        return trim(value.substr(5, value.size() - 6));
      }
      return value;
    }

    bool parseCount(const std::string &raw, std::int64_t &out)
    {
      const std::string value = unwrapSome(raw);
      if (value == "None")
      {
        out = 0;
        return true;
      }
      if (value.empty())
      {
        return false;
      }
      for (char c : value)
      {
        if (!std::isdigit(static_cast<unsigned char>(c)))
        {
          return false;
        }
      }
      errno = 0;
      char *end = nullptr;
      const long long parsed = std::strtoll(value.c_str(), &end, 10);
      if (errno == ERANGE || end == value.c_str() || *end != '\0')
      {
        return false;
      }
      out = static_cast<std::int64_t>(parsed);
      return true;
    }

    bool parseQuoted(const std::string &raw, std::string &out)
    {
      const std::string value = unwrapSome(raw);
      if (value.size() < 2 || value.front() != '"' || value.back() != '"')
      {
        return false;
      }
      out.clear();
      for (std::size_t i = 1; i + 1 < value.size(); i += 1)
      {
        if (value[i] == '\\' && i + 2 < value.size())
        {
          i += 1;
        }
        out.push_back(value[i]);
      }
      return true;
    }

    const PayloadField *findField(const std::vector<PayloadField> &fields, const std::vector<const char *> &names)
    {
      for (const char *name : names)
      {
        for (const PayloadField &field : fields)
        {
          if (field.key == name)
          {
            return &field;
          }
        }
      }
      return nullptr;
    }

    // Optional counts default to zero; required ones must be present.
    bool extractCount(const std::vector<PayloadField> &fields, const std::vector<const char *> &names,
                      bool required, std::int64_t &out)
    {
      const PayloadField *field = findField(fields, names);
      if (field == nullptr)
      {
        out = 0;
        return !required;
      }
      return parseCount(field->value, out);
    }

    // Accepts `(TokenUsage { ... })` and fills the counts and optional model.
    bool parseTokenUsage(const std::string &rest, ParsedRecord &out)
    {
      std::size_t pos = skipSpaces(rest, 0);
      if (pos >= rest.size() || rest[pos] != '(')
      {
        return false;
      }
      pos = skipSpaces(rest, pos + 1);
      const std::string type_name = "TokenUsage";
      if (rest.compare(pos, type_name.size(), type_name) != 0)
      {
        return false;
      }
      pos = skipSpaces(rest, pos + type_name.size());
      if (pos >= rest.size() || rest[pos] != '{')
      {
        return false;
      }
      const std::size_t close = findClosingBrace(rest, pos);
      if (close == std::string::npos)
      {
        return false;
      }
      std::size_t tail = skipSpaces(rest, close + 1);
      if (tail >= rest.size() || rest[tail] != ')')
      {
        return false;
      }
      // Continuation lines appended after the closing ')' belong to other
      // writers; only the remainder of its own line must be blank.
      std::size_t line_end = rest.find('\n', tail + 1);
      if (line_end == std::string::npos)
      {
        line_end = rest.size();
      }
      for (std::size_t i = tail + 1; i < line_end; i += 1)
      {
        if (!isSpace(rest[i]))
        {
          return false;
        }
      }

      std::vector<PayloadField> fields;
      if (!splitFields(rest.substr(pos + 1, close - pos - 1), fields))
      {
        return false;
      }

      TokenCounts tokens;
      if (!extractCount(fields, {"input_tokens", "prompt_tokens", "prompt_input_tokens", "tokens_in"}, true,
                        tokens.input_tokens))
      {
        return false;
      }
      if (!extractCount(fields,
                        {"cached_input_tokens", "prompt_cached", "cache_read_tokens", "cache_read", "cached_tokens",
                         "cached_prompt_tokens"},
                        false, tokens.cached_input_tokens))
      {
        return false;
      }
      if (!extractCount(fields, {"output_tokens", "completion_tokens", "tokens_out"}, true, tokens.output_tokens))
      {
        return false;
      }
      if (!extractCount(fields, {"reasoning_output_tokens", "reasoning_tokens"}, false,
                        tokens.reasoning_output_tokens))
      {
        return false;
      }
      if (findField(fields, {"total_tokens", "total"}) == nullptr)
      {
        if (tokens.input_tokens > std::numeric_limits<std::int64_t>::max() - tokens.output_tokens)
        {
          return false;
        }
        tokens.total_tokens = tokens.input_tokens + tokens.output_tokens;
      }
      else if (!extractCount(fields, {"total_tokens", "total"}, true, tokens.total_tokens))
      {
        return false;
      }

      out.model.reset();
      const PayloadField *model = findField(fields, {"model"});
      if (model != nullptr && model->value != "None")
      {
        std::string name;
        if (!parseQuoted(model->value, name))
        {
          return false;
        }
        if (!name.empty())
        {
          out.model = name;
        }
      }
      out.tokens = tokens;
      return true;
    }

    bool mentionsUsageLimit(const std::string &rest)
    {
      const std::string lowered = toLower(rest);
      std::size_t pos = 0;
      while ((pos = lowered.find("usage", pos)) != std::string::npos)
      {
        std::size_t next = pos + 5;
        const std::size_t after_space = skipSpaces(lowered, next);
        if (after_space > next && lowered.compare(after_space, 5, "limit") == 0)
        {
          return true;
        }
        pos = next;
      }
      return false;
    }

    std::optional<std::string> findConfiguredModel(const std::string &rest)
    {
      const std::size_t key = rest.find("model:");
      if (key == std::string::npos)
      {
        return std::nullopt;
      }
      const std::size_t open = rest.find('"', key + 6);
      if (open == std::string::npos || trim(rest.substr(key + 6, open - key - 6)) != "")
      {
        return std::nullopt;
      }
      const std::size_t close = rest.find('"', open + 1);
      if (close == std::string::npos || close == open + 1)
      {
        return std::nullopt;
      }
      return rest.substr(open + 1, close - open - 1);
    }

    bool isTrackedEvent(const std::string &name)
    {
      return name == "TokenCount" || name == "TaskStarted" || name == "ExecCommandBegin" || name == "Error" ||
             name == "SessionConfigured";
    }

  } // namespace

  std::string stripAnsi(const std::string &line)
  {
    std::string out;
    out.reserve(line.size());
    for (std::size_t i = 0; i < line.size(); i += 1)
    {
      if (line[i] == '\x1b' && i + 1 < line.size() && line[i + 1] == '[')
      {
        std::size_t j = i + 2;
        while (j < line.size() && (std::isdigit(static_cast<unsigned char>(line[j])) || line[j] == ';'))
        {
          j += 1;
        }
        if (j < line.size() && std::isalpha(static_cast<unsigned char>(line[j])))
        {
          i = j;
          continue;
        }
      }
      out.push_back(line[i]);
    }
    if (!out.empty() && out.back() == '\r')
    {
      out.pop_back();
    }
    return out;
  }

  bool startsWithTimestamp(const std::string &line)
  {
    if (line.size() < 11)
    {
      return false;
    }
    for (std::size_t i = 0; i < 10; i += 1)
    {
      const bool dash = i == 4 || i == 7;
      if (dash ? line[i] != '-' : !std::isdigit(static_cast<unsigned char>(line[i])))
      {
        return false;
      }
    }
    return line[10] == 'T';
  }

  std::optional<std::string> RecordAssembler::push(const std::string &line)
  {
    std::string clean = stripAnsi(line);
    if (startsWithTimestamp(clean))
    {
      std::optional<std::string> completed;
      if (has_pending_)
      {
        completed = std::move(pending_);
      }
      pending_ = std::move(clean);
      has_pending_ = true;
      return completed;
    }

    // A continuation before any record has nothing to attach to.
    if (has_pending_ && pending_.size() + 1 + clean.size() <= kMaxRecordBytes)
    {
      pending_.push_back('\n');
      pending_ += clean;
    }
    return std::nullopt;
  }

  std::optional<std::string> RecordAssembler::flush()
  {
    if (!has_pending_)
    {
      return std::nullopt;
    }
    has_pending_ = false;
    std::optional<std::string> completed = std::move(pending_);
    pending_.clear();
    return completed;
  }

  ExtractStatus extractRecord(const std::string &record, ParsedRecord &out)
  {
    std::size_t ts_end = 0;
    while (ts_end < record.size() && !isSpace(record[ts_end]))
    {
      ts_end += 1;
    }
    if (ts_end == 0 || ts_end == record.size())
    {
      return ExtractStatus::Ignored;
    }

    std::size_t pos = skipSpaces(record, ts_end);
    const std::size_t level_start = pos;
    while (pos < record.size() && std::isalpha(static_cast<unsigned char>(record[pos])))
    {
      pos += 1;
    }
    if (pos == level_start || pos >= record.size() || !isSpace(record[pos]))
    {
      return ExtractStatus::Ignored;
    }
    pos = skipSpaces(record, pos);

    const std::string target = kEventTarget;
    if (record.compare(pos, target.size(), target) != 0)
    {
      return ExtractStatus::Ignored;
    }
    pos = skipSpaces(record, pos + target.size());

    const std::size_t name_start = pos;
    while (pos < record.size() && isIdentChar(record[pos]))
    {
      pos += 1;
    }
    const std::string name = record.substr(name_start, pos - name_start);
    if (!isTrackedEvent(name))
    {
      return ExtractStatus::Ignored;
    }
    const std::string rest = record.substr(pos);

    ParsedRecord parsed;
    if (!parseIsoTimestamp(record.substr(0, ts_end), parsed.timestamp))
    {
      return ExtractStatus::Malformed;
    }

    if (name == "TokenCount")
    {
      parsed.kind = RecordKind::TokenCount;
      if (!parseTokenUsage(rest, parsed))
      {
        return ExtractStatus::Malformed;
      }
    }
    else if (name == "TaskStarted" || name == "ExecCommandBegin")
    {
      const std::size_t next = skipSpaces(rest, 0);
      if (next < rest.size() && rest[next] != '(')
      {
        return ExtractStatus::Malformed;
      }
      parsed.kind = name == "TaskStarted" ? RecordKind::TaskStarted : RecordKind::ExecCommandBegin;
    }
    else if (name == "Error")
    {
      if (!mentionsUsageLimit(rest))
      {
        return ExtractStatus::Ignored;
      }
      parsed.kind = RecordKind::UsageLimit;
    }
    else
    {
      parsed.kind = RecordKind::SessionConfigured;
      parsed.model = findConfiguredModel(rest);
    }

    out = std::move(parsed);
    return ExtractStatus::Accepted;
  }

  EventExtractor::EventExtractor(Metrics &metrics) : metrics_(metrics) {}

  std::optional<ParsedRecord> EventExtractor::pushLine(const std::string &line)
  {
    std::optional<std::string> record = assembler_.push(line);
    if (!record)
    {
      return std::nullopt;
    }
    return process(*record);
  }

  std::optional<ParsedRecord> EventExtractor::finish()
  {
    std::optional<std::string> record = assembler_.flush();
    if (!record)
    {
      return std::nullopt;
    }
    return process(*record);
  }

  std::optional<ParsedRecord> EventExtractor::process(const std::string &record)
  {
    StageTimer timer(metrics_, &Metrics::addExtractProcessing);
    metrics_.incrementRecords();

    ParsedRecord parsed;
    const ExtractStatus status = extractRecord(record, parsed);
    if (status == ExtractStatus::Malformed)
    {
      metrics_.incrementSkipped();
      return std::nullopt;
    }
    if (status == ExtractStatus::Ignored)
    {
      return std::nullopt;
    }

    switch (parsed.kind)
    {
    case RecordKind::SessionConfigured:
      if (parsed.model)
      {
        current_model_ = parsed.model;
      }
      break;
    case RecordKind::UsageLimit:
      metrics_.incrementUsageLimits();
      break;
    case RecordKind::TokenCount:
      metrics_.incrementTokenEvents();
      metrics_.incrementActivity();
      if (!parsed.model)
      {
        parsed.model = current_model_;
      }
      break;
    case RecordKind::TaskStarted:
    case RecordKind::ExecCommandBegin:
      metrics_.incrementActivity();
      break;
    }
    return parsed;
  }

} // namespace usage
