#include <dmutil/ingest/readers.hpp>
#include <dmutil/internal.hpp>

#include <json/json.h>
#include <trantor/utils/Logger.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace dmutil::ingest {

namespace {

// CSV splitter with quote handling ("" is the only escape).
std::vector<std::string> SplitCsvRow(const std::string& line) {
  std::vector<std::string> out;
  std::string cur;
  bool in_quotes = false;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (in_quotes) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        cur.push_back('"');
        ++i;
      } else if (c == '"') {
        in_quotes = false;
      } else {
        cur.push_back(c);
      }
    } else {
      if (c == '"') {
        in_quotes = true;
      } else if (c == ',') {
        out.push_back(cur);
        cur.clear();
      } else {
        cur.push_back(c);
      }
    }
  }
  out.push_back(cur);
  return out;
}

void StripCarriageReturn(std::string* line) {
  if (!line->empty() && line->back() == '\r') {
    line->pop_back();
  }
}

bool HasOpenQuote(const std::string& text) {
  return std::count(text.begin(), text.end(), '"') % 2 != 0;
}

// Read one CSV record. A quoted field may span lines; its line breaks are
// kept as '\n'.
bool ReadCsvRecord(std::istream& in, std::string* record) {
  if (!std::getline(in, *record)) {
    return false;
  }
  StripCarriageReturn(record);
  std::string next;
  while (HasOpenQuote(*record)) {
    if (!std::getline(in, next)) {
      LOG_WARN << "Unterminated quoted field at end of CSV data.";
      break;
    }
    StripCarriageReturn(&next);
    record->push_back('\n');
    record->append(next);
  }
  return true;
}

std::string ReadWholeFile(const std::string& path, const char* what) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error(std::string("Could not open ") + what + " file: " + path);
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    throw std::runtime_error(std::string("Could not read ") + what + " file: " + path);
  }
  return contents.str();
}

// Collect the string elements of an optional array member.
std::vector<std::string> StringArray(const Json::Value& record, const char* key) {
  std::vector<std::string> out;
  const Json::Value& values = record[key];
  if (values.isNull()) return out;
  if (!values.isArray()) {
    LOG_WARN << "Ignoring non-array field: " << key;
    return out;
  }
  for (const auto& v : values) {
    if (v.isString()) {
      out.push_back(v.asString());
    } else {
      LOG_WARN << "Ignoring non-string entry in " << key;
    }
  }
  return out;
}

// Value of an optional string member, or "" when absent.
std::string OptionalString(const Json::Value& record, const char* key) {
  const Json::Value& v = record[key];
  if (v.isString()) return v.asString();
  if (v.isNumeric()) return v.asString();
  return {};
}

}  // namespace

// --- Audience members (CSV) ---

std::vector<MemberRecord> ParseMemberCsv(std::string_view content) {
  std::vector<MemberRecord> members;
  std::istringstream stream{std::string(content)};

  std::string line;
  if (!ReadCsvRecord(stream, &line)) {
    return members;
  }
  const auto header = SplitCsvRow(line);

  size_t line_num = 0;
  while (ReadCsvRecord(stream, &line)) {
    ++line_num;
    const auto row = SplitCsvRow(line);

    MemberRecord member;
    for (size_t col = 0; col < row.size() && col < header.size(); ++col) {
      const std::string& field_name = header[col];
      if (field_name.empty()) {
        // Trailing field without a corresponding header.
        continue;
      }
      std::string_view value = internal::Trim(row[col]);
      if (value.empty()) {
        continue;
      }

      if (internal::StartsWith(field_name, "email_")) {
        member.emails.emplace_back(value);
      } else if (internal::StartsWith(field_name, "phone_")) {
        member.phone_numbers.emplace_back(value);
      } else {
        LOG_WARN << "Ignoring unrecognized field: " << field_name;
      }
    }

    if (!member.emails.empty() || !member.phone_numbers.empty()) {
      members.push_back(std::move(member));
    } else {
      LOG_WARN << "Ignoring line #" << line_num << ". No data.";
    }
  }

  return members;
}

std::vector<MemberRecord> ReadMemberDataFile(const std::string& path) {
  return ParseMemberCsv(ReadWholeFile(path, "CSV"));
}

// --- Events (JSON) ---

std::vector<EventRecord> ParseEventJson(std::string_view content) {
  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errors;
  std::istringstream stream{std::string(content)};

  if (!Json::parseFromStream(builder, stream, &root, &errors)) {
    throw std::runtime_error("Invalid JSON: " + errors);
  }
  if (!root.isArray()) {
    throw std::runtime_error("Expected a JSON array of events");
  }

  std::vector<EventRecord> events;
  events.reserve(root.size());

  for (const auto& record : root) {
    if (!record.isObject()) {
      LOG_WARN << "Skipping event that is not a JSON object.";
      continue;
    }

    EventRecord event;

    const Json::Value& timestamp = record["timestamp"];
    if (!timestamp.isString() || timestamp.asString().empty()) {
      LOG_WARN << "Skipping event with no timestamp.";
      continue;
    }
    if (!ParseTimestamp(timestamp.asString(), &event.timestamp)) {
      LOG_WARN << "Skipping event with invalid timestamp: " << timestamp.asString();
      continue;
    }

    event.transaction_id = OptionalString(record, "transactionId");
    if (event.transaction_id.empty()) {
      LOG_WARN << "Skipping event with no transaction ID";
      continue;
    }

    std::string source = OptionalString(record, "eventSource");
    if (!source.empty()) {
      EventSource parsed;
      if (!ParseEventSource(source, &parsed)) {
        LOG_WARN << "Skipping event with invalid event source: " << source;
        continue;
      }
      event.event_source = parsed;
    }

    event.gclid = OptionalString(record, "gclid");
    event.currency = OptionalString(record, "currency");

    const Json::Value& value = record["value"];
    if (!value.isNull()) {
      if (!value.isNumeric()) {
        LOG_WARN << "Skipping event with non-numeric value: "
                 << event.transaction_id;
        continue;
      }
      event.value = value.asDouble();
    }

    event.emails = StringArray(record, "emails");
    event.phone_numbers = StringArray(record, "phoneNumbers");

    events.push_back(std::move(event));
  }

  return events;
}

std::vector<EventRecord> ReadEventDataFile(const std::string& path) {
  std::string content = ReadWholeFile(path, "JSON");
  try {
    return ParseEventJson(content);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error("Invalid JSON in file " + path + ": " + e.what());
  }
}

}  // namespace dmutil::ingest
