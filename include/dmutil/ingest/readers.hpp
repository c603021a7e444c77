#pragma once

#include <dmutil/ingest/timestamp.hpp>
#include <dmutil/ingest/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dmutil::ingest {

/** Raw identifiers of one audience member, before formatting. */
struct MemberRecord {
  std::vector<std::string> emails;
  std::vector<std::string> phone_numbers;
};

/** One conversion event as read from the data file, before formatting. */
struct EventRecord {
  Timestamp timestamp;
  std::string transaction_id;
  std::optional<EventSource> event_source;
  std::string gclid;
  std::string currency;
  std::optional<double> value;
  std::vector<std::string> emails;
  std::vector<std::string> phone_numbers;
};

/**
 * Parse comma-separated member data.
 *
 * The first line is a header. Columns named "email_..." hold email
 * addresses and "phone_..." phone numbers; other columns are ignored.
 * Values are trimmed and blank values skipped. Rows without any value are
 * dropped with a warning. Quoted fields may contain commas, "" escapes and
 * line breaks.
 */
std::vector<MemberRecord> ParseMemberCsv(std::string_view content);

/** @throws std::runtime_error if the file cannot be read. */
std::vector<MemberRecord> ReadMemberDataFile(const std::string& path);

/**
 * Parse a JSON array of event objects.
 *
 * Events with a missing or invalid timestamp, a missing transactionId, an
 * unknown eventSource or a non-numeric value are dropped with a warning.
 *
 * @throws std::runtime_error if the content is not a JSON array.
 */
std::vector<EventRecord> ParseEventJson(std::string_view content);

/** @throws std::runtime_error if the file cannot be read or parsed. */
std::vector<EventRecord> ReadEventDataFile(const std::string& path);

}  // namespace dmutil::ingest
