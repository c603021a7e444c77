#pragma once

#include <dmutil/formatter.hpp>
#include <dmutil/ingest/readers.hpp>
#include <dmutil/ingest/types.hpp>

#include <json/json.h>

#include <string>
#include <vector>

namespace dmutil::ingest {

/** Request-wide settings shared by both ingestion requests. */
struct RequestOptions {
  Encoding encoding = Encoding::kHex;
  bool validate_only = true;
};

/**
 * Build the userIdentifiers array for a set of raw emails and phone numbers.
 * Identifiers that fail formatting are logged and skipped.
 */
Json::Value BuildUserIdentifiers(const std::vector<std::string>& emails,
                                 const std::vector<std::string>& phone_numbers,
                                 Encoding encoding);

Json::Value DestinationToJson(const Destination& destination);

/**
 * Build an IngestAudienceMembersRequest body. Members left without any
 * valid identifier are omitted.
 */
Json::Value BuildAudienceMembersRequest(const Destination& destination,
                                        const std::vector<MemberRecord>& members,
                                        const RequestOptions& options);

/**
 * Build an IngestEventsRequest body. Events without a valid identifier are
 * kept, without userData.
 */
Json::Value BuildEventsRequest(const Destination& destination,
                               const std::vector<EventRecord>& events,
                               const RequestOptions& options);

/** Serialize a request body; pretty adds three-space indentation. */
std::string ToJsonString(const Json::Value& value, bool pretty);

/** Re-indent a JSON document; text that is not JSON is returned unchanged. */
std::string PrettyPrintJson(const std::string& text);

}  // namespace dmutil::ingest
