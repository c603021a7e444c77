#include <dmutil/ingest/request.hpp>

#include <trantor/utils/Logger.h>

#include <sstream>

namespace dmutil::ingest {

namespace {

Json::Value ProductAccountToJson(const ProductAccount& account) {
  Json::Value json;
  json["accountType"] = AccountTypeName(account.account_type);
  json["accountId"] = account.account_id;
  return json;
}

Json::Value GrantedConsent() {
  Json::Value consent;
  consent["adUserData"] = "CONSENT_GRANTED";
  consent["adPersonalization"] = "CONSENT_GRANTED";
  return consent;
}

Json::Value CommonRequest(const Destination& destination,
                          const RequestOptions& options) {
  Json::Value request;
  Json::Value destinations(Json::arrayValue);
  destinations.append(DestinationToJson(destination));
  request["destinations"] = destinations;
  request["consent"] = GrantedConsent();
  request["encoding"] = EncodingName(options.encoding);
  request["validateOnly"] = options.validate_only;
  return request;
}

}  // namespace

Json::Value BuildUserIdentifiers(const std::vector<std::string>& emails,
                                 const std::vector<std::string>& phone_numbers,
                                 Encoding encoding) {
  Json::Value identifiers(Json::arrayValue);

  for (const auto& email : emails) {
    try {
      Json::Value identifier;
      identifier["emailAddress"] = ProcessEmailAddress(email, encoding);
      identifiers.append(identifier);
    } catch (const FormatError& e) {
      LOG_WARN << "Skipping invalid email: " << e.what();
    }
  }

  for (const auto& phone : phone_numbers) {
    try {
      Json::Value identifier;
      identifier["phoneNumber"] = ProcessPhoneNumber(phone, encoding);
      identifiers.append(identifier);
    } catch (const FormatError& e) {
      LOG_WARN << "Skipping invalid phone number: " << e.what();
    }
  }

  return identifiers;
}

Json::Value DestinationToJson(const Destination& destination) {
  Json::Value json;
  json["operatingAccount"] = ProductAccountToJson(destination.operating_account);
  if (destination.login_account) {
    json["loginAccount"] = ProductAccountToJson(*destination.login_account);
  }
  if (destination.linked_account) {
    json["linkedAccount"] = ProductAccountToJson(*destination.linked_account);
  }
  json["productDestinationId"] = destination.product_destination_id;
  return json;
}

Json::Value BuildAudienceMembersRequest(const Destination& destination,
                                        const std::vector<MemberRecord>& members,
                                        const RequestOptions& options) {
  Json::Value request = CommonRequest(destination, options);

  Json::Value audience_members(Json::arrayValue);
  for (const auto& member : members) {
    Json::Value identifiers =
        BuildUserIdentifiers(member.emails, member.phone_numbers, options.encoding);
    if (identifiers.empty()) {
      continue;
    }
    Json::Value audience_member;
    audience_member["userData"]["userIdentifiers"] = identifiers;
    audience_members.append(audience_member);
  }
  request["audienceMembers"] = audience_members;

  Json::Value terms;
  terms["customerMatchTermsOfServiceStatus"] = "ACCEPTED";
  request["termsOfService"] = terms;

  LOG_INFO << "Built audience members request with " << audience_members.size()
           << " of " << members.size() << " members";
  return request;
}

Json::Value BuildEventsRequest(const Destination& destination,
                               const std::vector<EventRecord>& events,
                               const RequestOptions& options) {
  Json::Value request = CommonRequest(destination, options);

  Json::Value events_json(Json::arrayValue);
  for (const auto& event : events) {
    Json::Value json;
    json["eventTimestamp"] = FormatTimestamp(event.timestamp);
    json["transactionId"] = event.transaction_id;
    if (event.event_source) {
      json["eventSource"] = EventSourceName(*event.event_source);
    }
    if (!event.gclid.empty()) {
      json["adIdentifiers"]["gclid"] = event.gclid;
    }
    if (!event.currency.empty()) {
      json["currency"] = event.currency;
    }
    if (event.value) {
      json["conversionValue"] = *event.value;
    }

    Json::Value identifiers =
        BuildUserIdentifiers(event.emails, event.phone_numbers, options.encoding);
    if (!identifiers.empty()) {
      json["userData"]["userIdentifiers"] = identifiers;
    }
    events_json.append(json);
  }
  request["events"] = events_json;

  LOG_INFO << "Built events request with " << events_json.size() << " events";
  return request;
}

std::string ToJsonString(const Json::Value& value, bool pretty) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = pretty ? "   " : "";
  return Json::writeString(builder, value);
}

std::string PrettyPrintJson(const std::string& text) {
  Json::Value json;
  Json::CharReaderBuilder builder;
  std::string errors;
  std::istringstream stream{text};
  if (!Json::parseFromStream(builder, stream, &json, &errors)) {
    return text;
  }
  return ToJsonString(json, true);
}

}  // namespace dmutil::ingest
