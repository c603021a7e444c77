#include <dmutil/ingest/types.hpp>

namespace dmutil::ingest {

namespace {

struct AccountTypeEntry {
  AccountType type;
  const char* name;
};

constexpr AccountTypeEntry kAccountTypes[] = {
    {AccountType::kGoogleAds, "GOOGLE_ADS"},
    {AccountType::kDisplayVideoPartner, "DISPLAY_VIDEO_PARTNER"},
    {AccountType::kDisplayVideoAdvertiser, "DISPLAY_VIDEO_ADVERTISER"},
    {AccountType::kDataPartner, "DATA_PARTNER"},
};

struct EventSourceEntry {
  EventSource source;
  const char* name;
};

constexpr EventSourceEntry kEventSources[] = {
    {EventSource::kWeb, "WEB"},
    {EventSource::kApp, "APP"},
    {EventSource::kInStore, "IN_STORE"},
    {EventSource::kPhone, "PHONE"},
    {EventSource::kOther, "OTHER"},
};

}  // namespace

bool ParseAccountType(std::string_view name, AccountType* out) {
  for (const auto& entry : kAccountTypes) {
    if (name == entry.name) {
      *out = entry.type;
      return true;
    }
  }
  return false;
}

const char* AccountTypeName(AccountType type) {
  for (const auto& entry : kAccountTypes) {
    if (entry.type == type) return entry.name;
  }
  return "ACCOUNT_TYPE_UNSPECIFIED";
}

bool ParseEventSource(std::string_view name, EventSource* out) {
  for (const auto& entry : kEventSources) {
    if (name == entry.name) {
      *out = entry.source;
      return true;
    }
  }
  return false;
}

const char* EventSourceName(EventSource source) {
  for (const auto& entry : kEventSources) {
    if (entry.source == source) return entry.name;
  }
  return "EVENT_SOURCE_UNSPECIFIED";
}

}  // namespace dmutil::ingest
