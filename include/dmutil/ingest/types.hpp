#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace dmutil::ingest {

/** Kind of product account a destination refers to. */
enum class AccountType {
  kGoogleAds,
  kDisplayVideoPartner,
  kDisplayVideoAdvertiser,
  kDataPartner
};

/** Parse the wire name ("GOOGLE_ADS", ...). Returns false if unknown. */
bool ParseAccountType(std::string_view name, AccountType* out);
const char* AccountTypeName(AccountType type);

struct ProductAccount {
  AccountType account_type = AccountType::kGoogleAds;
  std::string account_id;
};

/**
 * Where ingested data goes. product_destination_id is the audience ID for
 * audience members and the conversion action ID for events.
 */
struct Destination {
  ProductAccount operating_account;
  std::optional<ProductAccount> login_account;
  std::optional<ProductAccount> linked_account;
  std::string product_destination_id;
};

/** Origin of a conversion event. */
enum class EventSource {
  kWeb,
  kApp,
  kInStore,
  kPhone,
  kOther
};

bool ParseEventSource(std::string_view name, EventSource* out);
const char* EventSourceName(EventSource source);

}  // namespace dmutil::ingest
