#include <dmutil/formatter.hpp>
#include <dmutil/internal.hpp>

#include <algorithm>
#include <regex>

namespace dmutil {

namespace {

// Honorific prefix, removed from every position in a single pass.
const std::regex& GivenNamePrefixPattern() {
  static const std::regex kPattern(R"((?:mr|mrs|ms|dr)\.(?:\s|$))",
                                   std::regex::ECMAScript | std::regex::icase);
  return kPattern;
}

constexpr std::string_view kFamilyNameSuffixes[] = {
    "jr.", "sr.", "2nd", "3rd", "ii", "iii", "iv", "v", "vi",
    "cpa", "dc", "dds", "vm", "jd", "md", "phd"};

// Finds a trailing suffix token with its comma/whitespace separator in a
// lowercased name, scanning backwards from the end. Returns the offset where
// the separator starts, or npos.
size_t FindFamilyNameSuffix(std::string_view name) {
  size_t end = name.size();
  if (end > 0 && internal::IsWhitespace(name[end - 1])) --end;

  for (std::string_view suffix : kFamilyNameSuffixes) {
    if (suffix.size() > end ||
        name.compare(end - suffix.size(), suffix.size(), suffix) != 0) {
      continue;
    }
    size_t token_start = end - suffix.size();
    size_t sep_start = token_start;
    while (sep_start > 0 && internal::IsWhitespace(name[sep_start - 1])) {
      --sep_start;
    }
    if (sep_start > 0 && name[sep_start - 1] == ',') return sep_start - 1;
    if (sep_start < token_start) return sep_start;
  }
  return std::string_view::npos;
}

bool IsGmailDomain(std::string_view domain) {
  return domain == "gmail.com" || domain == "googlemail.com";
}

std::string HashAndEncode(std::string_view normalized, Encoding encoding) {
  return Encode(HashString(normalized), encoding);
}

}  // namespace

const char* FormatErrorCodeName(FormatErrorCode code) {
  switch (code) {
    case FormatErrorCode::kEmptyInput:
      return "EmptyInput";
    case FormatErrorCode::kInvalidFormat:
      return "InvalidFormat";
    case FormatErrorCode::kEmptyLocalPart:
      return "EmptyLocalPart";
    case FormatErrorCode::kEmptyDomain:
      return "EmptyDomain";
    case FormatErrorCode::kEmptyLocalPartAfterNormalization:
      return "EmptyLocalPartAfterNormalization";
    case FormatErrorCode::kNoDigits:
      return "NoDigits";
    case FormatErrorCode::kInvalidLength:
      return "InvalidLength";
    case FormatErrorCode::kInvalidCharacters:
      return "InvalidCharacters";
    case FormatErrorCode::kConsistsSolelyOfPrefix:
      return "ConsistsSolelyOfPrefix";
    case FormatErrorCode::kConsistsSolelyOfSuffix:
      return "ConsistsSolelyOfSuffix";
  }
  return "Unknown";
}

FormatError::FormatError(FormatErrorCode code, const std::string& message)
    : std::invalid_argument(message), code_(code) {}

// --- Normalization ---

std::string FormatEmailAddress(std::string_view email) {
  std::string_view trimmed = internal::Trim(email);
  if (trimmed.empty()) {
    throw FormatError(FormatErrorCode::kEmptyInput,
                      "Email address is blank or empty.");
  }
  if (std::any_of(trimmed.begin(), trimmed.end(), internal::IsWhitespace)) {
    throw FormatError(FormatErrorCode::kInvalidFormat,
                      "Email address contains intermediate whitespace.");
  }

  std::string lowered = internal::ToLowerAscii(trimmed);
  size_t at = lowered.find('@');
  if (at == std::string::npos || lowered.find('@', at + 1) != std::string::npos) {
    throw FormatError(FormatErrorCode::kInvalidFormat,
                      "Email is not of the form user@domain.");
  }

  std::string user = lowered.substr(0, at);
  std::string domain = lowered.substr(at + 1);

  if (user.empty()) {
    throw FormatError(FormatErrorCode::kEmptyLocalPart,
                      "Email address without the domain is empty.");
  }
  if (domain.empty()) {
    throw FormatError(FormatErrorCode::kEmptyDomain,
                      "Domain of email address is empty.");
  }

  if (IsGmailDomain(domain)) {
    // Gmail ignores periods in the local part.
    user.erase(std::remove(user.begin(), user.end(), '.'), user.end());
    if (user.empty()) {
      throw FormatError(
          FormatErrorCode::kEmptyLocalPartAfterNormalization,
          "Email address without the domain is empty after normalization.");
    }
  }

  return user + "@" + domain;
}

std::string FormatPhoneNumber(std::string_view phone) {
  std::string compact;
  compact.reserve(phone.size());
  for (char c : phone) {
    if (c != ' ') compact.push_back(c);
  }
  if (compact.empty()) {
    throw FormatError(FormatErrorCode::kEmptyInput,
                      "Phone number is blank or empty.");
  }

  std::string digits;
  digits.reserve(compact.size() + 1);
  digits.push_back('+');
  for (char c : compact) {
    if (c >= '0' && c <= '9') digits.push_back(c);
  }
  if (digits.size() == 1) {
    throw FormatError(FormatErrorCode::kNoDigits,
                      "Phone number contains no digits.");
  }
  return digits;
}

std::string FormatRegionCode(std::string_view region_code) {
  std::string code = internal::ToUpperAscii(internal::Trim(region_code));
  if (code.size() != 2) {
    throw FormatError(FormatErrorCode::kInvalidLength,
                      "Region code must be two characters.");
  }
  for (char c : code) {
    if (c < 'A' || c > 'Z') {
      throw FormatError(FormatErrorCode::kInvalidCharacters,
                        "Region code contains characters other than A-Z.");
    }
  }
  return code;
}

std::string FormatGivenName(std::string_view given_name) {
  std::string name = internal::ToLowerAscii(internal::Trim(given_name));
  if (name.empty()) {
    throw FormatError(FormatErrorCode::kEmptyInput,
                      "Given name is blank or empty.");
  }

  name = std::regex_replace(name, GivenNamePrefixPattern(), "");
  name = std::string(internal::Trim(name));
  if (name.empty()) {
    throw FormatError(FormatErrorCode::kConsistsSolelyOfPrefix,
                      "Given name consists solely of a prefix.");
  }
  return name;
}

std::string FormatFamilyName(std::string_view family_name) {
  std::string name = internal::ToLowerAscii(internal::Trim(family_name));
  if (name.empty()) {
    throw FormatError(FormatErrorCode::kEmptyInput,
                      "Family name is blank or empty.");
  }

  // Suffixes can be chained ("quinn, jr., dds"), so strip until none match.
  for (size_t pos = FindFamilyNameSuffix(name); pos != std::string::npos;
       pos = FindFamilyNameSuffix(name)) {
    name.erase(pos);
  }
  if (name.empty()) {
    throw FormatError(FormatErrorCode::kConsistsSolelyOfSuffix,
                      "Family name consists solely of a suffix.");
  }
  return name;
}

// --- Hashing and encoding ---

Digest HashString(std::string_view s) {
  std::string_view trimmed = internal::Trim(s);
  if (trimmed.empty()) {
    throw FormatError(FormatErrorCode::kEmptyInput, "String is blank or empty.");
  }
  return internal::Sha256::Digest(trimmed);
}

std::string HexEncode(std::string_view bytes) {
  if (bytes.empty()) {
    throw FormatError(FormatErrorCode::kEmptyInput, "Bytes empty.");
  }
  return internal::ToHex(bytes);
}

std::string HexEncode(const Digest& digest) {
  return HexEncode(internal::AsBytes(digest.data(), digest.size()));
}

std::string Base64Encode(std::string_view bytes) {
  if (bytes.empty()) {
    throw FormatError(FormatErrorCode::kEmptyInput, "Bytes empty.");
  }
  return internal::ToBase64(bytes);
}

std::string Base64Encode(const Digest& digest) {
  return Base64Encode(internal::AsBytes(digest.data(), digest.size()));
}

std::string Encode(const Digest& digest, Encoding encoding) {
  switch (encoding) {
    case Encoding::kHex:
      return HexEncode(digest);
    case Encoding::kBase64:
      return Base64Encode(digest);
  }
  throw std::invalid_argument("Unknown encoding");
}

// --- Process ---

std::string ProcessEmailAddress(std::string_view email, Encoding encoding) {
  return HashAndEncode(FormatEmailAddress(email), encoding);
}

std::string ProcessPhoneNumber(std::string_view phone, Encoding encoding) {
  return HashAndEncode(FormatPhoneNumber(phone), encoding);
}

std::string ProcessGivenName(std::string_view given_name, Encoding encoding) {
  return HashAndEncode(FormatGivenName(given_name), encoding);
}

std::string ProcessFamilyName(std::string_view family_name, Encoding encoding) {
  return HashAndEncode(FormatFamilyName(family_name), encoding);
}

std::string ProcessRegionCode(std::string_view region_code) {
  return FormatRegionCode(region_code);
}

bool ParseEncoding(std::string_view name, Encoding* out) {
  std::string lowered = internal::ToLowerAscii(name);
  if (lowered == "hex") {
    *out = Encoding::kHex;
    return true;
  }
  if (lowered == "base64") {
    *out = Encoding::kBase64;
    return true;
  }
  return false;
}

const char* EncodingName(Encoding encoding) {
  switch (encoding) {
    case Encoding::kHex:
      return "HEX";
    case Encoding::kBase64:
      return "BASE64";
  }
  return "ENCODING_UNSPECIFIED";
}

}  // namespace dmutil
