#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dmutil {

/** Output form of a hashed identifier. */
enum class Encoding {
  kHex,     // Lowercase hex, 64 characters
  kBase64   // Standard base64 with '=' padding, 44 characters
};

/** Reason a value was rejected by one of the Format* functions. */
enum class FormatErrorCode {
  kEmptyInput,                         // Empty or whitespace-only input
  kInvalidFormat,                      // Missing/extra '@', inner whitespace
  kEmptyLocalPart,                     // Nothing before '@'
  kEmptyDomain,                        // Nothing after '@'
  kEmptyLocalPartAfterNormalization,   // Gmail local part was only periods
  kNoDigits,                           // Phone number without any digit
  kInvalidLength,                      // Region code is not 2 characters
  kInvalidCharacters,                  // Region code outside A-Z
  kConsistsSolelyOfPrefix,             // Given name was only an honorific
  kConsistsSolelyOfSuffix              // Family name was only suffixes
};

/** Stable name of an error code, e.g. "EmptyLocalPart". */
const char* FormatErrorCodeName(FormatErrorCode code);

/**
 * Validation failure raised by the formatting, hashing and encoding
 * functions. Always caller-correctable; never retryable.
 */
class FormatError : public std::invalid_argument {
 public:
  FormatError(FormatErrorCode code, const std::string& message);

  FormatErrorCode code() const noexcept { return code_; }

 private:
  FormatErrorCode code_;
};

/** Raw SHA-256 digest. */
using Digest = std::array<uint8_t, 32>;

// ---------------------------------------------------------------------------
// Normalization
// ---------------------------------------------------------------------------

/**
 * Normalize an email address.
 *
 * Trims, rejects inner whitespace, lowercases and splits on '@'. For
 * gmail.com and googlemail.com every '.' is removed from the local part.
 *
 * @throws FormatError kEmptyInput, kInvalidFormat, kEmptyLocalPart,
 *         kEmptyDomain or kEmptyLocalPartAfterNormalization.
 */
std::string FormatEmailAddress(std::string_view email);

/**
 * Normalize a phone number to '+' followed by its digits.
 * No length or country code validation is done.
 *
 * @throws FormatError kEmptyInput or kNoDigits.
 */
std::string FormatPhoneNumber(std::string_view phone);

/**
 * Normalize a two-letter region code to uppercase.
 * @throws FormatError kInvalidLength or kInvalidCharacters.
 */
std::string FormatRegionCode(std::string_view region_code);

/**
 * Lowercase a given name and drop honorifics (mr., mrs., ms., dr.).
 * An honorific needs its trailing '.', so "Mralex" is kept as "mralex".
 *
 * @throws FormatError kEmptyInput or kConsistsSolelyOfPrefix.
 */
std::string FormatGivenName(std::string_view given_name);

/**
 * Lowercase a family name and strip trailing suffixes ("jr.", "dds", ...)
 * until none remain. A suffix must be preceded by a comma or whitespace.
 *
 * @throws FormatError kEmptyInput or kConsistsSolelyOfSuffix.
 */
std::string FormatFamilyName(std::string_view family_name);

// ---------------------------------------------------------------------------
// Hashing and encoding
// ---------------------------------------------------------------------------

/**
 * SHA-256 of the trimmed input.
 * @throws FormatError kEmptyInput if the input is blank.
 */
Digest HashString(std::string_view s);

/** @throws FormatError kEmptyInput if bytes is empty. */
std::string HexEncode(std::string_view bytes);
std::string HexEncode(const Digest& digest);

/** @throws FormatError kEmptyInput if bytes is empty. */
std::string Base64Encode(std::string_view bytes);
std::string Base64Encode(const Digest& digest);

std::string Encode(const Digest& digest, Encoding encoding);

// ---------------------------------------------------------------------------
// Format, hash and encode in one step
// ---------------------------------------------------------------------------

std::string ProcessEmailAddress(std::string_view email, Encoding encoding);
std::string ProcessPhoneNumber(std::string_view phone, Encoding encoding);
std::string ProcessGivenName(std::string_view given_name, Encoding encoding);
std::string ProcessFamilyName(std::string_view family_name, Encoding encoding);

// Region codes are sent in clear text: formatted, not hashed.
std::string ProcessRegionCode(std::string_view region_code);

/** Parse "hex" or "base64" (case-insensitive). Returns false otherwise. */
bool ParseEncoding(std::string_view name, Encoding* out);

/** "HEX" or "BASE64", as the ingestion API spells it. */
const char* EncodingName(Encoding encoding);

}  // namespace dmutil
