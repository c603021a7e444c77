#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <openssl/evp.h>

namespace dmutil::internal {

// SHA-256 wrapper using OpenSSL's EVP API.
class Sha256 {
 public:
  static constexpr size_t kDigestBytes = 32;

  using DigestBytes = std::array<uint8_t, kDigestBytes>;

  /** @throws std::runtime_error if OpenSSL fails to produce a digest. */
  static DigestBytes Digest(std::string_view data) {
    DigestBytes out{};
    unsigned int len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) &&
                    EVP_DigestUpdate(ctx, data.data(), data.size()) &&
                    EVP_DigestFinal_ex(ctx, out.data(), &len);
    EVP_MD_CTX_free(ctx);

    if (!ok || len != kDigestBytes) {
      throw std::runtime_error("SHA-256 digest computation failed");
    }
    return out;
  }
};

inline std::string_view AsBytes(const uint8_t* p, size_t n) {
  return std::string_view(reinterpret_cast<const char*>(p), n);
}

// Lowercase hex, two characters per byte.
inline std::string ToHex(std::string_view bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (char ch : bytes) {
    const auto b = static_cast<uint8_t>(ch);
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0f]);
  }
  return out;
}

// Standard base64 alphabet with '=' padding, no line breaks.
inline std::string ToBase64(std::string_view bytes) {
  // EVP_EncodeBlock NUL-terminates its output.
  std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  const int written = EVP_EncodeBlock(
      reinterpret_cast<unsigned char*>(out.data()),
      reinterpret_cast<const unsigned char*>(bytes.data()),
      static_cast<int>(bytes.size()));
  if (written < 0) {
    throw std::runtime_error("base64 encoding failed");
  }
  out.resize(static_cast<size_t>(written));
  return out;
}

// Characters removed by Trim(): space, tab, LF, CR, NUL, VT.
inline bool IsTrimChar(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\0' ||
         c == '\v';
}

// Whitespace class used for "contains whitespace" checks: adds form feed.
inline bool IsWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
         c == '\f';
}

inline std::string_view Trim(std::string_view s) {
  size_t start = 0;
  size_t end = s.size();
  while (start < end && IsTrimChar(s[start])) ++start;
  while (end > start && IsTrimChar(s[end - 1])) --end;
  return s.substr(start, end - start);
}

inline char AsciiLower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline char AsciiUpper(char c) {
  return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

inline std::string ToLowerAscii(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = AsciiLower(c);
  return out;
}

inline std::string ToUpperAscii(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = AsciiUpper(c);
  return out;
}

inline bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace dmutil::internal
