// Unit tests for dmutil/formatter.hpp
// Tests: Email, phone, region code, given/family name normalization,
// hashing, hex/base64 encoding and the Process* pipeline

#include <gtest/gtest.h>

#include <dmutil/formatter.hpp>

#include <algorithm>
#include <regex>
#include <string>
#include <vector>

namespace dmutil {
namespace {

// Runs fn and returns the code of the FormatError it throws.
template <typename Fn>
FormatErrorCode ErrorCodeOf(Fn fn) {
  try {
    fn();
  } catch (const FormatError& e) {
    return e.code();
  }
  ADD_FAILURE() << "Expected FormatError";
  return FormatErrorCode::kEmptyInput;
}

// =============================================================================
// Email Tests
// =============================================================================

class FormatEmailTest : public ::testing::Test {};

TEST_F(FormatEmailTest, LowercasesName) {
  EXPECT_EQ(FormatEmailAddress("QuinnY@example.com"), "quinny@example.com");
}

TEST_F(FormatEmailTest, LowercasesDomain) {
  EXPECT_EQ(FormatEmailAddress("QuinnY@EXAMPLE.com"), "quinny@example.com");
}

TEST_F(FormatEmailTest, TrimsSurroundingWhitespace) {
  EXPECT_EQ(FormatEmailAddress("  quinny@example.com\t\n"), "quinny@example.com");
}

TEST_F(FormatEmailTest, StripsPeriodsForGmail) {
  EXPECT_EQ(FormatEmailAddress("Jefferson.Loves.hiking@gmail.com"),
            "jeffersonloveshiking@gmail.com");
}

TEST_F(FormatEmailTest, StripsPeriodsForGooglemail) {
  EXPECT_EQ(FormatEmailAddress("Jefferson.LOVES.Hiking@googlemail.com"),
            "jeffersonloveshiking@googlemail.com");
}

TEST_F(FormatEmailTest, KeepsPeriodsForOtherDomains) {
  EXPECT_EQ(FormatEmailAddress("Jefferson.Loves.hiking@example.com"),
            "jefferson.loves.hiking@example.com");
  EXPECT_EQ(FormatEmailAddress("a.b@mail.gmail.com"), "a.b@mail.gmail.com");
}

TEST_F(FormatEmailTest, GmailNormalizationIsStable) {
  std::string once = FormatEmailAddress("J.e.f.f@GMAIL.com");
  EXPECT_EQ(once, "jeff@gmail.com");
  EXPECT_EQ(FormatEmailAddress(once), once);
}

TEST_F(FormatEmailTest, EmptyString) {
  EXPECT_EQ(ErrorCodeOf([] { FormatEmailAddress(""); }), FormatErrorCode::kEmptyInput);
}

TEST_F(FormatEmailTest, BlankString) {
  EXPECT_EQ(ErrorCodeOf([] { FormatEmailAddress("  "); }), FormatErrorCode::kEmptyInput);
}

TEST_F(FormatEmailTest, NoAtSymbol) {
  EXPECT_EQ(ErrorCodeOf([] { FormatEmailAddress("quinn"); }),
            FormatErrorCode::kInvalidFormat);
}

TEST_F(FormatEmailTest, TwoAtSymbols) {
  EXPECT_EQ(ErrorCodeOf([] { FormatEmailAddress("a@b@example.com"); }),
            FormatErrorCode::kInvalidFormat);
}

TEST_F(FormatEmailTest, IntermediateWhitespace) {
  EXPECT_EQ(ErrorCodeOf([] { FormatEmailAddress("quinn y@example.com"); }),
            FormatErrorCode::kInvalidFormat);
  EXPECT_EQ(ErrorCodeOf([] { FormatEmailAddress("quinn\fy@example.com"); }),
            FormatErrorCode::kInvalidFormat);
}

TEST_F(FormatEmailTest, EmptyUserPart) {
  EXPECT_EQ(ErrorCodeOf([] { FormatEmailAddress(" @googlemail.com"); }),
            FormatErrorCode::kEmptyLocalPart);
}

TEST_F(FormatEmailTest, EmptyDomain) {
  EXPECT_EQ(ErrorCodeOf([] { FormatEmailAddress("quinn@"); }),
            FormatErrorCode::kEmptyDomain);
}

TEST_F(FormatEmailTest, EmptyUserPartAfterNormalization) {
  EXPECT_EQ(ErrorCodeOf([] { FormatEmailAddress(" ...@gmail.com"); }),
            FormatErrorCode::kEmptyLocalPartAfterNormalization);
}

TEST_F(FormatEmailTest, ErrorIsInvalidArgument) {
  EXPECT_THROW(FormatEmailAddress("quinn"), std::invalid_argument);
}

TEST_F(FormatEmailTest, OutputShape) {
  const std::vector<std::string> inputs = {
      "QuinnY@example.com", " A.B.C@GMAIL.COM ", "x@y", "Mixed.Case+tag@Sub.Example.ORG"};
  for (const auto& input : inputs) {
    std::string out = FormatEmailAddress(input);
    EXPECT_EQ(std::count(out.begin(), out.end(), '@'), 1) << input;
    EXPECT_EQ(out.find_first_of(" \t\n\r\v\f"), std::string::npos) << input;
    for (char c : out) {
      EXPECT_FALSE(c >= 'A' && c <= 'Z') << input;
    }
  }
}

// =============================================================================
// Phone Tests
// =============================================================================

class FormatPhoneTest : public ::testing::Test {};

TEST_F(FormatPhoneTest, WithSpaces) {
  EXPECT_EQ(FormatPhoneNumber("1 800 555 0100"), "+18005550100");
}

TEST_F(FormatPhoneTest, NoSpaces) {
  EXPECT_EQ(FormatPhoneNumber("18005550100"), "+18005550100");
}

TEST_F(FormatPhoneTest, WithDashes) {
  EXPECT_EQ(FormatPhoneNumber("+1 800-555-0100"), "+18005550100");
}

TEST_F(FormatPhoneTest, International) {
  EXPECT_EQ(FormatPhoneNumber("441134960987"), "+441134960987");
  EXPECT_EQ(FormatPhoneNumber("+441134960987"), "+441134960987");
  EXPECT_EQ(FormatPhoneNumber("+44-113-496-0987"), "+441134960987");
}

TEST_F(FormatPhoneTest, StripsParenthesesAndLetters) {
  EXPECT_EQ(FormatPhoneNumber("(800) 555-CALL 0100"), "+8005550100");
}

TEST_F(FormatPhoneTest, NoLengthValidation) {
  EXPECT_EQ(FormatPhoneNumber("7"), "+7");
}

TEST_F(FormatPhoneTest, EmptyString) {
  EXPECT_EQ(ErrorCodeOf([] { FormatPhoneNumber(""); }), FormatErrorCode::kEmptyInput);
}

TEST_F(FormatPhoneTest, BlankString) {
  EXPECT_EQ(ErrorCodeOf([] { FormatPhoneNumber("  "); }), FormatErrorCode::kEmptyInput);
}

TEST_F(FormatPhoneTest, NoDigits) {
  EXPECT_EQ(ErrorCodeOf([] { FormatPhoneNumber(" +A BCD EFG "); }),
            FormatErrorCode::kNoDigits);
}

TEST_F(FormatPhoneTest, OutputShape) {
  const std::regex shape("^\\+[0-9]+$");
  for (const char* input : {"1 800 555 0100", "+44-113-496-0987", "x1y2z3", "(0)"}) {
    EXPECT_TRUE(std::regex_match(FormatPhoneNumber(input), shape)) << input;
  }
}

// =============================================================================
// Region Code Tests
// =============================================================================

class FormatRegionCodeTest : public ::testing::Test {};

TEST_F(FormatRegionCodeTest, Uppercases) {
  EXPECT_EQ(FormatRegionCode("us"), "US");
  EXPECT_EQ(FormatRegionCode("Gb"), "GB");
}

TEST_F(FormatRegionCodeTest, Trims) {
  EXPECT_EQ(FormatRegionCode("us  "), "US");
  EXPECT_EQ(FormatRegionCode("  us  "), "US");
}

TEST_F(FormatRegionCodeTest, EmptyAndBlank) {
  EXPECT_EQ(ErrorCodeOf([] { FormatRegionCode(""); }), FormatErrorCode::kInvalidLength);
  EXPECT_EQ(ErrorCodeOf([] { FormatRegionCode("  "); }), FormatErrorCode::kInvalidLength);
}

TEST_F(FormatRegionCodeTest, WrongLength) {
  EXPECT_EQ(ErrorCodeOf([] { FormatRegionCode("u"); }), FormatErrorCode::kInvalidLength);
  EXPECT_EQ(ErrorCodeOf([] { FormatRegionCode("usa"); }), FormatErrorCode::kInvalidLength);
  EXPECT_EQ(ErrorCodeOf([] { FormatRegionCode("u s"); }), FormatErrorCode::kInvalidLength);
}

TEST_F(FormatRegionCodeTest, InvalidCharacters) {
  EXPECT_EQ(ErrorCodeOf([] { FormatRegionCode("u2"); }),
            FormatErrorCode::kInvalidCharacters);
  EXPECT_EQ(ErrorCodeOf([] { FormatRegionCode("u-"); }),
            FormatErrorCode::kInvalidCharacters);
}

// =============================================================================
// Given Name Tests
// =============================================================================

class FormatGivenNameTest : public ::testing::Test {};

TEST_F(FormatGivenNameTest, TrimsAndLowercases) {
  EXPECT_EQ(FormatGivenName(" Alex   "), "alex");
}

TEST_F(FormatGivenNameTest, StripsLeadingPrefix) {
  EXPECT_EQ(FormatGivenName(" Mr. Alex   "), "alex");
  EXPECT_EQ(FormatGivenName(" Mrs. Alex   "), "alex");
  EXPECT_EQ(FormatGivenName(" Ms. Alex   "), "alex");
  EXPECT_EQ(FormatGivenName(" Dr. Alex   "), "alex");
}

TEST_F(FormatGivenNameTest, StripsTrailingPrefix) {
  EXPECT_EQ(FormatGivenName(" Alex Dr."), "alex");
}

TEST_F(FormatGivenNameTest, PrefixNeedsPeriod) {
  EXPECT_EQ(FormatGivenName(" Mralex   "), "mralex");
  EXPECT_EQ(FormatGivenName("Mr Alex"), "mr alex");
}

TEST_F(FormatGivenNameTest, PrefixNeedsBoundaryAfterPeriod) {
  EXPECT_EQ(FormatGivenName("Dr.Alex"), "dr.alex");
}

TEST_F(FormatGivenNameTest, EmptyString) {
  EXPECT_EQ(ErrorCodeOf([] { FormatGivenName(""); }), FormatErrorCode::kEmptyInput);
}

TEST_F(FormatGivenNameTest, BlankString) {
  EXPECT_EQ(ErrorCodeOf([] { FormatGivenName("  "); }), FormatErrorCode::kEmptyInput);
}

TEST_F(FormatGivenNameTest, OnlyPrefix) {
  EXPECT_EQ(ErrorCodeOf([] { FormatGivenName(" Mr. "); }),
            FormatErrorCode::kConsistsSolelyOfPrefix);
}

// =============================================================================
// Family Name Tests
// =============================================================================

class FormatFamilyNameTest : public ::testing::Test {};

TEST_F(FormatFamilyNameTest, TrimsAndLowercases) {
  EXPECT_EQ(FormatFamilyName(" Quinn   "), "quinn");
  EXPECT_EQ(FormatFamilyName("Quinn-Alex"), "quinn-alex");
}

TEST_F(FormatFamilyNameTest, StripsSuffix) {
  EXPECT_EQ(FormatFamilyName(" Quinn, Jr.   "), "quinn");
  EXPECT_EQ(FormatFamilyName(" Quinn,Jr.   "), "quinn");
  EXPECT_EQ(FormatFamilyName(" Quinn Sr.  "), "quinn");
  EXPECT_EQ(FormatFamilyName("Quinn III"), "quinn");
  EXPECT_EQ(FormatFamilyName("Quinn PhD"), "quinn");
}

TEST_F(FormatFamilyNameTest, StripsChainedSuffixes) {
  EXPECT_EQ(FormatFamilyName("quinn, jr. dds"), "quinn");
  EXPECT_EQ(FormatFamilyName("quinn, jr., dds"), "quinn");
}

TEST_F(FormatFamilyNameTest, KeepsSuffixInsideWord) {
  EXPECT_EQ(FormatFamilyName("Boardds"), "boardds");
  EXPECT_EQ(FormatFamilyName("lacparm"), "lacparm");
  EXPECT_EQ(FormatFamilyName("Ivy"), "ivy");
}

TEST_F(FormatFamilyNameTest, LongWhitespaceRuns) {
  EXPECT_EQ(FormatFamilyName("a" + std::string(100000, ' ') + "b"),
            "a" + std::string(100000, ' ') + "b");
  EXPECT_EQ(FormatFamilyName("Quinn" + std::string(100000, ' ') + "Jr."), "quinn");
  EXPECT_EQ(FormatFamilyName("Quinn," + std::string(100000, '\t') + "DDS MD"),
            "quinn");
}

TEST_F(FormatFamilyNameTest, SeparatorBeforeCommaIsKept) {
  EXPECT_EQ(FormatFamilyName("Quinn , Jr."), "quinn ");
}

TEST_F(FormatFamilyNameTest, EmptyString) {
  EXPECT_EQ(ErrorCodeOf([] { FormatFamilyName(""); }), FormatErrorCode::kEmptyInput);
}

TEST_F(FormatFamilyNameTest, BlankString) {
  EXPECT_EQ(ErrorCodeOf([] { FormatFamilyName("  "); }), FormatErrorCode::kEmptyInput);
}

TEST_F(FormatFamilyNameTest, OnlySuffix) {
  EXPECT_EQ(ErrorCodeOf([] { FormatFamilyName(", Jr. "); }),
            FormatErrorCode::kConsistsSolelyOfSuffix);
  EXPECT_EQ(ErrorCodeOf([] { FormatFamilyName(",Jr.,DDS "); }),
            FormatErrorCode::kConsistsSolelyOfSuffix);
}

// =============================================================================
// Hashing and Encoding Tests
// =============================================================================

class HashStringTest : public ::testing::Test {};

TEST_F(HashStringTest, KnownVectors) {
  EXPECT_EQ(HexEncode(HashString("alexz@example.com")),
            "509e933019bb285a134a9334b8bb679dff79d0ce023d529af4bd744d47b4fd8a");
  EXPECT_EQ(HexEncode(HashString("+18005550100")),
            "fb4f73a6ec5fdb7077d564cdd22c3554b43ce49168550c3b12c547b78c517b30");
  EXPECT_EQ(HexEncode(HashString("abc")),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashStringTest, TrimsBeforeHashing) {
  EXPECT_EQ(HashString("  abc \n"), HashString("abc"));
}

TEST_F(HashStringTest, BlankInputs) {
  EXPECT_EQ(ErrorCodeOf([] { HashString(""); }), FormatErrorCode::kEmptyInput);
  EXPECT_EQ(ErrorCodeOf([] { HashString(" "); }), FormatErrorCode::kEmptyInput);
  EXPECT_EQ(ErrorCodeOf([] { HashString("   "); }), FormatErrorCode::kEmptyInput);
}

TEST_F(HashStringTest, HexShape) {
  const std::regex shape("^[0-9a-f]{64}$");
  for (const char* input : {"a", "abc", "quinn@example.com", "\xc3\xa9t\xc3\xa9"}) {
    EXPECT_TRUE(std::regex_match(HexEncode(HashString(input)), shape)) << input;
  }
}

class EncodeTest : public ::testing::Test {};

TEST_F(EncodeTest, Hex) {
  EXPECT_EQ(HexEncode("acK123"), "61634b313233");
  EXPECT_EQ(HexEncode("999_XYZ"), "3939395f58595a");
}

TEST_F(EncodeTest, Base64) {
  EXPECT_EQ(Base64Encode("acK123"), "YWNLMTIz");
  EXPECT_EQ(Base64Encode("999_XYZ"), "OTk5X1hZWg==");
}

TEST_F(EncodeTest, EmptyBytes) {
  EXPECT_EQ(ErrorCodeOf([] { HexEncode(""); }), FormatErrorCode::kEmptyInput);
  EXPECT_EQ(ErrorCodeOf([] { Base64Encode(""); }), FormatErrorCode::kEmptyInput);
}

TEST_F(EncodeTest, DigestLengths) {
  Digest digest = HashString("abc");
  EXPECT_EQ(Encode(digest, Encoding::kHex).size(), 64u);
  EXPECT_EQ(Encode(digest, Encoding::kBase64).size(), 44u);
}

TEST_F(EncodeTest, ParseEncoding) {
  Encoding e = Encoding::kHex;
  EXPECT_TRUE(ParseEncoding("base64", &e));
  EXPECT_EQ(e, Encoding::kBase64);
  EXPECT_TRUE(ParseEncoding("HEX", &e));
  EXPECT_EQ(e, Encoding::kHex);
  EXPECT_FALSE(ParseEncoding("base32", &e));
  EXPECT_STREQ(EncodingName(Encoding::kBase64), "BASE64");
}

// =============================================================================
// Process Tests
// =============================================================================

class ProcessTest : public ::testing::Test {};

TEST_F(ProcessTest, EmailAddress) {
  EXPECT_EQ(ProcessEmailAddress("alexz@example.com", Encoding::kHex),
            "509e933019bb285a134a9334b8bb679dff79d0ce023d529af4bd744d47b4fd8a");
  EXPECT_EQ(ProcessEmailAddress("alexz@example.com", Encoding::kBase64),
            "UJ6TMBm7KFoTSpM0uLtnnf950M4CPVKa9L10TUe0/Yo=");
}

TEST_F(ProcessTest, EmailAddressIsNormalizedFirst) {
  EXPECT_EQ(ProcessEmailAddress("  AlexZ@Example.COM ", Encoding::kHex),
            ProcessEmailAddress("alexz@example.com", Encoding::kHex));
}

TEST_F(ProcessTest, PhoneNumber) {
  EXPECT_EQ(ProcessPhoneNumber("+18005550100", Encoding::kHex),
            "fb4f73a6ec5fdb7077d564cdd22c3554b43ce49168550c3b12c547b78c517b30");
  EXPECT_EQ(ProcessPhoneNumber("+18005550100", Encoding::kBase64),
            "+09zpuxf23B31WTN0iw1VLQ85JFoVQw7EsVHt4xRezA=");
}

TEST_F(ProcessTest, GivenName) {
  EXPECT_EQ(ProcessGivenName("Givenname", Encoding::kHex),
            "128a07bfe2df877c52076e60d7774cf5baaa046c5a6c48daf30ff43ecca2f814");
  EXPECT_EQ(ProcessGivenName("Givenname", Encoding::kBase64),
            "EooHv+Lfh3xSB25g13dM9bqqBGxabEja8w/0Psyi+BQ=");
}

TEST_F(ProcessTest, FamilyName) {
  EXPECT_EQ(ProcessFamilyName("Familyname", Encoding::kHex),
            "77762c287e61ce065bee5c15464012c6fbe088398b8057627d5577249430d574");
  EXPECT_EQ(ProcessFamilyName("Familyname", Encoding::kBase64),
            "d3YsKH5hzgZb7lwVRkASxvvgiDmLgFdifVV3JJQw1XQ=");
}

TEST_F(ProcessTest, RegionCodeIsNotHashed) {
  EXPECT_EQ(ProcessRegionCode(" us"), "US");
}

TEST_F(ProcessTest, PropagatesFormatErrors) {
  EXPECT_EQ(ErrorCodeOf([] { ProcessEmailAddress("nope", Encoding::kHex); }),
            FormatErrorCode::kInvalidFormat);
  EXPECT_EQ(ErrorCodeOf([] { ProcessGivenName(" Dr. ", Encoding::kBase64); }),
            FormatErrorCode::kConsistsSolelyOfPrefix);
}

TEST_F(ProcessTest, ErrorCodeNames) {
  EXPECT_STREQ(FormatErrorCodeName(FormatErrorCode::kEmptyLocalPart), "EmptyLocalPart");
  EXPECT_STREQ(FormatErrorCodeName(FormatErrorCode::kConsistsSolelyOfSuffix),
               "ConsistsSolelyOfSuffix");
}

}  // namespace
}  // namespace dmutil
