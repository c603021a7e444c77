#include <dmutil/formatter.hpp>

#include <iostream>

int main() {
  std::cout << "email:  " << dmutil::FormatEmailAddress(" Jane.Doe@GoogleMail.com ") << "\n";
  std::cout << "phone:  " << dmutil::FormatPhoneNumber("+1 (800) 555-0100") << "\n";
  std::cout << "given:  " << dmutil::FormatGivenName("Dr. Jane") << "\n";
  std::cout << "family: " << dmutil::FormatFamilyName("Doe, Jr.") << "\n";
  std::cout << "region: " << dmutil::ProcessRegionCode(" us ") << "\n";

  // Hashed identifiers as they are sent to the API.
  std::cout << "hex:    "
            << dmutil::ProcessEmailAddress("jane.doe@gmail.com", dmutil::Encoding::kHex)
            << "\n";
  std::cout << "base64: "
            << dmutil::ProcessEmailAddress("jane.doe@gmail.com", dmutil::Encoding::kBase64)
            << "\n";

  try {
    dmutil::FormatEmailAddress("no-at-sign");
  } catch (const dmutil::FormatError& e) {
    std::cerr << dmutil::FormatErrorCodeName(e.code()) << ": " << e.what() << "\n";
  }
  return 0;
}
