#include <dmutil/formatter.hpp>
#include <dmutil/version.hpp>

#include <iostream>
#include <string>

static void usage(const char* argv0) {
  std::cerr
      << "dmutil " << dmutil::Version() << "\n"
      << "usage:\n"
      << "  " << argv0 << " format-email <value>\n"
      << "  " << argv0 << " format-phone <value>\n"
      << "  " << argv0 << " format-given-name <value>\n"
      << "  " << argv0 << " format-family-name <value>\n"
      << "  " << argv0 << " format-region <value>\n"
      << "  " << argv0 << " process-email <value> [hex|base64]\n"
      << "  " << argv0 << " process-phone <value> [hex|base64]\n"
      << "  " << argv0 << " process-given-name <value> [hex|base64]\n"
      << "  " << argv0 << " process-family-name <value> [hex|base64]\n"
      << "  " << argv0 << " process-region <value>\n"
      << "  " << argv0 << " hash <value> [hex|base64]\n";
}

int main(int argc, char** argv) {
  if (argc < 3 || argc > 4) { usage(argv[0]); return 2; }

  std::string cmd = argv[1];
  std::string value = argv[2];

  dmutil::Encoding encoding = dmutil::Encoding::kHex;
  if (argc == 4 && !dmutil::ParseEncoding(argv[3], &encoding)) {
    std::cerr << "Invalid encoding: " << argv[3] << "\n";
    return 2;
  }

  try {
    std::string out;
    if (cmd == "format-email") {
      out = dmutil::FormatEmailAddress(value);
    } else if (cmd == "format-phone") {
      out = dmutil::FormatPhoneNumber(value);
    } else if (cmd == "format-given-name") {
      out = dmutil::FormatGivenName(value);
    } else if (cmd == "format-family-name") {
      out = dmutil::FormatFamilyName(value);
    } else if (cmd == "format-region" || cmd == "process-region") {
      out = dmutil::ProcessRegionCode(value);
    } else if (cmd == "process-email") {
      out = dmutil::ProcessEmailAddress(value, encoding);
    } else if (cmd == "process-phone") {
      out = dmutil::ProcessPhoneNumber(value, encoding);
    } else if (cmd == "process-given-name") {
      out = dmutil::ProcessGivenName(value, encoding);
    } else if (cmd == "process-family-name") {
      out = dmutil::ProcessFamilyName(value, encoding);
    } else if (cmd == "hash") {
      out = dmutil::Encode(dmutil::HashString(value), encoding);
    } else {
      usage(argv[0]);
      return 2;
    }
    std::cout << out << "\n";
    return 0;
  } catch (const dmutil::FormatError& e) {
    std::cerr << dmutil::FormatErrorCodeName(e.code()) << ": " << e.what() << "\n";
    return 1;
  }
}
