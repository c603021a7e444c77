#include <dmutil/ingest/config.hpp>
#include <dmutil/internal.hpp>

#include <trantor/utils/Logger.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace dmutil::ingest {

namespace {

const char* DestinationIdOption(ToolKind tool) {
  return tool == ToolKind::kAudienceMembers ? "audience_id" : "conversion_action_id";
}

const char* DataFileOption(ToolKind tool) {
  return tool == ToolKind::kAudienceMembers ? "csv_file" : "json_file";
}

std::string Trim(const std::string& s) {
  return std::string(internal::Trim(s));
}

bool ParseFileBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

uint32_t ParseTimeout(const std::string& value) {
  try {
    return static_cast<uint32_t>(std::stoul(value));
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid timeout_ms: " + value);
  }
}

bool SetDestinationKey(DestinationConfig* d, ToolKind tool,
                       const std::string& key, const std::string& value) {
  if (key == "operating_account_type") {
    d->operating_account_type = value;
  } else if (key == "operating_account_id") {
    d->operating_account_id = value;
  } else if (key == "login_account_type") {
    d->login_account_type = value;
  } else if (key == "login_account_id") {
    d->login_account_id = value;
  } else if (key == "linked_account_type") {
    d->linked_account_type = value;
  } else if (key == "linked_account_id") {
    d->linked_account_id = value;
  } else if (key == "product_destination_id" || key == DestinationIdOption(tool)) {
    d->product_destination_id = value;
  } else {
    return false;
  }
  return true;
}

bool SetClientKey(ClientConfig* c, const std::string& key, const std::string& value) {
  if (key == "endpoint") {
    c->endpoint = value;
  } else if (key == "access_token") {
    c->access_token = value;
  } else if (key == "timeout_ms") {
    c->timeout_ms = ParseTimeout(value);
  } else {
    return false;
  }
  return true;
}

}  // namespace

void PrintUsage(const char* argv0, ToolKind tool) {
  const std::string dest = DestinationIdOption(tool);
  const std::string file = DataFileOption(tool);
  const std::string file_kind = tool == ToolKind::kAudienceMembers ? "csv" : "json";

  std::cerr << "Usage: " << argv0 << " [options]\n"
            << "\nRequired:\n"
            << "  --operating_account_type <type>  GOOGLE_ADS, DISPLAY_VIDEO_PARTNER,\n"
            << "                                   DISPLAY_VIDEO_ADVERTISER or DATA_PARTNER\n"
            << "  --operating_account_id <id>      Operating account ID\n"
            << "  --" << dest << " <id>\n"
            << "  --" << file << " <path>          Path to the " << file_kind << " data file\n"
            << "\nOptional:\n"
            << "  --login_account_type <type>      Login account (with --login_account_id)\n"
            << "  --login_account_id <id>\n"
            << "  --linked_account_type <type>     Linked account (with --linked_account_id)\n"
            << "  --linked_account_id <id>\n"
            << "  --validate_only <true|false>     Validate without applying (default: true)\n"
            << "  --encoding <hex|base64>          Identifier encoding (default: hex)\n"
            << "  --dry_run                        Print the request instead of sending it\n"
            << "  --config, -c <path>              Path to YAML config file\n"
            << "  --endpoint <url>                 API endpoint (default: " << kDefaultEndpoint << ")\n"
            << "  --access_token <token>           OAuth2 access token for the request\n"
            << "  --timeout_ms <ms>                Request timeout (default: 30000)\n"
            << "  --log_level <level>              Log level: debug, info, warn, error\n"
            << "  --help, -h                       Show this help\n"
            << "\nExample:\n"
            << "  " << argv0 << " --operating_account_type GOOGLE_ADS"
            << " --operating_account_id 1234567890 --" << dest << " 987654321"
            << " --" << file << " data." << file_kind << "\n";
}

// Format:
//   key: value
//   section:
//     key: value
Config Config::LoadFromFile(const std::string& path, ToolKind tool) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  config.tool = tool;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    if (current_section == "destination") {
      SetDestinationKey(&config.destination, tool, key, value);
    } else if (current_section == "client") {
      SetClientKey(&config.client, key, value);
    } else if (current_section.empty()) {
      if (key == "data_file" || key == DataFileOption(tool)) {
        config.data_file = value;
      } else if (key == "validate_only") {
        config.validate_only = ParseFileBool(value);
      } else if (key == "encoding") {
        config.encoding = value;
      } else if (key == "dry_run") {
        config.dry_run = ParseFileBool(value);
      } else if (key == "log_level") {
        config.log_level = value;
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv, ToolKind tool) {
  // A config file is the base that command-line options override, so find
  // it before applying anything else.
  std::string config_file;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        throw std::runtime_error("--config requires a path argument");
      }
      config_file = argv[i + 1];
    } else if (internal::StartsWith(arg, "--config=")) {
      config_file = arg.substr(9);
    }
  }

  Config config = config_file.empty() ? Config{} : LoadFromFile(config_file, tool);
  config.tool = tool;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0], tool);
      std::exit(0);
    }
    if (arg == "--dry_run") {
      config.dry_run = true;
      continue;
    }
    if (arg == "-c") {
      ++i;
      continue;
    }
    if (!internal::StartsWith(arg, "--")) {
      throw std::runtime_error("Unexpected argument: " + arg);
    }

    std::string key = arg.substr(2);
    std::string value;
    bool has_value = false;
    size_t eq = key.find('=');
    if (eq != std::string::npos) {
      value = key.substr(eq + 1);
      key = key.substr(0, eq);
      has_value = true;
    } else if (i + 1 < argc) {
      value = argv[++i];
      has_value = true;
    }
    if (!has_value) {
      throw std::runtime_error("--" + key + " requires a value");
    }

    if (key == "config") {
      continue;
    } else if (key == "validate_only") {
      if (value != "true" && value != "false") {
        throw std::runtime_error("--validate_only requires a value of 'true' or 'false'.");
      }
      config.validate_only = (value == "true");
    } else if (key == DataFileOption(tool)) {
      config.data_file = value;
    } else if (key == "encoding") {
      config.encoding = value;
    } else if (key == "log_level") {
      config.log_level = value;
    } else if (SetDestinationKey(&config.destination, tool, key, value)) {
      continue;
    } else if (SetClientKey(&config.client, key, value)) {
      continue;
    } else {
      throw std::runtime_error("Unknown option: --" + key);
    }
  }

  return config;
}

void Config::Validate() const {
  if (destination.operating_account_type.empty()) {
    throw std::runtime_error("--operating_account_type is required");
  }
  if (destination.operating_account_id.empty()) {
    throw std::runtime_error("--operating_account_id is required");
  }
  if (destination.product_destination_id.empty()) {
    throw std::runtime_error(std::string("--") + DestinationIdOption(tool) +
                             " is required");
  }
  if (data_file.empty()) {
    throw std::runtime_error(std::string("--") + DataFileOption(tool) +
                             " is required");
  }

  if (destination.login_account_type.empty() != destination.login_account_id.empty()) {
    throw std::runtime_error(
        "Must specify either both or neither of login account type and login account ID");
  }
  if (destination.linked_account_type.empty() != destination.linked_account_id.empty()) {
    throw std::runtime_error(
        "Must specify either both or neither of linked account type and linked account ID");
  }

  Encoding parsed_encoding;
  if (!ParseEncoding(encoding, &parsed_encoding)) {
    throw std::runtime_error("Invalid encoding: " + encoding +
                             " (must be hex or base64)");
  }

  if (!dry_run && client.endpoint.empty()) {
    throw std::runtime_error("client endpoint is required");
  }
  if (client.timeout_ms == 0) {
    throw std::runtime_error("timeout_ms must be positive");
  }

  // Validate log level
  if (log_level != "debug" && log_level != "info" &&
      log_level != "warn" && log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + log_level +
                             " (must be debug, info, warn, or error)");
  }
}

Destination Config::BuildDestination() const {
  auto parse_account = [](const std::string& type, const std::string& id) {
    ProductAccount account;
    if (!ParseAccountType(type, &account.account_type)) {
      throw std::runtime_error("Invalid account type: " + type);
    }
    account.account_id = id;
    return account;
  };

  Destination out;
  out.operating_account = parse_account(destination.operating_account_type,
                                        destination.operating_account_id);
  if (!destination.login_account_type.empty()) {
    out.login_account = parse_account(destination.login_account_type,
                                      destination.login_account_id);
  }
  if (!destination.linked_account_type.empty()) {
    out.linked_account = parse_account(destination.linked_account_type,
                                       destination.linked_account_id);
  }
  out.product_destination_id = destination.product_destination_id;
  return out;
}

RequestOptions Config::BuildRequestOptions() const {
  RequestOptions options;
  if (!ParseEncoding(encoding, &options.encoding)) {
    throw std::runtime_error("Invalid encoding: " + encoding);
  }
  options.validate_only = validate_only;
  return options;
}

void ApplyLogLevel(const std::string& level) {
  if (level == "debug") {
    trantor::Logger::setLogLevel(trantor::Logger::kDebug);
  } else if (level == "info") {
    trantor::Logger::setLogLevel(trantor::Logger::kInfo);
  } else if (level == "warn") {
    trantor::Logger::setLogLevel(trantor::Logger::kWarn);
  } else if (level == "error") {
    trantor::Logger::setLogLevel(trantor::Logger::kError);
  } else {
    throw std::runtime_error("Invalid log_level: " + level);
  }
}

}  // namespace dmutil::ingest
