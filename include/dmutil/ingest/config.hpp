#pragma once

#include <dmutil/formatter.hpp>
#include <dmutil/ingest/client.hpp>
#include <dmutil/ingest/request.hpp>
#include <dmutil/ingest/types.hpp>

#include <string>

namespace dmutil::ingest {

/** Which ingestion tool is being configured. */
enum class ToolKind {
  kAudienceMembers,  // --audience_id, --csv_file
  kEvents            // --conversion_action_id, --json_file
};

/**
 * Destination as given on the command line, before account types are
 * parsed.
 */
struct DestinationConfig {
  std::string operating_account_type;
  std::string operating_account_id;
  std::string login_account_type;
  std::string login_account_id;
  std::string linked_account_type;
  std::string linked_account_id;
  std::string product_destination_id;
};

/**
 * Complete configuration of an ingestion tool.
 */
struct Config {
  ToolKind tool = ToolKind::kAudienceMembers;
  DestinationConfig destination;
  std::string data_file;
  bool validate_only = true;
  std::string encoding = "hex";
  bool dry_run = false;
  std::string log_level = "info";
  ClientConfig client;

  /**
   * Load configuration from a YAML-like file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path, ToolKind tool);

  /**
   * Parse configuration from command-line arguments. Options may be given
   * as "--key value" or "--key=value". When --config is present the file is
   * loaded first and command-line values override it.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv, ToolKind tool);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;

  /** @throws std::runtime_error on an unknown account type. */
  Destination BuildDestination() const;

  /** @throws std::runtime_error on an unknown encoding. */
  RequestOptions BuildRequestOptions() const;
};

/** Print the command-line help of a tool to stderr. */
void PrintUsage(const char* argv0, ToolKind tool);

/**
 * Set the process-wide log level (debug, info, warn, error).
 * @throws std::runtime_error on an unknown level.
 */
void ApplyLogLevel(const std::string& level);

}  // namespace dmutil::ingest
