#include <dmutil/ingest/client.hpp>
#include <dmutil/ingest/config.hpp>
#include <dmutil/ingest/readers.hpp>
#include <dmutil/ingest/request.hpp>

#include <trantor/utils/Logger.h>

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
  using dmutil::ingest::ToolKind;
  try {
    auto config = dmutil::ingest::Config::LoadFromArgs(argc, argv, ToolKind::kEvents);
    try {
      config.Validate();
    } catch (const std::runtime_error&) {
      dmutil::ingest::PrintUsage(argv[0], ToolKind::kEvents);
      throw;
    }
    dmutil::ingest::ApplyLogLevel(config.log_level);

    auto events = dmutil::ingest::ReadEventDataFile(config.data_file);
    LOG_INFO << "Read " << events.size() << " events from " << config.data_file;

    auto request = dmutil::ingest::BuildEventsRequest(
        config.BuildDestination(), events, config.BuildRequestOptions());

    if (config.dry_run) {
      std::cout << dmutil::ingest::ToJsonString(request, true) << std::endl;
      return 0;
    }

    LOG_DEBUG << "Request:\n" << dmutil::ingest::ToJsonString(request, true);

    dmutil::ingest::IngestionClient client(config.client);
    auto response = client.IngestEvents(request);
    std::cout << "Response (HTTP " << response.status_code << "):\n"
              << dmutil::ingest::PrettyPrintJson(response.body) << std::endl;
    return response.ok() ? 0 : 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
