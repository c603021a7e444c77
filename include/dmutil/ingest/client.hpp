#pragma once

#include <drogon/HttpClient.h>
#include <json/json.h>
#include <trantor/net/EventLoopThread.h>

#include <cstdint>
#include <memory>
#include <string>

namespace dmutil::ingest {

constexpr const char* kDefaultEndpoint = "https://datamanager.googleapis.com";
constexpr const char* kAudienceMembersIngestPath = "/v1/audienceMembers:ingest";
constexpr const char* kEventsIngestPath = "/v1/events:ingest";

/**
 * Connection settings for the ingestion API.
 */
struct ClientConfig {
  std::string endpoint = kDefaultEndpoint;
  std::string access_token;  // Sent as a bearer token when non-empty
  uint32_t timeout_ms = 30000;
};

struct IngestionResponse {
  int status_code = 0;
  std::string body;

  bool ok() const { return status_code >= 200 && status_code < 300; }
};

/**
 * Blocking client for the ingestion API. Runs its own event loop thread so
 * it can be used from a plain command-line program. Each call makes a
 * single attempt.
 */
class IngestionClient {
 public:
  explicit IngestionClient(ClientConfig config);
  ~IngestionClient();

  IngestionClient(const IngestionClient&) = delete;
  IngestionClient& operator=(const IngestionClient&) = delete;

  /**
   * POST a JSON body to endpoint + path.
   * @throws std::runtime_error if no response was received.
   */
  IngestionResponse Send(const std::string& path, const std::string& body);

  IngestionResponse IngestAudienceMembers(const Json::Value& request);
  IngestionResponse IngestEvents(const Json::Value& request);

 private:
  ClientConfig config_;
  std::unique_ptr<trantor::EventLoopThread> loop_thread_;
  drogon::HttpClientPtr client_;
};

}  // namespace dmutil::ingest
