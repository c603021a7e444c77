#include <dmutil/ingest/client.hpp>
#include <dmutil/ingest/request.hpp>

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <trantor/utils/Logger.h>

#include <chrono>
#include <stdexcept>
#include <utility>

namespace dmutil::ingest {

namespace {

const char* ReqResultName(drogon::ReqResult result) {
  switch (result) {
    case drogon::ReqResult::Ok:
      return "Ok";
    case drogon::ReqResult::BadResponse:
      return "BadResponse";
    case drogon::ReqResult::NetworkFailure:
      return "NetworkFailure";
    case drogon::ReqResult::BadServerAddress:
      return "BadServerAddress";
    case drogon::ReqResult::Timeout:
      return "Timeout";
    default:
      return "RequestFailed";
  }
}

}  // namespace

IngestionClient::IngestionClient(ClientConfig config)
    : config_(std::move(config)) {
  if (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
    config_.endpoint.pop_back();
  }

  loop_thread_ = std::make_unique<trantor::EventLoopThread>("dmutil-client");
  loop_thread_->run();
  client_ = drogon::HttpClient::newHttpClient(config_.endpoint,
                                              loop_thread_->getLoop());
}

IngestionClient::~IngestionClient() {
  // The client must go away before the loop it runs on.
  client_.reset();
  loop_thread_.reset();
}

IngestionResponse IngestionClient::Send(const std::string& path,
                                        const std::string& body) {
  auto req = drogon::HttpRequest::newHttpRequest();
  req->setMethod(drogon::Post);
  req->setPath(path);
  req->setContentTypeCode(drogon::CT_APPLICATION_JSON);
  req->setBody(body);
  if (!config_.access_token.empty()) {
    req->addHeader("Authorization", "Bearer " + config_.access_token);
  }

  LOG_DEBUG << "POST " << config_.endpoint << path << " (" << body.size()
            << " bytes)";

  auto start = std::chrono::steady_clock::now();
  auto [result, resp] = client_->sendRequest(req, config_.timeout_ms / 1000.0);
  auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - start)
                         .count();

  if (result != drogon::ReqResult::Ok || !resp) {
    LOG_ERROR << "Request to " << config_.endpoint << path << " failed: "
              << ReqResultName(result);
    throw std::runtime_error(std::string("Error sending request: ") +
                             ReqResultName(result));
  }

  IngestionResponse out;
  out.status_code = static_cast<int>(resp->statusCode());
  out.body = std::string(resp->body());

  LOG_INFO << "POST " << path << " -> " << out.status_code << " in "
           << duration_ms << " ms";
  return out;
}

IngestionResponse IngestionClient::IngestAudienceMembers(const Json::Value& request) {
  return Send(kAudienceMembersIngestPath, ToJsonString(request, false));
}

IngestionResponse IngestionClient::IngestEvents(const Json::Value& request) {
  return Send(kEventsIngestPath, ToJsonString(request, false));
}

}  // namespace dmutil::ingest
