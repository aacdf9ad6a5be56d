#pragma once
#include "application/media_service.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <map>
#include <memory>
#include <nlohmann/json.hpp>

namespace download_service {

nlohmann::json toJson(const FormatInfo& format);
nlohmann::json toJson(const MediaInfo& info);

http::status statusFor(ErrorKind kind);

class RestApiHandler : public common::RestApiHandlerBase {
public:
  explicit RestApiHandler(std::shared_ptr<MediaService> media_service);

  // Info and download both wait on yt-dlp.
  bool isLongRunning(const http::request<http::string_body>& req) const override;

protected:
  common::ApiResponse doHandleRequest(http::request<http::string_body>&& req) override;

private:
  std::shared_ptr<MediaService> media_service_;

  common::ApiResponse handleHealth();
  common::ApiResponse handleInfo(const nlohmann::json& body);
  common::ApiResponse handleDownload(const std::map<std::string, std::string>& query);
};

} // namespace download_service
