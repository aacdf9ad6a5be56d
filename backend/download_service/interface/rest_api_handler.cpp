#include "rest_api_handler.hpp"
#include "common/restful/url_codec.hpp"
#include <iostream>

namespace download_service {

namespace {

template <typename T>
nlohmann::json orNull(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> queryValue(const std::map<std::string, std::string>& query,
                                      const std::string& key) {
  auto it = query.find(key);
  if (it == query.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace

nlohmann::json toJson(const FormatInfo& format) {
  return {
    {"format_id", format.format_id},
    {"ext", format.ext},
    {"resolution", orNull(format.resolution)},
    {"abr", orNull(format.abr)},
    {"vcodec", orNull(format.vcodec)},
    {"acodec", orNull(format.acodec)},
    {"filesize", orNull(format.filesize)},
    {"format_note", orNull(format.format_note)}
  };
}

nlohmann::json toJson(const MediaInfo& info) {
  auto formats = nlohmann::json::array();
  for (const auto& format : info.formats) {
    formats.push_back(toJson(format));
  }
  return {
    {"id", info.id},
    {"title", info.title},
    {"duration", orNull(info.duration)},
    {"thumbnail", info.thumbnail},
    {"uploader", info.uploader},
    {"webpage_url", info.webpage_url},
    {"formats", std::move(formats)}
  };
}

http::status statusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:
    case ErrorKind::Engine:
      return http::status::bad_request;
    case ErrorKind::Directory:
    case ErrorKind::AcceleratorUnavailable:
    case ErrorKind::OutputNotFound:
    case ErrorKind::Cancelled:
    case ErrorKind::Internal:
      break;
  }
  return http::status::internal_server_error;
}

RestApiHandler::RestApiHandler(std::shared_ptr<MediaService> media_service)
    : media_service_(std::move(media_service)) {}

bool RestApiHandler::isLongRunning(const http::request<http::string_body>& req) const {
  auto raw_target = req.target();
  auto path = common::parseTarget(std::string_view(raw_target.data(), raw_target.size())).path;
  return (path == "/api/download" && req.method() == http::verb::get) ||
         (path == "/api/info" && req.method() == http::verb::post);
}

common::ApiResponse RestApiHandler::doHandleRequest(http::request<http::string_body>&& req) {
  auto raw_target = req.target();
  auto target = common::parseTarget(std::string_view(raw_target.data(), raw_target.size()));

  if (target.path == "/api/health" && req.method() == http::verb::get) {
    return handleHealth();
  } else if (target.path == "/api/info" && req.method() == http::verb::post) {
    auto body = parseRequestBody(req.body());
    return handleInfo(body);
  } else if (target.path == "/api/download" && req.method() == http::verb::get) {
    return handleDownload(target.query);
  } else {
    return createErrorResponse(http::status::not_found, "Not found");
  }
}

common::ApiResponse RestApiHandler::handleHealth() {
  return createJsonResponse(http::status::ok, {{"ok", true}});
}

common::ApiResponse RestApiHandler::handleInfo(const nlohmann::json& body) {
  std::string url;
  if (auto it = body.find("url"); it != body.end() && it->is_string()) {
    url = it->get<std::string>();
  }

  auto info = media_service_->getInfo(url);
  if (!info) {
    std::cerr << "[api] info failed for '" << url << "': " << info.error().message << std::endl;
    return createErrorResponse(statusFor(info.error().kind), info.error().message);
  }
  return createJsonResponse(http::status::ok, toJson(*info));
}

common::ApiResponse RestApiHandler::handleDownload(const std::map<std::string, std::string>& query) {
  auto url = queryValue(query, "url").value_or("");
  auto format_id = queryValue(query, "format_id");
  if (!format_id) {
    format_id = queryValue(query, "format_selector");
  }

  auto result = media_service_->downloadForStreaming(url, format_id);
  if (!result.success || !result.output_path) {
    auto error = result.error.value_or(DownloadError{ErrorKind::Internal, "Download failed"});
    return createErrorResponse(statusFor(error.kind), error.message);
  }

  common::FileResponse file;
  file.header.result(http::status::ok);
  file.header.set(http::field::content_type, "application/octet-stream");
  file.header.set(http::field::content_disposition,
                  common::attachmentDisposition(result.output_path->filename().string()));
  file.path = *result.output_path;
  std::error_code ec;
  auto size = std::filesystem::file_size(file.path, ec);
  if (!ec) {
    file.size = size;
  }
  file.owner = result.scratch;
  return file;
}

} // namespace download_service
