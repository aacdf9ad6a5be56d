#include "rest_api_handler_base.hpp"
#include <iostream>

namespace common {

void RestApiHandlerBase::addCorsHeaders(http::fields& fields) {
  fields.set(http::field::access_control_allow_origin, "*");
  fields.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
  fields.set(http::field::access_control_allow_headers, "Content-Type");
}

ApiResponse RestApiHandlerBase::handleRequest(http::request<http::string_body>&& req) {
  const auto version = req.version();
  const bool keep_alive = req.keep_alive();

  if (req.method() == http::verb::options) {
    http::response<http::string_body> res{http::status::no_content, version};
    addCorsHeaders(res.base());
    res.keep_alive(keep_alive);
    res.prepare_payload();
    return res;
  }

  ApiResponse response;
  try {
    response = doHandleRequest(std::move(req));
  } catch (const BadRequestError& e) {
    response = createErrorResponse(http::status::bad_request, e.what());
  } catch (const std::exception& e) {
    std::cerr << "[rest] Unhandled error: " << e.what() << std::endl;
    response = createErrorResponse(http::status::internal_server_error,
                                   "Internal error: " + std::string(e.what()));
  }

  std::visit([&](auto& res) {
    using T = std::decay_t<decltype(res)>;
    if constexpr (std::is_same_v<T, FileResponse>) {
      res.header.version(version);
      res.keep_alive = keep_alive;
      addCorsHeaders(res.header);
    } else {
      res.version(version);
      res.keep_alive(keep_alive);
      addCorsHeaders(res.base());
    }
  }, response);
  return response;
}

bool RestApiHandlerBase::isLongRunning(const http::request<http::string_body>&) const {
  return false;
}

http::response<http::string_body> RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  http::response<http::string_body> res{status, 11};
  res.set(http::field::content_type, "application/json; charset=utf-8");
  res.body() = json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res.prepare_payload();
  return res;
}

http::response<http::string_body> RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message) {

  nlohmann::json error_json = {
    {"error", message}
  };
  return createJsonResponse(status, error_json);
}

nlohmann::json RestApiHandlerBase::parseRequestBody(const std::string& body) {
  if (body.empty()) {
    return nlohmann::json::object();
  }
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    throw BadRequestError("Invalid JSON in request body");
  }
  if (!parsed.is_object()) {
    throw BadRequestError("Request body must be a JSON object");
  }
  return parsed;
}

}
