#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

// A file sent as the response body. The session streams it in bounded chunks
// and drops `owner` after the last byte or when the client goes away; the
// owner's destructor is what deletes the file.
struct FileResponse {
  http::response_header<> header;
  std::filesystem::path path;
  std::optional<std::uint64_t> size;
  std::shared_ptr<void> owner;
  bool keep_alive{true};
};

using ApiResponse = std::variant<http::response<http::string_body>, FileResponse>;

// Thrown by handlers for malformed requests; answered with 400.
class BadRequestError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  // Never throws: handler exceptions become JSON error responses. CORS
  // headers are added to every response, including preflight.
  ApiResponse handleRequest(http::request<http::string_body>&& req);

  // Requests that block for a long time (a whole download) get a thread of
  // their own instead of a pool worker.
  virtual bool isLongRunning(const http::request<http::string_body>& req) const;

protected:
  virtual ApiResponse doHandleRequest(http::request<http::string_body>&& req) = 0;

  http::response<http::string_body> createJsonResponse(
    http::status status, const nlohmann::json& json);

  http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& message);

  // Empty body is an empty object; anything that is not a JSON object is a
  // BadRequestError.
  nlohmann::json parseRequestBody(const std::string& body);

private:
  static void addCorsHeaders(http::fields& fields);
};

}
