#pragma once
#include <cstddef>
#include <memory>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include "common/restful/rest_api_handler_base.hpp"
#include "common/thread_pool.hpp"
#include "common/worker_registry.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace common {

// Reads requests asynchronously on its strand, then hands each one to a
// worker: the shared pool for short requests, a dedicated thread for long
// ones. There the handler runs and the response is written with blocking
// calls. Reading resumes on the strand once the response is out.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket,
              std::shared_ptr<RestApiHandlerBase> api_handler,
              ThreadPool& pool,
              WorkerRegistry& workers,
              std::size_t chunk_size);

  void run();

private:
  void doRead();
  void onRead(beast::error_code ec, std::size_t bytes_transferred);
  void process();
  bool writeString(http::response<http::string_body>& res);
  bool writeFile(FileResponse& file);
  void doClose();

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
  ThreadPool& pool_;
  WorkerRegistry& workers_;
  std::size_t chunk_size_;
};

class HttpServer {
public:
  HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<RestApiHandlerBase> api_handler,
             ThreadPool& pool,
             WorkerRegistry& workers,
             std::size_t chunk_size);

  void run();
  // Stops accepting; connections already open are left alone.
  void stop();

  // The bound address; differs from the requested one when port 0 was asked for.
  tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

private:
  void doAccept();
  void onAccept(beast::error_code ec, tcp::socket socket);

  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
  ThreadPool& pool_;
  WorkerRegistry& workers_;
  std::size_t chunk_size_;
};

}
