#include "http_server.hpp"
#include <fstream>
#include <iostream>
#include <vector>

namespace common {

// HttpServer implementation
HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
                       std::shared_ptr<RestApiHandlerBase> api_handler,
                       ThreadPool& pool,
                       WorkerRegistry& workers,
                       std::size_t chunk_size)
  : ioc_(ioc), acceptor_(ioc), api_handler_(std::move(api_handler)),
    pool_(pool), workers_(workers), chunk_size_(chunk_size == 0 ? 1 : chunk_size) {

  beast::error_code ec;

  acceptor_.open(endpoint.protocol(), ec);
  if (ec) {
    throw std::runtime_error("Failed to open acceptor: " + ec.message());
  }

  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (ec) {
    throw std::runtime_error("Failed to set reuse_address: " + ec.message());
  }

  acceptor_.bind(endpoint, ec);
  if (ec) {
    throw std::runtime_error("Failed to bind: " + ec.message());
  }

  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("Failed to listen: " + ec.message());
  }
}

void HttpServer::run() {
  doAccept();
}

void HttpServer::stop() {
  net::dispatch(acceptor_.get_executor(), [this]() {
    beast::error_code ec;
    acceptor_.close(ec);
  });
}

void HttpServer::doAccept() {
  acceptor_.async_accept(
    net::make_strand(ioc_),
    beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
    return;
  }
  if (ec) {
    std::cerr << "[http] Accept error: " << ec.message() << std::endl;
  } else {
    std::make_shared<HttpSession>(std::move(socket), api_handler_, pool_, workers_, chunk_size_)->run();
  }

  doAccept();
}

// HttpSession implementation
HttpSession::HttpSession(tcp::socket&& socket,
                         std::shared_ptr<RestApiHandlerBase> api_handler,
                         ThreadPool& pool,
                         WorkerRegistry& workers,
                         std::size_t chunk_size)
  : stream_(std::move(socket)), api_handler_(std::move(api_handler)),
    pool_(pool), workers_(workers), chunk_size_(chunk_size) {}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
  req_ = {};

  stream_.expires_after(std::chrono::seconds(30));

  http::async_read(stream_, buffer_, req_,
                   beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::end_of_stream) {
    return doClose();
  }

  if (ec) {
    if (ec != beast::error::timeout) {
      std::cerr << "[http] Read error: " << ec.message() << std::endl;
    }
    return;
  }

  stream_.expires_never();
  try {
    auto task = [self = shared_from_this()]() { self->process(); };
    if (api_handler_->isLongRunning(req_)) {
      workers_.spawn(std::move(task));
    } else {
      pool_.commit(std::move(task));
    }
  } catch (const std::exception& e) {
    std::cerr << "[http] Dropping request: " << e.what() << std::endl;
    doClose();
  }
}

void HttpSession::process() {
  auto response = api_handler_->handleRequest(std::move(req_));

  bool keep_alive = std::visit([this](auto& res) {
    using T = std::decay_t<decltype(res)>;
    if constexpr (std::is_same_v<T, FileResponse>) {
      bool keep = res.keep_alive;
      bool ok = writeFile(res);
      // deletes the file as soon as the transfer is over, however it ended
      res.owner.reset();
      return ok && keep;
    } else {
      return writeString(res) && !res.need_eof();
    }
  }, response);

  if (!keep_alive) {
    return doClose();
  }
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

bool HttpSession::writeString(http::response<http::string_body>& res) {
  beast::error_code ec;
  http::write(stream_, res, ec);
  if (ec) {
    std::cerr << "[http] Write error: " << ec.message() << std::endl;
    return false;
  }
  return true;
}

bool HttpSession::writeFile(FileResponse& file) {
  std::ifstream in(file.path, std::ios::binary);
  if (!in) {
    std::cerr << "[http] Cannot open " << file.path << " for streaming" << std::endl;
    http::response<http::string_body> res{http::status::internal_server_error, file.header.version()};
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.set(http::field::access_control_allow_origin, "*");
    res.body() = R"({"error":"Downloaded file could not be read"})";
    res.keep_alive(false);
    res.prepare_payload();
    writeString(res);
    return false;
  }

  http::response<http::buffer_body> res{std::move(file.header)};
  res.keep_alive(file.keep_alive);
  if (file.size) {
    res.content_length(*file.size);
  } else {
    res.chunked(true);
  }
  res.body().data = nullptr;
  res.body().more = true;

  http::response_serializer<http::buffer_body> sr{res};
  beast::error_code ec;
  http::write_header(stream_, sr, ec);
  if (ec) {
    std::cerr << "[http] Client went away before the body: " << ec.message() << std::endl;
    return false;
  }

  std::vector<char> chunk(chunk_size_);
  std::uint64_t sent = 0;
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    auto count = in.gcount();
    if (count <= 0) {
      break;
    }
    res.body().data = chunk.data();
    res.body().size = static_cast<std::size_t>(count);
    res.body().more = true;
    http::write(stream_, sr, ec);
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      std::cerr << "[http] Transfer aborted after " << sent << " bytes: " << ec.message() << std::endl;
      return false;
    }
    sent += static_cast<std::uint64_t>(count);
  }

  if (in.bad()) {
    std::cerr << "[http] Read failure on " << file.path << " after " << sent << " bytes" << std::endl;
    return false;
  }
  if (file.size && sent != *file.size) {
    std::cerr << "[http] " << file.path << " changed size during transfer" << std::endl;
    return false;
  }

  res.body().data = nullptr;
  res.body().size = 0;
  res.body().more = false;
  http::write(stream_, sr, ec);
  if (ec) {
    std::cerr << "[http] Write error: " << ec.message() << std::endl;
    return false;
  }
  return true;
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
