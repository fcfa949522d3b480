#include "http_server.hpp"
#include "common/logging/logger.hpp"

namespace common {

// HttpServer implementation
HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint, 
                       std::shared_ptr<RestApiHandlerBase> api_handler,
                       std::chrono::seconds io_timeout)
  : ioc_(ioc), acceptor_(net::make_strand(ioc)), api_handler_(api_handler), io_timeout_(io_timeout) {
  
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
  net::post(acceptor_.get_executor(), [this] {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) {
      Logger::warn("Failed to close acceptor: " + ec.message());
    }
  });
}

unsigned short HttpServer::port() const {
  return acceptor_.local_endpoint().port();
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
    Logger::error("Accept error: " + ec.message());
  } else {
    std::make_shared<HttpSession>(std::move(socket), api_handler_, io_timeout_)->run();
  }
  
  doAccept();
}

// HttpSession implementation
HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler,
                         std::chrono::seconds io_timeout)
  : stream_(std::move(socket)), api_handler_(api_handler), io_timeout_(io_timeout) {}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
  req_ = {};
  
  stream_.expires_after(io_timeout_);
  
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
      Logger::error("Read error: " + ec.message());
    }
    return;
  }
  
  // The handler runs the whole pipeline synchronously; no timer may be armed meanwhile.
  stream_.expires_never();
  auto response = std::make_shared<http::response<http::string_body>>(
    api_handler_->handleRequest(std::move(req_)));
  
  res_ = response;
  
  stream_.expires_after(io_timeout_);
  http::async_write(stream_, *response,
                    beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                            response->need_eof()));
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);
  
  if (ec) {
    Logger::error("Write error: " + ec.message());
    return;
  }
  
  if (close) {
    return doClose();
  }
  
  res_ = nullptr;
  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
