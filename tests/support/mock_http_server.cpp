#include "mock_http_server.hpp"
#include <iostream>

namespace test_support {

MockHttpServer::MockHttpServer(MockHandler handler)
  : acceptor_(ioc_), handler_(std::move(handler)) {

  tcp::endpoint endpoint(net::ip::make_address("127.0.0.1"), 0);
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
  port_ = acceptor_.local_endpoint().port();

  doAccept();
  thread_ = std::thread([this] { ioc_.run(); });
}

MockHttpServer::~MockHttpServer() {
  ioc_.stop();
  if (thread_.joinable()) thread_.join();
}

std::string MockHttpServer::url(const std::string& target) const {
  return "http://127.0.0.1:" + std::to_string(port_) + target;
}

void MockHttpServer::doAccept() {
  acceptor_.async_accept(
    net::make_strand(ioc_),
    beast::bind_front_handler(&MockHttpServer::onAccept, this));
}

void MockHttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec) {
    if (ec == net::error::operation_aborted) return;
    std::cerr << "Accept error: " << ec.message() << std::endl;
  } else {
    std::make_shared<MockHttpSession>(std::move(socket), handler_)->run();
  }

  doAccept();
}

MockHttpSession::MockHttpSession(tcp::socket&& socket, MockHandler handler)
  : stream_(std::move(socket)), handler_(std::move(handler)) {}

void MockHttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&MockHttpSession::doRead, shared_from_this()));
}

void MockHttpSession::doRead() {
  req_ = {};

  stream_.expires_after(std::chrono::seconds(30));

  http::async_read(stream_, buffer_, req_,
                   beast::bind_front_handler(&MockHttpSession::onRead, shared_from_this()));
}

void MockHttpSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::end_of_stream) {
    return doClose();
  }

  if (ec) {
    return;
  }

  res_ = std::make_shared<MockResponse>(handler_(req_));

  http::async_write(stream_, *res_,
                    beast::bind_front_handler(&MockHttpSession::onWrite, shared_from_this(),
                                              res_->need_eof()));
}

void MockHttpSession::onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    return;
  }

  if (close) {
    return doClose();
  }

  res_ = nullptr;
  doRead();
}

void MockHttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

MockResponse makeResponse(const MockRequest& req, http::status status, std::string body,
                          const std::string& content_type) {
  MockResponse res{status, req.version()};
  res.set(http::field::server, "sed-dl-test");
  res.set(http::field::content_type, content_type);
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

}
