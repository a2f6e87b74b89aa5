#include "http_server.hpp"
#include "common/logger.hpp"

namespace common {

namespace {
class ChunkedWriter : public StreamWriter {
public:
  ChunkedWriter(tcp::socket& socket, http::response<http::empty_body> header)
    : socket_(socket), header_(std::move(header)) {}

  http::response<http::empty_body>& header() override { return header_; }
  bool started() const override { return started_; }

  bool write(std::string_view chunk) override {
    if (failed_) return false;
    beast::error_code ec;
    if (!started_) {
      started_ = true;
      header_.chunked(true);
      http::response_serializer<http::empty_body> sr{header_};
      http::write_header(socket_, sr, ec);
      if (ec) return fail(ec);
    }
    if (chunk.empty()) return true;
    net::write(socket_, http::make_chunk(net::const_buffer(chunk.data(), chunk.size())), ec);
    if (ec) return fail(ec);
    return true;
  }

  bool finish() {
    if (!write({})) return false;
    beast::error_code ec;
    net::write(socket_, http::make_chunk_last(), ec);
    if (ec) return fail(ec);
    return true;
  }

private:
  bool fail(const beast::error_code& ec) {
    failed_ = true;
    Logger::info("client went away during stream: " + ec.message());
    return false;
  }

  tcp::socket& socket_;
  http::response<http::empty_body> header_;
  bool started_{false};
  bool failed_{false};
};
}

// HttpServer implementation
HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
                       std::shared_ptr<RestApiHandlerBase> api_handler,
                       std::shared_ptr<ThreadPool> stream_pool)
  : ioc_(ioc), acceptor_(ioc), api_handler_(api_handler), stream_pool_(stream_pool) {

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
  beast::error_code ec;
  acceptor_.close(ec);
}

void HttpServer::doAccept() {
  acceptor_.async_accept(
    net::make_strand(ioc_),
    beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) {
    return;
  }
  if (ec) {
    Logger::error("Accept error: " + ec.message());
  } else {
    std::make_shared<HttpSession>(std::move(socket), api_handler_, stream_pool_)->run();
  }

  doAccept();
}

// HttpSession implementation
HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler,
                         std::shared_ptr<ThreadPool> stream_pool)
  : stream_(std::move(socket)), api_handler_(api_handler), stream_pool_(stream_pool) {}

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
    Logger::warn("Read error: " + ec.message());
    return;
  }

  Logger::debug(std::string(req_.method_string()) + " " + std::string(req_.target()));
  auto version = req_.version();
  auto reply = api_handler_->handleRequest(std::move(req_));

  if (auto* streaming = std::get_if<StreamingReply>(&reply)) {
    stream_.expires_never();
    try {
      stream_pool_->commit([self = shared_from_this(), r = std::move(*streaming), version]() mutable {
        self->runStream(std::move(r), version);
      });
    } catch (const std::runtime_error& e) {
      Logger::error(std::string("cannot schedule stream: ") + e.what());
      doClose();
    }
    return;
  }

  auto response = std::make_shared<http::response<http::string_body>>(
    std::move(std::get<http::response<http::string_body>>(reply)));
  response->version(version);

  res_ = response;

  http::async_write(stream_, *response,
                    beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                            response->need_eof()));
}

void HttpSession::runStream(StreamingReply reply, unsigned version) {
  reply.header.version(version);
  reply.header.keep_alive(false);
  ChunkedWriter writer(stream_.socket(), std::move(reply.header));

  std::optional<http::response<http::string_body>> error;
  try {
    error = reply.produce(writer);
  } catch (const std::exception& e) {
    Logger::error(std::string("stream producer failed: ") + e.what());
    error = RestApiHandlerBase::createErrorResponse(http::status::internal_server_error,
                                                    "Internal server error: " + std::string(e.what()));
  }

  beast::error_code ec;
  if (error && !writer.started()) {
    error->version(version);
    error->keep_alive(false);
    RestApiHandlerBase::addCorsHeaders(*error);
    http::write(stream_.socket(), *error, ec);
  } else if (!error) {
    writer.finish();
  }
  // A failure after the first chunk leaves the body unterminated so the
  // client sees a truncated transfer.
  stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
  stream_.socket().close(ec);
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    Logger::warn("Write error: " + ec.message());
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
