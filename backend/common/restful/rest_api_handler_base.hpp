#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

// Body sink for chunked responses. The header goes out with the first write,
// so it can still be changed until then.
class StreamWriter {
public:
  virtual ~StreamWriter() = default;
  virtual http::response<http::empty_body>& header() = 0;
  // false once the peer is gone.
  virtual bool write(std::string_view chunk) = 0;
  virtual bool started() const = 0;
};

// A response whose body is produced on a worker thread. `produce` returns an
// error response to send instead, which only has an effect while nothing has
// been written; after that a failure drops the connection.
struct StreamingReply {
  http::response<http::empty_body> header;
  std::function<std::optional<http::response<http::string_body>>(StreamWriter&)> produce;
};

using Reply = std::variant<http::response<http::string_body>, StreamingReply>;

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  Reply handleRequest(http::request<Body, http::basic_fields<Allocator>>&& req) {
    if (req.method() == http::verb::options) {
      http::response<http::string_body> res{http::status::no_content, req.version()};
      addCorsHeaders(res);
      res.prepare_payload();
      return res;
    }

    try {
      auto reply = doHandleRequest(std::move(req));
      std::visit([](auto& r) {
        if constexpr (std::is_same_v<std::decay_t<decltype(r)>, StreamingReply>) {
          addCorsHeaders(r.header);
        } else {
          addCorsHeaders(r);
        }
      }, reply);
      return reply;
    } catch (const std::invalid_argument& e) {
      auto response = createErrorResponse(http::status::bad_request, e.what());
      addCorsHeaders(response);
      return response;
    } catch (const std::exception& e) {
      auto response = createErrorResponse(http::status::internal_server_error,
                                          "Internal server error: " + std::string(e.what()));
      addCorsHeaders(response);
      return response;
    }
  }

  template<class Response>
  static void addCorsHeaders(Response& res) {
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type, Authorization, X-Workout-ID");
    res.set(http::field::access_control_expose_headers, "X-Workout-ID, X-Exercise-Count");
  }

  static http::response<http::string_body> createJsonResponse(
    http::status status, const nlohmann::json& json);

  // {"detail": message}
  static http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& message);

protected:
  virtual Reply doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) = 0;

  nlohmann::json parseRequestBody(const std::string& body);
};

}
