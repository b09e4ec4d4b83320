#include "elm_mcp/registry/http_registry_client.hpp"

#include <charconv>
#include <optional>

#include <asio/as_tuple.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include "elm_mcp/utils/scoped_timer.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace elm_mcp::registry {

namespace {

// search.json lists every published package
constexpr std::uint64_t kMaxBodyBytes = 64ULL * 1024 * 1024;
constexpr auto kShutdownTimeout = std::chrono::seconds(2);
constexpr char kUserAgent[] = "elm-mcp/" BOOST_BEAST_VERSION_STRING;

using FetchResult = std::expected<HttpResponse, ToolError>;

// Hand-off between the Beast coroutine and the waiting server coroutine.
// Only touched on the server executor.
struct PendingFetch {
  explicit PendingFetch(asio::any_io_executor executor)
      : signal(std::move(executor), asio::steady_timer::time_point::max()) {
  }
  asio::steady_timer signal;
  std::optional<FetchResult> result;
};

auto MapError(const boost::system::error_code& ec, std::string_view stage)
    -> ToolError {
  if (ec == beast::error::timeout) {
    return ToolError::FromKind(
        ToolErrorKind::kTimedOut,
        fmt::format("Registry request timed out while {}", stage));
  }
  return ToolError::FromKind(
      ToolErrorKind::kUnavailable,
      fmt::format("Registry request failed while {}: {}", stage, ec.message()));
}

template <typename Stream>
auto SendAndReceive(
    Stream& stream, const std::string& host, const std::string& target,
    std::chrono::milliseconds timeout) -> net::awaitable<FetchResult> {
  http::request<http::empty_body> request{http::verb::get, target, 11};
  request.set(http::field::host, host);
  request.set(http::field::user_agent, kUserAgent);
  request.set(http::field::accept, "application/json");

  boost::system::error_code ec;
  beast::get_lowest_layer(stream).expires_after(timeout);
  co_await http::async_write(
      stream, request, net::redirect_error(net::use_awaitable, ec));
  if (ec) {
    co_return std::unexpected(MapError(ec, "sending the request"));
  }

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(kMaxBodyBytes);
  co_await http::async_read(
      stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
  if (ec) {
    co_return std::unexpected(MapError(ec, "reading the response"));
  }

  auto response = parser.release();
  co_return HttpResponse{
      .status = response.result_int(),
      .body = std::move(response.body()),
  };
}

auto DoFetch(
    RegistryEndpoint endpoint, std::string target,
    std::chrono::milliseconds timeout, ssl::context& ssl_context)
    -> net::awaitable<FetchResult> {
  auto executor = co_await net::this_coro::executor;
  boost::system::error_code ec;

  tcp::resolver resolver(executor);
  auto results = co_await resolver.async_resolve(
      endpoint.host, endpoint.port, net::redirect_error(net::use_awaitable, ec));
  if (ec) {
    co_return std::unexpected(MapError(ec, "resolving the host"));
  }

  if (!endpoint.tls) {
    beast::tcp_stream stream(executor);
    stream.expires_after(timeout);
    co_await stream.async_connect(
        results, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
      co_return std::unexpected(MapError(ec, "connecting"));
    }
    auto response = co_await SendAndReceive(stream, endpoint.host, target, timeout);
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
  }

  beast::ssl_stream<beast::tcp_stream> stream(executor, ssl_context);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kUnavailable, "Failed to set TLS server name");
  }
  stream.set_verify_callback(ssl::host_name_verification(endpoint.host));

  beast::get_lowest_layer(stream).expires_after(timeout);
  co_await beast::get_lowest_layer(stream).async_connect(
      results, net::redirect_error(net::use_awaitable, ec));
  if (ec) {
    co_return std::unexpected(MapError(ec, "connecting"));
  }
  co_await stream.async_handshake(
      ssl::stream_base::client, net::redirect_error(net::use_awaitable, ec));
  if (ec) {
    co_return std::unexpected(MapError(ec, "negotiating TLS"));
  }

  auto response = co_await SendAndReceive(stream, endpoint.host, target, timeout);

  // Servers commonly drop the connection without close_notify
  beast::get_lowest_layer(stream).expires_after(kShutdownTimeout);
  co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
  co_return response;
}

}  // namespace

auto RegistryEndpoint::Parse(std::string_view url)
    -> std::optional<RegistryEndpoint> {
  RegistryEndpoint endpoint;
  if (url.starts_with("https://")) {
    endpoint.tls = true;
    url.remove_prefix(8);
  } else if (url.starts_with("http://")) {
    endpoint.tls = false;
    url.remove_prefix(7);
  } else {
    return std::nullopt;
  }

  auto slash = url.find('/');
  auto authority = url.substr(0, slash);
  if (slash != std::string_view::npos) {
    auto path = url.substr(slash);
    while (path.ends_with('/')) {
      path.remove_suffix(1);
    }
    endpoint.base_path = std::string(path);
  }

  auto colon = authority.find(':');
  endpoint.host = std::string(authority.substr(0, colon));
  if (colon != std::string_view::npos) {
    auto port_text = authority.substr(colon + 1);
    int port = 0;
    auto [ptr, ec] = std::from_chars(
        port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc{} || ptr != port_text.data() + port_text.size() ||
        port <= 0 || port > 65535) {
      return std::nullopt;
    }
    endpoint.port = std::string(port_text);
  } else {
    endpoint.port = endpoint.tls ? "443" : "80";
  }

  if (endpoint.host.empty()) {
    return std::nullopt;
  }
  return endpoint;
}

HttpRegistryClient::HttpRegistryClient(
    asio::any_io_executor executor, RegistryEndpoint endpoint,
    std::chrono::milliseconds timeout, std::shared_ptr<spdlog::logger> logger)
    : executor_(std::move(executor)),
      endpoint_(std::move(endpoint)),
      timeout_(timeout),
      logger_(logger ? logger : spdlog::default_logger()),
      work_guard_(boost::asio::make_work_guard(io_context_)),
      ssl_context_(ssl::context::tls_client) {
  ssl_context_.set_default_verify_paths();
  ssl_context_.set_verify_mode(ssl::verify_peer);
  io_thread_ = std::thread([this]() { io_context_.run(); });
}

HttpRegistryClient::~HttpRegistryClient() {
  work_guard_.reset();
  io_context_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

auto HttpRegistryClient::Get(std::string target)
    -> asio::awaitable<std::expected<HttpResponse, ToolError>> {
  auto full_target = endpoint_.base_path + target;
  utils::ScopedTimer timer(fmt::format("GET {}", full_target), logger_);

  auto pending = std::make_shared<PendingFetch>(executor_);
  net::co_spawn(
      io_context_,
      DoFetch(endpoint_, full_target, timeout_, ssl_context_),
      [pending, executor = executor_](
          std::exception_ptr error, FetchResult result) mutable {
        if (error) {
          try {
            std::rethrow_exception(error);
          } catch (const std::exception& e) {
            result = ToolError::UnexpectedFromKind(
                ToolErrorKind::kUnavailable,
                fmt::format("Registry request failed: {}", e.what()));
          }
        }
        asio::post(
            executor, [pending, result = std::move(result)]() mutable {
              pending->result = std::move(result);
              pending->signal.cancel();
            });
      });

  // The server executor is single-threaded, so the result cannot land
  // between this check and the wait
  if (!pending->result) {
    co_await pending->signal.async_wait(asio::as_tuple(asio::use_awaitable));
  }
  if (!pending->result) {
    logger_->debug("HttpRegistryClient abandoned GET {}", full_target);
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kCancelled,
        fmt::format("Registry request for {} was cancelled", full_target));
  }

  auto result = std::move(*pending->result);
  if (result) {
    logger_->debug(
        "HttpRegistryClient GET {} -> {} ({} bytes)", full_target,
        result->status, result->body.size());
  } else {
    timer.MarkFailed(result.error().Message());
  }
  co_return result;
}

auto HttpRegistryClient::GetJson(std::string target)
    -> asio::awaitable<std::expected<nlohmann::json, ToolError>> {
  auto response = co_await Get(target);
  if (!response) {
    co_return std::unexpected(response.error());
  }

  if (response->status == 404) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kNotFound,
        fmt::format("The registry has no {}", target));
  }
  if (response->status != 200) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kUnavailable,
        fmt::format(
            "The registry answered {} with HTTP {}", target, response->status));
  }

  auto document = nlohmann::json::parse(response->body, nullptr, false);
  if (document.is_discarded()) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kUnavailable,
        fmt::format("The registry returned malformed JSON for {}", target));
  }
  co_return document;
}

auto HttpRegistryClient::FetchAllPackages()
    -> asio::awaitable<std::expected<nlohmann::json, ToolError>> {
  co_return co_await GetJson("/search.json");
}

auto HttpRegistryClient::FetchReleases(std::string author, std::string name)
    -> asio::awaitable<std::expected<nlohmann::json, ToolError>> {
  co_return co_await GetJson(
      fmt::format("/packages/{}/{}/releases.json", author, name));
}

auto HttpRegistryClient::FetchDocs(
    std::string author, std::string name, packages::Version version)
    -> asio::awaitable<std::expected<nlohmann::json, ToolError>> {
  co_return co_await GetJson(
      fmt::format("/packages/{}/{}/{}/docs.json", author, name, version));
}

}  // namespace elm_mcp::registry
