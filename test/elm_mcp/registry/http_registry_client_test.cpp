#include "elm_mcp/registry/http_registry_client.hpp"

#include <chrono>
#include <memory>
#include <string>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "test/elm_mcp/common/async_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::warn;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using elm_mcp::ToolErrorKind;
using elm_mcp::packages::Version;
using elm_mcp::registry::HttpRegistryClient;
using elm_mcp::registry::RegistryEndpoint;
using elm_mcp::test::RunAsyncTest;

using namespace std::chrono_literals;

namespace {

auto HttpResponseText(int status, std::string_view reason, std::string_view body)
    -> std::string {
  return fmt::format(
      "HTTP/1.1 {} {}\r\nContent-Type: application/json\r\n"
      "Content-Length: {}\r\nConnection: close\r\n\r\n{}",
      status, reason, body.size(), body);
}

// Accepts one connection, records the request head, answers after delay
auto ServeOnce(
    asio::ip::tcp::acceptor& acceptor, std::string response,
    std::chrono::milliseconds delay, std::shared_ptr<std::string> request)
    -> asio::awaitable<void> {
  auto [accept_ec, socket] =
      co_await acceptor.async_accept(asio::as_tuple(asio::use_awaitable));
  if (accept_ec) {
    co_return;
  }

  std::string buffer;
  auto [read_ec, n] = co_await asio::async_read_until(
      socket, asio::dynamic_buffer(buffer), "\r\n\r\n",
      asio::as_tuple(asio::use_awaitable));
  if (read_ec) {
    co_return;
  }
  *request = buffer.substr(0, n);

  if (delay > 0ms) {
    asio::steady_timer timer(co_await asio::this_coro::executor, delay);
    co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
  }

  co_await asio::async_write(
      socket, asio::buffer(response), asio::as_tuple(asio::use_awaitable));
  asio::error_code ignored;
  socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
}

struct LocalRegistry {
  asio::ip::tcp::acceptor acceptor;
  std::shared_ptr<std::string> last_request = std::make_shared<std::string>();

  explicit LocalRegistry(asio::any_io_executor executor)
      : acceptor(
            executor, asio::ip::tcp::endpoint(
                          asio::ip::make_address("127.0.0.1"), 0)) {
  }

  [[nodiscard]] auto Endpoint() const -> RegistryEndpoint {
    return RegistryEndpoint{
        .tls = false,
        .host = "127.0.0.1",
        .port = std::to_string(acceptor.local_endpoint().port()),
        .base_path = "/registry",
    };
  }

  void Answer(std::string response, std::chrono::milliseconds delay = 0ms) {
    asio::co_spawn(
        acceptor.get_executor(),
        ServeOnce(acceptor, std::move(response), delay, last_request),
        asio::detached);
  }
};

}  // namespace

TEST_CASE("RegistryEndpoint parses registry URLs", "[http]") {
  auto https = RegistryEndpoint::Parse("https://package.elm-lang.org");
  REQUIRE(https.has_value());
  CHECK(https->tls);
  CHECK(https->host == "package.elm-lang.org");
  CHECK(https->port == "443");
  CHECK(https->base_path.empty());

  auto local = RegistryEndpoint::Parse("http://localhost:8000/mirror/");
  REQUIRE(local.has_value());
  CHECK_FALSE(local->tls);
  CHECK(local->host == "localhost");
  CHECK(local->port == "8000");
  CHECK(local->base_path == "/mirror");

  CHECK_FALSE(RegistryEndpoint::Parse("ftp://example.com").has_value());
  CHECK_FALSE(RegistryEndpoint::Parse("http://:80").has_value());
  CHECK_FALSE(RegistryEndpoint::Parse("http://host:99999").has_value());
}

TEST_CASE("HttpRegistryClient decodes a release list", "[http]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    LocalRegistry registry(executor);
    HttpRegistryClient client(executor, registry.Endpoint(), 5s);
    registry.Answer(HttpResponseText(200, "OK", R"({"1.0.0":1,"1.0.5":2})"));

    auto releases = co_await client.FetchReleases("elm", "core");

    REQUIRE(releases.has_value());
    CHECK((*releases)["1.0.5"] == 2);
    CHECK(registry.last_request->starts_with(
        "GET /registry/packages/elm/core/releases.json HTTP/1.1\r\n"));
  });
}

TEST_CASE("HttpRegistryClient requests docs by version", "[http]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    LocalRegistry registry(executor);
    HttpRegistryClient client(executor, registry.Endpoint(), 5s);
    registry.Answer(HttpResponseText(200, "OK", "[]"));

    auto docs =
        co_await client.FetchDocs("elm", "json", *Version::Parse("1.1.3"));

    REQUIRE(docs.has_value());
    CHECK(docs->is_array());
    CHECK(registry.last_request->starts_with(
        "GET /registry/packages/elm/json/1.1.3/docs.json HTTP/1.1\r\n"));
  });
}

TEST_CASE("HttpRegistryClient maps 404 to NotFound", "[http]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    LocalRegistry registry(executor);
    HttpRegistryClient client(executor, registry.Endpoint(), 5s);
    registry.Answer(HttpResponseText(404, "Not Found", "not found"));

    auto releases = co_await client.FetchReleases("nobody", "nothing");

    REQUIRE_FALSE(releases.has_value());
    CHECK(releases.error().Kind() == ToolErrorKind::kNotFound);
  });
}

TEST_CASE("HttpRegistryClient maps server errors to Unavailable", "[http]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    LocalRegistry registry(executor);
    HttpRegistryClient client(executor, registry.Endpoint(), 5s);
    registry.Answer(HttpResponseText(503, "Service Unavailable", "busy"));

    auto packages = co_await client.FetchAllPackages();

    REQUIRE_FALSE(packages.has_value());
    CHECK(packages.error().Kind() == ToolErrorKind::kUnavailable);
    CHECK(packages.error().Retryable());
  });
}

TEST_CASE("HttpRegistryClient rejects malformed JSON", "[http]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    LocalRegistry registry(executor);
    HttpRegistryClient client(executor, registry.Endpoint(), 5s);
    registry.Answer(HttpResponseText(200, "OK", R"([{"name": "elm/co)"));

    auto packages = co_await client.FetchAllPackages();

    REQUIRE_FALSE(packages.has_value());
    CHECK(packages.error().Kind() == ToolErrorKind::kUnavailable);
  });
}

TEST_CASE("HttpRegistryClient times out a silent server", "[http]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    LocalRegistry registry(executor);
    HttpRegistryClient client(executor, registry.Endpoint(), 200ms);
    registry.Answer(HttpResponseText(200, "OK", "[]"), 1500ms);

    const auto start = std::chrono::steady_clock::now();
    auto packages = co_await client.FetchAllPackages();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(packages.has_value());
    CHECK(packages.error().Kind() == ToolErrorKind::kTimedOut);
    CHECK(elapsed < 1500ms);
  });
}

TEST_CASE("HttpRegistryClient reports refused connections", "[http]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    RegistryEndpoint endpoint;
    {
      // Take a free port, then release it so nothing listens there
      LocalRegistry released(executor);
      endpoint = released.Endpoint();
    }
    HttpRegistryClient client(executor, endpoint, 2s);

    auto packages = co_await client.FetchAllPackages();

    REQUIRE_FALSE(packages.has_value());
    CHECK(packages.error().Kind() == ToolErrorKind::kUnavailable);
  });
}
