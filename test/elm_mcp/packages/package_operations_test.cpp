#include "elm_mcp/packages/package_operations.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "test/elm_mcp/common/async_fixture.hpp"
#include "test/elm_mcp/common/fake_registry_client.hpp"
#include "test/elm_mcp/common/project_fixture.hpp"
#include "test/elm_mcp/common/sample_docs.hpp"

constexpr auto kLogLevel = spdlog::level::warn;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using elm_mcp::ToolError;
using elm_mcp::ToolErrorKind;
using elm_mcp::packages::ManifestToolOptions;
using elm_mcp::packages::PackageOperations;
using elm_mcp::packages::PackageRef;
using elm_mcp::packages::ToolMessage;
using elm_mcp::packages::Version;
using elm_mcp::process::ProcessOutput;
using elm_mcp::process::ProcessRequest;
using elm_mcp::process::ProcessRunner;
using elm_mcp::registry::PackageRegistry;
using elm_mcp::registry::RegistryCache;
using elm_mcp::test::FakeRegistryClient;
using elm_mcp::test::ProjectFixture;
using elm_mcp::test::RunAsyncTest;
using elm_mcp::test::SampleDocs;
using json = nlohmann::json;

using namespace std::chrono_literals;

namespace {

using RunResult = std::expected<ProcessOutput, ToolError>;

// Stands in for elm-json: records each invocation and answers with whatever
// the test scripted
class FakeManifestTool : public ProcessRunner {
 public:
  using ProcessRunner::ProcessRunner;

  std::vector<ProcessRequest> requests;
  std::function<RunResult(const ProcessRequest&)> behaviour =
      [](const ProcessRequest&) -> RunResult { return ProcessOutput{}; };

  auto Run(ProcessRequest request)
      -> asio::awaitable<std::expected<ProcessOutput, ToolError>> override {
    requests.push_back(request);
    co_return behaviour(requests.back());
  }
};

constexpr std::string_view kManifest = R"({
    "type": "application",
    "source-directories": ["src"],
    "elm-version": "0.19.1",
    "dependencies": {
        "direct": {
            "elm/browser": "1.0.2",
            "elm/core": "1.0.5"
        },
        "indirect": {
            "elm/json": "1.1.3"
        }
    },
    "test-dependencies": {
        "direct": {},
        "indirect": {}
    }
})";

struct OperationsHarness {
  ProjectFixture project{"elm_mcp_ops"};
  ProjectFixture elm_home{"elm_mcp_ops_home"};
  std::shared_ptr<FakeRegistryClient> client =
      std::make_shared<FakeRegistryClient>();
  std::shared_ptr<FakeManifestTool> tool;
  std::shared_ptr<PackageRegistry> registry;
  std::unique_ptr<PackageOperations> operations;

  explicit OperationsHarness(asio::any_io_executor executor)
      : tool(std::make_shared<FakeManifestTool>(executor)),
        registry(std::make_shared<PackageRegistry>(
            client, std::make_shared<RegistryCache>(64, 300s),
            elm_home.Root())) {
    project.WriteFile("elm.json", kManifest);
    client->AddPackage("elm/core", "Elm's standard libraries", {"1.0.5"});
    client->AddPackage("elm/http", "Make HTTP requests", {"1.0.0", "2.0.0"});
    client->AddPackage("elm/json", "Encode and decode JSON", {"1.1.3", "1.1.4"});
    operations = std::make_unique<PackageOperations>(
        project.Root(), tool, registry,
        ManifestToolOptions{.command = "elm-json", .timeout = 5s});
  }

  [[nodiscard]] auto Manifest() const -> json {
    return json::parse(project.ReadFile("elm.json"));
  }

  void SaveManifest(const json& manifest) const {
    project.WriteFile("elm.json", manifest.dump(4));
  }

  // Mimics a successful "install": records the package in the section
  void InstallOnRun(std::string full_name, std::string version, bool test) {
    tool->behaviour = [this, full_name, version,
                       test](const ProcessRequest&) -> RunResult {
      auto manifest = Manifest();
      manifest[test ? "test-dependencies" : "dependencies"]["direct"]
              [full_name] = version;
      SaveManifest(manifest);
      return ProcessOutput{.exit_code = 0, .stdout_data = "Done!"};
    };
  }

  void FailOnRun(std::string message) {
    tool->behaviour = [message](const ProcessRequest&) -> RunResult {
      return ProcessOutput{
          .exit_code = 1,
          .stderr_data = "\x1b[31m" + message + "\x1b[0m\n",
      };
    };
  }
};

auto Ref(std::string author, std::string name) -> PackageRef {
  return PackageRef{.author = std::move(author), .name = std::move(name)};
}

auto Ref(std::string author, std::string name, Version version) -> PackageRef {
  return PackageRef{
      .author = std::move(author), .name = std::move(name), .version = version};
}

}  // namespace

TEST_CASE("ToolMessage cleans tool output", "[package_operations]") {
  CHECK(
      ToolMessage(ProcessOutput{.exit_code = 1, .stderr_data = "\x1b[1;31mNo!\x1b[0m\n"}) ==
      "No!");
  CHECK(
      ToolMessage(ProcessOutput{.exit_code = 1, .stdout_data = "  from stdout \n"}) ==
      "from stdout");
  CHECK(ToolMessage(ProcessOutput{.exit_code = 3}) == "exited with code 3");
}

TEST_CASE("AddPackage installs a new dependency", "[package_operations]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    OperationsHarness harness(executor);
    harness.InstallOnRun("elm/http", "2.0.0", false);

    auto added = co_await harness.operations->AddPackage(
        Ref("elm", "http", Version{2, 0, 0}), false);

    REQUIRE(added.has_value());
    CHECK_FALSE(added->already_present);
    CHECK(added->package.version == Version{2, 0, 0});

    REQUIRE(harness.tool->requests.size() == 1);
    const auto& request = harness.tool->requests.front();
    CHECK(request.program == "elm-json");
    CHECK(request.working_dir == harness.project.Root());
    CHECK(request.timeout == 5s);
    CHECK(
        request.args ==
        std::vector<std::string>{"install", "--yes", "elm/http@2.0.0"});
  });
}

TEST_CASE("AddPackage reports the version the tool chose", "[package_operations]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    OperationsHarness harness(executor);
    harness.InstallOnRun("elm/http", "2.0.0", true);

    auto added =
        co_await harness.operations->AddPackage(Ref("elm", "http"), true);

    REQUIRE(added.has_value());
    CHECK(added->package.version == Version{2, 0, 0});
    REQUIRE(harness.tool->requests.size() == 1);
    CHECK(
        harness.tool->requests.front().args ==
        std::vector<std::string>{"install", "--yes", "--test", "elm/http"});
    CHECK(
        harness.Manifest()["test-dependencies"]["direct"]["elm/http"] ==
        "2.0.0");
  });
}

TEST_CASE("AddPackage leaves existing dependencies alone", "[package_operations]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    OperationsHarness harness(executor);

    SECTION("same version") {
      auto added = co_await harness.operations->AddPackage(
          Ref("elm", "core", Version{1, 0, 5}), false);
      REQUIRE(added.has_value());
      CHECK(added->already_present);
      CHECK(added->package.version == Version{1, 0, 5});
    }

    SECTION("no version requested") {
      auto added =
          co_await harness.operations->AddPackage(Ref("elm", "browser"), false);
      REQUIRE(added.has_value());
      CHECK(added->already_present);
      CHECK(added->package.version == Version{1, 0, 2});
    }

    SECTION("different version") {
      auto added = co_await harness.operations->AddPackage(
          Ref("elm", "core", Version{1, 0, 4}), false);
      REQUIRE_FALSE(added.has_value());
      CHECK(added.error().Kind() == ToolErrorKind::kConflictingConstraints);
    }

    SECTION("test dependency already a normal dependency") {
      auto added =
          co_await harness.operations->AddPackage(Ref("elm", "core"), true);
      REQUIRE(added.has_value());
      CHECK(added->already_present);
      CHECK(added->package.version == Version{1, 0, 5});
    }

    SECTION("test dependency at another version") {
      auto added = co_await harness.operations->AddPackage(
          Ref("elm", "browser", Version{1, 0, 0}), true);
      REQUIRE_FALSE(added.has_value());
      CHECK(added.error().Kind() == ToolErrorKind::kConflictingConstraints);
      CHECK_THAT(
          added.error().Message(),
          Catch::Matchers::ContainsSubstring("direct dependencies entry"));
    }

    CHECK(harness.tool->requests.empty());
  });
}

TEST_CASE("AddPackage explains install failures", "[package_operations]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    OperationsHarness harness(executor);
    harness.FailOnRun("No valid package version found");

    SECTION("unpublished version") {
      auto added = co_await harness.operations->AddPackage(
          Ref("elm", "http", Version{3, 0, 0}), false);
      REQUIRE_FALSE(added.has_value());
      CHECK(added.error().Kind() == ToolErrorKind::kNotFound);
      CHECK_THAT(
          added.error().Message(),
          Catch::Matchers::ContainsSubstring("3.0.0"));
    }

    SECTION("unknown package") {
      auto added = co_await harness.operations->AddPackage(
          Ref("nobody", "nothing"), false);
      REQUIRE_FALSE(added.has_value());
      CHECK(added.error().Kind() == ToolErrorKind::kNotFound);
    }

    SECTION("published but incompatible") {
      auto added = co_await harness.operations->AddPackage(
          Ref("elm", "http", Version{1, 0, 0}), false);
      REQUIRE_FALSE(added.has_value());
      CHECK(added.error().Kind() == ToolErrorKind::kConflictingConstraints);
      CHECK(added.error().Message() == "No valid package version found");
    }

    SECTION("registry unreachable") {
      harness.client->failure = ToolError::FromKind(
          ToolErrorKind::kUnavailable, "connection refused");
      auto added =
          co_await harness.operations->AddPackage(Ref("elm", "http"), false);
      REQUIRE_FALSE(added.has_value());
      CHECK(added.error().Kind() == ToolErrorKind::kConflictingConstraints);
    }

    CHECK(harness.Manifest() == json::parse(kManifest));
  });
}

TEST_CASE("AddPackage passes process errors through", "[package_operations]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    OperationsHarness harness(executor);
    harness.tool->behaviour = [](const ProcessRequest&) -> RunResult {
      return ToolError::UnexpectedFromKind(
          ToolErrorKind::kSpawnFailed, "elm-json: not found");
    };

    auto added =
        co_await harness.operations->AddPackage(Ref("elm", "http"), false);

    REQUIRE_FALSE(added.has_value());
    CHECK(added.error().Kind() == ToolErrorKind::kSpawnFailed);
  });
}

TEST_CASE("AddPackage checks the manifest after the tool", "[package_operations]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    OperationsHarness harness(executor);

    auto added =
        co_await harness.operations->AddPackage(Ref("elm", "http"), false);

    REQUIRE_FALSE(added.has_value());
    CHECK(added.error().Kind() == ToolErrorKind::kInternal);
  });
}

TEST_CASE("AddPackage needs a manifest", "[package_operations]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    OperationsHarness harness(executor);
    std::filesystem::remove(harness.project.Root() / "elm.json");

    auto added =
        co_await harness.operations->AddPackage(Ref("elm", "http"), false);

    REQUIRE_FALSE(added.has_value());
    CHECK(added.error().Kind() == ToolErrorKind::kNotFound);
    CHECK(harness.tool->requests.empty());
  });
}

TEST_CASE("RemovePackage removes direct dependencies", "[package_operations]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    OperationsHarness harness(executor);
    harness.tool->behaviour = [&harness](const ProcessRequest&) -> RunResult {
      auto manifest = harness.Manifest();
      manifest["dependencies"]["direct"].erase("elm/browser");
      harness.SaveManifest(manifest);
      return ProcessOutput{};
    };

    auto removed = co_await harness.operations->RemovePackage(
        Ref("elm", "browser", Version{9, 9, 9}), false);

    REQUIRE(removed.has_value());
    CHECK(removed->FullName() == "elm/browser");
    CHECK(removed->version == Version{1, 0, 2});
    REQUIRE(harness.tool->requests.size() == 1);
    CHECK(
        harness.tool->requests.front().args ==
        std::vector<std::string>{"uninstall", "--yes", "elm/browser"});

    auto again = co_await harness.operations->RemovePackage(
        Ref("elm", "browser"), false);
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().Kind() == ToolErrorKind::kNotFound);
    CHECK(harness.tool->requests.size() == 1);
  });
}

TEST_CASE("RemovePackage only touches direct entries", "[package_operations]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    OperationsHarness harness(executor);

    SECTION("indirect dependency") {
      auto removed =
          co_await harness.operations->RemovePackage(Ref("elm", "json"), false);
      REQUIRE_FALSE(removed.has_value());
      CHECK(removed.error().Kind() == ToolErrorKind::kNotFound);
    }

    SECTION("wrong section") {
      auto removed =
          co_await harness.operations->RemovePackage(Ref("elm", "core"), true);
      REQUIRE_FALSE(removed.has_value());
      CHECK(removed.error().Kind() == ToolErrorKind::kNotFound);
    }

    CHECK(harness.tool->requests.empty());
  });
}

TEST_CASE("RemovePackage reports tool failures", "[package_operations]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    OperationsHarness harness(executor);
    harness.FailOnRun("elm/core is required by other packages");

    auto removed =
        co_await harness.operations->RemovePackage(Ref("elm", "core"), false);

    REQUIRE_FALSE(removed.has_value());
    CHECK(removed.error().Kind() == ToolErrorKind::kConflictingConstraints);
    CHECK(removed.error().Message() == "elm/core is required by other packages");
  });
}

TEST_CASE("GetLatestVersion asks the registry", "[package_operations]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    OperationsHarness harness(executor);

    auto latest = co_await harness.operations->GetLatestVersion("elm", "http");
    REQUIRE(latest.has_value());
    CHECK(latest->version == Version{2, 0, 0});

    auto invalid = co_await harness.operations->GetLatestVersion("elm", "a b");
    REQUIRE_FALSE(invalid.has_value());
    CHECK(invalid.error().Kind() == ToolErrorKind::kInvalidArguments);
  });
}

TEST_CASE("RecordedVersion reads elm.json", "[package_operations]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    OperationsHarness harness(executor);

    CHECK(
        harness.operations->RecordedVersion(Ref("elm", "core")) ==
        Version{1, 0, 5});
    CHECK(
        harness.operations->RecordedVersion(Ref("elm", "json")) ==
        Version{1, 1, 3});
    CHECK_FALSE(harness.operations->RecordedVersion(Ref("elm", "http")));

    std::filesystem::remove(harness.project.Root() / "elm.json");
    CHECK_FALSE(harness.operations->RecordedVersion(Ref("elm", "core")));
    co_return;
  });
}

TEST_CASE("GetDocs resolves the version", "[package_operations]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    OperationsHarness harness(executor);
    harness.client->docs["elm/json@1.1.3"] = SampleDocs();
    harness.client->docs["elm/json@1.1.4"] = SampleDocs();
    harness.client->docs["elm/http@2.0.0"] = SampleDocs();

    SECTION("from the manifest") {
      auto ref = Ref("elm", "json");
      ref.version = harness.operations->RecordedVersion(ref);
      auto docs = co_await harness.operations->GetDocs(
          ref, "Json.Decode", "field");
      REQUIRE(docs.has_value());
      CHECK(docs->package.version == Version{1, 1, 3});
      CHECK(docs->docs["name"] == "field");
    }

    SECTION("explicit version wins") {
      auto docs = co_await harness.operations->GetDocs(
          Ref("elm", "json", Version{1, 1, 4}), std::nullopt, std::nullopt);
      REQUIRE(docs.has_value());
      CHECK(docs->package.version == Version{1, 1, 4});
      CHECK(docs->docs.is_array());
    }

    SECTION("latest when not a dependency") {
      auto docs = co_await harness.operations->GetDocs(
          Ref("elm", "http"), "Json.Encode", std::nullopt);
      REQUIRE(docs.has_value());
      CHECK(docs->package.version == Version{2, 0, 0});
      CHECK(docs->module == "Json.Encode");
    }

    SECTION("latest without a manifest") {
      std::filesystem::remove(harness.project.Root() / "elm.json");
      auto docs = co_await harness.operations->GetDocs(
          Ref("elm", "json"), std::nullopt, std::nullopt);
      REQUIRE(docs.has_value());
      CHECK(docs->package.version == Version{1, 1, 4});
    }

    SECTION("symbol without module") {
      auto docs = co_await harness.operations->GetDocs(
          Ref("elm", "json"), std::nullopt, "field");
      REQUIRE_FALSE(docs.has_value());
      CHECK(docs.error().Kind() == ToolErrorKind::kInvalidArguments);
    }
  });
}
