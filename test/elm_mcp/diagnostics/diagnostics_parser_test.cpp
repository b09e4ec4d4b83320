#include "elm_mcp/diagnostics/diagnostics_parser.hpp"

#include <optional>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::warn;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using elm_mcp::diagnostics::Diagnostic;
using elm_mcp::diagnostics::DiagnosticFormat;
using elm_mcp::diagnostics::DiagnosticSeverity;
using elm_mcp::diagnostics::DiagnosticsParser;
using elm_mcp::diagnostics::ParseDiagnosticFormat;
using elm_mcp::diagnostics::Region;
using elm_mcp::diagnostics::SortDiagnostics;
using elm_mcp::process::ProcessOutput;

namespace {

auto ElmProblem(
    std::string title, int line, int col, nlohmann::json message)
    -> nlohmann::json {
  return {
      {"title", std::move(title)},
      {"region",
       {{"start", {{"line", line}, {"column", col}}},
        {"end", {{"line", line}, {"column", col + 4}}}}},
      {"message", std::move(message)},
  };
}

auto CompileErrors(nlohmann::json errors) -> std::string {
  return nlohmann::json{{"type", "compile-errors"}, {"errors", errors}}.dump();
}

auto FailedWithStderr(std::string stderr_data) -> ProcessOutput {
  return ProcessOutput{
      .exit_code = 1, .stdout_data = "", .stderr_data = std::move(stderr_data)};
}

}  // namespace

TEST_CASE("ParseDiagnosticFormat names", "[diagnostics]") {
  CHECK(ParseDiagnosticFormat("elm-report") == DiagnosticFormat::kElmReport);
  CHECK(ParseDiagnosticFormat(" JSON-Lines ") == DiagnosticFormat::kJsonLines);
  CHECK_FALSE(ParseDiagnosticFormat("sarif").has_value());
}

TEST_CASE("Clean compile yields no diagnostics", "[diagnostics]") {
  DiagnosticsParser parser;
  ProcessOutput output{
      .exit_code = 0, .stdout_data = "Success!\n", .stderr_data = ""};

  auto report = parser.Parse(output, DiagnosticFormat::kElmReport);

  CHECK(report.diagnostics.empty());
  CHECK(report.dropped_records == 0);
  CHECK_FALSE(report.used_fallback);
}

TEST_CASE("Elm report problems are flattened and ordered", "[diagnostics]") {
  DiagnosticsParser parser;
  auto errors = nlohmann::json::array({
      {{"path", "src/Main.elm"},
       {"name", "Main"},
       {"problems",
        {ElmProblem("TYPE MISMATCH", 12, 5, "Expected Int"),
         ElmProblem(
             "NAMING ERROR", 3, 1,
             nlohmann::json::array(
                 {"I cannot find a `",
                  {{"bold", false},
                   {"underline", false},
                   {"color", "RED"},
                   {"string", "foo"}},
                  "` variable."}))}}},
      {{"path", "src/Api.elm"},
       {"name", "Api"},
       {"problems",
        nlohmann::json::array({ElmProblem("MISSING PATTERNS", 40, 9, "Add a branch")})}},
  });

  auto report = parser.Parse(
      FailedWithStderr(CompileErrors(errors)), DiagnosticFormat::kElmReport);

  REQUIRE(report.diagnostics.size() == 3);
  CHECK(report.dropped_records == 0);

  CHECK(report.diagnostics[0].file == "src/Api.elm");
  CHECK(report.diagnostics[0].title == "MISSING PATTERNS");

  CHECK(report.diagnostics[1].file == "src/Main.elm");
  CHECK(report.diagnostics[1].title == "NAMING ERROR");
  CHECK(report.diagnostics[1].message == "I cannot find a `foo` variable.");
  CHECK(
      report.diagnostics[1].region ==
      Region{.start_line = 3, .start_col = 1, .end_line = 3, .end_col = 5});

  CHECK(report.diagnostics[2].title == "TYPE MISMATCH");
  CHECK(report.diagnostics[2].severity == DiagnosticSeverity::kError);
}

TEST_CASE("Parsing the same output twice is identical", "[diagnostics]") {
  DiagnosticsParser parser;
  auto errors = nlohmann::json::array({
      {{"path", "src/B.elm"},
       {"problems",
        {ElmProblem("B2", 2, 1, "b2"), ElmProblem("B1", 1, 1, "b1")}}},
      {{"path", "src/A.elm"}, {"problems", nlohmann::json::array({ElmProblem("A1", 7, 2, "a1")})}},
  });
  auto output = FailedWithStderr(CompileErrors(errors));

  auto first = parser.Parse(output, DiagnosticFormat::kElmReport);
  auto second = parser.Parse(output, DiagnosticFormat::kElmReport);

  CHECK(first.diagnostics == second.diagnostics);
  REQUIRE(first.diagnostics.size() == 3);
  CHECK(first.diagnostics[0].title == "A1");
  CHECK(first.diagnostics[1].title == "B1");
  CHECK(first.diagnostics[2].title == "B2");
}

TEST_CASE("Malformed problems are dropped and counted", "[diagnostics]") {
  DiagnosticsParser parser;
  auto errors = nlohmann::json::array({
      {{"path", "src/Main.elm"},
       {"problems",
        {ElmProblem("GOOD", 1, 1, "fine"),
         {{"region", nullptr}, {"message", "no title"}},
         {{"title", "BAD REGION"},
          {"region", {{"start", {{"line", 1}}}}},
          {"message", "x"}}}}},
      {{"problems", nlohmann::json::array()}},
  });

  auto report = parser.Parse(
      FailedWithStderr(CompileErrors(errors)), DiagnosticFormat::kElmReport);

  REQUIRE(report.diagnostics.size() == 1);
  CHECK(report.diagnostics[0].title == "GOOD");
  CHECK(report.dropped_records == 3);
  CHECK_FALSE(report.used_fallback);
}

TEST_CASE("Project-level error becomes one diagnostic", "[diagnostics]") {
  DiagnosticsParser parser;
  nlohmann::json error = {
      {"type", "error"},
      {"path", "elm.json"},
      {"title", "UNKNOWN PACKAGE"},
      {"message", nlohmann::json::array({"The package ", "elm/htm", " ..."})},
  };

  auto report =
      parser.Parse(FailedWithStderr(error.dump()), DiagnosticFormat::kElmReport);

  REQUIRE(report.diagnostics.size() == 1);
  CHECK(report.diagnostics[0].file == "elm.json");
  CHECK(report.diagnostics[0].title == "UNKNOWN PACKAGE");
  CHECK(report.diagnostics[0].message == "The package elm/htm ...");
  CHECK_FALSE(report.diagnostics[0].region.has_value());
}

TEST_CASE("Truncated report falls back to raw text", "[diagnostics]") {
  DiagnosticsParser parser;
  auto full = CompileErrors(nlohmann::json::array(
      {{{"path", "src/Main.elm"}, {"problems", nlohmann::json::array({ElmProblem("X", 1, 1, "y")})}}}));
  auto truncated = full.substr(0, full.size() / 2);

  auto report =
      parser.Parse(FailedWithStderr(truncated), DiagnosticFormat::kElmReport);

  CHECK(report.used_fallback);
  REQUIRE(report.diagnostics.size() == 1);
  CHECK(report.diagnostics[0].title == "UNSTRUCTURED COMPILER OUTPUT");
  CHECK(report.diagnostics[0].message == truncated);
}

TEST_CASE("Plain text on stderr falls back to raw text", "[diagnostics]") {
  DiagnosticsParser parser;

  auto report = parser.Parse(
      FailedWithStderr("elm: elm.json: openFile: does not exist\n"),
      DiagnosticFormat::kElmReport);

  CHECK(report.used_fallback);
  REQUIRE(report.diagnostics.size() == 1);
  CHECK(report.diagnostics[0].message == "elm: elm.json: openFile: does not exist");
}

TEST_CASE("Failing exit with empty output still reports", "[diagnostics]") {
  DiagnosticsParser parser;
  ProcessOutput output{.exit_code = 2, .stdout_data = "", .stderr_data = ""};

  for (auto format :
       {DiagnosticFormat::kElmReport, DiagnosticFormat::kJsonLines}) {
    auto report = parser.Parse(output, format);
    REQUIRE(report.diagnostics.size() == 1);
    CHECK(report.diagnostics[0].title == "COMPILER FAILED");
    CHECK(
        report.diagnostics[0].message ==
        "The compiler exited with code 2 without reporting a diagnostic.");
  }
}

TEST_CASE("Empty problem list with failing exit still reports", "[diagnostics]") {
  DiagnosticsParser parser;

  auto report = parser.Parse(
      FailedWithStderr(CompileErrors(nlohmann::json::array())),
      DiagnosticFormat::kElmReport);

  REQUIRE(report.diagnostics.size() == 1);
  CHECK(report.diagnostics[0].title == "COMPILER FAILED");
}

TEST_CASE("Report forwarded to stdout is still parsed", "[diagnostics]") {
  DiagnosticsParser parser;
  ProcessOutput output{
      .exit_code = 1,
      .stdout_data = CompileErrors(nlohmann::json::array(
          {{{"path", "src/Main.elm"},
            {"problems", nlohmann::json::array({ElmProblem("X", 1, 1, "y")})}}})),
      .stderr_data = ""};

  auto report = parser.Parse(output, DiagnosticFormat::kElmReport);

  REQUIRE(report.diagnostics.size() == 1);
  CHECK(report.diagnostics[0].title == "X");
}

TEST_CASE("JSON lines records map to diagnostics", "[diagnostics]") {
  DiagnosticsParser parser;
  std::string lines =
      R"({"file":"src/B.elm","severity":"warning","title":"UNUSED","message":"unused import","region":{"start_line":4,"start_col":1,"end_line":4,"end_col":20}})"
      "\n"
      R"({"file":"src/A.elm","title":"TYPE","message":["a ",{"string":"b"}]})"
      "\n";
  ProcessOutput output{.exit_code = 1, .stdout_data = lines, .stderr_data = ""};

  auto report = parser.Parse(output, DiagnosticFormat::kJsonLines);

  REQUIRE(report.diagnostics.size() == 2);
  CHECK(report.dropped_records == 0);
  CHECK(report.diagnostics[0].file == "src/A.elm");
  CHECK(report.diagnostics[0].severity == DiagnosticSeverity::kError);
  CHECK(report.diagnostics[0].message == "a b");
  CHECK_FALSE(report.diagnostics[0].region.has_value());
  CHECK(report.diagnostics[1].severity == DiagnosticSeverity::kWarning);
  CHECK(report.diagnostics[1].region->end_col == 20);
}

TEST_CASE("Positions outside the int range drop the record", "[diagnostics]") {
  DiagnosticsParser parser;
  std::string lines =
      R"({"file":"src/A.elm","title":"HUGE","message":"x","region":{"start_line":4294967297,"start_col":1,"end_line":4294967297,"end_col":2}})"
      "\n"
      R"({"file":"src/A.elm","title":"FINE","message":"y","region":{"start_line":2,"start_col":1,"end_line":2,"end_col":2}})"
      "\n";
  ProcessOutput output{.exit_code = 1, .stdout_data = lines, .stderr_data = ""};

  auto report = parser.Parse(output, DiagnosticFormat::kJsonLines);

  REQUIRE(report.diagnostics.size() == 1);
  CHECK(report.diagnostics[0].title == "FINE");
  CHECK(report.dropped_records == 1);
}

TEST_CASE("SortDiagnostics orders by file then position", "[diagnostics]") {
  auto at = [](std::string file, std::optional<Region> region) {
    return Diagnostic{.file = std::move(file), .region = region, .title = "T"};
  };
  std::vector<Diagnostic> diagnostics{
      at("src/B.elm", Region{2, 1, 2, 5}),
      at("src/A.elm", Region{9, 3, 9, 4}),
      at("/shared/X.elm", Region{1, 1, 1, 2}),
      at("src/A.elm", std::nullopt),
      at("src/A.elm", Region{9, 1, 9, 2}),
  };

  SortDiagnostics(diagnostics);

  REQUIRE(diagnostics.size() == 5);
  CHECK(diagnostics[0].file == "/shared/X.elm");
  CHECK(diagnostics[1].file == "src/A.elm");
  CHECK_FALSE(diagnostics[1].region.has_value());
  CHECK(diagnostics[2].region->start_col == 1);
  CHECK(diagnostics[3].region->start_col == 3);
  CHECK(diagnostics[4].file == "src/B.elm");
}

TEST_CASE("JSON lines drops a truncated tail", "[diagnostics]") {
  DiagnosticsParser parser;
  std::string lines =
      R"({"file":"src/A.elm","title":"T","message":"m"})"
      "\n"
      R"({"file":"src/A.elm","title":"T2","mess)";
  ProcessOutput output{.exit_code = 1, .stdout_data = lines, .stderr_data = ""};

  auto report = parser.Parse(output, DiagnosticFormat::kJsonLines);

  REQUIRE(report.diagnostics.size() == 1);
  CHECK(report.dropped_records == 1);
  CHECK_FALSE(report.used_fallback);
}

TEST_CASE("JSON lines without any JSON falls back", "[diagnostics]") {
  DiagnosticsParser parser;
  ProcessOutput output{
      .exit_code = 1,
      .stdout_data = "Compiling...\n",
      .stderr_data = "segmentation fault\n"};

  auto report = parser.Parse(output, DiagnosticFormat::kJsonLines);

  CHECK(report.used_fallback);
  REQUIRE(report.diagnostics.size() == 1);
  CHECK(report.diagnostics[0].message == "Compiling...\nsegmentation fault");
}

TEST_CASE("FlattenMessage rejects unknown chunks", "[diagnostics]") {
  CHECK(DiagnosticsParser::FlattenMessage("plain") == "plain");
  CHECK_FALSE(
      DiagnosticsParser::FlattenMessage(nlohmann::json::array({1, 2}))
          .has_value());
  CHECK_FALSE(DiagnosticsParser::FlattenMessage(42).has_value());
}
