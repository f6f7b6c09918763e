#include <catch2/catch.hpp>
#include "interface/cli_options.hpp"
#include "support/test_runtime.hpp"

using namespace download_service;
using namespace test_support;

namespace {

std::expected<CliOptions, std::string> parse(std::vector<const char*> args) {
  args.insert(args.begin(), "sed-dl");
  return parseCommandLine(static_cast<int>(args.size()), args.data());
}

}

TEST_CASE("parses urls and download options", "[cli_options]") {
  auto options = parse({"--url", "https://a.example/tchMaterial/detail?contentId=x", "-u", "https://b.example",
                        "-o", "out", "-w", "8", "--select", "1,3", "--filter-ext", "pdf",
                        "--video-quality", "720", "--flat", "--force-redownload", "--verbose"});
  REQUIRE(options.has_value());
  CHECK(options->urls.size() == 2u);
  CHECK(options->output == "out");
  CHECK(options->workers == 8u);
  CHECK(options->select == "1,3");
  CHECK(options->filter_ext == "pdf");
  CHECK(options->video_quality == "720");
  CHECK(options->flat);
  CHECK(options->force_redownload);
  CHECK(options->verbose);
  CHECK_FALSE(options->interactive);
}

TEST_CASE("defaults select everything", "[cli_options]") {
  auto options = parse({"-i"});
  REQUIRE(options.has_value());
  CHECK(options->interactive);
  CHECK(options->select == "all");
  CHECK(options->filter_ext.empty());
  CHECK_FALSE(options->workers.has_value());
  CHECK_FALSE(options->prompt_each);
}

TEST_CASE("prompt each keeps batch inputs", "[cli_options]") {
  auto options = parse({"--batch-file", "inputs.txt", "--prompt-each"});
  REQUIRE(options.has_value());
  CHECK(options->prompt_each);
  CHECK_FALSE(options->interactive);
  CHECK(options->batch_file == "inputs.txt");
  CHECK(usageText().find("--prompt-each") != std::string::npos);
}

TEST_CASE("usage errors", "[cli_options]") {
  CHECK_FALSE(parse({}).has_value());
  CHECK_FALSE(parse({"--id", "b8e9a3fe-dae7-49c0-86cb-d146f883fd8e"}).has_value());
  CHECK_FALSE(parse({"-u", "x", "--workers", "0"}).has_value());
  CHECK_FALSE(parse({"-u", "x", "--workers", "17"}).has_value());
  CHECK_FALSE(parse({"--no-such-flag"}).has_value());
  CHECK_FALSE(parse({"-u", "x", "--workers", "many"}).has_value());
}

TEST_CASE("help needs no input", "[cli_options]") {
  auto help = parse({"--help"});
  REQUIRE(help.has_value());
  CHECK(help->help);
  auto token_help = parse({"--token-help"});
  REQUIRE(token_help.has_value());
  CHECK(token_help->token_help);
  CHECK(usageText().find("--batch-file") != std::string::npos);
  CHECK(std::string(kTokenHelp).find("ND_UC_AUTH") != std::string::npos);
}

TEST_CASE("ids take a type", "[cli_options]") {
  auto options = parse({"--id", "b8e9a3fe-dae7-49c0-86cb-d146f883fd8e", "--type", "tchMaterial"});
  REQUIRE(options.has_value());
  CHECK(options->ids.size() == 1u);
  CHECK(options->type == "tchMaterial");
}

TEST_CASE("batch file skips comments and blank lines", "[cli_options]") {
  TempDir dir;
  writeFile(dir / "batch.txt", "# textbooks\n\nhttps://a.example/x\r\n   b8e9a3fe-dae7-49c0-86cb-d146f883fd8e  \n#done\n");
  auto inputs = readBatchFile((dir / "batch.txt").string());
  REQUIRE(inputs.has_value());
  CHECK(*inputs == (std::vector<std::string>{"https://a.example/x", "b8e9a3fe-dae7-49c0-86cb-d146f883fd8e"}));
  CHECK_FALSE(readBatchFile((dir / "missing.txt").string()).has_value());
}
