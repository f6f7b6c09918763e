#include "cli_options.hpp"
#include <fstream>
#include <sstream>
#include <boost/program_options.hpp>
#include "common/config/config.hpp"

namespace download_service {

namespace po = boost::program_options;

namespace {

po::options_description describeOptions() {
  po::options_description desc("sed-dl options");
  desc.add_options()
    ("help,h", "show this help")
    ("url,u", po::value<std::vector<std::string>>()->composing(), "resource page URL (repeatable)")
    ("id", po::value<std::vector<std::string>>()->composing(), "resource id (needs --type)")
    ("type", po::value<std::string>(), "resource type for --id: tchMaterial, qualityCourse or syncClassroom")
    ("batch-file,b", po::value<std::string>(), "file with one URL or id per line")
    ("interactive,i", po::bool_switch(), "enter URLs and pick items interactively")
    ("prompt-each", po::bool_switch(), "ask for items and video quality for every batch input")
    ("token", po::value<std::string>(), "access token")
    ("token-help", po::bool_switch(), "explain how to obtain an access token")
    ("output,o", po::value<std::string>(), "output directory")
    ("workers,w", po::value<size_t>(), "parallel downloads (1-16)")
    ("select", po::value<std::string>()->default_value("all"), "items to download, e.g. all or 1,3,5-8")
    ("filter-ext", po::value<std::string>()->default_value(""), "only these extensions, e.g. pdf,ts")
    ("audio-format", po::value<std::string>(), "audio format to keep (mp3, m4a, ... or all)")
    ("video-quality", po::value<std::string>(), "best, worst or a height such as 720")
    ("flat", po::bool_switch(), "save everything into the output directory")
    ("force-redownload", po::bool_switch(), "download even when a valid file exists")
    ("config", po::value<std::string>(), "configuration file")
    ("log-file", po::value<std::string>(), "write a diagnostic log")
    ("verbose", po::bool_switch(), "debug output");
  return desc;
}

} // namespace

const char* const kTokenHelp = R"(How to obtain an access token:
1. Log in to the platform in Chrome, Edge or Firefox
   (https://auth.smartedu.cn/uias/login).
2. Open the developer tools:
   - Windows / Linux: F12 or Ctrl+Shift+I
   - macOS: Cmd+Opt+I
3. Switch to the "Console" tab.
4. Paste the following and press Enter:
----------------------------------------------
copy(
  JSON.parse(
    JSON.parse(
      localStorage.getItem(
        Object.keys(localStorage)
          .find(i => i.startsWith("ND_UC_AUTH"))
      )
    ).value
  ).access_token
)
----------------------------------------------
5. The token is now on the clipboard. Pass it with --token, set ACCESS_TOKEN,
   or paste it when sed-dl asks for it.
)";

std::string usageText() {
  std::ostringstream out;
  out << "Usage: sed-dl [--url URL ...] [--id ID --type TYPE] [--batch-file FILE] [-i] [options]\n\n"
      << describeOptions();
  return out.str();
}

std::expected<CliOptions, std::string> parseCommandLine(int argc, const char* const argv[]) {
  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, describeOptions()), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    return std::unexpected(std::string(e.what()));
  }

  CliOptions options;
  options.help = vm.count("help") > 0;
  if (vm.count("url")) options.urls = vm["url"].as<std::vector<std::string>>();
  if (vm.count("id")) options.ids = vm["id"].as<std::vector<std::string>>();
  if (vm.count("type")) options.type = vm["type"].as<std::string>();
  if (vm.count("batch-file")) options.batch_file = vm["batch-file"].as<std::string>();
  options.interactive = vm["interactive"].as<bool>();
  options.prompt_each = vm["prompt-each"].as<bool>();
  if (vm.count("token")) options.token = vm["token"].as<std::string>();
  options.token_help = vm["token-help"].as<bool>();
  if (vm.count("output")) options.output = vm["output"].as<std::string>();
  if (vm.count("workers")) options.workers = vm["workers"].as<size_t>();
  options.select = vm["select"].as<std::string>();
  options.filter_ext = vm["filter-ext"].as<std::string>();
  if (vm.count("audio-format")) options.audio_format = vm["audio-format"].as<std::string>();
  if (vm.count("video-quality")) options.video_quality = vm["video-quality"].as<std::string>();
  options.flat = vm["flat"].as<bool>();
  options.force_redownload = vm["force-redownload"].as<bool>();
  if (vm.count("config")) options.config_path = vm["config"].as<std::string>();
  if (vm.count("log-file")) options.log_file = vm["log-file"].as<std::string>();
  options.verbose = vm["verbose"].as<bool>();

  if (options.help || options.token_help) return options;

  if (options.workers && (*options.workers < config::kMinWorkers || *options.workers > config::kMaxWorkers)) {
    return std::unexpected("--workers must be between " + std::to_string(config::kMinWorkers) +
                           " and " + std::to_string(config::kMaxWorkers));
  }
  if (!options.ids.empty() && !options.type) {
    return std::unexpected(std::string("--id requires --type"));
  }
  if (options.urls.empty() && options.ids.empty() && !options.batch_file && !options.interactive) {
    return std::unexpected(std::string("nothing to do: give --url, --id, --batch-file or --interactive"));
  }
  return options;
}

std::expected<std::vector<std::string>, std::string> readBatchFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) return std::unexpected("Cannot open batch file " + path);
  std::vector<std::string> inputs;
  std::string line;
  while (std::getline(in, line)) {
    auto begin = line.find_first_not_of(" \t\r");
    if (begin == std::string::npos || line[begin] == '#') continue;
    auto end = line.find_last_not_of(" \t\r");
    inputs.push_back(line.substr(begin, end - begin + 1));
  }
  return inputs;
}

} // namespace download_service
