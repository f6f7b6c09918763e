#include "application/auth_resolver.hpp"
#include "application/http_fetch.hpp"
#include "application/orchestrator.hpp"
#include "application/path_lock_registry.hpp"
#include "application/quality_selector.hpp"
#include "application/retry_policy.hpp"
#include "application/selection.hpp"
#include "application/stream_resolver.hpp"
#include "application/transfer_manager.hpp"
#include "common/async_bridge.hpp"
#include "common/cancellation.hpp"
#include "common/config/config.hpp"
#include "common/logger.hpp"
#include "common/thread_pool.hpp"
#include "infrastructure/chapter_tree_resolver.hpp"
#include "infrastructure/curl_http_client.hpp"
#include "infrastructure/extractor_factory.hpp"
#include "infrastructure/file_credential_store.hpp"
#include "infrastructure/platform_api.hpp"
#include "interface/cli_options.hpp"
#include "interface/console_notifier.hpp"
#include "interface/console_progress.hpp"
#include "interface/console_prompter.hpp"
#include "interface/summary_report.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <unistd.h>
#include <utility>
#include <boost/asio.hpp>

namespace net = boost::asio;
using namespace download_service;

namespace {

std::optional<std::string> environmentToken(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (!value || !*value) return std::nullopt;
  return std::string(value);
}

} // namespace

int main(int argc, char** argv) {
  auto cli = parseCommandLine(argc, argv);
  if (!cli) {
    std::cerr << "[X] " << cli.error() << "\n\n" << usageText() << std::endl;
    return kExitUsage;
  }
  if (cli->help) {
    std::cout << usageText() << std::endl;
    return kExitSuccess;
  }
  if (cli->token_help) {
    std::cout << kTokenHelp << std::endl;
    return kExitSuccess;
  }

  try {
    auto& cfg = config::Config::getInstance();
    auto config_path = cli->config_path ? std::filesystem::path(*cli->config_path) : cfg.getDefaultConfigPath();
    if (auto loaded = cfg.loadFromFile(config_path); !loaded) {
      std::cerr << "[X] " << loaded.error() << std::endl;
      return kExitUsage;
    }
    if (cli->output) cfg.setOutputDir(*cli->output);
    if (cli->workers) cfg.setMaxWorkers(*cli->workers);
    if (cli->video_quality) cfg.setVideoQuality(*cli->video_quality);
    if (cli->audio_format) cfg.setAudioFormat(*cli->audio_format);

    common::setLogLevel(cli->verbose ? common::LogLevel::Debug : common::LogLevel::Warn);
    if (cli->log_file && !common::initLogFile(*cli->log_file)) {
      std::cerr << "[!] Cannot open log file " << *cli->log_file << std::endl;
    }

    const auto& network = cfg.getNetwork();
    const auto& download = cfg.getDownload();

    auto quality = QualityPolicy::parse(download.video_quality);
    if (!quality) {
      std::cerr << "[X] Invalid video quality: " << download.video_quality << std::endl;
      return kExitUsage;
    }
    std::optional<ResourceKind> kind_hint;
    if (cli->type) {
      kind_hint = parseResourceKind(*cli->type);
      if (!kind_hint) {
        std::cerr << "[X] Unknown resource type: " << *cli->type << std::endl;
        return kExitUsage;
      }
    }

    TaskOptions task_options;
    task_options.selection = cli->select;
    task_options.extensions = parseExtensionList(cli->filter_ext);
    task_options.audio_format = download.audio_format;
    task_options.quality = *quality;
    task_options.flatten = cli->flat;
    task_options.force = cli->force_redownload;

    std::vector<std::string> inputs = cli->urls;
    inputs.insert(inputs.end(), cli->ids.begin(), cli->ids.end());
    if (cli->batch_file) {
      auto batch = readBatchFile(*cli->batch_file);
      if (!batch) {
        std::cerr << "[X] " << batch.error() << std::endl;
        return kExitUsage;
      }
      inputs.insert(inputs.end(), batch->begin(), batch->end());
    }

    CurlGlobal curl_global;
    net::io_context ioc{1};
    common::CancellationToken cancel;
    common::ThreadPool pool(static_cast<unsigned>(download.max_workers + download.segment_workers + 2));

    CurlHttpClient http(pool, cancel, network.user_agent);
    RetryPolicy retry(retryOptionsFrom(network));
    const auto& credential = cfg.getCredential();
    auto store = std::make_shared<FileCredentialStore>(cfg.getDefaultConfigPath(), credential.token_key);
    auto prompter = std::make_shared<ConsolePrompter>();
    const bool can_prompt = cli->interactive || ::isatty(STDIN_FILENO) == 1;

    AuthSources sources{
      .explicit_token = cli->token,
      .env_token = environmentToken(credential.token_env),
      .persisted_token = store->loadToken(),
    };
    AuthResolver auth(ioc.get_executor(), sources, can_prompt ? prompter : nullptr, store, pool);
    FetchContext fetch{.client = http, .auth = &auth, .retry = retry, .cancel = cancel};

    ConsoleNotifier notifier(std::cerr, ConsoleNotifier::isTerminal(STDERR_FILENO));
    PlatformApi api(fetch, network, cfg.getUrlTemplates());
    ChapterTreeResolver chapters(api);
    StreamResolver streams(fetch, notifier, pool, StreamOptions{
      .segment_workers = download.segment_workers,
      .connect_timeout = network.connect_timeout,
      .timeout = network.timeout,
    });
    PathLockRegistry locks(ioc.get_executor());
    TransferManager transfers(ioc.get_executor(), fetch, streams, locks, pool, download.max_workers);
    Orchestrator orchestrator(
      makeExtractors(api, chapters, cfg.getDirectory()),
      transfers,
      notifier,
      pool,
      cfg.getApiEndpoints(),
      download.output_dir,
      TransferOptions{
        .force = cli->force_redownload,
        .quality = *quality,
        .connect_timeout = network.connect_timeout,
        .timeout = network.timeout,
      });

    ConsoleProgress progress(ioc.get_executor(), std::cerr, transfers.progress(), ConsoleNotifier::isTerminal(STDERR_FILENO));
    transfers.setStateListener([&progress](const DownloadItem& item, TransferState state) {
      progress.onState(item, state);
    });
    prompter->setPromptHook([&progress](bool prompting) { progress.setPaused(prompting); });

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    net::steady_timer grace(ioc);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
      if (ec) return;
      cancel.cancel();
      notifier.warn("Interrupted, stopping transfers (partial files are kept for resume)");
      // a prompt blocked on stdin never returns on its own
      grace.expires_after(std::chrono::seconds(3));
      grace.async_wait([&](const boost::system::error_code& wait_ec) {
        if (!wait_ec) ioc.stop();
      });
    });

    const bool ask_each = cli->interactive || cli->prompt_each;
    std::vector<TaskSummary> summaries;
    bool crashed = false;
    progress.start();
    net::co_spawn(ioc,
      [&]() -> net::awaitable<void> {
        if (ask_each) {
          for (const auto& input : inputs) {
            if (cancel.cancelled()) break;
            summaries.push_back(co_await orchestrator.run(Task{input, kind_hint, task_options}, prompter.get()));
          }
        } else {
          for (const auto& input : inputs) {
            orchestrator.submit(Task{input, kind_hint, task_options});
          }
          summaries = co_await orchestrator.runAll();
        }
        while (cli->interactive && !cancel.cancelled()) {
          auto line = co_await common::offload(pool, [prompter]() {
            return prompter->readInput("URL or id (q to quit): ");
          });
          if (!line || cancel.cancelled()) break;
          summaries.push_back(co_await orchestrator.run(Task{*line, kind_hint, task_options}, prompter.get()));
        }
      },
      [&](std::exception_ptr error) {
        progress.stop();
        signals.cancel();
        grace.cancel();
        if (!error) return;
        crashed = true;
        auto what = describeException(error);
        common::logError("Unhandled error: " + what);
        notifier.error("Unexpected failure: " + what);
      });
    ioc.run();

    printSummary(std::cout, summaries);
    const bool interrupted = cancel.cancelled();
    if (interrupted) {
      std::cout.flush();
      std::cerr.flush();
      common::closeLogFile();
      // a token prompt may still hold echo off on a pool thread
      restoreTerminalEcho();
      // pool threads may be parked on stdin; skip joining them
      std::_Exit(kExitInterrupted);
    }

    if (auto saved = auth.persistPromptedToken(); !saved) {
      notifier.warn("Could not save token: " + saved.error());
    } else if (*saved) {
      notifier.info("Token saved to " + store->path().string());
    }
    common::closeLogFile();
    if (crashed) return kExitFailure;
    return exitCodeFor(summaries, false);
  } catch (...) {
    auto what = describeException(std::current_exception());
    common::logError("Fatal: " + what);
    std::cerr << "[X] " << what << std::endl;
    return kExitFailure;
  }
}
