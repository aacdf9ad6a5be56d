#include "ytdlp_engine.hpp"
#include "ytdlp_output.hpp"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <memory>
#include <spawn.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

extern char** environ;

namespace download_service {

namespace {

// Child with stdout and stderr merged into one pipe. It leads its own process
// group, so terminate() also reaches the downloaders and muxers it starts.
class ChildProcess {
public:
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  ~ChildProcess() {
    closeOutput();
    if (!reaped_) {
      terminate();
      wait();
    }
  }

  // errno value on failure; ENOENT when the program does not exist
  static std::expected<std::unique_ptr<ChildProcess>, int> spawn(const std::vector<std::string>& args) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      return std::unexpected(errno);
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDERR_FILENO);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, argv[0], &actions, &attr, argv.data(), environ);
    posix_spawnattr_destroy(&attr);
    posix_spawn_file_actions_destroy(&actions);
    ::close(fds[1]);
    if (rc != 0) {
      ::close(fds[0]);
      return std::unexpected(rc);
    }

    FILE* out = ::fdopen(fds[0], "r");
    if (out == nullptr) {
      int error = errno;
      ::close(fds[0]);
      // reaps the child on the way out
      std::unique_ptr<ChildProcess> orphan(new ChildProcess(pid, nullptr));
      return std::unexpected(error);
    }
    return std::unique_ptr<ChildProcess>(new ChildProcess(pid, out));
  }

  FILE* output() const { return out_; }

  // Safe to call from any thread, any number of times.
  void terminate() {
    if (!reaped_.load(std::memory_order_acquire)) {
      ::kill(-pid_, SIGTERM);
    }
  }

  // Closes our end of the pipe and reaps the child; raw wait status or -1.
  int wait() {
    closeOutput();
    int status = 0;
    while (::waitpid(pid_, &status, 0) == -1) {
      if (errno != EINTR) {
        reaped_.store(true, std::memory_order_release);
        return -1;
      }
    }
    reaped_.store(true, std::memory_order_release);
    return status;
  }

private:
  ChildProcess(pid_t pid, FILE* out) : pid_(pid), out_(out) {}

  void closeOutput() {
    if (out_ != nullptr) {
      std::fclose(out_);
      out_ = nullptr;
    }
  }

  pid_t pid_;
  FILE* out_;
  std::atomic_bool reaped_{false};
};

} // namespace

YtDlpEngine::YtDlpEngine(config::EngineConfig config) : config_(std::move(config)) {}

std::vector<std::string> YtDlpEngine::commonArgs() const {
  std::vector<std::string> args = {
    "--no-playlist",
    "--no-warnings",
    "--retries", std::to_string(config_.retries),
    "--extractor-retries", std::to_string(config_.retries),
    "--skip-unavailable-fragments",
  };
  if (!config_.user_agent.empty()) {
    args.insert(args.end(), {"--add-header", "User-Agent:" + config_.user_agent});
  }
  if (!config_.accept_language.empty()) {
    args.insert(args.end(), {"--add-header", "Accept-Language:" + config_.accept_language});
  }
  if (!config_.youtube_clients.empty()) {
    std::string clients;
    for (const auto& client : config_.youtube_clients) {
      if (!clients.empty()) {
        clients += ',';
      }
      clients += client;
    }
    args.insert(args.end(), {"--extractor-args", "youtube:player_client=" + clients + ";skip=dash"});
  }
  if (config_.cookies_file) {
    std::error_code ec;
    if (std::filesystem::exists(*config_.cookies_file, ec)) {
      args.insert(args.end(), {"--cookies", config_.cookies_file->string()});
    }
  }
  return args;
}

std::vector<std::string> YtDlpEngine::buildInfoArgs(const std::string& url) const {
  std::vector<std::string> args = {config_.binary, "--dump-single-json", "--skip-download"};
  auto common = commonArgs();
  args.insert(args.end(), common.begin(), common.end());
  args.push_back("--");
  args.push_back(url);
  return args;
}

std::vector<std::string> YtDlpEngine::buildFetchArgs(const std::string& url,
                                                     const std::filesystem::path& output_template,
                                                     const FetchOptions& options) const {
  std::vector<std::string> args = {
    config_.binary,
    "--newline",
    "--progress",
    "-o", output_template.string(),
    "--merge-output-format", options.merge_output_format,
    "--concurrent-fragments", std::to_string(options.concurrent_fragments),
    "--progress-template", "download:" + std::string(kProgressTag) + "%(progress)j",
    "--progress-template", "postprocess:" + std::string(kPostprocessTag) + "%(progress.status)s",
    "--print", "after_move:" + std::string(kResultTag) + "%(.{filepath,title,ext})j",
  };

  if (options.format_id) {
    args.insert(args.end(), {"-f", *options.format_id});
  }

  if (options.accelerator) {
    auto name = std::filesystem::path(options.accelerator->program).filename().string();
    args.insert(args.end(), {"--downloader", options.accelerator->program});
    if (!options.accelerator->args.empty()) {
      std::string joined;
      for (const auto& arg : options.accelerator->args) {
        if (!joined.empty()) {
          joined += ' ';
        }
        joined += arg;
      }
      args.insert(args.end(), {"--downloader-args", name + ":" + joined});
    }
  }

  auto common = commonArgs();
  args.insert(args.end(), common.begin(), common.end());
  args.push_back("--");
  args.push_back(url);
  return args;
}

std::expected<int, std::string> YtDlpEngine::runProcess(const std::vector<std::string>& args,
                                                        const LineHandler& on_line,
                                                        std::stop_token stop_token) const {
  auto child = ChildProcess::spawn(args);
  if (!child) {
    if (child.error() == ENOENT) {
      return std::unexpected(config_.binary + " is not installed or not on PATH");
    }
    return std::unexpected("Failed to start " + config_.binary + ": " + std::strerror(child.error()));
  }
  auto& process = **child;

  // a stop request signals the child right away, even while it is silent
  std::stop_callback on_stop(stop_token, [&process]() { process.terminate(); });

  char buffer[4096];
  std::string line;
  bool abandoned = false;
  while (std::fgets(buffer, sizeof(buffer), process.output()) != nullptr) {
    line += buffer;
    if (line.empty() || line.back() != '\n') {
      continue;
    }
    on_line(line);
    line.clear();
    if (stop_token.stop_requested()) {
      abandoned = true;
      break;
    }
  }
  if (!abandoned && !line.empty()) {
    on_line(line);
  }

  int status = process.wait();
  if (abandoned || stop_token.stop_requested()) {
    return std::unexpected("Download cancelled");
  }
  if (status == -1) {
    return std::unexpected("Failed to wait for " + config_.binary + ": " + std::strerror(errno));
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return std::unexpected(config_.binary + " was terminated by signal " + std::to_string(WTERMSIG(status)));
  }
  return std::unexpected(config_.binary + " ended abnormally");
}

std::expected<MediaInfo, std::string> YtDlpEngine::extractInfo(const std::string& url) {
  std::string output;
  auto status = runProcess(buildInfoArgs(url),
                           [&output](std::string_view line) { output.append(line); },
                           {});
  if (!status) {
    return std::unexpected(status.error());
  }
  if (*status != 0) {
    auto message = extractErrorMessage(output);
    return std::unexpected(message.empty() ? config_.binary + " exited with code " + std::to_string(*status)
                                           : message);
  }

  auto document = findJsonDocument(output);
  if (!document) {
    return std::unexpected("Unreadable metadata from " + config_.binary);
  }
  return parseMediaInfo(*document);
}

std::expected<FetchResult, std::string> YtDlpEngine::fetch(
  const std::string& url,
  const std::filesystem::path& output_template,
  const FetchOptions& options,
  ProgressHook progress_hook,
  std::stop_token stop_token
) {
  FetchOutputReader reader(std::move(progress_hook));
  auto status = runProcess(buildFetchArgs(url, output_template, options),
                           [&reader](std::string_view line) { reader.consume(line); },
                           stop_token);
  if (!status) {
    return std::unexpected(status.error());
  }
  if (*status != 0) {
    auto message = reader.errorMessage();
    std::cerr << "[yt-dlp] exit code " << *status << " for " << url << std::endl;
    return std::unexpected(message.empty() ? config_.binary + " exited with code " + std::to_string(*status)
                                           : message);
  }
  if (!reader.hasResult()) {
    std::cerr << "[yt-dlp] " << url << " finished without reporting its output file" << std::endl;
  }
  return reader.result();
}

}
