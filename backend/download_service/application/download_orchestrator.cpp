#include "download_orchestrator.hpp"
#include "progress_normalizer.hpp"
#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <iostream>
#include <system_error>
#include <unistd.h>

namespace download_service {

namespace fs = std::filesystem;

namespace {

std::string trimmed(const std::string& text) {
  auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

fs::path expandUser(const fs::path& path) {
  auto text = path.string();
  if (text == "~" || text.starts_with("~/")) {
    const char* home = std::getenv("HOME");
    if (home != nullptr) {
      return fs::path(home) / text.substr(text.size() > 1 ? 2 : 1);
    }
  }
  return path;
}

// Reserves "<stem>.<ext>", then "<stem> (1).<ext>" and so on by creating an
// empty placeholder, so concurrent downloads of the same title cannot pick
// the same name.
std::expected<fs::path, std::error_code> reserveTarget(const fs::path& directory, const fs::path& filename) {
  auto stem = filename.stem().string();
  auto ext = filename.extension().string();
  for (int n = 0;; ++n) {
    auto target = n == 0 ? directory / filename
                         : directory / (stem + " (" + std::to_string(n) + ")" + ext);
    int fd = ::open(target.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd >= 0) {
      ::close(fd);
      return target;
    }
    if (errno != EEXIST) {
      return std::unexpected(std::error_code(errno, std::generic_category()));
    }
  }
}

} // namespace

// Fans events out to the observers and keeps the percentage from going
// backwards between the 0% reset and the terminal event.
class DownloadOrchestrator::ProgressDispatcher {
public:
  explicit ProgressDispatcher(const ObserverList& observers) : observers_(observers) {}

  void reset() {
    last_percent_ = 0.0;
    deliver(ProgressEvent{Phase::Preparing, 0.0, "Preparing download…"});
  }

  void emit(ProgressEvent event) {
    if (event.percent) {
      if (*event.percent < last_percent_) {
        event.percent = last_percent_;
      }
      last_percent_ = *event.percent;
    }
    deliver(event);
  }

  void finish(const DownloadResult& result) {
    if (result.success) {
      emit(ProgressEvent{Phase::Finished, 100.0,
                         "Done! File saved to " + result.output_path->string()});
    } else {
      emit(ProgressEvent{Phase::Failed, std::nullopt, "Error: " + result.error->message});
    }
    for (const auto& observer : observers_) {
      try {
        observer->onResult(result);
      } catch (const std::exception& e) {
        std::cerr << "[orchestrator] Observer failed on result: " << e.what() << std::endl;
      }
    }
  }

private:
  void deliver(const ProgressEvent& event) {
    for (const auto& observer : observers_) {
      try {
        observer->onProgress(event);
      } catch (const std::exception& e) {
        std::cerr << "[orchestrator] Observer failed on progress: " << e.what() << std::endl;
      }
    }
  }

  const ObserverList& observers_;
  double last_percent_{0.0};
};

void DownloadHandle::cancel() {
  worker_.request_stop();
}

DownloadOrchestrator::DownloadOrchestrator(std::shared_ptr<ExtractionEngine> engine,
                                           config::DownloadConfig config,
                                           std::string scratch_prefix,
                                           ExecutableLookup find_executable)
  : engine_(std::move(engine)),
    config_(std::move(config)),
    scratch_prefix_(std::move(scratch_prefix)),
    find_executable_(std::move(find_executable)) {}

std::shared_ptr<DownloadHandle> DownloadOrchestrator::start(DownloadRequest request, ObserverList observers) {
  std::shared_ptr<DownloadHandle> handle(new DownloadHandle());
  handle->result_ = handle->promise_.get_future().share();

  handle->worker_ = std::jthread(
    [self = shared_from_this(), handle_ptr = handle.get(),
     request = std::move(request), observers = std::move(observers)](std::stop_token stop_token) {
      auto result = self->run(request, observers, stop_token);
      handle_ptr->promise_.set_value(std::move(result));
      handle_ptr->active_.store(false, std::memory_order_release);
    });
  return handle;
}

DownloadResult DownloadOrchestrator::run(const DownloadRequest& request,
                                         const ObserverList& observers,
                                         std::stop_token stop_token) const {
  ProgressDispatcher dispatcher(observers);
  DownloadResult result;
  try {
    result = execute(request, dispatcher, stop_token);
  } catch (const std::exception& e) {
    result = DownloadResult::failed({ErrorKind::Internal, e.what()});
  }

  if (!result.success) {
    std::cerr << "[orchestrator] " << request.source_url << " failed ("
              << errorKindName(result.error->kind) << "): " << result.error->message << std::endl;
  }
  dispatcher.finish(result);
  return result;
}

DownloadResult DownloadOrchestrator::execute(const DownloadRequest& request,
                                             ProgressDispatcher& dispatcher,
                                             std::stop_token stop_token) const {
  auto url = trimmed(request.source_url);
  if (url.empty()) {
    return DownloadResult::failed({ErrorKind::Validation, "Missing url"});
  }

  auto destination = prepareDestination(request.destination_directory);
  if (!destination) {
    return DownloadResult::failed(destination.error());
  }

  FetchOptions options;
  options.concurrent_fragments = config_.concurrent_fragments;
  options.merge_output_format = config_.merge_output_format;
  if (request.format_selector && !trimmed(*request.format_selector).empty()) {
    options.format_id = trimmed(*request.format_selector);
  }
  if (request.use_external_accelerator) {
    auto program = find_executable_ ? find_executable_(config_.accelerator) : std::nullopt;
    if (!program) {
      return DownloadResult::failed({ErrorKind::AcceleratorUnavailable,
        config_.accelerator + " was not found on PATH; install it or turn off the accelerator"});
    }
    options.accelerator = AcceleratorOptions{program->string(), config_.accelerator_args};
  }

  auto created = common::ScratchDirectory::create(*destination, scratch_prefix_);
  if (!created) {
    return DownloadResult::failed({ErrorKind::Directory, created.error()});
  }
  // shared so that a hand-off result can carry it out of this scope; in every
  // other path the last reference dies here and takes the directory with it
  auto scratch = std::make_shared<common::ScratchDirectory>(std::move(*created));

  if (stop_token.stop_requested()) {
    return DownloadResult::failed({ErrorKind::Cancelled, "Download cancelled"});
  }

  dispatcher.reset();

  std::expected<FetchResult, std::string> fetched;
  try {
    fetched = engine_->fetch(
      url,
      scratch->path() / config_.output_template,
      options,
      [&dispatcher](const RawProgress& raw) { dispatcher.emit(ProgressNormalizer::normalize(raw)); },
      stop_token);
  } catch (const std::exception& e) {
    return DownloadResult::failed({ErrorKind::Engine, e.what()});
  }

  if (!fetched) {
    if (stop_token.stop_requested()) {
      return DownloadResult::failed({ErrorKind::Cancelled, "Download cancelled"});
    }
    return DownloadResult::failed({ErrorKind::Engine, fetched.error()});
  }

  auto produced = resolveOutput(*fetched, *scratch);
  if (!produced) {
    return DownloadResult::failed({ErrorKind::OutputNotFound, "Downloaded file not found"});
  }

  if (request.hand_off_output) {
    return DownloadResult::succeeded(*produced, std::move(scratch));
  }

  auto placed = placeOutput(*produced, *destination);
  if (!placed) {
    return DownloadResult::failed(placed.error());
  }
  scratch->remove();
  return DownloadResult::succeeded(*placed);
}

std::expected<fs::path, DownloadError> DownloadOrchestrator::prepareDestination(
  const fs::path& requested) const {
  if (requested.empty()) {
    return std::unexpected(DownloadError{ErrorKind::Directory, "No destination directory given"});
  }

  std::error_code ec;
  auto destination = fs::absolute(expandUser(requested), ec);
  if (ec) {
    return std::unexpected(DownloadError{ErrorKind::Directory,
      "Cannot resolve " + requested.string() + ": " + ec.message()});
  }
  destination = destination.lexically_normal();

  fs::create_directories(destination, ec);
  if (ec) {
    return std::unexpected(DownloadError{ErrorKind::Directory,
      "Cannot create " + destination.string() + ": " + ec.message()});
  }
  if (!fs::is_directory(destination, ec)) {
    return std::unexpected(DownloadError{ErrorKind::Directory,
      destination.string() + " is not a directory"});
  }
  if (::access(destination.c_str(), W_OK) != 0) {
    return std::unexpected(DownloadError{ErrorKind::Directory,
      destination.string() + " is not writable"});
  }
  return destination;
}

std::optional<fs::path> DownloadOrchestrator::resolveOutput(
  const FetchResult& fetched,
  const common::ScratchDirectory& scratch) const {
  std::error_code ec;

  for (const auto& reported : fetched.output_paths) {
    if (scratch.contains(reported) && fs::is_regular_file(reported, ec)) {
      return reported;
    }
  }

  if (!fetched.title.empty()) {
    auto ext = fetched.ext.empty() ? config_.merge_output_format : fetched.ext;
    auto candidate = scratch.path() / (fetched.title + "." + ext);
    if (candidate.parent_path() == scratch.path() && fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
  }

  fs::directory_iterator it(scratch.path(), ec);
  if (ec) {
    std::cerr << "[orchestrator] Cannot list " << scratch.path() << ": " << ec.message() << std::endl;
    return std::nullopt;
  }
  for (const auto& entry : it) {
    if (entry.is_regular_file(ec)) {
      return entry.path();
    }
  }
  return std::nullopt;
}

std::expected<fs::path, DownloadError> DownloadOrchestrator::placeOutput(
  const fs::path& produced,
  const fs::path& destination) const {
  auto reserved = reserveTarget(destination, produced.filename());
  if (!reserved) {
    return std::unexpected(DownloadError{ErrorKind::Directory,
      "Cannot create a file in " + destination.string() + ": " + reserved.error().message()});
  }
  const auto& target = *reserved;

  std::error_code ec;
  fs::rename(produced, target, ec);
  if (!ec) {
    return target;
  }

  // scratch and destination on different filesystems
  ec.clear();
  fs::copy_file(produced, target, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    auto message = "Cannot move the download into " + destination.string() + ": " + ec.message();
    fs::remove(target, ec);
    return std::unexpected(DownloadError{ErrorKind::Directory, message});
  }
  fs::remove(produced, ec);
  return target;
}

}
