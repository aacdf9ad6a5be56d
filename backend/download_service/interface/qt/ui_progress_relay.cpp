#include "ui_progress_relay.hpp"

namespace download_service {

UiProgressRelay::UiProgressRelay(QObject* parent) : QObject(parent) {}

void UiProgressRelay::onProgress(const ProgressEvent& event) {
  emit progressChanged(static_cast<int>(event.phase),
                       event.percent.value_or(-1.0),
                       QString::fromStdString(event.message));
}

void UiProgressRelay::onResult(const DownloadResult& result) {
  if (result.success && result.output_path) {
    emit downloadSucceeded(QString::fromStdString(result.output_path->string()));
  } else {
    emit downloadFailed(QString::fromStdString(
      result.error ? result.error->message : std::string("Download failed")));
  }
}

}
