#pragma once
#include <QObject>
#include <QString>
#include "domain/download_observer.hpp"

namespace download_service {

// Observer that turns worker-thread callbacks into Qt signals. Receivers on
// the UI thread connect with Qt::QueuedConnection, which is the only path by
// which download state reaches the widgets.
class UiProgressRelay : public QObject, public DownloadObserver {
  Q_OBJECT

public:
  explicit UiProgressRelay(QObject* parent = nullptr);

  void onProgress(const ProgressEvent& event) override;
  void onResult(const DownloadResult& result) override;

signals:
  // percent is -1 when the engine gave no usable figure
  void progressChanged(int phase, double percent, const QString& message);
  void downloadSucceeded(const QString& path);
  void downloadFailed(const QString& message);
};

}
