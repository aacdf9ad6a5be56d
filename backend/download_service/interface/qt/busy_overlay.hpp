#pragma once
#include <QLabel>
#include <QPointer>
#include <QWidget>
#include "domain/download_observer.hpp"

namespace download_service {

// Translucent layer over the parent widget that blocks input while a
// download runs.
class BusyOverlay : public QWidget {
  Q_OBJECT

public:
  explicit BusyOverlay(QWidget* parent);

  void showBusy(const QString& text);
  void hideBusy();

protected:
  bool eventFilter(QObject* watched, QEvent* event) override;
  void paintEvent(QPaintEvent* event) override;

private:
  QLabel* label_;
};

// Drives a BusyOverlay from a download's event stream. Safe to call from the
// worker thread; the overlay may be destroyed before the download ends.
class BusyOverlayObserver : public DownloadObserver {
public:
  explicit BusyOverlayObserver(BusyOverlay* overlay);

  void onProgress(const ProgressEvent& event) override;
  void onResult(const DownloadResult& result) override;

private:
  QPointer<BusyOverlay> overlay_;
};

}
