#include "busy_overlay.hpp"
#include <QEvent>
#include <QMetaObject>
#include <QPainter>
#include <QVBoxLayout>

namespace download_service {

BusyOverlay::BusyOverlay(QWidget* parent)
  : QWidget(parent), label_(new QLabel(this)) {
  setAttribute(Qt::WA_NoSystemBackground);
  setAttribute(Qt::WA_TransparentForMouseEvents, false);

  label_->setAlignment(Qt::AlignCenter);
  label_->setStyleSheet(QStringLiteral("color: white; font-weight: bold;"));
  auto* layout = new QVBoxLayout(this);
  layout->addWidget(label_);

  parent->installEventFilter(this);
  setGeometry(parent->rect());
  hide();
}

void BusyOverlay::showBusy(const QString& text) {
  label_->setText(text);
  setGeometry(parentWidget()->rect());
  raise();
  show();
}

void BusyOverlay::hideBusy() {
  hide();
}

bool BusyOverlay::eventFilter(QObject* watched, QEvent* event) {
  if (watched == parentWidget() && event->type() == QEvent::Resize) {
    setGeometry(parentWidget()->rect());
  }
  return QWidget::eventFilter(watched, event);
}

void BusyOverlay::paintEvent(QPaintEvent*) {
  QPainter painter(this);
  painter.fillRect(rect(), QColor(0, 0, 0, 110));
}

BusyOverlayObserver::BusyOverlayObserver(BusyOverlay* overlay) : overlay_(overlay) {}

void BusyOverlayObserver::onProgress(const ProgressEvent& event) {
  if (event.phase != Phase::Preparing) {
    return;
  }
  QPointer<BusyOverlay> overlay = overlay_;
  if (!overlay) {
    return;
  }
  QMetaObject::invokeMethod(overlay.data(), [overlay]() {
    if (overlay) {
      overlay->showBusy(QStringLiteral("Working…"));
    }
  }, Qt::QueuedConnection);
}

void BusyOverlayObserver::onResult(const DownloadResult&) {
  QPointer<BusyOverlay> overlay = overlay_;
  if (!overlay) {
    return;
  }
  QMetaObject::invokeMethod(overlay.data(), [overlay]() {
    if (overlay) {
      overlay->hideBusy();
    }
  }, Qt::QueuedConnection);
}

}
