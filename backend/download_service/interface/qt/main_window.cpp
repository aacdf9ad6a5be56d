#include "main_window.hpp"

#include <QCloseEvent>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QMessageBox>
#include <QStandardPaths>
#include <QVBoxLayout>
#include <cmath>
#include <iostream>

namespace download_service {

namespace {
constexpr const char* kLastDirKey = "last_dir";
constexpr const char* kUseAria2cKey = "use_aria2c";
}

MainWindow::MainWindow(std::shared_ptr<DownloadOrchestrator> orchestrator,
                       common::SettingsStore settings,
                       QWidget* parent)
  : QMainWindow(parent),
    orchestrator_(std::move(orchestrator)),
    settings_(std::move(settings)),
    url_edit_(nullptr),
    out_dir_edit_(nullptr),
    browse_button_(nullptr),
    aria_check_(nullptr),
    progress_(nullptr),
    status_label_(nullptr),
    download_button_(nullptr),
    overlay_(nullptr) {
  setupUi();

  // not parented: lifetime is shared with in-flight worker threads
  relay_ = std::make_shared<UiProgressRelay>();
  connect(relay_.get(), &UiProgressRelay::progressChanged,
          this, &MainWindow::onProgressChanged, Qt::QueuedConnection);
  connect(relay_.get(), &UiProgressRelay::downloadSucceeded,
          this, &MainWindow::onDownloadSucceeded, Qt::QueuedConnection);
  connect(relay_.get(), &UiProgressRelay::downloadFailed,
          this, &MainWindow::onDownloadFailed, Qt::QueuedConnection);

  observers_ = {relay_, std::make_shared<BusyOverlayObserver>(overlay_)};

  loadSettings();
}

void MainWindow::setupUi() {
  setWindowTitle(QStringLiteral("glassdl"));
  resize(640, 260);

  auto* central = new QWidget(this);
  setCentralWidget(central);

  url_edit_ = new QLineEdit();
  url_edit_->setPlaceholderText(QStringLiteral("https://www.youtube.com/watch?v=… or another URL"));

  out_dir_edit_ = new QLineEdit();
  out_dir_edit_->setPlaceholderText(QStringLiteral("Output directory"));
  browse_button_ = new QPushButton(QStringLiteral("Browse…"));

  aria_check_ = new QCheckBox(QStringLiteral("Use aria2c"));
  aria_check_->setToolTip(QStringLiteral("Use aria2c as external downloader"));

  progress_ = new QProgressBar();
  progress_->setRange(0, 100);
  progress_->setValue(0);

  status_label_ = new QLabel(QStringLiteral("Ready"));
  status_label_->setWordWrap(true);

  download_button_ = new QPushButton(QStringLiteral("Download"));
  download_button_->setDefault(true);

  auto* dir_row = new QHBoxLayout();
  dir_row->addWidget(out_dir_edit_, 1);
  dir_row->addWidget(browse_button_);

  auto* layout = new QVBoxLayout(central);
  layout->addWidget(new QLabel(QStringLiteral("Video URL")));
  layout->addWidget(url_edit_);
  layout->addWidget(new QLabel(QStringLiteral("Save to")));
  layout->addLayout(dir_row);
  layout->addWidget(aria_check_);
  layout->addWidget(progress_);
  layout->addWidget(status_label_);
  layout->addWidget(download_button_);
  layout->addStretch(1);

  overlay_ = new BusyOverlay(central);

  connect(browse_button_, &QPushButton::clicked, this, &MainWindow::pickDirectory);
  connect(download_button_, &QPushButton::clicked, this, &MainWindow::startDownload);
  connect(url_edit_, &QLineEdit::returnPressed, this, &MainWindow::startDownload);
}

QString MainWindow::defaultOutputDir() const {
  auto dir = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
  if (dir.isEmpty()) {
    dir = QDir::homePath();
  }
  return dir;
}

void MainWindow::loadSettings() {
  auto stored = settings_.load();
  QString dir;
  if (auto it = stored.find(kLastDirKey); it != stored.end() && it->is_string()) {
    dir = QString::fromStdString(it->get<std::string>());
  }
  out_dir_edit_->setText(dir.isEmpty() ? defaultOutputDir() : dir);

  if (auto it = stored.find(kUseAria2cKey); it != stored.end() && it->is_boolean()) {
    aria_check_->setChecked(it->get<bool>());
  }
}

void MainWindow::saveSettings() const {
  auto stored = settings_.load();
  stored[kLastDirKey] = out_dir_edit_->text().trimmed().toStdString();
  stored[kUseAria2cKey] = aria_check_->isChecked();
  if (!settings_.save(stored)) {
    std::cerr << "[gui] Could not write " << settings_.file() << std::endl;
  }
}

void MainWindow::pickDirectory() {
  const QString start = out_dir_edit_->text().isEmpty() ? defaultOutputDir() : out_dir_edit_->text();
  const QString dir = QFileDialog::getExistingDirectory(this, QStringLiteral("Choose output directory"), start);
  if (!dir.isEmpty()) {
    out_dir_edit_->setText(dir);
  }
}

void MainWindow::startDownload() {
  if (active_handle_ && active_handle_->isActive()) {
    QMessageBox::warning(this, QStringLiteral("In progress"), QStringLiteral("A download is already in progress."));
    return;
  }

  const QString url = url_edit_->text().trimmed();
  if (url.isEmpty()) {
    QMessageBox::warning(this, QStringLiteral("Error"), QStringLiteral("Enter a URL."));
    return;
  }

  QString out_dir = out_dir_edit_->text().trimmed();
  if (out_dir.isEmpty()) {
    out_dir = defaultOutputDir();
    out_dir_edit_->setText(out_dir);
  }

  DownloadRequest request;
  request.source_url = url.toStdString();
  request.destination_directory = std::filesystem::path(out_dir.toStdString());
  request.use_external_accelerator = aria_check_->isChecked();

  saveSettings();

  download_button_->setEnabled(false);
  progress_->setValue(0);
  status_label_->setText(QStringLiteral("Starting…"));

  active_handle_ = orchestrator_->start(std::move(request), observers_);
}

void MainWindow::onProgressChanged(int phase, double percent, const QString& message) {
  if (percent >= 0.0) {
    progress_->setValue(static_cast<int>(std::lround(percent)));
  }
  if (static_cast<Phase>(phase) == Phase::Downloading && percent >= 0.0) {
    status_label_->setText(QString::number(percent, 'f', 1) + QStringLiteral("% ") + message);
  } else {
    status_label_->setText(message);
  }
}

void MainWindow::onDownloadSucceeded(const QString& path) {
  finishDownload();
  progress_->setValue(100);
  status_label_->setText(QStringLiteral("Saved to ") + path);
}

void MainWindow::onDownloadFailed(const QString& message) {
  finishDownload();
  status_label_->setText(QStringLiteral("Error: ") + message);
  QMessageBox::critical(this, QStringLiteral("Download failed"), message);
}

void MainWindow::finishDownload() {
  active_handle_.reset();
  download_button_->setEnabled(true);
}

void MainWindow::closeEvent(QCloseEvent* event) {
  if (active_handle_ && active_handle_->isActive()) {
    QMessageBox::information(this, QStringLiteral("Download in progress"),
                             QStringLiteral("Please wait for the current download to finish before closing."));
    event->ignore();
    return;
  }
  saveSettings();
  event->accept();
}

}
