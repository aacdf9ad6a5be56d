#pragma once
#include <memory>
#include <QCheckBox>
#include <QLabel>
#include <QLineEdit>
#include <QMainWindow>
#include <QProgressBar>
#include <QPushButton>
#include "application/download_orchestrator.hpp"
#include "common/settings_store.hpp"
#include "interface/qt/busy_overlay.hpp"
#include "interface/qt/ui_progress_relay.hpp"

namespace download_service {

class MainWindow : public QMainWindow {
  Q_OBJECT

public:
  MainWindow(std::shared_ptr<DownloadOrchestrator> orchestrator,
             common::SettingsStore settings,
             QWidget* parent = nullptr);

protected:
  void closeEvent(QCloseEvent* event) override;

private slots:
  void pickDirectory();
  void startDownload();
  void onProgressChanged(int phase, double percent, const QString& message);
  void onDownloadSucceeded(const QString& path);
  void onDownloadFailed(const QString& message);

private:
  void setupUi();
  void loadSettings();
  void saveSettings() const;
  void finishDownload();
  QString defaultOutputDir() const;

  std::shared_ptr<DownloadOrchestrator> orchestrator_;
  common::SettingsStore settings_;

  QLineEdit* url_edit_;
  QLineEdit* out_dir_edit_;
  QPushButton* browse_button_;
  QCheckBox* aria_check_;
  QProgressBar* progress_;
  QLabel* status_label_;
  QPushButton* download_button_;
  BusyOverlay* overlay_;

  // fixed at construction and handed to every download
  ObserverList observers_;
  std::shared_ptr<UiProgressRelay> relay_;
  std::shared_ptr<DownloadHandle> active_handle_;
};

}
