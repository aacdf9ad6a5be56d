#include "application/download_orchestrator.hpp"
#include "infrastructure/executable_locator.hpp"
#include "infrastructure/ytdlp_engine.hpp"
#include "interface/qt/main_window.hpp"
#include "common/config/config.hpp"
#include "common/settings_store.hpp"
#include <QApplication>
#include <QMessageBox>
#include <iostream>

int main(int argc, char** argv) {
  QApplication app(argc, argv);
  QApplication::setApplicationName(QStringLiteral("glassdl"));

  try {
    const auto cfg = config::Config::fromEnvironment();

    std::shared_ptr<download_service::ExtractionEngine> engine =
      std::make_shared<download_service::YtDlpEngine>(cfg.getEngine());
    auto orchestrator = std::make_shared<download_service::DownloadOrchestrator>(
      engine, cfg.getDownload(), ".glassdl-", &download_service::findExecutable);

    if (!download_service::findExecutable(cfg.getEngine().binary)) {
      std::cerr << "[gui] " << cfg.getEngine().binary << " not found in PATH; downloads will fail" << std::endl;
    }

    download_service::MainWindow window(orchestrator, common::SettingsStore::forApplication("glassdl"));
    window.show();

    return app.exec();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    QMessageBox::critical(nullptr, QStringLiteral("glassdl"), QString::fromStdString(e.what()));
    return 1;
  }
}
