#include "application/download_orchestrator.hpp"
#include "application/media_service.hpp"
#include "infrastructure/executable_locator.hpp"
#include "infrastructure/ytdlp_engine.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#include "common/thread_pool.hpp"
#include "common/worker_registry.hpp"
#include "interface/rest_api_handler.hpp"
#include <csignal>
#include <filesystem>
#include <iostream>
#include <boost/asio.hpp>

int main(int argc, char** argv) {
  try {
    const auto cfg = config::Config::fromEnvironment();
    const auto& storage = cfg.getStorage();
    std::filesystem::create_directories(storage.scratch_root);

    std::shared_ptr<download_service::ExtractionEngine> engine =
      std::make_shared<download_service::YtDlpEngine>(cfg.getEngine());

    auto orchestrator = std::make_shared<download_service::DownloadOrchestrator>(
      engine, cfg.getDownload(), storage.scratch_prefix, &download_service::findExecutable);

    auto media_service = std::make_shared<download_service::MediaService>(
      engine, orchestrator, storage);

    const auto& server_config = cfg.getServer();
    boost::asio::io_context ioc{1};
    // declared after the io_context so workers are joined before it goes away;
    // shutdown waits for transfers still in progress
    common::ThreadPool pool{server_config.worker_threads};
    common::WorkerRegistry download_workers;

    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(server_config.host),
      server_config.port
    };

    auto api_handler = std::make_shared<download_service::RestApiHandler>(media_service);
    common::HttpServer http_server{ioc, http_endpoint, api_handler, pool, download_workers,
                                 storage.chunk_size};

    boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
    signals.async_wait([&ioc, &http_server](const boost::system::error_code&, int) {
      std::cout << "[server] Shutting down" << std::endl;
      http_server.stop();
      ioc.stop();
    });

    std::cout << "[server] HTTP Server listening on " << cfg.getServerAddress()
              << " (" << pool.size() << " workers, scratch in " << storage.scratch_root << ")" << std::endl;

    http_server.run();
    ioc.run();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
