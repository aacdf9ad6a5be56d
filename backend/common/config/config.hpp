#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace config {

struct ServerConfig {
  std::string host;
  unsigned short port;
  unsigned int worker_threads;
};

struct EngineConfig {
  std::string binary;
  std::optional<std::filesystem::path> cookies_file;
  std::vector<std::string> youtube_clients;
  int retries;
  std::string user_agent;
  std::string accept_language;
};

struct StorageConfig {
  std::filesystem::path scratch_root;
  std::string scratch_prefix;
  size_t chunk_size;
};

struct DownloadConfig {
  std::string accelerator;
  std::vector<std::string> accelerator_args;
  int concurrent_fragments;
  std::string merge_output_format;
  std::string output_template;
};

// Built once in main() and handed out by sub-struct; nothing reads the
// environment after startup.
class Config {
public:
  static Config fromEnvironment();
  static Config defaults();

  const ServerConfig& getServer() const { return server_; }
  const EngineConfig& getEngine() const { return engine_; }
  const StorageConfig& getStorage() const { return storage_; }
  const DownloadConfig& getDownload() const { return download_; }
  std::string getServerAddress() const { return server_.host + ":" + std::to_string(server_.port); }

private:
  Config();

  ServerConfig server_;
  EngineConfig engine_;
  StorageConfig storage_;
  DownloadConfig download_;
};

} // namespace config
