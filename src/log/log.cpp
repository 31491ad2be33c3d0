#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <iostream>

#include "core/config.hpp"

namespace taskstream {

namespace fs = std::filesystem;

namespace {

fs::path numbered(const fs::path& log_file, int n) {
  auto name = log_file.stem().string() + "." + std::to_string(n) + log_file.extension().string();
  return log_file.parent_path() / name;
}

// worker.log -> worker.1.log -> ... -> worker.<keep>.log
void shift_previous_logs(const fs::path& log_file, int keep) {
  std::error_code ec;
  if (!fs::exists(log_file, ec)) {
    return;
  }
  if (keep <= 0) {
    fs::remove(log_file, ec);
    return;
  }

  fs::remove(numbered(log_file, keep), ec);
  for (int n = keep - 1; n >= 1; --n) {
    if (fs::exists(numbered(log_file, n), ec)) {
      fs::rename(numbered(log_file, n), numbered(log_file, n + 1), ec);
    }
  }
  fs::rename(log_file, numbered(log_file, 1), ec);
  if (ec) {
    std::cerr << "Failed to move previous log " << log_file << ": " << ec.message() << "\n";
  }
}

}  // namespace

void init_log(const fs::path& log_file, const std::string& level, int keep) {
  fs::path path = log_file.empty() ? config_paths::config_dir() / "log" / "taskstream.log" : log_file;

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      std::cerr << "Failed to create log directory: " << ec.message() << "\n";
      return;
    }
  }
  shift_previous_logs(path, keep);

  try {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("taskstream", file_sink);

    auto parsed = spdlog::level::from_str(level);
    logger->set_level(parsed == spdlog::level::off && level != "off" ? spdlog::level::info : parsed);

    // [时间] [级别] [线程] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::drop("taskstream");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== taskstream logging to {} at {} ===", path.string(), spdlog::level::to_string_view(logger->level()));
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace taskstream
