// taskstream initialization
#include "taskstream/taskstream.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"
#include "log/log.h"

namespace taskstream {

void init(const Config &config) {
  init_log(config.log_file.value_or(std::filesystem::path{}), config.log_level, config.log_keep);

  auto providers = llm::ProviderFactory::instance().names();
  spdlog::info("taskstream {} ready ({} provider(s) registered, store {})", version(), providers.size(), config.store_dir.string());
}

void shutdown() {
  if (auto logger = spdlog::default_logger()) {
    logger->flush();
  }
}

std::string version() {
  return TASKSTREAM_VERSION_STRING;
}

}  // namespace taskstream
