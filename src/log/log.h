#ifndef TASKSTREAM_LOG_H
#define TASKSTREAM_LOG_H

#include <filesystem>
#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace taskstream {

/**
 * 安装 "taskstream" 默认 logger，写入单个文件
 *
 * 每个进程一个日志文件：已有的日志（如 worker.log）依次后移为
 * worker.1.log、worker.2.log ...，超过 keep 个的最旧文件被删除。
 * 会话和引擎的日志都带 [模块] 前缀，方便按 task id 过滤。
 *
 * @param log_file 日志文件；为空时使用 <config_dir>/log/taskstream.log
 * @param level spdlog 级别名，无法识别时用 info
 * @param keep 保留的旧日志个数，0 表示不保留
 */
void init_log(const std::filesystem::path& log_file, const std::string& level, int keep);

/**
 * 当前默认 logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace taskstream

#endif  // TASKSTREAM_LOG_H
