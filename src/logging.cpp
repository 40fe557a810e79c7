#include "logging.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

bool setup_logging(const ViewerOptions& opts, std::string& msg) {
  if (!opts.log_file) {
    spdlog::set_level(spdlog::level::off);
    return true;
  }
  try {
    auto logger = spdlog::basic_logger_mt("logpager", opts.log_file->string());
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& e) {
    spdlog::set_level(spdlog::level::off);
    msg = std::string("can not open log file: ") + e.what();
    return false;
  }
  spdlog::set_level(spdlog::level::from_str(opts.log_level));
  spdlog::flush_on(spdlog::level::warn);
  spdlog::info("logpager started, file: {}", opts.file ? opts.file->string() : std::string("-"));
  return true;
}
