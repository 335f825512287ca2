#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace wx_gateway {

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

}  // namespace wx_gateway
