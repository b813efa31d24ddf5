#pragma once

#include <string>

#include <spdlog/spdlog.h>

void setup_logging(const std::string& level);
