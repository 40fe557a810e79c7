#pragma once
/*
 * Logging
 *
 * Purpose: configure spdlog's default logger for the viewer.
 * Note: stdout belongs to ncurses, so without a log file logging is switched off.
 */
#include <string>
#include "viewer_options.hpp"

bool setup_logging(const ViewerOptions& opts, std::string& msg);
