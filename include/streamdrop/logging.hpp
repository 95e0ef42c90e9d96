#pragma once

#include <memory>

#include <spdlog/logger.h>

namespace streamdrop {

// Colored stderr logger named "streamdrop". Not registered globally; callers
// pass it to whatever needs it.
std::shared_ptr<spdlog::logger> makeLogger(bool verbose = false);

// Discards everything. Used when a caller does not care about diagnostics.
std::shared_ptr<spdlog::logger> makeNullLogger();

} // namespace streamdrop
