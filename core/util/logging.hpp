#pragma once

#include <spdlog/spdlog.h>

namespace congraph {
namespace logging {

/// Configure the default spdlog logger used by the library.
/// Library messages are tagged "[graph]", "[search]", "[planar]", ...
void init(spdlog::level::level_enum level = spdlog::level::warn);

} // namespace logging
} // namespace congraph
