#include "util/logging.hpp"

namespace congraph {
namespace logging {

void init(spdlog::level::level_enum level) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(level);
}

} // namespace logging
} // namespace congraph
