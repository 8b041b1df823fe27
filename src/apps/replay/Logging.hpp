#pragma once

#include "Logger/Logger.hpp"

namespace quorum::replay {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace quorum::replay
