#pragma once

#include "Logger/Logger.hpp"

namespace menagerie::core {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace menagerie::core
