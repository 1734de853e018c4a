#pragma once

#include <string>

namespace bailment::config {

/// Install the process-wide asynchronous logger: a colour console sink plus
/// a file sink when `log_file` is not empty.
void setup_logging(const std::string& level, const std::string& log_file);

}  // namespace bailment::config
