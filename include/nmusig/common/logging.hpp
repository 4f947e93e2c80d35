#pragma once

#include <string>

#include "easylogging++.h"

namespace nmusig {

struct LoggingOptions {
  // Empty means log to standard output only.
  std::string file;
  int verbosity = 0;
};

// Reads NMUSIG_LOG_FILE and NMUSIG_LOG_VERBOSITY.
LoggingOptions LoggingOptionsFromEnv();

// Installs the default easylogging++ configuration for this process. Every
// executable must also expand INITIALIZE_EASYLOGGINGPP exactly once.
void ConfigureLogging(const LoggingOptions& options);

}  // namespace nmusig
