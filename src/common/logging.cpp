#include "nmusig/common/logging.hpp"

#include <algorithm>
#include <cstdlib>

namespace nmusig {
namespace {

int ParseVerbosity(const char* env) {
  if (env == nullptr || env[0] == '\0') {
    return 0;
  }
  char* end = nullptr;
  const long parsed = std::strtol(env, &end, 10);
  if (end == env || end == nullptr || *end != '\0' || parsed < 0) {
    return 0;
  }
  return static_cast<int>(std::min<long>(parsed, 9));
}

}  // namespace

LoggingOptions LoggingOptionsFromEnv() {
  LoggingOptions options;
  const char* file = std::getenv("NMUSIG_LOG_FILE");
  if (file != nullptr) {
    options.file = file;
  }
  options.verbosity = ParseVerbosity(std::getenv("NMUSIG_LOG_VERBOSITY"));
  return options;
}

void ConfigureLogging(const LoggingOptions& options) {
  const bool to_file = !options.file.empty();

  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Format, "%datetime{%H:%m:%s.%g} %level %msg");
  conf.setGlobally(el::ConfigurationType::ToFile, to_file ? "true" : "false");
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, to_file ? "false" : "true");
  if (to_file) {
    conf.setGlobally(el::ConfigurationType::Filename, options.file);
  }
  conf.set(el::Level::Debug, el::ConfigurationType::Enabled, options.verbosity > 0 ? "true" : "false");

  el::Loggers::addFlag(el::LoggingFlag::ImmediateFlush);
  el::Loggers::setDefaultConfigurations(conf, true);
  el::Loggers::setVerboseLevel(options.verbosity);
}

}  // namespace nmusig
