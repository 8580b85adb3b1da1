#include <guest/option_parser.h>

#include <guest/text.h>

#include <algorithm>

namespace guest {

OptionsMap ParseOptions(const std::string &raw, Logger &logger) {
  OptionsMap options;
  const auto trimmed = Trim(raw);
  if (trimmed.empty()) {
    return options;
  }

  for (const auto &field : Split(trimmed, ',')) {
    const auto token = Trim(field);
    const auto separator = token.find('=');
    if (separator == std::string::npos ||
        std::count(token.begin(), token.end(), '=') != 1) {
      logger.Log(LogLevel::kWarn, "options.malformed",
                 {{"option", token}, {"reason", "expected key=value"}});
      continue;
    }

    auto key = Trim(token.substr(0, separator));
    if (key.empty()) {
      logger.Log(LogLevel::kWarn, "options.malformed",
                 {{"option", token}, {"reason", "empty key"}});
      continue;
    }
    options[std::move(key)] = Trim(token.substr(separator + 1));
  }

  logger.Log(LogLevel::kDebug, "options.parsed",
             {{"count", std::to_string(options.size())}});
  return options;
}

} // namespace guest
