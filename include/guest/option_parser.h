#pragma once

#include <guest/logging.h>
#include <guest/models.h>

#include <string>

namespace guest {

// Parses "key1=value1,key2=value2". Malformed pairs are dropped with a
// warning; parsing never fails.
OptionsMap ParseOptions(const std::string &raw, Logger &logger);

} // namespace guest
