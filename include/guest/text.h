#pragma once

#include <string>
#include <vector>

namespace guest {

std::string Trim(std::string value);
std::string ToLower(std::string value);
// Keeps empty fields: Split("a,,b", ',') has three entries.
std::vector<std::string> Split(const std::string &value, char delimiter);
std::vector<std::string> SplitWhitespace(const std::string &value);

} // namespace guest
