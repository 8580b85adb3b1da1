#include <guest/text.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace guest {

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::vector<std::string> Split(const std::string &value, char delimiter) {
  std::vector<std::string> fields;
  std::string current;
  for (const auto character : value) {
    if (character == delimiter) {
      fields.push_back(current);
      current.clear();
    } else {
      current.push_back(character);
    }
  }
  fields.push_back(current);
  return fields;
}

std::vector<std::string> SplitWhitespace(const std::string &value) {
  std::vector<std::string> words;
  std::istringstream stream(value);
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  return words;
}

} // namespace guest
