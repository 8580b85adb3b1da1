#include <guest/analyzer.h>
#include <guest/cli_exit_codes.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);
    return guest::RunAnalyzer(arguments);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    guest::PrintUsage(std::cerr);
    return guest::kExitUsageError;
  }
}
