#include "./lib.cpp" // Include all definitions from lib.cpp

// Standard Headers needed by main itself
#include <iostream> // For std::cout, std::cerr, std::cin
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
  // 1. Parse Arguments
  Config config;
  try {
    config = parse_arguments(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << "ERROR: " << e.what() << "\n\n";
    print_usage(std::cerr);
    return 2;
  }

  if (config.showHelp) {
    print_usage(std::cout);
    return 0;
  }

  // 2. Collect input paths (stdin when none were given)
  std::vector<std::string> paths = config.paths;
  if (paths.empty() && !read_paths_from_stream(std::cin, paths)) {
    std::cerr << "ERROR: Error reading stdin\n";
    return 1;
  }

  // 3. Process every path; per-path failures are reported, not fatal
  process_paths(paths, config, std::cout);
  std::cout.flush();
  return 0;
}
