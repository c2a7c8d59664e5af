#include <algorithm>
#include <cctype> // For std::tolower
#include <cerrno>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits> // Needed for numeric_limits
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error> // For filesystem errors
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// --- Configuration ---

constexpr unsigned long long kDefaultMaxFileSizeB = 10ULL << 20; // 10 MiB
constexpr std::size_t kSniffSampleSize = 8 << 10;                // 8 KiB
constexpr std::size_t kCopyBufferSize = 64 << 10;

struct Config {
  bool recurse = false;
  std::string extension; // Lowercase with leading dot, empty = no filter
  bool namesOnly = false;
  unsigned long long maxFileSizeB = kDefaultMaxFileSizeB; // 0 = unlimited
  bool showHelp = false;
  std::vector<std::string> paths; // Positional arguments, in given order
};

// --- Results ---

enum class ResultKind {
  Ok,       // Directory walked without error
  Emitted,  // Delimiter and content written
  Listed,   // Name written (names-only mode)
  Filtered, // Rejected by the extension filter
  SkippedTooLarge,
  SkippedBinary,
  PathAccessError,
  DirectoryWithoutRecursion,
  TraversalError,
  IoError
};

struct ProcessResult {
  ResultKind kind = ResultKind::Ok;
  std::string message; // Set for errors only
};

bool is_error(ResultKind kind) {
  switch (kind) {
  case ResultKind::PathAccessError:
  case ResultKind::DirectoryWithoutRecursion:
  case ResultKind::TraversalError:
  case ResultKind::IoError:
    return true;
  default:
    return false;
  }
}

// --- Utility Functions ---

std::string trim(std::string_view str) {
  constexpr std::string_view whitespace = " \t\n\r\f\v";
  size_t start = str.find_first_not_of(whitespace);
  if (start == std::string_view::npos)
    return "";
  size_t end = str.find_last_not_of(whitespace);
  return std::string(str.substr(start, end - start + 1));
}

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

// Joins a directory entry name onto its parent the way a cleaned path reads:
// "./a.txt" becomes "a.txt", "src//a.txt" becomes "src/a.txt".
fs::path join_path(const fs::path &parent, const fs::path &name) {
  return (parent / name).lexically_normal();
}

// --- Extension Filter ---

// Lowercases the filter and makes sure it starts with a dot.
std::string normalize_extension(std::string_view extension) {
  if (extension.empty())
    return "";
  std::string normalized = to_lower(std::string(extension));
  if (normalized.front() != '.')
    normalized.insert(normalized.begin(), '.');
  return normalized;
}

// Plain suffix comparison: "gz" also accepts "a.tar.gz", "o" accepts "foo.go".
bool matches_extension(std::string_view path, std::string_view extension) {
  if (extension.empty())
    return true;
  return to_lower(std::string(path)).ends_with(normalize_extension(extension));
}

// --- Binary Sniffer ---

// Bytes are read as Latin-1 code points. Printable means graphic or the ASCII
// space; NBSP (0xA0) and the soft hyphen (0xAD) are not.
bool is_printable_byte(unsigned char byte) {
  if (byte >= 0x20 && byte < 0x7F)
    return true;
  return byte >= 0xA1 && byte != 0xAD;
}

// More than 10% non-printable bytes (tab, CR and LF excluded) means binary.
bool is_binary(std::span<const char> sample) {
  if (sample.empty())
    return false;

  size_t non_printable = 0;
  for (char c : sample) {
    unsigned char byte = static_cast<unsigned char>(c);
    if (byte == '\n' || byte == '\r' || byte == '\t')
      continue;
    if (byte == 0 || !is_printable_byte(byte))
      ++non_printable;
  }
  return non_printable * 10 > sample.size();
}

// --- Emitter ---

bool is_file_size_valid(unsigned long long file_size,
                        unsigned long long max_file_size_b) {
  return max_file_size_b == 0 || file_size <= max_file_size_b;
}

// Streams the remaining bytes of `in` to `out` unchanged.
ProcessResult copy_stream(std::istream &in, std::ostream &out) {
  std::vector<char> buffer(kCopyBufferSize);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize count = in.gcount();
    if (count > 0) {
      out.write(buffer.data(), count);
      if (!out)
        return {ResultKind::IoError, "write to output failed"};
    }
  }
  if (in.bad())
    return {ResultKind::IoError, "read failed"};
  return {ResultKind::Emitted, ""};
}

ProcessResult emit_file(const fs::path &path, const Config &config,
                        std::ostream &output_stream) {
  const std::string display_path = path.string();

  if (config.namesOnly) {
    output_stream << display_path << '\n';
    return {ResultKind::Listed, ""};
  }

  // Character devices and pipes have no size of their own and count as 0
  std::error_code ec;
  fs::file_status status = fs::status(path, ec);
  if (ec)
    return {ResultKind::PathAccessError, ec.message()};
  if (fs::is_directory(status))
    return {ResultKind::PathAccessError,
            std::make_error_code(std::errc::is_a_directory).message()};
  unsigned long long file_size = 0;
  if (fs::is_regular_file(status)) {
    file_size = fs::file_size(path, ec);
    if (ec)
      return {ResultKind::PathAccessError, ec.message()};
  }
  if (!is_file_size_valid(file_size, config.maxFileSizeB)) {
    std::cerr << "WARNING: Skipping " << display_path << " (size " << file_size
              << " bytes exceeds limit " << config.maxFileSizeB << ")\n";
    return {ResultKind::SkippedTooLarge, ""};
  }

  errno = 0;
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    std::error_code open_ec(errno, std::generic_category());
    return {ResultKind::IoError,
            "could not open file" +
                (open_ec ? ": " + open_ec.message() : std::string())};
  }

  std::vector<char> sample(kSniffSampleSize);
  file.read(sample.data(), static_cast<std::streamsize>(sample.size()));
  if (file.bad())
    return {ResultKind::IoError, "read failed"};
  sample.resize(static_cast<size_t>(file.gcount()));

  if (is_binary(sample)) {
    std::cerr << "WARNING: Skipping binary file " << display_path << '\n';
    return {ResultKind::SkippedBinary, ""};
  }

  // A short sample leaves eofbit set, which would make seekg fail
  file.clear();
  file.seekg(0, std::ios::beg);
  if (!file)
    return {ResultKind::IoError, "could not rewind file"};

  output_stream << "\n--- " << display_path << " ---\n";
  ProcessResult copied = copy_stream(file, output_stream);
  if (is_error(copied.kind))
    return copied;
  output_stream << '\n';
  return {ResultKind::Emitted, ""};
}

// --- Directory Walker ---

// Depth-first walk below `dir`. Entries of one directory are visited in
// lexical order; directories (symlinks not followed) are descended into and
// everything else is handed to `visit`. The first error stops the walk.
ProcessResult
walk_directory(const fs::path &dir,
               const std::function<ProcessResult(const fs::path &)> &visit) {
  std::error_code ec;
  std::vector<fs::directory_entry> entries;
  fs::directory_iterator it(dir, ec);
  if (ec)
    return {ResultKind::TraversalError, dir.string() + ": " + ec.message()};
  for (fs::directory_iterator end; it != end;) {
    entries.push_back(*it);
    it.increment(ec);
    if (ec)
      return {ResultKind::TraversalError, dir.string() + ": " + ec.message()};
  }

  std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.path().filename().string() <
                     b.path().filename().string();
            });

  for (const auto &entry : entries) {
    fs::path entry_path = join_path(dir, entry.path().filename());
    fs::file_status status = entry.symlink_status(ec);
    if (ec)
      return {ResultKind::TraversalError,
              entry_path.string() + ": " + ec.message()};

    ProcessResult result = fs::is_directory(status)
                               ? walk_directory(entry_path, visit)
                               : visit(entry_path);
    if (is_error(result.kind))
      return result;
  }
  return {ResultKind::Ok, ""};
}

// --- Path Dispatcher ---

ProcessResult process_path(const std::string &path, const Config &config,
                           std::ostream &output_stream) {
  std::error_code ec;
  fs::file_status status = fs::status(path, ec);
  if (ec || !fs::exists(status)) {
    std::string reason =
        ec ? ec.message()
           : std::make_error_code(std::errc::no_such_file_or_directory)
                 .message();
    return {ResultKind::PathAccessError, reason};
  }

  if (fs::is_directory(status)) {
    if (!config.recurse)
      return {ResultKind::DirectoryWithoutRecursion,
              "'" + path + "' is a directory (use -r to recurse)"};
    return walk_directory(path, [&](const fs::path &entry_path) {
      if (!matches_extension(entry_path.string(), config.extension))
        return ProcessResult{ResultKind::Filtered, ""};
      return emit_file(entry_path, config, output_stream);
    });
  }

  if (!matches_extension(path, config.extension))
    return {ResultKind::Filtered, ""};
  return emit_file(path, config, output_stream);
}

// Processes every path in order. Failures are reported and never stop the
// run; returns the number of paths that failed.
size_t process_paths(const std::vector<std::string> &paths,
                     const Config &config, std::ostream &output_stream) {
  size_t failures = 0;
  for (const auto &path : paths) {
    ProcessResult result;
    try {
      result = process_path(path, config, output_stream);
    } catch (const std::exception &e) {
      result = {ResultKind::IoError, e.what()};
    }
    if (is_error(result.kind)) {
      std::cerr << "ERROR: Error processing " << path << ": " << result.message
                << '\n';
      ++failures;
    }
  }
  return failures;
}

// --- Input Reader ---

// Reads newline separated paths, trimming whitespace and dropping blank
// lines. Returns false if the stream failed before reaching end of input.
bool read_paths_from_stream(std::istream &input,
                            std::vector<std::string> &paths) {
  std::string line;
  while (std::getline(input, line)) {
    std::string path = trim(line);
    if (!path.empty())
      paths.push_back(std::move(path));
  }
  return !input.bad();
}

// --- Argument Parsing ---

void print_usage(std::ostream &out) {
  out << "llmcat - Display files in an LLM-friendly format\n\n";
  out << "Usage:\n";
  out << "  llmcat [flags] [files...]\n";
  out << "  command | xargs llmcat [flags]\n";
  out << "  find . -name '*.go' | llmcat\n\n";
  out << "Flags:\n";

  std::vector<std::pair<std::string, std::string>> options = {
      {"-r", "Recursively process directories"},
      {"-ext string", "Only process files with this extension (e.g., .go, "
                      ".txt)"},
      {"-n", "Only print file names, not contents"},
      {"-max-size bytes",
       "Maximum bytes per file (default 10485760, 0 = unlimited, suffix "
       "K/M/G allowed)"},
      {"-h", "Show this help message"}};

  size_t max_option_length = 0;
  for (const auto &option : options) {
    max_option_length = std::max(max_option_length, option.first.length());
  }
  for (const auto &option : options) {
    out << "  " << std::left << std::setw(max_option_length + 2)
        << option.first << option.second << "\n";
  }

  out << "\nExamples:\n";
  out << "  llmcat file1.txt file2.go\n";
  out << "  llmcat -r -ext .go src/\n";
  out << "  llmcat -n $(git ls-files)\n";
  out << "  find . -type f -size -20M | llmcat\n\n";
  out << "Output format when dumping:\n";
  out << "  --- filename.go ---\n";
  out << "  [file contents]\n\n";
}

// Parses a byte count with an optional K, M or G suffix.
unsigned long long parse_size(const std::string &value) {
  std::string size_str = value;
  if (size_str.empty())
    throw std::invalid_argument("Empty size value");
  if (size_str[0] == '-')
    throw std::invalid_argument("Size cannot be negative");

  unsigned long long multiplier = 1;
  char suffix = static_cast<char>(
      std::toupper(static_cast<unsigned char>(size_str.back())));
  if (!std::isdigit(static_cast<unsigned char>(suffix))) {
    if (suffix == 'K') {
      multiplier = 1024ULL;
    } else if (suffix == 'M') {
      multiplier = 1024ULL * 1024ULL;
    } else if (suffix == 'G') {
      multiplier = 1024ULL * 1024ULL * 1024ULL;
    } else {
      throw std::invalid_argument("Invalid size suffix (use K, M, G)");
    }
    size_str.pop_back();
  }

  if (size_str.empty() ||
      !std::all_of(size_str.begin(), size_str.end(), [](unsigned char c) {
        return std::isdigit(c);
      }))
    throw std::invalid_argument("Size must be a non-negative integer");

  unsigned long long size = 0;
  try {
    size = std::stoull(size_str);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("Size is out of range");
  }
  if (size > std::numeric_limits<unsigned long long>::max() / multiplier)
    throw std::invalid_argument("Size is out of range");
  return size * multiplier;
}

bool parse_bool(const std::string &value) {
  if (value == "1" || value == "t" || value == "T" || value == "true" ||
      value == "TRUE" || value == "True")
    return true;
  if (value == "0" || value == "f" || value == "F" || value == "false" ||
      value == "FALSE" || value == "False")
    return false;
  throw std::invalid_argument("invalid boolean value \"" + value + "\"");
}

// Flags take one or two dashes and either "-flag value" or "-flag=value".
// Parsing stops at "--" or at the first argument that is not a flag.
// Throws std::invalid_argument on unknown flags and bad values.
Config parse_arguments(int argc, char *argv[]) {
  Config config;

  int i = 1;
  for (; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg.size() < 2 || arg[0] != '-')
      break; // First positional argument ("-" alone is a path too)
    if (arg == "--") {
      ++i;
      break;
    }

    std::string_view flag = arg.substr(arg[1] == '-' ? 2 : 1);
    if (flag.empty() || flag[0] == '-' || flag[0] == '=')
      throw std::invalid_argument("bad flag syntax: " + std::string(arg));

    std::string name(flag);
    std::string value;
    bool has_value = false;
    if (size_t eq = flag.find('='); eq != std::string_view::npos) {
      name = std::string(flag.substr(0, eq));
      value = std::string(flag.substr(eq + 1));
      has_value = true;
    }

    auto require_value = [&]() {
      if (has_value)
        return;
      if (i + 1 >= argc)
        throw std::invalid_argument("flag needs an argument: -" + name);
      value = argv[++i];
    };

    if (name == "r") {
      config.recurse = has_value ? parse_bool(value) : true;
    } else if (name == "n") {
      config.namesOnly = has_value ? parse_bool(value) : true;
    } else if (name == "h" || name == "help") {
      config.showHelp = has_value ? parse_bool(value) : true;
    } else if (name == "ext") {
      require_value();
      config.extension = normalize_extension(value);
    } else if (name == "max-size") {
      require_value();
      try {
        config.maxFileSizeB = parse_size(value);
      } catch (const std::invalid_argument &e) {
        throw std::invalid_argument("Invalid max-size value: '" + value +
                                    "'. " + e.what());
      }
    } else {
      throw std::invalid_argument("Unknown or invalid option: " +
                                  std::string(arg));
    }
  }

  for (; i < argc; ++i) {
    config.paths.emplace_back(argv[i]);
  }
  return config;
}
