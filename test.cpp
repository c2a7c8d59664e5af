#include "lib.cpp" // Include the implementation directly so every helper is testable

#include <cassert>
#include <filesystem> // Already included via lib.cpp but good practice
#include <functional> // For std::function
#include <iostream>   // For std::cerr, std::cout, std::endl
#include <sstream>    // For std::stringstream
#include <string>
#include <vector>

const std::string TEST_DIR_NAME = "test_dir_llmcat"; // Use a unique name
const fs::path TEST_DIR_PATH = TEST_DIR_NAME; // Relative, so printed paths are
                                              // predictable

// --- Helper Functions for Testing ---

void cleanup_test_directories() {
  std::error_code ec;
  fs::remove_all(TEST_DIR_PATH, ec);
}

// Creates a test file, ensuring parent directory exists
void create_test_file(const fs::path &path, const std::string &content) {
  try {
    if (path.has_parent_path()) {
      fs::create_directories(path.parent_path());
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      std::cerr << "Error creating test file: " << path.string() << std::endl;
      return;
    }
    file << content;
  } catch (const std::exception &e) {
    std::cerr << "Exception creating test file " << path.string() << ": "
              << e.what() << std::endl;
  }
}

// Creates the main test directory structure
void create_test_directory_structure() {
  cleanup_test_directories(); // Clean first
  fs::create_directories(TEST_DIR_PATH / "src" / "nested");
  fs::create_directories(TEST_DIR_PATH / "empty_dir");

  create_test_file(TEST_DIR_PATH / "a.txt", "hello");
  create_test_file(TEST_DIR_PATH / "b.txt", "world");
  create_test_file(TEST_DIR_PATH / "src" / "main.go", "package main\n");
  create_test_file(TEST_DIR_PATH / "src" / "README.MD", "# Readme\n");
  create_test_file(TEST_DIR_PATH / "src" / "nested" / "util.GO",
                   "package nested\n");
  create_test_file(TEST_DIR_PATH / "src" / "nested" / "fruit.mango",
                   "not go code\n");
  create_test_file(TEST_DIR_PATH / "src" / "blob.go",
                   std::string(64, '\0') + "package blob\n");
  create_test_file(TEST_DIR_PATH / "large.txt", std::string(2049, 'L'));
}

// Captures everything written to std::cerr while func runs
std::string capture_stderr(const std::function<void()> &func) {
  std::stringstream buffer;
  std::streambuf *oldCerr = std::cerr.rdbuf();
  std::cerr.rdbuf(buffer.rdbuf());
  func();
  std::cerr.rdbuf(oldCerr);
  return buffer.str();
}

// Builds an argv array for parse_arguments; argv[0] is the program name
Config parse(std::vector<std::string> args) {
  args.insert(args.begin(), "llmcat");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return parse_arguments(static_cast<int>(argv.size()), argv.data());
}

bool parse_throws(const std::vector<std::string> &args) {
  try {
    parse(args);
  } catch (const std::invalid_argument &) {
    return true;
  }
  return false;
}

std::string path_of(const fs::path &relative_to_test_dir) {
  return (TEST_DIR_PATH / relative_to_test_dir).string();
}

// --- Test Functions ---

void test_trim() {
  std::cout << "Test: Trim..." << std::flush;
  assert(trim("  hello  ") == "hello");
  assert(trim("\tworld\r\n") == "world");
  assert(trim("no whitespace") == "no whitespace");
  assert(trim("   ") == "");
  assert(trim("") == "");
  std::cout << " Passed\n";
}

void test_normalize_extension() {
  std::cout << "Test: Normalize extension..." << std::flush;
  assert(normalize_extension("") == "");
  assert(normalize_extension(".go") == ".go");
  assert(normalize_extension("go") == ".go");
  assert(normalize_extension(".GO") == ".go");
  assert(normalize_extension("Tar.GZ") == ".tar.gz");
  std::cout << " Passed\n";
}

void test_matches_extension() {
  std::cout << "Test: Matches extension (suffix, case-insensitive)..."
            << std::flush;
  assert(matches_extension("anything.bin", "") == true); // No filter
  assert(matches_extension("main.go", ".GO") == true);
  assert(matches_extension("main.go", "go") == true);
  assert(matches_extension("MAIN.GO", ".go") == true);
  // The dot is part of the compared suffix
  assert(matches_extension("foo.mango", ".go") == false);
  assert(matches_extension("foo.xgo", ".go") == false);
  // Suffix, not parsed extension
  assert(matches_extension("a.tar.gz", "gz") == true);
  assert(matches_extension("foo.go", "o") == true);
  assert(matches_extension("main.goo", ".go") == false);
  assert(matches_extension("main.txt", ".go") == false);
  assert(matches_extension("go", ".go") == false); // No dot before "go"
  assert(matches_extension("dir/archive.tar.gz", "tar.gz") == true);
  std::cout << " Passed\n";
}

void test_is_printable_byte() {
  std::cout << "Test: Is printable byte..." << std::flush;
  assert(is_printable_byte(' ') == true);
  assert(is_printable_byte('a') == true);
  assert(is_printable_byte('~') == true);
  assert(is_printable_byte(0x00) == false);
  assert(is_printable_byte(0x1B) == false); // ESC
  assert(is_printable_byte(0x7F) == false); // DEL
  assert(is_printable_byte(0x85) == false); // C1 control
  assert(is_printable_byte(0xA0) == false); // NBSP
  assert(is_printable_byte(0xAD) == false); // Soft hyphen
  assert(is_printable_byte(0xA9) == true);  // Copyright sign
  assert(is_printable_byte(0xE9) == true);  // e with acute
  assert(is_printable_byte(0xFF) == true);
  std::cout << " Passed\n";
}

void test_is_binary() {
  std::cout << "Test: Is binary..." << std::flush;
  auto binary = [](const std::string &sample) {
    return is_binary(std::span<const char>(sample.data(), sample.size()));
  };
  assert(binary("") == false);
  assert(binary("plain text\nwith\ttabs\r\n") == false);
  assert(binary(std::string(16, '\0')) == true);
  // Exactly 10% non-printable is still text
  assert(binary(std::string(9, 'a') + '\x01') == false);
  assert(binary(std::string(10, 'a') + '\x01') == false);
  // Just over 10% is binary
  assert(binary(std::string(8, 'a') + '\x01') == true);
  // Tabs, CR and LF never count
  assert(binary(std::string(100, '\n') + std::string(100, '\t')) == false);
  // UTF-8 accented letters read as Latin-1 pairs, still printable
  assert(binary("\xC3\xA9t\xC3\xA9") == false);
  std::cout << " Passed\n";
}

void test_is_file_size_valid() {
  std::cout << "Test: Is file size valid..." << std::flush;
  assert(is_file_size_valid(5, 1024) == true);
  assert(is_file_size_valid(1024, 1024) == true);
  assert(is_file_size_valid(1025, 1024) == false);
  assert(is_file_size_valid(5, 0) == true); // max_size 0 means no limit
  std::cout << " Passed\n";
}

void test_emit_file_text() {
  std::cout << "Test: Emit text file..." << std::flush;
  create_test_directory_structure();
  Config config;
  std::stringstream out;
  ProcessResult result = emit_file(path_of("src/main.go"), config, out);
  assert(result.kind == ResultKind::Emitted);
  assert(out.str() ==
         "\n--- " + path_of("src/main.go") + " ---\npackage main\n\n");
  std::cout << " Passed\n";
}

void test_emit_file_empty() {
  std::cout << "Test: Emit empty file..." << std::flush;
  create_test_directory_structure();
  create_test_file(TEST_DIR_PATH / "empty.txt", "");
  Config config;
  std::stringstream out;
  ProcessResult result = emit_file(path_of("empty.txt"), config, out);
  assert(result.kind == ResultKind::Emitted);
  assert(out.str() == "\n--- " + path_of("empty.txt") + " ---\n\n");
  std::cout << " Passed\n";
}

void test_emit_file_larger_than_sample() {
  std::cout << "Test: Emit file larger than the sniff sample..." << std::flush;
  create_test_directory_structure();
  // Text prefix longer than the sample, binary tail is never sniffed
  std::string content = std::string(kSniffSampleSize + 100, 'x') +
                        std::string(2000, '\0');
  create_test_file(TEST_DIR_PATH / "long.txt", content);
  Config config;
  config.maxFileSizeB = 0;
  std::stringstream out;
  ProcessResult result = emit_file(path_of("long.txt"), config, out);
  assert(result.kind == ResultKind::Emitted);
  assert(out.str() ==
         "\n--- " + path_of("long.txt") + " ---\n" + content + "\n");
  std::cout << " Passed\n";
}

void test_emit_file_too_large() {
  std::cout << "Test: Skip file above max size..." << std::flush;
  create_test_directory_structure();
  Config config;
  config.maxFileSizeB = 2048;
  std::stringstream out;
  ProcessResult result;
  std::string err = capture_stderr(
      [&]() { result = emit_file(path_of("large.txt"), config, out); });
  assert(result.kind == ResultKind::SkippedTooLarge);
  assert(out.str().empty());
  assert(err.find("Skipping " + path_of("large.txt")) != std::string::npos);
  assert(err.find("2049") != std::string::npos);

  // 0 disables the limit
  config.maxFileSizeB = 0;
  result = emit_file(path_of("large.txt"), config, out);
  assert(result.kind == ResultKind::Emitted);
  assert(out.str().find("--- " + path_of("large.txt") + " ---") !=
         std::string::npos);
  std::cout << " Passed\n";
}

void test_emit_file_binary() {
  std::cout << "Test: Skip binary file..." << std::flush;
  create_test_directory_structure();
  Config config;
  std::stringstream out;
  ProcessResult result;
  std::string err = capture_stderr(
      [&]() { result = emit_file(path_of("src/blob.go"), config, out); });
  assert(result.kind == ResultKind::SkippedBinary);
  assert(out.str().empty()); // No delimiter either
  assert(err.find("Skipping binary file " + path_of("src/blob.go")) !=
         std::string::npos);
  std::cout << " Passed\n";
}

void test_emit_file_names_only() {
  std::cout << "Test: Names-only mode..." << std::flush;
  create_test_directory_structure();
  Config config;
  config.namesOnly = true;
  config.maxFileSizeB = 16;
  std::stringstream out;
  std::string err = capture_stderr([&]() {
    // Oversized and binary files are listed, nothing is opened or stat'ed
    assert(emit_file(path_of("large.txt"), config, out).kind ==
           ResultKind::Listed);
    assert(emit_file(path_of("src/blob.go"), config, out).kind ==
           ResultKind::Listed);
    assert(emit_file(path_of("does_not_exist.txt"), config, out).kind ==
           ResultKind::Listed);
  });
  assert(out.str() == path_of("large.txt") + "\n" + path_of("src/blob.go") +
                          "\n" + path_of("does_not_exist.txt") + "\n");
  assert(err.empty());
  std::cout << " Passed\n";
}

void test_process_path_missing() {
  std::cout << "Test: Process missing path..." << std::flush;
  create_test_directory_structure();
  Config config;
  std::stringstream out;
  ProcessResult result = process_path(path_of("nope.txt"), config, out);
  assert(result.kind == ResultKind::PathAccessError);
  assert(!result.message.empty());
  assert(out.str().empty());
  std::cout << " Passed\n";
}

void test_process_path_directory_without_recurse() {
  std::cout << "Test: Directory without recursion..." << std::flush;
  create_test_directory_structure();
  Config config;
  std::stringstream out;
  ProcessResult result = process_path(path_of("src"), config, out);
  assert(result.kind == ResultKind::DirectoryWithoutRecursion);
  assert(result.message.find(path_of("src")) != std::string::npos);
  assert(result.message.find("-r") != std::string::npos);
  assert(out.str().empty());
  std::cout << " Passed\n";
}

void test_process_path_filtered_file() {
  std::cout << "Test: Extension filter on a direct file..." << std::flush;
  create_test_directory_structure();
  Config config;
  config.extension = normalize_extension("go");
  std::stringstream out;
  assert(process_path(path_of("a.txt"), config, out).kind ==
         ResultKind::Filtered);
  assert(out.str().empty());
  assert(process_path(path_of("src/main.go"), config, out).kind ==
         ResultKind::Emitted);
  std::cout << " Passed\n";
}

void test_process_path_recursive_order() {
  std::cout << "Test: Recursive walk order..." << std::flush;
  create_test_directory_structure();
  create_test_file(TEST_DIR_PATH / "order" / "a.txt", "a");
  create_test_file(TEST_DIR_PATH / "order" / "b" / "c.txt", "c");
  create_test_file(TEST_DIR_PATH / "order" / "b.txt", "b");
  fs::create_directories(TEST_DIR_PATH / "order" / "d_empty");
  Config config;
  config.recurse = true;
  config.namesOnly = true;
  std::stringstream out;
  // Trailing slash on the argument is dropped from child paths
  ProcessResult result = process_path(path_of("order") + "/", config, out);
  assert(result.kind == ResultKind::Ok);
  assert(out.str() == path_of("order/a.txt") + "\n" +
                          path_of("order/b/c.txt") + "\n" +
                          path_of("order/b.txt") + "\n");
  std::cout << " Passed\n";
}

void test_process_path_recursive_extension() {
  std::cout << "Test: Recursive walk with extension filter..." << std::flush;
  create_test_directory_structure();
  Config config;
  config.recurse = true;
  config.extension = normalize_extension(".GO");
  std::stringstream out;
  std::string err = capture_stderr([&]() {
    ProcessResult result = process_path(path_of("src"), config, out);
    assert(result.kind == ResultKind::Ok);
  });
  std::string output = out.str();
  assert(output == "\n--- " + path_of("src/main.go") +
                       " ---\npackage main\n\n" + "\n--- " +
                       path_of("src/nested/util.GO") +
                       " ---\npackage nested\n\n");
  assert(output.find("README") == std::string::npos);
  assert(output.find("fruit.mango") == std::string::npos);
  assert(err.find("Skipping binary file " + path_of("src/blob.go")) !=
         std::string::npos);
  std::cout << " Passed\n";
}

void test_walk_aborts_on_error() {
  std::cout << "Test: Walk stops at the first failing entry..." << std::flush;
  create_test_directory_structure();
  create_test_file(TEST_DIR_PATH / "walk" / "a.txt", "first");
  create_test_file(TEST_DIR_PATH / "walk" / "c.txt", "never reached");
  fs::create_directories(TEST_DIR_PATH / "target_dir");
  // Symlinks are not followed by the walk; the emitter then finds a directory
  fs::create_directory_symlink(fs::absolute(TEST_DIR_PATH / "target_dir"),
                               TEST_DIR_PATH / "walk" / "b_link");
  Config config;
  config.recurse = true;
  std::stringstream out;
  ProcessResult result = process_path(path_of("walk"), config, out);
  assert(is_error(result.kind));
  assert(out.str() == "\n--- " + path_of("walk/a.txt") + " ---\nfirst\n");
  std::cout << " Passed\n";
}

void test_walk_directory_traversal_error() {
  std::cout << "Test: Walk reports unreadable directories..." << std::flush;
  create_test_directory_structure();
  size_t visited = 0;
  auto count_visits = [&](const fs::path &) {
    ++visited;
    return ProcessResult{ResultKind::Emitted, ""};
  };

  // A regular file cannot be listed
  ProcessResult result = walk_directory(path_of("a.txt"), count_visits);
  assert(result.kind == ResultKind::TraversalError);
  assert(result.message.rfind(path_of("a.txt") + ": ", 0) == 0);

  // Neither can a directory that is gone
  fs::create_directories(TEST_DIR_PATH / "gone");
  fs::remove(TEST_DIR_PATH / "gone");
  result = walk_directory(path_of("gone"), count_visits);
  assert(result.kind == ResultKind::TraversalError);
  assert(result.message.rfind(path_of("gone") + ": ", 0) == 0);
  assert(visited == 0);
  std::cout << " Passed\n";
}

void test_emit_file_character_device() {
  std::cout << "Test: Emit character device as empty file..." << std::flush;
  if (!fs::is_character_file("/dev/null")) {
    std::cout << " Skipped (no /dev/null)\n";
    return;
  }
  Config config;
  std::stringstream out;
  ProcessResult result = emit_file("/dev/null", config, out);
  assert(result.kind == ResultKind::Emitted);
  assert(out.str() == "\n--- /dev/null ---\n\n");
  std::cout << " Passed\n";
}

void test_emit_file_open_error_reason() {
  std::cout << "Test: Open failure carries the OS reason..." << std::flush;
  create_test_directory_structure();
  fs::path locked = TEST_DIR_PATH / "locked.txt";
  create_test_file(locked, "secret");
  fs::permissions(locked, fs::perms::none);
  std::ifstream check(locked);
  if (check.is_open()) {
    // Running with privileges that ignore file permissions
    check.close();
    fs::permissions(locked, fs::perms::owner_all);
    std::cout << " Skipped (permissions not enforced)\n";
    return;
  }
  Config config;
  std::stringstream out;
  ProcessResult result = emit_file(locked, config, out);
  fs::permissions(locked, fs::perms::owner_all);
  assert(result.kind == ResultKind::IoError);
  assert(result.message.find(
             std::make_error_code(std::errc::permission_denied).message()) !=
         std::string::npos);
  assert(out.str().empty());
  std::cout << " Passed\n";
}

void test_process_paths_two_files() {
  std::cout << "Test: Two files concatenated..." << std::flush;
  create_test_directory_structure();
  Config config;
  std::stringstream out;
  size_t failures =
      process_paths({path_of("a.txt"), path_of("b.txt")}, config, out);
  assert(failures == 0);
  assert(out.str() == "\n--- " + path_of("a.txt") + " ---\nhello\n" +
                          "\n--- " + path_of("b.txt") + " ---\nworld\n");
  std::cout << " Passed\n";
}

void test_process_paths_continue_after_error() {
  std::cout << "Test: Errors do not stop sibling paths..." << std::flush;
  create_test_directory_structure();
  Config config;
  std::stringstream out;
  size_t failures = 0;
  std::string err = capture_stderr([&]() {
    failures = process_paths(
        {path_of("missing.txt"), path_of("src"), path_of("a.txt")}, config,
        out);
  });
  assert(failures == 2);
  assert(out.str() == "\n--- " + path_of("a.txt") + " ---\nhello\n");
  assert(err.find("ERROR: Error processing " + path_of("missing.txt")) !=
         std::string::npos);
  assert(err.find("ERROR: Error processing " + path_of("src")) !=
         std::string::npos);
  std::cout << " Passed\n";
}

void test_process_paths_idempotent() {
  std::cout << "Test: Repeated runs give identical output..." << std::flush;
  create_test_directory_structure();
  Config config;
  config.recurse = true;
  config.maxFileSizeB = 0;
  std::stringstream first;
  std::stringstream second;
  capture_stderr([&]() {
    process_paths({TEST_DIR_NAME}, config, first);
    process_paths({TEST_DIR_NAME}, config, second);
  });
  assert(!first.str().empty());
  assert(first.str() == second.str());
  std::cout << " Passed\n";
}

void test_read_paths_from_stream() {
  std::cout << "Test: Read paths from stream..." << std::flush;
  std::stringstream input("a.txt\n  spaced.go  \n\n\t\nlast.md");
  std::vector<std::string> paths;
  assert(read_paths_from_stream(input, paths));
  assert((paths == std::vector<std::string>{"a.txt", "spaced.go", "last.md"}));

  std::stringstream broken("ignored\n");
  broken.setstate(std::ios::badbit);
  std::vector<std::string> none;
  assert(!read_paths_from_stream(broken, none));
  std::cout << " Passed\n";
}

void test_parse_arguments_defaults() {
  std::cout << "Test: Parse arguments defaults..." << std::flush;
  Config config = parse({});
  assert(config.recurse == false);
  assert(config.namesOnly == false);
  assert(config.showHelp == false);
  assert(config.extension.empty());
  assert(config.maxFileSizeB == 10485760ULL);
  assert(config.paths.empty());
  std::cout << " Passed\n";
}

void test_parse_arguments_flags() {
  std::cout << "Test: Parse arguments flags..." << std::flush;
  Config config =
      parse({"-r", "-n", "-ext", "GO", "-max-size", "0", "a.go", "b.go"});
  assert(config.recurse && config.namesOnly);
  assert(config.extension == ".go");
  assert(config.maxFileSizeB == 0);
  assert((config.paths == std::vector<std::string>{"a.go", "b.go"}));

  // Inline values and double dashes
  config = parse({"--ext=.TXT", "-max-size=2K", "--r", "-n=false", "x"});
  assert(config.extension == ".txt");
  assert(config.maxFileSizeB == 2048);
  assert(config.recurse && !config.namesOnly);
  assert((config.paths == std::vector<std::string>{"x"}));

  assert(parse({"-max-size", "1M"}).maxFileSizeB == 1024ULL * 1024ULL);
  assert(parse({"-max-size", "3g"}).maxFileSizeB == 3ULL << 30);
  assert(parse({"-h"}).showHelp);
  assert(parse({"--help"}).showHelp);
  std::cout << " Passed\n";
}

void test_parse_arguments_positional() {
  std::cout << "Test: Parse arguments stops at first path..." << std::flush;
  Config config = parse({"-r", "dir", "-n", "-"});
  assert(config.recurse && !config.namesOnly);
  assert((config.paths == std::vector<std::string>{"dir", "-n", "-"}));

  config = parse({"-n", "--", "-r"});
  assert(config.namesOnly && !config.recurse);
  assert((config.paths == std::vector<std::string>{"-r"}));
  std::cout << " Passed\n";
}

void test_parse_arguments_errors() {
  std::cout << "Test: Parse arguments errors..." << std::flush;
  assert(parse_throws({"-x"}));
  assert(parse_throws({"-ext"}));      // Missing value
  assert(parse_throws({"-max-size"})); // Missing value
  assert(parse_throws({"-max-size", "-5"}));
  assert(parse_throws({"-max-size", "ten"}));
  assert(parse_throws({"-max-size", "12X"}));
  assert(parse_throws({"-max-size", "1.5M"}));
  assert(parse_throws({"-max-size", "99999999999999999999999"}));
  assert(parse_throws({"-max-size="}));
  assert(parse_throws({"-r=maybe"}));
  assert(parse_throws({"---r"}));
  std::cout << " Passed\n";
}

void test_print_usage() {
  std::cout << "Test: Usage text..." << std::flush;
  std::stringstream out;
  print_usage(out);
  std::string usage = out.str();
  assert(usage.find("llmcat [flags] [files...]") != std::string::npos);
  assert(usage.find("-max-size bytes") != std::string::npos);
  assert(usage.find("-ext string") != std::string::npos);
  assert(usage.find("--- filename.go ---") != std::string::npos);
  std::cout << " Passed\n";
}

int main() {
  try {
    test_trim();
    test_normalize_extension();
    test_matches_extension();
    test_is_printable_byte();
    test_is_binary();
    test_is_file_size_valid();
    test_emit_file_text();                   // Uses TEST_DIR_PATH
    test_emit_file_empty();                  // Uses TEST_DIR_PATH
    test_emit_file_larger_than_sample();     // Uses TEST_DIR_PATH
    test_emit_file_too_large();              // Uses TEST_DIR_PATH
    test_emit_file_binary();                 // Uses TEST_DIR_PATH
    test_emit_file_names_only();             // Uses TEST_DIR_PATH
    test_process_path_missing();             // Uses TEST_DIR_PATH
    test_process_path_directory_without_recurse();
    test_process_path_filtered_file();
    test_process_path_recursive_order();
    test_process_path_recursive_extension();
    test_walk_aborts_on_error();
    test_walk_directory_traversal_error();
    test_emit_file_character_device();
    test_emit_file_open_error_reason();
    test_process_paths_two_files();
    test_process_paths_continue_after_error();
    test_process_paths_idempotent();
    test_read_paths_from_stream();
    test_parse_arguments_defaults();
    test_parse_arguments_flags();
    test_parse_arguments_positional();
    test_parse_arguments_errors();
    test_print_usage();

    // Cleanup after all tests
    cleanup_test_directories();
    std::cout << "\nAll tests passed successfully!\n";
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "\n\n!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!\n";
    std::cerr << "Test failed with exception: " << e.what() << std::endl;
    std::cerr << "!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!\n\n";
    cleanup_test_directories(); // Attempt cleanup even on failure
    return 1;
  }
}
