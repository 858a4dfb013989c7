#include "atomspell/config.hpp"

#include "test_support.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

namespace {

[[noreturn]] void test_fail(const char* expr, const char* file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr) \
  do { \
    if (!(expr)) { \
      test_fail(#expr, __FILE__, __LINE__); \
    } \
  } while (0)

using atomspell::Config;
using atomspell::ConfigResult;
using atomspell::LanguageId;

void test_defaults() {
  const Config config;
  CHECK(config.checker.suggestions_enabled);
  CHECK(!config.checker.case_sensitive);
  CHECK(config.checker.max_suggestions == 5);
  CHECK(std::fabs(config.checker.confidence_threshold - 0.7) < 1e-9);
  CHECK(config.checker.max_edit_distance == 2);
  CHECK(config.dictionary.default_language.id() == LanguageId::English);
  CHECK(config.dictionary.min_word_length == 2);
  CHECK(config.analyzer.parallel_min_lines == 512);

  std::string reason;
  CHECK(atomspell::validate_config(config, &reason));
  CHECK(reason.empty());
}

void test_parse_sections() {
  std::istringstream in{
      "# AtomSpell\n"
      "checker:\n"
      "  suggestions_enabled: no\n"
      "  case_sensitive: true\n"
      "  max_suggestions: 8 # больше вариантов\n"
      "  confidence_threshold: 0.55\n"
      "dictionary:\n"
      "  default_language: \"fr\"\n"
      "  min_word_length: 3\n"
      "  search_dirs: [/opt/dicts, ./local]\n"
      "  system_dictionaries: off\n"
      "analyzer:\n"
      "  worker_threads: 4\n"
      "  parallel_min_lines: 64\n"
      "  acronyms: GPU, TPU\n"
      "  proper_nouns: 'Ada, Linus'\n"
      "unknown:\n"
      "  max_suggestions: 99\n"};

  const Config config = atomspell::parse_config_stream(in);
  CHECK(!config.checker.suggestions_enabled);
  CHECK(config.checker.case_sensitive);
  CHECK(config.checker.max_suggestions == 8);
  CHECK(std::fabs(config.checker.confidence_threshold - 0.55) < 1e-9);
  CHECK(config.dictionary.default_language.id() == LanguageId::French);
  CHECK(config.dictionary.min_word_length == 3);
  CHECK(config.dictionary.search_dirs.size() == 2);
  CHECK(config.dictionary.search_dirs[0] == "/opt/dicts");
  CHECK(!config.dictionary.system_dictionaries);
  CHECK(config.analyzer.worker_threads == 4);
  CHECK(config.analyzer.parallel_min_lines == 64);
  CHECK(config.analyzer.acronyms ==
        (std::vector<std::string>{"GPU", "TPU"}));
  CHECK(config.analyzer.proper_nouns ==
        (std::vector<std::string>{"Ada", "Linus"}));
}

void test_bad_values_keep_defaults() {
  std::istringstream in{"checker:\n"
                        "  max_suggestions: many\n"
                        "  case_sensitive: maybe\n"
                        "  confidence_threshold: 0.5x\n"};
  const Config config = atomspell::parse_config_stream(in);
  CHECK(config.checker.max_suggestions == 5);
  CHECK(!config.checker.case_sensitive);
  CHECK(std::fabs(config.checker.confidence_threshold - 0.7) < 1e-9);
}

void test_validate() {
  std::string reason;

  Config threshold;
  threshold.checker.confidence_threshold = 1.5;
  CHECK(!atomspell::validate_config(threshold, &reason));
  CHECK(reason.find("confidence_threshold") != std::string::npos);

  Config distance;
  distance.checker.max_edit_distance = 0;
  CHECK(!atomspell::validate_config(distance, nullptr));

  Config length;
  length.dictionary.min_word_length = 0;
  CHECK(!atomspell::validate_config(length, &reason));
  CHECK(reason.find("min_word_length") != std::string::npos);

  Config automatic;
  automatic.dictionary.default_language =
      atomspell::Language{LanguageId::AutoDetect};
  CHECK(!atomspell::validate_config(automatic, nullptr));
}

void test_load_checked() {
  atomspell::test::TempDir dir;

  auto missing = atomspell::load_config_checked(dir / "absent.yaml");
  CHECK(missing.result == ConfigResult::FileNotFound);
  CHECK(!missing.error.empty());

  CHECK(atomspell::load_config_checked({}).result ==
        ConfigResult::FileNotFound);

  atomspell::test::write_file(dir / "bad.yaml",
                              "checker:\n  confidence_threshold: 3\n");
  auto invalid = atomspell::load_config_checked(dir / "bad.yaml");
  CHECK(invalid.result == ConfigResult::InvalidValue);
  CHECK(invalid.error.find("confidence_threshold") != std::string::npos);
  // Вызывающий получает дефолты
  CHECK(std::fabs(invalid.config.checker.confidence_threshold - 0.7) < 1e-9);

  atomspell::test::write_file(dir / "good.yaml",
                              "checker:\n  max_suggestions: 3\n");
  auto good = atomspell::load_config_checked(dir / "good.yaml");
  CHECK(good.result == ConfigResult::Ok);
  CHECK(good.config.checker.max_suggestions == 3);
  CHECK(good.config.config_path == dir / "good.yaml");

  // best-effort: битый конфиг -> дефолты
  const Config fallback = atomspell::load_config((dir / "bad.yaml").string());
  CHECK(std::fabs(fallback.checker.confidence_threshold - 0.7) < 1e-9);
}

void test_parse_list() {
  CHECK(atomspell::parse_list("a, b ,c") ==
        (std::vector<std::string>{"a", "b", "c"}));
  CHECK(atomspell::parse_list("[x, 'y']") ==
        (std::vector<std::string>{"x", "y"}));
  CHECK(atomspell::parse_list("one,,two,") ==
        (std::vector<std::string>{"one", "two"}));
  CHECK(atomspell::parse_list("").empty());
}

} // namespace

#undef CHECK

int main() {
  test_defaults();
  test_parse_sections();
  test_bad_values_keep_defaults();
  test_validate();
  test_load_checked();
  test_parse_list();

  std::cout << "OK\n";
  return 0;
}
