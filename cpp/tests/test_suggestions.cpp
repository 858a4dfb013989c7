#include "atomspell/suggestion_generator.hpp"

#include "test_support.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

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

using atomspell::CasePattern;
using atomspell::Dictionary;
using atomspell::Language;
using atomspell::LanguageId;
using atomspell::SuggestionCandidate;
using atomspell::SuggestionOptions;
using atomspell::test::TempDir;

void test_distance() {
  using atomspell::damerau_levenshtein_distance;
  CHECK(damerau_levenshtein_distance(std::string_view{"teh"}, "the") == 1);
  CHECK(damerau_levenshtein_distance(std::string_view{"quikc"}, "quick") == 1);
  CHECK(damerau_levenshtein_distance(std::string_view{"kitten"}, "sitting") == 3);
  CHECK(damerau_levenshtein_distance(std::string_view{""}, "abc") == 3);
  CHECK(damerau_levenshtein_distance(std::string_view{"abc"}, "") == 3);
  CHECK(damerau_levenshtein_distance(std::string_view{"same"}, "same") == 0);
  // Кодовые точки, а не байты
  CHECK(damerau_levenshtein_distance(std::string_view{"café"}, "cafe") == 1);
}

void test_case_patterns() {
  CHECK(atomspell::detect_case_pattern("quick") == CasePattern::AllLower);
  CHECK(atomspell::detect_case_pattern("QUICK") == CasePattern::AllUpper);
  CHECK(atomspell::detect_case_pattern("Quick") == CasePattern::TitleCase);
  CHECK(atomspell::detect_case_pattern("qUick") == CasePattern::Mixed);
  CHECK(atomspell::detect_case_pattern("日本") == CasePattern::AllLower);
  CHECK(atomspell::detect_case_pattern("Über") == CasePattern::TitleCase);

  CHECK(atomspell::apply_case_pattern("quick", CasePattern::AllUpper) ==
        "QUICK");
  CHECK(atomspell::apply_case_pattern("über", CasePattern::TitleCase) ==
        "Über");
  CHECK(atomspell::apply_case_pattern("quick", CasePattern::Mixed) == "quick");
}

void test_ranking() {
  std::vector<SuggestionCandidate> candidates{
      {"zeta", 2, 0}, {"beta", 1, 1}, {"alpha", 1, 1}, {"gamma", 1, 0}};
  atomspell::rank_candidates(candidates);
  CHECK(candidates[0].word == "gamma");
  CHECK(candidates[1].word == "alpha");
  CHECK(candidates[2].word == "beta");
  CHECK(candidates[3].word == "zeta");
}

std::unique_ptr<Dictionary> load_english(const TempDir& dir) {
  atomspell::test::write_file(
      dir / "dictionary/dictionary(eng).txt",
      "the\nquick\nquack\nquiche\nbrown\nfox\nbox\nfix\n");
  auto dict = std::make_unique<Dictionary>(
      Language{LanguageId::English}, atomspell::test::isolated_config(dir));
  CHECK(dict->load().ok());
  return dict;
}

void test_generate() {
  TempDir dir;
  const auto dict_ptr = load_english(dir);
  const Dictionary& dict = *dict_ptr;
  const SuggestionOptions options;

  const auto lower = atomspell::generate_suggestions(dict, "quikc", options);
  CHECK(!lower.empty());
  CHECK(lower.front() == "quick");
  CHECK(lower.size() <= options.max_suggestions);

  const auto upper = atomspell::generate_suggestions(dict, "QUIKC", options);
  CHECK(upper.front() == "QUICK");

  const auto title = atomspell::generate_suggestions(dict, "Quikc", options);
  CHECK(title.front() == "Quick");

  const auto teh = atomspell::generate_suggestions(dict, "teh", options);
  CHECK(teh.front() == "the");

  // Слово из словаря само себя не предлагает
  for (const auto& s : atomspell::generate_suggestions(dict, "fox", options)) {
    CHECK(s != "fox");
  }
}

void test_limits() {
  TempDir dir;
  const auto dict_ptr = load_english(dir);
  const Dictionary& dict = *dict_ptr;

  SuggestionOptions one;
  one.max_suggestions = 1;
  const auto fox = atomspell::generate_suggestions(dict, "fax", one);
  CHECK(fox.size() == 1);
  // fix и fox на расстоянии 1: побеждает алфавит
  CHECK(fox.front() == "fix");

  SuggestionOptions none;
  none.max_suggestions = 0;
  CHECK(atomspell::generate_suggestions(dict, "quikc", none).empty());

  CHECK(atomspell::generate_suggestions(dict, "zzzzzzzzzz", SuggestionOptions{})
            .empty());
  CHECK(atomspell::generate_suggestions(dict, "", SuggestionOptions{}).empty());
}

} // namespace

#undef CHECK

int main() {
  test_distance();
  test_case_patterns();
  test_ranking();
  test_generate();
  test_limits();

  std::cout << "OK\n";
  return 0;
}
