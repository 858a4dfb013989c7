#include "atomspell/confidence_scorer.hpp"
#include "atomspell/correctness_cache.hpp"
#include "atomspell/correctness_resolver.hpp"
#include "atomspell/word_classifier.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
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

using atomspell::WordCategory;

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

void test_rule_order() {
  const auto rules = atomspell::classifier_rules();
  CHECK(rules.size() == 4);
  CHECK(rules[0].category == WordCategory::Acronym);
  CHECK(rules[1].category == WordCategory::ProperNoun);
  CHECK(rules[2].category == WordCategory::CodeIdentifier);
  CHECK(rules[3].category == WordCategory::TechnicalTerm);
}

void test_classify() {
  // Аббревиатура раньше имени собственного
  CHECK(atomspell::classify("API", false) == WordCategory::Acronym);
  CHECK(atomspell::classify("HTTP2", false) == WordCategory::Acronym);
  CHECK(atomspell::classify("ABCDEFG", false) == WordCategory::ProperNoun);

  CHECK(atomspell::classify("London", false) == WordCategory::ProperNoun);
  CHECK(atomspell::classify("The", false) == WordCategory::Normal);
  CHECK(atomspell::classify("Ox", false) == WordCategory::Normal);

  CHECK(atomspell::classify("get_value_t", true) ==
        WordCategory::CodeIdentifier);
  CHECK(atomspell::classify("fooBar", true) == WordCategory::CodeIdentifier);
  CHECK(atomspell::classify("fooBar", false) == WordCategory::Normal);
  CHECK(atomspell::classify("node_ptr", true) == WordCategory::CodeIdentifier);

  CHECK(atomspell::classify("multi-threaded", false) ==
        WordCategory::TechnicalTerm);
  CHECK(atomspell::classify("re-do", false) == WordCategory::Normal);
  CHECK(atomspell::classify("quick", false) == WordCategory::Normal);
}

void test_shape_heuristics() {
  CHECK(atomspell::looks_like_code_identifier("max_value"));
  CHECK(!atomspell::looks_like_code_identifier("_private"));
  CHECK(atomspell::looks_like_code_identifier("camelCase"));
  CHECK(atomspell::looks_like_code_identifier("UserService"));
  CHECK(atomspell::looks_like_code_identifier("has_items"));
  CHECK(!atomspell::looks_like_code_identifier("plain"));

  CHECK(atomspell::is_numeric_heavy("v2"));
  CHECK(atomspell::is_numeric_heavy("x86"));
  CHECK(!atomspell::is_numeric_heavy("abc1"));
  CHECK(!atomspell::is_numeric_heavy("word"));

  CHECK(atomspell::is_skippable_code_identifier("get_value_t"));
  CHECK(atomspell::is_skippable_code_identifier("__init__"));
  CHECK(atomspell::is_skippable_code_identifier("0xFF"));
  CHECK(atomspell::is_skippable_code_identifier("len"));
  CHECK(!atomspell::is_skippable_code_identifier("parseHeader"));

  CHECK(atomspell::looks_reasonable("London"));
  CHECK(atomspell::looks_reasonable("NASA"));
  CHECK(!atomspell::looks_reasonable("Zzzzzzz"));
  CHECK(!atomspell::looks_reasonable("Brrrtkk"));
  CHECK(!atomspell::looks_reasonable("X1234"));
}

void test_confidence() {
  CHECK(near(atomspell::score_confidence("the", WordCategory::Normal, true),
             1.0));
  // 0.5 * 1.2
  CHECK(near(atomspell::score_confidence("quikc", WordCategory::Normal, false),
             0.6));
  CHECK(near(atomspell::score_confidence("natoin", WordCategory::Normal, false),
             0.5 * 1.2));
  // 0.5 * 1.2 * 1.3 ("tion")
  CHECK(near(atomspell::score_confidence("nation", WordCategory::Normal, false),
             0.78));
  // 0.5 * 0.3
  CHECK(near(
      atomspell::score_confidence("abcdef", WordCategory::CodeIdentifier, false),
      0.15));
  // 0.5 * 1.2 * 0.3 (короткое)
  CHECK(near(atomspell::score_confidence("xq", WordCategory::Normal, false),
             0.18));
  // 0.5 * 0.8 * 1.1 (дефис)
  CHECK(near(atomspell::score_confidence("multi-thraded",
                                         WordCategory::TechnicalTerm, false),
             0.44));

  for (auto category :
       {WordCategory::Normal, WordCategory::CodeIdentifier,
        WordCategory::Acronym, WordCategory::ProperNoun,
        WordCategory::TechnicalTerm}) {
    const double c = atomspell::score_confidence(
        "incomprehensibilities_everywhere-ness", category, false);
    CHECK(c >= 0.0 && c <= 1.0);
  }
}

void test_leniency() {
  CHECK(atomspell::lenient_accept("Zelda", WordCategory::ProperNoun));
  CHECK(!atomspell::lenient_accept("Qqqqqqq", WordCategory::ProperNoun));
  CHECK(atomspell::lenient_accept("NASA", WordCategory::Acronym));
  CHECK(atomspell::lenient_accept("parseHeaderX", WordCategory::CodeIdentifier));
  CHECK(!atomspell::lenient_accept("parseHeaderAndBodyFields",
                                   WordCategory::CodeIdentifier));
  CHECK(!atomspell::lenient_accept("quikc", WordCategory::Normal));
  CHECK(!atomspell::lenient_accept("multi-thraded",
                                   WordCategory::TechnicalTerm));
}

void test_cache_keys() {
  using atomspell::CorrectnessCache;
  CorrectnessCache cache;

  const auto k1 = CorrectnessCache::make_key("eng", "word",
                                             WordCategory::Normal, false);
  const auto k2 = CorrectnessCache::make_key("fra", "word",
                                             WordCategory::Normal, false);
  const auto k3 = CorrectnessCache::make_key("eng", "word",
                                             WordCategory::Normal, true);
  CHECK(k1 != k2);
  CHECK(k1 != k3);

  CHECK(!cache.get(k1).has_value());
  cache.insert(k1, true);
  cache.insert(k2, false);
  CHECK(cache.get(k1) == std::optional<bool>{true});
  CHECK(cache.get(k2) == std::optional<bool>{false});
  CHECK(cache.size() == 2);

  cache.insert(k1, true);
  CHECK(cache.size() == 2);

  cache.clear();
  CHECK(cache.size() == 0);
  CHECK(!cache.get(k1).has_value());
}

} // namespace

#undef CHECK

int main() {
  test_rule_order();
  test_classify();
  test_shape_heuristics();
  test_confidence();
  test_leniency();
  test_cache_keys();

  std::cout << "OK\n";
  return 0;
}
