#include "atomspell/correctness_resolver.hpp"
#include "atomspell/document_analyzer.hpp"
#include "atomspell/language.hpp"
#include "atomspell/spell_checker.hpp"

#include "test_support.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unordered_set>
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

using atomspell::CheckerConfig;
using atomspell::Config;
using atomspell::DocumentAnalysis;
using atomspell::Language;
using atomspell::LanguageId;
using atomspell::SpellChecker;
using atomspell::WordCategory;
using atomspell::test::TempDir;

const Language kEnglish{LanguageId::English};

Config make_config(const TempDir& dir) {
  atomspell::test::write_file(
      dir / "dictionary/dictionary(eng).csv",
      "word\nthe\nquick\nbrown\nfox\njumps\nover\nlazy\ndog\nlet\nwe\nmet\n"
      "and\n");
  Config config;
  config.dictionary = atomspell::test::isolated_config(dir);
  config.checker.confidence_threshold = 0.55;
  config.analyzer.worker_threads = 1;
  return config;
}

const atomspell::WordCheck* find_word(const DocumentAnalysis& analysis,
                                      std::string_view original) {
  for (const auto& check : analysis.words) {
    if (check.original == original) {
      return &check;
    }
  }
  return nullptr;
}

void test_misspellings_reported() {
  TempDir dir;
  SpellChecker checker{make_config(dir)};

  const auto analysis = checker.check_document("Teh quikc fox");
  CHECK(analysis.total_words == 3);
  CHECK(analysis.misspelled_words == 2);
  CHECK(analysis.unique_words == 3);
  CHECK(analysis.accuracy == 33.0);
  CHECK(analysis.lines_checked == 1);
  CHECK(!analysis.likely_code);
  CHECK(analysis.words.size() == 3);

  // "Teh" в начале предложения — обычное слово, не имя
  const auto* teh = find_word(analysis, "Teh");
  CHECK(teh != nullptr);
  CHECK(!teh->is_correct);
  CHECK(teh->category == WordCategory::Normal);
  CHECK(teh->word == "teh");
  CHECK(!teh->suggestions.empty());
  CHECK(teh->suggestions.front() == "The");

  const auto* quikc = find_word(analysis, "quikc");
  CHECK(quikc != nullptr);
  CHECK(!quikc->is_correct);
  CHECK(quikc->suggestions.front() == "quick");
  CHECK(quikc->start == 4);
  CHECK(quikc->column == 5);

  const auto* fox = find_word(analysis, "fox");
  CHECK(fox->is_correct);
  CHECK(fox->confidence == 1.0);
  CHECK(fox->suggestions.empty());

  CHECK(analysis.suggestions_count ==
        teh->suggestions.size() + quikc->suggestions.size());
}

void test_threshold_and_options() {
  TempDir dir;
  SpellChecker checker{make_config(dir)};

  // Порог по умолчанию выше уверенности 0.6: ошибок нет
  CheckerConfig lenient;
  const auto quiet =
      checker.analyze("Teh quikc fox", kEnglish, std::nullopt, lenient);
  CHECK(quiet.misspelled_words == 0);
  CHECK(quiet.accuracy == 100.0);
  CHECK(find_word(quiet, "quikc")->confidence < 0.7);

  CheckerConfig no_suggestions;
  no_suggestions.confidence_threshold = 0.55;
  no_suggestions.suggestions_enabled = false;
  const auto bare =
      checker.analyze("quikc", kEnglish, std::nullopt, no_suggestions);
  CHECK(bare.misspelled_words == 1);
  CHECK(bare.suggestions_count == 0);
}

void test_code_and_acronyms() {
  TempDir dir;
  SpellChecker checker{make_config(dir)};

  const auto code = checker.check_document("let get_value_t = 1;", "main.rs");
  CHECK(code.likely_code);
  CHECK(code.file_type == std::optional<std::string>{"rs"});
  const auto* ident = find_word(code, "get_value_t");
  CHECK(ident != nullptr);
  CHECK(ident->category == WordCategory::CodeIdentifier);
  CHECK(ident->is_correct);
  CHECK(code.misspelled_words == 0);

  const auto prose = checker.check_document("the API and the fox");
  const auto* api = find_word(prose, "API");
  CHECK(api != nullptr);
  CHECK(api->category == WordCategory::Acronym);
  CHECK(api->is_correct);
  CHECK(prose.total_words == 4);
  CHECK(prose.misspelled_words == 0);

  CHECK(checker.is_correct("API"));
  CHECK(checker.is_correct("fox"));
  CHECK(!checker.is_correct("quikc"));
}

void test_empty_and_missing_dictionary() {
  TempDir dir;
  SpellChecker checker{make_config(dir)};

  const auto empty = checker.check_document("");
  CHECK(empty.total_words == 0);
  CHECK(empty.accuracy == 100.0);
  CHECK(empty.words.empty());

  TempDir bare;
  Config config;
  config.dictionary = atomspell::test::isolated_config(bare);
  SpellChecker orphan{config};
  const auto none = orphan.check_document("Teh quikc fox");
  CHECK(none.total_words == 0);
  CHECK(none.misspelled_words == 0);
  CHECK(none.accuracy == 100.0);
  CHECK(none.words.empty());
  CHECK(orphan.is_correct("quikc"));
  CHECK(orphan.word_count(kEnglish) == 0);
}

void test_lines_and_sentences() {
  TempDir dir;
  SpellChecker checker{make_config(dir)};

  const auto analysis =
      checker.check_document("the fox.\n  Quikc dog\nthe Zzxqvbn");
  CHECK(analysis.lines_checked == 3);

  const auto* quikc = find_word(analysis, "Quikc");
  CHECK(quikc != nullptr);
  CHECK(quikc->line == 2);
  CHECK(quikc->column == 3);
  // Предыдущая строка закончилась точкой
  CHECK(quikc->category == WordCategory::Normal);
  CHECK(!quikc->is_correct);
  CHECK(quikc->suggestions.front() == "Quick");

  const auto* name = find_word(analysis, "Zzxqvbn");
  CHECK(name->category == WordCategory::ProperNoun);
  CHECK(name->line == 3);
}

void test_session_lists() {
  TempDir dir;
  SpellChecker checker{make_config(dir)};

  auto before = checker.check_document("the Zzxqvbn");
  CHECK(before.total_words == 2);

  checker.add_proper_noun("Zzxqvbn");
  auto after = checker.check_document("the Zzxqvbn");
  CHECK(after.total_words == 1);
  CHECK(after.words.size() == 2);

  checker.ignore_for_session("quikc");
  auto ignored = checker.check_document("Teh quikc fox");
  CHECK(find_word(ignored, "quikc")->is_correct);
  CHECK(ignored.misspelled_words == 1);

  // Сессионный список не сбрасывается вместе со словарным
  CHECK(checker.clear_ignored(kEnglish).ok());
  CHECK(checker.is_correct("quikc"));

  checker.add_acronym("ZQX");
  auto acronym = checker.check_document("the ZQX fox");
  CHECK(acronym.total_words == 2);
}

void test_dictionary_mutations() {
  TempDir dir;
  SpellChecker checker{make_config(dir)};

  CHECK(!checker.is_correct("quikc"));
  CHECK(checker.add_word("quikc", kEnglish).ok());
  CHECK(checker.is_correct("quikc"));
  CHECK(checker.check_document("Teh quikc fox").misspelled_words == 1);

  CHECK(checker.remove_word("quikc", kEnglish).ok());
  CHECK(!checker.is_correct("quikc"));

  CHECK(checker.ignore_word("Teh", kEnglish).ok());
  CHECK(checker.check_document("Teh quikc fox").misspelled_words == 1);
  CHECK(checker.clear_ignored(kEnglish).ok());
  CHECK(checker.check_document("Teh quikc fox").misspelled_words == 2);

  CHECK(checker.add_word("", kEnglish).code == atomspell::DictError::InvalidWord);
  CHECK(checker.add_word("word", Language{LanguageId::AutoDetect}).code ==
        atomspell::DictError::DictionaryNotFound);

  const std::size_t count = checker.word_count(kEnglish);
  CHECK(count == 12);
  CHECK(checker.export_dictionary(kEnglish, dir / "out/words.txt").ok());

  atomspell::test::write_file(dir / "extra.txt", "quikc\nzebra\n");
  CHECK(checker.import_dictionary(dir / "extra.txt", kEnglish).ok());
  CHECK(checker.word_count(kEnglish) == count + 2);
  CHECK(checker.is_correct("zebra"));

  CHECK(checker.reload_dictionary(kEnglish).ok());
  CHECK(checker.cache()->size() == 0);
}

void test_language_switch_clears_cache() {
  TempDir dir;
  SpellChecker checker{make_config(dir)};

  CHECK(checker.is_correct("fox"));
  CHECK(!checker.is_correct("quikc"));
  CHECK(checker.cache()->size() > 0);

  CHECK(checker.set_language(kEnglish).ok());
  CHECK(checker.cache()->size() > 0);

  // Французского списка нет, загружается английский
  CHECK(checker.set_language(Language{LanguageId::French}).ok());
  CHECK(checker.language().id() == LanguageId::French);
  CHECK(checker.cache()->size() == 0);
}

void test_language_switch_reports_load_failure() {
  TempDir bare;
  Config config;
  config.dictionary = atomspell::test::isolated_config(bare);
  SpellChecker checker{config};
  CHECK(checker.is_correct("quikc"));

  const auto status = checker.set_language(Language{LanguageId::German});
  CHECK(status.code == atomspell::DictError::DictionaryNotFound);
  CHECK(!status.error.empty());
  CHECK(checker.language().id() == LanguageId::English);

  // Автоопределение не требует словаря заранее
  CHECK(checker.set_language(Language{LanguageId::AutoDetect}).ok());
  CHECK(checker.language().is_auto());
}

void test_cache_consistency() {
  TempDir dir;
  const Config config = make_config(dir);
  atomspell::Dictionary dict{kEnglish, config.dictionary};
  CHECK(dict.load().ok());

  atomspell::CorrectnessCache cache;
  const std::unordered_set<std::string> session_ignored;
  const atomspell::CorrectnessResolver resolver{dict, cache, session_ignored,
                                                false};

  struct Case {
    std::string_view token;
    WordCategory category;
    bool expected;
  };
  const Case cases[] = {
      {"fox", WordCategory::Normal, true},
      {"quikc", WordCategory::Normal, false},
      // Нет в словаре, принимается как правдоподобное имя
      {"London", WordCategory::ProperNoun, true},
  };

  for (const auto& c : cases) {
    const std::string normalized = atomspell::normalize_word(c.token, kEnglish);
    const bool first = resolver.resolve(c.token, normalized, c.category, false);
    CHECK(first == c.expected);
    CHECK(cache.size() > 0);
    CHECK(resolver.resolve(c.token, normalized, c.category, false) == first);

    cache.clear();
    CHECK(resolver.resolve(c.token, normalized, c.category, false) == first);
    CHECK(cache.size() == 1);
    cache.clear();
  }

  // То же через фасад
  SpellChecker checker{config};
  for (const std::string_view word : {"fox", "quikc", "London"}) {
    const bool first = checker.is_correct(word);
    checker.cache()->clear();
    CHECK(checker.is_correct(word) == first);
  }
}

void test_sentence_start_reclassified_before_skip() {
  TempDir dir;
  SpellChecker checker{make_config(dir)};

  // В начале файла "Get_value_t" похоже на имя, но это идентификатор
  const auto code = checker.check_document("Get_value_t(1);", "main.rs");
  const auto* ident = find_word(code, "Get_value_t");
  CHECK(ident != nullptr);
  CHECK(ident->category == WordCategory::CodeIdentifier);
  CHECK(ident->is_correct);
  CHECK(code.total_words == 0);

  // Известное имя в начале предложения по-прежнему пропускается
  checker.add_proper_noun("Zzxqvbn");
  const auto prose = checker.check_document("Zzxqvbn met the dog.");
  const auto* name = find_word(prose, "Zzxqvbn");
  CHECK(name != nullptr);
  CHECK(name->category == WordCategory::ProperNoun);
  CHECK(prose.total_words == 3);
  CHECK(prose.misspelled_words == 0);
}

void test_auto_detect() {
  TempDir dir;
  SpellChecker checker{make_config(dir)};

  const auto analysis =
      checker.analyze("the quick brown fox and the lazy dog",
                      Language{LanguageId::AutoDetect}, std::nullopt,
                      checker.config().checker);
  CHECK(analysis.language.id() == LanguageId::English);
  CHECK(analysis.misspelled_words == 0);
  CHECK(analysis.total_words == 8);
}

void test_parallel_matches_serial() {
  TempDir dir;
  Config config = make_config(dir);

  std::string text;
  for (int i = 0; i < 300; ++i) {
    text += (i % 3 == 0) ? "Teh quikc fox.\n" : "the lazy dog jumps ovr\n";
  }

  SpellChecker serial{config};
  const auto expected = serial.check_document(text);

  config.analyzer.worker_threads = 4;
  config.analyzer.parallel_min_lines = 8;
  SpellChecker parallel{config};
  const auto actual = parallel.check_document(text);

  CHECK(actual.total_words == expected.total_words);
  CHECK(actual.misspelled_words == expected.misspelled_words);
  CHECK(actual.unique_words == expected.unique_words);
  CHECK(actual.accuracy == expected.accuracy);
  CHECK(actual.words.size() == expected.words.size());
  for (std::size_t i = 0; i < actual.words.size(); ++i) {
    CHECK(actual.words[i].original == expected.words[i].original);
    CHECK(actual.words[i].line == expected.words[i].line);
    CHECK(actual.words[i].column == expected.words[i].column);
    CHECK(actual.words[i].is_correct == expected.words[i].is_correct);
    CHECK(actual.words[i].suggestions == expected.words[i].suggestions);
  }
  CHECK(actual.words.back().line == 300);
}

void test_shared_state() {
  TempDir dir;
  const Config config = make_config(dir);
  auto manager = std::make_shared<atomspell::DictionaryManager>(config.dictionary);
  auto cache = std::make_shared<atomspell::CorrectnessCache>();

  SpellChecker first{config, manager, cache};
  SpellChecker second{config, manager, cache};

  CHECK(!first.is_correct("quikc"));
  CHECK(second.add_word("quikc", kEnglish).ok());
  // Общий кеш сброшен изменением через второго
  CHECK(first.is_correct("quikc"));

  // Одновременные проверки дают одинаковый результат
  std::vector<std::size_t> misspelled(4);
  {
    std::vector<std::jthread> threads;
    for (std::size_t i = 0; i < misspelled.size(); ++i) {
      threads.emplace_back([&first, &misspelled, i] {
        misspelled[i] = first.check_document("Teh quick fox").misspelled_words;
      });
    }
  }
  for (auto m : misspelled) {
    CHECK(m == 1);
  }
}

void test_ends_sentence() {
  CHECK(atomspell::ends_sentence("Done."));
  CHECK(atomspell::ends_sentence("Really?  "));
  CHECK(atomspell::ends_sentence("Note:"));
  CHECK(atomspell::ends_sentence(""));
  CHECK(!atomspell::ends_sentence("and then"));
}

} // namespace

#undef CHECK

int main() {
  test_misspellings_reported();
  test_threshold_and_options();
  test_code_and_acronyms();
  test_empty_and_missing_dictionary();
  test_lines_and_sentences();
  test_session_lists();
  test_dictionary_mutations();
  test_language_switch_clears_cache();
  test_language_switch_reports_load_failure();
  test_cache_consistency();
  test_sentence_start_reclassified_before_skip();
  test_auto_detect();
  test_parallel_matches_serial();
  test_shared_state();
  test_ends_sentence();

  std::cout << "OK\n";
  return 0;
}
