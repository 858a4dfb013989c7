#include "atomspell/dictionary.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
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

using atomspell::DictError;
using atomspell::Dictionary;
using atomspell::Language;
using atomspell::LanguageId;
using atomspell::test::TempDir;

const Language kEnglish{LanguageId::English};
const Language kFrench{LanguageId::French};

void write_english(const TempDir& dir) {
  atomspell::test::write_file(dir / "dictionary/dictionary(eng).csv",
                              "word\nthe\nquick\nbrown\nfox\nLondon\n");
}

void test_load_csv_and_idempotence() {
  TempDir dir;
  write_english(dir);

  Dictionary dict{kEnglish, atomspell::test::isolated_config(dir)};
  CHECK(!dict.is_loaded());

  auto status = dict.load();
  CHECK(status.ok());
  CHECK(dict.is_loaded());
  CHECK(dict.word_count() == 5);
  CHECK(dict.source_path().has_value());
  CHECK(dict.source_path()->filename() == "dictionary(eng).csv");

  CHECK(dict.load().ok());
  CHECK(dict.word_count() == 5);
}

void test_txt_used_when_no_csv() {
  TempDir dir;
  atomspell::test::write_file(dir / "dictionary/dictionary(eng).txt",
                              "alpha\nbeta\n");
  Dictionary dict{kEnglish, atomspell::test::isolated_config(dir)};
  CHECK(dict.load().ok());
  CHECK(dict.word_count() == 2);
  CHECK(dict.has_word("alpha"));
}

void test_fallback_to_default_language() {
  TempDir dir;
  write_english(dir);

  Dictionary dict{kFrench, atomspell::test::isolated_config(dir)};
  CHECK(dict.load().ok());
  CHECK(dict.language() == kFrench);
  CHECK(dict.source_language() == kEnglish);
  CHECK(dict.contains("fox", false, false));
}

void test_not_found_and_empty() {
  TempDir dir;
  {
    Dictionary dict{kEnglish, atomspell::test::isolated_config(dir)};
    auto status = dict.load();
    CHECK(status.code == DictError::DictionaryNotFound);
    CHECK(!dict.is_loaded());
  }

  atomspell::test::write_file(dir / "dictionary/dictionary(eng).txt",
                              "# only a comment\n");
  Dictionary dict{kEnglish, atomspell::test::isolated_config(dir)};
  auto status = dict.load();
  CHECK(status.code == DictError::EmptyDictionary);
  CHECK(!status.fatal());
  CHECK(dict.is_loaded());
  CHECK(dict.word_count() == 0);
}

void test_contains_skip_rules() {
  TempDir dir;
  write_english(dir);
  Dictionary dict{kEnglish, atomspell::test::isolated_config(dir)};
  CHECK(dict.load().ok());

  CHECK(dict.contains("The", false, false));
  CHECK(dict.contains("  fox ", false, false));
  CHECK(!dict.contains("quikc", false, false));

  // Пустое и короткое слово не проверяется
  CHECK(dict.contains("", false, false));
  CHECK(dict.contains("x", false, false));

  // Слово с цифрами
  CHECK(dict.contains("v2", false, false));
  CHECK(dict.contains("x86", false, false));

  // Форма идентификатора только в контексте кода
  CHECK(dict.contains("parse_header", false, true));
  CHECK(!dict.contains("parse_header", false, false));
  CHECK(dict.contains("fooBar", false, true));
}

void test_case_sensitive() {
  TempDir dir;
  write_english(dir);
  Dictionary dict{kEnglish, atomspell::test::isolated_config(dir)};
  CHECK(dict.load().ok());

  CHECK(dict.contains("quick", true, false));
  CHECK(dict.contains("Quick", true, false));
  CHECK(!dict.contains("QuIcK", true, false));
  CHECK(dict.contains("QuIcK", false, false));
}

void test_add_and_ignore_persist() {
  TempDir dir;
  write_english(dir);
  const auto cfg = atomspell::test::isolated_config(dir);

  {
    Dictionary dict{kEnglish, cfg};
    CHECK(dict.load().ok());

    CHECK(!dict.contains("atomspell", false, false));
    CHECK(dict.add_word("AtomSpell").ok());
    CHECK(dict.contains("atomspell", false, false));
    CHECK(dict.is_user_word("ATOMSPELL"));

    CHECK(dict.ignore_word("Blargh").ok());
    CHECK(dict.contains("blargh", false, false));
    CHECK(dict.is_ignored("blargh"));

    CHECK(std::filesystem::exists(dict.user_words_path()));
    CHECK(std::filesystem::exists(dict.ignored_words_path()));
    CHECK(dict.user_words_path().filename() == "eng_user.txt");
    CHECK(dict.ignored_words_path().filename() == "eng_ignored.txt");
  }

  // Новый экземпляр подхватывает пользовательские файлы
  Dictionary reloaded{kEnglish, cfg};
  CHECK(reloaded.load().ok());
  CHECK(reloaded.contains("atomspell", false, false));
  CHECK(reloaded.contains("blargh", false, false));
  CHECK(reloaded.word_count() == 6);

  CHECK(reloaded.clear_ignored().ok());
  CHECK(!reloaded.contains("blargh", false, false));
  CHECK(reloaded.ignored_words().empty());
}

void test_add_removes_from_ignored() {
  TempDir dir;
  write_english(dir);
  Dictionary dict{kEnglish, atomspell::test::isolated_config(dir)};
  CHECK(dict.load().ok());

  CHECK(dict.ignore_word("zork").ok());
  CHECK(dict.add_word("zork").ok());
  CHECK(!dict.is_ignored("zork"));
  CHECK(dict.user_words() == (std::vector<std::string>{"zork"}));
}

void test_invalid_words_rejected() {
  TempDir dir;
  write_english(dir);
  Dictionary dict{kEnglish, atomspell::test::isolated_config(dir)};
  CHECK(dict.load().ok());
  const auto before = dict.word_count();

  CHECK(dict.add_word("").code == DictError::InvalidWord);
  CHECK(dict.add_word("   ").code == DictError::InvalidWord);
  CHECK(dict.add_word("a").code == DictError::InvalidWord);
  CHECK(dict.add_word("1234").code == DictError::InvalidWord);
  CHECK(dict.ignore_word(" b ").code == DictError::InvalidWord);
  CHECK(dict.word_count() == before);
  CHECK(!std::filesystem::exists(dict.user_words_path()));
}

void test_unstorable_words_rejected() {
  TempDir dir;
  write_english(dir);
  const auto cfg = atomspell::test::isolated_config(dir);

  {
    Dictionary dict{kEnglish, cfg};
    CHECK(dict.load().ok());

    // '#' в начале строки читается как комментарий
    CHECK(dict.add_word("#hashtag").code == DictError::InvalidWord);
    // Перевод строки разбил бы слово на два при чтении
    CHECK(dict.add_word("foo\nbar").code == DictError::InvalidWord);
    CHECK(dict.add_word("foo bar").code == DictError::InvalidWord);
    CHECK(dict.add_word("foo\x01").code == DictError::InvalidWord);
    CHECK(dict.ignore_word("tab\tword").code == DictError::InvalidWord);
    CHECK(!dict.is_user_word("foo"));

    // Решётка внутри слова допустима
    CHECK(dict.add_word("c#sharp").ok());
    CHECK(dict.add_word("zephyr").ok());
  }

  Dictionary reloaded{kEnglish, cfg};
  CHECK(reloaded.load().ok());
  CHECK(reloaded.user_words() ==
        (std::vector<std::string>{"c#sharp", "zephyr"}));
  CHECK(!reloaded.contains("foo", false, false));
  CHECK(!reloaded.contains("bar", false, false));
  CHECK(reloaded.ignored_words().empty());
}

void test_persist_failure_keeps_word() {
  TempDir dir;
  write_english(dir);
  auto cfg = atomspell::test::isolated_config(dir);
  // user_data_dir — обычный файл, каталог создать нельзя
  atomspell::test::write_file(dir / "blocker", "x");
  cfg.user_data_dir = dir / "blocker";

  Dictionary dict{kEnglish, cfg};
  CHECK(dict.load().ok());
  auto status = dict.add_word("zork");
  CHECK(status.code == DictError::Io);
  CHECK(dict.contains("zork", false, false));
}

void test_export_import_roundtrip() {
  TempDir dir;
  write_english(dir);
  auto cfg = atomspell::test::isolated_config(dir);

  Dictionary source{kEnglish, cfg};
  CHECK(source.load().ok());
  CHECK(source.add_word("Zebra").ok());

  for (const char* name : {"export/words.csv", "export/words.txt"}) {
    CHECK(source.export_to_file(dir / name).ok());

    TempDir other;
    atomspell::test::write_file(other / "dictionary/dictionary(eng).txt",
                                "placeholder\n");
    Dictionary fresh{kEnglish, atomspell::test::isolated_config(other)};
    CHECK(fresh.load().ok());
    CHECK(fresh.import_from_file(dir / name).ok());

    auto words = fresh.sorted_words();
    words.erase(std::find(words.begin(), words.end(), "placeholder"));
    CHECK(words == source.sorted_words());
  }

  CHECK(source.export_to_file(dir / "words.json").code ==
        DictError::UnsupportedFormat);
  CHECK(source.import_from_file(dir / "words.json").code ==
        DictError::UnsupportedFormat);
  CHECK(source.import_from_file(dir / "absent.txt").code == DictError::Io);
}

void test_load_from_file() {
  TempDir dir;
  atomspell::test::write_file(dir / "custom/medical.txt",
                              "aspirin\nibuprofen\n");
  Dictionary dict{Language::custom("med"),
                  atomspell::test::isolated_config(dir)};
  CHECK(dict.load_from_file(dir / "custom/medical.txt").ok());
  CHECK(dict.is_loaded());
  CHECK(dict.contains("Aspirin", false, false));
  CHECK(dict.word_count() == 2);
  CHECK(dict.user_words_path().filename() == "med_user.txt");
}

void test_search_dirs() {
  TempDir dir;
  atomspell::DictionaryConfig cfg;
  cfg.user_data_dir = dir.path();
  const auto dirs = atomspell::dictionary_search_dirs(cfg);
  CHECK(dirs.size() == 5);
  CHECK(dirs[0] == "dictionary");
  CHECK(dirs[2] == dir / "dictionaries");

  cfg.search_dirs = {"/tmp/only"};
  CHECK(atomspell::dictionary_search_dirs(cfg).size() == 1);
}

void test_find_hunspell_files() {
  TempDir dir;
  auto cfg = atomspell::test::isolated_config(dir);
  cfg.hunspell_dirs = {dir / "missing", dir / "hunspell"};
  CHECK(!atomspell::find_hunspell_files(cfg, kEnglish).has_value());

  atomspell::test::write_file(dir / "hunspell/en_US.aff", "SET UTF-8\n");
  atomspell::test::write_file(dir / "hunspell/en_US.dic", "2\nhello/S\nworld\n");
  auto files = atomspell::find_hunspell_files(cfg, kEnglish);
  CHECK(files.has_value());
  CHECK(files->dic == dir / "hunspell/en_US.dic");
  CHECK(!atomspell::find_hunspell_files(cfg, Language::custom("xx")).has_value());

  // Системный .dic как источник базового списка
  cfg.system_dictionaries = true;
  Dictionary dict{kEnglish, cfg};
  CHECK(dict.load().ok());
  CHECK(dict.contains("hello", false, false));
  CHECK(dict.contains("world", false, false));
}

} // namespace

#undef CHECK

int main() {
  test_load_csv_and_idempotence();
  test_txt_used_when_no_csv();
  test_fallback_to_default_language();
  test_not_found_and_empty();
  test_contains_skip_rules();
  test_case_sensitive();
  test_add_and_ignore_persist();
  test_add_removes_from_ignored();
  test_invalid_words_rejected();
  test_unstorable_words_rejected();
  test_persist_failure_keeps_word();
  test_export_import_roundtrip();
  test_load_from_file();
  test_search_dirs();
  test_find_hunspell_files();

  std::cout << "OK\n";
  return 0;
}
