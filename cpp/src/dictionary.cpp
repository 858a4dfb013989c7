/**
 * @file dictionary.cpp
 * @brief Реализация словаря: загрузка, поиск, пользовательские списки
 */

#include "atomspell/dictionary.hpp"
#include "atomspell/unicode_text.hpp"
#include "atomspell/word_classifier.hpp"
#include "atomspell/word_list.hpp"

#include <unicode/uchar.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <iostream>
#include <system_error>

namespace atomspell {

namespace {

// Системный каталог словарей AtomSpell
constexpr const char *kSystemDictionaryDir = "/usr/share/atomspell/dictionaries";

constexpr std::array<std::string_view, 2> kBaseExtensions = {"csv", "txt"};

constexpr const char *kUserDictionariesDir = "user_dictionaries";

/// Содержит ли слово хотя бы одну букву
bool has_letter(std::string_view word) {
  for (char32_t c : decode_utf8(word)) {
    if (u_isalpha(static_cast<UChar32>(c))) {
      return true;
    }
  }
  return false;
}

/// Переживает ли слово запись в построчный файл и повторное чтение
bool is_storable(std::string_view word) {
  if (word.starts_with('#')) {
    return false;
  }
  for (char32_t c : decode_utf8(word)) {
    const auto cp = static_cast<UChar32>(c);
    if (u_isUWhiteSpace(cp) || u_iscntrl(cp)) {
      return false;
    }
  }
  return true;
}

bool regular_file_exists(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && !ec;
}

std::vector<std::string> sorted(const std::unordered_set<std::string> &set) {
  std::vector<std::string> out(set.begin(), set.end());
  std::sort(out.begin(), out.end());
  return out;
}

long long elapsed_ms(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

} // namespace

std::vector<std::filesystem::path>
dictionary_search_dirs(const DictionaryConfig &config) {
  if (!config.search_dirs.empty()) {
    return config.search_dirs;
  }
  return {
      "dictionary",
      std::filesystem::path{"src"} / "dictionary",
      config.user_data_dir / "dictionaries",
      kSystemDictionaryDir,
      ".",
  };
}

std::optional<HunspellFiles> find_hunspell_files(const DictionaryConfig &config,
                                                 const Language &language) {
  const std::string locale{language.hunspell_locale()};
  if (locale.empty()) {
    return std::nullopt;
  }

  for (const auto &dir : config.hunspell_dirs) {
    HunspellFiles files{dir / (locale + ".aff"), dir / (locale + ".dic")};
    if (regular_file_exists(files.aff) && regular_file_exists(files.dic)) {
      return files;
    }
  }
  return std::nullopt;
}

// ===========================================================================
// Dictionary
// ===========================================================================

Dictionary::Dictionary(Language language, DictionaryConfig config)
    : language_{std::move(language)}, config_{std::move(config)},
      bloom_{std::make_unique<BloomFilter>()}, source_language_{language_} {}

Dictionary::~Dictionary() = default;

DictStatus Dictionary::load() {
  std::lock_guard<std::mutex> load_lock(load_mu_);
  {
    std::shared_lock lock(mu_);
    if (loaded_) {
      return load_status_;
    }
  }

  DictStatus status = load_base_for(language_);

  if (status.fatal() && !(language_ == config_.default_language)) {
    std::cerr << kLogPrefix << "Warning: " << status.error
              << ", falling back to " << config_.default_language.name()
              << "\n";
    DictStatus fallback = load_base_for(config_.default_language);
    if (fallback.fatal()) {
      return DictStatus::failure(
          DictError::DictionaryNotFound,
          "No dictionary for " + language_.name() + " or fallback " +
              config_.default_language.name());
    }
    status = std::move(fallback);
  }

  if (status.fatal()) {
    if (status.code != DictError::DictionaryNotFound) {
      return DictStatus::failure(DictError::DictionaryNotFound, status.error);
    }
    return status;
  }

  return finish_load(std::move(status));
}

DictStatus Dictionary::load_from_file(const std::filesystem::path &path) {
  std::lock_guard<std::mutex> load_lock(load_mu_);

  const auto t0 = std::chrono::steady_clock::now();
  const WordListOptions opts{language_, config_.min_word_length,
                             config_.load_threads};
  WordListOutcome out = read_word_list(path, opts);
  if (out.status.fatal()) {
    std::cerr << kLogPrefix << "Warning: " << out.status.error << "\n";
    return out.status;
  }

  const std::size_t count = out.words.size();
  install_base(std::move(out.words), language_, path);
  std::cerr << kLogPrefix << "Loaded " << count << " words for "
            << language_.name() << " from " << path.string() << " ("
            << elapsed_ms(t0) << " ms)\n";

  if (count == 0) {
    std::cerr << kLogPrefix << "Warning: empty dictionary " << path.string()
              << "\n";
    return finish_load(DictStatus::failure(DictError::EmptyDictionary,
                                           "Empty dictionary: " +
                                               path.string()));
  }
  return finish_load(DictStatus::success());
}

DictStatus Dictionary::load_base_for(const Language &lang) {
  if (lang.is_auto()) {
    return DictStatus::failure(DictError::DictionaryNotFound,
                               "Auto-detect is not a dictionary language");
  }

  std::vector<std::filesystem::path> candidates;
  const auto dirs = dictionary_search_dirs(config_);
  for (auto ext : kBaseExtensions) {
    const std::string filename = lang.dictionary_filename(ext);
    for (const auto &dir : dirs) {
      candidates.push_back(dir / filename);
    }
  }
  if (config_.system_dictionaries) {
    if (auto files = find_hunspell_files(config_, lang)) {
      candidates.push_back(files->dic);
    }
  }

  const WordListOptions opts{lang, config_.min_word_length,
                             config_.load_threads};
  DictStatus last = DictStatus::failure(DictError::DictionaryNotFound,
                                        "No dictionary for " + lang.name());

  for (const auto &path : candidates) {
    if (!regular_file_exists(path)) {
      continue;
    }

    const auto t0 = std::chrono::steady_clock::now();
    WordListOutcome out = read_word_list(path, opts);
    if (out.status.fatal()) {
      std::cerr << kLogPrefix << "Warning: " << out.status.error << "\n";
      last = std::move(out.status);
      continue;
    }

    const std::size_t count = out.words.size();
    install_base(std::move(out.words), lang, path);
    std::cerr << kLogPrefix << "Loaded " << count << " words for "
              << lang.name() << " from " << path.string() << " ("
              << elapsed_ms(t0) << " ms)\n";

    if (count == 0) {
      std::cerr << kLogPrefix << "Warning: empty dictionary " << path.string()
                << "\n";
      return DictStatus::failure(DictError::EmptyDictionary,
                                 "Empty dictionary: " + path.string());
    }
    return DictStatus::success();
  }

  return last;
}

void Dictionary::install_base(std::vector<std::string> words,
                              const Language &from,
                              std::filesystem::path path) {
  std::unique_lock lock(mu_);
  words_.clear();
  bloom_->clear();
  words_.reserve(words.size());
  for (auto &w : words) {
    bloom_->add(w);
    words_.insert(std::move(w));
  }
  source_language_ = from;
  source_path_ = std::move(path);
}

void Dictionary::merge_user_files() {
  const WordListOptions opts{language_, config_.min_word_length, 1};

  std::vector<std::string> disk_user;
  std::vector<std::string> disk_ignored;

  if (const auto path = user_words_path(); regular_file_exists(path)) {
    WordListOutcome out = read_word_list(path, opts);
    if (out.status.fatal()) {
      std::cerr << kLogPrefix << "Warning: " << out.status.error << "\n";
    } else {
      disk_user = std::move(out.words);
    }
  }
  if (const auto path = ignored_words_path(); regular_file_exists(path)) {
    WordListOutcome out = read_word_list(path, opts);
    if (out.status.fatal()) {
      std::cerr << kLogPrefix << "Warning: " << out.status.error << "\n";
    } else {
      disk_ignored = std::move(out.words);
    }
  }

  std::unique_lock lock(mu_);
  for (auto &w : disk_user) {
    user_words_.insert(std::move(w));
  }
  for (auto &w : disk_ignored) {
    ignored_.insert(std::move(w));
  }
  // Пользовательские слова побеждают "неизвестно" и игнорирование
  for (const auto &w : user_words_) {
    bloom_->add(w);
    words_.insert(w);
    ignored_.erase(w);
  }
}

DictStatus Dictionary::finish_load(DictStatus status) {
  merge_user_files();
  open_hunspell();

  std::unique_lock lock(mu_);
  loaded_ = true;
  load_status_ = status;
  return status;
}

void Dictionary::open_hunspell() {
#ifdef HAVE_HUNSPELL
  if (!config_.system_dictionaries || hunspell_available_.load()) {
    return;
  }

  auto files = find_hunspell_files(config_, language_);
  if (!files) {
    files = find_hunspell_files(config_, source_language());
  }
  if (!files) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(hunspell_mu_);
    hunspell_ = std::make_unique<Hunspell>(files->aff.c_str(),
                                           files->dic.c_str());
  }
  hunspell_available_.store(true, std::memory_order_release);
  std::cerr << kLogPrefix << "Hunspell " << language_.hunspell_locale()
            << " loaded from " << files->dic.string() << "\n";
#endif
}

bool Dictionary::check_hunspell(const std::string &word) const {
#ifdef HAVE_HUNSPELL
  if (!is_hunspell_available()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(hunspell_mu_);
  return hunspell_ && hunspell_->spell(word) != 0;
#else
  (void)word;
  return false;
#endif
}

std::vector<std::string>
Dictionary::hunspell_suggest(const std::string &word) const {
#ifdef HAVE_HUNSPELL
  if (!is_hunspell_available()) {
    return {};
  }
  std::lock_guard<std::mutex> lock(hunspell_mu_);
  if (!hunspell_) {
    return {};
  }
  // Hunspell::suggest возвращает список предложений
  return hunspell_->suggest(word);
#else
  (void)word;
  return {};
#endif
}

bool Dictionary::is_loaded() const {
  std::shared_lock lock(mu_);
  return loaded_;
}

Language Dictionary::source_language() const {
  std::shared_lock lock(mu_);
  return source_language_;
}

std::optional<std::filesystem::path> Dictionary::source_path() const {
  std::shared_lock lock(mu_);
  return source_path_;
}

// ===========================================================================
// Поиск
// ===========================================================================

bool Dictionary::contains(std::string_view word, bool case_sensitive,
                          bool is_code_context) const {
  const std::string_view trimmed = trim(word);
  if (trimmed.empty() || char_count(trimmed) < config_.min_word_length) {
    return true;
  }

  if (!language_.is_cjk() && is_numeric_heavy(trimmed)) {
    return true;
  }

  if (is_code_context && looks_like_code_identifier(trimmed)) {
    return true;
  }

  const std::string normalized = normalize_word(trimmed, language_);
  {
    std::shared_lock lock(mu_);
    if (ignored_.contains(normalized)) {
      return true;
    }

    const bool case_ok = !case_sensitive || trimmed == normalized ||
                         trimmed == capitalize(normalized);
    if (case_ok && bloom_->maybe_contains(normalized) &&
        words_.contains(normalized)) {
      return true;
    }
  }

  return check_hunspell(std::string{trimmed});
}

bool Dictionary::has_word(std::string_view normalized) const {
  const std::string key{normalized};
  std::shared_lock lock(mu_);
  return bloom_->maybe_contains(key) && words_.contains(key);
}

bool Dictionary::is_ignored(std::string_view word) const {
  const std::string key = normalize_word(word, language_);
  std::shared_lock lock(mu_);
  return ignored_.contains(key);
}

bool Dictionary::is_user_word(std::string_view word) const {
  const std::string key = normalize_word(word, language_);
  std::shared_lock lock(mu_);
  return user_words_.contains(key);
}

// ===========================================================================
// Изменение
// ===========================================================================

std::optional<std::string>
Dictionary::normalize_checked(std::string_view word) const {
  std::string normalized = normalize_word(word, language_);
  if (normalized.empty() || char_count(normalized) < config_.min_word_length ||
      !has_letter(normalized) || !is_storable(normalized)) {
    return std::nullopt;
  }
  return normalized;
}

DictStatus Dictionary::add_word(std::string_view word) {
  auto normalized = normalize_checked(word);
  if (!normalized) {
    return DictStatus::failure(DictError::InvalidWord,
                               "Invalid word: '" + std::string{word} + "'");
  }

  std::unique_lock lock(mu_);
  bloom_->add(*normalized);
  words_.insert(*normalized);
  user_words_.insert(*normalized);
  const bool was_ignored = ignored_.erase(*normalized) > 0;

  DictStatus status = persist_user_words_locked();
  if (status.ok() && was_ignored) {
    status = persist_ignored_locked();
  }
  return status;
}

DictStatus Dictionary::remove_word(std::string_view word) {
  auto normalized = normalize_checked(word);
  if (!normalized) {
    return DictStatus::failure(DictError::InvalidWord,
                               "Invalid word: '" + std::string{word} + "'");
  }

  std::unique_lock lock(mu_);
  words_.erase(*normalized);
  if (user_words_.erase(*normalized) > 0) {
    return persist_user_words_locked();
  }
  return DictStatus::success();
}

DictStatus Dictionary::ignore_word(std::string_view word) {
  auto normalized = normalize_checked(word);
  if (!normalized) {
    return DictStatus::failure(DictError::InvalidWord,
                               "Invalid word: '" + std::string{word} + "'");
  }

  std::unique_lock lock(mu_);
  ignored_.insert(std::move(*normalized));
  return persist_ignored_locked();
}

DictStatus Dictionary::clear_ignored() {
  std::unique_lock lock(mu_);
  ignored_.clear();
  return persist_ignored_locked();
}

DictStatus Dictionary::import_from_file(const std::filesystem::path &path) {
  const WordListFormat format = format_for_path(path);
  if (format != WordListFormat::Csv && format != WordListFormat::Text) {
    return DictStatus::failure(DictError::UnsupportedFormat,
                               "Unsupported import format: " + path.string());
  }

  const WordListOptions opts{language_, config_.min_word_length,
                             config_.load_threads};
  WordListOutcome out = read_word_list(path, opts);
  if (out.status.fatal()) {
    return out.status;
  }

  std::unique_lock lock(mu_);
  for (auto &w : out.words) {
    bloom_->add(w);
    words_.insert(w);
    user_words_.insert(std::move(w));
  }
  std::cerr << kLogPrefix << "Imported " << out.words.size() << " words into "
            << language_.name() << " from " << path.string() << "\n";
  return persist_user_words_locked();
}

DictStatus Dictionary::export_to_file(const std::filesystem::path &path) const {
  const WordListFormat format = format_for_path(path);
  if (format != WordListFormat::Csv && format != WordListFormat::Text) {
    return DictStatus::failure(DictError::UnsupportedFormat,
                               "Unsupported export format: " + path.string());
  }
  return write_word_list(path, sorted_words());
}

DictStatus Dictionary::persist_user_words_locked() const {
  DictStatus status = write_word_list(user_words_path(), sorted(user_words_));
  if (!status.ok()) {
    std::cerr << kLogPrefix << "Warning: failed to save user words: "
              << status.error << "\n";
  }
  return status;
}

DictStatus Dictionary::persist_ignored_locked() const {
  DictStatus status = write_word_list(ignored_words_path(), sorted(ignored_));
  if (!status.ok()) {
    std::cerr << kLogPrefix << "Warning: failed to save ignored words: "
              << status.error << "\n";
  }
  return status;
}

// ===========================================================================
// Доступ к словам
// ===========================================================================

std::size_t Dictionary::word_count() const {
  std::shared_lock lock(mu_);
  return words_.size();
}

std::vector<std::string> Dictionary::sorted_words() const {
  std::shared_lock lock(mu_);
  return sorted(words_);
}

std::vector<std::string> Dictionary::user_words() const {
  std::shared_lock lock(mu_);
  return sorted(user_words_);
}

std::vector<std::string> Dictionary::ignored_words() const {
  std::shared_lock lock(mu_);
  return sorted(ignored_);
}

void Dictionary::for_each_word(
    const std::function<void(const std::string &)> &fn) const {
  std::shared_lock lock(mu_);
  for (const auto &w : words_) {
    fn(w);
  }
}

std::filesystem::path Dictionary::user_words_path() const {
  return config_.user_data_dir / kUserDictionariesDir /
         (std::string{language_.code()} + "_user.txt");
}

std::filesystem::path Dictionary::ignored_words_path() const {
  return config_.user_data_dir / kUserDictionariesDir /
         (std::string{language_.code()} + "_ignored.txt");
}

} // namespace atomspell
