/**
 * @file dictionary.hpp
 * @brief Словарь одного языка: базовый список, пользовательские и
 *        игнорируемые слова
 *
 * Все хранимые слова нормализованы (нижний регистр для алфавитных
 * письменностей, как есть для CJK), поэтому поиск не нормализует
 * хранимые данные повторно.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#ifdef HAVE_HUNSPELL
#include <hunspell/hunspell.hxx>
#endif

#include "atomspell/bloom_filter.hpp"
#include "atomspell/config.hpp"
#include "atomspell/language.hpp"
#include "atomspell/types.hpp"

namespace atomspell {

/**
 * @brief Каталоги поиска базовых словарей
 *
 * config.search_dirs, если задан, иначе: dictionary/, src/dictionary/,
 * <user_data_dir>/dictionaries/, /usr/share/atomspell/dictionaries/, "."
 */
[[nodiscard]] std::vector<std::filesystem::path>
dictionary_search_dirs(const DictionaryConfig &config);

/// Пара файлов Hunspell (.aff + .dic)
struct HunspellFiles {
  std::filesystem::path aff;
  std::filesystem::path dic;
};

/**
 * @brief Ищет .aff/.dic для локали языка в config.hunspell_dirs
 */
[[nodiscard]] std::optional<HunspellFiles>
find_hunspell_files(const DictionaryConfig &config, const Language &language);

/**
 * @brief Словарь одного языка
 *
 * Базовый набор слов только читается после загрузки. Изменения
 * (add/ignore/clear/import) выполняются под эксклюзивной блокировкой и
 * сохраняются в пользовательские файлы языка.
 */
class Dictionary {
public:
  Dictionary(Language language, DictionaryConfig config);
  ~Dictionary();

  Dictionary(const Dictionary &) = delete;
  Dictionary &operator=(const Dictionary &) = delete;

  /**
   * @brief Загружает базовый список, затем пользовательские файлы
   *
   * Порядок поиска: dictionary(<code>).csv, dictionary(<code>).txt во всех
   * каталогах поиска, системный Hunspell .dic, затем те же шаги для языка
   * по умолчанию. Повторный вызов после успешной загрузки ничего не делает.
   *
   * @return Ok, EmptyDictionary (не фатально) или DictionaryNotFound
   */
  [[nodiscard]] DictStatus load();

  /**
   * @brief Загружает базовый список из явно указанного файла
   *
   * Используется для пользовательских словарей. Заменяет уже загруженный
   * базовый список.
   */
  [[nodiscard]] DictStatus load_from_file(const std::filesystem::path &path);

  [[nodiscard]] bool is_loaded() const;

  [[nodiscard]] const Language &language() const noexcept { return language_; }

  /// Язык, чей базовый список реально загружен (отличается при фолбэке)
  [[nodiscard]] Language source_language() const;

  /// Файл, из которого загружен базовый список
  [[nodiscard]] std::optional<std::filesystem::path> source_path() const;

  [[nodiscard]] std::size_t min_word_length() const noexcept {
    return config_.min_word_length;
  }

  // =========================================================================
  // Поиск
  // =========================================================================

  /**
   * @brief Проверяет слово
   *
   * Всегда true ("пропустить") для пустых и коротких слов, игнорируемых
   * слов, слов из цифр (не CJK) и, в контексте кода, слов формы
   * идентификатора. Иначе — членство в нормализованном наборе.
   * С учётом регистра слово должно совпадать с нормализованной формой
   * или с её вариантом с заглавной первой буквой.
   */
  [[nodiscard]] bool contains(std::string_view word, bool case_sensitive,
                              bool is_code_context) const;

  /// Членство нормализованного слова в наборе (без правил пропуска)
  [[nodiscard]] bool has_word(std::string_view normalized) const;

  [[nodiscard]] bool is_ignored(std::string_view word) const;
  [[nodiscard]] bool is_user_word(std::string_view word) const;

  // =========================================================================
  // Изменение
  // =========================================================================

  /**
   * @brief Добавляет слово в пользовательский словарь
   *
   * Снимает слово с игнорирования. Ошибка сохранения возвращается как Io,
   * но слово остаётся добавленным на текущую сессию.
   *
   * @return InvalidWord для пустого или короткого слова (без изменений)
   */
  [[nodiscard]] DictStatus add_word(std::string_view word);

  /// Удаляет слово из набора и пользовательского словаря
  [[nodiscard]] DictStatus remove_word(std::string_view word);

  /// Добавляет слово в список игнорируемых
  [[nodiscard]] DictStatus ignore_word(std::string_view word);

  /// Очищает список игнорируемых
  [[nodiscard]] DictStatus clear_ignored();

  /**
   * @brief Добавляет слова из файла .csv/.txt в пользовательский словарь
   * @return UnsupportedFormat для другого расширения
   */
  [[nodiscard]] DictStatus import_from_file(const std::filesystem::path &path);

  /**
   * @brief Выгружает все слова (отсортированные) в файл .csv/.txt
   */
  [[nodiscard]] DictStatus
  export_to_file(const std::filesystem::path &path) const;

  // =========================================================================
  // Доступ к словам
  // =========================================================================

  [[nodiscard]] std::size_t word_count() const;

  /// Все слова в лексикографическом порядке
  [[nodiscard]] std::vector<std::string> sorted_words() const;

  /// Слова, добавленные пользователем, в лексикографическом порядке
  [[nodiscard]] std::vector<std::string> user_words() const;

  [[nodiscard]] std::vector<std::string> ignored_words() const;

  /// Обходит все слова под разделяемой блокировкой
  void for_each_word(const std::function<void(const std::string &)> &fn) const;

  [[nodiscard]] std::filesystem::path user_words_path() const;
  [[nodiscard]] std::filesystem::path ignored_words_path() const;

  // =========================================================================
  // Hunspell
  // =========================================================================

  [[nodiscard]] bool is_hunspell_available() const noexcept {
    return hunspell_available_.load(std::memory_order_acquire);
  }

  /**
   * @brief Варианты исправления от Hunspell
   * @return Пустой список, если Hunspell не доступен
   */
  [[nodiscard]] std::vector<std::string>
  hunspell_suggest(const std::string &word) const;

private:
  /// Загружает список для языка: csv, txt, затем .dic
  [[nodiscard]] DictStatus load_base_for(const Language &lang);

  /// Вставляет слова базового списка (под эксклюзивной блокировкой)
  void install_base(std::vector<std::string> words, const Language &from,
                    std::filesystem::path path);

  /// Подмешивает пользовательские и игнорируемые слова с диска
  void merge_user_files();

  /// Открывает Hunspell для локали языка (если собран с HAVE_HUNSPELL)
  void open_hunspell();

  [[nodiscard]] bool check_hunspell(const std::string &word) const;

  [[nodiscard]] std::optional<std::string>
  normalize_checked(std::string_view word) const;

  // Вызываются под эксклюзивной блокировкой mu_
  [[nodiscard]] DictStatus persist_user_words_locked() const;
  [[nodiscard]] DictStatus persist_ignored_locked() const;

  [[nodiscard]] DictStatus finish_load(DictStatus status);

  Language language_;
  DictionaryConfig config_;

  mutable std::shared_mutex mu_;
  std::mutex load_mu_;

  std::unordered_set<std::string> words_;
  std::unordered_set<std::string> user_words_;
  std::unordered_set<std::string> ignored_;
  std::unique_ptr<BloomFilter> bloom_;

  bool loaded_ = false;
  DictStatus load_status_;
  Language source_language_;
  std::optional<std::filesystem::path> source_path_;

#ifdef HAVE_HUNSPELL
  // Hunspell для проверки словоформ и вариантов исправления
  std::unique_ptr<Hunspell> hunspell_;
  mutable std::mutex hunspell_mu_;
#endif
  std::atomic<bool> hunspell_available_{false};
};

} // namespace atomspell
