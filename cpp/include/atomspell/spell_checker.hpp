/**
 * @file spell_checker.hpp
 * @brief Фасад проверки орфографии
 *
 * Владеет активным языком, списками сессии и ссылками на разделяемые
 * кеш словарей и кеш проверок. Оба кеша можно передать снаружи, чтобы
 * несколько проверяющих (или тесты) делили одно состояние.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string_view>

#include "atomspell/analysis.hpp"
#include "atomspell/config.hpp"
#include "atomspell/correctness_cache.hpp"
#include "atomspell/dictionary_manager.hpp"
#include "atomspell/document_analyzer.hpp"
#include "atomspell/language.hpp"
#include "atomspell/types.hpp"

namespace atomspell {

class SpellChecker {
public:
  /**
   * @param manager Кеш словарей (nullptr — создать свой по config)
   * @param cache Кеш проверок (nullptr — создать свой)
   */
  explicit SpellChecker(Config config,
                        std::shared_ptr<DictionaryManager> manager = nullptr,
                        std::shared_ptr<CorrectnessCache> cache = nullptr);

  SpellChecker(const SpellChecker &) = delete;
  SpellChecker &operator=(const SpellChecker &) = delete;

  // =========================================================================
  // Язык
  // =========================================================================

  /**
   * @brief Меняет активный язык
   *
   * Словарь нового языка загружается сразу. При фатальной ошибке загрузки
   * активный язык не меняется и возвращается её статус.
   * Кеш проверок очищается до того, как любая следующая проверка увидит
   * новый язык. Кеш словарей не трогается.
   */
  [[nodiscard]] DictStatus set_language(const Language &language);

  [[nodiscard]] Language language() const;

  // =========================================================================
  // Проверка
  // =========================================================================

  /**
   * @brief Проверяет текст с явными настройками
   *
   * AutoDetect разрешается по тексту. Никогда не завершается ошибкой:
   * без словаря возвращает нулевые итоги и точность 100.
   */
  [[nodiscard]] DocumentAnalysis
  analyze(std::string_view text, const Language &language,
          std::optional<std::string_view> filename,
          const CheckerConfig &options);

  /// Проверяет текст на активном языке с настройками из конфига
  [[nodiscard]] DocumentAnalysis
  check_document(std::string_view text,
                 std::optional<std::string_view> filename = std::nullopt);

  /**
   * @brief Проверяет одно слово на активном языке
   * @return true если слово верно (или пропускается)
   */
  [[nodiscard]] bool is_correct(std::string_view word);

  // =========================================================================
  // Изменение словарей
  // =========================================================================

  [[nodiscard]] DictStatus add_word(std::string_view word,
                                    const Language &language);
  [[nodiscard]] DictStatus remove_word(std::string_view word,
                                       const Language &language);
  [[nodiscard]] DictStatus ignore_word(std::string_view word,
                                       const Language &language);
  [[nodiscard]] DictStatus clear_ignored(const Language &language);
  [[nodiscard]] DictStatus
  import_dictionary(const std::filesystem::path &path,
                    const Language &language);
  [[nodiscard]] DictStatus
  export_dictionary(const Language &language,
                    const std::filesystem::path &path);

  /// Перезагружает словарь языка и очищает кеш проверок
  [[nodiscard]] DictStatus reload_dictionary(const Language &language);

  /// Число слов в словаре языка (0, если словаря нет)
  [[nodiscard]] std::size_t word_count(const Language &language);

  // =========================================================================
  // Списки сессии
  // =========================================================================

  /// Игнорировать слово до конца сессии (без сохранения)
  void ignore_for_session(std::string_view word);
  void add_proper_noun(std::string_view word);
  void add_acronym(std::string_view word);

  [[nodiscard]] const Config &config() const noexcept { return config_; }
  [[nodiscard]] const std::shared_ptr<DictionaryManager> &manager() const {
    return manager_;
  }
  [[nodiscard]] const std::shared_ptr<CorrectnessCache> &cache() const {
    return cache_;
  }

private:
  /// AutoDetect -> язык по тексту
  [[nodiscard]] static Language resolve_language(const Language &language,
                                                 std::string_view text);

  /// Словарь языка для изменения; ошибка загрузки — в status
  [[nodiscard]] std::shared_ptr<Dictionary>
  dictionary_for(const Language &language, DictStatus &status);

  Config config_;
  std::shared_ptr<DictionaryManager> manager_;
  std::shared_ptr<CorrectnessCache> cache_;

  // Язык и списки сессии. Проверка держит разделяемую блокировку,
  // смена языка и изменения — эксклюзивную.
  mutable std::shared_mutex state_mu_;
  Language language_;
  SessionWordLists lists_;
};

} // namespace atomspell
