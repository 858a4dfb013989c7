/**
 * @file config.hpp
 * @brief Конфигурация AtomSpell
 *
 * Типобезопасная конфигурация с YAML парсингом.
 * Все значения имеют разумные дефолты.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "atomspell/language.hpp"
#include "atomspell/types.hpp"

namespace atomspell {

// ===========================================================================
// Структура конфигурации
// ===========================================================================

/**
 * @brief Каталог пользовательских данных по умолчанию
 *
 * $XDG_DATA_HOME/atomspell, иначе $HOME/.local/share/atomspell,
 * иначе ./.atomspell
 */
[[nodiscard]] std::filesystem::path default_user_data_dir();

/// Настройки проверки отдельных слов
struct CheckerConfig {
  /// Генерировать ли варианты исправления
  bool suggestions_enabled = true;

  /// Учитывать ли регистр при поиске в словаре
  bool case_sensitive = false;

  /// Максимум вариантов исправления на слово
  std::size_t max_suggestions = 5;

  /// Слово считается ошибкой только при уверенности не ниже порога
  double confidence_threshold = 0.7;

  /// Максимальное расстояние Дамерау-Левенштейна для кандидатов
  std::size_t max_edit_distance = 2;
};

/// Настройки загрузки словарей
struct DictionaryConfig {
  /// Язык, к которому откатывается загрузка при отсутствии словаря
  Language default_language{LanguageId::English};

  /// Слова короче (в символах) не добавляются и не проверяются
  std::size_t min_word_length = 2;

  /// Каталог user_dictionaries/ и dictionaries/
  std::filesystem::path user_data_dir = default_user_data_dir();

  /// Каталоги поиска базовых словарей. Пусто — встроенный список
  std::vector<std::filesystem::path> search_dirs;

  /// Использовать ли системные словари Hunspell
  bool system_dictionaries = true;

  /// Каталоги поиска .aff/.dic
  std::vector<std::filesystem::path> hunspell_dirs{"/usr/share/hunspell",
                                                   "/usr/share/myspell"};

  /// Потоки разбора больших словарей (0 = hardware_concurrency)
  std::size_t load_threads = 0;
};

/// Настройки анализа документа
struct AnalyzerConfig {
  /// Потоки параллельного анализа (0 = hardware_concurrency)
  std::size_t worker_threads = 0;

  /// Документы от стольких строк анализируются параллельно
  std::size_t parallel_min_lines = 512;

  /// Дополнительные аббревиатуры к встроенному списку
  std::vector<std::string> acronyms;

  /// Известные имена собственные
  std::vector<std::string> proper_nouns;
};

/// Полная конфигурация
struct Config {
  CheckerConfig checker;
  DictionaryConfig dictionary;
  AnalyzerConfig analyzer;
  std::filesystem::path config_path{std::string{kConfigPath}};
};

// ===========================================================================
// Загрузчик конфигурации
// ===========================================================================

/// Результат загрузки конфигурации из файла.
///
/// В отличие от `load_config()`, это API НЕ делает скрытых фолбэков и
/// позволяет вызывающему коду принять решение (fail-fast / fallback /
/// UI-ошибка).
struct ConfigLoadOutcome {
  Config config;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
};

/**
 * @brief Разбирает конфигурацию из потока (без валидации)
 */
[[nodiscard]] Config parse_config_stream(std::istream &in);

/**
 * @brief Загружает конфигурацию из конкретного файла
 *
 * @param path Абсолютный или относительный путь к конфигу
 * @return ConfigLoadOutcome с кодом результата и сообщением ошибки
 */
[[nodiscard]] ConfigLoadOutcome load_config_checked(std::filesystem::path path);

/**
 * @brief Загружает конфигурацию из YAML файла (best-effort)
 *
 * Для пути по умолчанию сначала пробует ~/.config/atomspell/config.yaml.
 * При ошибках чтения/валидации возвращает дефолты.
 */
[[nodiscard]] Config load_config(std::string_view path = kConfigPath);

/**
 * @brief Разбирает список через запятую ("a, b ,c" -> {a, b, c})
 */
[[nodiscard]] std::vector<std::string> parse_list(std::string_view value);

/**
 * @brief Валидирует конфигурацию
 *
 * @param config Конфигурация для проверки
 * @param[out] reason Описание первой найденной ошибки (если не nullptr)
 * @return true если все значения в допустимых пределах
 */
[[nodiscard]] bool validate_config(const Config &config,
                                   std::string *reason = nullptr);

} // namespace atomspell
