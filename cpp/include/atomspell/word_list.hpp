/**
 * @file word_list.hpp
 * @brief Чтение и запись файлов со списками слов (CSV, TXT, Hunspell .dic)
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "atomspell/language.hpp"
#include "atomspell/types.hpp"

namespace atomspell {

/// Формат файла со словами
enum class WordListFormat {
  Csv,      ///< Первая колонка — слово, строка-заголовок "word" пропускается
  Text,     ///< Одно слово в строке, '#' — комментарий
  Hunspell, ///< .dic: первая строка — число слов, далее "слово/флаги"
  Unknown
};

/// Определяет формат по расширению (без учёта регистра)
[[nodiscard]] WordListFormat format_for_path(const std::filesystem::path &path);

/// Результат чтения списка слов
struct WordListOutcome {
  std::vector<std::string> words; ///< Нормализованные слова в порядке файла
  DictStatus status;
  std::string charset; ///< Кодировка исходного файла
};

/// Параметры разбора списка
struct WordListOptions {
  Language language{LanguageId::English};
  std::size_t min_word_length = 2;

  /// Потоки для больших файлов (0 = hardware_concurrency, 1 = без пула)
  std::size_t threads = 0;
};

/// Файлы длиннее стольких строк разбираются параллельно
inline constexpr std::size_t kParallelParseLines = 4096;

/**
 * @brief Извлекает первое поле CSV строки
 *
 * Поддерживает поле в кавычках с удвоенными кавычками внутри.
 */
[[nodiscard]] std::string csv_first_field(std::string_view line);

/**
 * @brief Экранирует слово для записи в CSV
 */
[[nodiscard]] std::string csv_escape(std::string_view word);

/**
 * @brief Разбирает содержимое файла (уже в UTF-8) в нормализованные слова
 *
 * Пустые, слишком короткие и некорректные записи пропускаются.
 */
[[nodiscard]] std::vector<std::string>
parse_word_list(std::string_view content, WordListFormat format,
                const WordListOptions &options);

/**
 * @brief Читает файл со словами
 *
 * Не-UTF-8 содержимое перекодируется (см. decode_to_utf8); если это не
 * удалось — InvalidEncoding. Отсутствующий файл — Io, неизвестное
 * расширение — UnsupportedFormat.
 */
[[nodiscard]] WordListOutcome
read_word_list(const std::filesystem::path &path,
               const WordListOptions &options);

/**
 * @brief Записывает слова в файл атомарно (временный файл + rename)
 *
 * Формат выбирается по расширению; для Hunspell и Unknown —
 * UnsupportedFormat. Родительский каталог создаётся при необходимости.
 */
[[nodiscard]] DictStatus write_word_list(const std::filesystem::path &path,
                                         const std::vector<std::string> &words);

} // namespace atomspell
