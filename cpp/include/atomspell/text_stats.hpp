/**
 * @file text_stats.hpp
 * @brief Статистика текста: частоты слов, время чтения, точность,
 *        построение списка слов из корпуса
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "atomspell/language.hpp"

namespace atomspell {

/// Скорость чтения (слов в минуту)
inline constexpr std::size_t kReadingWordsPerMinute = 200;

/**
 * @brief Процент верных слов, округлённый до целого
 * @return 100.0 при total == 0
 */
[[nodiscard]] double calculate_accuracy(std::size_t correct, std::size_t total);

/**
 * @brief Слова текста в нижнем регистре (CJK — как есть)
 *
 * В режиме кода отбрасываются константы, числа, hex-литералы, имена с
 * '_', CamelCase и служебные сокращения (var, fn, ptr, self...).
 */
[[nodiscard]] std::vector<std::string>
extract_words(std::string_view text, const Language &language, bool is_code);

/// Частоты слов (см. extract_words)
[[nodiscard]] std::unordered_map<std::string, std::size_t>
word_frequency(std::string_view text, const Language &language, bool is_code);

/**
 * @brief n самых частых слов: по убыванию частоты, затем по алфавиту
 */
[[nodiscard]] std::vector<std::pair<std::string, std::size_t>>
most_common_words(const std::unordered_map<std::string, std::size_t> &freq,
                  std::size_t n);

/// Время чтения
struct ReadingTime {
  std::size_t minutes = 0;
  std::size_t seconds = 0;
};

/// Время чтения при 200 словах в минуту
[[nodiscard]] ReadingTime reading_time(std::string_view text);

/**
 * @brief Очищает слово: оставляет буквы и цифры, а апострофы и дефисы
 *        только между буквами
 */
[[nodiscard]] std::string sanitize_word(std::string_view word);

/**
 * @brief Непустое слово длиной от 2 байт с хотя бы одной буквой
 */
[[nodiscard]] bool is_valid_word(std::string_view word);

/**
 * @brief Строит отсортированный список различных слов корпуса
 *
 * Результат можно записать write_word_list() как словарь языка.
 */
[[nodiscard]] std::vector<std::string>
build_word_list(std::string_view text, const Language &language,
                std::size_t min_length);

} // namespace atomspell
