/**
 * @file confidence_scorer.hpp
 * @brief Уверенность в том, что ненайденное слово — настоящая опечатка
 */

#pragma once

#include <string_view>

#include "atomspell/types.hpp"

namespace atomspell {

/// Базовая уверенность для ненайденного слова
inline constexpr double kBaseConfidence = 0.5;

/**
 * @brief Множитель уверенности для категории
 *
 * Код и аббревиатуры чаще оказываются допустимым "шумом", чем опечаткой.
 */
[[nodiscard]] constexpr double category_weight(WordCategory category) noexcept {
  switch (category) {
  case WordCategory::Normal:
    return 1.2;
  case WordCategory::CodeIdentifier:
    return 0.3;
  case WordCategory::Acronym:
    return 0.4;
  case WordCategory::ProperNoun:
    return 0.6;
  case WordCategory::TechnicalTerm:
    return 0.8;
  }
  return 1.0;
}

/**
 * @brief Содержит ли слово типичный для опечаток фрагмент
 *
 * "ie", "ei", "tion", "sion", "able", "ible", "ment", "ness", "ough"
 * (без учёта регистра).
 */
[[nodiscard]] bool has_common_typo_pattern(std::string_view word);

/**
 * @brief Вычисляет уверенность (0..1)
 *
 * Для правильного слова — 1.0. Иначе 0.5 с множителями: категория,
 * длина (<3 символов ×0.3, >20 ×0.7), '_' или '-' ×1.1, типичный
 * фрагмент опечатки ×1.3. Результат ограничен [0, 1].
 *
 * @param word Исходный текст токена
 * @param category Категория токена
 * @param is_correct Результат проверки по словарю
 */
[[nodiscard]] double score_confidence(std::string_view word,
                                      WordCategory category, bool is_correct);

} // namespace atomspell
