/**
 * @file suggestion_generator.hpp
 * @brief Варианты исправления для слов с ошибкой
 *
 * Кандидаты берутся из словаря активного языка (и из Hunspell, если он
 * открыт), ранжируются по расстоянию Дамерау-Левенштейна и получают
 * регистр исходного слова.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "atomspell/dictionary.hpp"

namespace atomspell {

// ===========================================================================
// Паттерны регистра
// ===========================================================================

/// Паттерн регистра в слове
enum class CasePattern {
  AllLower,  ///< все строчные (quick)
  AllUpper,  ///< ВСЕ ЗАГЛАВНЫЕ (QUICK)
  TitleCase, ///< Первая заглавная, остальные строчные (Quick)
  Mixed      ///< Смешанный регистр (qUick) — не переносим
};

/**
 * @brief Определяет паттерн регистра в слове
 *
 * Учитываются только буквы, у которых есть регистр. Слово без таких букв
 * (CJK, цифры) — AllLower.
 */
[[nodiscard]] CasePattern detect_case_pattern(std::string_view word);

/**
 * @brief Применяет паттерн регистра к слову в нижнем регистре
 *
 * AllUpper -> to_upper, TitleCase -> capitalize, остальное без изменений.
 */
[[nodiscard]] std::string apply_case_pattern(std::string_view word,
                                             CasePattern pattern);

// ===========================================================================
// Расстояние редактирования
// ===========================================================================

/**
 * @brief Вычисляет расстояние Дамерау-Левенштейна между двумя строками
 *
 * Учитывает вставку, удаление, замену и перестановку соседних символов.
 * Работает по кодовым точкам.
 */
[[nodiscard]] std::size_t damerau_levenshtein_distance(std::u32string_view s1,
                                                       std::u32string_view s2);

/// То же для UTF-8 строк
[[nodiscard]] std::size_t damerau_levenshtein_distance(std::string_view s1,
                                                       std::string_view s2);

// ===========================================================================
// Генерация вариантов
// ===========================================================================

/// Ограничения генерации
struct SuggestionOptions {
  std::size_t max_suggestions = 5;
  std::size_t max_edit_distance = 2;
};

/// Кандидат с ключами ранжирования
struct SuggestionCandidate {
  std::string word;          ///< Нормализованная форма
  std::size_t distance = 0;  ///< До нормализованного токена
  std::size_t length_diff = 0;
};

/**
 * @brief Упорядочивает кандидатов
 *
 * По расстоянию, затем по близости длины, затем лексикографически.
 */
void rank_candidates(std::vector<SuggestionCandidate> &candidates);

/**
 * @brief Генерирует варианты исправления
 *
 * @param dictionary Словарь активного языка
 * @param original Исходный текст токена (с исходным регистром)
 * @return До max_suggestions вариантов, самый вероятный первым. Пустой
 *         список — допустимый результат.
 */
[[nodiscard]] std::vector<std::string>
generate_suggestions(const Dictionary &dictionary, std::string_view original,
                     const SuggestionOptions &options);

} // namespace atomspell
