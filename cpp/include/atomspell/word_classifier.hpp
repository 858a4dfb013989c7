/**
 * @file word_classifier.hpp
 * @brief Семантическая категория токена и эвристики формы слова
 *
 * Классификация — упорядоченная таблица правил: первое сработавшее правило
 * определяет категорию. Порядок важен: короткая аббревиатура в верхнем
 * регистре не должна стать именем собственным, хотя и начинается с
 * заглавной буквы.
 */

#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string_view>

#include "atomspell/types.hpp"

namespace atomspell {

/// Признаки токена, вычисляемые один раз перед проверкой правил
struct TokenTraits {
  std::string_view text;
  std::size_t length = 0;      ///< В кодовых точках
  bool first_upper = false;    ///< Первый символ — заглавная буква
  bool all_caps_like = false;  ///< Только заглавные, цифры и '_'
  bool has_upper = false;
  bool has_lower = false;
  bool has_underscore = false;
  bool has_hyphen = false;
};

/// Вычисляет признаки токена (ICU свойства символов)
[[nodiscard]] TokenTraits analyze_token(std::string_view token);

/// Правило классификации
struct ClassifierRule {
  WordCategory category;
  std::string_view name;
  bool (*matches)(const TokenTraits &traits, bool is_code_context);
};

/**
 * @brief Правила в порядке приоритета
 *
 * Acronym, ProperNoun, CodeIdentifier (только в коде), TechnicalTerm.
 * Если ни одно не сработало — Normal.
 */
[[nodiscard]] std::span<const ClassifierRule> classifier_rules() noexcept;

/**
 * @brief Определяет категорию токена
 * @param token Исходный текст токена (с исходным регистром)
 * @param is_code_context Документ распознан как исходный код
 */
[[nodiscard]] WordCategory classify(std::string_view token,
                                    bool is_code_context);

/// Слова, которые пишутся с заглавной, но не являются именами собственными
[[nodiscard]] bool is_common_capitalized(std::string_view token) noexcept;

// ===========================================================================
// Эвристики формы слова
// ===========================================================================

/**
 * @brief Форма идентификатора из кода, независимо от классификатора
 *
 * '_' не по краям, смешанный регистр (не сплошь заглавные), префиксы
 * get_/set_/is_/has_ или суффиксы _t/_ptr/Handler/Service/Manager/Factory.
 */
[[nodiscard]] bool looks_like_code_identifier(std::string_view word);

/**
 * @brief Слово с цифрами и меньше чем тремя буквами ("v2", "x86", "1st")
 */
[[nodiscard]] bool is_numeric_heavy(std::string_view word);

/**
 * @brief Идентификатор, который не нужно проверять
 *
 * Не длиннее 3 символов, число, hex-литерал, dunder ("__init__") или
 * аксессор/тип по соглашению (get_x, is_ready, size_t, node_ptr).
 */
[[nodiscard]] bool is_skippable_code_identifier(std::string_view word);

/**
 * @brief Правдоподобное имя собственное или аббревиатура
 *
 * Доля букв больше 0.7, нет серий одного символа длиннее 4, и слово
 * не длиннее 4 символов либо содержит гласную.
 */
[[nodiscard]] bool looks_reasonable(std::string_view word);

/// Есть ли серия одинаковых символов длиннее max_repeats
[[nodiscard]] bool has_repeated_characters(std::string_view word,
                                           std::size_t max_repeats);

/// Есть ли латинская гласная (включая y)
[[nodiscard]] bool has_vowels(std::string_view word) noexcept;

/// Встроенный список распространённых аббревиатур (в нижнем регистре)
[[nodiscard]] std::span<const std::string_view> default_acronyms() noexcept;

} // namespace atomspell
