/**
 * @file unicode_text.hpp
 * @brief UTF-8 утилиты: декодирование, регистр, CJK, перекодировка
 *
 * Чистые функции над UTF-8 строками. Классификация символов и смена
 * регистра выполняются через ICU, чтобы работать с любыми письменностями.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace atomspell {

// ===========================================================================
// Базовые UTF-8 утилиты
// ===========================================================================

/**
 * @brief Декодирует UTF-8 в последовательность кодовых точек
 *
 * Невалидные байты заменяются на U+FFFD.
 */
[[nodiscard]] std::u32string decode_utf8(std::string_view text);

/**
 * @brief Кодирует кодовые точки обратно в UTF-8
 */
[[nodiscard]] std::string encode_utf8(std::u32string_view code_points);

/**
 * @brief Количество символов (кодовых точек) в UTF-8 строке
 */
[[nodiscard]] std::size_t char_count(std::string_view text);

/**
 * @brief Проверяет корректность UTF-8
 */
[[nodiscard]] bool is_valid_utf8(std::string_view bytes);

/**
 * @brief Удаляет пробельные символы ASCII с начала и конца строки
 */
[[nodiscard]] std::string_view trim(std::string_view sv);

// ===========================================================================
// Регистр
// ===========================================================================

/**
 * @brief Переводит строку в нижний регистр (корневая локаль ICU)
 */
[[nodiscard]] std::string to_lower(std::string_view text);

/**
 * @brief Переводит строку в верхний регистр (корневая локаль ICU)
 */
[[nodiscard]] std::string to_upper(std::string_view text);

/**
 * @brief Делает первую букву заглавной, остальное не трогает
 */
[[nodiscard]] std::string capitalize(std::string_view text);

/**
 * @brief Переводит в нижний регистр только первый символ ("Teh" -> "teh")
 */
[[nodiscard]] std::string lower_first(std::string_view text);

// ===========================================================================
// CJK
// ===========================================================================

/**
 * @brief Проверяет, относится ли кодовая точка к Han/Hiragana/Katakana/Hangul
 */
[[nodiscard]] constexpr bool is_cjk_code_point(char32_t c) noexcept {
  return (c >= 0x4E00 && c <= 0x9FFF) || // CJK Unified Ideographs
         (c >= 0x3040 && c <= 0x309F) || // Hiragana
         (c >= 0x30A0 && c <= 0x30FF) || // Katakana
         (c >= 0xAC00 && c <= 0xD7AF);   // Hangul Syllables
}

/**
 * @brief Проверяет, содержит ли текст хотя бы один CJK символ
 */
[[nodiscard]] bool is_cjk_text(std::string_view text);

// ===========================================================================
// Перекодировка
// ===========================================================================

/// Результат приведения байтов к UTF-8
struct DecodedText {
  std::string text;
  std::string charset; ///< "UTF-8" или имя определённой кодировки
  bool reencoded = false;
};

/**
 * @brief Приводит произвольные байты к UTF-8
 *
 * Валидный UTF-8 возвращается как есть. Иначе кодировка определяется
 * детектором ICU, с запасным вариантом windows-1252.
 *
 * @return std::nullopt если перекодировать не удалось
 */
[[nodiscard]] std::optional<DecodedText> decode_to_utf8(std::string_view bytes);

} // namespace atomspell
