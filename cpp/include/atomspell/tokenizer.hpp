/**
 * @file tokenizer.hpp
 * @brief Разбиение текста на строки и слова-кандидаты
 *
 * Шаблон слова выбирается один раз на документ: CJK, исходный код или
 * обычный текст. Поиск идёт регулярными выражениями ICU поверх UTF-8 UText,
 * поэтому смещения токенов — байтовые смещения внутри строки.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <unicode/regex.h>
#include <unicode/utext.h>

#include "atomspell/language.hpp"

namespace atomspell {

/// Шаблон поиска слов
enum class TokenPattern : std::uint8_t {
  Prose, ///< Буквы Unicode с апострофами/дефисами внутри
  Cjk,   ///< Серии Han/Hiragana/Katakana/Hangul или латинские слова
  Code   ///< Латинские слова от 3 букв (идентификаторы с '_')
};

/// Слово-кандидат внутри строки
struct Token {
  std::string text;
  std::size_t start = 0; ///< Байтовое смещение начала (0-based)
  std::size_t end = 0;   ///< Байтовое смещение конца (не включая)
};

/// Контекст токенизации документа
struct TokenContext {
  TokenPattern pattern = TokenPattern::Prose;
  bool code_context = false; ///< Документ похож на исходный код
};

/**
 * @brief Проверяет расширение файла на принадлежность исходному коду
 *
 * Сравнение без учёта регистра ("main.RS" — код). Файл без расширения
 * кодом не считается.
 */
[[nodiscard]] bool is_code_file(std::string_view filename);

/**
 * @brief Эвристика "текст похож на код"
 *
 * Среди первых десяти строк нужно минимум две с признаками кода: скобки,
 * ';' вне комментария, "->", "=>", ключевые слова (fn, def, class, import...).
 */
[[nodiscard]] bool is_likely_code(std::string_view text);

/**
 * @brief Выбирает шаблон для документа
 *
 * CJK язык всегда даёт TokenPattern::Cjk. Иначе Code, если имя файла
 * указывает на код или текст похож на код, и Prose в остальных случаях.
 */
[[nodiscard]] TokenContext
select_token_context(const Language &language,
                     std::optional<std::string_view> filename,
                     std::string_view text);

/**
 * @brief Разбивает текст на строки по '\n', удаляя завершающий '\r'
 *
 * Завершающий перевод строки не порождает пустую строку.
 */
[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text);

/**
 * @brief Ленивый перебор токенов одной строки
 *
 * Владеет собственным RegexMatcher, поэтому каждому потоку нужен свой
 * экземпляр. reset() перезапускает перебор на новой строке. Строка должна
 * жить, пока идёт перебор.
 */
class LineTokenizer {
public:
  explicit LineTokenizer(TokenPattern pattern);
  ~LineTokenizer();

  LineTokenizer(const LineTokenizer &) = delete;
  LineTokenizer &operator=(const LineTokenizer &) = delete;

  /// Начинает перебор строки с начала
  void reset(std::string_view line);

  /// Следующий токен длиной от kMinTokenChars символов
  [[nodiscard]] std::optional<Token> next();

private:
  std::unique_ptr<icu::RegexMatcher> matcher_;
  UText *text_ = nullptr;
  std::string_view line_;
};

/**
 * @brief Все токены строки (удобная обёртка над LineTokenizer)
 */
[[nodiscard]] std::vector<Token> tokenize_line(std::string_view line,
                                               TokenPattern pattern);

} // namespace atomspell
