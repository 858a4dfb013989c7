/**
 * @file language.hpp
 * @brief Каталог языков: коды, имена, соглашения об именах словарей,
 *        нормализация слов и эвристическое определение языка текста
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace atomspell {

/// Закрытый перечень поддерживаемых языков
enum class LanguageId : std::uint8_t {
  English,
  Afrikaans,
  French,
  Spanish,
  German,
  Chinese,
  Italian,
  Portuguese,
  Russian,
  Japanese,
  Korean,
  AutoDetect,
  Custom
};

/**
 * @brief Неизменяемое значение-язык
 *
 * Равенство и хеш определяются кодом. Для Custom код задаётся при создании,
 * для остальных берётся из каталога. AutoDetect — не ключ словаря, его нужно
 * разрешить в конкретный язык до поиска.
 */
class Language {
public:
  Language() = default;
  Language(LanguageId id) : id_{id} {}

  /// Пользовательский язык с произвольным кодом
  [[nodiscard]] static Language custom(std::string code);

  /**
   * @brief Разбирает код языка
   *
   * Принимает трёхбуквенные коды (eng), двухбуквенные (en) и английские
   * названия (english) без учёта регистра. Пустая строка — English,
   * неизвестный код — Custom(code).
   */
  [[nodiscard]] static Language from_code(std::string_view code);

  /// Все языки каталога (включая AutoDetect, без Custom)
  [[nodiscard]] static const std::vector<Language> &all();

  [[nodiscard]] LanguageId id() const noexcept { return id_; }
  [[nodiscard]] std::string_view code() const noexcept;
  [[nodiscard]] std::string name() const;

  /// Локаль hunspell-словаря (en_US); пусто для AutoDetect/Custom
  [[nodiscard]] std::string_view hunspell_locale() const noexcept;

  [[nodiscard]] bool is_cjk() const noexcept;
  [[nodiscard]] bool is_auto() const noexcept {
    return id_ == LanguageId::AutoDetect;
  }
  [[nodiscard]] bool is_custom() const noexcept {
    return id_ == LanguageId::Custom;
  }

  /**
   * @brief Имя файла базового словаря: "dictionary(eng).csv"
   * @param extension Расширение без точки ("csv" или "txt")
   * @return Пустая строка для AutoDetect
   */
  [[nodiscard]] std::string
  dictionary_filename(std::string_view extension) const;

  [[nodiscard]] bool operator==(const Language &other) const noexcept {
    return code() == other.code();
  }

private:
  LanguageId id_ = LanguageId::English;
  std::string custom_code_;
};

/**
 * @brief Нормализует слово для хранения и поиска в словаре
 *
 * Латиница и прочие алфавитные письменности — нижний регистр,
 * CJK — без изменений. Пробелы по краям удаляются.
 */
[[nodiscard]] std::string normalize_word(std::string_view word,
                                         const Language &language);

// ===========================================================================
// Определение языка
// ===========================================================================

/// Оценка принадлежности текста языку (0..100)
struct LanguageScore {
  Language language;
  double score = 0.0;
};

/**
 * @brief Оценивает вероятные языки текста
 *
 * Считает долю частотных служебных слов среди первых 50 слов и долю CJK
 * символов. Возвращает до трёх лучших вариантов по убыванию оценки.
 */
[[nodiscard]] std::vector<LanguageScore>
detect_language_scores(std::string_view text);

/**
 * @brief Определяет язык текста
 * @return Лучший язык, если его оценка выше 25, иначе English
 */
[[nodiscard]] Language detect_language(std::string_view text);

} // namespace atomspell

template <> struct std::hash<atomspell::Language> {
  std::size_t operator()(const atomspell::Language &lang) const noexcept {
    return std::hash<std::string_view>{}(lang.code());
  }
};
