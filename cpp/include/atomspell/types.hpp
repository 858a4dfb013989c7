/**
 * @file types.hpp
 * @brief Базовые типы и коды результатов для AtomSpell
 *
 * Этот файл содержит фундаментальные типы, используемые во всём ядре
 * проверки орфографии: категории слов, коды ошибок словаря, пути по умолчанию.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace atomspell {

// ===========================================================================
// Константы
// ===========================================================================

/// Путь к системному конфигурационному файлу
inline constexpr std::string_view kConfigPath = "/etc/atomspell/config.yaml";

/// Путь к пользовательскому конфигу (относительно $HOME)
inline constexpr std::string_view kUserConfigRelPath =
    ".config/atomspell/config.yaml";

/// Каталог пользовательских данных (относительно $HOME)
inline constexpr std::string_view kUserDataRelPath = ".local/share/atomspell";

/// Префикс всех диагностических сообщений
inline constexpr std::string_view kLogPrefix = "[atomspell] ";

/// Токены короче этого (в символах) отбрасываются до классификации
inline constexpr std::size_t kMinTokenChars = 2;

// ===========================================================================
// Категории слов
// ===========================================================================

/// Семантическая категория токена
enum class WordCategory : std::uint8_t {
  Normal,         ///< Обычное слово
  CodeIdentifier, ///< Идентификатор из исходного кода (get_value, fooBar)
  Acronym,        ///< Аббревиатура (API, HTTP2)
  ProperNoun,     ///< Имя собственное (London)
  TechnicalTerm   ///< Технический термин через дефис (multi-threaded)
};

[[nodiscard]] constexpr std::string_view
to_string(WordCategory category) noexcept {
  switch (category) {
  case WordCategory::Normal:
    return "Normal";
  case WordCategory::CodeIdentifier:
    return "CodeIdentifier";
  case WordCategory::Acronym:
    return "Acronym";
  case WordCategory::ProperNoun:
    return "ProperNoun";
  case WordCategory::TechnicalTerm:
    return "TechnicalTerm";
  }
  return "Normal";
}

// ===========================================================================
// Типы результатов операций
// ===========================================================================

/// Результат парсинга конфигурации
enum class ConfigResult { Ok, FileNotFound, ParseError, InvalidValue };

/// Код результата операций со словарём
enum class DictError {
  Ok,
  Io,                 ///< Файл отсутствует или не читается/не пишется
  DictionaryNotFound, ///< Нет словаря ни для языка, ни для языка по умолчанию
  EmptyDictionary,    ///< Словарь загружен, но слов нет (не фатально)
  InvalidEncoding,    ///< Не UTF-8 и перекодировать не удалось
  UnsupportedFormat,  ///< Неизвестное расширение файла
  InvalidWord         ///< Пустое или слишком короткое слово
};

[[nodiscard]] constexpr std::string_view to_string(DictError code) noexcept {
  switch (code) {
  case DictError::Ok:
    return "ok";
  case DictError::Io:
    return "io error";
  case DictError::DictionaryNotFound:
    return "dictionary not found";
  case DictError::EmptyDictionary:
    return "empty dictionary";
  case DictError::InvalidEncoding:
    return "invalid encoding";
  case DictError::UnsupportedFormat:
    return "unsupported format";
  case DictError::InvalidWord:
    return "invalid word";
  }
  return "unknown";
}

/// Результат операции со словарём: код + человекочитаемое сообщение
struct DictStatus {
  DictError code = DictError::Ok;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return code == DictError::Ok; }

  /// EmptyDictionary не мешает работе — словарь остаётся пригодным
  [[nodiscard]] bool fatal() const noexcept {
    return code != DictError::Ok && code != DictError::EmptyDictionary;
  }

  [[nodiscard]] static DictStatus success() { return {}; }

  [[nodiscard]] static DictStatus failure(DictError c, std::string message) {
    return DictStatus{c, std::move(message)};
  }
};

} // namespace atomspell
