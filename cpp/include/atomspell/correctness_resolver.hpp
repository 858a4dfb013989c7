/**
 * @file correctness_resolver.hpp
 * @brief Ответ на вопрос "слово написано верно?"
 *
 * Порядок: список игнорирования сессии -> пользовательский словарь ->
 * кеш -> базовый словарь -> снисхождение по категории. Результаты
 * словаря и снисхождения кешируются, попадания в игнор и пользовательский
 * словарь — нет (они меняются при add/ignore).
 */

#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

#include "atomspell/correctness_cache.hpp"
#include "atomspell/dictionary.hpp"
#include "atomspell/types.hpp"

namespace atomspell {

/// Максимальная длина идентификатора, принимаемого без словаря
inline constexpr std::size_t kLenientIdentifierLen = 15;

/**
 * @brief Снисхождение для слова, которого нет в словаре
 *
 * ProperNoun/Acronym — если слово правдоподобно (looks_reasonable),
 * CodeIdentifier — если не длиннее 15 символов, остальное — никогда.
 */
[[nodiscard]] bool lenient_accept(std::string_view token,
                                  WordCategory category);

class CorrectnessResolver {
public:
  /**
   * @param session_ignored Нормализованные слова, игнорируемые в сессии
   */
  CorrectnessResolver(const Dictionary &dictionary, CorrectnessCache &cache,
                      const std::unordered_set<std::string> &session_ignored,
                      bool case_sensitive)
      : dictionary_{dictionary}, cache_{cache},
        session_ignored_{session_ignored}, case_sensitive_{case_sensitive} {}

  /**
   * @brief Проверяет токен
   * @param token Исходный текст токена
   * @param normalized Нормализованная форма токена
   * @param category Категория из классификатора
   */
  [[nodiscard]] bool resolve(std::string_view token,
                             const std::string &normalized,
                             WordCategory category, bool is_code_context) const;

private:
  const Dictionary &dictionary_;
  CorrectnessCache &cache_;
  const std::unordered_set<std::string> &session_ignored_;
  bool case_sensitive_;
};

} // namespace atomspell
