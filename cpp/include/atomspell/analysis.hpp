/**
 * @file analysis.hpp
 * @brief Результаты проверки: отдельное слово и документ целиком
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "atomspell/language.hpp"
#include "atomspell/types.hpp"

namespace atomspell {

/// Результат проверки одного токена
struct WordCheck {
  std::string word;     ///< Нормализованная форма
  std::string original; ///< Текст токена как в документе
  std::size_t start = 0; ///< Байтовое смещение в строке (0-based)
  std::size_t end = 0;   ///< Конец (не включая)
  std::size_t line = 0;   ///< Номер строки (1-based)
  std::size_t column = 0; ///< start + 1
  bool is_correct = true;
  double confidence = 1.0; ///< Уверенность в ошибке (1.0 для верных слов)
  WordCategory category = WordCategory::Normal;
  std::vector<std::string> suggestions; ///< Самый вероятный вариант первым
};

/// Итог проверки документа
struct DocumentAnalysis {
  std::size_t total_words = 0;      ///< Без пропущенных токенов
  std::size_t misspelled_words = 0; ///< Ошибка с уверенностью >= порога
  std::size_t unique_words = 0;     ///< Различные нормализованные слова
  double accuracy = 100.0;          ///< Процент, округлён до целого
  std::vector<WordCheck> words;     ///< В порядке документа
  std::size_t suggestions_count = 0;
  Language language{LanguageId::English};
  std::size_t lines_checked = 0;
  std::chrono::microseconds check_duration{0};
  bool likely_code = false;
  std::optional<std::string> file_type; ///< Расширение из имени файла
};

} // namespace atomspell
