/**
 * @file document_analyzer.hpp
 * @brief Проверка документа: токенизация -> классификация -> проверка ->
 *        уверенность -> варианты исправления, и итоговая статистика
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "atomspell/analysis.hpp"
#include "atomspell/config.hpp"
#include "atomspell/correctness_cache.hpp"
#include "atomspell/dictionary.hpp"
#include "atomspell/tokenizer.hpp"

namespace atomspell {

/// Списки слов уровня сессии (все в нормализованной форме)
struct SessionWordLists {
  std::unordered_set<std::string> ignored;
  std::unordered_set<std::string> acronyms; ///< В нижнем регистре
  std::unordered_set<std::string> proper_nouns;
};

/**
 * @brief Заканчивается ли строка концом предложения
 *
 * Пустая (после trim) строка или последний символ из ".!?:".
 */
[[nodiscard]] bool ends_sentence(std::string_view line);

/**
 * @brief Анализатор одного документа
 *
 * Лёгкий объект на время одного вызова: ссылается на словарь, кеш и
 * списки сессии, которые должны пережить анализ.
 */
class DocumentAnalyzer {
public:
  /**
   * @param dictionary Словарь языка; nullptr — пустой результат
   */
  DocumentAnalyzer(const Dictionary *dictionary, CorrectnessCache &cache,
                   const SessionWordLists &lists, CheckerConfig checker,
                   AnalyzerConfig analyzer);

  /**
   * @brief Проверяет текст
   *
   * Никогда не завершается ошибкой: для пустого текста или отсутствующего
   * словаря возвращает нулевые итоги и точность 100.
   */
  [[nodiscard]] DocumentAnalysis
  analyze(std::string_view text, const Language &language,
          std::optional<std::string_view> filename) const;

  /**
   * @brief Пропускается ли токен без проверки
   *
   * Аббревиатура из списка, короткий/числовой/hex/dunder идентификатор
   * или известное имя собственное.
   */
  [[nodiscard]] bool should_skip(std::string_view token,
                                 const std::string &normalized,
                                 WordCategory category) const;

private:
  struct LineTask {
    std::string_view line;
    std::size_t line_no = 0;
    bool sentence_start = true; ///< Предыдущая строка закончила предложение
  };

  struct LineResult {
    std::vector<WordCheck> checks;
    std::vector<std::string> counted; ///< Нормализованные непропущенные слова
    std::size_t misspelled = 0;
  };

  [[nodiscard]] LineResult analyze_line(LineTokenizer &tokenizer,
                                        const LineTask &task,
                                        bool code_context) const;

  /// Проверка непропущенного токена: resolve -> score -> suggest
  void evaluate(WordCheck &check, bool code_context) const;

  const Dictionary *dictionary_;
  CorrectnessCache &cache_;
  const SessionWordLists &lists_;
  CheckerConfig checker_;
  AnalyzerConfig analyzer_;
};

} // namespace atomspell
