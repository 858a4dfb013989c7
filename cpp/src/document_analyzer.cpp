/**
 * @file document_analyzer.cpp
 * @brief Проход по строкам документа и сбор статистики
 */

#include "atomspell/document_analyzer.hpp"
#include "atomspell/confidence_scorer.hpp"
#include "atomspell/correctness_resolver.hpp"
#include "atomspell/suggestion_generator.hpp"
#include "atomspell/text_stats.hpp"
#include "atomspell/unicode_text.hpp"
#include "atomspell/word_classifier.hpp"
#include "atomspell/worker_pool.hpp"

#include <chrono>

namespace atomspell {

namespace {

constexpr std::string_view kSentenceEnd = ".!?:";

/// Есть ли конец предложения между двумя токенами строки
bool gap_ends_sentence(std::string_view gap) {
  return gap.find_first_of(".!?") != std::string_view::npos;
}

std::optional<std::string> file_extension(std::string_view filename) {
  const auto slash = filename.find_last_of("/\\");
  if (slash != std::string_view::npos) {
    filename.remove_prefix(slash + 1);
  }
  const auto dot = filename.rfind('.');
  if (dot == std::string_view::npos || dot + 1 >= filename.size()) {
    return std::nullopt;
  }
  return to_lower(filename.substr(dot + 1));
}

} // namespace

bool ends_sentence(std::string_view line) {
  const std::string_view trimmed = trim(line);
  return trimmed.empty() ||
         kSentenceEnd.find(trimmed.back()) != std::string_view::npos;
}

DocumentAnalyzer::DocumentAnalyzer(const Dictionary *dictionary,
                                   CorrectnessCache &cache,
                                   const SessionWordLists &lists,
                                   CheckerConfig checker,
                                   AnalyzerConfig analyzer)
    : dictionary_{dictionary}, cache_{cache}, lists_{lists},
      checker_{checker}, analyzer_{std::move(analyzer)} {}

bool DocumentAnalyzer::should_skip(std::string_view token,
                                   const std::string &normalized,
                                   WordCategory category) const {
  switch (category) {
  case WordCategory::Acronym:
    return lists_.acronyms.contains(to_lower(token));
  case WordCategory::CodeIdentifier:
    return is_skippable_code_identifier(token);
  case WordCategory::ProperNoun:
    return lists_.proper_nouns.contains(normalized);
  case WordCategory::Normal:
  case WordCategory::TechnicalTerm:
    return false;
  }
  return false;
}

void DocumentAnalyzer::evaluate(WordCheck &check, bool code_context) const {
  const CorrectnessResolver resolver{*dictionary_, cache_, lists_.ignored,
                                     checker_.case_sensitive};
  const bool found =
      resolver.resolve(check.original, check.word, check.category, code_context);
  check.confidence = score_confidence(check.original, check.category, found);

  // Ниже порога считаем шумом, а не ошибкой
  check.is_correct = found || check.confidence < checker_.confidence_threshold;

  if (!check.is_correct && checker_.suggestions_enabled) {
    const SuggestionOptions opts{checker_.max_suggestions,
                                 checker_.max_edit_distance};
    check.suggestions = generate_suggestions(*dictionary_, check.original, opts);
  }
}

DocumentAnalyzer::LineResult
DocumentAnalyzer::analyze_line(LineTokenizer &tokenizer, const LineTask &task,
                               bool code_context) const {
  LineResult result;
  const Language &language = dictionary_->language();

  tokenizer.reset(task.line);
  std::optional<std::size_t> prev_end;

  while (auto token = tokenizer.next()) {
    const bool sentence_initial =
        prev_end.has_value()
            ? gap_ends_sentence(
                  task.line.substr(*prev_end, token->start - *prev_end))
            : task.sentence_start;
    prev_end = token->end;

    WordCheck check;
    check.word = normalize_word(token->text, language);
    check.start = token->start;
    check.end = token->end;
    check.line = task.line_no;
    check.column = token->start + 1;
    check.category = classify(token->text, code_context);

    // "Teh" в начале предложения — не имя собственное, известные имена остаются
    if (check.category == WordCategory::ProperNoun && sentence_initial &&
        !lists_.proper_nouns.contains(check.word)) {
      check.category = classify(lower_first(token->text), code_context);
    }

    if (should_skip(token->text, check.word, check.category)) {
      check.original = std::move(token->text);
      result.checks.push_back(std::move(check));
      continue;
    }

    check.original = std::move(token->text);
    evaluate(check, code_context);

    if (!check.is_correct) {
      ++result.misspelled;
    }
    result.counted.push_back(check.word);
    result.checks.push_back(std::move(check));
  }
  return result;
}

DocumentAnalysis
DocumentAnalyzer::analyze(std::string_view text, const Language &language,
                          std::optional<std::string_view> filename) const {
  const auto t0 = std::chrono::steady_clock::now();

  DocumentAnalysis analysis;
  analysis.language = language;
  if (filename.has_value()) {
    analysis.file_type = file_extension(*filename);
  }

  const TokenContext ctx = select_token_context(language, filename, text);
  analysis.likely_code = ctx.code_context;

  if (dictionary_ == nullptr) {
    return analysis;
  }

  const auto lines = split_lines(text);
  analysis.lines_checked = lines.size();

  std::vector<LineTask> tasks;
  tasks.reserve(lines.size());
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const bool sentence_start = i == 0 || ends_sentence(lines[i - 1]);
    tasks.push_back(LineTask{lines[i], i + 1, sentence_start});
  }

  std::vector<LineResult> results;
  const std::size_t threads = resolve_thread_count(analyzer_.worker_threads);

  if (threads > 1 && lines.size() >= analyzer_.parallel_min_lines) {
    // Каждому потоку свой RegexMatcher
    WorkerPool<LineTask, LineResult> pool{[this, &ctx](LineTask &task) {
      LineTokenizer tokenizer{ctx.pattern};
      return analyze_line(tokenizer, task, ctx.code_context);
    }};
    pool.start(threads);
    results = pool.map(std::move(tasks));
  } else {
    LineTokenizer tokenizer{ctx.pattern};
    results.reserve(tasks.size());
    for (const auto &task : tasks) {
      results.push_back(analyze_line(tokenizer, task, ctx.code_context));
    }
  }

  std::unordered_set<std::string> unique;
  for (auto &line : results) {
    analysis.total_words += line.counted.size();
    analysis.misspelled_words += line.misspelled;
    for (auto &word : line.counted) {
      unique.insert(std::move(word));
    }
    for (auto &check : line.checks) {
      analysis.suggestions_count += check.suggestions.size();
      analysis.words.push_back(std::move(check));
    }
  }
  analysis.unique_words = unique.size();
  analysis.accuracy = calculate_accuracy(
      analysis.total_words - analysis.misspelled_words, analysis.total_words);

  analysis.check_duration = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - t0);
  return analysis;
}

} // namespace atomspell
