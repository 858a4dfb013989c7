/**
 * @file confidence_scorer.cpp
 * @brief Эвристика уверенности для ненайденных слов
 */

#include "atomspell/confidence_scorer.hpp"
#include "atomspell/unicode_text.hpp"

#include <algorithm>
#include <array>

namespace atomspell {

namespace {

constexpr std::array<std::string_view, 9> kTypoPatterns = {
    "ie", "ei", "tion", "sion", "able", "ible", "ment", "ness", "ough"};

constexpr double kShortWordFactor = 0.3;
constexpr double kLongWordFactor = 0.7;
constexpr double kCompoundFactor = 1.1;
constexpr double kTypoPatternFactor = 1.3;

constexpr std::size_t kShortWordLen = 3;
constexpr std::size_t kLongWordLen = 20;

} // namespace

bool has_common_typo_pattern(std::string_view word) {
  const std::string lowered = to_lower(word);
  return std::any_of(kTypoPatterns.begin(), kTypoPatterns.end(),
                     [&lowered](std::string_view p) {
                       return lowered.find(p) != std::string::npos;
                     });
}

double score_confidence(std::string_view word, WordCategory category,
                        bool is_correct) {
  if (is_correct) {
    return 1.0;
  }

  double confidence = kBaseConfidence * category_weight(category);

  const std::size_t length = char_count(word);
  if (length < kShortWordLen) {
    confidence *= kShortWordFactor;
  } else if (length > kLongWordLen) {
    confidence *= kLongWordFactor;
  }

  if (word.find_first_of("_-") != std::string_view::npos) {
    confidence *= kCompoundFactor;
  }

  if (has_common_typo_pattern(word)) {
    confidence *= kTypoPatternFactor;
  }

  return std::clamp(confidence, 0.0, 1.0);
}

} // namespace atomspell
