/**
 * @file suggestion_generator.cpp
 * @brief Реализация ранжирования вариантов исправления
 */

#include "atomspell/suggestion_generator.hpp"
#include "atomspell/unicode_text.hpp"

#include <unicode/uchar.h>

#include <algorithm>
#include <unordered_set>

namespace atomspell {

namespace {

std::size_t abs_diff(std::size_t a, std::size_t b) noexcept {
  return a > b ? a - b : b - a;
}

} // namespace

// ===========================================================================
// Паттерны регистра
// ===========================================================================

CasePattern detect_case_pattern(std::string_view word) {
  std::size_t upper_count = 0;
  std::size_t lower_count = 0;
  bool first_upper = false;
  bool first_cased_seen = false;

  for (char32_t c : decode_utf8(word)) {
    const auto uc = static_cast<UChar32>(c);
    const bool upper = u_isupper(uc);
    const bool lower = u_islower(uc);
    if (!upper && !lower) {
      continue;
    }
    if (!first_cased_seen) {
      first_upper = upper;
      first_cased_seen = true;
    }
    if (upper) {
      ++upper_count;
    } else {
      ++lower_count;
    }
  }

  if (upper_count == 0) {
    return CasePattern::AllLower;
  }
  if (upper_count == 1 && first_upper) {
    return CasePattern::TitleCase;
  }
  if (lower_count == 0) {
    return CasePattern::AllUpper;
  }
  return CasePattern::Mixed;
}

std::string apply_case_pattern(std::string_view word, CasePattern pattern) {
  switch (pattern) {
  case CasePattern::AllUpper:
    return to_upper(word);
  case CasePattern::TitleCase:
    return capitalize(word);
  case CasePattern::AllLower:
  case CasePattern::Mixed:
    break;
  }
  return std::string{word};
}

// ===========================================================================
// Расстояние редактирования
// ===========================================================================

std::size_t damerau_levenshtein_distance(std::u32string_view s1,
                                         std::u32string_view s2) {
  const std::size_t len1 = s1.size();
  const std::size_t len2 = s2.size();

  if (len1 == 0)
    return len2;
  if (len2 == 0)
    return len1;
  if (s1 == s2)
    return 0;

  // Три строки матрицы: i-2, i-1, i
  std::vector<std::size_t> prev2(len2 + 1);
  std::vector<std::size_t> prev(len2 + 1);
  std::vector<std::size_t> cur(len2 + 1);

  for (std::size_t j = 0; j <= len2; ++j) {
    prev[j] = j;
  }

  for (std::size_t i = 1; i <= len1; ++i) {
    cur[0] = i;
    for (std::size_t j = 1; j <= len2; ++j) {
      const std::size_t cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;

      cur[j] = std::min({
          prev[j] + 1,       // Удаление
          cur[j - 1] + 1,    // Вставка
          prev[j - 1] + cost // Замена
      });

      // Транспозиция (перестановка соседних символов)
      if (i > 1 && j > 1 && s1[i - 1] == s2[j - 2] && s1[i - 2] == s2[j - 1]) {
        cur[j] = std::min(cur[j], prev2[j - 2] + cost);
      }
    }
    std::swap(prev2, prev);
    std::swap(prev, cur);
  }

  return prev[len2];
}

std::size_t damerau_levenshtein_distance(std::string_view s1,
                                         std::string_view s2) {
  return damerau_levenshtein_distance(decode_utf8(s1), decode_utf8(s2));
}

// ===========================================================================
// Генерация вариантов
// ===========================================================================

void rank_candidates(std::vector<SuggestionCandidate> &candidates) {
  std::sort(candidates.begin(), candidates.end(),
            [](const SuggestionCandidate &a, const SuggestionCandidate &b) {
              if (a.distance != b.distance) {
                return a.distance < b.distance;
              }
              if (a.length_diff != b.length_diff) {
                return a.length_diff < b.length_diff;
              }
              return a.word < b.word;
            });
}

std::vector<std::string> generate_suggestions(const Dictionary &dictionary,
                                              std::string_view original,
                                              const SuggestionOptions &options) {
  std::vector<std::string> out;
  if (options.max_suggestions == 0 || options.max_edit_distance == 0) {
    return out;
  }

  const std::string normalized =
      normalize_word(original, dictionary.language());
  if (normalized.empty()) {
    return out;
  }

  const std::u32string target = decode_utf8(normalized);
  const std::size_t target_len = target.size();

  std::vector<SuggestionCandidate> candidates;
  std::unordered_set<std::string> seen;

  dictionary.for_each_word([&](const std::string &word) {
    // Разница длин — нижняя граница расстояния
    const std::size_t len = char_count(word);
    if (abs_diff(len, target_len) > options.max_edit_distance) {
      return;
    }
    const std::size_t d = damerau_levenshtein_distance(decode_utf8(word), target);
    if (d == 0 || d > options.max_edit_distance) {
      return;
    }
    seen.insert(word);
    candidates.push_back({word, d, abs_diff(len, target_len)});
  });

  // Hunspell знает словоформы, которых нет в базовом списке
  for (const auto &suggestion : dictionary.hunspell_suggest(std::string{original})) {
    std::string word = normalize_word(suggestion, dictionary.language());
    if (word.empty() || seen.contains(word)) {
      continue;
    }
    const std::u32string cps = decode_utf8(word);
    const std::size_t d = damerau_levenshtein_distance(cps, target);
    if (d == 0) {
      continue;
    }
    seen.insert(word);
    candidates.push_back({std::move(word), d, abs_diff(cps.size(), target_len)});
  }

  rank_candidates(candidates);

  const CasePattern pattern = detect_case_pattern(original);
  const std::size_t limit = std::min(candidates.size(), options.max_suggestions);
  out.reserve(limit);
  for (std::size_t i = 0; i < limit; ++i) {
    out.push_back(apply_case_pattern(candidates[i].word, pattern));
  }
  return out;
}

} // namespace atomspell
