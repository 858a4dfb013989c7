/**
 * @file text_stats.cpp
 * @brief Реализация статистики текста
 */

#include "atomspell/text_stats.hpp"
#include "atomspell/tokenizer.hpp"
#include "atomspell/unicode_text.hpp"

#include <unicode/uchar.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <set>

namespace atomspell {

namespace {

// clang-format off
/// Сокращения и ключевые слова, которые в коде не являются словами
constexpr std::array<std::string_view, 47> kCodeSymbols = {
    "var", "val", "fn", "def", "func", "cls", "obj", "arr", "vec", "str",
    "int", "num", "bool", "float", "double", "char", "byte", "ptr", "ref",
    "mut", "const", "static", "pub", "priv", "prot", "async", "await",
    "try", "catch", "throw", "null", "nil", "none", "some", "ok", "err",
    "true", "false", "self", "this", "super", "new", "del", "inc", "dec",
    "let", "impl",
};
// clang-format on

/// CONSTANT_NAME: заглавные, цифры и '_', первый символ не цифра
bool is_constant_name(std::string_view word) {
  if (word.empty() || (word.front() >= '0' && word.front() <= '9')) {
    return false;
  }
  return std::all_of(word.begin(), word.end(), [](char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
  });
}

bool is_code_symbol(std::string_view word) {
  return std::find(kCodeSymbols.begin(), kCodeSymbols.end(), word) !=
         kCodeSymbols.end();
}

/// snake_case длиннее 5 байт или CamelCase длиннее 3 байт
bool is_common_code_pattern(std::string_view word) {
  if (word.find('_') != std::string_view::npos && word.size() > 5) {
    return true;
  }
  const bool has_upper = std::any_of(word.begin(), word.end(), [](char c) {
    return c >= 'A' && c <= 'Z';
  });
  return has_upper && word.size() > 3;
}

bool keep_code_word(std::string_view word) {
  return word.size() > 2 && !is_constant_name(word) &&
         !is_common_code_pattern(word) && !is_code_symbol(to_lower(word));
}

TokenPattern pattern_for(const Language &language, bool is_code) {
  if (language.is_cjk()) {
    return TokenPattern::Cjk;
  }
  return is_code ? TokenPattern::Code : TokenPattern::Prose;
}

} // namespace

double calculate_accuracy(std::size_t correct, std::size_t total) {
  if (total == 0) {
    return 100.0;
  }
  return std::round(static_cast<double>(correct) / static_cast<double>(total) *
                    100.0);
}

std::vector<std::string> extract_words(std::string_view text,
                                       const Language &language, bool is_code) {
  std::vector<std::string> words;
  const TokenPattern pattern = pattern_for(language, is_code);
  const bool filter_code = pattern == TokenPattern::Code;

  LineTokenizer tokenizer{pattern};
  for (auto line : split_lines(text)) {
    tokenizer.reset(line);
    while (auto token = tokenizer.next()) {
      if (filter_code && !keep_code_word(token->text)) {
        continue;
      }
      words.push_back(normalize_word(token->text, language));
    }
  }
  return words;
}

std::unordered_map<std::string, std::size_t>
word_frequency(std::string_view text, const Language &language, bool is_code) {
  std::unordered_map<std::string, std::size_t> freq;
  for (auto &word : extract_words(text, language, is_code)) {
    ++freq[std::move(word)];
  }
  return freq;
}

std::vector<std::pair<std::string, std::size_t>>
most_common_words(const std::unordered_map<std::string, std::size_t> &freq,
                  std::size_t n) {
  std::vector<std::pair<std::string, std::size_t>> words(freq.begin(),
                                                         freq.end());
  std::sort(words.begin(), words.end(), [](const auto &a, const auto &b) {
    if (a.second != b.second) {
      return a.second > b.second;
    }
    return a.first < b.first;
  });
  if (words.size() > n) {
    words.resize(n);
  }
  return words;
}

ReadingTime reading_time(std::string_view text) {
  const std::size_t words =
      extract_words(text, Language{LanguageId::English}, false).size();
  return ReadingTime{words / kReadingWordsPerMinute,
                     (words % kReadingWordsPerMinute) * 60 /
                         kReadingWordsPerMinute};
}

std::string sanitize_word(std::string_view word) {
  const std::u32string cps = decode_utf8(trim(word));
  std::u32string out;
  out.reserve(cps.size());

  for (std::size_t i = 0; i < cps.size(); ++i) {
    const auto c = static_cast<UChar32>(cps[i]);
    if (u_isalnum(c)) {
      out.push_back(cps[i]);
    } else if (cps[i] == U'\'' || cps[i] == U'-') {
      // Апостроф/дефис только внутри слова
      if (i > 0 && i + 1 < cps.size() &&
          u_isalpha(static_cast<UChar32>(cps[i - 1])) &&
          u_isalpha(static_cast<UChar32>(cps[i + 1]))) {
        out.push_back(cps[i]);
      }
    }
  }
  return encode_utf8(out);
}

bool is_valid_word(std::string_view word) {
  const std::string_view trimmed = trim(word);
  if (trimmed.size() < 2) {
    return false;
  }
  for (char32_t c : decode_utf8(trimmed)) {
    if (u_isalpha(static_cast<UChar32>(c))) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> build_word_list(std::string_view text,
                                         const Language &language,
                                         std::size_t min_length) {
  std::set<std::string> unique;
  for (auto &word : extract_words(text, language, false)) {
    std::string clean = sanitize_word(word);
    if (is_valid_word(clean) && char_count(clean) >= min_length) {
      unique.insert(std::move(clean));
    }
  }
  return {unique.begin(), unique.end()};
}

} // namespace atomspell
