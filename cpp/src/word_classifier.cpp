/**
 * @file word_classifier.cpp
 * @brief Таблица правил классификации и эвристики формы слова
 */

#include "atomspell/word_classifier.hpp"
#include "atomspell/unicode_text.hpp"

#include <unicode/uchar.h>

#include <algorithm>

namespace atomspell {

namespace {

// clang-format off
constexpr std::array<std::string_view, 10> kCommonCapitalized = {
    "I", "A", "The", "And", "But", "Or", "For", "Nor", "Yet", "So",
};

constexpr std::array<std::string_view, 27> kDefaultAcronyms = {
    "api", "http", "https", "url", "uri", "html", "css", "js", "ts",
    "json", "xml", "sql", "nosql", "cpu", "gpu", "ram", "rom", "usb",
    "ssd", "hdd", "lan", "wan", "vpn", "dns", "ip", "tcp", "udp",
};

constexpr std::array<std::string_view, 4> kAccessorPrefixes = {
    "get_", "set_", "is_", "has_",
};

constexpr std::array<std::string_view, 2> kTypeSuffixes = {"_t", "_ptr"};

constexpr std::array<std::string_view, 4> kRoleSuffixes = {
    "Handler", "Service", "Manager", "Factory",
};
// clang-format on

/// Максимальная длина аббревиатуры
constexpr std::size_t kMaxAcronymLen = 6;

/// Минимальная длина имени собственного (строго больше)
constexpr std::size_t kProperNounMinLen = 2;

/// Минимальная длина технического термина (строго больше)
constexpr std::size_t kTechnicalTermMinLen = 5;

template <std::size_t N>
[[nodiscard]] bool starts_with_any(std::string_view word,
                                   const std::array<std::string_view, N> &list) {
  return std::any_of(list.begin(), list.end(),
                     [word](std::string_view p) { return word.starts_with(p); });
}

template <std::size_t N>
[[nodiscard]] bool ends_with_any(std::string_view word,
                                 const std::array<std::string_view, N> &list) {
  return std::any_of(list.begin(), list.end(),
                     [word](std::string_view s) { return word.ends_with(s); });
}

// ===========================================================================
// Правила
// ===========================================================================

bool rule_acronym(const TokenTraits &t, bool /*is_code_context*/) {
  return t.all_caps_like && t.length <= kMaxAcronymLen;
}

bool rule_proper_noun(const TokenTraits &t, bool /*is_code_context*/) {
  return t.first_upper && t.length > kProperNounMinLen &&
         !is_common_capitalized(t.text);
}

bool rule_code_identifier(const TokenTraits &t, bool is_code_context) {
  if (!is_code_context) {
    return false;
  }
  return t.has_underscore || (t.has_upper && t.has_lower) ||
         t.text.starts_with("get_") || t.text.starts_with("set_") ||
         ends_with_any(t.text, kTypeSuffixes);
}

bool rule_technical_term(const TokenTraits &t, bool /*is_code_context*/) {
  return t.has_hyphen && t.length > kTechnicalTermMinLen;
}

constexpr std::array<ClassifierRule, 4> kRules = {{
    {WordCategory::Acronym, "acronym", &rule_acronym},
    {WordCategory::ProperNoun, "proper-noun", &rule_proper_noun},
    {WordCategory::CodeIdentifier, "code-identifier", &rule_code_identifier},
    {WordCategory::TechnicalTerm, "technical-term", &rule_technical_term},
}};

} // namespace

TokenTraits analyze_token(std::string_view token) {
  TokenTraits t;
  t.text = token;

  const std::u32string cps = decode_utf8(token);
  t.length = cps.size();
  if (cps.empty()) {
    return t;
  }

  t.first_upper = u_isupper(static_cast<UChar32>(cps.front()));
  t.all_caps_like = true;

  for (char32_t c : cps) {
    const auto uc = static_cast<UChar32>(c);
    const bool upper = u_isupper(uc);
    const bool lower = u_islower(uc);
    t.has_upper = t.has_upper || upper;
    t.has_lower = t.has_lower || lower;
    if (c == U'_') {
      t.has_underscore = true;
    } else if (c == U'-') {
      t.has_hyphen = true;
    }
    if (!(upper || u_isdigit(uc) || c == U'_')) {
      t.all_caps_like = false;
    }
  }

  return t;
}

std::span<const ClassifierRule> classifier_rules() noexcept { return kRules; }

WordCategory classify(std::string_view token, bool is_code_context) {
  const TokenTraits traits = analyze_token(token);
  for (const auto &rule : kRules) {
    if (rule.matches(traits, is_code_context)) {
      return rule.category;
    }
  }
  return WordCategory::Normal;
}

bool is_common_capitalized(std::string_view token) noexcept {
  return std::find(kCommonCapitalized.begin(), kCommonCapitalized.end(),
                   token) != kCommonCapitalized.end();
}

// ===========================================================================
// Эвристики формы слова
// ===========================================================================

bool looks_like_code_identifier(std::string_view word) {
  if (word.empty()) {
    return false;
  }

  if (word.find('_') != std::string_view::npos && word.front() != '_' &&
      word.back() != '_') {
    return true;
  }

  const TokenTraits t = analyze_token(word);
  if (t.has_upper && t.has_lower) {
    return true;
  }

  return starts_with_any(word, kAccessorPrefixes) ||
         ends_with_any(word, kTypeSuffixes) ||
         ends_with_any(word, kRoleSuffixes);
}

bool is_numeric_heavy(std::string_view word) {
  bool has_digit = false;
  std::size_t letters = 0;
  for (char32_t c : decode_utf8(word)) {
    const auto uc = static_cast<UChar32>(c);
    if (u_isdigit(uc)) {
      has_digit = true;
    } else if (u_isalpha(uc)) {
      ++letters;
    }
  }
  return has_digit && letters < 3;
}

bool is_skippable_code_identifier(std::string_view word) {
  const std::u32string cps = decode_utf8(word);
  if (cps.size() <= 3) {
    return true;
  }
  if (std::all_of(cps.begin(), cps.end(), [](char32_t c) {
        return u_isdigit(static_cast<UChar32>(c));
      })) {
    return true;
  }
  if (word.starts_with("0x") || word.find("__") != std::string_view::npos) {
    return true;
  }
  return starts_with_any(word, kAccessorPrefixes) ||
         ends_with_any(word, kTypeSuffixes);
}

bool has_repeated_characters(std::string_view word, std::size_t max_repeats) {
  char32_t current = 0;
  std::size_t count = 0;
  for (char32_t c : decode_utf8(word)) {
    if (count > 0 && c == current) {
      if (++count > max_repeats) {
        return true;
      }
    } else {
      current = c;
      count = 1;
    }
  }
  return false;
}

bool has_vowels(std::string_view word) noexcept {
  return word.find_first_of("aeiouyAEIOUY") != std::string_view::npos;
}

bool looks_reasonable(std::string_view word) {
  const std::u32string cps = decode_utf8(word);
  if (cps.empty()) {
    return false;
  }

  const auto letters = std::count_if(cps.begin(), cps.end(), [](char32_t c) {
    return u_isalpha(static_cast<UChar32>(c));
  });
  const double letter_ratio =
      static_cast<double>(letters) / static_cast<double>(cps.size());

  return letter_ratio > 0.7 && !has_repeated_characters(word, 4) &&
         (cps.size() <= 4 || has_vowels(word));
}

std::span<const std::string_view> default_acronyms() noexcept {
  return kDefaultAcronyms;
}

} // namespace atomspell
