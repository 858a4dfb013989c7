/**
 * @file correctness_resolver.cpp
 * @brief Порядок проверки слова и снисхождение по категориям
 */

#include "atomspell/correctness_resolver.hpp"
#include "atomspell/unicode_text.hpp"
#include "atomspell/word_classifier.hpp"

namespace atomspell {

bool lenient_accept(std::string_view token, WordCategory category) {
  switch (category) {
  case WordCategory::ProperNoun:
  case WordCategory::Acronym:
    return looks_reasonable(token);
  case WordCategory::CodeIdentifier:
    return char_count(token) <= kLenientIdentifierLen;
  case WordCategory::Normal:
  case WordCategory::TechnicalTerm:
    return false;
  }
  return false;
}

bool CorrectnessResolver::resolve(std::string_view token,
                                  const std::string &normalized,
                                  WordCategory category,
                                  bool is_code_context) const {
  if (session_ignored_.contains(normalized)) {
    return true;
  }
  if (dictionary_.is_user_word(normalized)) {
    return true;
  }

  // С учётом регистра ответ зависит от исходного написания
  const std::string key = CorrectnessCache::make_key(
      dictionary_.language().code(),
      case_sensitive_ ? std::string_view{token} : std::string_view{normalized},
      category, is_code_context);

  if (auto hit = cache_.get(key)) {
    return *hit;
  }

  bool correct = dictionary_.contains(token, case_sensitive_, is_code_context);
  if (!correct) {
    correct = lenient_accept(token, category);
  }

  cache_.insert(key, correct);
  return correct;
}

} // namespace atomspell
