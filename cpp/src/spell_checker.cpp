/**
 * @file spell_checker.cpp
 * @brief Реализация фасада проверки орфографии
 */

#include "atomspell/spell_checker.hpp"
#include "atomspell/correctness_resolver.hpp"
#include "atomspell/unicode_text.hpp"
#include "atomspell/word_classifier.hpp"

#include <exception>
#include <iostream>
#include <mutex>

namespace atomspell {

SpellChecker::SpellChecker(Config config,
                           std::shared_ptr<DictionaryManager> manager,
                           std::shared_ptr<CorrectnessCache> cache)
    : config_{std::move(config)}, manager_{std::move(manager)},
      cache_{std::move(cache)}, language_{config_.dictionary.default_language} {
  if (!manager_) {
    manager_ = std::make_shared<DictionaryManager>(config_.dictionary);
  }
  if (!cache_) {
    cache_ = std::make_shared<CorrectnessCache>();
  }

  for (auto acronym : default_acronyms()) {
    lists_.acronyms.emplace(acronym);
  }
  for (const auto &acronym : config_.analyzer.acronyms) {
    lists_.acronyms.insert(to_lower(trim(acronym)));
  }
  for (const auto &noun : config_.analyzer.proper_nouns) {
    lists_.proper_nouns.insert(normalize_word(noun, language_));
  }
}

// ===========================================================================
// Язык
// ===========================================================================

DictStatus SpellChecker::set_language(const Language &language) {
  if (this->language() == language) {
    return DictStatus::success();
  }

  // Автоопределение выбирает словарь на каждой проверке
  DictStatus status;
  if (!language.is_auto()) {
    auto outcome = manager_->get_dictionary(language);
    if (outcome.status.fatal()) {
      return std::move(outcome.status);
    }
    status = std::move(outcome.status);
  }

  std::unique_lock lock(state_mu_);
  if (language_ != language) {
    cache_->clear();
    language_ = language;
  }
  return status;
}

Language SpellChecker::language() const {
  std::shared_lock lock(state_mu_);
  return language_;
}

Language SpellChecker::resolve_language(const Language &language,
                                        std::string_view text) {
  if (!language.is_auto()) {
    return language;
  }
  return detect_language(text);
}

// ===========================================================================
// Проверка
// ===========================================================================

DocumentAnalysis SpellChecker::analyze(std::string_view text,
                                       const Language &language,
                                       std::optional<std::string_view> filename,
                                       const CheckerConfig &options) {
  const Language resolved = resolve_language(language, text);

  std::shared_lock lock(state_mu_);
  auto outcome = manager_->get_dictionary(resolved);

  try {
    const DocumentAnalyzer analyzer{outcome.dictionary.get(), *cache_, lists_,
                                    options, config_.analyzer};
    return analyzer.analyze(text, resolved, filename);
  } catch (const std::exception &e) {
    std::cerr << kLogPrefix << "Warning: analysis failed: " << e.what()
              << "\n";
  }

  DocumentAnalysis empty;
  empty.language = resolved;
  return empty;
}

DocumentAnalysis
SpellChecker::check_document(std::string_view text,
                             std::optional<std::string_view> filename) {
  return analyze(text, language(), filename, config_.checker);
}

bool SpellChecker::is_correct(std::string_view word) {
  const std::string_view trimmed = trim(word);

  std::shared_lock lock(state_mu_);
  auto outcome = manager_->get_dictionary(language_);
  if (!outcome.ok()) {
    return true;
  }

  const std::string normalized = normalize_word(trimmed, language_);
  const WordCategory category = classify(trimmed, false);
  const CorrectnessResolver resolver{*outcome.dictionary, *cache_,
                                     lists_.ignored,
                                     config_.checker.case_sensitive};
  return resolver.resolve(trimmed, normalized, category, false);
}

// ===========================================================================
// Изменение словарей
// ===========================================================================

std::shared_ptr<Dictionary> SpellChecker::dictionary_for(const Language &language,
                                                         DictStatus &status) {
  if (language.is_auto()) {
    status = DictStatus::failure(DictError::DictionaryNotFound,
                                 "Auto-detect cannot be modified");
    return nullptr;
  }
  auto outcome = manager_->get_dictionary(language);
  status = std::move(outcome.status);
  return outcome.dictionary;
}

DictStatus SpellChecker::add_word(std::string_view word,
                                  const Language &language) {
  DictStatus status;
  auto dictionary = dictionary_for(language, status);
  if (!dictionary) {
    return status;
  }
  std::unique_lock lock(state_mu_);
  status = dictionary->add_word(word);
  cache_->clear();
  return status;
}

DictStatus SpellChecker::remove_word(std::string_view word,
                                     const Language &language) {
  DictStatus status;
  auto dictionary = dictionary_for(language, status);
  if (!dictionary) {
    return status;
  }
  std::unique_lock lock(state_mu_);
  status = dictionary->remove_word(word);
  cache_->clear();
  return status;
}

DictStatus SpellChecker::ignore_word(std::string_view word,
                                     const Language &language) {
  DictStatus status;
  auto dictionary = dictionary_for(language, status);
  if (!dictionary) {
    return status;
  }
  std::unique_lock lock(state_mu_);
  status = dictionary->ignore_word(word);
  cache_->clear();
  return status;
}

DictStatus SpellChecker::clear_ignored(const Language &language) {
  DictStatus status;
  auto dictionary = dictionary_for(language, status);
  if (!dictionary) {
    return status;
  }
  std::unique_lock lock(state_mu_);
  status = dictionary->clear_ignored();
  cache_->clear();
  return status;
}

DictStatus SpellChecker::import_dictionary(const std::filesystem::path &path,
                                           const Language &language) {
  DictStatus status;
  auto dictionary = dictionary_for(language, status);
  if (!dictionary) {
    return status;
  }
  std::unique_lock lock(state_mu_);
  status = dictionary->import_from_file(path);
  cache_->clear();
  return status;
}

DictStatus SpellChecker::export_dictionary(const Language &language,
                                           const std::filesystem::path &path) {
  DictStatus status;
  auto dictionary = dictionary_for(language, status);
  if (!dictionary) {
    return status;
  }
  return dictionary->export_to_file(path);
}

DictStatus SpellChecker::reload_dictionary(const Language &language) {
  std::unique_lock lock(state_mu_);
  auto outcome = manager_->reload_dictionary(language);
  cache_->clear();
  return outcome.status;
}

std::size_t SpellChecker::word_count(const Language &language) {
  DictStatus status;
  auto dictionary = dictionary_for(language, status);
  return dictionary ? dictionary->word_count() : 0;
}

// ===========================================================================
// Списки сессии
// ===========================================================================

void SpellChecker::ignore_for_session(std::string_view word) {
  std::unique_lock lock(state_mu_);
  lists_.ignored.insert(normalize_word(word, language_));
}

void SpellChecker::add_proper_noun(std::string_view word) {
  std::unique_lock lock(state_mu_);
  lists_.proper_nouns.insert(normalize_word(word, language_));
}

void SpellChecker::add_acronym(std::string_view word) {
  std::unique_lock lock(state_mu_);
  lists_.acronyms.insert(to_lower(trim(word)));
}

} // namespace atomspell
