/**
 * @file dictionary_manager.cpp
 * @brief Реализация кеша словарей
 */

#include "atomspell/dictionary_manager.hpp"

#include <iostream>
#include <system_error>

namespace atomspell {

DictionaryManager::DictionaryManager(DictionaryConfig config)
    : config_{std::move(config)} {}

std::shared_ptr<DictionaryManager::Slot>
DictionaryManager::slot_for(const Language &language) {
  std::lock_guard<std::mutex> lock(mu_);
  auto &slot = slots_[language];
  if (!slot) {
    slot = std::make_shared<Slot>();
  }
  return slot;
}

DictionaryOutcome DictionaryManager::get_dictionary(const Language &language) {
  if (language.is_auto()) {
    return {nullptr,
            DictStatus::failure(DictError::DictionaryNotFound,
                                "Auto-detect must be resolved to a language")};
  }

  auto slot = slot_for(language);
  std::lock_guard<std::mutex> load_lock(slot->load_mu);
  if (slot->dictionary) {
    return {slot->dictionary, DictStatus::success()};
  }

  auto dictionary = std::make_shared<Dictionary>(language, config_);
  DictStatus status = dictionary->load();
  if (status.fatal()) {
    std::cerr << kLogPrefix << "Warning: " << status.error << "\n";
    return {nullptr, std::move(status)};
  }

  slot->dictionary = dictionary;
  return {std::move(dictionary), std::move(status)};
}

DictionaryOutcome
DictionaryManager::reload_dictionary(const Language &language) {
  if (language.is_auto()) {
    return {nullptr,
            DictStatus::failure(DictError::DictionaryNotFound,
                                "Auto-detect must be resolved to a language")};
  }

  auto slot = slot_for(language);
  std::lock_guard<std::mutex> load_lock(slot->load_mu);

  auto dictionary = std::make_shared<Dictionary>(language, config_);
  DictStatus status = dictionary->load();
  if (status.fatal()) {
    std::cerr << kLogPrefix << "Warning: reload of " << language.name()
              << " failed: " << status.error << "\n";
    return {nullptr, std::move(status)};
  }

  slot->dictionary = dictionary;
  std::cerr << kLogPrefix << "Reloaded " << language.name() << " ("
            << dictionary->word_count() << " words)\n";
  return {std::move(dictionary), std::move(status)};
}

DictionaryOutcome
DictionaryManager::add_custom_dictionary(const std::filesystem::path &path,
                                         const Language &language) {
  if (language.is_auto()) {
    return {nullptr,
            DictStatus::failure(DictError::DictionaryNotFound,
                                "Auto-detect must be resolved to a language")};
  }

  auto dictionary = std::make_shared<Dictionary>(language, config_);
  DictStatus status = dictionary->load_from_file(path);
  if (status.fatal()) {
    return {nullptr, std::move(status)};
  }

  auto slot = slot_for(language);
  {
    std::lock_guard<std::mutex> load_lock(slot->load_mu);
    slot->dictionary = dictionary;
  }
  return {std::move(dictionary), std::move(status)};
}

std::shared_ptr<Dictionary>
DictionaryManager::cached(const Language &language) {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = slots_.find(language);
    if (it == slots_.end()) {
      return nullptr;
    }
    slot = it->second;
  }
  std::lock_guard<std::mutex> load_lock(slot->load_mu);
  return slot->dictionary;
}

void DictionaryManager::evict(const Language &language) {
  std::lock_guard<std::mutex> lock(mu_);
  slots_.erase(language);
}

std::vector<Language> DictionaryManager::available_languages() const {
  std::vector<Language> out;
  const auto dirs = dictionary_search_dirs(config_);

  for (const auto &language : Language::all()) {
    if (language.is_auto()) {
      continue;
    }
    bool found = false;
    for (std::string_view ext : {"csv", "txt"}) {
      for (const auto &dir : dirs) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(
                dir / language.dictionary_filename(ext), ec)) {
          found = true;
          break;
        }
      }
      if (found) {
        break;
      }
    }
    if (!found && config_.system_dictionaries) {
      found = find_hunspell_files(config_, language).has_value();
    }
    if (found) {
      out.push_back(language);
    }
  }
  return out;
}

} // namespace atomspell
