/**
 * @file correctness_cache.hpp
 * @brief Потокобезопасный кеш результатов проверки слов
 *
 * Ключ — язык и нормализованное слово (плюс категория и признак кода,
 * от которых зависит ответ). Записи не устаревают; весь кеш очищается
 * при смене языка или перезагрузке словаря.
 */

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "atomspell/types.hpp"

namespace atomspell {

class CorrectnessCache {
public:
  CorrectnessCache() = default;

  CorrectnessCache(const CorrectnessCache &) = delete;
  CorrectnessCache &operator=(const CorrectnessCache &) = delete;

  /**
   * @brief Строит ключ кеша
   * @param language_code Код языка ("eng")
   * @param word Нормализованное слово (или исходное при учёте регистра)
   */
  [[nodiscard]] static std::string make_key(std::string_view language_code,
                                            std::string_view word,
                                            WordCategory category,
                                            bool is_code_context) {
    std::string key;
    key.reserve(language_code.size() + word.size() + 4);
    key.append(language_code);
    key.push_back('\x1f');
    key.append(word);
    key.push_back('\x1f');
    key.push_back(static_cast<char>('0' + static_cast<int>(category)));
    key.push_back(is_code_context ? 'c' : 'p');
    return key;
  }

  [[nodiscard]] std::optional<bool> get(const std::string &key) const {
    std::shared_lock lock(mu_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  /// Ответы для одного ключа детерминированы, последняя запись побеждает
  void insert(std::string key, bool correct) {
    std::unique_lock lock(mu_);
    map_.insert_or_assign(std::move(key), correct);
  }

  void clear() {
    std::unique_lock lock(mu_);
    map_.clear();
  }

  [[nodiscard]] std::size_t size() const {
    std::shared_lock lock(mu_);
    return map_.size();
  }

private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, bool> map_;
};

} // namespace atomspell
