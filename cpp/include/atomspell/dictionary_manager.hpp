/**
 * @file dictionary_manager.hpp
 * @brief Кеш словарей: не более одного экземпляра на язык
 */

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "atomspell/config.hpp"
#include "atomspell/dictionary.hpp"
#include "atomspell/language.hpp"
#include "atomspell/types.hpp"

namespace atomspell {

/// Словарь вместе с результатом его загрузки
struct DictionaryOutcome {
  std::shared_ptr<Dictionary> dictionary; ///< nullptr при фатальной ошибке
  DictStatus status;

  [[nodiscard]] bool ok() const noexcept { return dictionary != nullptr; }
};

/**
 * @brief Владеет словарями по языкам
 *
 * Загрузка ленивая. Для каждого языка есть свой слот со своей блокировкой:
 * параллельные запросы одного языка ждут единственную загрузку, запросы
 * разных языков друг друга не блокируют.
 */
class DictionaryManager {
public:
  explicit DictionaryManager(DictionaryConfig config);

  DictionaryManager(const DictionaryManager &) = delete;
  DictionaryManager &operator=(const DictionaryManager &) = delete;

  /**
   * @brief Возвращает словарь языка, загружая его при первом обращении
   *
   * AutoDetect нужно разрешить до вызова: для него DictionaryNotFound.
   * Неудачная загрузка не кешируется, следующий вызов попробует снова.
   */
  [[nodiscard]] DictionaryOutcome get_dictionary(const Language &language);

  /**
   * @brief Загружает словарь заново и заменяет запись в кеше
   *
   * Уже выданные shared_ptr продолжают указывать на старый экземпляр.
   */
  [[nodiscard]] DictionaryOutcome reload_dictionary(const Language &language);

  /**
   * @brief Загружает явно указанный файл как базовый список языка
   */
  [[nodiscard]] DictionaryOutcome
  add_custom_dictionary(const std::filesystem::path &path,
                        const Language &language);

  /// Словарь из кеша без загрузки
  [[nodiscard]] std::shared_ptr<Dictionary> cached(const Language &language);

  /// Удаляет словарь из кеша
  void evict(const Language &language);

  /**
   * @brief Языки, для которых найден базовый список в каталогах поиска
   */
  [[nodiscard]] std::vector<Language> available_languages() const;

  [[nodiscard]] const DictionaryConfig &config() const noexcept {
    return config_;
  }

private:
  struct Slot {
    std::mutex load_mu;
    std::shared_ptr<Dictionary> dictionary;
  };

  [[nodiscard]] std::shared_ptr<Slot> slot_for(const Language &language);

  DictionaryConfig config_;

  std::mutex mu_;
  std::unordered_map<Language, std::shared_ptr<Slot>> slots_;
};

} // namespace atomspell
