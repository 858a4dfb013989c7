/**
 * @file bloom_filter.hpp
 * @brief Вероятностный предфильтр для быстрого отсечения отсутствующих слов
 *
 * Bloom Filter за O(1) отвечает:
 * - "Точно НЕТ в словаре" (100% достоверность)
 * - "ВОЗМОЖНО есть" (требует проверки в хеш-таблице)
 *
 * Большинство опечаток отсекается без обращения к unordered_set.
 */

#pragma once

#include "atomspell/hasher.hpp"

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace atomspell {

/**
 * @brief Компактный Bloom Filter для словарного lookup
 *
 * Параметры:
 * - Размер: 2^21 бит = 256 KB
 * - k = 7 хеш-функций
 * - Ожидаемый false positive rate: ~1% при 200k словах
 */
class BloomFilter {
public:
  static constexpr std::size_t kBitCount = 1U << 21;
  static constexpr std::size_t kHashCount = 7;
  // Маска для быстрого модуля (размер — степень двойки)
  static constexpr std::uint64_t kMask = kBitCount - 1;

  BloomFilter() = default;

  /**
   * @brief Добавляет нормализованное слово в фильтр
   */
  void add(std::string_view word) noexcept {
    std::uint64_t h1 = 0;
    std::uint64_t h2 = 0;
    Hasher::hash_string_double(word, h1, h2);
    for (std::size_t i = 0; i < kHashCount; ++i) {
      bits_[static_cast<std::size_t>((h1 + i * h2) & kMask)] = true;
    }
  }

  /**
   * @brief Проверяет, может ли слово быть в словаре
   * @return false = точно НЕТ, true = возможно есть
   */
  [[nodiscard]] bool maybe_contains(std::string_view word) const noexcept {
    std::uint64_t h1 = 0;
    std::uint64_t h2 = 0;
    Hasher::hash_string_double(word, h1, h2);
    for (std::size_t i = 0; i < kHashCount; ++i) {
      if (!bits_[static_cast<std::size_t>((h1 + i * h2) & kMask)]) {
        return false;
      }
    }
    return true;
  }

  void clear() noexcept { bits_.reset(); }

  /**
   * @brief Возвращает заполненность фильтра (0.0 - 1.0)
   */
  [[nodiscard]] double fill_ratio() const noexcept {
    return static_cast<double>(bits_.count()) / static_cast<double>(kBitCount);
  }

private:
  std::bitset<kBitCount> bits_;
};

} // namespace atomspell
