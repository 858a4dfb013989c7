/**
 * @file hasher.hpp
 * @brief FNV-1a хеширование нормализованных слов
 *
 * Используется Bloom-фильтром словаря: слова хешируются как байты UTF-8
 * после нормализации, поэтому одинаковые слова всегда дают один хеш.
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace atomspell {

/**
 * @brief FNV-1a 64-bit хешер
 */
class Hasher {
public:
  // FNV-1a константы для 64-bit
  static constexpr std::uint64_t kFnvBasis = 14695981039346656037ULL;
  static constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

  /**
   * @brief Хеширует строку побайтно
   * @param str Нормализованное слово (UTF-8)
   * @return 64-bit хеш
   */
  [[nodiscard]] static constexpr std::uint64_t
  hash_string(std::string_view str) noexcept {
    std::uint64_t hash = kFnvBasis;
    for (char c : str) {
      hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
      hash *= kFnvPrime;
    }
    return hash;
  }

  /**
   * @brief Вычисляет два хеша для double hashing: h_i = h1 + i * h2
   */
  static constexpr void hash_string_double(std::string_view str,
                                           std::uint64_t &h1,
                                           std::uint64_t &h2) noexcept {
    h1 = hash_string(str);
    h2 = (h1 >> 17) | (h1 << 47);
    h2 *= kFnvPrime;
    h2 ^= (h1 >> 31);
    h2 |= 1; // нечётный шаг обходит все позиции
  }
};

} // namespace atomspell
