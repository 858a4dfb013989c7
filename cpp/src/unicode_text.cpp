/**
 * @file unicode_text.cpp
 * @brief Реализация UTF-8 утилит поверх ICU
 */

#include "atomspell/unicode_text.hpp"

#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/ucsdet.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <cstdint>
#include <limits>
#include <memory>

namespace atomspell {

namespace {

/// Длина UTF-8 символа по первому байту, 0 для невалидного байта
constexpr std::size_t utf8_char_len(unsigned char first_byte) noexcept {
  if ((first_byte & 0x80) == 0)
    return 1; // ASCII
  if ((first_byte & 0xE0) == 0xC0)
    return 2; // 110xxxxx
  if ((first_byte & 0xF0) == 0xE0)
    return 3; // 1110xxxx
  if ((first_byte & 0xF8) == 0xF0)
    return 4; // 11110xxx
  return 0;
}

/// Удаляет детектор кодировок ICU
struct CharsetDetectorCloser {
  void operator()(UCharsetDetector *det) const noexcept { ucsdet_close(det); }
};

using CharsetDetectorPtr =
    std::unique_ptr<UCharsetDetector, CharsetDetectorCloser>;

icu::UnicodeString to_unicode(std::string_view text) {
  return icu::UnicodeString::fromUTF8(
      icu::StringPiece(text.data(), static_cast<std::int32_t>(text.size())));
}

std::string to_utf8(const icu::UnicodeString &text) {
  std::string out;
  text.toUTF8String(out);
  return out;
}

/// Пробует интерпретировать байты в указанной кодировке
std::optional<std::string> convert_from(std::string_view bytes,
                                        const char *charset) {
  icu::UnicodeString decoded(bytes.data(),
                             static_cast<std::int32_t>(bytes.size()), charset);
  if (decoded.isBogus()) {
    return std::nullopt;
  }
  return to_utf8(decoded);
}

} // namespace

std::u32string decode_utf8(std::string_view text) {
  std::u32string result;
  result.reserve(text.size());

  const auto *s = reinterpret_cast<const std::uint8_t *>(text.data());
  const auto length = static_cast<std::int64_t>(text.size());
  std::int64_t i = 0;

  while (i < length) {
    UChar32 c = 0;
    U8_NEXT(s, i, length, c);
    result.push_back(c < 0 ? U'\uFFFD' : static_cast<char32_t>(c));
  }

  return result;
}

std::string encode_utf8(std::u32string_view code_points) {
  std::string result;
  result.reserve(code_points.size());

  for (char32_t c : code_points) {
    std::uint8_t buf[U8_MAX_LENGTH];
    std::int32_t len = 0;
    UBool error = false;
    U8_APPEND(buf, len, U8_MAX_LENGTH, static_cast<UChar32>(c), error);
    if (!error) {
      result.append(reinterpret_cast<const char *>(buf),
                    static_cast<std::size_t>(len));
    }
  }

  return result;
}

std::size_t char_count(std::string_view text) {
  std::size_t count = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    auto len = utf8_char_len(static_cast<unsigned char>(text[i]));
    i += (len == 0) ? 1 : len;
    ++count;
  }
  return count;
}

bool is_valid_utf8(std::string_view bytes) {
  const auto *s = reinterpret_cast<const std::uint8_t *>(bytes.data());
  const auto length = static_cast<std::int64_t>(bytes.size());
  std::int64_t i = 0;

  while (i < length) {
    UChar32 c = 0;
    U8_NEXT(s, i, length, c);
    if (c < 0) {
      return false;
    }
  }
  return true;
}

std::string_view trim(std::string_view sv) {
  constexpr std::string_view kSpace = " \t\r\n\f\v";
  const auto first = sv.find_first_not_of(kSpace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = sv.find_last_not_of(kSpace);
  return sv.substr(first, last - first + 1);
}

std::string to_lower(std::string_view text) {
  icu::UnicodeString u = to_unicode(text);
  u.toLower(icu::Locale::getRoot());
  return to_utf8(u);
}

std::string to_upper(std::string_view text) {
  icu::UnicodeString u = to_unicode(text);
  u.toUpper(icu::Locale::getRoot());
  return to_utf8(u);
}

std::string capitalize(std::string_view text) {
  std::u32string cps = decode_utf8(text);
  if (cps.empty()) {
    return {};
  }
  cps[0] = static_cast<char32_t>(u_totitle(static_cast<UChar32>(cps[0])));
  return encode_utf8(cps);
}

std::string lower_first(std::string_view text) {
  std::u32string cps = decode_utf8(text);
  if (cps.empty()) {
    return {};
  }
  cps[0] = static_cast<char32_t>(u_tolower(static_cast<UChar32>(cps[0])));
  return encode_utf8(cps);
}

bool is_cjk_text(std::string_view text) {
  for (char32_t c : decode_utf8(text)) {
    if (is_cjk_code_point(c)) {
      return true;
    }
  }
  return false;
}

std::optional<DecodedText> decode_to_utf8(std::string_view bytes) {
  if (is_valid_utf8(bytes)) {
    return DecodedText{std::string{bytes}, "UTF-8", false};
  }

  if (bytes.size() >
      static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
    return std::nullopt;
  }

  UErrorCode status = U_ZERO_ERROR;
  CharsetDetectorPtr det{ucsdet_open(&status)};
  if (U_SUCCESS(status) && det) {
    ucsdet_setText(det.get(), bytes.data(),
                   static_cast<std::int32_t>(bytes.size()), &status);
    const UCharsetMatch *match = ucsdet_detect(det.get(), &status);
    if (U_SUCCESS(status) && match != nullptr) {
      const char *name = ucsdet_getName(match, &status);
      if (U_SUCCESS(status) && name != nullptr) {
        if (auto text = convert_from(bytes, name)) {
          return DecodedText{std::move(*text), name, true};
        }
      }
    }
  }

  // Детектор не справился — однобайтовая западная кодировка
  if (auto text = convert_from(bytes, "windows-1252")) {
    return DecodedText{std::move(*text), "windows-1252", true};
  }

  return std::nullopt;
}

} // namespace atomspell
