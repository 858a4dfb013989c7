/**
 * @file tokenizer.cpp
 * @brief Токенизация на регулярных выражениях ICU
 */

#include "atomspell/tokenizer.hpp"
#include "atomspell/types.hpp"
#include "atomspell/unicode_text.hpp"

#include <unicode/parseerr.h>
#include <unicode/unistr.h>

#include <array>
#include <stdexcept>

namespace atomspell {

namespace {

// clang-format off
constexpr std::string_view kProseRegex = R"(\b\p{L}[\p{L}'\-]*\b)";
constexpr std::string_view kCjkRegex =
    R"([\p{Han}\p{Hiragana}\p{Katakana}\p{Hangul}]+|\p{Latin}[\p{Latin}'\-]*)";
constexpr std::string_view kCodeRegex = R"(\b[A-Za-z][A-Za-z_'\-]{2,}\b)";

/// Расширения файлов исходного кода и разметки
constexpr std::array<std::string_view, 54> kCodeExtensions = {
    "rs", "py", "js", "ts", "jsx", "tsx", "java", "cpp", "c", "cc",
    "go", "rb", "php", "cs", "swift", "kt", "scala", "hs", "lua",
    "pl", "r", "m", "f", "f90", "f95", "f03", "f08", "v", "sv",
    "vhd", "vhdl", "asm", "s", "sh", "bash", "zsh", "fish",
    "ps1", "bat", "cmd", "yml", "yaml", "toml", "json", "xml", "html",
    "htm", "css", "scss", "less", "md", "markdown", "tex", "bib",
};

/// Подстроки, выдающие строку исходного кода
constexpr std::array<std::string_view, 16> kCodeMarkers = {
    "{", "}", "->", "=>", "fn ", "def ", "function ", "class ",
    "import ", "export ", "#include", "pub ", "let ", "const ", "var ",
    "return ",
};
// clang-format on

constexpr std::size_t kCodeScanLines = 10;
constexpr std::size_t kCodeMinIndicators = 2;

std::unique_ptr<icu::RegexPattern> compile(std::string_view source) {
  UErrorCode status = U_ZERO_ERROR;
  UParseError parse_error{};
  std::unique_ptr<icu::RegexPattern> pattern{icu::RegexPattern::compile(
      icu::UnicodeString::fromUTF8(icu::StringPiece(
          source.data(), static_cast<std::int32_t>(source.size()))),
      0, parse_error, status)};
  if (U_FAILURE(status) || !pattern) {
    throw std::runtime_error("ICU regex compile failed: " +
                             std::string{u_errorName(status)});
  }
  return pattern;
}

/// Скомпилированные шаблоны (ленивая потокобезопасная инициализация)
const icu::RegexPattern &compiled(TokenPattern pattern) {
  static const auto prose = compile(kProseRegex);
  static const auto cjk = compile(kCjkRegex);
  static const auto code = compile(kCodeRegex);

  switch (pattern) {
  case TokenPattern::Prose:
    return *prose;
  case TokenPattern::Cjk:
    return *cjk;
  case TokenPattern::Code:
    return *code;
  }
  return *prose;
}

[[nodiscard]] bool is_code_line(std::string_view line) {
  const std::string_view trimmed = trim(line);
  if (trimmed.find(';') != std::string_view::npos &&
      !trimmed.starts_with("//")) {
    return true;
  }
  for (auto marker : kCodeMarkers) {
    if (trimmed.find(marker) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

// ===========================================================================
// Контекст документа
// ===========================================================================

bool is_code_file(std::string_view filename) {
  const auto slash = filename.find_last_of("/\\");
  if (slash != std::string_view::npos) {
    filename.remove_prefix(slash + 1);
  }
  const auto dot = filename.rfind('.');
  if (dot == std::string_view::npos || dot + 1 >= filename.size()) {
    return false;
  }

  const std::string ext = to_lower(filename.substr(dot + 1));
  for (auto known : kCodeExtensions) {
    if (ext == known) {
      return true;
    }
  }
  return false;
}

bool is_likely_code(std::string_view text) {
  std::size_t indicators = 0;
  std::size_t scanned = 0;
  for (auto line : split_lines(text)) {
    if (scanned++ >= kCodeScanLines) {
      break;
    }
    if (is_code_line(line) && ++indicators >= kCodeMinIndicators) {
      return true;
    }
  }
  return false;
}

TokenContext select_token_context(const Language &language,
                                  std::optional<std::string_view> filename,
                                  std::string_view text) {
  TokenContext ctx;
  ctx.code_context =
      (filename.has_value() && is_code_file(*filename)) || is_likely_code(text);

  if (language.is_cjk()) {
    ctx.pattern = TokenPattern::Cjk;
  } else if (ctx.code_context) {
    ctx.pattern = TokenPattern::Code;
  } else {
    ctx.pattern = TokenPattern::Prose;
  }
  return ctx;
}

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
      nl = text.size();
    }
    std::string_view line = text.substr(pos, nl - pos);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    pos = nl + 1;
  }
  return lines;
}

// ===========================================================================
// LineTokenizer
// ===========================================================================

LineTokenizer::LineTokenizer(TokenPattern pattern) {
  UErrorCode status = U_ZERO_ERROR;
  matcher_.reset(compiled(pattern).matcher(status));
  if (U_FAILURE(status) || !matcher_) {
    throw std::runtime_error("ICU matcher creation failed: " +
                             std::string{u_errorName(status)});
  }
}

LineTokenizer::~LineTokenizer() {
  // Matcher держит клон UText, освобождаем его первым
  matcher_.reset();
  if (text_ != nullptr) {
    utext_close(text_);
  }
}

void LineTokenizer::reset(std::string_view line) {
  line_ = line;

  UErrorCode status = U_ZERO_ERROR;
  text_ = utext_openUTF8(text_, line.data(),
                         static_cast<std::int64_t>(line.size()), &status);
  if (U_FAILURE(status)) {
    line_ = {};
    return;
  }
  matcher_->reset(text_);
}

std::optional<Token> LineTokenizer::next() {
  if (line_.empty()) {
    return std::nullopt;
  }

  UErrorCode status = U_ZERO_ERROR;
  while (matcher_->find(status)) {
    const std::int64_t start = matcher_->start64(status);
    const std::int64_t end = matcher_->end64(status);
    if (U_FAILURE(status) || start < 0 || end <= start) {
      break;
    }

    const auto s = static_cast<std::size_t>(start);
    const auto e = static_cast<std::size_t>(end);
    std::string_view text = line_.substr(s, e - s);
    if (char_count(text) < kMinTokenChars) {
      continue;
    }
    return Token{std::string{text}, s, e};
  }
  return std::nullopt;
}

std::vector<Token> tokenize_line(std::string_view line, TokenPattern pattern) {
  std::vector<Token> tokens;
  LineTokenizer tokenizer{pattern};
  tokenizer.reset(line);
  while (auto token = tokenizer.next()) {
    tokens.push_back(std::move(*token));
  }
  return tokens;
}

} // namespace atomspell
