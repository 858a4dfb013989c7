/**
 * @file language.cpp
 * @brief Каталог языков и эвристика определения языка
 */

#include "atomspell/language.hpp"
#include "atomspell/unicode_text.hpp"

#include <algorithm>
#include <array>
#include <unordered_map>
#include <unordered_set>

namespace atomspell {

namespace {

/// Строка каталога: всё, что известно о встроенном языке
struct CatalogEntry {
  LanguageId id;
  std::string_view code;
  std::string_view name;
  std::string_view hunspell_locale;
  std::string_view alias2;
  std::string_view alias_name;
};

constexpr std::array<CatalogEntry, 12> kCatalog = {{
    {LanguageId::English, "eng", "English", "en_US", "en", "english"},
    {LanguageId::Afrikaans, "afr", "Afrikaans", "af_ZA", "af", "afrikaans"},
    {LanguageId::French, "fra", "French", "fr_FR", "fr", "french"},
    {LanguageId::Spanish, "spa", "Spanish", "es_ES", "es", "spanish"},
    {LanguageId::German, "deu", "German", "de_DE", "de", "german"},
    {LanguageId::Chinese, "zho", "Chinese", "zh_CN", "zh", "chinese"},
    {LanguageId::Italian, "ita", "Italian", "it_IT", "it", "italian"},
    {LanguageId::Portuguese, "por", "Portuguese", "pt_PT", "pt", "portuguese"},
    {LanguageId::Russian, "rus", "Russian", "ru_RU", "ru", "russian"},
    {LanguageId::Japanese, "jpn", "Japanese", "ja_JP", "ja", "japanese"},
    {LanguageId::Korean, "kor", "Korean", "ko_KR", "ko", "korean"},
    {LanguageId::AutoDetect, "auto", "Auto-detect", "", "autodetect", "auto-detect"},
}};

[[nodiscard]] const CatalogEntry *find_entry(LanguageId id) noexcept {
  for (const auto &entry : kCatalog) {
    if (entry.id == id) {
      return &entry;
    }
  }
  return nullptr;
}

/// Анализируется не больше стольких слов
constexpr std::size_t kDetectWordLimit = 50;

/// Язык попадает в выдачу только с оценкой выше этой
constexpr double kMinReportedScore = 10.0;

/// Порог уверенности detect_language
constexpr double kDetectAcceptScore = 25.0;

/// Доля CJK символов, начиная с которой текст считается CJK
constexpr double kCjkRatio = 0.3;

using WordSet = std::unordered_set<std::string_view>;

/// Частотные служебные слова (ленивая инициализация)
const std::vector<std::pair<LanguageId, WordSet>> &common_words() {
  static const std::vector<std::pair<LanguageId, WordSet>> table = {
      {LanguageId::English,
       {"the",   "and",   "that",  "have",  "for",   "with",   "this",
        "from",  "they",  "would", "will",  "what",  "there",  "their",
        "about", "which", "when",  "who",   "them",  "some",   "time",
        "could", "people", "other", "than", "then",  "now",    "look",
        "only",  "come",  "its",   "over",  "think", "also",   "back",
        "after", "use",   "two",   "how",   "our",   "work",   "first",
        "well",  "way",   "even",  "new",   "want"}},
      {LanguageId::Afrikaans,
       {"die",  "en",   "het",  "vir",   "om",    "wat",     "in",
        "is",   "jy",   "ek",   "nie",   "sy",    "ons",     "hulle",
        "daar", "maar", "my",   "haar",  "so",    "by",      "kan",
        "van",  "dit",  "te",   "met",   "hy",    "was",     "op",
        "een",  "toe",  "gaan", "moet",  "nog",   "al",      "uit",
        "sê",   "baie", "hier", "wees",  "gewees", "word",   "waar",
        "kom",  "laat", "dink", "sien"}},
      {LanguageId::French,
       {"le",    "la",   "et",    "que",  "dans",    "un",    "est",
        "pour",  "des",  "les",   "une",  "pas",     "son",   "avec",
        "il",    "elle", "qui",   "mais", "nous",    "vous",  "ce",
        "se",    "aux",  "du",    "de",   "par",     "sur",   "sont",
        "cette", "été",  "plus",  "pouvoir", "comme", "tout", "faire",
        "me",    "même", "sans",  "autre", "aussi",  "bien",  "si",
        "y",     "ou",   "où",    "lui",  "donc"}},
      {LanguageId::Spanish,
       {"el",   "la",    "de",     "que",   "y",     "a",     "en",
        "un",   "ser",   "se",     "no",    "haber", "por",   "con",
        "su",   "para",  "como",   "estar", "tener", "le",    "lo",
        "todo", "pero",  "más",    "hacer", "o",     "poder", "decir",
        "este", "ir",    "otro",   "ese",   "si",    "me",    "ya",
        "ver",  "porque", "dar",   "cuando", "él",   "muy",   "sin",
        "vez",  "mucho", "saber",  "qué",   "sobre", "mi",    "alguno"}},
      {LanguageId::German,
       {"der",   "die",  "und",  "in",    "den",  "von",  "zu",
        "das",   "mit",  "sich", "des",   "auf",  "für",  "ist",
        "im",    "dem",  "nicht", "ein",  "eine", "als",  "auch",
        "es",    "an",   "werden", "aus", "er",   "hat",  "dass",
        "sie",   "nach", "wird", "bei",   "einer", "um",  "am",
        "sind",  "noch", "wie"}},
  };
  return table;
}

/// Разбивает текст по пробельным символам ASCII
std::vector<std::string_view> split_whitespace(std::string_view text,
                                               std::size_t limit) {
  constexpr std::string_view kSpace = " \t\r\n\f\v";
  std::vector<std::string_view> words;
  std::size_t pos = 0;
  while (words.size() < limit) {
    pos = text.find_first_not_of(kSpace, pos);
    if (pos == std::string_view::npos) {
      break;
    }
    auto end = text.find_first_of(kSpace, pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    words.push_back(text.substr(pos, end - pos));
    pos = end;
  }
  return words;
}

/**
 * @brief Выбирает CJK язык по письменности
 *
 * Кана однозначно указывает на японский, хангыль на корейский,
 * иероглифы без каны на китайский.
 */
Language cjk_language(const std::u32string &cps) {
  bool has_kana = false;
  bool has_hangul = false;
  bool has_han = false;
  for (char32_t c : cps) {
    if (c >= 0x3040 && c <= 0x30FF) {
      has_kana = true;
    } else if (c >= 0xAC00 && c <= 0xD7AF) {
      has_hangul = true;
    } else if (c >= 0x4E00 && c <= 0x9FFF) {
      has_han = true;
    }
  }
  if (has_kana) {
    return LanguageId::Japanese;
  }
  if (has_hangul && !has_han) {
    return LanguageId::Korean;
  }
  return has_han ? LanguageId::Chinese : LanguageId::Korean;
}

} // namespace

// ===========================================================================
// Language
// ===========================================================================

Language Language::custom(std::string code) {
  Language lang{LanguageId::Custom};
  lang.custom_code_ = std::move(code);
  return lang;
}

Language Language::from_code(std::string_view code) {
  const std::string key = to_lower(trim(code));
  if (key.empty()) {
    return LanguageId::English;
  }
  for (const auto &entry : kCatalog) {
    if (key == entry.code || key == entry.alias2 || key == entry.alias_name) {
      return entry.id;
    }
  }
  return custom(key);
}

const std::vector<Language> &Language::all() {
  static const std::vector<Language> languages = [] {
    std::vector<Language> out;
    out.reserve(kCatalog.size());
    for (const auto &entry : kCatalog) {
      out.emplace_back(entry.id);
    }
    return out;
  }();
  return languages;
}

std::string_view Language::code() const noexcept {
  if (id_ == LanguageId::Custom) {
    return custom_code_;
  }
  const auto *entry = find_entry(id_);
  return entry ? entry->code : std::string_view{};
}

std::string Language::name() const {
  if (id_ == LanguageId::Custom) {
    return "Custom (" + custom_code_ + ")";
  }
  const auto *entry = find_entry(id_);
  return entry ? std::string{entry->name} : std::string{};
}

std::string_view Language::hunspell_locale() const noexcept {
  const auto *entry = find_entry(id_);
  return entry ? entry->hunspell_locale : std::string_view{};
}

bool Language::is_cjk() const noexcept {
  switch (id_) {
  case LanguageId::Chinese:
  case LanguageId::Japanese:
  case LanguageId::Korean:
    return true;
  case LanguageId::English:
  case LanguageId::Afrikaans:
  case LanguageId::French:
  case LanguageId::Spanish:
  case LanguageId::German:
  case LanguageId::Italian:
  case LanguageId::Portuguese:
  case LanguageId::Russian:
  case LanguageId::AutoDetect:
  case LanguageId::Custom:
    return false;
  }
  return false;
}

std::string Language::dictionary_filename(std::string_view extension) const {
  if (is_auto()) {
    return {};
  }
  std::string name = "dictionary(";
  name += code();
  name += ").";
  name += extension;
  return name;
}

// ===========================================================================
// Нормализация
// ===========================================================================

std::string normalize_word(std::string_view word, const Language &language) {
  const std::string_view trimmed = trim(word);

  switch (language.id()) {
  case LanguageId::Chinese:
  case LanguageId::Japanese:
  case LanguageId::Korean:
    return std::string{trimmed};
  case LanguageId::English:
  case LanguageId::Afrikaans:
  case LanguageId::French:
  case LanguageId::Spanish:
  case LanguageId::German:
  case LanguageId::Italian:
  case LanguageId::Portuguese:
  case LanguageId::Russian:
  case LanguageId::AutoDetect:
  case LanguageId::Custom:
    return to_lower(trimmed);
  }
  return to_lower(trimmed);
}

// ===========================================================================
// Определение языка
// ===========================================================================

std::vector<LanguageScore> detect_language_scores(std::string_view text) {
  std::unordered_map<LanguageId, double> scores;

  // CJK письменности не разделяют слова пробелами, поэтому проверяются первыми
  const std::u32string cps = decode_utf8(text);
  if (!cps.empty()) {
    const auto cjk = static_cast<double>(
        std::count_if(cps.begin(), cps.end(), is_cjk_code_point));
    if (cjk / static_cast<double>(cps.size()) > kCjkRatio) {
      scores[cjk_language(cps).id()] = 100.0;
    }
  }

  const std::string lowered = to_lower(text);
  const auto words = split_whitespace(lowered, kDetectWordLimit);

  if (scores.empty() && words.size() < 3) {
    return {{Language{LanguageId::English}, 100.0}};
  }

  if (!words.empty()) {
    for (const auto &[id, vocabulary] : common_words()) {
      std::size_t matches = 0;
      for (auto word : words) {
        if (vocabulary.contains(word)) {
          ++matches;
        }
      }
      const double score = static_cast<double>(matches) /
                           static_cast<double>(words.size()) * 100.0;
      if (score > kMinReportedScore) {
        scores.emplace(id, score);
      }
    }
  }

  if (scores.empty()) {
    scores[LanguageId::English] = 80.0;
  }

  std::vector<LanguageScore> sorted;
  sorted.reserve(scores.size());
  for (const auto &[id, score] : scores) {
    sorted.push_back({Language{id}, score});
  }
  std::sort(sorted.begin(), sorted.end(),
            [](const LanguageScore &a, const LanguageScore &b) {
              if (a.score != b.score) {
                return a.score > b.score;
              }
              return a.language.id() < b.language.id();
            });
  if (sorted.size() > 3) {
    sorted.resize(3);
  }
  return sorted;
}

Language detect_language(std::string_view text) {
  const auto scores = detect_language_scores(text);
  if (!scores.empty() && scores.front().score > kDetectAcceptScore) {
    return scores.front().language;
  }
  return LanguageId::English;
}

} // namespace atomspell
