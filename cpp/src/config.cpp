/**
 * @file config.cpp
 * @brief Реализация загрузчика конфигурации
 */

#include "atomspell/config.hpp"
#include "atomspell/unicode_text.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace atomspell {

namespace {

/// Парсит неотрицательное целое число из строки
std::optional<std::size_t> parse_size(std::string_view sv) {
  sv = trim(sv);
  std::size_t value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec == std::errc{} && ptr == sv.data() + sv.size()) {
    return value;
  }
  return std::nullopt;
}

/// Парсит число с плавающей точкой из строки
std::optional<double> parse_double(std::string_view sv) {
  sv = trim(sv);
  // std::from_chars для double не везде поддерживается, используем strtod
  std::string str{sv};
  if (str.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  double value = std::strtod(str.c_str(), &end);
  if (end == str.c_str() + str.size()) {
    return value;
  }
  return std::nullopt;
}

/// Парсит булево значение из строки
std::optional<bool> parse_bool(std::string_view sv) {
  sv = trim(sv);
  if (sv == "true" || sv == "yes" || sv == "1" || sv == "on") {
    return true;
  }
  if (sv == "false" || sv == "no" || sv == "0" || sv == "off") {
    return false;
  }
  return std::nullopt;
}

/// Снимает кавычки YAML со строкового значения
std::string_view unquote(std::string_view sv) {
  if (sv.size() >= 2 && ((sv.front() == '"' && sv.back() == '"') ||
                         (sv.front() == '\'' && sv.back() == '\''))) {
    sv.remove_prefix(1);
    sv.remove_suffix(1);
  }
  return sv;
}

std::vector<std::filesystem::path> parse_path_list(std::string_view value) {
  std::vector<std::filesystem::path> paths;
  for (auto &item : parse_list(value)) {
    paths.emplace_back(std::move(item));
  }
  return paths;
}

/// Получает путь к user config (~/.config/atomspell/config.yaml)
std::string get_user_config_path() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::string(home) + "/" + std::string(kUserConfigRelPath);
  }
  return "";
}

void apply_checker_key(CheckerConfig &cfg, std::string_view key,
                       std::string_view value) {
  if (key == "suggestions_enabled") {
    if (auto val = parse_bool(value)) {
      cfg.suggestions_enabled = *val;
    }
  } else if (key == "case_sensitive") {
    if (auto val = parse_bool(value)) {
      cfg.case_sensitive = *val;
    }
  } else if (key == "max_suggestions") {
    if (auto val = parse_size(value)) {
      cfg.max_suggestions = *val;
    }
  } else if (key == "confidence_threshold") {
    if (auto val = parse_double(value)) {
      cfg.confidence_threshold = *val;
    }
  } else if (key == "max_edit_distance") {
    if (auto val = parse_size(value)) {
      cfg.max_edit_distance = *val;
    }
  }
}

void apply_dictionary_key(DictionaryConfig &cfg, std::string_view key,
                          std::string_view value) {
  if (key == "default_language") {
    cfg.default_language = Language::from_code(unquote(value));
  } else if (key == "min_word_length") {
    if (auto val = parse_size(value)) {
      cfg.min_word_length = *val;
    }
  } else if (key == "user_data_dir") {
    auto dir = unquote(value);
    if (!dir.empty()) {
      cfg.user_data_dir = std::string{dir};
    }
  } else if (key == "search_dirs") {
    cfg.search_dirs = parse_path_list(value);
  } else if (key == "system_dictionaries") {
    if (auto val = parse_bool(value)) {
      cfg.system_dictionaries = *val;
    }
  } else if (key == "hunspell_dirs") {
    cfg.hunspell_dirs = parse_path_list(value);
  } else if (key == "load_threads") {
    if (auto val = parse_size(value)) {
      cfg.load_threads = *val;
    }
  }
}

void apply_analyzer_key(AnalyzerConfig &cfg, std::string_view key,
                        std::string_view value) {
  if (key == "worker_threads") {
    if (auto val = parse_size(value)) {
      cfg.worker_threads = *val;
    }
  } else if (key == "parallel_min_lines") {
    if (auto val = parse_size(value)) {
      cfg.parallel_min_lines = *val;
    }
  } else if (key == "acronyms") {
    cfg.acronyms = parse_list(value);
  } else if (key == "proper_nouns") {
    cfg.proper_nouns = parse_list(value);
  }
}

} // namespace

std::filesystem::path default_user_data_dir() {
  if (const char *xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
    return std::filesystem::path{xdg} / "atomspell";
  }
  if (const char *home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path{home} / std::string{kUserDataRelPath};
  }
  return std::filesystem::path{".atomspell"};
}

std::vector<std::string> parse_list(std::string_view value) {
  std::vector<std::string> items;
  value = unquote(trim(value));
  // Допускаем YAML flow-список: [a, b, c]
  if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
    value = value.substr(1, value.size() - 2);
  }

  while (!value.empty()) {
    auto comma = value.find(',');
    auto item = unquote(trim(value.substr(0, comma)));
    if (!item.empty()) {
      items.emplace_back(item);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    value.remove_prefix(comma + 1);
  }
  return items;
}

bool validate_config(const Config &config, std::string *reason) {
  auto fail = [reason](const char *msg) {
    if (reason) {
      *reason = msg;
    }
    return false;
  };

  const auto &checker = config.checker;
  if (!(checker.confidence_threshold >= 0.0 &&
        checker.confidence_threshold <= 1.0)) {
    return fail("checker.confidence_threshold must be within [0, 1]");
  }
  if (checker.max_suggestions > 50) {
    return fail("checker.max_suggestions must not exceed 50");
  }
  if (checker.max_edit_distance == 0 || checker.max_edit_distance > 4) {
    return fail("checker.max_edit_distance must be within [1, 4]");
  }

  if (config.dictionary.min_word_length == 0 ||
      config.dictionary.min_word_length > 16) {
    return fail("dictionary.min_word_length must be within [1, 16]");
  }
  if (config.dictionary.default_language.is_auto()) {
    return fail("dictionary.default_language must be a concrete language");
  }

  if (config.analyzer.parallel_min_lines == 0) {
    return fail("analyzer.parallel_min_lines must be positive");
  }

  return true;
}

Config parse_config_stream(std::istream &in) {
  Config config;

  std::string line;
  std::string current_section;

  while (std::getline(in, line)) {
    std::string_view sv = trim(line);

    // Пропуск пустых строк и комментариев
    if (sv.empty() || sv.front() == '#') {
      continue;
    }

    // Комментарий в конце строки
    if (auto hash = sv.find(" #"); hash != std::string_view::npos) {
      sv = trim(sv.substr(0, hash));
    }

    auto colon_pos = sv.find(':');
    if (colon_pos == std::string_view::npos) {
      continue;
    }

    std::string_view key = trim(sv.substr(0, colon_pos));
    std::string_view value = trim(sv.substr(colon_pos + 1));

    // Заголовок секции: "checker:" без значения в начале строки
    const bool top_level = !line.empty() && line.front() != ' ' &&
                           line.front() != '\t';
    if (value.empty() && top_level) {
      current_section = std::string{key};
      continue;
    }

    if (current_section == "checker") {
      apply_checker_key(config.checker, key, value);
    } else if (current_section == "dictionary") {
      apply_dictionary_key(config.dictionary, key, value);
    } else if (current_section == "analyzer") {
      apply_analyzer_key(config.analyzer, key, value);
    }
  }

  return config;
}

ConfigLoadOutcome load_config_checked(std::filesystem::path path) {
  ConfigLoadOutcome out;
  out.used_path = std::move(path);

  if (out.used_path.empty()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Empty config path";
    return out;
  }

  std::ifstream file{out.used_path};
  if (!file.is_open()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Config file not found: " + out.used_path.string();
    return out;
  }

  out.config = parse_config_stream(file);
  out.config.config_path = out.used_path;

  if (file.bad()) {
    out.result = ConfigResult::ParseError;
    out.error = "Failed to read config: " + out.used_path.string();
    out.config = Config{};
    return out;
  }

  std::string reason;
  if (!validate_config(out.config, &reason)) {
    out.result = ConfigResult::InvalidValue;
    out.error =
        "Invalid configuration in: " + out.used_path.string() + " (" + reason +
        ")";
    out.config = Config{};
    return out;
  }

  out.result = ConfigResult::Ok;
  return out;
}

Config load_config(std::string_view path) {
  // Best-effort логика: если запрошен дефолтный путь, пробуем user-config
  // первым.
  std::filesystem::path effective_path{std::string{path}};

  if (path == kConfigPath) {
    std::string user_path = get_user_config_path();
    if (!user_path.empty()) {
      std::error_code ec;
      bool exists = std::filesystem::exists(user_path, ec);
      if (!ec && exists) {
        effective_path = user_path;
        std::cerr << kLogPrefix << "Using user config: " << user_path << "\n";
      }
    }
  }

  ConfigLoadOutcome out = load_config_checked(effective_path);
  if (out.result != ConfigResult::Ok) {
    // Файл не найден/битый — используем дефолты.
    if (!out.error.empty()) {
      std::cerr << kLogPrefix << "Warning: " << out.error << "\n";
    }
    return Config{};
  }

  return out.config;
}

} // namespace atomspell
