/**
 * @file word_list.cpp
 * @brief Разбор и атомарная запись списков слов
 */

#include "atomspell/word_list.hpp"
#include "atomspell/unicode_text.hpp"
#include "atomspell/worker_pool.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <sstream>
#include <system_error>

namespace atomspell {

namespace {

/// Фрагмент строк файла для параллельного разбора
struct ParseChunk {
  std::span<const std::string_view> lines;
  bool first_chunk = false;
};

std::vector<std::string_view> split_lines_view(std::string_view content) {
  std::vector<std::string_view> lines;
  std::size_t pos = 0;
  while (pos < content.size()) {
    auto nl = content.find('\n', pos);
    if (nl == std::string_view::npos) {
      nl = content.size();
    }
    lines.push_back(content.substr(pos, nl - pos));
    pos = nl + 1;
  }
  return lines;
}

/// Извлекает слово из строки hunspell (формат: word/flags[\tmorph])
std::string_view extract_hunspell_word(std::string_view line) {
  auto end = line.find_first_of("/\t ");
  return end == std::string_view::npos ? line : line.substr(0, end);
}

[[nodiscard]] bool is_count_line(std::string_view line) {
  line = trim(line);
  if (line.empty()) {
    return false;
  }
  for (char c : line) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

/**
 * @brief Разбирает одну строку в нормализованное слово
 * @return Пустая строка, если строку нужно пропустить
 */
std::string parse_entry(std::string_view line, WordListFormat format,
                        bool first_line, const WordListOptions &options) {
  std::string raw;

  switch (format) {
  case WordListFormat::Csv: {
    raw = csv_first_field(line);
    if (first_line && to_lower(trim(raw)) == "word") {
      return {};
    }
    break;
  }
  case WordListFormat::Text: {
    auto sv = trim(line);
    if (sv.empty() || sv.front() == '#') {
      return {};
    }
    raw = std::string{sv};
    break;
  }
  case WordListFormat::Hunspell: {
    if (first_line && is_count_line(line)) {
      return {};
    }
    raw = std::string{extract_hunspell_word(trim(line))};
    break;
  }
  case WordListFormat::Unknown:
    return {};
  }

  std::string word = normalize_word(raw, options.language);
  if (word.empty() || char_count(word) < options.min_word_length) {
    return {};
  }
  return word;
}

std::vector<std::string> parse_chunk(const ParseChunk &chunk,
                                     WordListFormat format,
                                     const WordListOptions &options) {
  std::vector<std::string> words;
  words.reserve(chunk.lines.size());
  for (std::size_t i = 0; i < chunk.lines.size(); ++i) {
    auto word =
        parse_entry(chunk.lines[i], format, chunk.first_chunk && i == 0, options);
    if (!word.empty()) {
      words.push_back(std::move(word));
    }
  }
  return words;
}

} // namespace

WordListFormat format_for_path(const std::filesystem::path &path) {
  const std::string ext = to_lower(path.extension().string());
  if (ext == ".csv") {
    return WordListFormat::Csv;
  }
  if (ext == ".txt") {
    return WordListFormat::Text;
  }
  if (ext == ".dic") {
    return WordListFormat::Hunspell;
  }
  return WordListFormat::Unknown;
}

std::string csv_first_field(std::string_view line) {
  line = trim(line);
  if (line.empty()) {
    return {};
  }

  if (line.front() != '"') {
    auto comma = line.find(',');
    return std::string{trim(line.substr(0, comma))};
  }

  std::string field;
  for (std::size_t i = 1; i < line.size(); ++i) {
    if (line[i] == '"') {
      if (i + 1 < line.size() && line[i + 1] == '"') {
        field += '"';
        ++i;
        continue;
      }
      break;
    }
    field += line[i];
  }
  return field;
}

std::string csv_escape(std::string_view word) {
  if (word.find_first_of(",\"\n") == std::string_view::npos) {
    return std::string{word};
  }
  std::string out = "\"";
  for (char c : word) {
    if (c == '"') {
      out += '"';
    }
    out += c;
  }
  out += '"';
  return out;
}

std::vector<std::string> parse_word_list(std::string_view content,
                                         WordListFormat format,
                                         const WordListOptions &options) {
  const auto lines = split_lines_view(content);
  const std::size_t threads = resolve_thread_count(options.threads);

  if (lines.size() <= kParallelParseLines || threads <= 1) {
    return parse_chunk(ParseChunk{lines, true}, format, options);
  }

  // Большой файл: режем на фрагменты и разбираем в пуле
  const std::size_t chunk_count = threads * 4;
  const std::size_t chunk_size = (lines.size() + chunk_count - 1) / chunk_count;

  std::vector<ParseChunk> chunks;
  const std::span<const std::string_view> all{lines};
  for (std::size_t begin = 0; begin < lines.size(); begin += chunk_size) {
    const std::size_t len = std::min(chunk_size, lines.size() - begin);
    chunks.push_back(ParseChunk{all.subspan(begin, len), begin == 0});
  }

  WorkerPool<ParseChunk, std::vector<std::string>> pool{
      [format, &options](ParseChunk &chunk) {
        return parse_chunk(chunk, format, options);
      }};
  pool.start(threads);
  auto parts = pool.map(std::move(chunks));
  pool.stop();

  std::vector<std::string> words;
  words.reserve(lines.size());
  for (auto &part : parts) {
    words.insert(words.end(), std::make_move_iterator(part.begin()),
                 std::make_move_iterator(part.end()));
  }
  return words;
}

WordListOutcome read_word_list(const std::filesystem::path &path,
                               const WordListOptions &options) {
  WordListOutcome out;

  const WordListFormat format = format_for_path(path);
  if (format == WordListFormat::Unknown) {
    out.status = DictStatus::failure(
        DictError::UnsupportedFormat,
        "Unsupported word list format: " + path.string());
    return out;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    out.status =
        DictStatus::failure(DictError::Io, "Cannot open " + path.string());
    return out;
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    out.status =
        DictStatus::failure(DictError::Io, "Cannot read " + path.string());
    return out;
  }
  const std::string bytes = buffer.str();

  auto decoded = decode_to_utf8(bytes);
  if (!decoded) {
    out.status = DictStatus::failure(
        DictError::InvalidEncoding, "Cannot decode " + path.string());
    return out;
  }
  if (decoded->reencoded) {
    std::cerr << kLogPrefix << "Warning: " << path.string()
              << " is not UTF-8, decoded as " << decoded->charset << "\n";
  }

  out.charset = decoded->charset;
  out.words = parse_word_list(decoded->text, format, options);
  return out;
}

DictStatus write_word_list(const std::filesystem::path &path,
                           const std::vector<std::string> &words) {
  const WordListFormat format = format_for_path(path);
  if (format != WordListFormat::Csv && format != WordListFormat::Text) {
    return DictStatus::failure(DictError::UnsupportedFormat,
                               "Unsupported word list format: " +
                                   path.string());
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return DictStatus::failure(DictError::Io,
                                 "Cannot create " +
                                     path.parent_path().string() + ": " +
                                     ec.message());
    }
  }

  std::filesystem::path tmp = path;
  tmp += ".tmp";

  {
    std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return DictStatus::failure(DictError::Io,
                                 "Cannot write " + tmp.string());
    }

    if (format == WordListFormat::Csv) {
      file << "word\n";
      for (const auto &w : words) {
        file << csv_escape(w) << "\n";
      }
    } else {
      for (const auto &w : words) {
        file << w << "\n";
      }
    }

    file.flush();
    if (!file) {
      return DictStatus::failure(DictError::Io,
                                 "Cannot write " + tmp.string());
    }
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return DictStatus::failure(DictError::Io,
                               "Cannot replace " + path.string());
  }

  return DictStatus::success();
}

} // namespace atomspell
