#include "tokenizer.hpp"
#include "text_util.hpp"
#include <re2/re2.h>
#include <algorithm>

namespace {

const size_t kKeepHyphenatedMax = 12; // two-part hyphenated words up to this stay whole
const size_t kLongWord = 17;          // longer words get split
const size_t kLongWordPiece = 10;

struct WordUnit {
  std::string text;
  std::string text_original;
  size_t word_index = 0;   // ordinal of the source word
  bool child = false;      // continuation fragment of the previous unit's word
  bool line_break = false; // the whitespace after it holds a line break
};

struct RawWord {
  std::string text;
  bool line_break = false;
};

bool is_vowel(char32_t c) {
  if (c >= 'A' && c <= 'Z') c = c - 'A' + 'a';
  return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

bool ends_group(const std::string& t) {
  if (t.empty()) return false;
  switch (t.back()) {
    case ',': case ';': case ':': case '.': case '?': case '!': return true;
    default: return false;
  }
}

// Decode entities and make sure sentence punctuation is followed by whitespace,
// so "end.Next" splits into "end." and "Next".
std::string normalize(const std::string& text) {
  static const RE2 glued("([.,?!:;])(\\S)");
  std::string s = html_decode(text);
  // Replacements do not overlap, so "..." needs a second pass.
  while (RE2::GlobalReplace(&s, glued, "\\1 \\2") > 0) {}
  return s;
}

std::vector<RawWord> split_words(const std::string& s) {
  std::vector<RawWord> words;
  size_t i = 0;
  while (i < s.size() && is_ascii_space(s[i])) ++i;
  while (i < s.size()) {
    size_t b = i;
    while (i < s.size() && !is_ascii_space(s[i])) ++i;
    RawWord w;
    w.text = s.substr(b, i - b);
    while (i < s.size() && is_ascii_space(s[i])) {
      if (s[i] == '\n' || s[i] == '\r') w.line_break = true;
      ++i;
    }
    words.push_back(std::move(w));
  }
  return words;
}

std::vector<std::string> split_on(const std::string& s, char sep) {
  std::vector<std::string> parts;
  size_t b = 0;
  for (;;) {
    size_t e = s.find(sep, b);
    if (e == std::string::npos) { parts.push_back(s.substr(b)); break; }
    parts.push_back(s.substr(b, e - b));
    b = e + 1;
  }
  return parts;
}

// Hyphen and long-word fragmentation. Only used with one word per slide.
void fragment_word(const RawWord& w, size_t word_index, std::vector<WordUnit>& out) {
  size_t first = out.size();
  auto emit = [&](std::string text) {
    WordUnit u;
    u.text = std::move(text);
    u.text_original = w.text;
    u.word_index = word_index;
    u.child = out.size() > first;
    out.push_back(std::move(u));
  };
  auto emit_pieces = [&](const std::string& part, bool hyphen_after) {
    std::vector<std::string> pieces;
    if (utf8_length(part) > kLongWord) pieces = split_long_word(part, kLongWordPiece);
    else pieces.push_back(part);
    for (size_t j = 0; j < pieces.size(); ++j) {
      bool last = j + 1 == pieces.size();
      emit(!last || hyphen_after ? pieces[j] + "-" : pieces[j]);
    }
  };

  size_t len = utf8_length(w.text);
  if (w.text.find('-') != std::string::npos && len > 1) {
    auto parts = split_on(w.text, '-');
    if (parts.size() == 2 && len <= kKeepHyphenatedMax) {
      emit(w.text);
    } else {
      for (size_t idx = 0; idx < parts.size(); ++idx) {
        if (parts[idx].empty()) continue;
        emit_pieces(parts[idx], idx + 1 < parts.size());
      }
    }
  } else {
    emit_pieces(w.text, false);
  }

  if (out.size() > first) out.back().line_break = w.line_break;
}

std::vector<WordUnit> first_pass(const std::string& text, const ReaderSettings& settings) {
  std::vector<WordUnit> units;
  if (text.empty()) return units;

  auto words = split_words(normalize(text));
  units.reserve(words.size());
  for (size_t k = 0; k < words.size(); ++k) {
    if (settings.chunk_size == 1) {
      fragment_word(words[k], k, units);
    } else {
      WordUnit u;
      u.text = words[k].text;
      u.text_original = words[k].text;
      u.word_index = k;
      u.line_break = words[k].line_break;
      units.push_back(std::move(u));
    }
  }
  return units;
}

// Drops empty and punctuation-only units. A dropped unit's line break moves to
// the unit before it; continuation flags are recomputed on what survives.
std::vector<WordUnit> second_pass(std::vector<WordUnit> units) {
  std::vector<WordUnit> kept;
  kept.reserve(units.size());
  for (auto& u : units) {
    if (trim(u.text).empty() || is_punctuation_only(u.text)) {
      if (u.line_break && !kept.empty()) kept.back().line_break = true;
      continue;
    }
    u.child = !kept.empty() && kept.back().word_index == u.word_index;
    kept.push_back(std::move(u));
  }
  return kept;
}

} // namespace

std::vector<std::string> split_long_word(const std::string& word, size_t max_length) {
  std::vector<std::string> chunks;
  if (max_length < 2) max_length = 2;
  std::u32string remaining = utf8_decode(word);

  while (remaining.size() > max_length) {
    size_t break_point = max_length;
    // Scan back from the limit towards the middle of the piece.
    for (size_t i = max_length - 2; i >= max_length / 2; --i) {
      if (is_vowel(remaining[i]) && !is_vowel(remaining[i + 1])) {
        break_point = i + 1;
        break;
      }
    }
    chunks.push_back(utf8_encode(remaining.substr(0, break_point)));
    remaining.erase(0, break_point);
  }
  if (!remaining.empty()) chunks.push_back(utf8_encode(remaining));
  return chunks;
}

bool is_punctuation_only(const std::string& text) {
  static const RE2 punct("[\\s\\p{P}\\p{S}]*");
  return RE2::FullMatch(text, punct);
}

PauseDelays punctuation_delay(const std::string& text, bool line_break, const ReaderSettings& settings) {
  PauseDelays d;
  char last = text.empty() ? '\0' : text.back();

  if (last == ',' || last == ';' || last == ':') {
    if (settings.pause_after_comma) d.post = settings.pause_after_comma_delay;
  }
  if (last == '.' || last == '?' || last == '!') {
    if (settings.pause_after_period) d.post = settings.pause_after_period_delay;
  }
  bool paragraph = line_break || text.find('\n') != std::string::npos ||
                   text.find('\r') != std::string::npos;
  if (paragraph && settings.pause_after_paragraph) {
    d.post = std::max(d.post, settings.pause_after_paragraph_delay);
  }
  return d;
}

std::vector<Slide> tokenize_segment(const std::string& text, const ReaderSettings& settings,
                                    bool terminal, const TextMeasurer* measurer) {
  auto units = second_pass(first_pass(text, settings));
  const size_t per_slide = (size_t)std::max(1, settings.chunk_size);

  std::vector<Slide> slides;
  int next_number = 1;
  for (size_t i = 0; i < units.size(); ) {
    std::string joined;
    size_t j = 0;
    bool line_break = false;
    while (j < per_slide && i + j < units.size()) {
      const auto& u = units[i + j];
      if (j) joined += ' ';
      joined += u.text;
      ++j;
      if (ends_group(u.text) || u.line_break) {
        line_break = u.line_break;
        break;
      }
    }

    Slide s;
    s.text = trim(joined);
    s.text_original = units[i].text_original;
    s.wpm = settings.wpm;
    s.words_in_slide = (int)j;
    s.is_child_of_previous = units[i].child;
    s.slide_number = (s.is_child_of_previous && next_number > 1) ? next_number - 1 : next_number++;
    s.optimal_letter_position = calculate_orp(s.text);
    s.pixel_offset = calculate_pixel_offset(s.text, s.optimal_letter_position,
                                            settings.font, settings.font_size, measurer);
    auto d = punctuation_delay(s.text, line_break, settings);
    s.pre_delay = d.pre;
    s.post_delay = d.post;

    slides.push_back(std::move(s));
    i += j;
  }

  if (terminal && !slides.empty()) slides.back().post_delay = 0;
  return slides;
}

std::vector<Slide> tokenize_text(const std::string& text, const ReaderSettings& settings,
                                 const TextMeasurer* measurer) {
  return tokenize_segment(text, settings, true, measurer);
}
