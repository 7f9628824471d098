#pragma once
#include "orp.hpp"
#include "settings.hpp"
#include "slide.hpp"
#include <string>
#include <vector>

struct PauseDelays {
  double pre = 0;
  double post = 0;
};

// Text -> untimed slides (duration 0). Slide numbers start at 1.
// The last slide of the result has post_delay 0.
std::vector<Slide> tokenize_text(const std::string& text, const ReaderSettings& settings,
                                 const TextMeasurer* measurer = nullptr);

// Same, for one piece of a longer sequence. When `terminal` is false the last
// slide keeps its punctuation/paragraph pause.
std::vector<Slide> tokenize_segment(const std::string& text, const ReaderSettings& settings,
                                    bool terminal, const TextMeasurer* measurer = nullptr);

// Splits into pieces of at most `max_length` code points, preferring a break
// right after a vowel that precedes a consonant. No hyphens are added.
std::vector<std::string> split_long_word(const std::string& word, size_t max_length = 10);

// True for text made only of whitespace, punctuation and symbols.
bool is_punctuation_only(const std::string& text);

PauseDelays punctuation_delay(const std::string& text, bool line_break, const ReaderSettings& settings);
