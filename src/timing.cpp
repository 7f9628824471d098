#include "timing.hpp"
#include "text_util.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cmath>

namespace {
void clamp_min(Slide& s, const ReaderSettings& settings) {
  if (s.duration < settings.min_slide_duration) s.duration = settings.min_slide_duration;
}
}

void apply_basic_timing(std::vector<Slide>& slides, const ReaderSettings& settings) {
  const double per_word = (60.0 / settings.wpm) * 1000.0;
  for (auto& s : slides) {
    s.duration = per_word * s.words_in_slide;
    clamp_min(s, settings);
  }
}

void apply_word_length_timing(std::vector<Slide>& slides, const ReaderSettings& settings) {
  const double total_target = ((double)slides.size() / settings.wpm) * 60000.0;
  size_t total_length = 0;
  for (const auto& s : slides) total_length += utf8_length(s.text);

  const double per_char = total_length ? total_target / (double)total_length : 0.0;
  for (auto& s : slides) {
    s.duration = per_char * (double)utf8_length(s.text);
    clamp_min(s, settings);
  }
}

void apply_word_frequency_timing(std::vector<Slide>& slides, const ReaderSettings& settings,
                                 const WordInformation& info) {
  static const RE2 strip("[.,?!;:'\"()\\[\\]{}]");

  const double dur_short = settings.word_freq_high_duration;
  const double dur_long = settings.word_freq_low_duration;
  const double a = (dur_long - dur_short) / (INFO_HIGH - INFO_LOW);
  const double b = dur_short - INFO_LOW * a;

  for (auto& s : slides) {
    auto words = split_whitespace(s.text);
    double total_info = 0;
    for (auto w : words) {
      RE2::GlobalReplace(&w, strip, "");
      if (!w.empty()) total_info += info.information(w);
    }
    const double avg = words.empty() ? 0.0 : total_info / (double)words.size();
    s.duration = (a * avg + b) * s.words_in_slide;
    clamp_min(s, settings);
  }
}

void apply_timing(std::vector<Slide>& slides, const ReaderSettings& settings, const WordInformation* info) {
  switch (settings.algorithm) {
    case TimingAlgorithm::WordLength:
      apply_word_length_timing(slides, settings);
      break;
    case TimingAlgorithm::WordFrequency:
      apply_word_frequency_timing(slides, settings, info ? *info : BuiltinWordInformation::instance());
      break;
    case TimingAlgorithm::Basic:
      apply_basic_timing(slides, settings);
      break;
  }
}

SlideShowData calculate_stats(const std::vector<Slide>& slides, const ReaderSettings& settings) {
  SlideShowData d;
  if (slides.empty()) return d;

  d.min_duration = slides.front().duration;
  d.max_duration = slides.front().duration;
  long long total_words = 0;
  for (const auto& s : slides) {
    d.total_duration += s.duration;
    d.total_duration_with_pauses += s.duration + s.pre_delay + s.post_delay;
    total_words += s.words_in_slide;
    d.min_duration = std::min(d.min_duration, s.duration);
    d.max_duration = std::max(d.max_duration, s.duration);
  }
  d.total_slides = slides.size();
  d.real_wpm = d.total_duration > 0
    ? (int)std::lround((double)total_words / d.total_duration * 60000.0)
    : settings.wpm;
  return d;
}

void adjust_timing_by_wpm(std::vector<Slide>& slides, int old_wpm, int new_wpm) {
  const double ratio = (double)old_wpm / (double)new_wpm;
  for (auto& s : slides) {
    s.duration *= ratio;
    s.wpm = new_wpm;
  }
}
