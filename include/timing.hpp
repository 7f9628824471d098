#pragma once
#include "settings.hpp"
#include "slide.hpp"
#include "word_info.hpp"
#include <vector>

// Every algorithm clamps durations to settings.min_slide_duration.
void apply_basic_timing(std::vector<Slide>& slides, const ReaderSettings& settings);

// Budget is slide count / wpm minutes, shared out by character count.
void apply_word_length_timing(std::vector<Slide>& slides, const ReaderSettings& settings);

// Linear in the average information of the slide's words, between
// word_freq_high_duration at INFO_LOW and word_freq_low_duration at INFO_HIGH.
void apply_word_frequency_timing(std::vector<Slide>& slides, const ReaderSettings& settings,
                                 const WordInformation& info);

// Dispatches on settings.algorithm. A null `info` uses the built-in table.
void apply_timing(std::vector<Slide>& slides, const ReaderSettings& settings,
                  const WordInformation* info = nullptr);

SlideShowData calculate_stats(const std::vector<Slide>& slides, const ReaderSettings& settings);

// Live speed change: durations *= old/new, wpm tags set to new_wpm.
void adjust_timing_by_wpm(std::vector<Slide>& slides, int old_wpm, int new_wpm);
