#pragma once
#include <string>

enum class TimingAlgorithm { Basic, WordLength, WordFrequency };

const char* algorithm_name(TimingAlgorithm a);
// Accepts "basic", "wordLength", "wordFrequency". Throws on anything else.
TimingAlgorithm algorithm_from_name(const std::string& name);

struct ReaderSettings {
  int wpm = 300;
  int chunk_size = 1;              // words per slide, 1..5
  std::string font = "system-ui";
  double font_size = 48;
  TimingAlgorithm algorithm = TimingAlgorithm::Basic;

  bool pause_after_comma = true;
  bool pause_after_period = true;
  bool pause_after_paragraph = true;
  double pause_after_comma_delay = 250;
  double pause_after_period_delay = 450;
  double pause_after_paragraph_delay = 700;

  double min_slide_duration = 50;

  // wordFrequency bounds: high = common words (short), low = rare words (long)
  double word_freq_high_duration = 40;
  double word_freq_low_duration = 300;
};

// Keys are optional; missing ones keep the defaults above.
ReaderSettings parse_settings(const std::string& json_text, ReaderSettings base = {});
ReaderSettings load_settings(const std::string& path, ReaderSettings base = {});
std::string settings_to_json(const ReaderSettings& s);
