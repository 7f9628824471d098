#include "settings.hpp"
#include "json_io.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

const char* algorithm_name(TimingAlgorithm a) {
  switch (a) {
    case TimingAlgorithm::WordLength: return "wordLength";
    case TimingAlgorithm::WordFrequency: return "wordFrequency";
    case TimingAlgorithm::Basic: break;
  }
  return "basic";
}

TimingAlgorithm algorithm_from_name(const std::string& name) {
  if (name == "basic") return TimingAlgorithm::Basic;
  if (name == "wordLength") return TimingAlgorithm::WordLength;
  if (name == "wordFrequency") return TimingAlgorithm::WordFrequency;
  throw std::runtime_error("settings: unknown algorithm '" + name + "'");
}

namespace {
template <typename T>
void read_key(const json& j, const char* key, T& dst) {
  if (j.contains(key) && !j[key].is_null()) dst = j[key].get<T>();
}
}

ReaderSettings parse_settings(const std::string& json_text, ReaderSettings s) {
  try {
    auto j = json::parse(json_text);
    if (!j.is_object()) throw std::runtime_error("settings: expected a JSON object");

    read_key(j, "wpm", s.wpm);
    read_key(j, "chunkSize", s.chunk_size);
    read_key(j, "font", s.font);
    read_key(j, "fontSize", s.font_size);
    if (j.contains("algorithm")) s.algorithm = algorithm_from_name(j["algorithm"].get<std::string>());
    read_key(j, "pauseAfterComma", s.pause_after_comma);
    read_key(j, "pauseAfterPeriod", s.pause_after_period);
    read_key(j, "pauseAfterParagraph", s.pause_after_paragraph);
    read_key(j, "pauseAfterCommaDelay", s.pause_after_comma_delay);
    read_key(j, "pauseAfterPeriodDelay", s.pause_after_period_delay);
    read_key(j, "pauseAfterParagraphDelay", s.pause_after_paragraph_delay);
    read_key(j, "minSlideDuration", s.min_slide_duration);
    read_key(j, "wordFreqHighDuration", s.word_freq_high_duration);
    read_key(j, "wordFreqLowDuration", s.word_freq_low_duration);
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("settings: ") + e.what());
  }
  return s;
}

ReaderSettings load_settings(const std::string& path, ReaderSettings base) {
  return parse_settings(read_file(path), std::move(base));
}

std::string settings_to_json(const ReaderSettings& s) {
  json j = {
    {"wpm", s.wpm},
    {"chunkSize", s.chunk_size},
    {"font", s.font},
    {"fontSize", s.font_size},
    {"algorithm", algorithm_name(s.algorithm)},
    {"pauseAfterComma", s.pause_after_comma},
    {"pauseAfterPeriod", s.pause_after_period},
    {"pauseAfterParagraph", s.pause_after_paragraph},
    {"pauseAfterCommaDelay", s.pause_after_comma_delay},
    {"pauseAfterPeriodDelay", s.pause_after_period_delay},
    {"pauseAfterParagraphDelay", s.pause_after_paragraph_delay},
    {"minSlideDuration", s.min_slide_duration},
    {"wordFreqHighDuration", s.word_freq_high_duration},
    {"wordFreqLowDuration", s.word_freq_low_duration},
  };
  return j.dump(2, ' ', false, json::error_handler_t::replace);
}
