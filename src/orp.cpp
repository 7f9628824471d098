#include "orp.hpp"
#include "text_util.hpp"
#include <algorithm>

int calculate_orp(const std::string& text) {
  size_t n = utf8_length(text);
  if (n <= 1) return 1;
  if (n <= 4) return 2;
  if (n <= 9) return 3;
  return 4;
}

double calculate_pixel_offset(const std::string& text, int orp, const std::string& font, double size,
                              const TextMeasurer* measurer) {
  if (orp < 1) orp = 1;
  if (!measurer) {
    const double avg_char_width = size * 0.6;
    return std::max(0.0, (orp - 0.5) * avg_char_width);
  }

  auto cps = utf8_decode(text);
  size_t idx = std::min<size_t>((size_t)orp - 1, cps.size());
  std::string prefix = utf8_encode(cps.substr(0, idx));
  std::string letter = idx < cps.size() ? utf8_encode(cps.substr(idx, 1)) : std::string();

  double to_orp = measurer->width(prefix, font, size);
  double letter_w = letter.empty() ? 0.0 : measurer->width(letter, font, size);
  return std::max(0.0, to_orp + letter_w / 2);
}

void recalculate_pixel_offsets(std::vector<Slide>& slides, const std::string& font, double size,
                               const TextMeasurer* measurer) {
  for (auto& s : slides) {
    s.pixel_offset = calculate_pixel_offset(s.text, s.optimal_letter_position, font, size, measurer);
  }
}
