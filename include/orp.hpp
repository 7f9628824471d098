#pragma once
#include "slide.hpp"
#include <string>
#include <vector>

// Host text-measurement capability (a canvas, a font rasterizer, ...).
class TextMeasurer {
public:
  virtual ~TextMeasurer() = default;
  // Advance width in pixels of `text` set in `font` at `size` px.
  virtual double width(const std::string& text, const std::string& font, double size) const = 0;
};

// Optimal recognition point, 1-based, by code-point length:
// 1 -> 1, 2..4 -> 2, 5..9 -> 3, 10+ -> 4.
int calculate_orp(const std::string& text);

// Horizontal offset of the middle of the fixation character. With a measurer:
// width(prefix) + width(fixation char) / 2. Without: (orp - 0.5) * size * 0.6.
double calculate_pixel_offset(const std::string& text, int orp, const std::string& font, double size,
                              const TextMeasurer* measurer = nullptr);

void recalculate_pixel_offsets(std::vector<Slide>& slides, const std::string& font, double size,
                               const TextMeasurer* measurer = nullptr);
