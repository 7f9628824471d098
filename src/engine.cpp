#include "engine.hpp"
#include "text_util.hpp"
#include <algorithm>

ProcessedText process_text(const std::string& text, const ReaderSettings& settings,
                           const WordInformation* info, const TextMeasurer* measurer) {
  ProcessedText out;
  out.slides = tokenize_text(text, settings, measurer);
  apply_timing(out.slides, settings, info);
  out.stats = calculate_stats(out.slides, settings);
  return out;
}

double block_duration(const ContentBlock& block) {
  const double per_line = 500;
  switch (block.type) {
    case BlockType::Code:
    case BlockType::Table: {
      size_t lines = (size_t)std::count(block.content.begin(), block.content.end(), '\n') + 1;
      return std::max(3000.0, std::min(15000.0, (double)lines * per_line));
    }
    case BlockType::Heading: return 1500;
    case BlockType::Image: return 3000;
    default: return 1000;
  }
}

namespace {
Slide make_block_slide(const ContentBlock& block, const ReaderSettings& settings) {
  Slide s;
  s.text = block.content;
  s.text_original = block.content;
  s.duration = block_duration(block);
  s.post_delay = settings.pause_after_paragraph_delay;
  s.wpm = settings.wpm;
  s.words_in_slide = (int)split_whitespace(block.content).size();
  s.body = BlockSlide{block.type, block.metadata};
  return s;
}
}

ProcessedContent process_content(const ParsedContent& content, const ReaderSettings& settings,
                                 const WordInformation* info, const TextMeasurer* measurer) {
  ProcessedContent out;
  int last_number = 0;

  for (const auto& block : content.blocks) {
    out.block_indices.push_back(out.slides.size());

    switch (block.type) {
      case BlockType::Hr:
        break;

      case BlockType::Code:
      case BlockType::Table:
      case BlockType::Heading:
      case BlockType::Image: {
        Slide s = make_block_slide(block, settings);
        s.slide_number = ++last_number;
        out.slides.push_back(std::move(s));
        break;
      }

      case BlockType::Text:
      case BlockType::Blockquote:
      case BlockType::List: {
        auto slides = tokenize_segment(block.content, settings, false, measurer);
        apply_timing(slides, settings, info);
        // A block ends a paragraph.
        if (!slides.empty() && settings.pause_after_paragraph) {
          slides.back().post_delay = std::max(slides.back().post_delay, settings.pause_after_paragraph_delay);
        }
        for (auto& s : slides) {
          s.slide_number += last_number;
          s.body = PlainSlide{block.type, block.metadata};
        }
        if (!slides.empty()) last_number = slides.back().slide_number;
        out.slides.insert(out.slides.end(), std::make_move_iterator(slides.begin()),
                          std::make_move_iterator(slides.end()));
        break;
      }
    }
  }

  if (!out.slides.empty()) out.slides.back().post_delay = 0;
  out.stats = calculate_stats(out.slides, settings);
  return out;
}

std::unique_ptr<ChunkedProcessor> create_chunked_processor(const std::string& text,
                                                           const ReaderSettings& settings,
                                                           ChunkerOptions opts,
                                                           const WordInformation* info,
                                                           const TextMeasurer* measurer) {
  return std::make_unique<ChunkedProcessor>(text, settings, opts, info, measurer);
}
