#pragma once
#include "chunked_processor.hpp"
#include "orp.hpp"
#include "settings.hpp"
#include "slide.hpp"
#include "timing.hpp"
#include "tokenizer.hpp"
#include "word_info.hpp"
#include <memory>
#include <string>
#include <vector>

struct ProcessedText {
  std::vector<Slide> slides;
  SlideShowData stats;
};

struct ProcessedContent {
  std::vector<Slide> slides;
  SlideShowData stats;
  std::vector<size_t> block_indices; // first slide index of every block, hr included
};

// tokenize + time + stats in one go.
ProcessedText process_text(const std::string& text, const ReaderSettings& settings,
                           const WordInformation* info = nullptr,
                           const TextMeasurer* measurer = nullptr);

// Prose blocks (text, blockquote, list) become ordinary slides tagged with
// their block type; code, table, heading and image become one verbatim slide
// each; hr produces nothing.
ProcessedContent process_content(const ParsedContent& content, const ReaderSettings& settings,
                                 const WordInformation* info = nullptr,
                                 const TextMeasurer* measurer = nullptr);

// Display time of a verbatim block slide in ms.
double block_duration(const ContentBlock& block);

std::unique_ptr<ChunkedProcessor> create_chunked_processor(const std::string& text,
                                                           const ReaderSettings& settings,
                                                           ChunkerOptions opts = {},
                                                           const WordInformation* info = nullptr,
                                                           const TextMeasurer* measurer = nullptr);
