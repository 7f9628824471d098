#pragma once
#include "engine.hpp"
#include <memory>
#include <string>
#include <vector>

// Texts longer than this go through a ChunkedProcessor.
constexpr size_t kLargeTextThreshold = 50000;
// Slides read right after loading a large text.
constexpr size_t kInitialSlides = 500;

// One loaded document and the state derived from it. Loading another document
// drops the previous processor, so a background loop driving
// process_more_chunks() simply finds nothing left to do.
class ReaderSession {
public:
  explicit ReaderSession(ReaderSettings settings = {}, ChunkerOptions chunker = {},
                         const WordInformation* info = nullptr,
                         const TextMeasurer* measurer = nullptr);

  void load_text(const std::string& text, const std::string& title = "");
  void load_content(const ParsedContent& content);
  void clear();

  // Processes up to `max_chunks` more chunks. Returns whether more remain.
  bool process_more_chunks(int max_chunks = 3);

  // Processes forward as far as needed; null when out of range.
  const Slide* slide_at(size_t index);

  void update_settings(const ReaderSettings& next);
  void set_wpm(int wpm);

  const std::vector<Slide>& slides() const;
  const SlideShowData& stats() const { return stats_; }
  const ReaderSettings& settings() const { return settings_; }
  const std::vector<size_t>& block_indices() const { return block_indices_; }
  const std::string& title() const { return title_; }
  const ReadingEstimate& reading_estimate() const { return estimate_; }

  bool is_large_text() const { return processor_ != nullptr; }
  size_t total_slides() const;
  // Percentage of the document read at `current_index`.
  double progress(size_t current_index) const;
  // Percentage of the document processed.
  int processing_progress() const;

private:
  void refresh_stats();

  ReaderSettings settings_;
  ChunkerOptions chunker_;
  const WordInformation* info_;
  const TextMeasurer* measurer_;

  std::unique_ptr<ChunkedProcessor> processor_;
  std::vector<Slide> slides_; // direct pipeline / content output
  SlideShowData stats_;
  std::vector<size_t> block_indices_;
  std::string title_;
  ReadingEstimate estimate_;
};
