#pragma once
#include "orp.hpp"
#include "settings.hpp"
#include "slide.hpp"
#include "word_info.hpp"
#include <optional>
#include <string>
#include <vector>

// A whitespace-aligned piece of the source text: [start, end) in bytes.
// Once processed, its slides live at [slide_start, slide_start + slide_count)
// of the processor's flat slide array.
struct TextChunk {
  size_t start = 0;
  size_t end = 0;
  bool processed = false;
  size_t slide_start = 0;
  size_t slide_count = 0;
};

// Chunks of up to `budget` bytes, each cut pulled back to the whitespace that
// starts the next chunk. Hard cut (on a UTF-8 boundary) if there is none.
std::vector<TextChunk> partition_text(const std::string& text, size_t budget);

enum class ProcessingState { NotStarted, InProgress, Complete };

struct ChunkerOptions {
  size_t chunk_chars = 10000;
  size_t slide_buffer = 500;   // extra slides processed past a requested range
  bool eager_first_chunk = true;
};

// Tokenizes and times a large text one chunk at a time, in document order.
// `info` and `measurer` are not owned and must outlive the processor.
class ChunkedProcessor {
public:
  ChunkedProcessor(std::string text, ReaderSettings settings, ChunkerOptions opts = {},
                   const WordInformation* info = nullptr, const TextMeasurer* measurer = nullptr);

  // Exact once complete; before that an estimate that is never below the
  // processed count.
  size_t total_estimated_slides() const;
  size_t processed_slides_count() const { return slides_.size(); }
  bool is_fully_processed() const { return next_chunk_ >= chunks_.size(); }
  ProcessingState state() const;

  // Processes whatever chunks the range could touch, then returns the
  // (possibly shorter) slice.
  std::vector<Slide> get_slides(size_t start, size_t count);
  std::optional<Slide> get_slide(size_t index);

  // Stats over the slides processed so far.
  SlideShowData get_stats() const;

  // Processes the next chunk. Returns whether any chunk is left.
  bool process_more();
  void process_all();

  // Live updates; also applied to chunks processed afterwards.
  void rescale_wpm(int old_wpm, int new_wpm);
  void recalculate_pixel_offsets(const std::string& font, double size);

  const std::vector<Slide>& slides() const { return slides_; }
  std::vector<Slide>& slides() { return slides_; }
  const std::vector<TextChunk>& chunks() const { return chunks_; }
  size_t processed_chunks() const { return next_chunk_; }
  const ReaderSettings& settings() const { return settings_; }

private:
  void process_chunk(size_t index);
  void ensure_range(size_t start, size_t count);
  void refine_estimate();

  std::string text_;
  ReaderSettings settings_;
  ChunkerOptions opts_;
  const WordInformation* info_;
  const TextMeasurer* measurer_;

  std::vector<TextChunk> chunks_;
  std::vector<Slide> slides_;
  size_t next_chunk_ = 0;
  int last_slide_number_ = 0;
  size_t estimate_ = 0;
  int timing_wpm_;      // wpm the timing algorithms run at
  double rate_ = 1.0;   // accumulated live rescale
};

struct ReadingEstimate {
  size_t words = 0;
  long minutes = 0;
  long seconds = 0;
};

ReadingEstimate estimate_reading_time(const std::string& text, int wpm);

struct Section {
  size_t start = 0;
  size_t end = 0;
  std::string preview; // first 100 characters, "..." when cut
};

// Splits on blank lines.
std::vector<Section> split_into_sections(const std::string& text);
