#include "chunked_processor.hpp"
#include "text_util.hpp"
#include "timing.hpp"
#include "tokenizer.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cmath>
#include <limits>

std::vector<TextChunk> partition_text(const std::string& text, size_t budget) {
  if (budget == 0) budget = 1;
  std::vector<TextChunk> chunks;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t end = std::min(pos + budget, text.size());
    if (end < text.size()) {
      size_t e = end;
      while (e > pos && !is_ascii_space(text[e])) --e;
      if (e > pos) {
        end = e;
      } else {
        end = utf8_floor(text, end);
        if (end == pos) { // budget smaller than one character
          end = pos + 1;
          while (end < text.size() && ((unsigned char)text[end] & 0xC0) == 0x80) ++end;
        }
      }
    }
    TextChunk c;
    c.start = pos;
    c.end = end;
    chunks.push_back(c);
    pos = end;
  }
  return chunks;
}

ChunkedProcessor::ChunkedProcessor(std::string text, ReaderSettings settings, ChunkerOptions opts,
                                   const WordInformation* info, const TextMeasurer* measurer)
  : text_(std::move(text)), settings_(std::move(settings)), opts_(opts),
    info_(info), measurer_(measurer), timing_wpm_(settings_.wpm) {
  chunks_ = partition_text(text_, opts_.chunk_chars);

  // Rough guess until the first chunk has been measured.
  size_t words = split_whitespace(text_).size();
  size_t per_slide = (size_t)std::max(1, settings_.chunk_size);
  estimate_ = (words + per_slide - 1) / per_slide;

  if (chunks_.size() <= 2) {
    process_all();
  } else if (opts_.eager_first_chunk) {
    process_more();
  }
}

ProcessingState ChunkedProcessor::state() const {
  if (is_fully_processed()) return ProcessingState::Complete;
  return next_chunk_ == 0 ? ProcessingState::NotStarted : ProcessingState::InProgress;
}

size_t ChunkedProcessor::total_estimated_slides() const {
  if (is_fully_processed()) return slides_.size();
  return std::max(estimate_, slides_.size());
}

void ChunkedProcessor::process_chunk(size_t index) {
  TextChunk& chunk = chunks_[index];
  const bool last = index + 1 == chunks_.size();

  // Take the whitespace after the chunk along so a line break right at the
  // cut still counts for the chunk's last word.
  size_t seg_end = chunk.end;
  while (seg_end < text_.size() && is_ascii_space(text_[seg_end])) ++seg_end;

  auto slides = tokenize_segment(text_.substr(chunk.start, seg_end - chunk.start),
                                 settings_, last, measurer_);
  ReaderSettings timing = settings_;
  timing.wpm = timing_wpm_;
  apply_timing(slides, timing, info_);
  if (rate_ != 1.0) {
    for (auto& s : slides) s.duration *= rate_;
  }

  for (auto& s : slides) {
    s.slide_number += last_slide_number_;
    s.wpm = settings_.wpm;
  }
  if (!slides.empty()) last_slide_number_ = slides.back().slide_number;

  chunk.slide_start = slides_.size();
  chunk.slide_count = slides.size();
  chunk.processed = true;
  slides_.insert(slides_.end(), std::make_move_iterator(slides.begin()),
                 std::make_move_iterator(slides.end()));
  // The last chunk may hold only whitespace or punctuation, leaving the
  // document's final slide in an earlier chunk.
  if (is_fully_processed() && !slides_.empty()) slides_.back().post_delay = 0;
  refine_estimate();
}

void ChunkedProcessor::refine_estimate() {
  if (is_fully_processed() || next_chunk_ == 0) return;
  size_t covered = chunks_[next_chunk_ - 1].end;
  if (covered == 0) return;
  double density = (double)slides_.size() / (double)covered;
  size_t refined = slides_.size() + (size_t)std::ceil((double)(text_.size() - covered) * density);
  // The word-count guess only stands in until the first chunk is measured.
  estimate_ = next_chunk_ == 1 ? refined : std::max(estimate_, refined);
}

bool ChunkedProcessor::process_more() {
  if (next_chunk_ >= chunks_.size()) return false;
  // Advance first: refine_estimate looks at next_chunk_.
  size_t index = next_chunk_++;
  process_chunk(index);
  return next_chunk_ < chunks_.size();
}

void ChunkedProcessor::process_all() {
  while (process_more()) {}
}

void ChunkedProcessor::ensure_range(size_t start, size_t count) {
  const size_t max = std::numeric_limits<size_t>::max();
  size_t target = count > max - start ? max : start + count;
  target = opts_.slide_buffer > max - target ? max : target + opts_.slide_buffer;
  while (!is_fully_processed() && slides_.size() < target) {
    size_t last = next_chunk_;
    size_t covered = next_chunk_ ? chunks_[next_chunk_ - 1].end : 0;
    if (covered > 0 && !slides_.empty()) {
      // Extrapolate where slide `target` falls from the density seen so far.
      double density = (double)slides_.size() / (double)covered;
      double want = covered + (double)(target - slides_.size()) / density;
      size_t at = want >= (double)text_.size() ? text_.size() - 1 : (size_t)want;
      auto it = std::upper_bound(chunks_.begin(), chunks_.end(), at,
                                 [](size_t pos, const TextChunk& c) { return pos < c.start; });
      size_t holder = (size_t)(it - chunks_.begin()) - 1;
      last = std::max(last, holder);
    }
    while (next_chunk_ <= last && next_chunk_ < chunks_.size()) process_more();
  }
}

std::vector<Slide> ChunkedProcessor::get_slides(size_t start, size_t count) {
  ensure_range(start, count);
  if (start >= slides_.size()) return {};
  size_t end = count > slides_.size() - start ? slides_.size() : start + count;
  return std::vector<Slide>(slides_.begin() + (long)start, slides_.begin() + (long)end);
}

std::optional<Slide> ChunkedProcessor::get_slide(size_t index) {
  ensure_range(index, 1);
  if (index >= slides_.size()) return std::nullopt;
  return slides_[index];
}

SlideShowData ChunkedProcessor::get_stats() const {
  return calculate_stats(slides_, settings_);
}

void ChunkedProcessor::rescale_wpm(int old_wpm, int new_wpm) {
  adjust_timing_by_wpm(slides_, old_wpm, new_wpm);
  rate_ *= (double)old_wpm / (double)new_wpm;
  settings_.wpm = new_wpm;
}

void ChunkedProcessor::recalculate_pixel_offsets(const std::string& font, double size) {
  ::recalculate_pixel_offsets(slides_, font, size, measurer_);
  settings_.font = font;
  settings_.font_size = size;
}

ReadingEstimate estimate_reading_time(const std::string& text, int wpm) {
  ReadingEstimate e;
  e.words = split_whitespace(text).size();
  double total_seconds = wpm > 0 ? (double)e.words / wpm * 60.0 : 0.0;
  e.minutes = (long)std::floor(total_seconds / 60.0);
  e.seconds = std::lround(std::fmod(total_seconds, 60.0));
  return e;
}

namespace {
Section make_section(const std::string& text, size_t start, size_t end) {
  const size_t kPreview = 100;
  Section s;
  s.start = start;
  s.end = end;
  auto cps = utf8_decode(text.substr(start, end - start));
  s.preview = trim(utf8_encode(cps.substr(0, kPreview)));
  if (cps.size() > kPreview) s.preview += "...";
  return s;
}
}

std::vector<Section> split_into_sections(const std::string& text) {
  static const RE2 blank("(\\n\\s*\\n)");
  std::vector<Section> sections;

  re2::StringPiece input(text);
  re2::StringPiece gap;
  size_t last_end = 0;
  while (RE2::FindAndConsume(&input, blank, &gap)) {
    size_t gap_start = (size_t)(gap.data() - text.data());
    if (gap_start > last_end) sections.push_back(make_section(text, last_end, gap_start));
    last_end = gap_start + gap.size();
  }
  if (last_end < text.size()) sections.push_back(make_section(text, last_end, text.size()));
  return sections;
}
