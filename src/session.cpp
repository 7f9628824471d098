#include "session.hpp"
#include <cmath>

ReaderSession::ReaderSession(ReaderSettings settings, ChunkerOptions chunker,
                             const WordInformation* info, const TextMeasurer* measurer)
  : settings_(std::move(settings)), chunker_(chunker), info_(info), measurer_(measurer) {}

void ReaderSession::load_text(const std::string& text, const std::string& title) {
  clear();
  title_ = title.empty() ? "Document" : title;
  estimate_ = estimate_reading_time(text, settings_.wpm);

  if (text.size() > kLargeTextThreshold) {
    processor_ = create_chunked_processor(text, settings_, chunker_, info_, measurer_);
    processor_->get_slides(0, kInitialSlides);
  } else {
    auto r = process_text(text, settings_, info_, measurer_);
    slides_ = std::move(r.slides);
  }
  refresh_stats();
}

void ReaderSession::load_content(const ParsedContent& content) {
  clear();
  title_ = content.title.empty() ? "Document" : content.title;

  std::string all;
  for (const auto& b : content.blocks) {
    if (!all.empty()) all += ' ';
    all += b.content;
  }
  estimate_ = estimate_reading_time(all, settings_.wpm);

  auto r = process_content(content, settings_, info_, measurer_);
  slides_ = std::move(r.slides);
  block_indices_ = std::move(r.block_indices);
  refresh_stats();
}

void ReaderSession::clear() {
  processor_.reset();
  slides_.clear();
  block_indices_.clear();
  stats_ = SlideShowData{};
  title_.clear();
  estimate_ = ReadingEstimate{};
}

bool ReaderSession::process_more_chunks(int max_chunks) {
  if (!processor_ || processor_->is_fully_processed()) return false;
  for (int i = 0; i < max_chunks && processor_->process_more(); ++i) {}
  refresh_stats();
  return !processor_->is_fully_processed();
}

const Slide* ReaderSession::slide_at(size_t index) {
  if (processor_) {
    while (!processor_->is_fully_processed() && processor_->processed_slides_count() <= index) {
      processor_->process_more();
    }
    refresh_stats();
  }
  const auto& all = slides();
  return index < all.size() ? &all[index] : nullptr;
}

void ReaderSession::update_settings(const ReaderSettings& next) {
  if (next.font != settings_.font || next.font_size != settings_.font_size) {
    if (processor_) processor_->recalculate_pixel_offsets(next.font, next.font_size);
    else recalculate_pixel_offsets(slides_, next.font, next.font_size, measurer_);
  }
  if (next.wpm != settings_.wpm && next.wpm > 0) {
    if (processor_) processor_->rescale_wpm(settings_.wpm, next.wpm);
    else adjust_timing_by_wpm(slides_, settings_.wpm, next.wpm);
  }
  settings_ = next;
  refresh_stats();
}

void ReaderSession::set_wpm(int wpm) {
  ReaderSettings next = settings_;
  next.wpm = wpm;
  update_settings(next);
}

const std::vector<Slide>& ReaderSession::slides() const {
  return processor_ ? processor_->slides() : slides_;
}

size_t ReaderSession::total_slides() const {
  return processor_ ? processor_->total_estimated_slides() : slides_.size();
}

double ReaderSession::progress(size_t current_index) const {
  size_t total = total_slides();
  if (total == 0) return 0;
  return (double)(current_index + 1) / (double)total * 100.0;
}

int ReaderSession::processing_progress() const {
  if (!processor_) return slides_.empty() && title_.empty() ? 0 : 100;
  if (processor_->is_fully_processed()) return 100;
  size_t total = processor_->total_estimated_slides();
  if (total == 0) return 0;
  return (int)std::lround((double)processor_->processed_slides_count() / (double)total * 100.0);
}

void ReaderSession::refresh_stats() {
  stats_ = calculate_stats(slides(), settings_);
}
