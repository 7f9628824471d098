// =============================================================================
// Chunked Processor Tests
// =============================================================================

#include <gtest/gtest.h>
#include "chunked_processor.hpp"
#include "engine.hpp"
#include "text_util.hpp"

#include <string>
#include <vector>

namespace {

// Prose with commas, hyphenated and over-long words, and paragraph breaks.
std::string sample_text(int sentences) {
  std::string out;
  for (int i = 0; i < sentences; ++i) {
    out += "Sentence " + std::to_string(i) + " has a well-known-author, and ";
    out += "extraordinarilylongwordhere text.";
    out += (i % 5 == 4) ? "\n\n" : " ";
  }
  return out;
}

void expect_same_slides(const std::vector<Slide>& got, const std::vector<Slide>& want) {
  ASSERT_EQ(got.size(), want.size());
  for (size_t i = 0; i < got.size(); ++i) {
    SCOPED_TRACE("slide " + std::to_string(i));
    EXPECT_EQ(got[i].text, want[i].text);
    EXPECT_EQ(got[i].text_original, want[i].text_original);
    EXPECT_EQ(got[i].slide_number, want[i].slide_number);
    EXPECT_EQ(got[i].is_child_of_previous, want[i].is_child_of_previous);
    EXPECT_EQ(got[i].words_in_slide, want[i].words_in_slide);
    EXPECT_EQ(got[i].optimal_letter_position, want[i].optimal_letter_position);
    EXPECT_DOUBLE_EQ(got[i].duration, want[i].duration);
    EXPECT_DOUBLE_EQ(got[i].post_delay, want[i].post_delay);
    EXPECT_DOUBLE_EQ(got[i].pixel_offset, want[i].pixel_offset);
    EXPECT_EQ(got[i].wpm, want[i].wpm);
  }
}

ChunkerOptions small_chunks(size_t chars = 500) {
  ChunkerOptions o;
  o.chunk_chars = chars;
  return o;
}

} // namespace

class ChunkedProcessorTest : public ::testing::Test {
protected:
  ReaderSettings settings;
  std::string text = sample_text(600);
};

// ---------------------------------------------------------------------------
// Partitioning
// ---------------------------------------------------------------------------

TEST(PartitionTest, CutsLandOnWhitespace) {
  auto chunks = partition_text("aaa bbb ccc", 5);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].start, 0u); EXPECT_EQ(chunks[0].end, 3u);
  EXPECT_EQ(chunks[1].start, 3u); EXPECT_EQ(chunks[1].end, 7u);
  EXPECT_EQ(chunks[2].start, 7u); EXPECT_EQ(chunks[2].end, 11u);
}

TEST(PartitionTest, ChunksAreContiguousAndBounded) {
  std::string text = sample_text(200);
  auto chunks = partition_text(text, 300);
  ASSERT_GT(chunks.size(), 2u);
  size_t pos = 0;
  for (const auto& c : chunks) {
    EXPECT_EQ(c.start, pos);
    EXPECT_LE(c.end - c.start, 300u);
    if (c.end < text.size()) EXPECT_TRUE(is_ascii_space(text[c.end]));
    pos = c.end;
  }
  EXPECT_EQ(pos, text.size());
}

TEST(PartitionTest, HardCutWithoutWhitespace) {
  auto chunks = partition_text("abcdefghij", 4);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].end, 4u);
  EXPECT_EQ(chunks[1].end, 8u);
  EXPECT_EQ(chunks[2].end, 10u);
}

TEST(PartitionTest, HardCutKeepsUtf8SequencesWhole) {
  std::string text = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9"; // five e-acute
  auto chunks = partition_text(text, 3);
  ASSERT_EQ(chunks.size(), 5u);
  for (const auto& c : chunks) {
    EXPECT_EQ(utf8_length(text.substr(c.start, c.end - c.start)), 1u);
  }
}

TEST(PartitionTest, EmptyTextHasNoChunks) {
  EXPECT_TRUE(partition_text("", 100).empty());
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TEST_F(ChunkedProcessorTest, SmallInputIsCompleteAtConstruction) {
  std::string small = "A short text, read at once.";
  ChunkedProcessor p(small, settings);
  EXPECT_TRUE(p.is_fully_processed());
  EXPECT_EQ(p.state(), ProcessingState::Complete);
  EXPECT_EQ(p.total_estimated_slides(), p.processed_slides_count());
  expect_same_slides(p.slides(), process_text(small, settings).slides);
}

TEST_F(ChunkedProcessorTest, TwoChunksCountAsSmall) {
  std::string two = sample_text(4);
  ChunkedProcessor p(two, settings, small_chunks(two.size() / 2 + 40));
  ASSERT_EQ(p.chunks().size(), 2u);
  EXPECT_TRUE(p.is_fully_processed());
  EXPECT_FALSE(p.process_more());
}

TEST_F(ChunkedProcessorTest, LargeInputProcessesOnlyTheFirstChunk) {
  ChunkedProcessor p(text, settings, small_chunks());
  ASSERT_GT(p.chunks().size(), 2u);
  EXPECT_EQ(p.processed_chunks(), 1u);
  EXPECT_EQ(p.state(), ProcessingState::InProgress);
  EXPECT_FALSE(p.is_fully_processed());
  EXPECT_TRUE(p.chunks()[0].processed);
  EXPECT_FALSE(p.chunks()[1].processed);
  EXPECT_EQ(p.processed_slides_count(), p.chunks()[0].slide_count);
  EXPECT_GT(p.processed_slides_count(), 0u);
  EXPECT_GT(p.total_estimated_slides(), p.processed_slides_count());
}

TEST_F(ChunkedProcessorTest, LazyProcessorStartsUntouched) {
  ChunkerOptions o = small_chunks();
  o.eager_first_chunk = false;
  ChunkedProcessor p(text, settings, o);
  EXPECT_EQ(p.state(), ProcessingState::NotStarted);
  EXPECT_EQ(p.processed_slides_count(), 0u);
  EXPECT_EQ(p.total_estimated_slides(), split_whitespace(text).size());

  EXPECT_TRUE(p.process_more());
  EXPECT_EQ(p.state(), ProcessingState::InProgress);
}

TEST_F(ChunkedProcessorTest, EmptyTextIsComplete) {
  ChunkedProcessor p("", settings);
  EXPECT_TRUE(p.is_fully_processed());
  EXPECT_EQ(p.total_estimated_slides(), 0u);
  EXPECT_FALSE(p.get_slide(0).has_value());
  EXPECT_TRUE(p.get_slides(0, 10).empty());
  EXPECT_EQ(p.get_stats().total_slides, 0u);
  EXPECT_FALSE(p.process_more());
}

// ---------------------------------------------------------------------------
// Incremental processing
// ---------------------------------------------------------------------------

TEST_F(ChunkedProcessorTest, FullReadMatchesDirectPipeline) {
  ChunkedProcessor p(text, settings, small_chunks());
  p.process_all();
  EXPECT_TRUE(p.is_fully_processed());
  expect_same_slides(p.slides(), process_text(text, settings).slides);
}

TEST_F(ChunkedProcessorTest, FullReadMatchesDirectPipelineWithFrequencyTiming) {
  settings.algorithm = TimingAlgorithm::WordFrequency;
  ChunkedProcessor p(text, settings, small_chunks(777));
  p.process_all();
  expect_same_slides(p.slides(), process_text(text, settings).slides);
}

TEST_F(ChunkedProcessorTest, ChunkSlideRangesAreContiguous) {
  ChunkedProcessor p(text, settings, small_chunks());
  p.process_all();
  size_t next = 0;
  for (const auto& c : p.chunks()) {
    EXPECT_TRUE(c.processed);
    EXPECT_EQ(c.slide_start, next);
    next += c.slide_count;
  }
  EXPECT_EQ(next, p.processed_slides_count());

  int prev = 0;
  for (const auto& s : p.slides()) {
    EXPECT_GE(s.slide_number, prev);
    prev = s.slide_number;
  }
  EXPECT_EQ(p.slides().back().post_delay, 0);
}

TEST_F(ChunkedProcessorTest, ProcessMoreReportsWhetherChunksRemain) {
  ChunkedProcessor p(text, settings, small_chunks());
  const size_t n = p.chunks().size();

  size_t trues = 0;
  while (p.process_more()) ++trues;
  EXPECT_EQ(trues, n - 2); // chunk 0 at construction, the last call returns false
  EXPECT_TRUE(p.is_fully_processed());
  EXPECT_EQ(p.processed_chunks(), n);

  for (int i = 0; i < 3; ++i) EXPECT_FALSE(p.process_more());
  EXPECT_EQ(p.processed_chunks(), n);
}

TEST_F(ChunkedProcessorTest, ProcessAllDrainsEverything) {
  ChunkedProcessor p(text, settings, small_chunks());
  p.process_all();
  EXPECT_EQ(p.state(), ProcessingState::Complete);
  p.process_all();
  EXPECT_EQ(p.total_estimated_slides(), p.processed_slides_count());
}

TEST_F(ChunkedProcessorTest, LastSlideHasNoPauseWhenTailIsWhitespace) {
  std::string tail_text;
  for (int i = 0; i < 40; ++i) tail_text += "word ";
  tail_text += "end." + std::string(200, ' ');

  ChunkedProcessor p(tail_text, settings, small_chunks(64));
  ASSERT_GT(p.chunks().size(), 2u);
  p.process_all();
  EXPECT_EQ(p.chunks().back().slide_count, 0u);
  ASSERT_FALSE(p.slides().empty());
  EXPECT_EQ(p.slides().back().text, "end.");
  EXPECT_DOUBLE_EQ(p.slides().back().post_delay, 0);
  expect_same_slides(p.slides(), process_text(tail_text, settings).slides);
}

TEST_F(ChunkedProcessorTest, LastSlideHasNoPauseWhenTailIsPunctuation) {
  std::string tail_text;
  for (int i = 0; i < 40; ++i) tail_text += "word ";
  tail_text += "end.";
  for (int i = 0; i < 60; ++i) tail_text += " ...";

  ChunkedProcessor p(tail_text, settings, small_chunks(64));
  ASSERT_GT(p.chunks().size(), 2u);
  p.process_all();
  EXPECT_EQ(p.chunks().back().slide_count, 0u);
  ASSERT_FALSE(p.slides().empty());
  EXPECT_EQ(p.slides().back().text, "end.");
  EXPECT_DOUBLE_EQ(p.slides().back().post_delay, 0);
  expect_same_slides(p.slides(), process_text(tail_text, settings).slides);
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

TEST_F(ChunkedProcessorTest, RandomAccessProcessesTheRangePlusBuffer) {
  auto direct = process_text(text, settings).slides;
  ASSERT_GT(direct.size(), 2000u);

  ChunkedProcessor p(text, settings, small_chunks());
  auto got = p.get_slides(1000, 10);
  ASSERT_EQ(got.size(), 10u);
  EXPECT_GE(p.processed_slides_count(), 1000u + 10u + 500u);
  EXPECT_FALSE(p.is_fully_processed());

  std::vector<Slide> want(direct.begin() + 1000, direct.begin() + 1010);
  expect_same_slides(got, want);
}

TEST_F(ChunkedProcessorTest, GetSlideMatchesDirectIndex) {
  auto direct = process_text(text, settings).slides;
  ChunkedProcessor p(text, settings, small_chunks());
  auto s = p.get_slide(1777);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->text, direct[1777].text);
  EXPECT_EQ(s->slide_number, direct[1777].slide_number);
}

TEST_F(ChunkedProcessorTest, GetSlidePastTheEndIsEmpty) {
  ChunkedProcessor p(text, settings, small_chunks());
  EXPECT_FALSE(p.get_slide(10000000).has_value());
  EXPECT_TRUE(p.is_fully_processed());

  auto tail = p.get_slides(p.processed_slides_count() - 3, 100);
  EXPECT_EQ(tail.size(), 3u);
}

TEST_F(ChunkedProcessorTest, StatsCoverProcessedSlidesOnly) {
  ChunkedProcessor p(text, settings, small_chunks());
  auto partial = p.get_stats();
  EXPECT_EQ(partial.total_slides, p.processed_slides_count());

  p.process_all();
  auto full = p.get_stats();
  EXPECT_EQ(full.total_slides, p.processed_slides_count());
  EXPECT_GT(full.total_duration, partial.total_duration);
}

TEST_F(ChunkedProcessorTest, EstimateTracksProgressAndBecomesExact) {
  ChunkedProcessor p(text, settings, small_chunks());
  size_t prev = p.total_estimated_slides();
  while (p.process_more()) {
    size_t est = p.total_estimated_slides();
    EXPECT_GE(est, p.processed_slides_count());
    EXPECT_GE(est, prev);
    prev = est;
  }
  EXPECT_EQ(p.total_estimated_slides(), p.processed_slides_count());
  EXPECT_EQ(p.total_estimated_slides(), process_text(text, settings).slides.size());
}

TEST_F(ChunkedProcessorTest, EstimateComesFromFirstChunkDensity) {
  // Half the whitespace tokens are dashes, which never become slides.
  std::string dashed;
  for (int i = 0; i < 3000; ++i) dashed += "word - ";

  ChunkedProcessor p(dashed, settings, small_chunks(500));
  ASSERT_EQ(p.state(), ProcessingState::InProgress);
  size_t first = p.total_estimated_slides();
  EXPECT_NEAR((double)first, 3000.0, 30.0);

  size_t prev = first;
  while (p.process_more()) {
    EXPECT_GE(p.total_estimated_slides(), prev);
    prev = p.total_estimated_slides();
  }
  EXPECT_EQ(p.total_estimated_slides(), 3000u);
}

// ---------------------------------------------------------------------------
// Live updates
// ---------------------------------------------------------------------------

TEST_F(ChunkedProcessorTest, WpmRescaleAlsoAppliesToLaterChunks) {
  ChunkedProcessor p(text, settings, small_chunks());
  p.rescale_wpm(300, 600);
  p.process_all();

  ReaderSettings faster = settings;
  faster.wpm = 600;
  expect_same_slides(p.slides(), process_text(text, faster).slides);
}

TEST_F(ChunkedProcessorTest, FontChangeAlsoAppliesToLaterChunks) {
  ChunkedProcessor p(text, settings, small_chunks());
  p.recalculate_pixel_offsets("monospace", 24);
  p.process_all();

  ReaderSettings mono = settings;
  mono.font = "monospace";
  mono.font_size = 24;
  expect_same_slides(p.slides(), process_text(text, mono).slides);
}

// ---------------------------------------------------------------------------
// Estimates and sections
// ---------------------------------------------------------------------------

TEST(ReadingEstimateTest, CountsWordsAndTime) {
  std::string words;
  for (int i = 0; i < 630; ++i) words += "word ";
  auto e = estimate_reading_time(words, 300);
  EXPECT_EQ(e.words, 630u);
  EXPECT_EQ(e.minutes, 2);
  EXPECT_EQ(e.seconds, 6);

  auto none = estimate_reading_time("   ", 300);
  EXPECT_EQ(none.words, 0u);
  EXPECT_EQ(none.minutes, 0);
  EXPECT_EQ(none.seconds, 0);
}

TEST(SectionsTest, SplitsOnBlankLines) {
  std::string text = "First para.\n\nSecond para.\n \nThird";
  auto sections = split_into_sections(text);
  ASSERT_EQ(sections.size(), 3u);
  EXPECT_EQ(sections[0].start, 0u);
  EXPECT_EQ(sections[0].end, 11u);
  EXPECT_EQ(sections[0].preview, "First para.");
  EXPECT_EQ(sections[1].start, 13u);
  EXPECT_EQ(sections[1].end, 25u);
  EXPECT_EQ(sections[2].start, 28u);
  EXPECT_EQ(sections[2].end, text.size());
  EXPECT_EQ(sections[2].preview, "Third");
}

TEST(SectionsTest, LongSectionsGetTruncatedPreview) {
  std::string text(150, 'a');
  auto sections = split_into_sections(text);
  ASSERT_EQ(sections.size(), 1u);
  EXPECT_EQ(sections[0].preview, std::string(100, 'a') + "...");
}
