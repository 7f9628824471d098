#include "cli.hpp"
#include "engine.hpp"
#include "freq_store.hpp"
#include "json_io.hpp"
#include "session.hpp"

#include <cstdio>
#include <iostream>
#include <memory>

static ReaderSettings settings_from_args(const Args& args) {
  ReaderSettings s;
  if (!args.settings_path.empty()) s = load_settings(args.settings_path);
  if (args.wpm > 0) s.wpm = args.wpm;
  if (args.words_per_slide > 0) s.chunk_size = args.words_per_slide;
  if (!args.algorithm.empty()) s.algorithm = algorithm_from_name(args.algorithm);
  if (!args.font.empty()) s.font = args.font;
  if (args.font_size > 0) s.font_size = args.font_size;
  if (args.min_duration >= 0) s.min_slide_duration = args.min_duration;
  return s;
}

static void print_slides(const std::vector<Slide>& slides, const SlideShowData& stats,
                         const std::vector<size_t>& block_indices, bool json) {
  if (json) {
    std::cout << "{\"slides\": " << slides_to_json(slides)
              << ",\n\"stats\": " << stats_to_json(stats);
    if (!block_indices.empty()) std::cout << ",\n\"blockIndices\": " << indices_to_json(block_indices);
    std::cout << "}\n";
    return;
  }
  char buf[64];
  for (const auto& s : slides) {
    std::snprintf(buf, sizeof(buf), "%6d %8.1f %6.0f %2d%s ", s.slide_number, s.duration,
                  s.post_delay, s.optimal_letter_position, s.is_child_of_previous ? "+" : " ");
    std::cout << buf;
    if (s.is_block()) std::cout << "[" << block_type_name(s.block_type()) << "] ";
    std::cout << s.text << "\n";
  }
  std::cerr << stats.total_slides << " slides, "
            << (long)(stats.total_duration_with_pauses / 1000) << " s with pauses, "
            << stats.real_wpm << " wpm\n";
  if (!block_indices.empty()) {
    std::cerr << "blocks start at";
    for (size_t i : block_indices) std::cerr << " " << i;
    std::cerr << "\n";
  }
}

static int run(const Args& args) {
  if (args.mode == "import-freq") {
    FrequencyStore store(args.freq_db);
    size_t n = store.import_list(args.input_path);
    std::cerr << "Imported " << n << " words into " << args.freq_db << "\n";
    return 0;
  }

  ReaderSettings settings = settings_from_args(args);

  if (args.mode == "estimate") {
    std::string text = read_file(args.input_path);
    auto e = estimate_reading_time(text, settings.wpm);
    auto sections = split_into_sections(text);
    if (args.json) {
      std::cout << "{\"words\": " << e.words << ", \"minutes\": " << e.minutes
                << ", \"seconds\": " << e.seconds << ",\n\"sections\": " << sections_to_json(sections) << "}\n";
    } else {
      std::cout << e.words << " words, " << e.minutes << " min " << e.seconds << " s at "
                << settings.wpm << " wpm\n";
      for (const auto& s : sections) std::cout << "  @" << s.start << " " << s.preview << "\n";
    }
    return 0;
  }

  std::unique_ptr<FrequencyStore> freq;
  if (!args.freq_db.empty()) freq = std::make_unique<FrequencyStore>(args.freq_db);

  ChunkerOptions chunker;
  chunker.chunk_chars = (size_t)args.chunk_chars;
  ReaderSession session(settings, chunker, freq.get());

  if (args.mode == "content") {
    auto content = load_content(args.input_path);
    session.load_content(content);
    if (!args.quiet) std::cerr << content.blocks.size() << " blocks\n";
  } else {
    session.load_text(read_file(args.input_path), args.input_path);
    while (session.process_more_chunks()) {
      if (!args.quiet) {
        std::cerr << "Processed " << session.processing_progress() << "% ("
                  << session.slides().size() << " slides)\n";
      }
    }
  }

  print_slides(session.slides(), session.stats(), session.block_indices(), args.json);
  return 0;
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);
  try {
    return run(args);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
}
