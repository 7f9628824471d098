#include "cli.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

static const char* USAGE =
"rsvp process <file> [--settings path] [--wpm N] [--words-per-slide N] [--algorithm basic|wordLength|wordFrequency]\n"
"                    [--font name] [--font-size N] [--min-duration MS] [--freq-db path] [--chunk-chars N] [--json] [--quiet]\n"
"rsvp content <blocks.json> [same options as process]\n"
"rsvp estimate <file> [--wpm N] [--json]\n"
"rsvp import-freq <word-count-list> --freq-db path\n";

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 3) { std::cerr << USAGE; std::exit(1); }
  a.mode = argv[1];
  if (a.mode != "process" && a.mode != "content" && a.mode != "estimate" && a.mode != "import-freq") {
    std::cerr << USAGE; std::exit(1);
  }
  a.input_path = argv[2];

  int i = 3;
  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      dst = argv[i++];
    };
    try {
      std::string v;
      if (f == "--settings") next(a.settings_path);
      else if (f == "--freq-db") next(a.freq_db);
      else if (f == "--algorithm") next(a.algorithm);
      else if (f == "--font") next(a.font);
      else if (f == "--wpm") { next(v); a.wpm = std::stoi(v); }
      else if (f == "--words-per-slide") { next(v); a.words_per_slide = std::stoi(v); }
      else if (f == "--font-size") { next(v); a.font_size = std::stod(v); }
      else if (f == "--min-duration") { next(v); a.min_duration = std::stod(v); }
      else if (f == "--chunk-chars") { next(v); a.chunk_chars = std::stol(v); }
      else if (f == "--json") a.json = true;
      else if (f == "--quiet") a.quiet = true;
      else { std::cerr << "Unknown flag: " << f << "\n"; std::exit(1); }
    } catch (const std::logic_error&) {
      std::cerr << "Bad number after " << f << "\n"; std::exit(1);
    }
  }

  if (a.mode == "import-freq" && a.freq_db.empty()) { std::cerr << USAGE; std::exit(1); }
  if ((a.wpm != -1 && a.wpm <= 0) || a.chunk_chars <= 0 ||
      (a.words_per_slide != -1 && (a.words_per_slide < 1 || a.words_per_slide > 5))) {
    std::cerr << USAGE; std::exit(1);
  }
  return a;
}
