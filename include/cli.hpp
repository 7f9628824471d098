#pragma once
#include <string>

struct Args {
  std::string mode;          // "process", "content", "estimate" or "import-freq"
  std::string input_path;
  std::string settings_path;
  std::string freq_db;       // SQLite word-frequency table; built-in list if empty
  bool json = false;
  bool quiet = false;
  long chunk_chars = 10000;

  // -1 / empty = keep the settings file or default
  int wpm = -1;
  int words_per_slide = -1;
  std::string algorithm;
  std::string font;
  double font_size = -1;
  double min_duration = -1;
};

Args parse_cli(int argc, char** argv);
