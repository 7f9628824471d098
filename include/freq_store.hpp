#pragma once
#include "word_info.hpp"
#include <cstdint>
#include <string>

// Word counts kept in SQLite; information = -log2(count / total).
class FrequencyStore : public WordInformation {
public:
  explicit FrequencyStore(const std::string& sqlite_path);
  ~FrequencyStore();

  FrequencyStore(const FrequencyStore&) = delete;
  FrequencyStore& operator=(const FrequencyStore&) = delete;

  void ensure_schema();
  void add_count(const std::string& word, int64_t count); // accumulates
  // Reads "word count" lines; returns the number of words imported.
  size_t import_list(const std::string& path);

  int64_t count(const std::string& word) const;
  int64_t total() const;
  double information(const std::string& word) const override;

private:
  struct Impl;
  Impl* impl_;
};
