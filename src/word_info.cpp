#include "word_info.hpp"
#include <algorithm>
#include <cmath>

namespace {
// Most frequent English words, most frequent first.
const char* kRanked[] = {
  "the", "of", "and", "to", "a", "in", "is", "you", "that", "it",
  "he", "was", "for", "on", "are", "as", "with", "his", "they", "i",
  "at", "be", "this", "have", "from", "or", "one", "had", "by", "word",
  "but", "not", "what", "all", "were", "we", "when", "your", "can", "said",
  "there", "use", "an", "each", "which", "she", "do", "how", "their", "if",
  "will", "up", "other", "about", "out", "many", "then", "them", "these", "so",
  "some", "her", "would", "make", "like", "him", "into", "time", "has", "look",
  "two", "more", "write", "go", "see", "number", "no", "way", "could", "people",
  "my", "than", "first", "water", "been", "call", "who", "oil", "its", "now",
  "find", "long", "down", "day", "did", "get", "come", "made", "may", "part",
  "over", "new", "sound", "take", "only", "little", "work", "know", "place", "year",
  "live", "me", "back", "give", "most", "very", "after", "thing", "our", "just",
  "name", "good", "sentence", "man", "think", "say", "great", "where", "help", "through",
  "much", "before", "line", "right", "too", "mean", "old", "any", "same", "tell",
  "boy", "follow", "came", "want", "show", "also", "around", "form", "three", "small",
  "set", "put", "end", "does", "another", "well", "large", "must", "big", "even",
  "such", "because", "turn", "here", "why", "ask", "went", "men", "read", "need",
  "land", "different", "home", "us", "move", "try", "kind", "hand", "picture", "again",
  "change", "off", "play", "spell", "air", "away", "animal", "house", "point", "page",
  "letter", "mother", "answer", "found", "study", "still", "learn", "should", "world", "high",
};
}

double clamp_information(double bits) {
  return std::max(INFO_LOW, std::min(INFO_HIGH, bits));
}

std::string ascii_lower(std::string s) {
  for (auto& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
  return s;
}

BuiltinWordInformation::BuiltinWordInformation() {
  size_t rank = 1;
  for (const char* w : kRanked) {
    bits_.emplace(w, clamp_information(std::log2(10.0 * (double)rank)));
    ++rank;
  }
}

double BuiltinWordInformation::information(const std::string& word) const {
  auto it = bits_.find(ascii_lower(word));
  return it == bits_.end() ? INFO_HIGH : it->second;
}

const BuiltinWordInformation& BuiltinWordInformation::instance() {
  static const BuiltinWordInformation info;
  return info;
}
