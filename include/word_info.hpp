#pragma once
#include <string>
#include <unordered_map>

// Information content bounds in bits. Common words sit near INFO_LOW,
// unknown or rare ones at INFO_HIGH.
constexpr double INFO_LOW = 4.0;
constexpr double INFO_HIGH = 17.0;

double clamp_information(double bits);

class WordInformation {
public:
  virtual ~WordInformation() = default;
  // Bits of surprise for `word`, in [INFO_LOW, INFO_HIGH]. Case-insensitive.
  virtual double information(const std::string& word) const = 0;
};

// Zipf estimate over an embedded list of frequent English words:
// rank r -> log2(10 r) bits.
class BuiltinWordInformation : public WordInformation {
public:
  BuiltinWordInformation();
  double information(const std::string& word) const override;

  static const BuiltinWordInformation& instance();

private:
  std::unordered_map<std::string, double> bits_;
};

std::string ascii_lower(std::string s);
