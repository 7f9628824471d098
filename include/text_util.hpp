#pragma once
#include <string>
#include <vector>

// UTF-8 helpers. Invalid bytes decode as U+FFFD, one byte at a time.
std::u32string utf8_decode(const std::string& s);
std::string utf8_encode(const std::u32string& s);
size_t utf8_length(const std::string& s);

// Largest offset <= pos that does not fall inside a multi-byte sequence.
size_t utf8_floor(const std::string& s, size_t pos);

inline bool is_ascii_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim(const std::string& s);

// Decodes the named entities the reader cares about plus numeric &#N; / &#xN;.
std::string html_decode(const std::string& s);

// Splits on ASCII whitespace, dropping empty pieces.
std::vector<std::string> split_whitespace(const std::string& s);
