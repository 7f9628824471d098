#include "text_util.hpp"
#include <re2/re2.h>
#include <cstdlib>

std::u32string utf8_decode(const std::string& s) {
  std::u32string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    unsigned char c = (unsigned char)s[i];
    int extra = 0;
    char32_t cp = 0;
    if (c < 0x80) { cp = c; }
    else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
    else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
    else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
    else { out.push_back(0xFFFD); ++i; continue; }

    if (i + extra >= s.size()) {
      out.push_back(0xFFFD); ++i; continue;
    }
    bool ok = true;
    for (int k = 1; k <= extra; ++k) {
      unsigned char cc = (unsigned char)s[i + k];
      if ((cc & 0xC0) != 0x80) { ok = false; break; }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (!ok) { out.push_back(0xFFFD); ++i; continue; }
    out.push_back(cp);
    i += extra + 1;
  }
  return out;
}

std::string utf8_encode(const std::u32string& s) {
  std::string out;
  out.reserve(s.size());
  for (char32_t cp : s) {
    if (cp < 0x80) {
      out.push_back((char)cp);
    } else if (cp < 0x800) {
      out.push_back((char)(0xC0 | (cp >> 6)));
      out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back((char)(0xE0 | (cp >> 12)));
      out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
      out.push_back((char)(0xF0 | (cp >> 18)));
      out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back((char)(0x80 | (cp & 0x3F)));
    }
  }
  return out;
}

size_t utf8_length(const std::string& s) {
  return utf8_decode(s).size();
}

size_t utf8_floor(const std::string& s, size_t pos) {
  if (pos >= s.size()) return s.size();
  while (pos > 0 && ((unsigned char)s[pos] & 0xC0) == 0x80) --pos;
  return pos;
}

std::string trim(const std::string& s) {
  auto a = s.find_first_not_of(" \t\r\n\f\v");
  auto b = s.find_last_not_of(" \t\r\n\f\v");
  if (a == std::string::npos) return "";
  return s.substr(a, b - a + 1);
}

std::string html_decode(const std::string& s) {
  if (s.find('&') == std::string::npos) return s;

  static const RE2 entity("&(#[xX][0-9a-fA-F]+|#[0-9]+|[a-zA-Z]+);");
  std::string out;
  out.reserve(s.size());
  re2::StringPiece input(s);
  re2::StringPiece name;
  const char* last = s.data();
  while (RE2::FindAndConsume(&input, entity, &name)) {
    // `input` now starts right after the match.
    const char* match_begin = name.data() - 1;
    out.append(last, match_begin - last);
    last = input.data();

    std::string n(name.data(), name.size());
    std::string rep;
    if (n == "amp") rep = "&";
    else if (n == "lt") rep = "<";
    else if (n == "gt") rep = ">";
    else if (n == "quot") rep = "\"";
    else if (n == "apos") rep = "'";
    else if (n == "nbsp") rep = " ";
    else if (n[0] == '#') {
      bool hex = n.size() > 1 && (n[1] == 'x' || n[1] == 'X');
      unsigned long cp = std::strtoul(n.c_str() + (hex ? 2 : 1), nullptr, hex ? 16 : 10);
      if (cp == 0xA0) rep = " ";
      else if (cp > 0 && cp <= 0x10FFFF) rep = utf8_encode(std::u32string(1, (char32_t)cp));
    }
    if (rep.empty()) rep = "&" + n + ";"; // unknown entity stays as written
    out += rep;
  }
  out.append(last, s.data() + s.size() - last);
  return out;
}

std::vector<std::string> split_whitespace(const std::string& s) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && is_ascii_space(s[i])) ++i;
    size_t b = i;
    while (i < s.size() && !is_ascii_space(s[i])) ++i;
    if (i > b) out.push_back(s.substr(b, i - b));
  }
  return out;
}
