#include "json_io.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

namespace {
BlockMetadata metadata_from_json(const json& j) {
  BlockMetadata m;
  if (j.contains("language")) m.language = j["language"].get<std::string>();
  if (j.contains("level")) m.level = j["level"].get<int>();
  if (j.contains("src")) m.src = j["src"].get<std::string>();
  if (j.contains("alt")) m.alt = j["alt"].get<std::string>();
  if (j.contains("ordered")) m.ordered = j["ordered"].get<bool>();
  return m;
}

json metadata_to_json(const BlockMetadata& m) {
  json j = json::object();
  if (m.language) j["language"] = *m.language;
  if (m.level) j["level"] = *m.level;
  if (m.src) j["src"] = *m.src;
  if (m.alt) j["alt"] = *m.alt;
  if (m.ordered) j["ordered"] = *m.ordered;
  return j;
}

ContentBlock block_from_json(const json& j) {
  ContentBlock b;
  b.type = block_type_from_name(j.at("type").get<std::string>());
  if (j.contains("content")) b.content = j["content"].get<std::string>();
  if (j.contains("metadata") && j["metadata"].is_object()) b.metadata = metadata_from_json(j["metadata"]);
  return b;
}
}

ParsedContent parse_content(const std::string& json_text) {
  ParsedContent c;
  try {
    auto j = json::parse(json_text);
    const json* blocks = &j;
    if (j.is_object()) {
      if (j.contains("title")) c.title = j["title"].get<std::string>();
      if (j.contains("source")) c.source = j["source"].get<std::string>();
      blocks = &j.at("blocks");
    }
    if (!blocks->is_array()) throw std::runtime_error("content: blocks must be an array");
    for (auto& b : *blocks) c.blocks.push_back(block_from_json(b));
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("content: ") + e.what());
  }
  return c;
}

ParsedContent load_content(const std::string& path) {
  return parse_content(read_file(path));
}

std::string slides_to_json(const std::vector<Slide>& slides) {
  json arr = json::array();
  for (const auto& s : slides) {
    json j = {
      {"text", s.text},
      {"textOriginal", s.text_original},
      {"duration", s.duration},
      {"preDelay", s.pre_delay},
      {"postDelay", s.post_delay},
      {"wpm", s.wpm},
      {"optimalLetterPosition", s.optimal_letter_position},
      {"pixelOffset", s.pixel_offset},
      {"slideNumber", s.slide_number},
      {"wordsInSlide", s.words_in_slide},
      {"isChildOfPrevious", s.is_child_of_previous},
    };
    if (auto* b = std::get_if<BlockSlide>(&s.body)) {
      j["kind"] = "block";
      j["blockType"] = block_type_name(b->type);
      if (b->metadata) j["metadata"] = metadata_to_json(*b->metadata);
    } else {
      const auto& p = std::get<PlainSlide>(s.body);
      j["kind"] = "plain";
      j["blockType"] = block_type_name(p.origin);
      if (p.metadata) j["metadata"] = metadata_to_json(*p.metadata);
    }
    arr.push_back(std::move(j));
  }
  return arr.dump(2, ' ', false, json::error_handler_t::replace);
}

std::string stats_to_json(const SlideShowData& d) {
  json j = {
    {"totalDuration", d.total_duration},
    {"totalDurationWithPauses", d.total_duration_with_pauses},
    {"totalSlides", d.total_slides},
    {"minDuration", d.min_duration},
    {"maxDuration", d.max_duration},
    {"realWPM", d.real_wpm},
  };
  return j.dump(2, ' ', false, json::error_handler_t::replace);
}

std::string sections_to_json(const std::vector<Section>& sections) {
  json arr = json::array();
  for (const auto& s : sections) {
    arr.push_back({{"start", s.start}, {"end", s.end}, {"preview", s.preview}});
  }
  return arr.dump(2, ' ', false, json::error_handler_t::replace);
}

std::string indices_to_json(const std::vector<size_t>& indices) {
  return json(indices).dump();
}
