#pragma once
#include "chunked_processor.hpp"
#include "slide.hpp"
#include <string>
#include <vector>

// {"title": "...", "source": "...", "blocks": [{"type": "code", "content": "...",
//   "metadata": {"language": "cpp"}}, ...]}; a bare array of blocks also works.
ParsedContent parse_content(const std::string& json_text);
ParsedContent load_content(const std::string& path);

std::string slides_to_json(const std::vector<Slide>& slides);
std::string stats_to_json(const SlideShowData& stats);
std::string sections_to_json(const std::vector<Section>& sections);
std::string indices_to_json(const std::vector<size_t>& indices);

std::string read_file(const std::string& path);
