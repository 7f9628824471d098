#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class BlockType { Text, Code, Heading, Blockquote, Image, List, Table, Hr };

const char* block_type_name(BlockType t);
// Throws std::runtime_error on an unknown name.
BlockType block_type_from_name(const std::string& name);

struct BlockMetadata {
  std::optional<std::string> language; // code blocks
  std::optional<int> level;            // headings (1-6)
  std::optional<std::string> src;      // images
  std::optional<std::string> alt;      // images
  std::optional<bool> ordered;         // lists
};

// Ordinary RSVP slide. `origin` is Text, Blockquote or List.
struct PlainSlide {
  BlockType origin = BlockType::Text;
  std::optional<BlockMetadata> metadata;
};

// Verbatim slide for a code/table/heading/image block.
struct BlockSlide {
  BlockType type = BlockType::Code;
  std::optional<BlockMetadata> metadata;
};

struct Slide {
  std::string text;
  std::string text_original;
  double duration = 0;          // ms
  double pre_delay = 0;         // ms, reserved
  double post_delay = 0;        // ms
  int wpm = 0;                  // wpm in effect when timed
  int optimal_letter_position = 1; // 1-based, code points
  double pixel_offset = 0;
  int slide_number = 0;
  int words_in_slide = 0;
  bool is_child_of_previous = false;
  std::variant<PlainSlide, BlockSlide> body;

  bool is_block() const { return std::holds_alternative<BlockSlide>(body); }
  BlockType block_type() const;
};

struct SlideShowData {
  double total_duration = 0;
  double total_duration_with_pauses = 0;
  size_t total_slides = 0;
  double min_duration = 0;
  double max_duration = 0;
  int real_wpm = 0;
};

struct ContentBlock {
  BlockType type = BlockType::Text;
  std::string content;
  std::optional<BlockMetadata> metadata;
};

struct ParsedContent {
  std::vector<ContentBlock> blocks;
  std::string title;
  std::string source;
};
