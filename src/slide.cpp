#include "slide.hpp"
#include <stdexcept>

const char* block_type_name(BlockType t) {
  switch (t) {
    case BlockType::Text: return "text";
    case BlockType::Code: return "code";
    case BlockType::Heading: return "heading";
    case BlockType::Blockquote: return "blockquote";
    case BlockType::Image: return "image";
    case BlockType::List: return "list";
    case BlockType::Table: return "table";
    case BlockType::Hr: return "hr";
  }
  return "text";
}

BlockType block_type_from_name(const std::string& name) {
  static const BlockType all[] = {BlockType::Text, BlockType::Code, BlockType::Heading,
                                  BlockType::Blockquote, BlockType::Image, BlockType::List,
                                  BlockType::Table, BlockType::Hr};
  for (auto t : all) if (name == block_type_name(t)) return t;
  throw std::runtime_error("content: unknown block type '" + name + "'");
}

BlockType Slide::block_type() const {
  if (auto* b = std::get_if<BlockSlide>(&body)) return b->type;
  return std::get<PlainSlide>(body).origin;
}
