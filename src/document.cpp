#include "document.hpp"
#include "text.hpp"
#include <algorithm>

size_t TableData::column_count() const {
  size_t n = headers.size();
  for (auto& row : cells) n = std::max(n, row.size());
  return n;
}

const char* to_string(BlockType t) {
  switch (t) {
    case BlockType::Paragraph: return "Paragraph";
    case BlockType::Heading:   return "Heading";
    case BlockType::ListItem:  return "ListItem";
    case BlockType::CodeBlock: return "CodeBlock";
    case BlockType::Quote:     return "Quote";
    case BlockType::Header:    return "Header";
    case BlockType::Footer:    return "Footer";
    case BlockType::Caption:   return "Caption";
    case BlockType::TocEntry:  return "TocEntry";
    case BlockType::Note:      return "Note";
  }
  return "Paragraph";
}

const char* to_string(StructureType t) {
  switch (t) {
    case StructureType::Code:  return "Code";
    case StructureType::Table: return "Table";
    case StructureType::List:  return "List";
  }
  return "Code";
}

const char* to_string(DocumentDomain d) {
  switch (d) {
    case DocumentDomain::General:   return "General";
    case DocumentDomain::Technical: return "Technical";
    case DocumentDomain::Business:  return "Business";
    case DocumentDomain::Academic:  return "Academic";
  }
  return "General";
}

const char* to_string(Alignment a) {
  switch (a) {
    case Alignment::Left:    return "Left";
    case Alignment::Right:   return "Right";
    case Alignment::Center:  return "Center";
    case Alignment::Justify: return "Justify";
  }
  return "Left";
}

BlockType block_type_from(const std::string& s) {
  static const BlockType all[] = {
    BlockType::Paragraph, BlockType::Heading, BlockType::ListItem, BlockType::CodeBlock,
    BlockType::Quote, BlockType::Header, BlockType::Footer, BlockType::Caption,
    BlockType::TocEntry, BlockType::Note };
  auto k = to_lower(s);
  for (auto t : all) if (to_lower(to_string(t)) == k) return t;
  return BlockType::Paragraph;
}

Alignment alignment_from(const std::string& s) {
  auto k = to_lower(s);
  if (k == "right") return Alignment::Right;
  if (k == "center") return Alignment::Center;
  if (k == "justify") return Alignment::Justify;
  return Alignment::Left;
}
