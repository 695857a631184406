// top100/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "top100/syntax/ts_ll.hpp"

#include <stdexcept>

namespace top100::ts_ll
{

Parser::Parser()
{
  parser_ = ts_parser_new();
  if (parser_ == nullptr) {
    throw std::runtime_error("ts_parser_new() failed");
  }

  const TSLanguage * lang = tree_sitter_c_sharp();
  // Checked in Release builds too: a grammar built against an incompatible
  // tree-sitter ABI is rejected here.
  if (lang == nullptr || !ts_parser_set_language(parser_, lang)) {
    ts_parser_delete(parser_);
    parser_ = nullptr;
    throw std::runtime_error("ts_parser_set_language() failed for tree-sitter-c-sharp");
  }
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

Tree Parser::parse(std::string_view source) const
{
  return Tree(ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size())));
}

}  // namespace top100::ts_ll
