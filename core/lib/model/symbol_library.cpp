// kicad_format/model/symbol_library.cpp - Symbol library files and entry points
#include "kicad_format/model/symbol_library.hpp"

#include <utility>

#include "kicad_format/sexpr/sexpr_context.hpp"

namespace kicad_format
{
namespace
{

bool next_is_string(const Parser & p)
{
  const Sexpr * next = p.peek();
  return next != nullptr && next->is_string();
}

bool next_is_string(const ParserRef & p) { return isa<StringNode>(p.peek()); }

template <typename P>
SymbolLibraryFile parse_library(P & p)
{
  p.expect_symbol_matching(SymbolLibraryFile::k_keyword);
  SymbolLibraryFile lib;
  lib.version = p.expect_unsigned_with_name("version");
  {
    auto generator = p.expect_list_with_name("generator");
    if (next_is_string(generator)) {
      lib.generator = std::string(generator.expect_string());
      lib.generator_is_string = true;
    } else {
      lib.generator = std::string(generator.expect_symbol());
    }
    generator.expect_end();
  }
  if (auto version = p.maybe_string_with_name("generator_version")) {
    lib.generator_version = std::string(*version);
  }
  lib.symbols = p.template expect_many<SymbolDefinition>();
  p.expect_end();
  return lib;
}

}  // namespace

SymbolLibraryFile SymbolLibraryFile::from_sexpr(Parser parser) { return parse_library(parser); }

SymbolLibraryFile SymbolLibraryFile::from_sexpr_ref(ParserRef parser)
{
  return parse_library(parser);
}

Sexpr SymbolLibraryFile::to_sexpr() const
{
  SexprList items{
    Sexpr::number_with_name("version", static_cast<double>(version)),
    generator_is_string ? Sexpr::string_with_name("generator", generator)
                        : Sexpr::symbol_with_name("generator", generator),
  };
  if (generator_version) {
    items.push_back(Sexpr::string_with_name("generator_version", *generator_version));
  }
  for (const auto & symbol : symbols) {
    items.push_back(symbol.to_sexpr());
  }
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

// ============================================================================
// LibraryLoadError
// ============================================================================

std::string LibraryLoadError::message() const
{
  if (const auto * syntax = std::get_if<SyntaxError>(&error)) {
    return syntax->message;
  }
  return std::get<ParseError>(error).what();
}

Diagnostic LibraryLoadError::to_diagnostic() const
{
  return std::visit([](const auto & e) { return kicad_format::to_diagnostic(e); }, error);
}

// ============================================================================
// Entry points
// ============================================================================

ParseResult<SymbolLibraryFile> parse_symbol_library(const Sexpr & tree)
{
  try {
    return SymbolLibraryFile::from_sexpr(Parser::from_tree(tree));
  } catch (ParseError & e) {
    e.push_context(SymbolLibraryFile::k_keyword);
    return std::move(e);
  }
}

LibraryLoadResult parse_symbol_library(std::string_view text, FileId file)
{
  ReadResult tree = read_sexpr(text, file);
  if (!tree) {
    return LibraryLoadError{std::move(tree).error()};
  }
  ParseResult<SymbolLibraryFile> result = parse_symbol_library(*tree);
  if (!result) {
    return LibraryLoadError{std::move(result).error()};
  }
  return std::move(result).value();
}

ParseResult<SymbolLibraryFile> parse_symbol_library_fast(const SexprNode & root)
{
  const auto * list = dyn_cast<ListNode>(&root);
  if (list == nullptr) {
    return ParseError(UnexpectedTokenKind{SexprKind::List, root.kind}, root.range);
  }

  try {
    return SymbolLibraryFile::from_sexpr_ref(ParserRef(*list));
  } catch (ParseError & e) {
    e.set_range_if_unset(list->range);
    e.push_context(SymbolLibraryFile::k_keyword);
    return std::move(e);
  }
}

LibraryLoadResult parse_symbol_library_fast(std::string_view text, FileId file)
{
  // The model copies every string it keeps, so it outlives the arena.
  SexprContext ctx;
  NodeReadResult root = ctx.read(text, file);
  if (!root) {
    return LibraryLoadError{std::move(root).error()};
  }
  ParseResult<SymbolLibraryFile> result = parse_symbol_library_fast(**root);
  if (!result) {
    return LibraryLoadError{std::move(result).error()};
  }
  return std::move(result).value();
}

}  // namespace kicad_format
