// kicad_format/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// Small wrappers that run a snippet through either cursor so tests can check
// both parse paths with the same input.
//
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "kicad_format/basic/casting.hpp"
#include "kicad_format/basic/source_manager.hpp"
#include "kicad_format/convert/parser.hpp"
#include "kicad_format/convert/parser_ref.hpp"
#include "kicad_format/sexpr/reader.hpp"
#include "kicad_format/sexpr/sexpr_context.hpp"

namespace kicad_format::test_support
{

/// Read `text` or throw, for snippets that are known to be well formed.
[[nodiscard]] inline Sexpr read_or_throw(std::string_view text)
{
  auto tree = read_sexpr(text);
  if (!tree) {
    throw std::runtime_error("test input is not valid: " + tree.error().message);
  }
  return std::move(tree).value();
}

/// Parse one entity with the owning cursor.
template <typename T>
[[nodiscard]] T parse_owning(std::string_view text)
{
  return T::from_sexpr(Parser::from_tree(read_or_throw(text)));
}

/// Parse one entity with the borrowing cursor. The arena dies on return, so
/// this also checks that the model keeps no views into it.
template <typename T>
[[nodiscard]] T parse_borrowing(std::string_view text)
{
  SexprContext ctx;
  auto root = ctx.read(text);
  if (!root) {
    throw std::runtime_error("test input is not valid: " + root.error().message);
  }
  const auto * list = dyn_cast<ListNode>(root.value());
  if (list == nullptr) {
    throw std::runtime_error("test input is not a list");
  }
  return T::from_sexpr_ref(ParserRef(*list));
}

/// Run `fn` and return the ParseError it throws.
template <typename Fn>
[[nodiscard]] ParseError capture_parse_error(Fn && fn)
{
  try {
    fn();
  } catch (const ParseError & e) {
    return e;
  }
  throw std::runtime_error("expected a ParseError");
}

/**
 * A registered file plus the registry that owns it, for tests that need
 * line and column information.
 */
struct TestSourceUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();

  [[nodiscard]] std::string_view text() const { return sources.file(file_id)->content(); }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return sources.full_range(r);
  }
};

[[nodiscard]] inline TestSourceUnit make_source(
  std::string src, const std::filesystem::path & virtual_path = "<test>.kicad_sym")
{
  TestSourceUnit out;
  out.file_id = out.sources.add(virtual_path, std::move(src));
  return out;
}

[[nodiscard]] inline std::string read_text_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("failed to open " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

}  // namespace kicad_format::test_support
