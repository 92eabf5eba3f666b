// kicad_format/project/library_check.cpp - Library checks run by kfmt
//
#include "kicad_format/project/library_check.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "kicad_format/sexpr/reader.hpp"
#include "kicad_format/sexpr/sexpr_context.hpp"

namespace kicad_format
{
namespace
{

ParseStrategy other_strategy(ParseStrategy s)
{
  return s == ParseStrategy::Owning ? ParseStrategy::Borrowing : ParseStrategy::Owning;
}

LibraryLoadResult parse_with(std::string_view text, FileId file, ParseStrategy strategy)
{
  if (strategy == ParseStrategy::Borrowing) {
    return parse_symbol_library_fast(text, file);
  }
  return parse_symbol_library(text, file);
}

/// Ranges of the nodes reached by following child indices `path` from the
/// root of `text`, outermost first. Never empty once `text` reads.
std::vector<SourceRange> ranges_along(
  std::string_view text, FileId file, const std::vector<size_t> & path)
{
  SexprContext ctx;
  NodeReadResult root = ctx.read(text, file);
  if (!root) {
    return {SourceRange{}};
  }

  std::vector<SourceRange> ranges;
  const SexprNode * node = *root;
  for (const size_t index : path) {
    const auto * list = dyn_cast<ListNode>(node);
    if (list == nullptr || index >= list->size()) {
      break;
    }
    node = list->children[index];
    ranges.push_back(node->range);
  }
  if (ranges.empty()) {
    ranges.push_back((*root)->range);
  }
  return ranges;
}

/// Top-level child index of the `n`-th symbol definition:
/// keyword, version, generator and the optional generator_version come first.
size_t symbol_item_index(const SymbolLibraryFile & lib, size_t n)
{
  return 3 + (lib.generator_version ? 1 : 0) + n;
}

size_t first_difference(const SexprList & a, const SexprList & b)
{
  const size_t common = std::min(a.size(), b.size());
  for (size_t i = 0; i < common; ++i) {
    if (a[i] != b[i]) {
      return i;
    }
  }
  return common;
}

/// Child indices leading from the roots of two differing trees down to the
/// innermost list where they part.
std::vector<size_t> difference_path(const Sexpr & a, const Sexpr & b)
{
  std::vector<size_t> path;
  const Sexpr * x = &a;
  const Sexpr * y = &b;
  while (true) {
    const SexprList * xs = x->as_list();
    const SexprList * ys = y->as_list();
    if (xs == nullptr || ys == nullptr) {
      break;
    }
    const size_t i = first_difference(*xs, *ys);
    path.push_back(i);
    if (i >= xs->size() || i >= ys->size()) {
      break;
    }
    x = &(*xs)[i];
    y = &(*ys)[i];
  }
  return path;
}

}  // namespace

std::optional<SymbolLibraryFile> load_library(
  std::string_view text, FileId file, ParseStrategy strategy, DiagnosticBag & diags)
{
  LibraryLoadResult result = parse_with(text, file, strategy);
  if (!result) {
    diags.add(result.error().to_diagnostic());
    return std::nullopt;
  }
  return std::move(result).value();
}

bool verify_agreement(
  std::string_view text, FileId file, ParseStrategy used, const SymbolLibraryFile & lib,
  DiagnosticBag & diags)
{
  const ParseStrategy other = other_strategy(used);
  LibraryLoadResult result = parse_with(text, file, other);
  if (!result) {
    Diagnostic diag = result.error().to_diagnostic();
    diag.notes.push_back(
      "the " + std::string(to_string(used)) + " parser accepted this file, the " +
      std::string(to_string(other)) + " parser did not");
    diags.add(std::move(diag));
    return false;
  }

  const SymbolLibraryFile & theirs = result.value();
  if (theirs == lib) {
    return true;
  }

  const auto mismatch =
    std::mismatch(lib.symbols.begin(), lib.symbols.end(), theirs.symbols.begin(),
                  theirs.symbols.end());
  const bool header_differs = mismatch.first == lib.symbols.end() &&
                              mismatch.second == theirs.symbols.end();
  std::vector<size_t> path;
  if (!header_differs) {
    path.push_back(
      symbol_item_index(lib, static_cast<size_t>(mismatch.first - lib.symbols.begin())));
  }

  diags
    .report_error(
      ranges_along(text, file, path).back(), "parse strategies disagree",
      header_differs ? "library header parsed differently" : "first symbol parsed differently")
    .with_code(k_code_strategies_disagree)
    .with_note(
      "compared the " + std::string(to_string(used)) + " and " + std::string(to_string(other)) +
      " parsers")
    .with_help("compare `kfmt dump --strategy owning` with `kfmt dump --strategy borrowing`");
  return false;
}

bool verify_roundtrip(
  std::string_view text, FileId file, const SymbolLibraryFile & lib, DiagnosticBag & diags)
{
  ReadResult tree = read_sexpr(text, file);
  if (!tree) {
    diags.add(to_diagnostic(tree.error()));
    return false;
  }

  const Sexpr written = lib.to_sexpr();
  if (written == *tree) {
    return true;
  }

  // Point at the innermost differing node and, below the top level, at the
  // library item that holds it.
  const std::vector<SourceRange> ranges =
    ranges_along(text, file, difference_path(written, *tree));
  auto builder = diags.report_error(
    ranges.back(), "serialized model differs from the input tree", "written differently");
  builder.with_code(k_code_roundtrip_mismatch);
  if (ranges.size() > 1) {
    builder.with_secondary_label(ranges.front(), "in this item");
  }
  builder.with_help("run `kfmt format` to see the serialized form");
  return false;
}

std::optional<SymbolLibraryFile> check_library(
  std::string_view text, FileId file, const ToolConfig & config, DiagnosticBag & diags)
{
  auto lib = load_library(text, file, config.parser.strategy, diags);
  if (!lib) {
    return std::nullopt;
  }

  bool ok = true;
  if (config.check.verify_agreement) {
    ok = verify_agreement(text, file, config.parser.strategy, *lib, diags) && ok;
  }
  if (config.check.verify_roundtrip) {
    ok = verify_roundtrip(text, file, *lib, diags) && ok;
  }
  if (!ok) {
    return std::nullopt;
  }

  if (lib->symbols.empty()) {
    diags.report_warning(ranges_along(text, file, {}).front(), "library defines no symbols")
      .with_code(k_code_empty_library);
  }
  return lib;
}

}  // namespace kicad_format
