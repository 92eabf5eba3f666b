// kicad_format/sexpr/writer.hpp - Render a token tree as text
#pragma once

#include <string>

#include "kicad_format/sexpr/sexpr.hpp"

namespace kicad_format
{

struct WriteOptions
{
  /// Put nested lists on their own lines, KiCad 8 style.
  bool pretty = true;
  /// Spaces per nesting level when pretty is set.
  int indent = 2;
};

/**
 * Render a tree as text. Strings are quoted with `\" \\ \n \r \t` escapes;
 * numbers use the shortest spelling that reads back to the same value.
 */
[[nodiscard]] std::string write_sexpr(const Sexpr & tree, const WriteOptions & options = {});

/// Spelling used for a number atom.
[[nodiscard]] std::string format_number(double value);

/// Quoted and escaped spelling of a string atom.
[[nodiscard]] std::string quote_string(std::string_view text);

}  // namespace kicad_format
