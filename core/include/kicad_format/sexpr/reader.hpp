// kicad_format/sexpr/reader.hpp - Text to owning token tree
#pragma once

#include <string>
#include <string_view>

#include "kicad_format/basic/result.hpp"
#include "kicad_format/basic/source_manager.hpp"
#include "kicad_format/sexpr/sexpr.hpp"

namespace kicad_format
{

/**
 * Malformed S-expression text: unbalanced parentheses, an unterminated
 * string, an empty document or trailing input after the root expression.
 */
struct SyntaxError
{
  std::string message;
  SourceRange range;
};

using ReadResult = Result<Sexpr, SyntaxError>;

/**
 * Read exactly one expression from `text`.
 *
 * @param text The source text
 * @param file File the text belongs to, used for error ranges
 */
[[nodiscard]] ReadResult read_sexpr(std::string_view text, FileId file = FileId::invalid());

}  // namespace kicad_format
