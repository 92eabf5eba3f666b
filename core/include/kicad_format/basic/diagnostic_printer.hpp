// kicad_format/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context and position markers.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "kicad_format/basic/diagnostic.hpp"
#include "kicad_format/basic/source_manager.hpp"

namespace kicad_format
{

/**
 * Prints diagnostics in a compiler-style format:
 *
 *   error[K0103]: expected symbol 'in_bom', found 'on_board'
 *     --> Device.kicad_sym:4:34
 *      |
 *    4 |   (symbol "Device:R" (on_board yes))
 *      |                      ^^^^^^^^^^^^^^
 *      = note: in 'symbol'
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label, const SourceRegistry & sources);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace kicad_format
