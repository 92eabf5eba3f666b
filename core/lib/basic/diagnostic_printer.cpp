// kicad_format/basic/diagnostic_printer.cpp - Compiler-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "kicad_format/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace kicad_format
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange primary = diag.primary_range();
  const std::string filename = sources.path_string(primary.file_id());
  const FullSourceRange fr = sources.full_range(primary);

  print_severity_header(diag);

  if (fr.is_valid()) {
    fmt::print(os_, "{} {}:{}:{}\n", gutter_arrow(), filename, fr.start_line, fr.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  for (const auto & label : diag.labels) {
    print_label(label, sources);
  }
  for (const auto & note : diag.notes) {
    print_trailer("note", note);
  }
  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<const Diagnostic *> sorted;
  sorted.reserve(diags.size());
  for (const auto & d : diags) {
    sorted.push_back(&d);
  }

  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_range().get_begin() < b->primary_range().get_begin();
  });

  for (const auto * d : sorted) {
    print(*d, sources);
  }
}

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  std::string_view severity = "error";
  switch (diag.severity) {
    case Severity::Error:
      severity = "error";
      break;
    case Severity::Warning:
      severity = "warning";
      break;
    case Severity::Note:
      severity = "note";
      break;
  }

  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);

  if (!use_color_) {
    fmt::print(os_, "{}{}: {}\n", severity, code, diag.message);
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Note:
      os_ << rang::fg::cyan;
      break;
  }
  os_ << severity << code << rang::fg::reset << ": " << diag.message << rang::style::reset
      << "\n";
}

void DiagnosticPrinter::print_label(const Label & label, const SourceRegistry & sources)
{
  const SourceFile * source = sources.file(label.range.file_id());
  const FullSourceRange fr = sources.full_range(label.range);
  if (source == nullptr || !fr.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  const std::string_view line = source->line(fr.start_line - 1);
  fmt::print(os_, "{}\n", gutter_pipe());
  fmt::print(os_, " {:>4} | {}\n", fr.start_line, line);

  // Multi-line ranges are marked up to the end of the first line.
  uint32_t end_column = fr.end_column;
  if (fr.end_line != fr.start_line) {
    end_column = static_cast<uint32_t>(line.size()) + 1;
  }
  const size_t width = std::max<size_t>(1, end_column > fr.start_column ? end_column - fr.start_column : 1);
  const char marker = label.style == LabelStyle::Primary ? '^' : '-';

  fmt::print(os_, "{} {}", gutter_pipe(), std::string(fr.start_column - 1, ' '));
  if (use_color_) {
    os_ << (label.style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan)
        << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(width, marker));
  if (!label.message.empty()) {
    fmt::print(os_, " {}", label.message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
  } else {
    fmt::print(os_, "      = {}: {}\n", kind, message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}  -->{}", "\033[1;36m", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace kicad_format
