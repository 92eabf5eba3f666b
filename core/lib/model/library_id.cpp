// kicad_format/model/library_id.cpp - Identifier parsing
#include "kicad_format/model/library_id.hpp"

#include <fmt/format.h>

#include <charconv>

#include "kicad_format/convert/parse_error.hpp"

namespace kicad_format
{
namespace
{

void set_reason(std::string * reason, std::string text)
{
  if (reason != nullptr) {
    *reason = std::move(text);
  }
}

// Canonical decimal: digits only, no sign, no leading zeros except "0".
bool parse_canonical_u32(std::string_view text, uint32_t & out)
{
  if (text.empty() || (text.size() > 1 && text.front() == '0')) {
    return false;
  }
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  const char * const last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), last, out);
  return ec == std::errc() && ptr == last;
}

}  // namespace

// ============================================================================
// LibraryId
// ============================================================================

std::optional<LibraryId> LibraryId::try_parse(std::string_view text, std::string * reason)
{
  const auto colon = text.find(':');
  if (colon == std::string_view::npos) {
    if (text.empty()) {
      set_reason(reason, "symbol name is empty");
      return std::nullopt;
    }
    return LibraryId(std::nullopt, std::string(text));
  }

  const std::string_view library = text.substr(0, colon);
  const std::string_view name = text.substr(colon + 1);
  if (library.empty()) {
    set_reason(reason, "library name before ':' is empty");
    return std::nullopt;
  }
  if (name.empty()) {
    set_reason(reason, "symbol name after ':' is empty");
    return std::nullopt;
  }
  if (name.find(':') != std::string_view::npos) {
    set_reason(reason, "symbol name contains ':'");
    return std::nullopt;
  }
  return LibraryId(std::string(library), std::string(name));
}

LibraryId LibraryId::parse(std::string_view text)
{
  std::string reason;
  if (auto id = try_parse(text, &reason)) {
    return std::move(*id);
  }
  throw ParseError::library_identifier_malformed(std::string(text), std::move(reason));
}

std::string LibraryId::to_string() const
{
  if (library_) {
    return fmt::format("{}:{}", *library_, name_);
  }
  return name_;
}

// ============================================================================
// UnitId
// ============================================================================

std::optional<UnitId> UnitId::try_parse(std::string_view text, std::string * reason)
{
  const auto style_sep = text.rfind('_');
  if (style_sep == std::string_view::npos || style_sep == 0) {
    set_reason(reason, "unit id must have the form <name>_<unit>_<style>");
    return std::nullopt;
  }
  const auto unit_sep = text.rfind('_', style_sep - 1);
  if (unit_sep == std::string_view::npos || unit_sep == 0) {
    set_reason(reason, "unit id must have the form <name>_<unit>_<style>");
    return std::nullopt;
  }

  uint32_t unit = 0;
  uint32_t style = 0;
  if (!parse_canonical_u32(text.substr(unit_sep + 1, style_sep - unit_sep - 1), unit)) {
    set_reason(reason, "unit number is not a canonical decimal");
    return std::nullopt;
  }
  if (!parse_canonical_u32(text.substr(style_sep + 1), style)) {
    set_reason(reason, "body style number is not a canonical decimal");
    return std::nullopt;
  }
  return UnitId(std::string(text.substr(0, unit_sep)), unit, style);
}

UnitId UnitId::parse(std::string_view text)
{
  std::string reason;
  if (auto id = try_parse(text, &reason)) {
    return std::move(*id);
  }
  throw ParseError::library_identifier_malformed(std::string(text), std::move(reason));
}

std::string UnitId::to_string() const { return fmt::format("{}_{}_{}", name_, unit_, style_); }

}  // namespace kicad_format
