// kicad_format/model/library_id.hpp - Structured symbol identifiers
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "kicad_format/sexpr/sexpr.hpp"

namespace kicad_format
{

/**
 * A symbol identifier of the form `[library:]name`.
 *
 * The library part is optional, but a colon implies a non-empty library.
 * The name is never empty and never contains a colon. to_string() reproduces
 * the parsed text exactly.
 */
class LibraryId
{
public:
  LibraryId() = default;
  LibraryId(std::optional<std::string> library, std::string name)
  : library_(std::move(library)), name_(std::move(name))
  {
  }

  /// Throws ParseError (LibraryIdentifierMalformed) on malformed input.
  [[nodiscard]] static LibraryId parse(std::string_view text);

  /// Returns nullopt on malformed input and stores the reason when asked.
  [[nodiscard]] static std::optional<LibraryId> try_parse(
    std::string_view text, std::string * reason = nullptr);

  [[nodiscard]] const std::optional<std::string> & library() const noexcept { return library_; }
  [[nodiscard]] const std::string & name() const noexcept { return name_; }

  [[nodiscard]] std::string to_string() const;
  [[nodiscard]] Sexpr to_sexpr() const { return Sexpr::string(to_string()); }

  [[nodiscard]] bool operator==(const LibraryId & o) const
  {
    return library_ == o.library_ && name_ == o.name_;
  }
  [[nodiscard]] bool operator!=(const LibraryId & o) const { return !(*this == o); }

private:
  std::optional<std::string> library_;
  std::string name_;
};

/**
 * A sub-unit identifier of the form `<name>_<unit>_<style>`, e.g. `R_0_1`.
 *
 * Unit and style are decimal numbers without leading zeros, so the text
 * re-serializes exactly.
 */
class UnitId
{
public:
  UnitId() = default;
  UnitId(std::string name, uint32_t unit, uint32_t style)
  : name_(std::move(name)), unit_(unit), style_(style)
  {
  }

  /// Throws ParseError (LibraryIdentifierMalformed) on malformed input.
  [[nodiscard]] static UnitId parse(std::string_view text);

  [[nodiscard]] static std::optional<UnitId> try_parse(
    std::string_view text, std::string * reason = nullptr);

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] uint32_t unit() const noexcept { return unit_; }
  [[nodiscard]] uint32_t style() const noexcept { return style_; }

  [[nodiscard]] std::string to_string() const;
  [[nodiscard]] Sexpr to_sexpr() const { return Sexpr::string(to_string()); }

  [[nodiscard]] bool operator==(const UnitId & o) const
  {
    return name_ == o.name_ && unit_ == o.unit_ && style_ == o.style_;
  }
  [[nodiscard]] bool operator!=(const UnitId & o) const { return !(*this == o); }

private:
  std::string name_;
  uint32_t unit_ = 0;
  uint32_t style_ = 0;
};

}  // namespace kicad_format
