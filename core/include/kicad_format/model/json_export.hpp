// kicad_format/model/json_export.hpp - JSON serialization for typed models
//
// Keys are snake_case field names. Symbol definitions carry a "type" tag of
// "root_symbol" or "derived_symbol". Absent optionals are omitted.
//
#pragma once

#include <nlohmann/json.hpp>

#include "kicad_format/model/symbol_library.hpp"
#include "kicad_format/sexpr/sexpr.hpp"

namespace kicad_format
{

/**
 * Serialize a symbol library to JSON.
 *
 * @param lib The parsed library
 * @return JSON object with version, generator and symbols
 */
[[nodiscard]] nlohmann::json to_json(const SymbolLibraryFile & lib);

[[nodiscard]] nlohmann::json to_json(const SymbolDefinition & symbol);

/**
 * Serialize a raw token tree. Lists become arrays, symbols become
 * {"symbol": text}, strings and numbers map to JSON scalars.
 */
[[nodiscard]] nlohmann::json to_json(const Sexpr & tree);

}  // namespace kicad_format
