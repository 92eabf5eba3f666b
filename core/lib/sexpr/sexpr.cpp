// kicad_format/sexpr/sexpr.cpp - Owning token tree helpers
#include "kicad_format/sexpr/sexpr.hpp"

#include <ostream>

#include "kicad_format/sexpr/writer.hpp"

namespace kicad_format
{

Sexpr Sexpr::symbol(std::string text)
{
  Sexpr s;
  s.value_.emplace<0>(Symbol{std::move(text)});
  return s;
}

Sexpr Sexpr::string(std::string text)
{
  Sexpr s;
  s.value_.emplace<1>(String{std::move(text)});
  return s;
}

Sexpr Sexpr::number(double value)
{
  Sexpr s;
  s.value_.emplace<2>(value);
  return s;
}

Sexpr Sexpr::list(SexprList items)
{
  Sexpr s;
  s.value_.emplace<3>(std::move(items));
  return s;
}

Sexpr Sexpr::list_with_name(std::string_view name, SexprList items)
{
  SexprList all;
  all.reserve(items.size() + 1);
  all.push_back(symbol(std::string(name)));
  for (auto & item : items) {
    all.push_back(std::move(item));
  }
  return list(std::move(all));
}

Sexpr Sexpr::symbol_with_name(std::string_view name, std::string_view value)
{
  return list({symbol(std::string(name)), symbol(std::string(value))});
}

Sexpr Sexpr::string_with_name(std::string_view name, std::string_view value)
{
  return list({symbol(std::string(name)), string(std::string(value))});
}

Sexpr Sexpr::number_with_name(std::string_view name, double value)
{
  return list({symbol(std::string(name)), number(value)});
}

Sexpr Sexpr::bool_with_name(std::string_view name, bool value, BoolSpelling spelling)
{
  return symbol_with_name(name, bool_symbol(value, spelling));
}

const std::string * Sexpr::as_symbol() const noexcept
{
  const auto * s = std::get_if<Symbol>(&value_);
  return s != nullptr ? &s->text : nullptr;
}

const std::string * Sexpr::as_string() const noexcept
{
  const auto * s = std::get_if<String>(&value_);
  return s != nullptr ? &s->text : nullptr;
}

const double * Sexpr::as_number() const noexcept { return std::get_if<double>(&value_); }

const SexprList * Sexpr::as_list() const noexcept { return std::get_if<SexprList>(&value_); }

SexprList * Sexpr::as_list() noexcept { return std::get_if<SexprList>(&value_); }

bool Sexpr::is_list_with_name(std::string_view keyword) const noexcept
{
  const SexprList * items = as_list();
  return items != nullptr && list_has_name(*items, keyword);
}

bool list_has_name(const SexprList & list, std::string_view keyword) noexcept
{
  if (list.empty()) {
    return false;
  }
  const std::string * head = list.front().as_symbol();
  return head != nullptr && *head == keyword;
}

std::ostream & operator<<(std::ostream & os, const Sexpr & sexpr)
{
  return os << write_sexpr(sexpr, WriteOptions{false, 0});
}

}  // namespace kicad_format
