// kicad_format/sexpr/writer.cpp - Token tree rendering
#include "kicad_format/sexpr/writer.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace kicad_format
{
namespace
{

class SexprWriter
{
public:
  explicit SexprWriter(const WriteOptions & options) : options_(options) {}

  void write(const Sexpr & node, int depth)
  {
    if (const auto * s = node.as_symbol()) {
      out_ += *s;
    } else if (const auto * str = node.as_string()) {
      out_ += quote_string(*str);
    } else if (const auto * num = node.as_number()) {
      out_ += format_number(*num);
    } else if (const auto * items = node.as_list()) {
      write_list(*items, depth);
    }
  }

  std::string take() { return std::move(out_); }

private:
  void write_list(const SexprList & items, int depth)
  {
    const bool nested = std::any_of(items.begin(), items.end(), [](const Sexpr & s) {
      return s.is_list();
    });

    out_ += '(';
    if (!options_.pretty || !nested) {
      for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
          out_ += ' ';
        }
        write(items[i], depth + 1);
      }
      out_ += ')';
      return;
    }

    // Leading atoms stay on the opening line; every list starts a new line.
    bool first = true;
    bool broke_line = false;
    for (const auto & item : items) {
      if (item.is_list() || broke_line) {
        newline(depth + 1);
        broke_line = true;
      } else if (!first) {
        out_ += ' ';
      }
      write(item, depth + 1);
      first = false;
    }
    newline(depth);
    out_ += ')';
  }

  void newline(int depth)
  {
    out_ += '\n';
    out_.append(static_cast<size_t>(std::max(0, depth * options_.indent)), ' ');
  }

  const WriteOptions & options_;
  std::string out_;
};

}  // namespace

std::string format_number(double value)
{
  // "{}" gives the shortest round-trip spelling and drops a trailing ".0".
  if (value == 0.0) {
    return "0";
  }
  return fmt::format("{}", value);
}

std::string quote_string(std::string_view text)
{
  std::string out;
  out.reserve(text.size() + 2);
  out += '"';
  for (const char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
        break;
    }
  }
  out += '"';
  return out;
}

std::string write_sexpr(const Sexpr & tree, const WriteOptions & options)
{
  SexprWriter writer(options);
  writer.write(tree, 0);
  std::string text = writer.take();
  if (options.pretty) {
    text += '\n';
  }
  return text;
}

}  // namespace kicad_format
