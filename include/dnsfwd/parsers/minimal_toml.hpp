// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace dnsfwd
{
namespace parsers
{
namespace toml
{

/// \brief Raised for malformed TOML input; the message carries the line.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &message, std::size_t line)
      : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + message),
        _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

class array
{
public:
  using container_type = std::vector<value_type>;
  using const_iterator = container_type::const_iterator;

  void push_back(value_type val) { _values.push_back(std::move(val)); }
  std::size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }
  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }
  const value_type &operator[](std::size_t idx) const { return _values[idx]; }

private:
  container_type _values;
};

/// \brief A single TOML value: scalar, array or sub-table. A default
/// constructed node means "not present".
class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const { return !std::holds_alternative<std::monostate>(_value); }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  template <typename T> std::optional<T> as() const
  {
    if (auto *val = std::get_if<T>(&_value))
    {
      return *val;
    }
    return std::nullopt;
  }

  const array *as_array() const
  {
    auto *val = std::get_if<std::shared_ptr<array>>(&_value);
    return val ? val->get() : nullptr;
  }

  table *as_table() const
  {
    auto *val = std::get_if<std::shared_ptr<table>>(&_value);
    return val ? val->get() : nullptr;
  }

  explicit operator bool() const { return is_value(); }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &key) const { return _values.count(key) != 0; }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }
  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  void insert(const std::string &key, node value) { _values[key] = std::move(value); }

  node get(const std::string &key) const
  {
    auto it = _values.find(key);
    return it == _values.end() ? node() : it->second;
  }

  /// \brief Look up "a.b.c" through nested tables. Missing keys yield an
  /// empty node.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::stringstream ss(dottedPath);
    std::string part;
    node found;
    while (std::getline(ss, part, '.'))
    {
      if (!current)
      {
        return node();
      }
      found = current->get(part);
      if (!found)
      {
        return node();
      }
      current = found.as_table();
    }
    return found;
  }

  /// \brief Return the sub-table at a dotted path, creating missing levels.
  table &ensure_path(const std::string &dottedPath, std::size_t line)
  {
    table *current = this;
    std::stringstream ss(dottedPath);
    std::string part;
    while (std::getline(ss, part, '.'))
    {
      if (part.empty())
      {
        throw parse_error("empty table name in [" + dottedPath + "]", line);
      }
      node existing = current->get(part);
      if (!existing)
      {
        auto created = std::make_shared<table>();
        current->insert(part, node(created));
        current = created.get();
        continue;
      }
      current = existing.as_table();
      if (!current)
      {
        throw parse_error("key '" + part + "' is not a table", line);
      }
    }
    return *current;
  }

private:
  container_type _values;
};

/// \brief Parser for the TOML subset used by configuration files: [tables],
/// dotted table names, bare keys, strings, integers, booleans, arrays and
/// comments.
class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;

    skipBlank();
    while (!atEnd())
    {
      if (peek() == '[')
      {
        current = &root.ensure_path(parseTableHeader(), _line);
      }
      else
      {
        std::string key = parseKey();
        skipSpaces();
        expect('=');
        skipSpaces();
        current->insert(key, node(parseValue()));
      }
      skipSpaces();
      skipComment();
      if (!atEnd() && peek() != '\n' && peek() != '\r')
      {
        fail("unexpected trailing characters");
      }
      skipBlank();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos = 0;
  std::size_t _line = 1;

  bool atEnd() const { return _pos >= _input.size(); }
  char peek() const { return atEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    char c = _input[_pos++];
    if (c == '\n')
    {
      ++_line;
    }
    return c;
  }

  [[noreturn]] void fail(const std::string &message) const { throw parse_error(message, _line); }

  void expect(char c)
  {
    if (peek() != c)
    {
      fail(std::string("expected '") + c + "'");
    }
    advance();
  }

  void skipSpaces()
  {
    while (!atEnd() && (peek() == ' ' || peek() == '\t'))
    {
      advance();
    }
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!atEnd() && peek() != '\n')
      {
        advance();
      }
    }
  }

  void skipBlank()
  {
    while (!atEnd())
    {
      if (std::isspace(static_cast<unsigned char>(peek())))
      {
        advance();
      }
      else if (peek() == '#')
      {
        skipComment();
      }
      else
      {
        break;
      }
    }
  }

  std::string parseTableHeader()
  {
    advance(); // '['
    std::string name;
    while (!atEnd() && peek() != ']' && peek() != '\n')
    {
      char c = advance();
      if (c != ' ' && c != '\t')
      {
        name += c;
      }
    }
    expect(']');
    if (name.empty())
    {
      fail("empty table header");
    }
    return name;
  }

  std::string parseKey()
  {
    std::string key;
    while (!atEnd())
    {
      unsigned char c = static_cast<unsigned char>(peek());
      if (!std::isalnum(c) && c != '_' && c != '-')
      {
        break;
      }
      key += advance();
    }
    if (key.empty())
    {
      fail("expected a key");
    }
    return key;
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
    {
      return parseString();
    }
    if (c == '[')
    {
      return parseArray();
    }
    if (c == 't' || c == 'f')
    {
      return parseBool();
    }
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
    {
      return parseInteger();
    }
    fail("invalid value");
  }

  std::string parseString()
  {
    char quote = advance();
    std::string str;
    while (!atEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c != '\\' || quote == '\'')
      {
        str += c;
        continue;
      }
      if (atEnd())
      {
        break;
      }
      char escaped = advance();
      switch (escaped)
      {
      case 'n':
        str += '\n';
        break;
      case 't':
        str += '\t';
        break;
      case 'r':
        str += '\r';
        break;
      default:
        str += escaped;
      }
    }
    if (peek() != quote)
    {
      fail("unterminated string");
    }
    advance();
    return str;
  }

  value_type parseArray()
  {
    advance(); // '['
    auto arr = std::make_shared<array>();
    skipBlank();
    while (!atEnd() && peek() != ']')
    {
      arr->push_back(parseValue());
      skipBlank();
      if (peek() == ',')
      {
        advance();
        skipBlank();
      }
      else if (peek() != ']')
      {
        fail("expected ',' or ']' in array");
      }
    }
    expect(']');
    return arr;
  }

  bool parseBool()
  {
    std::string word;
    while (!atEnd() && std::isalpha(static_cast<unsigned char>(peek())))
    {
      word += advance();
    }
    if (word == "true")
    {
      return true;
    }
    if (word == "false")
    {
      return false;
    }
    fail("invalid boolean '" + word + "'");
  }

  int64_t parseInteger()
  {
    std::string digits;
    if (peek() == '+' || peek() == '-')
    {
      digits += advance();
    }
    while (!atEnd() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_'))
    {
      char c = advance();
      if (c != '_')
      {
        digits += c;
      }
    }
    try
    {
      std::size_t used = 0;
      int64_t value = std::stoll(digits, &used);
      if (used != digits.size())
      {
        fail("invalid integer '" + digits + "'");
      }
      return value;
    }
    catch (const std::logic_error &)
    {
      fail("invalid integer '" + digits + "'");
    }
  }
};

inline table parse(const std::string &tomlString) { return parser(tomlString).parse(); }

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    throw std::runtime_error("Cannot open file: " + filename);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace dnsfwd
