// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
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

namespace linkgate
{
namespace parsers
{
namespace toml
{

class table;

using value_type =
    std::variant<std::monostate, int64_t, double, bool, std::string, std::shared_ptr<table>>;

/// \brief A single TOML value or sub-table. An empty node means "not found".
class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, int64_t>)
    {
      if (auto* val = std::get_if<int64_t>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, double>)
    {
      if (auto* val = std::get_if<double>(&_value))
        return *val;
      if (auto* val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
      if (auto* val = std::get_if<bool>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
      if (auto* val = std::get_if<std::string>(&_value))
        return *val;
    }
    return std::nullopt;
  }

  table* as_table()
  {
    if (auto* val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  const table* as_table() const
  {
    if (auto* val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

private:
  value_type _value;
};

namespace detail
{
  inline std::vector<std::string> splitDotted(const std::string& path)
  {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.'))
      parts.push_back(part);
    return parts;
  }
} // namespace detail

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string& key) const { return _values.find(key) != _values.end(); }
  bool empty() const { return _values.empty(); }
  size_t size() const { return _values.size(); }

  node& operator[](const std::string& key) { return _values[key]; }

  /// \brief Walks nested tables along "a.b.c"; returns an empty node when any
  /// segment is missing.
  node at_path(const std::string& dottedPath) const
  {
    auto parts = detail::splitDotted(dottedPath);
    const table* current = this;
    for (size_t i = 0; i < parts.size(); ++i)
    {
      auto it = current->_values.find(parts[i]);
      if (it == current->_values.end())
        return node();
      if (i + 1 == parts.size())
        return it->second;
      current = it->second.as_table();
      if (!current)
        return node();
    }
    return node();
  }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  void insert(const std::string& key, node value) { _values[key] = std::move(value); }

private:
  container_type _values;
};

/// \brief Reader for the TOML subset used by configuration files: tables,
/// strings, integers, floats, booleans and comments.
class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table* current = &root;

    while (true)
    {
      skipBlankLinesAndComments();
      if (isEnd())
        break;

      if (peek() == '[')
      {
        current = ensureTable(&root, parseSection());
      }
      else
      {
        std::string key = parseKey();
        skipSpaces();
        expect('=');
        skipSpaces();
        value_type value = parseValue();
        if (current->contains(key))
          fail("Duplicate key '" + key + "'");
        current->insert(key, node(std::move(value)));
      }
      expectEndOfLine();
    }
    return root;
  }

private:
  std::string _input;
  size_t _pos = 0;
  size_t _line = 1;

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }
  char advance()
  {
    if (isEnd())
      return '\0';
    char c = _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  [[noreturn]] void fail(const std::string& what) const
  {
    throw std::runtime_error("TOML parse error at line " + std::to_string(_line) + ": " + what);
  }

  void expect(char c)
  {
    if (peek() != c)
      fail(std::string("Expected '") + c + "'");
    advance();
  }

  void skipSpaces()
  {
    while (peek() == ' ' || peek() == '\t')
      advance();
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
        advance();
    }
  }

  void skipBlankLinesAndComments()
  {
    while (!isEnd())
    {
      skipSpaces();
      skipComment();
      if (peek() == '\r' || peek() == '\n')
        advance();
      else
        break;
    }
  }

  void expectEndOfLine()
  {
    skipSpaces();
    skipComment();
    if (peek() == '\r')
      advance();
    if (isEnd())
      return;
    if (peek() != '\n')
      fail("Unexpected trailing content");
    advance();
  }

  static bool isBareKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  }

  std::string parseKeySegment()
  {
    if (peek() == '"' || peek() == '\'')
      return parseString();
    std::string key;
    while (isBareKeyChar(peek()))
      key += advance();
    if (key.empty())
      fail("Expected key");
    return key;
  }

  std::string parseKey()
  {
    // Dotted keys on the left-hand side are not supported
    std::string key = parseKeySegment();
    skipSpaces();
    if (peek() == '.')
      fail("Dotted keys are only supported in table headers");
    return key;
  }

  std::string parseSection()
  {
    expect('[');
    skipSpaces();
    std::string section = parseKeySegment();
    skipSpaces();
    while (peek() == '.')
    {
      advance();
      skipSpaces();
      section += '.' + parseKeySegment();
      skipSpaces();
    }
    expect(']');
    return section;
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return parseString();
    if (c == 't' || c == 'f')
      return parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    fail("Invalid value");
  }

  std::string parseString()
  {
    char quote = advance();
    bool literal = quote == '\'';
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c == '\\' && !literal)
      {
        char esc = advance();
        switch (esc)
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
        case '\\':
          str += '\\';
          break;
        case '"':
          str += '"';
          break;
        default:
          fail(std::string("Unsupported escape sequence \\") + esc);
        }
      }
      else
      {
        str += c;
      }
    }
    if (peek() != quote)
      fail("Unterminated string");
    advance();
    return str;
  }

  bool parseBool()
  {
    std::string word;
    while (std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("Invalid boolean value: " + word);
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;
    if (peek() == '+' || peek() == '-')
      num += advance();

    while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '.' ||
           peek() == 'e' || peek() == 'E' ||
           ((peek() == '+' || peek() == '-') && !num.empty() &&
            (num.back() == 'e' || num.back() == 'E')))
    {
      char c = advance();
      if (c == '_')
        continue;
      if (c == '.' || c == 'e' || c == 'E')
        isFloat = true;
      num += c;
    }

    try
    {
      size_t consumed = 0;
      if (isFloat)
      {
        double d = std::stod(num, &consumed);
        if (consumed == num.size())
          return d;
      }
      else
      {
        long long i = std::stoll(num, &consumed);
        if (consumed == num.size())
          return static_cast<int64_t>(i);
      }
    }
    catch (const std::exception& e)
    {
      fail("Invalid number: " + num + " (" + e.what() + ")");
    }
    fail("Invalid number: " + num);
  }

  table* ensureTable(table* root, const std::string& path)
  {
    table* current = root;
    for (const auto& key : detail::splitDotted(path))
    {
      if (!current->contains(key))
      {
        current->insert(key, node(std::make_shared<table>()));
      }
      current = (*current)[key].as_table();
      if (!current)
        fail("Key '" + key + "' is not a table in [" + path + "]");
    }
    return current;
  }
};

inline table parse_file(const std::string& filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    throw std::runtime_error("Failed to open file: " + filename);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  parser p(buffer.str());
  return p.parse();
}

inline table parse(const std::string& tomlString)
{
  parser p(tomlString);
  return p.parse();
}

} // namespace toml
} // namespace parsers
} // namespace linkgate
