// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <dnsfwd/parsers/minimal_toml.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dnsfwd
{
namespace core
{
/// \brief Loads a TOML configuration file and exposes typed lookups by
/// dotted key.
class ConfigLoader
{
public:
  explicit ConfigLoader(const std::string &filename) : _filename(filename) {}

  /// \brief Reads and parses the file again.
  /// \throws std::runtime_error if the file cannot be opened
  /// \throws parsers::toml::parse_error on syntax errors
  const parsers::toml::table &load()
  {
    _table = parsers::toml::parse_file(_filename);
    _loaded = true;
    return _table;
  }

  /// \brief Like load() but reports failure instead of throwing.
  bool reload()
  {
    try
    {
      load();
      return true;
    }
    catch (const std::exception &)
    {
      _table = parsers::toml::table{};
      _loaded = false;
      return false;
    }
  }

  bool isLoaded() const { return _loaded; }

  const std::string &filename() const { return _filename; }

  const parsers::toml::table &table() const { return _table; }

  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    return _table.at_path(dottedKey).as<T>();
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings.
  /// \return std::nullopt if the key is missing or not an array
  /// \throws std::runtime_error if any element is not a string
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    const auto *arr = node.as_array();
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *arr)
    {
      if (auto *strVal = std::get_if<std::string>(&elem))
      {
        result.push_back(*strVal);
      }
      else
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
    }
    return result;
  }

private:
  std::string _filename;
  parsers::toml::table _table;
  bool _loaded = false;
};

} // namespace core
} // namespace dnsfwd
