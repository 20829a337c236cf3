#pragma once

#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace runtime {

struct TomlValue {
  using Array = std::vector<TomlValue>;
  using Variant = std::variant<bool, int64_t, double, std::string, Array>;

  Variant value;

  [[nodiscard]] bool is_bool() const;
  [[nodiscard]] bool is_int() const;
  [[nodiscard]] bool is_double() const;
  [[nodiscard]] bool is_string() const;
  [[nodiscard]] bool is_array() const;

  [[nodiscard]] bool as_bool() const;
  [[nodiscard]] int64_t as_int() const;
  [[nodiscard]] double as_double() const;
  [[nodiscard]] const std::string& as_string() const;
  [[nodiscard]] const Array& as_array() const;
};

// Tables are keyed by their full dotted name, e.g. "coil.c_pop" or "servo.diverter.positions".
// Parts containing a dot stay quoted. Ordered so devices are built in a stable order.
using TomlSection = std::map<std::string, TomlValue>;
using TomlDocument = std::map<std::string, TomlSection>;

// Subset: [table] and [dotted.table] headers, bare or quoted keys, strings, integers (decimal,
// 0x hex, _ separators), floats, booleans and arrays, which may span lines.
TomlDocument parse_toml(std::istream& in, const std::string& source);
TomlDocument parse_toml_file(const std::string& path);
TomlDocument parse_toml_string(const std::string& text);

// "servo.diverter.positions" -> {"servo", "diverter", "positions"}; quoted parts keep their dots.
std::vector<std::string> split_table_name(const std::string& name);

}  // namespace runtime
