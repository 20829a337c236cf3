#include "runtime/config/toml_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace runtime {

namespace {

std::string trim(std::string s) {
  auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

class TomlReader {
 public:
  TomlReader(std::istream& in, std::string source) : in_(&in), source_(std::move(source)) {}

  TomlDocument read() {
    TomlDocument doc;
    std::string table;
    std::string line;
    while (next_line(line)) {
      if (line.front() == '[') {
        table = read_header(line);
        if (doc.count(table) != 0) {
          fail("table [" + table + "] defined twice");
        }
        doc.emplace(table, TomlSection{});
        continue;
      }
      if (table.empty()) {
        fail("key-value outside a table");
      }

      const std::size_t eq = find_unquoted(line, '=');
      if (eq == std::string::npos) {
        fail("missing '='");
      }
      const std::string key = unquote_key(trim(line.substr(0, eq)));
      std::string raw = trim(line.substr(eq + 1));
      if (!raw.empty() && raw.front() == '[') {
        append_continuation_lines(raw);
      }

      auto& section = doc[table];
      if (section.count(key) != 0) {
        fail("duplicate key '" + key + "' in table [" + table + "]");
      }
      section.emplace(key, parse_value(raw));
    }
    return doc;
  }

 private:
  [[noreturn]] void fail(const std::string& what) const {
    throw std::runtime_error("TOML parse error " + source_ + ":" + std::to_string(line_no_) +
                             ": " + what);
  }

  // Next non-empty line with comments removed.
  bool next_line(std::string& out) {
    std::string raw;
    while (std::getline(*in_, raw)) {
      ++line_no_;
      out = trim(strip_comment(raw));
      if (!out.empty()) {
        return true;
      }
    }
    return false;
  }

  static std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
      const char ch = line[i];
      if (quote != 0) {
        if (ch == '\\' && quote == '"') {
          ++i;
        } else if (ch == quote) {
          quote = 0;
        }
      } else if (ch == '"' || ch == '\'') {
        quote = ch;
      } else if (ch == '#') {
        return line.substr(0, i);
      }
    }
    return line;
  }

  static std::size_t find_unquoted(const std::string& text, char target) {
    char quote = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
      const char ch = text[i];
      if (quote != 0) {
        if (ch == quote) {
          quote = 0;
        }
      } else if (ch == '"' || ch == '\'') {
        quote = ch;
      } else if (ch == target) {
        return i;
      }
    }
    return std::string::npos;
  }

  static int bracket_balance(const std::string& text) {
    int depth = 0;
    char quote = 0;
    for (const char ch : text) {
      if (quote != 0) {
        if (ch == quote) {
          quote = 0;
        }
      } else if (ch == '"' || ch == '\'') {
        quote = ch;
      } else if (ch == '[') {
        ++depth;
      } else if (ch == ']') {
        --depth;
      }
    }
    return depth;
  }

  void append_continuation_lines(std::string& raw) {
    while (bracket_balance(raw) > 0) {
      std::string more;
      if (!next_line(more)) {
        fail("unterminated array");
      }
      raw += " " + more;
    }
  }

  std::string read_header(const std::string& line) {
    if (line.back() != ']' || line.size() < 3) {
      fail("malformed table header");
    }
    if (line[1] == '[') {
      fail("arrays of tables are not supported");
    }
    const std::vector<std::string> parts = split_table_name(trim(line.substr(1, line.size() - 2)));
    std::string name;
    for (const auto& part : parts) {
      if (part.empty()) {
        fail("empty part in table name '" + line + "'");
      }
      const std::string quoted = part.find('.') == std::string::npos ? part : "\"" + part + "\"";
      name += name.empty() ? quoted : "." + quoted;
    }
    return name;
  }

  std::string unquote_key(const std::string& key) {
    if (key.empty()) {
      fail("empty key");
    }
    if (key.front() == '"' || key.front() == '\'') {
      if (key.size() < 2 || key.back() != key.front()) {
        fail("unterminated quoted key");
      }
      return key.substr(1, key.size() - 2);
    }
    for (const char ch : key) {
      if (!(std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '-')) {
        fail("invalid character in key '" + key + "'");
      }
    }
    return key;
  }

  TomlValue parse_value(const std::string& raw) {
    const std::string value = trim(raw);
    if (value.empty()) {
      fail("empty value");
    }
    switch (value.front()) {
      case '"':
        return TomlValue{parse_basic_string(value)};
      case '\'':
        if (value.size() < 2 || value.back() != '\'') {
          fail("invalid literal string");
        }
        return TomlValue{value.substr(1, value.size() - 2)};
      case '[':
        return parse_array(value);
      default:
        break;
    }
    if (value == "true" || value == "false") {
      return TomlValue{value == "true"};
    }
    return parse_number(value);
  }

  std::string parse_basic_string(const std::string& raw) {
    if (raw.size() < 2 || raw.back() != '"') {
      fail("invalid string literal");
    }
    std::string out;
    for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
      char ch = raw[i];
      if (ch == '\\') {
        if (i + 2 >= raw.size()) {
          fail("trailing escape");
        }
        switch (raw[++i]) {
          case '"':
            ch = '"';
            break;
          case '\\':
            ch = '\\';
            break;
          case 'n':
            ch = '\n';
            break;
          case 't':
            ch = '\t';
            break;
          case 'r':
            ch = '\r';
            break;
          default:
            fail("unsupported escape sequence");
        }
      } else if (ch == '"') {
        fail("unescaped quote inside string");
      }
      out.push_back(ch);
    }
    return out;
  }

  TomlValue parse_array(const std::string& raw) {
    if (raw.back() != ']') {
      fail("invalid array literal");
    }
    TomlValue::Array items;
    std::string current;
    int depth = 0;
    char quote = 0;
    for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
      const char ch = raw[i];
      if (quote != 0) {
        if (ch == quote) {
          quote = 0;
        }
      } else if (ch == '"' || ch == '\'') {
        quote = ch;
      } else if (ch == '[') {
        ++depth;
      } else if (ch == ']') {
        if (--depth < 0) {
          fail("invalid array nesting");
        }
      } else if (ch == ',' && depth == 0) {
        const std::string item = trim(current);
        if (item.empty()) {
          fail("empty array element");
        }
        items.push_back(parse_value(item));
        current.clear();
        continue;
      }
      current.push_back(ch);
    }
    if (quote != 0 || depth != 0) {
      fail("malformed array");
    }
    const std::string last = trim(current);
    // A trailing comma is allowed.
    if (!last.empty()) {
      items.push_back(parse_value(last));
    }
    return TomlValue{items};
  }

  TomlValue parse_number(const std::string& raw) {
    std::string digits;
    digits.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
      if (raw[i] == '_') {
        const bool between_digits = i > 0 && i + 1 < raw.size() &&
                                    std::isxdigit(static_cast<unsigned char>(raw[i - 1])) &&
                                    std::isxdigit(static_cast<unsigned char>(raw[i + 1]));
        if (!between_digits) {
          fail("misplaced '_' in number '" + raw + "'");
        }
        continue;
      }
      digits.push_back(raw[i]);
    }

    const bool hex = digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X');
    int64_t integer = 0;
    const char* begin = digits.data() + (hex ? 2 : 0);
    const char* end = digits.data() + digits.size();
    if (*begin == '+') {
      ++begin;
    }
    const auto result = std::from_chars(begin, end, integer, hex ? 16 : 10);
    if (result.ec == std::errc() && result.ptr == end) {
      return TomlValue{integer};
    }

    if (!hex) {
      std::istringstream iss(digits);
      iss.imbue(std::locale::classic());
      double parsed = 0.0;
      iss >> parsed;
      if (!iss.fail() && iss.eof()) {
        return TomlValue{parsed};
      }
    }
    fail("invalid value '" + raw + "'");
  }

  std::istream* in_;
  std::string source_;
  int line_no_ = 0;
};

}  // namespace

bool TomlValue::is_bool() const { return std::holds_alternative<bool>(value); }
bool TomlValue::is_int() const { return std::holds_alternative<int64_t>(value); }
bool TomlValue::is_double() const { return std::holds_alternative<double>(value); }
bool TomlValue::is_string() const { return std::holds_alternative<std::string>(value); }
bool TomlValue::is_array() const { return std::holds_alternative<Array>(value); }

bool TomlValue::as_bool() const { return std::get<bool>(value); }
int64_t TomlValue::as_int() const { return std::get<int64_t>(value); }
double TomlValue::as_double() const {
  if (is_int()) {
    return static_cast<double>(as_int());
  }
  return std::get<double>(value);
}
const std::string& TomlValue::as_string() const { return std::get<std::string>(value); }
const TomlValue::Array& TomlValue::as_array() const { return std::get<Array>(value); }

std::vector<std::string> split_table_name(const std::string& name) {
  std::vector<std::string> parts;
  std::string current;
  char quote = 0;
  for (const char ch : name) {
    if (quote != 0) {
      if (ch == quote) {
        quote = 0;
      } else {
        current.push_back(ch);
      }
    } else if (ch == '"' || ch == '\'') {
      quote = ch;
    } else if (ch == '.') {
      parts.push_back(trim(current));
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  parts.push_back(trim(current));
  return parts;
}

TomlDocument parse_toml(std::istream& in, const std::string& source) {
  return TomlReader(in, source).read();
}

TomlDocument parse_toml_file(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("Failed to open TOML file: " + path);
  }
  return parse_toml(in, path);
}

TomlDocument parse_toml_string(const std::string& text) {
  std::istringstream in(text);
  return parse_toml(in, "<string>");
}

}  // namespace runtime
