/**
 * @file json_helpers.h
 * @brief Minimal JSON writer and reader for feature files, config and reports.
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace dynamix {
namespace json {

/**
 * @brief Escapes quotes, backslashes and control characters for JSON output.
 *
 * @example
 * ```cpp
 * json::escape("Intro \"A\"");  // returns: Intro \"A\"
 * ```
 */
inline std::string escape(const std::string& s) {
  std::string result;
  result.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        result += c;
        break;
    }
  }
  return result;
}

/**
 * @brief Streaming JSON writer with automatic comma handling.
 *
 * Non-finite doubles are written as null.
 *
 * @example
 * ```cpp
 * std::ostringstream oss;
 * json::Writer w(oss);
 * w.beginObject()
 *     .write("id", "track.json")
 *     .write("tempo", 128.0)
 *     .beginArray("drops").value(61.5).value(122.0).endArray()
 * .endObject();
 * // {"id":"track.json","tempo":128,"drops":[61.5,122]}
 * ```
 */
class Writer {
 public:
  /**
   * @param os Output stream
   * @param pretty Newlines and indentation when true
   * @param indent_size Spaces per level
   */
  explicit Writer(std::ostream& os, bool pretty = false, int indent_size = 2)
      : os_(os), pretty_(pretty), indent_size_(indent_size) {}

  Writer& beginObject(const char* key = nullptr) {
    writeCommaIfNeeded();
    if (key) writeKey(key);
    os_ << "{";
    pushContext();
    return *this;
  }

  Writer& endObject() {
    popContext();
    writeNewlineIndent();
    os_ << "}";
    return *this;
  }

  Writer& beginArray(const char* key = nullptr) {
    writeCommaIfNeeded();
    if (key) writeKey(key);
    os_ << "[";
    pushContext();
    return *this;
  }

  Writer& endArray() {
    popContext();
    writeNewlineIndent();
    os_ << "]";
    return *this;
  }

  /// @brief Numeric key-value pair.
  template <typename T>
  Writer& write(const char* key, T value) {
    writeCommaIfNeeded();
    writeKey(key);
    writeNumber(value);
    return *this;
  }

  Writer& write(const char* key, bool value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << (value ? "true" : "false");
    return *this;
  }

  Writer& write(const char* key, const std::string& value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << "\"" << escape(value) << "\"";
    return *this;
  }

  Writer& write(const char* key, const char* value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << "\"" << escape(value) << "\"";
    return *this;
  }

  /// @brief Numeric array element.
  template <typename T>
  Writer& value(T v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    writeNumber(v);
    return *this;
  }

  Writer& value(bool v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << (v ? "true" : "false");
    return *this;
  }

  Writer& value(const std::string& v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << "\"" << escape(v) << "\"";
    return *this;
  }

  Writer& value(const char* v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << "\"" << escape(v) << "\"";
    return *this;
  }

 private:
  template <typename T>
  void writeNumber(T value) {
    if constexpr (std::is_floating_point_v<T>) {
      if (!std::isfinite(value)) {
        os_ << "null";
        return;
      }
    }
    os_ << value;
  }

  void writeKey(const char* key) {
    writeNewlineIndent();
    os_ << "\"" << key << "\":";
    if (pretty_) os_ << " ";
  }

  void writeCommaIfNeeded() {
    if (!first_) os_ << ",";
    first_ = false;
  }

  void writeNewlineIndent() {
    if (pretty_) {
      os_ << "\n";
      for (int i = 0; i < depth_ * indent_size_; ++i) os_ << " ";
    }
  }

  void pushContext() {
    ++depth_;
    first_ = true;
  }

  void popContext() {
    --depth_;
    first_ = false;
  }

  std::ostream& os_;
  bool pretty_;
  int indent_size_;
  int depth_ = 0;
  bool first_ = true;
};

/// @brief RAII object scope: beginObject() on construction, endObject() on destruction.
class ObjectScope {
 public:
  ObjectScope(Writer& w, const char* key = nullptr) : w_(w) { w_.beginObject(key); }
  ~ObjectScope() { w_.endObject(); }
  Writer& writer() { return w_; }

 private:
  Writer& w_;
};

/// @brief RAII array scope: beginArray() on construction, endArray() on destruction.
class ArrayScope {
 public:
  ArrayScope(Writer& w, const char* key = nullptr) : w_(w) { w_.beginArray(key); }
  ~ArrayScope() { w_.endArray(); }
  Writer& writer() { return w_; }

 private:
  Writer& w_;
};

// ============================================================================
// Reader
// ============================================================================

/**
 * @brief Small JSON object reader.
 *
 * Scalars are stored as text. Nested objects and arrays are stored as their
 * raw JSON text and re-parsed on access, so documents such as feature files
 * can be walked one level at a time.
 *
 * @example
 * ```cpp
 * json::Parser p(R"({"tempo":{"bpm":128},"drops":[61.5,122]})");
 * p.getObject("tempo").getDouble("bpm");  // 128.0
 * std::vector<double> drops;
 * p.getNumberArray("drops", drops);       // {61.5, 122.0}
 * ```
 */
class Parser {
 public:
  explicit Parser(const std::string& json) : json_(json) { parse(); }

  /// @brief False if the text is not a well-formed JSON object.
  bool valid() const { return valid_; }

  bool has(const std::string& key) const { return values_.find(key) != values_.end(); }

  int getInt(const std::string& key, int default_val = 0) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    try {
      return std::stoi(it->second);
    } catch (const std::exception&) {
      return default_val;
    }
  }

  uint32_t getUint(const std::string& key, uint32_t default_val = 0) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    try {
      return static_cast<uint32_t>(std::stoul(it->second));
    } catch (const std::exception&) {
      return default_val;
    }
  }

  bool getBool(const std::string& key, bool default_val = false) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    if (it->second == "true") return true;
    if (it->second == "false") return false;
    return default_val;
  }

  std::string getString(const std::string& key, const std::string& default_val = "") const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    return it->second;
  }

  double getDouble(const std::string& key, double default_val = 0.0) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    double result = default_val;
    return parseNumber(it->second, result) ? result : default_val;
  }

  /// @brief True if the key holds a number.
  bool isNumber(const std::string& key) const {
    auto it = values_.find(key);
    double unused = 0.0;
    return it != values_.end() && kinds_.at(key) == Kind::Scalar &&
           parseNumber(it->second, unused);
  }

  bool isObject(const std::string& key) const {
    auto it = kinds_.find(key);
    return it != kinds_.end() && it->second == Kind::Object;
  }

  bool isArray(const std::string& key) const {
    auto it = kinds_.find(key);
    return it != kinds_.end() && it->second == Kind::Array;
  }

  /// @brief Nested object (empty parser if missing or not an object).
  Parser getObject(const std::string& key) const {
    if (!isObject(key)) return Parser("{}");
    return Parser(values_.at(key));
  }

  /**
   * @brief Numeric array.
   * @param key Array key
   * @param out Parsed numbers
   * @return false if the key is missing, not an array, or holds a non-number
   */
  bool getNumberArray(const std::string& key, std::vector<double>& out) const {
    out.clear();
    if (!isArray(key)) return false;
    for (const auto& element : splitArray(values_.at(key))) {
      double v = 0.0;
      if (!parseNumber(element, v)) return false;
      out.push_back(v);
    }
    return true;
  }

  /**
   * @brief Array of objects.
   * @param key Array key
   * @param out One parser per element
   * @return false if the key is missing, not an array, or holds a non-object
   */
  bool getObjectArray(const std::string& key, std::vector<Parser>& out) const {
    out.clear();
    if (!isArray(key)) return false;
    for (const auto& element : splitArray(values_.at(key))) {
      Parser p(element);
      if (!p.valid()) return false;
      out.push_back(std::move(p));
    }
    return true;
  }

 private:
  enum class Kind { Scalar, String, Object, Array };

  static bool parseNumber(const std::string& text, double& out) {
    if (text.empty()) return false;
    try {
      size_t consumed = 0;
      double v = std::stod(text, &consumed);
      if (consumed != text.size()) return false;
      out = v;
      return true;
    } catch (const std::exception&) {
      return false;
    }
  }

  static bool isSpace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

  static void skipWhitespace(const std::string& s, size_t& pos) {
    while (pos < s.size() && isSpace(s[pos])) ++pos;
  }

  // Advances past a string literal starting at pos (which points at '"').
  static bool skipString(const std::string& s, size_t& pos) {
    ++pos;
    while (pos < s.size() && s[pos] != '"') {
      if (s[pos] == '\\') ++pos;
      ++pos;
    }
    if (pos >= s.size()) return false;
    ++pos;
    return true;
  }

  // Advances past a balanced {...} or [...] starting at pos.
  static bool skipNested(const std::string& s, size_t& pos) {
    int depth = 0;
    while (pos < s.size()) {
      char c = s[pos];
      if (c == '"') {
        if (!skipString(s, pos)) return false;
        continue;
      }
      if (c == '{' || c == '[') ++depth;
      if (c == '}' || c == ']') {
        --depth;
        if (depth == 0) {
          ++pos;
          return true;
        }
      }
      ++pos;
    }
    return false;
  }

  // Reads 4 hex digits at pos. Leaves pos unchanged on failure.
  static bool readHex4(const std::string& s, size_t& pos, uint32_t& out) {
    if (pos + 4 > s.size()) return false;
    uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
      char c = s[pos + i];
      value <<= 4;
      if (c >= '0' && c <= '9') {
        value |= static_cast<uint32_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        value |= static_cast<uint32_t>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        value |= static_cast<uint32_t>(c - 'A' + 10);
      } else {
        return false;
      }
    }
    pos += 4;
    out = value;
    return true;
  }

  static void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
      out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  // Decodes the code point of a unicode escape (and a following low
  // surrogate escape) with pos on the first hex digit. Leaves pos on the last
  // consumed character.
  // Malformed or unpaired escapes decode to U+FFFD.
  static uint32_t readUnicodeEscape(const std::string& s, size_t& pos) {
    constexpr uint32_t kReplacement = 0xFFFD;
    uint32_t cp = 0;
    if (!readHex4(s, pos, cp)) {
      --pos;
      return kReplacement;
    }
    if (cp >= 0xD800 && cp <= 0xDBFF) {
      size_t next = pos;
      uint32_t low = 0;
      if (next + 1 < s.size() && s[next] == '\\' && s[next + 1] == 'u') {
        next += 2;
        if (readHex4(s, next, low) && low >= 0xDC00 && low <= 0xDFFF) {
          pos = next - 1;
          return 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
      }
      --pos;
      return kReplacement;
    }
    --pos;
    if (cp >= 0xDC00 && cp <= 0xDFFF) return kReplacement;
    return cp;
  }

  // Splits a raw "[a, b, {...}]" into element texts.
  static std::vector<std::string> splitArray(const std::string& raw) {
    std::vector<std::string> elements;
    size_t pos = 0;
    skipWhitespace(raw, pos);
    if (pos >= raw.size() || raw[pos] != '[') return elements;
    ++pos;
    while (pos < raw.size()) {
      skipWhitespace(raw, pos);
      if (pos >= raw.size() || raw[pos] == ']') break;
      if (raw[pos] == ',') {
        ++pos;
        continue;
      }
      size_t start = pos;
      if (raw[pos] == '{' || raw[pos] == '[') {
        if (!skipNested(raw, pos)) break;
      } else if (raw[pos] == '"') {
        if (!skipString(raw, pos)) break;
      } else {
        while (pos < raw.size() && raw[pos] != ',' && raw[pos] != ']' && !isSpace(raw[pos])) ++pos;
      }
      elements.push_back(raw.substr(start, pos - start));
    }
    return elements;
  }

  std::string parseString(size_t& pos) {
    if (pos >= json_.size() || json_[pos] != '"') return "";
    ++pos;
    std::string result;
    while (pos < json_.size() && json_[pos] != '"') {
      if (json_[pos] == '\\' && pos + 1 < json_.size()) {
        ++pos;
        switch (json_[pos]) {
          case 'n':
            result += '\n';
            break;
          case 'r':
            result += '\r';
            break;
          case 't':
            result += '\t';
            break;
          case 'b':
            result += '\b';
            break;
          case 'f':
            result += '\f';
            break;
          case 'u':
            ++pos;
            appendUtf8(result, readUnicodeEscape(json_, pos));
            break;
          default:
            result += json_[pos];
            break;
        }
      } else {
        result += json_[pos];
      }
      ++pos;
    }
    if (pos < json_.size()) ++pos;
    return result;
  }

  void parse() {
    size_t pos = 0;
    skipWhitespace(json_, pos);
    if (pos >= json_.size() || json_[pos] != '{') return;
    ++pos;

    while (pos < json_.size()) {
      skipWhitespace(json_, pos);
      if (pos >= json_.size()) return;
      if (json_[pos] == '}') {
        valid_ = true;
        return;
      }
      if (json_[pos] == ',') {
        ++pos;
        continue;
      }
      if (json_[pos] != '"') return;

      std::string key = parseString(pos);
      skipWhitespace(json_, pos);
      if (pos >= json_.size() || json_[pos] != ':') return;
      ++pos;
      skipWhitespace(json_, pos);
      if (pos >= json_.size()) return;

      char c = json_[pos];
      if (c == '"') {
        values_[key] = parseString(pos);
        kinds_[key] = Kind::String;
      } else if (c == '{' || c == '[') {
        size_t start = pos;
        if (!skipNested(json_, pos)) return;
        values_[key] = json_.substr(start, pos - start);
        kinds_[key] = (c == '{') ? Kind::Object : Kind::Array;
      } else {
        std::string value;
        while (pos < json_.size() && json_[pos] != ',' && json_[pos] != '}' &&
               !isSpace(json_[pos])) {
          value += json_[pos];
          ++pos;
        }
        if (value.empty()) return;
        values_[key] = value;
        kinds_[key] = Kind::Scalar;
      }
    }
  }

  std::string json_;
  std::map<std::string, std::string> values_;
  std::map<std::string, Kind> kinds_;
  bool valid_ = false;
};

// ============================================================================
// Visitor-based serialization helpers
// ============================================================================

struct WriteVisitor {
  Writer& w;
  void operator()(const char* k, uint32_t v) { w.write(k, v); }
  void operator()(const char* k, bool v) { w.write(k, v); }
  void operator()(const char* k, double v) { w.write(k, v); }
  template <typename E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
  void operator()(const char* k, E v) {
    w.write(k, static_cast<int>(v));
  }
  template <typename T>
  void nested(const char* k, const T& obj) {
    w.beginObject(k);
    obj.writeTo(w);
    w.endObject();
  }
};

struct ReadVisitor {
  const Parser& p;
  void operator()(const char* k, uint32_t& v) { v = p.getUint(k, v); }
  void operator()(const char* k, bool& v) { v = p.getBool(k, v); }
  void operator()(const char* k, double& v) { v = p.getDouble(k, v); }
  template <typename E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
  void operator()(const char* k, E& v) {
    v = static_cast<E>(p.getInt(k, static_cast<int>(v)));
  }
  template <typename T>
  void nested(const char* k, T& obj) {
    if (p.has(k)) obj.readFrom(p.getObject(k));
  }
};

}  // namespace json
}  // namespace dynamix
