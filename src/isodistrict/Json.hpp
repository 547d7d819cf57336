#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace isodistrict {

// Minimal JSON value representation and parser for scene payloads and viewer configs.
//
// Notes:
//  - Strict JSON: no comments, no trailing commas.
//  - Numbers are parsed as double.
//  - Objects are stored as an ordered list of key/value pairs (first match wins on lookup).
//  - \uXXXX escapes (including surrogate pairs) are decoded to UTF-8.
//
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  static JsonValue MakeNull();
  static JsonValue MakeBool(bool b);
  static JsonValue MakeNumber(double n);
  static JsonValue MakeString(std::string s);
  static JsonValue MakeArray();
  static JsonValue MakeObject();

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }
};

const char* JsonTypeName(JsonValue::Type t);

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);

// Typed member lookups. A missing member or one of the wrong type yields the fallback.
double JsonNumberOr(const JsonValue& obj, const std::string& key, double fallback);
std::string JsonStringOr(const JsonValue& obj, const std::string& key, const std::string& fallback);
bool JsonBoolOr(const JsonValue& obj, const std::string& key, bool fallback);

// Returns the member array, or nullptr when missing / not an array.
const JsonValue* FindJsonArray(const JsonValue& obj, const std::string& key);

// Errors are reported as "JSON parse error at line L, column C: message".
bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Append a Unicode code point as UTF-8. Invalid code points append U+FFFD.
void AppendUtf8(std::string& out, std::uint32_t cp);

} // namespace isodistrict
