#include "uhi/Json.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>

namespace uhi {

JsonValue JsonValue::MakeBool(bool b)
{
  JsonValue v;
  v.type = Type::Bool;
  v.boolValue = b;
  return v;
}

JsonValue JsonValue::MakeNumber(double n)
{
  JsonValue v;
  v.type = Type::Number;
  v.numberValue = n;
  return v;
}

JsonValue JsonValue::MakeString(std::string s)
{
  JsonValue v;
  v.type = Type::String;
  v.stringValue = std::move(s);
  return v;
}

JsonValue JsonValue::MakeArray()
{
  JsonValue v;
  v.type = Type::Array;
  return v;
}

JsonValue JsonValue::MakeObject()
{
  JsonValue v;
  v.type = Type::Object;
  return v;
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

std::string JsonEscape(const std::string& s)
{
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(s.size() + 8);
  for (unsigned char ch : s) {
    switch (ch) {
    case '\\': out += "\\\\"; break;
    case '"': out += "\\\""; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (ch < 0x20) {
        out += "\\u00";
        out.push_back(kHex[(ch >> 4) & 0xF]);
        out.push_back(kHex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

namespace {

class Reader {
public:
  explicit Reader(const std::string& text) : m_s(text) {}

  bool document(JsonValue& out)
  {
    if (!value(out, 0)) return false;
    skipWs();
    if (m_i != m_s.size()) return fail("trailing characters");
    return true;
  }

  const std::string& error() const { return m_err; }

private:
  static constexpr int kMaxDepth = 256;

  void skipWs()
  {
    while (m_i < m_s.size() && std::isspace(static_cast<unsigned char>(m_s[m_i])) != 0) ++m_i;
  }

  char peek() const { return m_i < m_s.size() ? m_s[m_i] : '\0'; }

  bool fail(const std::string& msg)
  {
    if (m_err.empty()) {
      std::ostringstream oss;
      oss << "JSON parse error @" << m_i << ": " << msg;
      m_err = oss.str();
    }
    return false;
  }

  bool literal(const char* word)
  {
    const std::string w(word);
    if (m_s.compare(m_i, w.size(), w) != 0) return fail("expected '" + w + "'");
    m_i += w.size();
    return true;
  }

  bool value(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");
    skipWs();
    const char c = peek();
    switch (c) {
    case '\0': return fail("unexpected end of input");
    case 'n':
      out = JsonValue{};
      return literal("null");
    case 't':
      out = JsonValue::MakeBool(true);
      return literal("true");
    case 'f':
      out = JsonValue::MakeBool(false);
      return literal("false");
    case '"': {
      std::string s;
      if (!string(s)) return false;
      out = JsonValue::MakeString(std::move(s));
      return true;
    }
    case '[': return array(out, depth);
    case '{': return object(out, depth);
    default: break;
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return number(out);
    return fail(std::string("unexpected character '") + c + "'");
  }

  bool digits()
  {
    if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return fail("expected digit");
    while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++m_i;
    return true;
  }

  bool number(JsonValue& out)
  {
    const std::size_t start = m_i;
    if (peek() == '-') ++m_i;
    if (peek() == '0') {
      ++m_i;
    } else if (!digits()) {
      return false;
    }
    if (peek() == '.') {
      ++m_i;
      if (!digits()) return false;
    }
    if (peek() == 'e' || peek() == 'E') {
      ++m_i;
      if (peek() == '+' || peek() == '-') ++m_i;
      if (!digits()) return false;
    }

    const std::string text = m_s.substr(start, m_i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || !end || *end != '\0') return fail("invalid number");
    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool string(std::string& out)
  {
    if (peek() != '"') return fail("expected string");
    ++m_i;
    out.clear();
    while (m_i < m_s.size()) {
      const char c = m_s[m_i++];
      if (c == '"') return true;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (m_i >= m_s.size()) break;
      const char e = m_s[m_i++];
      switch (e) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u': {
        if (m_i + 4 > m_s.size()) return fail("invalid \\u escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
          const char h = m_s[m_i++];
          code <<= 4;
          if (h >= '0' && h <= '9') code |= static_cast<unsigned int>(h - '0');
          else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned int>(h - 'a' + 10);
          else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned int>(h - 'A' + 10);
          else return fail("invalid hex digit in \\u escape");
        }
        // Encode the BMP code point as UTF-8 (surrogate pairs are kept as-is).
        if (code < 0x80) {
          out.push_back(static_cast<char>(code));
        } else if (code < 0x800) {
          out.push_back(static_cast<char>(0xC0 | (code >> 6)));
          out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
          out.push_back(static_cast<char>(0xE0 | (code >> 12)));
          out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
          out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }
    return fail("unterminated string");
  }

  bool array(JsonValue& out, int depth)
  {
    ++m_i; // '['
    out = JsonValue::MakeArray();
    skipWs();
    if (peek() == ']') {
      ++m_i;
      return true;
    }
    while (true) {
      JsonValue v;
      if (!value(v, depth + 1)) return false;
      out.arrayValue.push_back(std::move(v));
      skipWs();
      if (peek() == ']') {
        ++m_i;
        return true;
      }
      if (peek() != ',') return fail("expected ',' or ']'");
      ++m_i;
    }
  }

  bool object(JsonValue& out, int depth)
  {
    ++m_i; // '{'
    out = JsonValue::MakeObject();
    skipWs();
    if (peek() == '}') {
      ++m_i;
      return true;
    }
    while (true) {
      skipWs();
      std::string k;
      if (!string(k)) return false;
      skipWs();
      if (peek() != ':') return fail("expected ':'");
      ++m_i;
      JsonValue v;
      if (!value(v, depth + 1)) return false;
      out.objectValue.emplace_back(std::move(k), std::move(v));
      skipWs();
      if (peek() == '}') {
        ++m_i;
        return true;
      }
      if (peek() != ',') return fail("expected ',' or '}'");
      ++m_i;
    }
  }

  const std::string& m_s;
  std::size_t m_i = 0;
  std::string m_err;
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Reader r(text);
  JsonValue v;
  if (!r.document(v)) {
    outError = r.error();
    return false;
  }
  outValue = std::move(v);
  outError.clear();
  return true;
}

bool ReadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open " + path;
    return false;
  }
  std::ostringstream oss;
  oss << f.rdbuf();
  if (!ParseJson(oss.str(), outValue, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

// JsonWriter --------------------------------------------------------------------------------------

JsonWriter::JsonWriter(std::ostream& os, JsonWriteOptions opt) : m_os(&os), m_opt(opt) {}

bool JsonWriter::setError(std::string msg)
{
  if (m_error.empty()) m_error = std::move(msg);
  return false;
}

void JsonWriter::newline(std::size_t depth)
{
  if (!m_opt.pretty) return;
  *m_os << '\n';
  for (std::size_t i = 0; i < depth * static_cast<std::size_t>(std::max(0, m_opt.indent)); ++i) *m_os << ' ';
}

bool JsonWriter::prepareValue()
{
  if (!ok()) return false;
  if (m_finished) return setError("JsonWriter: value after document end");
  if (m_stack.empty()) return true;

  Frame& top = m_stack.back();
  if (top.isObject) {
    if (top.expectingKey) return setError("JsonWriter: object value without key");
    return true;
  }
  if (!top.first) *m_os << ',';
  newline(m_stack.size());
  top.first = false;
  return true;
}

void JsonWriter::finishValue()
{
  if (m_stack.empty()) {
    m_finished = true;
    return;
  }
  Frame& top = m_stack.back();
  if (top.isObject) top.expectingKey = true;
}

bool JsonWriter::beginContainer(bool isObject, char open)
{
  if (!prepareValue()) return false;
  *m_os << open;
  m_stack.push_back(Frame{isObject, true, true});
  return static_cast<bool>(*m_os) || setError("JsonWriter: stream failure");
}

bool JsonWriter::endContainer(bool isObject, char close)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().isObject != isObject) return setError("JsonWriter: mismatched container end");
  if (isObject && !m_stack.back().expectingKey) return setError("JsonWriter: dangling object key");
  const bool empty = m_stack.back().first;
  m_stack.pop_back();
  if (!empty) newline(m_stack.size());
  *m_os << close;
  finishValue();
  if (m_finished && m_opt.pretty) *m_os << '\n';
  return static_cast<bool>(*m_os) || setError("JsonWriter: stream failure");
}

bool JsonWriter::beginObject() { return beginContainer(true, '{'); }
bool JsonWriter::endObject() { return endContainer(true, '}'); }
bool JsonWriter::beginArray() { return beginContainer(false, '['); }
bool JsonWriter::endArray() { return endContainer(false, ']'); }

bool JsonWriter::key(const std::string& k)
{
  if (!ok()) return false;
  if (m_stack.empty() || !m_stack.back().isObject) return setError("JsonWriter: key outside object");
  Frame& top = m_stack.back();
  if (!top.expectingKey) return setError("JsonWriter: two keys in a row");
  if (!top.first) *m_os << ',';
  newline(m_stack.size());
  top.first = false;
  top.expectingKey = false;
  *m_os << '"' << JsonEscape(k) << "\":";
  if (m_opt.pretty) *m_os << ' ';
  return true;
}

bool JsonWriter::nullValue()
{
  if (!prepareValue()) return false;
  *m_os << "null";
  finishValue();
  return true;
}

bool JsonWriter::boolValue(bool b)
{
  if (!prepareValue()) return false;
  *m_os << (b ? "true" : "false");
  finishValue();
  return true;
}

bool JsonWriter::numberValue(double n)
{
  if (!std::isfinite(n)) return setError("JsonWriter: non-finite number");
  if (!prepareValue()) return false;
  // Shortest of 15 / 17 significant digits that round-trips.
  std::ostringstream oss;
  oss << std::setprecision(15) << n;
  if (std::strtod(oss.str().c_str(), nullptr) != n) {
    oss.str(std::string());
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << n;
  }
  *m_os << oss.str();
  finishValue();
  return true;
}

bool JsonWriter::intValue(std::int64_t n)
{
  if (!prepareValue()) return false;
  *m_os << n;
  finishValue();
  return true;
}

bool JsonWriter::stringValue(const std::string& s)
{
  if (!prepareValue()) return false;
  *m_os << '"' << JsonEscape(s) << '"';
  finishValue();
  return true;
}

bool JsonWriter::value(const JsonValue& v)
{
  switch (v.type) {
  case JsonValue::Type::Null: return nullValue();
  case JsonValue::Type::Bool: return boolValue(v.boolValue);
  case JsonValue::Type::Number: return numberValue(v.numberValue);
  case JsonValue::Type::String: return stringValue(v.stringValue);
  case JsonValue::Type::Array:
    if (!beginArray()) return false;
    for (const JsonValue& e : v.arrayValue) {
      if (!value(e)) return false;
    }
    return endArray();
  case JsonValue::Type::Object:
    if (!beginObject()) return false;
    for (const auto& kv : v.objectValue) {
      if (!key(kv.first) || !value(kv.second)) return false;
    }
    return endObject();
  }
  return setError("JsonWriter: unknown value type");
}

} // namespace uhi
