#include "marshal.h"

#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

namespace gemfetch {

namespace {

constexpr unsigned char kMajorVersion{ 4 };
constexpr unsigned char kMinorVersion{ 8 };
constexpr int kMaxDepth{ 256 };

std::string describe_byte(unsigned char c) {
  char buf[8]{};
  std::snprintf(buf, sizeof buf, "0x%02x", static_cast<unsigned>(c));
  return buf;
}

}  // namespace

std::string_view marshal_type_name(marshal_type type) {
  switch (type) {
    case marshal_type::NIL: return "nil";
    case marshal_type::TRUE_VALUE: return "true";
    case marshal_type::FALSE_VALUE: return "false";
    case marshal_type::INTEGER: return "integer";
    case marshal_type::FLOAT: return "float";
    case marshal_type::STRING: return "string";
    case marshal_type::SYMBOL: return "symbol";
    case marshal_type::REGEXP: return "regexp";
    case marshal_type::ARRAY: return "array";
    case marshal_type::HASH: return "hash";
    case marshal_type::OBJECT: return "object";
    case marshal_type::STRUCT: return "struct";
    case marshal_type::USER_DUMP: return "user_dump";
    case marshal_type::USER_MARSHAL: return "user_marshal";
    case marshal_type::DATA: return "data";
    case marshal_type::CLASS_REF: return "class";
    case marshal_type::MODULE_REF: return "module";
  }
  return "unknown";
}

std::string const &marshal_value::as_string() const {
  if (type != marshal_type::STRING && type != marshal_type::SYMBOL) {
    throw marshal_error("marshal: expected string, found " +
                        std::string{ marshal_type_name(type) });
  }
  return text;
}

std::int64_t marshal_value::as_integer() const {
  if (type != marshal_type::INTEGER) {
    throw marshal_error("marshal: expected integer, found " +
                        std::string{ marshal_type_name(type) });
  }
  return integer;
}

std::vector<marshal_value const *> const &marshal_value::as_array() const {
  if (type != marshal_type::ARRAY) {
    throw marshal_error("marshal: expected array, found " +
                        std::string{ marshal_type_name(type) });
  }
  return elements;
}

marshal_value const *marshal_value::get(std::string_view key) const {
  if (type != marshal_type::HASH) { return nullptr; }
  for (auto const &[k, v] : entries) {
    if ((k->type == marshal_type::STRING || k->type == marshal_type::SYMBOL) &&
        k->text == key) {
      return v;
    }
  }
  return nullptr;
}

marshal_value const *marshal_value::ivar(std::string_view name) const {
  for (auto const &[n, v] : ivars) {
    if (n == name) { return v; }
  }
  return nullptr;
}

class marshal_reader {
 public:
  marshal_reader(std::string_view data, marshal_document &doc) : data_{ data }, doc_{ doc } {}

  marshal_value *read_stream() {
    unsigned char const major{ read_byte() };
    unsigned char const minor{ read_byte() };
    if (major != kMajorVersion || minor > kMinorVersion) {
      throw marshal_error("marshal: unsupported format version " + std::to_string(major) +
                          "." + std::to_string(minor));
    }
    return read_value(0);
  }

 private:
  unsigned char peek_byte() const {
    if (pos_ >= data_.size()) { throw marshal_error("marshal: unexpected end of data"); }
    return static_cast<unsigned char>(data_[pos_]);
  }

  unsigned char read_byte() {
    if (pos_ >= data_.size()) { throw marshal_error("marshal: unexpected end of data"); }
    return static_cast<unsigned char>(data_[pos_++]);
  }

  std::string_view read_raw(std::size_t length) {
    if (length > data_.size() - pos_) {
      throw marshal_error("marshal: unexpected end of data");
    }
    auto const result{ data_.substr(pos_, length) };
    pos_ += length;
    return result;
  }

  std::int64_t read_long() {
    auto const c{ static_cast<signed char>(read_byte()) };
    if (c == 0) { return 0; }
    if (c > 0) {
      if (c > 4) { return c - 5; }
      std::int64_t x{ 0 };
      for (int i{ 0 }; i < c; ++i) { x |= static_cast<std::int64_t>(read_byte()) << (8 * i); }
      return x;
    }
    if (c < -4) { return c + 5; }
    int const n{ -c };
    std::int64_t x{ -1 };
    for (int i{ 0 }; i < n; ++i) {
      x &= ~(static_cast<std::int64_t>(0xff) << (8 * i));
      x |= static_cast<std::int64_t>(read_byte()) << (8 * i);
    }
    return x;
  }

  std::size_t read_length() {
    auto const n{ read_long() };
    if (n < 0) { throw marshal_error("marshal: negative length"); }
    return static_cast<std::size_t>(n);
  }

  std::string_view read_bytes() { return read_raw(read_length()); }

  marshal_value *make(marshal_type type) {
    auto &node{ doc_.nodes_.emplace_back() };
    node.type = type;
    return &node;
  }

  marshal_value *make_entry(marshal_type type) {
    auto *node{ make(type) };
    objects_.push_back(node);
    return node;
  }

  // Symbols have their own link table.
  marshal_value *read_symbol_value(int depth) {
    if (depth > kMaxDepth) { throw marshal_error("marshal: nesting too deep"); }
    unsigned char const tag{ read_byte() };
    switch (tag) {
      case ':': return read_symbol_body();
      case ';': return symbol_link();
      case 'I': {
        auto *sym{ read_symbol_value(depth + 1) };
        skip_ivars(depth);
        return sym;
      }
      default:
        throw marshal_error("marshal: expected symbol, found " + describe_byte(tag));
    }
  }

  std::string const &read_symbol(int depth) { return read_symbol_value(depth)->text; }

  marshal_value *read_symbol_body() {
    auto *node{ make(marshal_type::SYMBOL) };
    node->text = std::string{ read_bytes() };
    symbols_.push_back(node);
    return node;
  }

  marshal_value *symbol_link() {
    auto const index{ read_length() };
    if (index >= symbols_.size()) { throw marshal_error("marshal: bad symbol link"); }
    return symbols_[index];
  }

  void skip_ivars(int depth) {
    auto const count{ read_length() };
    for (std::size_t i{ 0 }; i < count; ++i) {
      read_symbol(depth + 1);
      read_value(depth + 1);
    }
  }

  void read_ivars_into(marshal_value *node, int depth) {
    auto const count{ read_length() };
    for (std::size_t i{ 0 }; i < count; ++i) {
      auto name{ read_symbol(depth + 1) };
      auto const *value{ read_value(depth + 1) };
      node->ivars.emplace_back(std::move(name), value);
    }
  }

  double parse_float(std::string_view text) {
    if (text == "nan") { return std::numeric_limits<double>::quiet_NaN(); }
    if (text == "inf") { return std::numeric_limits<double>::infinity(); }
    if (text == "-inf") { return -std::numeric_limits<double>::infinity(); }

    // Older writers append mantissa bytes after a NUL.
    std::string const digits{ text.substr(0, text.find('\0')) };
    char *end{ nullptr };
    double const value{ std::strtod(digits.c_str(), &end) };
    if (digits.empty() || end != digits.c_str() + digits.size()) {
      throw marshal_error("marshal: bad float '" + digits + "'");
    }
    return value;
  }

  std::int64_t read_bignum() {
    unsigned char const sign{ read_byte() };
    if (sign != '+' && sign != '-') { throw marshal_error("marshal: bad bignum sign"); }
    auto const words{ read_length() };
    if (words > data_.size()) { throw marshal_error("marshal: unexpected end of data"); }
    auto const bytes{ read_raw(words * 2) };

    std::uint64_t magnitude{ 0 };
    for (std::size_t i{ 0 }; i < bytes.size(); ++i) {
      auto const b{ static_cast<unsigned char>(bytes[i]) };
      if (i >= 8) {
        if (b != 0) { throw marshal_error("marshal: bignum out of range"); }
        continue;
      }
      magnitude |= static_cast<std::uint64_t>(b) << (8 * i);
    }

    auto const limit{ static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) };
    if (sign == '+') {
      if (magnitude > limit) { throw marshal_error("marshal: bignum out of range"); }
      return static_cast<std::int64_t>(magnitude);
    }
    if (magnitude > limit + 1) { throw marshal_error("marshal: bignum out of range"); }
    if (magnitude == limit + 1) { return std::numeric_limits<std::int64_t>::min(); }
    return -static_cast<std::int64_t>(magnitude);
  }

  // '_dump' data: the class's _load runs before the object table entry is made, so
  // ivars on the dumped string are consumed first.
  marshal_value *read_user_dump(int depth, bool has_ivars) {
    std::string class_name{ read_symbol(depth) };
    std::string bytes{ read_bytes() };
    if (has_ivars) { skip_ivars(depth); }
    auto *node{ make_entry(marshal_type::USER_DUMP) };
    node->class_name = std::move(class_name);
    node->text = std::move(bytes);
    return node;
  }

  marshal_value *read_value(int depth) {
    if (depth > kMaxDepth) { throw marshal_error("marshal: nesting too deep"); }

    unsigned char const tag{ read_byte() };
    switch (tag) {
      case '0': return make(marshal_type::NIL);
      case 'T': return make(marshal_type::TRUE_VALUE);
      case 'F': return make(marshal_type::FALSE_VALUE);

      case 'i': {
        auto *node{ make(marshal_type::INTEGER) };
        node->integer = read_long();
        return node;
      }

      case 'l': {
        auto *node{ make_entry(marshal_type::INTEGER) };
        node->integer = read_bignum();
        return node;
      }

      case 'f': {
        auto *node{ make_entry(marshal_type::FLOAT) };
        node->real = parse_float(read_bytes());
        return node;
      }

      case ':': return read_symbol_body();
      case ';': return symbol_link();

      case '"': {
        auto *node{ make_entry(marshal_type::STRING) };
        node->text = std::string{ read_bytes() };
        return node;
      }

      case '/': {
        auto *node{ make_entry(marshal_type::REGEXP) };
        node->text = std::string{ read_bytes() };
        node->integer = read_byte();  // options
        return node;
      }

      case 'I': {
        // Instance variables on a builtin (usually string encoding). The wrapped value
        // registers itself in the object table.
        if (peek_byte() == 'u') {
          ++pos_;
          return read_user_dump(depth + 1, true);
        }
        auto *inner{ read_value(depth + 1) };
        if (inner->type == marshal_type::SYMBOL) {
          skip_ivars(depth);
          return inner;
        }
        read_ivars_into(inner, depth);
        return inner;
      }

      case '[': {
        auto *node{ make_entry(marshal_type::ARRAY) };
        auto const count{ read_length() };
        if (count > data_.size() - pos_) { throw marshal_error("marshal: bad array length"); }
        node->elements.reserve(count);
        for (std::size_t i{ 0 }; i < count; ++i) {
          node->elements.push_back(read_value(depth + 1));
        }
        return node;
      }

      case '{':
      case '}': {
        auto *node{ make_entry(marshal_type::HASH) };
        auto const count{ read_length() };
        if (count > data_.size() - pos_) { throw marshal_error("marshal: bad hash length"); }
        for (std::size_t i{ 0 }; i < count; ++i) {
          auto const *key{ read_value(depth + 1) };
          auto const *value{ read_value(depth + 1) };
          node->entries.emplace_back(key, value);
        }
        if (tag == '}') { node->default_value = read_value(depth + 1); }
        return node;
      }

      case 'o': {
        auto *node{ make_entry(marshal_type::OBJECT) };
        node->class_name = read_symbol(depth);
        read_ivars_into(node, depth);
        return node;
      }

      case 'S': {
        auto *node{ make_entry(marshal_type::STRUCT) };
        node->class_name = read_symbol(depth);
        read_ivars_into(node, depth);
        return node;
      }

      case 'u': return read_user_dump(depth, false);

      case 'U':
      case 'd': {
        auto *node{ make_entry(tag == 'U' ? marshal_type::USER_MARSHAL : marshal_type::DATA) };
        node->class_name = read_symbol(depth);
        node->payload = read_value(depth + 1);
        return node;
      }

      case 'c':
      case 'm':
      case 'M': {
        auto *node{ make_entry(tag == 'c' ? marshal_type::CLASS_REF
                                          : marshal_type::MODULE_REF) };
        node->text = std::string{ read_bytes() };
        node->class_name = node->text;
        return node;
      }

      case 'e': {
        read_symbol(depth);  // extending module
        return read_value(depth + 1);
      }

      case 'C': {
        std::string class_name{ read_symbol(depth) };
        auto *inner{ read_value(depth + 1) };
        inner->class_name = std::move(class_name);
        return inner;
      }

      case '@': {
        auto const index{ read_length() };
        if (index >= objects_.size()) { throw marshal_error("marshal: bad object link"); }
        return objects_[index];
      }

      default: throw marshal_error("marshal: unknown type tag " + describe_byte(tag));
    }
  }

  std::string_view data_;
  std::size_t pos_{ 0 };
  marshal_document &doc_;
  std::vector<marshal_value *> objects_;
  std::vector<marshal_value *> symbols_;
};

marshal_document marshal_document::parse(std::string_view bytes) {
  marshal_document doc;
  marshal_reader reader{ bytes, doc };
  doc.root_ = reader.read_stream();
  return doc;
}

}  // namespace gemfetch
