#pragma once

#include "util.h"

#include <cstdint>
#include <deque>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gemfetch {

class marshal_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class marshal_type {
  NIL,
  TRUE_VALUE,
  FALSE_VALUE,
  INTEGER,       // fixnum or bignum in 64-bit range
  FLOAT,
  STRING,
  SYMBOL,
  REGEXP,
  ARRAY,
  HASH,
  OBJECT,        // 'o' plain object, ivars by name
  STRUCT,        // 'S' members stored like ivars
  USER_DUMP,     // 'u' class with _dump: raw bytes in `text`
  USER_MARSHAL,  // 'U' class with marshal_dump: `payload`
  DATA,          // 'd' wrapped data object: `payload`
  CLASS_REF,
  MODULE_REF
};

std::string_view marshal_type_name(marshal_type type);

// One decoded node. Child links point into the owning marshal_document, so a node is
// only valid while its document is alive. Object links ('@') resolve to the same node.
struct marshal_value {
  marshal_type type{ marshal_type::NIL };
  std::int64_t integer{ 0 };
  double real{ 0.0 };
  std::string text;        // string bytes, symbol name, regexp source, _dump bytes
  std::string class_name;  // objects, user types, class/module refs, subclassed builtins
  std::vector<marshal_value const *> elements;
  std::vector<std::pair<marshal_value const *, marshal_value const *>> entries;
  std::vector<std::pair<std::string, marshal_value const *>> ivars;
  marshal_value const *default_value{ nullptr };
  marshal_value const *payload{ nullptr };

  bool is(marshal_type t) const { return type == t; }
  bool is_nil() const { return type == marshal_type::NIL; }

  // Checked accessors; throw marshal_error on a type mismatch.
  std::string const &as_string() const;  // STRING or SYMBOL
  std::int64_t as_integer() const;
  std::vector<marshal_value const *> const &as_array() const;

  // Hash lookup by string or symbol key; nullptr if absent or not a hash.
  marshal_value const *get(std::string_view key) const;

  // Instance variable ("@name") or struct member; nullptr if absent.
  marshal_value const *ivar(std::string_view name) const;
};

class marshal_document : uncopyable {
 public:
  // Decode a complete Marshal 4.8 stream. Throws marshal_error.
  static marshal_document parse(std::string_view bytes);

  marshal_value const &root() const { return *root_; }
  std::size_t node_count() const { return nodes_.size(); }

 private:
  friend class marshal_reader;

  marshal_document() = default;

  std::deque<marshal_value> nodes_;
  marshal_value const *root_{ nullptr };
};

}  // namespace gemfetch
