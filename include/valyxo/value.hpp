#pragma once
#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>


namespace vx {


struct Value;

using Int   = std::int64_t;
using Float = double;
using List  = std::vector<Value>;
using Dict  = std::map<std::string, Value>;

// Lists and dicts are shared but never mutated after construction.
using ListPtr = std::shared_ptr<const List>;
using DictPtr = std::shared_ptr<const Dict>;

struct Value {
  enum Type { None, Bool, Integer, Real, Str, ListT, DictT };

  std::variant<std::monostate, bool, Int, Float, std::string, ListPtr, DictPtr> data;
  // 0 for scalars, 1 + deepest element for lists and dicts
  int nesting{0};

  Value() = default;
  Value(bool b)               : data(b) {}
  Value(Int i)                : data(i) {}
  Value(int i)                : data(Int{i}) {}
  Value(Float f)              : data(f) {}
  Value(std::string s)        : data(std::move(s)) {}
  Value(const char* s)        : data(std::string(s)) {}
  Value(List l);
  Value(Dict d);

  Type type() const { return static_cast<Type>(data.index()); }

  bool is_none()   const { return type() == None; }
  bool is_bool()   const { return type() == Bool; }
  bool is_int()    const { return type() == Integer; }
  bool is_float()  const { return type() == Real; }
  bool is_number() const { return is_int() || is_float(); }
  bool is_str()    const { return type() == Str; }
  bool is_list()   const { return type() == ListT; }
  bool is_dict()   const { return type() == DictT; }

  bool               as_bool()  const { return std::get<bool>(data); }
  Int                as_int()   const { return std::get<Int>(data); }
  Float              as_float() const { return std::get<Float>(data); }
  const std::string& as_str()   const { return std::get<std::string>(data); }
  const List&        as_list()  const { return *std::get<ListPtr>(data); }
  const Dict&        as_dict()  const { return *std::get<DictPtr>(data); }

  // int or float widened to double
  Float as_number() const { return is_int() ? static_cast<Float>(as_int()) : as_float(); }
};


const char* type_name(const Value& v);

// Display form used by print: strings unquoted.
std::string to_string(const Value& v);
// Literal form used inside containers and diagnostics: strings quoted.
std::string repr(const Value& v);

bool truthy(const Value& v);
bool equals(const Value& a, const Value& b);

inline bool operator==(const Value& a, const Value& b){ return equals(a, b); }
inline bool operator!=(const Value& a, const Value& b){ return !equals(a, b); }

std::ostream& operator<<(std::ostream& os, const Value& v);


} // namespace vx
