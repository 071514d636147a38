#ifndef EVALEXPR_VALUE_H
#define EVALEXPR_VALUE_H

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

namespace evalexpr {

class Value;

using List = std::vector<Value>;
using ListRef = std::shared_ptr<const List>;

/// Builtin - a host function bound in the environment before the program
/// starts. Faults it returns carry no location; the VM supplies one.
struct Builtin {
    using Fn = std::function<llvm::Expected<Value>(llvm::ArrayRef<Value>)>;

    std::string name;
    Fn fn;
};
using BuiltinRef = std::shared_ptr<const Builtin>;

struct NoneType {};

/// Value - the dynamically typed runtime value. Lists are immutable once
/// built; appending produces a fresh list.
class Value {
public:
    enum class Kind { None, Bool, Int, Float, List, Builtin };

    Value() = default;  // NONE

    static Value none() { return Value(); }
    static Value boolean(bool b) { return Value(Storage(std::in_place_type<bool>, b)); }
    static Value integer(int64_t i) { return Value(Storage(std::in_place_type<int64_t>, i)); }
    static Value floating(double d) { return Value(Storage(std::in_place_type<double>, d)); }
    static Value list(List elements);
    static Value builtin(llvm::StringRef name, Builtin::Fn fn);

    Kind getKind() const { return static_cast<Kind>(storage.index()); }
    bool isNone() const { return getKind() == Kind::None; }
    bool isBool() const { return getKind() == Kind::Bool; }
    bool isInt() const { return getKind() == Kind::Int; }
    bool isFloat() const { return getKind() == Kind::Float; }
    bool isList() const { return getKind() == Kind::List; }
    bool isBuiltin() const { return getKind() == Kind::Builtin; }
    /// Numbers in arithmetic: integers, floats and booleans (as 0/1).
    bool isNumeric() const { return isInt() || isFloat() || isBool(); }

    bool getBool() const { return std::get<bool>(storage); }
    int64_t getInt() const { return std::get<int64_t>(storage); }
    double getFloat() const { return std::get<double>(storage); }
    const List& getList() const { return *std::get<ListRef>(storage); }
    const Builtin& getBuiltin() const { return *std::get<BuiltinRef>(storage); }

    /// Numeric value widened to double; only valid when isNumeric().
    double toDouble() const;

    /// FALSE and NONE are falsy, everything else is truthy.
    bool isTruthy() const;

    /// Language-level equality: numbers compare by value across kinds,
    /// lists element-wise, builtins by identity.
    bool equals(const Value& other) const;

    /// Structural identity: same kind and same payload. 1 and 1.0 are equal
    /// but not identical.
    bool isIdenticalTo(const Value& other) const;

    void print(llvm::raw_ostream& os) const;
    std::string str() const;

    static llvm::StringRef kindName(Kind kind);

private:
    using Storage = std::variant<NoneType, bool, int64_t, double, ListRef, BuiltinRef>;
    Storage storage;

    explicit Value(Storage s) : storage(std::move(s)) {}
};

inline llvm::raw_ostream& operator<<(llvm::raw_ostream& os, const Value& v) {
    v.print(os);
    return os;
}

/// Exact three-way comparison of two numeric values (integers, floats,
/// booleans): negative, zero or positive. Integers are never rounded to
/// double. Empty when either side is nan.
std::optional<int> compareNumeric(const Value& lhs, const Value& rhs);

/// Shortest decimal spelling of d that reads back as d, always with a
/// fractional part or exponent ("3.0", "0.1", "1e+16").
std::string formatFloat(double d);

} // end namespace evalexpr

#endif // EVALEXPR_VALUE_H
