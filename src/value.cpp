#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "llvm/Support/ErrorHandling.h"

#include "evalexpr/value.h"

using namespace evalexpr;

Value Value::list(List elements) {
    return Value(Storage(std::in_place_type<ListRef>,
                         std::make_shared<const List>(std::move(elements))));
}

Value Value::builtin(llvm::StringRef name, Builtin::Fn fn) {
    return Value(Storage(std::in_place_type<BuiltinRef>,
                         std::make_shared<const Builtin>(Builtin{name.str(), std::move(fn)})));
}

double Value::toDouble() const {
    switch (getKind()) {
    case Kind::Bool:  return getBool() ? 1.0 : 0.0;
    case Kind::Int:   return static_cast<double>(getInt());
    case Kind::Float: return getFloat();
    default:
        llvm_unreachable("toDouble on a non-numeric value");
    }
}

bool Value::isTruthy() const {
    switch (getKind()) {
    case Kind::None:    return false;
    case Kind::Bool:    return getBool();
    case Kind::Int:
    case Kind::Float:
    case Kind::List:
    case Kind::Builtin: return true;
    }
    llvm_unreachable("unknown value kind");
}

bool Value::equals(const Value& other) const {
    if (isNumeric() && other.isNumeric()) {
        std::optional<int> cmp = compareNumeric(*this, other);
        return cmp && *cmp == 0;
    }
    if (getKind() != other.getKind())
        return false;

    switch (getKind()) {
    case Kind::None:
        return true;
    case Kind::List: {
        const List& lhs = getList();
        const List& rhs = other.getList();
        if (lhs.size() != rhs.size())
            return false;
        for (size_t i = 0, e = lhs.size(); i != e; ++i)
            if (!lhs[i].equals(rhs[i]))
                return false;
        return true;
    }
    case Kind::Builtin:
        return std::get<BuiltinRef>(storage) == std::get<BuiltinRef>(other.storage);
    case Kind::Bool:
    case Kind::Int:
    case Kind::Float:
        break;
    }
    llvm_unreachable("numeric kinds handled above");
}

bool Value::isIdenticalTo(const Value& other) const {
    if (getKind() != other.getKind())
        return false;
    switch (getKind()) {
    case Kind::None:  return true;
    case Kind::Bool:  return getBool() == other.getBool();
    case Kind::Int:   return getInt() == other.getInt();
    case Kind::Float: {
        double lhs = getFloat(), rhs = other.getFloat();
        return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
    }
    case Kind::List: {
        const List& lhs = getList();
        const List& rhs = other.getList();
        if (lhs.size() != rhs.size())
            return false;
        for (size_t i = 0, e = lhs.size(); i != e; ++i)
            if (!lhs[i].isIdenticalTo(rhs[i]))
                return false;
        return true;
    }
    case Kind::Builtin:
        return std::get<BuiltinRef>(storage) == std::get<BuiltinRef>(other.storage);
    }
    llvm_unreachable("unknown value kind");
}

static int64_t integralValue(const Value& v) { return v.isBool() ? v.getBool() : v.getInt(); }

template <typename T>
static int threeWay(T lhs, T rhs) { return lhs < rhs ? -1 : (lhs > rhs ? 1 : 0); }

// Compares an integer with a finite or infinite (not nan) double exactly.
static int compareIntFloat(int64_t i, double d) {
    // 2^63 is exactly representable; every int64 lies in [-2^63, 2^63).
    const double twoTo63 = 9223372036854775808.0;
    if (d >= twoTo63)
        return -1;
    if (d < -twoTo63)
        return 1;
    double whole = std::trunc(d);
    int cmp = threeWay(i, static_cast<int64_t>(whole));
    if (cmp != 0)
        return cmp;
    // i equals the integral part of d; the fraction decides.
    return threeWay(whole, d);
}

std::optional<int> evalexpr::compareNumeric(const Value& lhs, const Value& rhs) {
    bool lhsFloat = lhs.isFloat(), rhsFloat = rhs.isFloat();
    if (!lhsFloat && !rhsFloat)
        return threeWay(integralValue(lhs), integralValue(rhs));

    if ((lhsFloat && std::isnan(lhs.getFloat())) || (rhsFloat && std::isnan(rhs.getFloat())))
        return std::nullopt;
    if (lhsFloat && rhsFloat)
        return threeWay(lhs.getFloat(), rhs.getFloat());
    if (rhsFloat)
        return compareIntFloat(integralValue(lhs), rhs.getFloat());
    return -compareIntFloat(integralValue(rhs), lhs.getFloat());
}

std::string evalexpr::formatFloat(double d) {
    if (std::isnan(d))
        return "nan";
    if (std::isinf(d))
        return d < 0 ? "-inf" : "inf";

    // Shortest digit string that reads back as d, in scientific form:
    // "-d.ddde+XX".
    char buf[32];
    for (int digits = 1; digits <= 17; ++digits) {
        snprintf(buf, sizeof(buf), "%.*e", digits - 1, d);
        if (strtod(buf, nullptr) == d)
            break;
    }
    llvm::StringRef sci(buf);
    size_t ePos = sci.find('e');
    llvm::StringRef mantissa = sci.take_front(ePos);
    int exponent = atoi(buf + ePos + 1);

    // Exponent form outside [1e-4, 1e16), fixed notation inside.
    if (exponent < -4 || exponent >= 16)
        return sci.str();

    std::string out;
    if (mantissa.consume_front("-"))
        out += '-';
    std::string significand = mantissa.str();
    significand.erase(std::remove(significand.begin(), significand.end(), '.'),
                      significand.end());

    if (exponent < 0) {
        out += "0.";
        out.append(static_cast<size_t>(-exponent - 1), '0');
        out += significand;
        return out;
    }

    size_t intDigits = static_cast<size_t>(exponent) + 1;
    if (significand.size() <= intDigits) {
        out += significand;
        out.append(intDigits - significand.size(), '0');
        out += ".0";
    } else {
        out += significand.substr(0, intDigits);
        out += '.';
        out += significand.substr(intDigits);
    }
    return out;
}

void Value::print(llvm::raw_ostream& os) const {
    switch (getKind()) {
    case Kind::None:
        os << "NONE";
        return;
    case Kind::Bool:
        os << (getBool() ? "TRUE" : "FALSE");
        return;
    case Kind::Int:
        os << getInt();
        return;
    case Kind::Float:
        os << formatFloat(getFloat());
        return;
    case Kind::List: {
        os << '[';
        bool first = true;
        for (const Value& elt : getList()) {
            if (!first)
                os << ", ";
            first = false;
            elt.print(os);
        }
        os << ']';
        return;
    }
    case Kind::Builtin:
        os << "<built-in function " << getBuiltin().name << '>';
        return;
    }
    llvm_unreachable("unknown value kind");
}

std::string Value::str() const {
    std::string out;
    llvm::raw_string_ostream os(out);
    print(os);
    return os.str();
}

llvm::StringRef Value::kindName(Kind kind) {
    switch (kind) {
    case Kind::None:    return "none";
    case Kind::Bool:    return "boolean";
    case Kind::Int:     return "integer";
    case Kind::Float:   return "float";
    case Kind::List:    return "list";
    case Kind::Builtin: return "built-in function";
    }
    llvm_unreachable("unknown value kind");
}
