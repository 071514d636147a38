#include <optional>

#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/MathExtras.h"

#include "evalexpr/fault.h"
#include "evalexpr/vm.h"

using namespace evalexpr;

static llvm::Error operationFault(FaultKind kind, const llvm::Twine& msg) {
    return makeFault(kind, "", SourceLoc(), msg);
}

static llvm::Error operandTypeFault(BinaryOpKind op, const Value& lhs, const Value& rhs) {
    return operationFault(FaultKind::Type,
                          "unsupported operand types for " + binaryOpName(op) + ": '" +
                              Value::kindName(lhs.getKind()) + "' and '" +
                              Value::kindName(rhs.getKind()) + "'");
}

// Integers and booleans combine as 64-bit integers; anything involving a
// float is computed in double precision.
static bool isIntegral(const Value& v) { return v.isInt() || v.isBool(); }
static int64_t toInteger(const Value& v) { return v.isBool() ? v.getBool() : v.getInt(); }

static llvm::Expected<Value> arithmetic(BinaryOpKind op, const Value& lhs, const Value& rhs) {
    if (!lhs.isNumeric() || !rhs.isNumeric())
        return operandTypeFault(op, lhs, rhs);

    if (op == BinaryOpKind::Div) {
        // True division: the quotient is always a float.
        double divisor = rhs.toDouble();
        if (divisor == 0.0)
            return operationFault(FaultKind::Arithmetic, "division by zero");
        return Value::floating(lhs.toDouble() / divisor);
    }

    if (isIntegral(lhs) && isIntegral(rhs)) {
        int64_t l = toInteger(lhs), r = toInteger(rhs), result;
        bool overflow;
        switch (op) {
        case BinaryOpKind::Add: overflow = llvm::AddOverflow(l, r, result); break;
        case BinaryOpKind::Sub: overflow = llvm::SubOverflow(l, r, result); break;
        case BinaryOpKind::Mul: overflow = llvm::MulOverflow(l, r, result); break;
        default: llvm_unreachable("not an arithmetic op");
        }
        if (overflow)
            return operationFault(FaultKind::Arithmetic,
                                  "integer overflow in " + binaryOpName(op));
        return Value::integer(result);
    }

    double l = lhs.toDouble(), r = rhs.toDouble();
    switch (op) {
    case BinaryOpKind::Add: return Value::floating(l + r);
    case BinaryOpKind::Sub: return Value::floating(l - r);
    case BinaryOpKind::Mul: return Value::floating(l * r);
    default: llvm_unreachable("not an arithmetic op");
    }
}

static llvm::Expected<Value> ordering(BinaryOpKind op, const Value& lhs, const Value& rhs) {
    if (!lhs.isNumeric() || !rhs.isNumeric())
        return operandTypeFault(op, lhs, rhs);

    // Any comparison involving nan is false.
    std::optional<int> result = compareNumeric(lhs, rhs);
    if (!result)
        return Value::boolean(false);
    int cmp = *result;

    switch (op) {
    case BinaryOpKind::Lt: return Value::boolean(cmp < 0);
    case BinaryOpKind::Le: return Value::boolean(cmp <= 0);
    case BinaryOpKind::Gt: return Value::boolean(cmp > 0);
    case BinaryOpKind::Ge: return Value::boolean(cmp >= 0);
    default: llvm_unreachable("not an ordering op");
    }
}

static llvm::Expected<Value> listAppend(const Value& list, const Value& element) {
    if (!list.isList())
        return operationFault(FaultKind::MalformedTape,
                              "listAppend expects a list, got '" +
                                  Value::kindName(list.getKind()) + "'");
    List elements = list.getList();
    elements.push_back(element);
    return Value::list(std::move(elements));
}

static llvm::Expected<Value> call(const Value& callee, const Value& args) {
    if (!callee.isBuiltin())
        return operationFault(FaultKind::Type, "'" + Value::kindName(callee.getKind()) +
                                                   "' value is not callable");
    if (!args.isList())
        return operationFault(FaultKind::MalformedTape,
                              "call expects an argument list, got '" +
                                  Value::kindName(args.getKind()) + "'");
    return callee.getBuiltin().fn(args.getList());
}

llvm::Expected<Value> evalexpr::applyBinary(BinaryOpKind op, const Value& lhs, const Value& rhs) {
    switch (op) {
    case BinaryOpKind::Add:
    case BinaryOpKind::Sub:
    case BinaryOpKind::Mul:
    case BinaryOpKind::Div:
        return arithmetic(op, lhs, rhs);
    case BinaryOpKind::Lt:
    case BinaryOpKind::Le:
    case BinaryOpKind::Gt:
    case BinaryOpKind::Ge:
        return ordering(op, lhs, rhs);
    case BinaryOpKind::Eq:
        return Value::boolean(lhs.equals(rhs));
    case BinaryOpKind::Ne:
        return Value::boolean(!lhs.equals(rhs));
    case BinaryOpKind::ListAppend:
        return listAppend(lhs, rhs);
    case BinaryOpKind::Call:
        return call(lhs, rhs);
    }
    llvm_unreachable("unknown binary op");
}

llvm::Expected<Value> evalexpr::applyNegate(const Value& operand) {
    switch (operand.getKind()) {
    case Value::Kind::Bool:
    case Value::Kind::Int: {
        int64_t result;
        if (llvm::SubOverflow(int64_t(0), toInteger(operand), result))
            return operationFault(FaultKind::Arithmetic, "integer overflow in negation");
        return Value::integer(result);
    }
    case Value::Kind::Float:
        return Value::floating(-operand.getFloat());
    case Value::Kind::None:
    case Value::Kind::List:
    case Value::Kind::Builtin:
        break;
    }
    return operationFault(FaultKind::Type, "bad operand type for negation: '" +
                                               Value::kindName(operand.getKind()) + "'");
}
