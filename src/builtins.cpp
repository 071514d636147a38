#include <cmath>

#include "llvm/Support/MathExtras.h"

#include "evalexpr/environment.h"
#include "evalexpr/fault.h"

using namespace evalexpr;

// Built-in faults carry no filename or location; the VM fills them in from
// the call instruction.
static llvm::Error builtinFault(const llvm::Twine& msg) {
    return makeFault(FaultKind::Type, "", SourceLoc(), msg);
}

static llvm::Expected<Value> builtinSin(llvm::ArrayRef<Value> args) {
    if (args.size() != 1)
        return builtinFault("sin expects 1 argument, got " + llvm::Twine(args.size()));
    if (!args[0].isNumeric())
        return builtinFault("sin expects a number, got " +
                            Value::kindName(args[0].getKind()));
    return Value::floating(std::sin(args[0].toDouble()));
}

void evalexpr::installBuiltins(Environment& env, llvm::raw_ostream& out) {
    env.bind("pi", Value::floating(llvm::numbers::pi));
    env.bind("e", Value::floating(llvm::numbers::e));
    env.bind("sin", Value::builtin("sin", builtinSin));

    llvm::raw_ostream* os = &out;
    env.bind("print", Value::builtin("print", [os](llvm::ArrayRef<Value> args) -> llvm::Expected<Value> {
        bool first = true;
        for (const Value& arg : args) {
            if (!first)
                *os << ' ';
            first = false;
            arg.print(*os);
        }
        *os << '\n';
        return Value::none();
    }));
}

Environment evalexpr::makeGlobalEnvironment(llvm::raw_ostream& out) {
    Environment env;
    installBuiltins(env, out);
    return env;
}
