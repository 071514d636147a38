#include <variant>
#include <vector>

#include "llvm/Support/Format.h"

#include "evalexpr/fault.h"
#include "evalexpr/vm.h"

using namespace evalexpr;

namespace {

/// The left side of an assignment: a name, not a value.
struct VarName {
    std::string name;
};

using StackSlot = std::variant<Value, VarName>;

/// Executor - the state of one run. Each operator() performs the stack effect
/// of one opcode; a taken jump sets nextPc.
class Executor {
public:
    Executor(const Tape& tape, Environment& env, llvm::StringRef filename,
             llvm::raw_ostream& trace)
        : tape(tape), env(env), filename(filename), trace(trace) {}

    llvm::Expected<Value> run();

    llvm::Error operator()(const PushConst& inst);
    llvm::Error operator()(const LoadVar& inst);
    llvm::Error operator()(const PushVarName& inst);
    llvm::Error operator()(const Negate& inst);
    llvm::Error operator()(const BinaryOp& inst);
    llvm::Error operator()(const Assign& inst);
    llvm::Error operator()(const Discard& inst);
    llvm::Error operator()(const MakeEmptyList& inst);
    llvm::Error operator()(const JumpIfFalse& inst);
    llvm::Error operator()(const Jump& inst);

private:
    const Tape& tape;
    Environment& env;
    llvm::StringRef filename;
    llvm::raw_ostream& trace;

    std::vector<StackSlot> stack;
    size_t pc = 0;
    size_t nextPc = 0;

    llvm::Error fault(FaultKind kind, const llvm::Twine& msg) {
        return makeFault(kind, filename, tape.getLoc(pc), msg);
    }
    /// Gives faults raised by operations and built-ins the position of the
    /// current instruction.
    llvm::Error locate(llvm::Error err);

    llvm::Expected<Value> popValue();
    llvm::Expected<std::string> popName();
    llvm::Error jumpTo(size_t target);
};

} // end anonymous namespace

llvm::Error Executor::locate(llvm::Error err) {
    return llvm::handleErrors(std::move(err), [&](const Fault& f) -> llvm::Error {
        if (f.getLoc().isValid() && !f.getFilename().empty())
            return llvm::make_error<Fault>(f);
        return llvm::make_error<Fault>(f.getKind(), filename.str(), tape.getLoc(pc),
                                       f.getMessage(), f.getSnippet());
    });
}

llvm::Expected<Value> Executor::popValue() {
    if (stack.empty())
        return fault(FaultKind::MalformedTape, "operand stack underflow");
    if (auto* name = std::get_if<VarName>(&stack.back()))
        return fault(FaultKind::MalformedTape,
                     "expected a value on the stack, found the name '" + name->name + "'");
    Value v = std::move(std::get<Value>(stack.back()));
    stack.pop_back();
    return std::move(v);
}

llvm::Expected<std::string> Executor::popName() {
    if (stack.empty())
        return fault(FaultKind::MalformedTape, "operand stack underflow");
    auto* name = std::get_if<VarName>(&stack.back());
    if (!name)
        return fault(FaultKind::MalformedTape, "expected a variable name on the stack");
    std::string result = std::move(name->name);
    stack.pop_back();
    return std::move(result);
}

llvm::Error Executor::jumpTo(size_t target) {
    if (target > tape.size())
        return fault(FaultKind::MalformedTape,
                     "jump target " + llvm::Twine(target) + " is outside the tape");
    nextPc = target;
    return llvm::Error::success();
}

llvm::Error Executor::operator()(const PushConst& inst) {
    stack.emplace_back(inst.value);
    return llvm::Error::success();
}

llvm::Error Executor::operator()(const LoadVar& inst) {
    const Value* v = env.lookup(inst.name);
    if (!v)
        return fault(FaultKind::Name, "name '" + inst.name + "' is not defined");
    stack.emplace_back(*v);
    return llvm::Error::success();
}

llvm::Error Executor::operator()(const PushVarName& inst) {
    stack.emplace_back(VarName{inst.name});
    return llvm::Error::success();
}

llvm::Error Executor::operator()(const Negate&) {
    llvm::Expected<Value> operand = popValue();
    if (!operand)
        return operand.takeError();
    llvm::Expected<Value> result = applyNegate(*operand);
    if (!result)
        return locate(result.takeError());
    stack.emplace_back(std::move(*result));
    return llvm::Error::success();
}

llvm::Error Executor::operator()(const BinaryOp& inst) {
    llvm::Expected<Value> rhs = popValue();
    if (!rhs)
        return rhs.takeError();
    llvm::Expected<Value> lhs = popValue();
    if (!lhs)
        return lhs.takeError();
    llvm::Expected<Value> result = applyBinary(inst.op, *lhs, *rhs);
    if (!result)
        return locate(result.takeError());
    stack.emplace_back(std::move(*result));
    return llvm::Error::success();
}

llvm::Error Executor::operator()(const Assign&) {
    llvm::Expected<Value> value = popValue();
    if (!value)
        return value.takeError();
    llvm::Expected<std::string> name = popName();
    if (!name)
        return name.takeError();
    env.bind(*name, *value);
    // Assignment is an expression: its value stays on the stack.
    stack.emplace_back(std::move(*value));
    return llvm::Error::success();
}

llvm::Error Executor::operator()(const Discard&) {
    llvm::Expected<Value> value = popValue();
    if (!value)
        return value.takeError();
    return llvm::Error::success();
}

llvm::Error Executor::operator()(const MakeEmptyList&) {
    stack.emplace_back(Value::list({}));
    return llvm::Error::success();
}

llvm::Error Executor::operator()(const JumpIfFalse& inst) {
    llvm::Expected<Value> cond = popValue();
    if (!cond)
        return cond.takeError();
    if (!cond->isTruthy())
        return jumpTo(inst.target);
    return llvm::Error::success();
}

llvm::Error Executor::operator()(const Jump& inst) {
    return jumpTo(inst.target);
}

llvm::Expected<Value> Executor::run() {
    while (pc < tape.size()) {
        nextPc = pc + 1;
        trace << llvm::format("%4zu  ", pc);
        printInstruction(trace, tape[pc]);
        trace << "    [stack " << stack.size() << "]\n";

        if (llvm::Error err = std::visit(*this, tape[pc]))
            return std::move(err);
        pc = nextPc;
    }

    if (stack.size() != 1) {
        pc = tape.empty() ? 0 : tape.size() - 1;
        SourceLoc loc = tape.empty() ? SourceLoc() : tape.getLoc(pc);
        return makeFault(FaultKind::MalformedTape, filename, loc,
                         "tape finished with " + llvm::Twine(stack.size()) +
                             " entries on the stack, expected 1");
    }
    if (std::holds_alternative<VarName>(stack.back()))
        return makeFault(FaultKind::MalformedTape, filename, tape.getLoc(tape.size() - 1),
                         "tape finished with a variable name as its result");
    return std::move(std::get<Value>(stack.back()));
}

llvm::Expected<Value> VirtualMachine::run(const Tape& tape, Environment& env) {
    Executor executor(tape, env, filename, trace);
    return executor.run();
}
