#include <cassert>

#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/Format.h"

#include "evalexpr/instruction.h"

using namespace evalexpr;

llvm::StringRef evalexpr::binaryOpName(BinaryOpKind op) {
    switch (op) {
    case BinaryOpKind::Add:        return "add";
    case BinaryOpKind::Sub:        return "sub";
    case BinaryOpKind::Mul:        return "mul";
    case BinaryOpKind::Div:        return "div";
    case BinaryOpKind::Lt:         return "lt";
    case BinaryOpKind::Le:         return "le";
    case BinaryOpKind::Gt:         return "gt";
    case BinaryOpKind::Ge:         return "ge";
    case BinaryOpKind::Eq:         return "eq";
    case BinaryOpKind::Ne:         return "ne";
    case BinaryOpKind::ListAppend: return "listAppend";
    case BinaryOpKind::Call:       return "call";
    }
    llvm_unreachable("unknown binary op");
}

namespace {

struct InstructionPrinter {
    llvm::raw_ostream& os;

    void operator()(const PushConst& inst) { os << "PushConst " << inst.value; }
    void operator()(const LoadVar& inst) { os << "LoadVar " << inst.name; }
    void operator()(const PushVarName& inst) { os << "PushVarName " << inst.name; }
    void operator()(const Negate&) { os << "Negate"; }
    void operator()(const BinaryOp& inst) { os << "BinaryOp " << binaryOpName(inst.op); }
    void operator()(const Assign&) { os << "Assign"; }
    void operator()(const Discard&) { os << "Discard"; }
    void operator()(const MakeEmptyList&) { os << "MakeEmptyList"; }
    void operator()(const JumpIfFalse& inst) { printJump("JumpIfFalse", inst.target); }
    void operator()(const Jump& inst) { printJump("Jump", inst.target); }

    void printJump(llvm::StringRef mnemonic, size_t target) {
        os << mnemonic << ' ';
        if (target == Tape::UnpatchedTarget)
            os << "<unpatched>";
        else
            os << target;
    }
};

} // end anonymous namespace

void evalexpr::printInstruction(llvm::raw_ostream& os, const Instruction& inst) {
    std::visit(InstructionPrinter{os}, inst);
}

bool evalexpr::isIdentical(const Instruction& lhs, const Instruction& rhs) {
    if (lhs.index() != rhs.index())
        return false;
    if (auto* l = std::get_if<PushConst>(&lhs))
        return l->value.isIdenticalTo(std::get<PushConst>(rhs).value);
    if (auto* l = std::get_if<LoadVar>(&lhs))
        return l->name == std::get<LoadVar>(rhs).name;
    if (auto* l = std::get_if<PushVarName>(&lhs))
        return l->name == std::get<PushVarName>(rhs).name;
    if (auto* l = std::get_if<BinaryOp>(&lhs))
        return l->op == std::get<BinaryOp>(rhs).op;
    if (auto* l = std::get_if<JumpIfFalse>(&lhs))
        return l->target == std::get<JumpIfFalse>(rhs).target;
    if (auto* l = std::get_if<Jump>(&lhs))
        return l->target == std::get<Jump>(rhs).target;
    return true;  // operand-less opcodes
}

size_t Tape::emit(Instruction inst, SourceLoc loc) {
    code.push_back(std::move(inst));
    locs.push_back(loc);
    return code.size() - 1;
}

void Tape::patchTarget(size_t index, size_t target) {
    assert(index < code.size() && "patching past the end of the tape");
    if (auto* jf = std::get_if<JumpIfFalse>(&code[index]))
        jf->target = target;
    else if (auto* j = std::get_if<Jump>(&code[index]))
        j->target = target;
    else
        llvm_unreachable("patching a non-jump instruction");
}

void Tape::print(llvm::raw_ostream& os) const {
    for (size_t i = 0, e = code.size(); i != e; ++i) {
        os << llvm::format("%4zu  ", i);
        printInstruction(os, code[i]);
        if (locs[i].isValid())
            os << "    ; " << locs[i].row << ':' << locs[i].col;
        os << '\n';
    }
}

bool Tape::operator==(const Tape& other) const {
    if (code.size() != other.code.size())
        return false;
    for (size_t i = 0, e = code.size(); i != e; ++i)
        if (!isIdentical(code[i], other.code[i]) || locs[i] != other.locs[i])
            return false;
    return true;
}
