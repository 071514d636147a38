#ifndef EVALEXPR_INSTRUCTION_H
#define EVALEXPR_INSTRUCTION_H

#include <cstddef>
#include <limits>
#include <string>
#include <variant>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include "evalexpr/fault.h"
#include "evalexpr/value.h"

namespace evalexpr {

enum class BinaryOpKind {
    Add, Sub, Mul, Div,
    Lt, Le, Gt, Ge, Eq, Ne,
    ListAppend,
    Call
};

llvm::StringRef binaryOpName(BinaryOpKind op);

//===----------------------------------------------------------------------===//
// Instructions
//===----------------------------------------------------------------------===//
// One struct per opcode. Jump targets are tape indices.

struct PushConst { Value value; };
struct LoadVar { std::string name; };
struct PushVarName { std::string name; };
struct Negate {};
struct BinaryOp { BinaryOpKind op; };
struct Assign {};
struct Discard {};
struct MakeEmptyList {};
struct JumpIfFalse { size_t target; };
struct Jump { size_t target; };

using Instruction = std::variant<PushConst, LoadVar, PushVarName, Negate, BinaryOp,
                                 Assign, Discard, MakeEmptyList, JumpIfFalse, Jump>;

bool isIdentical(const Instruction& lhs, const Instruction& rhs);
void printInstruction(llvm::raw_ostream& os, const Instruction& inst);

/// Tape - the compiled program: a flat instruction sequence plus, for every
/// instruction, the location of the token that produced it.
class Tape {
public:
    /// Target written into forward jumps until they are patched.
    static constexpr size_t UnpatchedTarget = std::numeric_limits<size_t>::max();

    /// Appends inst and returns its index. The index, not a reference, is
    /// the handle used for back-patching.
    size_t emit(Instruction inst, SourceLoc loc = SourceLoc());

    /// Overwrites the target of the jump at index.
    void patchTarget(size_t index, size_t target);

    size_t size() const { return code.size(); }
    bool empty() const { return code.empty(); }
    const Instruction& operator[](size_t index) const { return code[index]; }
    SourceLoc getLoc(size_t index) const { return locs[index]; }

    std::vector<Instruction>::const_iterator begin() const { return code.begin(); }
    std::vector<Instruction>::const_iterator end() const { return code.end(); }

    void print(llvm::raw_ostream& os) const;

    bool operator==(const Tape& other) const;
    bool operator!=(const Tape& other) const { return !(*this == other); }

private:
    std::vector<Instruction> code;
    std::vector<SourceLoc> locs;
};

} // end namespace evalexpr

#endif // EVALEXPR_INSTRUCTION_H
