#ifndef EVALEXPR_VM_H
#define EVALEXPR_VM_H

#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include "evalexpr/environment.h"
#include "evalexpr/instruction.h"
#include "evalexpr/value.h"

namespace evalexpr {

/// VirtualMachine - executes a finished tape against an operand stack and
/// the caller's environment.
///
/// The machine keeps no state between runs: the operand stack and program
/// counter live inside run(), and the environment is owned by the caller.
class VirtualMachine {
public:
    /// filename is only used to label runtime faults. Every executed
    /// instruction is logged to trace.
    explicit VirtualMachine(llvm::StringRef filename, llvm::raw_ostream& trace = llvm::nulls())
        : filename(filename.str()), trace(trace) {}

    /// Runs tape to completion. The single value left on the stack is the
    /// result; a fault aborts the run and no partial result is returned.
    llvm::Expected<Value> run(const Tape& tape, Environment& env);

private:
    std::string filename;
    llvm::raw_ostream& trace;
};

/// Operand combination behind BinaryOp and Negate. lhs is the operand pushed
/// first. Faults carry neither filename nor location.
llvm::Expected<Value> applyBinary(BinaryOpKind op, const Value& lhs, const Value& rhs);
llvm::Expected<Value> applyNegate(const Value& operand);

} // end namespace evalexpr

#endif // EVALEXPR_VM_H
