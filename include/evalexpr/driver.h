#ifndef EVALEXPR_DRIVER_H
#define EVALEXPR_DRIVER_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include "evalexpr/environment.h"
#include "evalexpr/interpreter_ctx.h"
#include "evalexpr/value.h"

namespace evalexpr {

/// Compiles source and runs it in a fresh environment seeded with the
/// built-ins. filename only labels faults. A compilation fault prevents
/// execution.
llvm::Expected<Value> compileAndRun(llvm::StringRef source, llvm::StringRef filename,
                                    const InterpreterContext& ctx);

/// Same, but runs against env, which the caller keeps after the run.
llvm::Expected<Value> compileAndRun(llvm::StringRef source, llvm::StringRef filename,
                                    Environment& env, const InterpreterContext& ctx);

/// Runs the program stored at path the way the command line tool does and
/// returns its exit status. A read error or a fault is reported on stderr
/// and gives 1. Otherwise the final value goes to result (when
/// ctx.printResult is set) and the status is 0.
int runFile(llvm::StringRef path, const InterpreterContext& ctx, llvm::raw_ostream& result);

} // end namespace evalexpr

#endif // EVALEXPR_DRIVER_H
