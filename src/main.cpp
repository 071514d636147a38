#include "llvm/Support/CommandLine.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

#include "evalexpr/driver.h"
#include "evalexpr/interpreter_ctx.h"

static llvm::cl::opt<std::string> InputFilename(llvm::cl::Positional,
                                                llvm::cl::desc("<input file>"),
                                                llvm::cl::Required);

static llvm::cl::opt<bool> DumpTape("dump-tape",
                                    llvm::cl::desc("Print the compiled tape before running it"));

static llvm::cl::opt<bool> Trace("trace",
                                 llvm::cl::desc("Log every executed instruction to stderr"));

static llvm::cl::opt<bool> NoResult("no-result",
                                    llvm::cl::desc("Do not print the program's final value"));

//===----------------------------------------------------------------------===//
// Main driver code.
//===----------------------------------------------------------------------===//

int main(int argc, char** argv) {
    llvm::InitLLVM X(argc, argv);
    llvm::cl::ParseCommandLineOptions(argc, argv, "evalexpr - expression language interpreter\n");

    evalexpr::InterpreterContext ctx;
    ctx.dumpTape = DumpTape;
    ctx.trace = Trace;
    ctx.printResult = !NoResult;

    return evalexpr::runFile(InputFilename, ctx, llvm::outs());
}
