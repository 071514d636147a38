#ifndef EVALEXPR_INTERPRETER_CONTEXT_H
#define EVALEXPR_INTERPRETER_CONTEXT_H

#include "llvm/Support/raw_ostream.h"

namespace evalexpr {

class InterpreterContext {
public:
    llvm::raw_ostream* out = &llvm::outs();  // where the print built-in writes
    bool dumpTape = false;                   // print the compiled tape to stderr before running
    bool trace = false;                      // log every executed instruction to stderr
    bool printResult = true;                 // runFile writes the final value
};

} // end namespace evalexpr

#endif
