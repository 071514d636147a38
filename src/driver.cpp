#include "llvm/Support/MemoryBuffer.h"

#include "evalexpr/driver.h"
#include "evalexpr/log.h"
#include "evalexpr/parser.h"
#include "evalexpr/vm.h"

using namespace evalexpr;

llvm::Expected<Value> evalexpr::compileAndRun(llvm::StringRef source, llvm::StringRef filename,
                                              Environment& env, const InterpreterContext& ctx) {
    llvm::Expected<Tape> tape = compile(source, filename);
    if (!tape)
        return tape.takeError();

    if (ctx.dumpTape) {
        logNote("compiled tape for " + filename);
        tape->print(llvm::errs());
    }

    VirtualMachine vm(filename, traceStream(ctx.trace));
    return vm.run(*tape, env);
}

llvm::Expected<Value> evalexpr::compileAndRun(llvm::StringRef source, llvm::StringRef filename,
                                              const InterpreterContext& ctx) {
    Environment env = makeGlobalEnvironment(*ctx.out);
    return compileAndRun(source, filename, env, ctx);
}

int evalexpr::runFile(llvm::StringRef path, const InterpreterContext& ctx,
                      llvm::raw_ostream& result) {
    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> fileOrErr =
        llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
    if (std::error_code ec = fileOrErr.getError()) {
        logError("cannot read '" + path + "': " + ec.message());
        return 1;
    }

    llvm::Expected<Value> value = compileAndRun((*fileOrErr)->getBuffer(), path, ctx);
    if (!value) {
        logFault(value.takeError());
        return 1;
    }

    if (ctx.printResult)
        result << *value << "\n";
    return 0;
}
