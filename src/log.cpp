#include "llvm/Support/WithColor.h"

#include "evalexpr/fault.h"
#include "evalexpr/log.h"

namespace evalexpr {

void logError(const llvm::Twine& msg) {
    llvm::WithColor::error(llvm::errs()) << msg << "\n";
}

void logNote(const llvm::Twine& msg) {
    llvm::WithColor::note(llvm::errs()) << msg << "\n";
}

void logFault(llvm::Error err) {
    llvm::handleAllErrors(std::move(err),
        [](const Fault& f) {
            llvm::errs() << f.message() << "\n";
        },
        [](const llvm::ErrorInfoBase& e) {
            logError(e.message());
        });
}

llvm::raw_ostream& traceStream(bool enabled) {
    return enabled ? llvm::errs() : llvm::nulls();
}

}
