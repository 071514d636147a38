#ifndef EVALEXPR_LOG_H
#define EVALEXPR_LOG_H

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

// log* - These are little helper functions for diagnostics. Everything goes
// to stderr; program output from print goes elsewhere.
namespace evalexpr {

void logError(const llvm::Twine& msg);
void logNote(const llvm::Twine& msg);

/// Reports every fault held by err and consumes it.
void logFault(llvm::Error err);

/// The stream VM traces and tape dumps are written to: stderr when enabled,
/// a null stream otherwise.
llvm::raw_ostream& traceStream(bool enabled);

} // end namespace evalexpr

#endif // EVALEXPR_LOG_H
