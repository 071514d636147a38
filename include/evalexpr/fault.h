#ifndef EVALEXPR_FAULT_H
#define EVALEXPR_FAULT_H

#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

namespace evalexpr {

/// Row/column of a character in the source text. Both are 1-based; a
/// default-constructed location means "unknown".
struct SourceLoc {
    unsigned row = 0;
    unsigned col = 0;

    bool isValid() const { return row != 0; }
    bool operator==(const SourceLoc& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const SourceLoc& other) const { return !(*this == other); }
};

enum class FaultKind {
    Lexical,       // unrecognized character sequence
    Syntax,        // unexpected or missing token
    Name,          // unbound variable
    MalformedTape, // instruction with no defined stack effect
    Type,          // operand of the wrong kind
    Arithmetic     // division by zero, integer overflow
};

llvm::StringRef faultKindName(FaultKind kind);

/// Fault - the single error payload of the compiler and the VM.
///
/// Faults travel as llvm::Error values, so callers inspect them with
/// llvm::handleErrors / llvm::errorToFaultKind rather than catching.
class Fault : public llvm::ErrorInfo<Fault> {
public:
    static char ID;

    Fault(FaultKind kind, std::string filename, SourceLoc loc, std::string msg,
          std::string snippet = "")
        : kind(kind), filename(std::move(filename)), loc(loc), msg(std::move(msg)),
          snippet(std::move(snippet)) {}

    FaultKind getKind() const { return kind; }
    const std::string& getFilename() const { return filename; }
    SourceLoc getLoc() const { return loc; }
    const std::string& getMessage() const { return msg; }
    const std::string& getSnippet() const { return snippet; }

    /// <filename>:<row>:<col>:<message>, or <filename>:<message> when the
    /// location is unknown.
    std::string message() const override;
    void log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

private:
    FaultKind kind;
    std::string filename;
    SourceLoc loc;
    std::string msg;
    std::string snippet;
};

inline llvm::Error makeFault(FaultKind kind, llvm::StringRef filename, SourceLoc loc,
                             const llvm::Twine& msg) {
    return llvm::make_error<Fault>(kind, filename.str(), loc, msg.str());
}

/// Consumes err and returns the kind of the Fault it holds. err must hold a
/// Fault.
FaultKind errorToFaultKind(llvm::Error err);

} // end namespace evalexpr

#endif // EVALEXPR_FAULT_H
