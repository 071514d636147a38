#include "evalexpr/fault.h"

#include "llvm/Support/ErrorHandling.h"

using namespace evalexpr;

char Fault::ID = 0;

llvm::StringRef evalexpr::faultKindName(FaultKind kind) {
    switch (kind) {
    case FaultKind::Lexical:       return "lexical fault";
    case FaultKind::Syntax:        return "syntax fault";
    case FaultKind::Name:          return "name fault";
    case FaultKind::MalformedTape: return "malformed tape";
    case FaultKind::Type:          return "type fault";
    case FaultKind::Arithmetic:    return "arithmetic fault";
    }
    llvm_unreachable("unknown fault kind");
}

std::string Fault::message() const {
    std::string out;
    llvm::raw_string_ostream os(out);
    log(os);
    return os.str();
}

void Fault::log(llvm::raw_ostream& os) const {
    os << filename << ':';
    if (loc.isValid())
        os << loc.row << ':' << loc.col << ':';
    os << msg;
}

std::error_code Fault::convertToErrorCode() const {
    return llvm::inconvertibleErrorCode();
}

FaultKind evalexpr::errorToFaultKind(llvm::Error err) {
    FaultKind kind = FaultKind::MalformedTape;
    llvm::handleAllErrors(std::move(err), [&](const Fault& f) { kind = f.getKind(); });
    return kind;
}
