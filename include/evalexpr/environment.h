#ifndef EVALEXPR_ENVIRONMENT_H
#define EVALEXPR_ENVIRONMENT_H

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include "evalexpr/value.h"

namespace evalexpr {

/// Environment - the single global name -> value mapping of one program run.
/// There are no nested scopes; assignment rebinds in place.
class Environment {
public:
    /// Returns the bound value, or nullptr when name is unbound.
    const Value* lookup(llvm::StringRef name) const {
        auto it = bindings.find(name);
        return it == bindings.end() ? nullptr : &it->second;
    }

    void bind(llvm::StringRef name, Value value) {
        bindings[name] = std::move(value);
    }

    bool contains(llvm::StringRef name) const { return bindings.count(name) != 0; }
    size_t size() const { return bindings.size(); }

private:
    llvm::StringMap<Value> bindings;
};

/// Binds pi, e, sin and print. print writes to out.
void installBuiltins(Environment& env, llvm::raw_ostream& out);

/// A fresh environment seeded with the built-ins.
Environment makeGlobalEnvironment(llvm::raw_ostream& out);

} // end namespace evalexpr

#endif // EVALEXPR_ENVIRONMENT_H
