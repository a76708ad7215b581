#pragma once
#include <stdexcept>
#include <string>

namespace PMACRO {

// Base of every error the interpreter raises. Anything thrown from an
// instruction handler aborts the run.
class MacroError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed instruction of a recognised opcode, or a goto to a missing checkpoint
class SyntaxError : public MacroError {
public:
    using MacroError::MacroError;
};

class NotFoundError : public MacroError {
public:
    using MacroError::MacroError;
};

class TypeError : public MacroError {
public:
    using MacroError::MacroError;
};

// Integer result does not fit in 64 bits
class OverflowError : public MacroError {
public:
    using MacroError::MacroError;
};

// Macro source could not be read
class FileError : public MacroError {
public:
    using MacroError::MacroError;
};

// Raised by the expression engine; never escapes evaluateCondition()
class ConditionError : public MacroError {
public:
    using MacroError::MacroError;
};

// Failure reported by an actuation/sensing provider
class AdapterError : public MacroError {
public:
    using MacroError::MacroError;
};

// Pointer parked in the top-left corner while actuation was requested
class FailSafeError : public AdapterError {
public:
    using AdapterError::AdapterError;
};

} // namespace PMACRO
