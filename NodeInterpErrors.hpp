// NodeInterp errors
//
// Every evaluation failure aborts the pass and is thrown as an EvalError
// carrying the offending node (and parameter or output name, when there is
// one). Flow file problems are FlowErrors. Both are std::runtime_error so a
// caller that only wants the message can catch that.
#pragma once
#include <stdexcept>
#include <string>

namespace NodeInterp {

enum class ErrorKind {
    UnknownOperation,
    UnknownNode,
    MissingExternalParameter,
    MissingCachedOutput,
    GizmoHookMissing,
    OperationContractViolation,
    MissingReturnOutput,
    CycleDetected,
};

const char* errorKindName(ErrorKind kind);

class EvalError : public std::runtime_error {
public:
    EvalError(ErrorKind kind, std::string nodeId, std::string name, const std::string& message);

    ErrorKind kind() const { return errorKind; }
    const std::string& nodeId() const { return node; }
    // Parameter, output or hook name involved; empty when not applicable
    const std::string& name() const { return detail; }

private:
    ErrorKind errorKind;
    std::string node;
    std::string detail;
};

class FlowError : public std::runtime_error {
public:
    explicit FlowError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace NodeInterp
