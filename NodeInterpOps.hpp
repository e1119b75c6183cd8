// NodeInterp operations
//
// Operations are the behavior behind a node's op name. They are registered
// once at startup in an OperationRegistry and looked up by name during
// evaluation, so new node kinds can be added without touching the evaluator.
//
// Invocation protocol:
//   op(inputs)                                -> ValueMap of outputs
//   preGizmo(inputs, gizmosIn, params, node)  -> replacement ValueMap of inputs
//   postGizmo(outputs)                        -> GizmoList
// Callables hand back a HookResult; returning any other shape than the one
// listed is a contract violation reported by the evaluator.
#pragma once
#include "NodeInterpCore.hpp"
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace NodeInterp {

// Whatever an operation callable produced. std::monostate means "nothing".
using HookResult = std::variant<std::monostate, Value, ValueMap, GizmoList>;

using OpFn = std::function<HookResult(const ValueMap& inputs)>;
// `params` is the pass's parameter store; hooks may write edited values back.
using PreGizmoFn = std::function<HookResult(const ValueMap& inputs, const GizmoList& gizmosIn,
                                            ExternalParameterValues& params, const NodeId& nodeId)>;
using PostGizmoFn = std::function<HookResult(const ValueMap& outputs)>;

struct OperationDef {
    std::string name;
    OpFn op;
    // When set, the evaluator runs the hooks below for the target node
    bool hasGizmo = false;
    PreGizmoFn preGizmo;
    PostGizmoFn postGizmo;
    std::string description;
};

class OperationRegistry {
public:
    // Adds or replaces the definition registered under def.name
    void registerOp(OperationDef def);
    // Convenience for plain operations without gizmos
    void registerOp(const std::string& name, OpFn op, const std::string& description = "");

    // nullptr if no operation of that name is registered
    const OperationDef* nodeDef(const std::string& name) const;
    bool contains(const std::string& name) const { return defs.count(name) != 0; }
    size_t size() const { return defs.size(); }
    // Registered names in sorted order
    std::vector<std::string> names() const;

private:
    std::map<std::string, OperationDef> defs;
};

// Value, Add, Multiply, MakeVector, Echo and the gizmo-enabled Translate
void registerBuiltinOps(OperationRegistry& registry);

} // namespace NodeInterp
