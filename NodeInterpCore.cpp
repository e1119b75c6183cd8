// NodeInterpCore.cpp
//
// Implements value helpers, the graph index, the parameter store and the
// error types shared by the evaluator and the flow loader.
#include "NodeInterpCore.hpp"
#include "NodeInterpErrors.hpp"
#include <fmt/core.h>
#include <type_traits>

namespace NodeInterp {

std::string valueToString(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + x + "\"";
        } else if constexpr (std::is_same_v<T, Vec3>) {
            return fmt::format("({}, {}, {})", x.x, x.y, x.z);
        } else {
            return fmt::format("{}", x);
        }
    }, v);
}

const char* valueTypeName(const Value& v) {
    if (std::holds_alternative<int>(v)) return "int";
    if (std::holds_alternative<float>(v)) return "float";
    if (std::holds_alternative<double>(v)) return "double";
    if (std::holds_alternative<std::string>(v)) return "string";
    return "vec3";
}

std::optional<double> valueAsDouble(const Value& v) {
    if (std::holds_alternative<int>(v)) return (double)std::get<int>(v);
    if (std::holds_alternative<float>(v)) return (double)std::get<float>(v);
    if (std::holds_alternative<double>(v)) return std::get<double>(v);
    return std::nullopt;
}

void Graph::addNode(Node node) {
    if (nodeIndex.count(node.id)) {
        throw FlowError(fmt::format("Duplicate node id '{}'", node.id));
    }
    nodeIndex.emplace(node.id, nodeList.size());
    nodeList.push_back(std::move(node));
}

const Node& Graph::node(const NodeId& id) const {
    auto it = nodeIndex.find(id);
    if (it == nodeIndex.end()) {
        throw EvalError(ErrorKind::UnknownNode, id, "",
                        fmt::format("Node '{}' does not exist in the graph", id));
    }
    return nodeList[it->second];
}

void ExternalParameterValues::merge(const ExternalParameterValues& other) {
    for (const auto& [key, value] : other.values) values[key] = value;
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnknownOperation: return "UnknownOperation";
    case ErrorKind::UnknownNode: return "UnknownNode";
    case ErrorKind::MissingExternalParameter: return "MissingExternalParameter";
    case ErrorKind::MissingCachedOutput: return "MissingCachedOutput";
    case ErrorKind::GizmoHookMissing: return "GizmoHookMissing";
    case ErrorKind::OperationContractViolation: return "OperationContractViolation";
    case ErrorKind::MissingReturnOutput: return "MissingReturnOutput";
    case ErrorKind::CycleDetected: return "CycleDetected";
    }
    return "Unknown";
}

EvalError::EvalError(ErrorKind kind, std::string nodeId, std::string name, const std::string& message)
    : std::runtime_error(message), errorKind(kind), node(std::move(nodeId)), detail(std::move(name)) {}

} // namespace NodeInterp
