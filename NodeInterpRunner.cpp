// NodeInterpRunner.cpp
//
// Implements the recursive node executor and the graph runner entry point.
#include "NodeInterpRunner.hpp"
#include "Log.hpp"
#include <chrono>
#include <fmt/core.h>
#include <stdexcept>

namespace NodeInterp {

const char* gizmoModeName(GizmoConfig::Mode mode) {
    switch (mode) {
    case GizmoConfig::Mode::Ignore: return "off";
    case GizmoConfig::Mode::InOut: return "inout";
    case GizmoConfig::Mode::OutOnly: return "out";
    }
    return "?";
}

std::string Renderable::describe() const {
    return fmt::format("{} {}", valueTypeName(value), valueToString(value));
}

EvaluationContext::EvaluationContext(ExternalParameterValues& params, const OperationRegistry& ops,
                                     NodeId target, GizmoConfig config)
    : externalParamValues(params),
      nodeDefinitions(ops),
      targetNode(std::move(target)),
      gizmosEnabled(config.enabled()),
      gizmoConfig(std::move(config)) {}

namespace {

const char* hookResultShape(const HookResult& r) {
    switch (r.index()) {
    case 0: return "nothing";
    case 1: return "a single value";
    case 2: return "a mapping";
    default: return "a gizmo list";
    }
}

// Removes the node from the visiting set however runNode exits
struct VisitGuard {
    std::unordered_set<NodeId>& visiting;
    const NodeId& id;
    ~VisitGuard() { visiting.erase(id); }
};

} // namespace

void runNode(const Graph& graph, EvaluationContext& ctx, const NodeId& nodeId) {
    if (ctx.outputsCache.count(nodeId)) {
        ++ctx.stats.cacheHits;
        logTrace("cache hit for node {}", nodeId);
        return;
    }
    if (!ctx.visiting.insert(nodeId).second) {
        throw EvalError(ErrorKind::CycleDetected, nodeId, "",
                        fmt::format("Cycle detected in graph at node {}", nodeId));
    }
    VisitGuard guard{ctx.visiting, nodeId};

    const Node& node = graph.node(nodeId);
    const std::string& opName = node.opName;
    const OperationDef* nodeDef = ctx.nodeDefinitions.nodeDef(opName);
    if (!nodeDef) {
        throw EvalError(ErrorKind::UnknownOperation, nodeId, opName,
                        fmt::format("Node definition not found for {} (node {})", opName, nodeId));
    }

    // Arguments sent to this node's op
    ValueMap inputMap;
    for (const auto& input : node.inputs) {
        if (const auto* conn = std::get_if<Connection>(&input.kind)) {
            if (!graph.contains(conn->node)) {
                throw EvalError(ErrorKind::UnknownNode, conn->node, input.name,
                                fmt::format("Input '{}' of node {} is connected to missing node {}",
                                            input.name, nodeId, conn->node));
            }
            auto cached = ctx.outputsCache.find(conn->node);
            if (cached == ctx.outputsCache.end()) {
                runNode(graph, ctx, conn->node);
                cached = ctx.outputsCache.find(conn->node);
                if (cached == ctx.outputsCache.end()) {
                    throw std::logic_error("Cache should be populated after calling runNode");
                }
            } else {
                ++ctx.stats.cacheHits;
            }
            auto value = cached->second.find(conn->outputName);
            if (value == cached->second.end()) {
                throw EvalError(ErrorKind::MissingCachedOutput, conn->node, conn->outputName,
                                fmt::format("Node {} has no output '{}' (needed by input '{}' of node {})",
                                            conn->node, conn->outputName, input.name, nodeId));
            }
            inputMap[input.name] = value->second;
        } else {
            ExternalParameter ext(nodeId, input.name);
            const Value* val = ctx.externalParamValues.find(ext);
            if (!val) {
                throw EvalError(ErrorKind::MissingExternalParameter, nodeId, input.name,
                                fmt::format("Could not retrieve external parameter named '{}' from node {}",
                                            input.name, nodeId));
            }
            inputMap[input.name] = *val;
        }
    }

    const bool runGizmos = ctx.gizmosEnabled && nodeId == ctx.targetNode && nodeDef->hasGizmo;

    // Pre-gizmo: patch the input map from the previous round's gizmo state
    if (runGizmos && ctx.gizmoConfig.mode == GizmoConfig::Mode::InOut) {
        if (!nodeDef->preGizmo) {
            throw EvalError(ErrorKind::GizmoHookMissing, nodeId, "pre_gizmo",
                            fmt::format("Node with gizmo should have 'pre_gizmo' ({}, node {})", opName, nodeId));
        }
        logDebug("pre_gizmo {} on node {} with {} gizmos", opName, nodeId, ctx.gizmoConfig.gizmosIn.size());
        HookResult patched = nodeDef->preGizmo(inputMap, ctx.gizmoConfig.gizmosIn, ctx.externalParamValues, nodeId);
        ++ctx.stats.gizmoHooksRun;
        auto* newInputs = std::get_if<ValueMap>(&patched);
        if (!newInputs) {
            throw EvalError(ErrorKind::OperationContractViolation, nodeId, "pre_gizmo",
                            fmt::format("A node's pre_gizmo callback should return an updated parameter map, "
                                        "got {} ({}, node {})", hookResultShape(patched), opName, nodeId));
        }
        inputMap = std::move(*newInputs);
    }

    if (!nodeDef->op) {
        throw EvalError(ErrorKind::OperationContractViolation, nodeId, "op",
                        fmt::format("Node should always have an 'op' ({}, node {})", opName, nodeId));
    }
    logTrace("running node {} ({})", nodeId, opName);
    HookResult result = nodeDef->op(inputMap);
    ++ctx.stats.nodesEvaluated;
    auto* outputs = std::get_if<ValueMap>(&result);
    if (!outputs) {
        throw EvalError(ErrorKind::OperationContractViolation, nodeId, "op",
                        fmt::format("A node's op function should always return a mapping, got {} ({}, node {})",
                                    hookResultShape(result), opName, nodeId));
    }

    const ValueMap& stored = ctx.outputsCache.emplace(nodeId, std::move(*outputs)).first->second;

    // Post-gizmo: derive this round's gizmos. Replaces, never appends.
    if (runGizmos) {
        if (!nodeDef->postGizmo) {
            throw EvalError(ErrorKind::GizmoHookMissing, nodeId, "post_gizmo",
                            fmt::format("Node with gizmo should have 'post_gizmo' ({}, node {})", opName, nodeId));
        }
        logDebug("post_gizmo {} on node {}", opName, nodeId);
        HookResult gizmos = nodeDef->postGizmo(stored);
        ++ctx.stats.gizmoHooksRun;
        auto* list = std::get_if<GizmoList>(&gizmos);
        if (!list) {
            throw EvalError(ErrorKind::OperationContractViolation, nodeId, "post_gizmo",
                            fmt::format("A node's post_gizmo function should return a sequence of gizmos, "
                                        "got {} ({}, node {})", hookResultShape(gizmos), opName, nodeId));
        }
        ctx.gizmoOutputs = std::move(*list);
    }
}

ProgramResult runGraph(const Graph& graph, const NodeId& targetNode,
                       ExternalParameterValues externalParamValues,
                       const OperationRegistry& nodeDefinitions,
                       GizmoConfig gizmoConfig) {
    auto t0 = std::chrono::steady_clock::now();
    const Node& target = graph.node(targetNode);

    EvaluationContext ctx(externalParamValues, nodeDefinitions, targetNode, std::move(gizmoConfig));
    logDebug("running graph: target={} gizmos={}", targetNode, gizmoModeName(ctx.gizmoConfig.mode));

    // Ensure the outputs cache is populated
    runNode(graph, ctx, targetNode);

    auto cached = ctx.outputsCache.find(targetNode);
    if (cached == ctx.outputsCache.end()) {
        throw std::logic_error("Final node should be in the outputs cache");
    }

    ProgramResult result;
    if (target.returnValue) {
        auto out = cached->second.find(*target.returnValue);
        if (out == cached->second.end()) {
            throw EvalError(ErrorKind::MissingReturnOutput, targetNode, *target.returnValue,
                            fmt::format("Target node {} did not produce its return output '{}'",
                                        targetNode, *target.returnValue));
        }
        result.renderable = Renderable::fromValue(out->second);
    }
    if (ctx.gizmosEnabled) result.updatedGizmos = std::move(ctx.gizmoOutputs);

    auto t1 = std::chrono::steady_clock::now();
    ctx.stats.evalTimeNs = (unsigned long long)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
    result.stats = ctx.stats;
    result.updatedValues = std::move(externalParamValues);
    logDebug("pass done: {} nodes evaluated, {} cache hits, {} gizmo hooks, {} ns",
             result.stats.nodesEvaluated, result.stats.cacheHits, result.stats.gizmoHooksRun,
             result.stats.evalTimeNs);
    return result;
}

} // namespace NodeInterp
