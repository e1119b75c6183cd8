// NodeInterp graph runner
//
// One evaluation pass walks the graph depth-first from a target node,
// running each required node exactly once and caching its outputs. When
// gizmos are enabled, the target's operation is wrapped by its pre_gizmo hook
// (which may rewrite the inputs from the previous round's gizmo state) and its
// post_gizmo hook (which derives the gizmos to show for this round).
//
// Evaluation is single-threaded and synchronous. The graph must be acyclic;
// a cycle is reported as CycleDetected instead of recursing forever.
#pragma once
#include "NodeInterpCore.hpp"
#include "NodeInterpErrors.hpp"
#include "NodeInterpOps.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace NodeInterp {

struct GizmoConfig {
    enum class Mode {
        Ignore,  // no hooks run, result carries no gizmos
        InOut,   // pre_gizmo gets gizmosIn, then post_gizmo runs
        OutOnly  // only post_gizmo runs
    };

    Mode mode = Mode::Ignore;
    // Previous round's gizmo state; only read in InOut mode
    GizmoList gizmosIn;

    static GizmoConfig ignore() { return GizmoConfig{}; }
    static GizmoConfig inOut(GizmoList gizmos) { return GizmoConfig{Mode::InOut, std::move(gizmos)}; }
    static GizmoConfig outOnly() { return GizmoConfig{Mode::OutOnly, {}}; }

    bool enabled() const { return mode != Mode::Ignore; }
};

const char* gizmoModeName(GizmoConfig::Mode mode);

// What the caller displays for the target node
struct Renderable {
    Value value;

    static Renderable fromValue(const Value& v) { return Renderable{v}; }
    std::string describe() const;
};

// Per-pass counters, in the spirit of the engine's perf stats
struct RunStats {
    unsigned long long nodesEvaluated = 0;
    unsigned long long cacheHits = 0;
    unsigned long long gizmoHooksRun = 0;
    unsigned long long evalTimeNs = 0;
};

struct ProgramResult {
    std::optional<Renderable> renderable;
    // Present iff gizmos were enabled for the pass
    std::optional<GizmoList> updatedGizmos;
    ExternalParameterValues updatedValues;
    RunStats stats;
};

// Mutable state of one pass. Owned by the call driving the pass and handed
// by reference through the recursive executor.
struct EvaluationContext {
    EvaluationContext(ExternalParameterValues& params, const OperationRegistry& ops,
                      NodeId target, GizmoConfig config);

    std::unordered_map<NodeId, ValueMap> outputsCache;
    // Borrowed for the pass; pre_gizmo hooks may write into it
    ExternalParameterValues& externalParamValues;
    const OperationRegistry& nodeDefinitions;
    NodeId targetNode;
    bool gizmosEnabled = false;
    GizmoConfig gizmoConfig;
    GizmoList gizmoOutputs;
    // Nodes whose inputs are being resolved; reaching one again means a cycle
    std::unordered_set<NodeId> visiting;
    RunStats stats;
};

// Runs one pass rooted at `targetNode` and packages the result. The parameter
// store is moved in and returned, possibly edited, in the result.
ProgramResult runGraph(const Graph& graph, const NodeId& targetNode,
                       ExternalParameterValues externalParamValues,
                       const OperationRegistry& nodeDefinitions,
                       GizmoConfig gizmoConfig);

// Makes sure `nodeId`'s outputs are in ctx.outputsCache, running it and any
// unmet dependencies first.
void runNode(const Graph& graph, EvaluationContext& ctx, const NodeId& nodeId);

} // namespace NodeInterp
