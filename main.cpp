// main.cpp
//
// Headless NodeInterp runner. Parses CLI (CLI11), loads the JSON flow,
// evaluates the target node once (or --repeat times for timing), and prints
// the result as JSON on stdout. Updated parameters can be written back with
// --save-params so gizmo edits survive between runs.
#include "FlowLoader.hpp"
#include "Log.hpp"
#include "NodeInterpOps.hpp"
#include "NodeInterpRunner.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <string>

int main(int argc, char** argv) {
    std::string flowPath = "flows/translate_gizmo.json";
    std::string target;            // overrides the flow's target
    std::string paramsPath;        // extra parameter JSON merged over the flow's
    std::string gizmoMode = "off"; // off | out | inout
    std::string gizmoStatePath;    // prior gizmo state for inout
    std::string saveParamsPath;
    int repeat = 1;                // >1 prints a perf summary
    std::string logLevelName = "warn";
    bool listOps = false;

    CLI::App app{"NodeInterp"};
    try {
        app.add_option("--flow", flowPath, "Path to flow JSON file");
        app.add_option("--target", target, "Node to evaluate (defaults to the flow's target)");
        app.add_option("--params", paramsPath, "Parameter JSON merged over the flow's parameters");
        app.add_option("--gizmos", gizmoMode, "Gizmo mode: off|out|inout")
            ->check(CLI::IsMember({"off", "out", "inout"}));
        app.add_option("--gizmo-state", gizmoStatePath, "Prior gizmo state JSON (inout mode)");
        app.add_option("--save-params", saveParamsPath, "Write updated parameters to this file");
        app.add_option("--repeat", repeat, "Evaluate N times and print timing")->check(CLI::PositiveNumber);
        app.add_option("--log-level", logLevelName, "error|warn|info|debug|trace")
            ->check(CLI::IsMember({"error", "warn", "info", "debug", "trace"}));
        app.add_flag("--list-ops", listOps, "List registered operations and exit");
        app.allow_extras(false);
        app.set_config("--config");
        app.set_help_all_flag("--help-all", "Show all help");
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    NodeInterp::setLogLevel(NodeInterp::parseLogLevel(logLevelName));

    NodeInterp::OperationRegistry registry;
    NodeInterp::registerBuiltinOps(registry);

    if (listOps) {
        for (const auto& name : registry.names()) {
            const auto* def = registry.nodeDef(name);
            fmt::print("{:<12}{} {}\n", name, def->hasGizmo ? "[gizmo]" : "       ", def->description);
        }
        return 0;
    }

    try {
        NodeInterp::Flow flow = NodeInterp::loadFlowFile(flowPath);
        if (!paramsPath.empty()) {
            flow.parameters.merge(NodeInterp::parametersFromJson(NodeInterp::readJsonFile(paramsPath)));
        }
        if (target.empty()) {
            if (!flow.target) throw NodeInterp::FlowError("Flow has no target; pass --target");
            target = *flow.target;
        }

        NodeInterp::GizmoList gizmosIn = flow.gizmos;
        if (!gizmoStatePath.empty()) {
            gizmosIn = NodeInterp::gizmosFromJson(NodeInterp::readJsonFile(gizmoStatePath));
        }
        auto makeGizmoConfig = [&]() {
            if (gizmoMode == "inout") return NodeInterp::GizmoConfig::inOut(gizmosIn);
            if (gizmoMode == "out") return NodeInterp::GizmoConfig::outOnly();
            return NodeInterp::GizmoConfig::ignore();
        };

        NodeInterp::logInfo("NodeInterp: flow='{}' target={} gizmos={}", flowPath, target, gizmoMode);

        // Each pass starts from the loaded parameters; only the last result is kept
        NodeInterp::ProgramResult result;
        unsigned long long nsAccum = 0, nsMin = ~0ull, nsMax = 0;
        for (int i = 0; i < repeat; ++i) {
            result = NodeInterp::runGraph(flow.graph, target, flow.parameters, registry, makeGizmoConfig());
            unsigned long long ns = result.stats.evalTimeNs;
            nsAccum += ns;
            nsMin = std::min(nsMin, ns);
            nsMax = std::max(nsMax, ns);
        }

        fmt::print("{}\n", NodeInterp::resultToJson(result).dump(2));
        if (repeat > 1) {
            fmt::print(stderr, "perf: runs={} avg_ns={} min_ns={} max_ns={} nodes_per_run={}\n",
                       repeat, nsAccum / (unsigned long long)repeat, nsMin, nsMax, result.stats.nodesEvaluated);
        }
        if (!saveParamsPath.empty()) {
            NodeInterp::writeJsonFile(saveParamsPath, NodeInterp::parametersToJson(result.updatedValues));
            NodeInterp::logInfo("saved {} parameters to {}", result.updatedValues.size(), saveParamsPath);
        }
    } catch (const NodeInterp::EvalError& e) {
        NodeInterp::logError("{}: {}", NodeInterp::errorKindName(e.kind()), e.what());
        return 2;
    } catch (const std::exception& e) {
        NodeInterp::logError("{}", e.what());
        return 1;
    }
    return 0;
}
