// Flow file loading
//
// Reads graphs, parameter stores and gizmo state from JSON flow files and
// writes parameter stores and run results back out. This sits on top of the
// evaluator; the runner itself never touches files.
//
// Flow layout:
//   {
//     "target": "<node id>",                     (optional)
//     "nodes": [
//       {"id": "...", "op": "...", "return": "<output>",   (return optional)
//        "inputs": [{"name": "...", "from": {"node": "...", "output": "..."}},
//                   {"name": "...", "external": {"promoted": false}}]}
//     ],
//     "parameters": [{"node": "...", "name": "...", "value": <value>}],
//     "gizmos": [<value>, ...]                   (optional prior gizmo state)
//   }
// Values: integers -> int, other numbers -> double, booleans -> int,
// strings -> string, [x, y, z] -> vec3.
#pragma once
#include "NodeInterpCore.hpp"
#include "NodeInterpRunner.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace NodeInterp {

struct Flow {
    Graph graph;
    std::optional<NodeId> target;
    ExternalParameterValues parameters;
    GizmoList gizmos;
};

Value valueFromJson(const nlohmann::json& j);
nlohmann::json valueToJson(const Value& v);

ExternalParameterValues parametersFromJson(const nlohmann::json& j);
// Entries sorted by (node, name) so saved files diff cleanly
nlohmann::json parametersToJson(const ExternalParameterValues& params);

GizmoList gizmosFromJson(const nlohmann::json& j);
nlohmann::json gizmosToJson(const GizmoList& gizmos);

// Throws FlowError naming the offending element on malformed input
Flow loadFlowFromJson(const nlohmann::json& json);
// Looks for `path`, then ../path and ../../path, like the runtime always has
Flow loadFlowFile(const std::string& path);

nlohmann::json readJsonFile(const std::string& path);
void writeJsonFile(const std::string& path, const nlohmann::json& json);

nlohmann::json resultToJson(const ProgramResult& result);

} // namespace NodeInterp
