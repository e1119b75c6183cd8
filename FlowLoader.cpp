// FlowLoader.cpp
//
// JSON <-> graph, parameter and gizmo conversion for flow files.
#include "FlowLoader.hpp"
#include "Log.hpp"
#include <algorithm>
#include <cstdint>
#include <fmt/core.h>
#include <fstream>
#include <limits>
#include <type_traits>
#include <vector>

namespace NodeInterp {

Value valueFromJson(const nlohmann::json& j) {
    // Use the actual JSON type; booleans become 0/1 ints
    if (j.is_string()) return j.get<std::string>();
    if (j.is_boolean()) return j.get<bool>() ? 1 : 0;
    // Integers that do not fit an int are kept as double
    if (j.is_number_unsigned()) {
        auto u = j.get<std::uint64_t>();
        if (u <= (std::uint64_t)std::numeric_limits<int>::max()) return (int)u;
        return j.get<double>();
    }
    if (j.is_number_integer()) {
        auto i = j.get<std::int64_t>();
        if (i >= std::numeric_limits<int>::min() && i <= std::numeric_limits<int>::max()) return (int)i;
        return j.get<double>();
    }
    if (j.is_number_float()) return j.get<double>();
    if (j.is_array() && j.size() == 3 &&
        std::all_of(j.begin(), j.end(), [](const nlohmann::json& c) { return c.is_number(); })) {
        return Vec3{j[0].get<float>(), j[1].get<float>(), j[2].get<float>()};
    }
    throw FlowError(fmt::format("Unsupported value in flow: {}", j.dump()));
}

nlohmann::json valueToJson(const Value& v) {
    return std::visit([](const auto& x) -> nlohmann::json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Vec3>) {
            return nlohmann::json::array({x.x, x.y, x.z});
        } else {
            return x;
        }
    }, v);
}

namespace {

const nlohmann::json& requireField(const nlohmann::json& j, const char* key, const std::string& where) {
    if (!j.is_object() || !j.contains(key)) {
        throw FlowError(fmt::format("Missing '{}' in {}", key, where));
    }
    return j.at(key);
}

std::string requireString(const nlohmann::json& j, const char* key, const std::string& where) {
    const auto& field = requireField(j, key, where);
    if (!field.is_string()) throw FlowError(fmt::format("'{}' in {} must be a string", key, where));
    return field.get<std::string>();
}

NodeInput inputFromJson(const nlohmann::json& j, const std::string& nodeId) {
    std::string where = "an input of node '" + nodeId + "'";
    NodeInput input;
    input.name = requireString(j, "name", where);
    where = fmt::format("input '{}' of node '{}'", input.name, nodeId);
    const bool hasFrom = j.contains("from");
    const bool hasExternal = j.contains("external");
    if (hasFrom == hasExternal) {
        throw FlowError(fmt::format("{} needs exactly one of 'from' or 'external'", where));
    }
    if (hasFrom) {
        const auto& from = j.at("from");
        input.kind = Connection{requireString(from, "node", where), requireString(from, "output", where)};
    } else {
        External ext;
        const auto& e = j.at("external");
        if (e.is_object() && e.contains("promoted")) ext.promoted = e.at("promoted").get<bool>();
        input.kind = ext;
    }
    return input;
}

Node nodeFromJson(const nlohmann::json& j) {
    Node node;
    node.id = requireString(j, "id", "a node");
    std::string where = "node '" + node.id + "'";
    node.opName = requireString(j, "op", where);
    if (j.contains("return") && !j.at("return").is_null()) node.returnValue = requireString(j, "return", where);
    if (j.contains("inputs")) {
        for (const auto& in : j.at("inputs")) node.inputs.push_back(inputFromJson(in, node.id));
    }
    return node;
}

} // namespace

ExternalParameterValues parametersFromJson(const nlohmann::json& j) {
    if (!j.is_array()) throw FlowError("'parameters' must be an array");
    ExternalParameterValues params;
    for (const auto& p : j) {
        std::string node = requireString(p, "node", "a parameter");
        std::string name = requireString(p, "name", "a parameter of node '" + node + "'");
        params.set(ExternalParameter(node, name),
                   valueFromJson(requireField(p, "value", fmt::format("parameter '{}' of node '{}'", name, node))));
    }
    return params;
}

nlohmann::json parametersToJson(const ExternalParameterValues& params) {
    std::vector<const ExternalParameterValues::Map::value_type*> sorted;
    for (const auto& kv : params.entries()) sorted.push_back(&kv);
    std::sort(sorted.begin(), sorted.end(), [](const auto* a, const auto* b) {
        if (a->first.nodeId != b->first.nodeId) return a->first.nodeId < b->first.nodeId;
        return a->first.paramName < b->first.paramName;
    });
    nlohmann::json out = nlohmann::json::array();
    for (const auto* kv : sorted) {
        out.push_back({{"node", kv->first.nodeId}, {"name", kv->first.paramName}, {"value", valueToJson(kv->second)}});
    }
    return out;
}

GizmoList gizmosFromJson(const nlohmann::json& j) {
    if (!j.is_array()) throw FlowError("Gizmo state must be an array");
    GizmoList gizmos;
    for (const auto& g : j) gizmos.push_back(valueFromJson(g));
    return gizmos;
}

nlohmann::json gizmosToJson(const GizmoList& gizmos) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& g : gizmos) out.push_back(valueToJson(g));
    return out;
}

Flow loadFlowFromJson(const nlohmann::json& json) {
    Flow flow;
    try {
        for (const auto& nodeJson : requireField(json, "nodes", "flow")) {
            flow.graph.addNode(nodeFromJson(nodeJson));
        }
        if (json.contains("target")) flow.target = requireString(json, "target", "flow");
        if (json.contains("parameters")) flow.parameters = parametersFromJson(json.at("parameters"));
        if (json.contains("gizmos")) flow.gizmos = gizmosFromJson(json.at("gizmos"));
    } catch (const nlohmann::json::exception& e) {
        throw FlowError(fmt::format("Malformed flow: {}", e.what()));
    }
    if (flow.target && !flow.graph.contains(*flow.target)) {
        throw FlowError(fmt::format("Flow target '{}' is not a node of the flow", *flow.target));
    }
    logDebug("loaded flow: {} nodes, {} parameters", flow.graph.size(), flow.parameters.size());
    return flow;
}

Flow loadFlowFile(const std::string& path) {
    return loadFlowFromJson(readJsonFile(path));
}

nlohmann::json readJsonFile(const std::string& path) {
    for (const std::string& candidate : {path, "../" + path, "../../" + path}) {
        std::ifstream f(candidate);
        if (!f.good()) continue;
        try {
            nlohmann::json json;
            f >> json;
            logDebug("read {}", candidate);
            return json;
        } catch (const nlohmann::json::exception& e) {
            throw FlowError(fmt::format("Could not parse {}: {}", candidate, e.what()));
        }
    }
    throw FlowError("Could not find file: " + path);
}

void writeJsonFile(const std::string& path, const nlohmann::json& json) {
    std::ofstream out(path);
    if (!out.is_open()) throw FlowError("Could not open for writing: " + path);
    out << json.dump(2) << "\n";
}

nlohmann::json resultToJson(const ProgramResult& result) {
    nlohmann::json out;
    out["renderable"] = result.renderable ? valueToJson(result.renderable->value) : nlohmann::json();
    out["gizmos"] = result.updatedGizmos ? gizmosToJson(*result.updatedGizmos) : nlohmann::json();
    out["parameters"] = parametersToJson(result.updatedValues);
    out["stats"] = {
        {"nodesEvaluated", result.stats.nodesEvaluated},
        {"cacheHits", result.stats.cacheHits},
        {"gizmoHooksRun", result.stats.gizmoHooksRun},
        {"evalTimeNs", result.stats.evalTimeNs},
    };
    return out;
}

} // namespace NodeInterp
