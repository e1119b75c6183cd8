// NodeInterp core types
//
// This header defines the value type that flows between nodes, the read-only
// graph model (nodes, inputs, dependency kinds) and the external parameter
// store that holds user-set leaf inputs. The evaluator in NodeInterpRunner.hpp
// walks these structures; nothing here executes anything.
#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace NodeInterp {

using NodeId = std::string;

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    bool operator==(const Vec3& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Vec3& o) const { return !(*this == o); }
};

// Scalar or vector value that can flow on ports. Extend here to add more types.
using Value = std::variant<int, float, double, std::string, Vec3>;
// Named values; both the inputs and the outputs of an operation.
using ValueMap = std::unordered_map<std::string, Value>;

// Gizmos are interactive handles attached to the target node. Their state is
// an ordinary value (a Vec3 for transform handles).
using Gizmo = Value;
using GizmoList = std::vector<Gizmo>;

// Human-readable rendering used by logs and the CLI
std::string valueToString(const Value& v);
// Name of the held alternative ("int", "float", "double", "string", "vec3")
const char* valueTypeName(const Value& v);
// Numeric view of int/float/double values; nullopt for strings and vectors
std::optional<double> valueAsDouble(const Value& v);

// Input fed by another node's output
struct Connection {
    NodeId node;
    std::string outputName;
};

// Input set by the user. `promoted` only matters to editors exposing the
// parameter upward; evaluation ignores it.
struct External {
    bool promoted = false;
};

using DependencyKind = std::variant<Connection, External>;

struct NodeInput {
    std::string name;
    DependencyKind kind;
};

struct Node {
    NodeId id;
    std::string opName;
    std::vector<NodeInput> inputs;
    // Output returned by the graph when this node is the evaluation target
    std::optional<std::string> returnValue;
};

// Immutable during evaluation. Node order is the order nodes were added.
class Graph {
public:
    Graph() = default;

    // Adds a node; throws FlowError if the id is already taken
    void addNode(Node node);

    bool contains(const NodeId& id) const { return nodeIndex.count(id) != 0; }
    // Throws EvalError(UnknownNode) if absent
    const Node& node(const NodeId& id) const;
    const std::vector<Node>& nodes() const { return nodeList; }
    size_t size() const { return nodeList.size(); }

private:
    std::vector<Node> nodeList;
    std::unordered_map<NodeId, size_t> nodeIndex;
};

// Key of a user-provided leaf input: (node id, input name)
struct ExternalParameter {
    NodeId nodeId;
    std::string paramName;

    ExternalParameter() = default;
    ExternalParameter(NodeId node, std::string name)
        : nodeId(std::move(node)), paramName(std::move(name)) {}

    bool operator==(const ExternalParameter& o) const {
        return nodeId == o.nodeId && paramName == o.paramName;
    }
    bool operator!=(const ExternalParameter& o) const { return !(*this == o); }
};

struct ExternalParameterHash {
    size_t operator()(const ExternalParameter& p) const {
        size_t h = std::hash<std::string>{}(p.nodeId);
        // boost-style combine
        h ^= std::hash<std::string>{}(p.paramName) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

// User-set values for every External input. Moved into a run and handed
// back in the result, since gizmo hooks may edit it.
class ExternalParameterValues {
public:
    using Map = std::unordered_map<ExternalParameter, Value, ExternalParameterHash>;

    const Value* find(const ExternalParameter& key) const {
        auto it = values.find(key);
        return it == values.end() ? nullptr : &it->second;
    }
    void set(const ExternalParameter& key, Value v) { values[key] = std::move(v); }
    bool erase(const ExternalParameter& key) { return values.erase(key) != 0; }
    bool contains(const ExternalParameter& key) const { return values.count(key) != 0; }
    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
    // Copies every entry of `other` over this store
    void merge(const ExternalParameterValues& other);

    const Map& entries() const { return values; }

private:
    Map values;
};

} // namespace NodeInterp
