// NodeInterpOps.cpp
//
// Operation registry and the built-in node library. Built-in ops follow the
// flow engine's numeric rules: int/float/double mix freely and are coerced
// to the kind of the first operand; strings only combine with strings.
#include "NodeInterpOps.hpp"
#include "Log.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace NodeInterp {

void OperationRegistry::registerOp(OperationDef def) {
    if (def.name.empty()) throw std::invalid_argument("Operation name must not be empty");
    if (defs.count(def.name)) logWarn("Replacing operation '{}'", def.name);
    auto name = def.name;
    defs[name] = std::move(def);
}

void OperationRegistry::registerOp(const std::string& name, OpFn op, const std::string& description) {
    OperationDef def;
    def.name = name;
    def.op = std::move(op);
    def.description = description;
    registerOp(std::move(def));
}

const OperationDef* OperationRegistry::nodeDef(const std::string& name) const {
    auto it = defs.find(name);
    return it == defs.end() ? nullptr : &it->second;
}

std::vector<std::string> OperationRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(defs.size());
    for (const auto& kv : defs) out.push_back(kv.first);
    return out;
}

namespace {

// Truncates like a C cast; throws when the result does not fit an int
int toIntChecked(double v, const char* opName) {
    double t = std::trunc(v);
    if (!(t >= (double)std::numeric_limits<int>::min() && t <= (double)std::numeric_limits<int>::max())) {
        throw std::runtime_error(std::string("Integer overflow in ") + opName + " node");
    }
    return (int)t;
}

// Cast a double back into the numeric kind held by `like`
Value numericLike(const Value& like, double v, const char* opName) {
    if (std::holds_alternative<int>(like)) return toIntChecked(v, opName);
    if (std::holds_alternative<float>(like)) {
        if (std::isfinite(v) && std::fabs(v) > (double)std::numeric_limits<float>::max()) {
            throw std::runtime_error(std::string("Float overflow in ") + opName + " node");
        }
        return (float)v;
    }
    return v;
}

const Value& requireInput(const ValueMap& inputs, const char* opName, const char* name) {
    auto it = inputs.find(name);
    if (it == inputs.end()) {
        throw std::runtime_error(std::string(opName) + " node is missing input '" + name + "'");
    }
    return it->second;
}

Vec3 requireVec3(const ValueMap& inputs, const char* opName, const char* name) {
    const Value& v = requireInput(inputs, opName, name);
    if (!std::holds_alternative<Vec3>(v)) {
        throw std::runtime_error(std::string(opName) + " node expects a vec3 for '" + name +
                                 "', got " + valueTypeName(v));
    }
    return std::get<Vec3>(v);
}

HookResult opValue(const ValueMap& inputs) {
    return ValueMap{{"value", requireInput(inputs, "Value", "value")}};
}

// Sum of every input, in input-name order
HookResult opAdd(const ValueMap& inputs) {
    if (inputs.empty()) throw std::runtime_error("Invalid Add node configuration");
    std::map<std::string, Value> ordered(inputs.begin(), inputs.end());
    const Value& first = ordered.begin()->second;

    if (std::holds_alternative<std::string>(first)) {
        std::string result;
        for (const auto& [name, v] : ordered) {
            if (!std::holds_alternative<std::string>(v)) throw std::runtime_error("Type mismatch in Add node");
            result += std::get<std::string>(v);
        }
        return ValueMap{{"sum", result}};
    }
    if (std::holds_alternative<Vec3>(first)) {
        Vec3 sum;
        for (const auto& [name, v] : ordered) {
            if (!std::holds_alternative<Vec3>(v)) throw std::runtime_error("Type mismatch in Add node");
            const auto& p = std::get<Vec3>(v);
            sum.x += p.x; sum.y += p.y; sum.z += p.z;
        }
        return ValueMap{{"sum", sum}};
    }
    // Integer sums accumulate as integers; truncate float operands like a C cast
    if (std::holds_alternative<int>(first)) {
        long long sum = 0;
        for (const auto& [name, v] : ordered) {
            auto d = valueAsDouble(v);
            if (!d) throw std::runtime_error("Type mismatch in Add node");
            sum += toIntChecked(*d, "Add");
        }
        if (sum < std::numeric_limits<int>::min() || sum > std::numeric_limits<int>::max()) {
            throw std::runtime_error("Integer overflow in Add node");
        }
        return ValueMap{{"sum", (int)sum}};
    }
    double sum = 0.0;
    for (const auto& [name, v] : ordered) {
        auto d = valueAsDouble(v);
        if (!d) throw std::runtime_error("Type mismatch in Add node");
        sum += *d;
    }
    return ValueMap{{"sum", numericLike(first, sum, "Add")}};
}

HookResult opMultiply(const ValueMap& inputs) {
    const Value& a = requireInput(inputs, "Multiply", "a");
    const Value& b = requireInput(inputs, "Multiply", "b");
    auto da = valueAsDouble(a);
    auto db = valueAsDouble(b);
    if (da && db) return ValueMap{{"product", numericLike(a, *da * *db, "Multiply")}};
    if (std::holds_alternative<Vec3>(a) && db) {
        auto v = std::get<Vec3>(a);
        float s = (float)*db;
        return ValueMap{{"product", Vec3{v.x * s, v.y * s, v.z * s}}};
    }
    if (da && std::holds_alternative<Vec3>(b)) {
        auto v = std::get<Vec3>(b);
        float s = (float)*da;
        return ValueMap{{"product", Vec3{v.x * s, v.y * s, v.z * s}}};
    }
    throw std::runtime_error(std::string("Type mismatch in Multiply node: ") + valueTypeName(a) +
                             " * " + valueTypeName(b));
}

HookResult opMakeVector(const ValueMap& inputs) {
    auto component = [&](const char* name) {
        auto d = valueAsDouble(requireInput(inputs, "MakeVector", name));
        if (!d) throw std::runtime_error(std::string("MakeVector expects a number for '") + name + "'");
        return (float)*d;
    };
    return ValueMap{{"vec", Vec3{component("x"), component("y"), component("z")}}};
}

HookResult opEcho(const ValueMap& inputs) {
    return inputs;
}

HookResult opTranslate(const ValueMap& inputs) {
    Vec3 p = requireVec3(inputs, "Translate", "point");
    Vec3 o = requireVec3(inputs, "Translate", "offset");
    return ValueMap{{"point", Vec3{p.x + o.x, p.y + o.y, p.z + o.z}}, {"offset", o}};
}

// The first incoming gizmo is the handle the user dragged; it becomes the new offset
HookResult preGizmoTranslate(const ValueMap& inputs, const GizmoList& gizmosIn,
                             ExternalParameterValues& params, const NodeId& nodeId) {
    ValueMap patched = inputs;
    if (gizmosIn.empty() || !std::holds_alternative<Vec3>(gizmosIn.front())) return patched;
    patched["offset"] = gizmosIn.front();
    ExternalParameter key(nodeId, "offset");
    if (params.contains(key)) params.set(key, gizmosIn.front());
    return patched;
}

HookResult postGizmoTranslate(const ValueMap& outputs) {
    auto it = outputs.find("offset");
    if (it == outputs.end()) return GizmoList{};
    return GizmoList{it->second};
}

} // namespace

void registerBuiltinOps(OperationRegistry& registry) {
    registry.registerOp("Value", opValue, "Outputs its 'value' input unchanged");
    registry.registerOp("Add", opAdd, "Sums all inputs into 'sum'");
    registry.registerOp("Multiply", opMultiply, "Multiplies 'a' by 'b' into 'product'");
    registry.registerOp("MakeVector", opMakeVector, "Builds 'vec' from 'x', 'y', 'z'");
    registry.registerOp("Echo", opEcho, "Copies every input to an output of the same name");

    OperationDef translate;
    translate.name = "Translate";
    translate.op = opTranslate;
    translate.hasGizmo = true;
    translate.preGizmo = preGizmoTranslate;
    translate.postGizmo = postGizmoTranslate;
    translate.description = "Moves 'point' by 'offset'; the offset is editable through a gizmo";
    registry.registerOp(std::move(translate));
}

} // namespace NodeInterp
