// Graph-building shorthands shared by the tests
#pragma once
#include "NodeInterpCore.hpp"
#include "NodeInterpErrors.hpp"
#include "NodeInterpOps.hpp"
#include "NodeInterpRunner.hpp"
#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace NodeInterp::test {

inline NodeInput from(const std::string& name, const NodeId& node, const std::string& output) {
    return NodeInput{name, Connection{node, output}};
}

inline NodeInput external(const std::string& name, bool promoted = false) {
    return NodeInput{name, External{promoted}};
}

inline Node makeNode(const NodeId& id, const std::string& op, std::vector<NodeInput> inputs,
                     std::optional<std::string> returnValue = std::nullopt) {
    return Node{id, op, std::move(inputs), std::move(returnValue)};
}

// Registers an echo op under `name` that counts its invocations per op name
class CallCounter {
public:
    void registerEcho(OperationRegistry& registry, const std::string& name) {
        registry.registerOp(name, [this, name](const ValueMap& inputs) -> HookResult {
            ++calls[name];
            return inputs;
        });
    }
    int count(const std::string& name) const {
        auto it = calls.find(name);
        return it == calls.end() ? 0 : it->second;
    }

private:
    std::map<std::string, int> calls;
};

// Asserts that `fn` throws an EvalError of the given kind and returns it
template <typename Fn>
EvalError expectEvalError(ErrorKind kind, Fn&& fn) {
    try {
        fn();
    } catch (const EvalError& e) {
        EXPECT_EQ(errorKindName(e.kind()), std::string(errorKindName(kind))) << e.what();
        return e;
    }
    ADD_FAILURE() << "expected EvalError " << errorKindName(kind);
    return EvalError(kind, "", "", "not thrown");
}

} // namespace NodeInterp::test
