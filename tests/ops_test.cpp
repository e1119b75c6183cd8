#include "test_helpers.hpp"
#include <limits>

using namespace NodeInterp;

namespace {

ValueMap call(const OperationRegistry& ops, const std::string& name, const ValueMap& inputs) {
    const OperationDef* def = ops.nodeDef(name);
    EXPECT_NE(def, nullptr) << name;
    HookResult r = def->op(inputs);
    EXPECT_TRUE(std::holds_alternative<ValueMap>(r)) << name;
    return std::get<ValueMap>(r);
}

class BuiltinOps : public ::testing::Test {
protected:
    void SetUp() override { registerBuiltinOps(ops); }
    OperationRegistry ops;
};

} // namespace

TEST(OperationRegistry, LookupAndReplace) {
    OperationRegistry ops;
    EXPECT_EQ(ops.nodeDef("Missing"), nullptr);

    ops.registerOp("B", [](const ValueMap&) -> HookResult { return ValueMap{{"v", 1}}; });
    ops.registerOp("A", [](const ValueMap&) -> HookResult { return ValueMap{}; }, "first");
    EXPECT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops.names(), (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(ops.nodeDef("A")->description, "first");
    EXPECT_FALSE(ops.nodeDef("A")->hasGizmo);

    ops.registerOp("A", [](const ValueMap&) -> HookResult { return ValueMap{}; }, "second");
    EXPECT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops.nodeDef("A")->description, "second");

    EXPECT_THROW(ops.registerOp(OperationDef{}), std::invalid_argument);
}

TEST_F(BuiltinOps, AllRegistered) {
    for (const char* name : {"Value", "Add", "Multiply", "MakeVector", "Echo", "Translate"}) {
        EXPECT_TRUE(ops.contains(name)) << name;
    }
    EXPECT_TRUE(ops.nodeDef("Translate")->hasGizmo);
    EXPECT_TRUE(ops.nodeDef("Translate")->preGizmo);
    EXPECT_TRUE(ops.nodeDef("Translate")->postGizmo);
}

TEST_F(BuiltinOps, Value) {
    auto out = call(ops, "Value", {{"value", std::string("hi")}});
    EXPECT_EQ(std::get<std::string>(out.at("value")), "hi");
    EXPECT_THROW(ops.nodeDef("Value")->op({}), std::runtime_error);
}

TEST_F(BuiltinOps, AddCoercesToTheFirstInputsKind) {
    // "a" sorts first, so an int "a" makes an int sum with truncated floats
    auto ints = call(ops, "Add", {{"a", 2}, {"b", 3.9}, {"c", 1.5f}});
    EXPECT_EQ(std::get<int>(ints.at("sum")), 6);

    auto doubles = call(ops, "Add", {{"a", 0.5}, {"b", 2}});
    EXPECT_DOUBLE_EQ(std::get<double>(doubles.at("sum")), 2.5);

    auto floats = call(ops, "Add", {{"a", 0.25f}, {"b", 0.5}});
    EXPECT_FLOAT_EQ(std::get<float>(floats.at("sum")), 0.75f);
}

TEST_F(BuiltinOps, AddStringsAndVectors) {
    auto s = call(ops, "Add", {{"b", std::string("world")}, {"a", std::string("hello ")}});
    EXPECT_EQ(std::get<std::string>(s.at("sum")), "hello world");

    auto v = call(ops, "Add", {{"a", Vec3{1, 2, 3}}, {"b", Vec3{1, 1, 1}}});
    EXPECT_EQ(std::get<Vec3>(v.at("sum")), (Vec3{2, 3, 4}));
}

TEST_F(BuiltinOps, AddRejectsMixedKindsAndEmptyInput) {
    const auto& add = ops.nodeDef("Add")->op;
    EXPECT_THROW(add({{"a", std::string("x")}, {"b", 1}}), std::runtime_error);
    EXPECT_THROW(add({{"a", 1}, {"b", Vec3{}}}), std::runtime_error);
    EXPECT_THROW(add({}), std::runtime_error);
}

TEST_F(BuiltinOps, IntArithmeticRejectsOverflow) {
    const int maxInt = std::numeric_limits<int>::max();
    const auto& add = ops.nodeDef("Add")->op;
    const auto& mul = ops.nodeDef("Multiply")->op;

    EXPECT_EQ(std::get<int>(call(ops, "Add", {{"a", maxInt - 1}, {"b", 1}}).at("sum")), maxInt);
    EXPECT_EQ(std::get<int>(call(ops, "Add", {{"a", maxInt}, {"b", -1.5}}).at("sum")), maxInt - 1);

    EXPECT_THROW(add({{"a", maxInt}, {"b", 1}}), std::runtime_error);
    EXPECT_THROW(add({{"a", std::numeric_limits<int>::min()}, {"b", -1}}), std::runtime_error);
    EXPECT_THROW(add({{"a", 1}, {"b", 1e30}}), std::runtime_error);
    EXPECT_THROW(mul({{"a", 100000}, {"b", 100000}}), std::runtime_error);
    EXPECT_THROW(mul({{"a", 2.0f}, {"b", 1e300}}), std::runtime_error);
    // Double results are not narrowed
    EXPECT_DOUBLE_EQ(std::get<double>(call(ops, "Multiply", {{"a", 1e5}, {"b", 100000}}).at("product")), 1e10);
}

TEST_F(BuiltinOps, Multiply) {
    EXPECT_EQ(std::get<int>(call(ops, "Multiply", {{"a", 3}, {"b", 4}}).at("product")), 12);
    EXPECT_DOUBLE_EQ(std::get<double>(call(ops, "Multiply", {{"a", 1.5}, {"b", 2}}).at("product")), 3.0);
    EXPECT_EQ(std::get<Vec3>(call(ops, "Multiply", {{"a", Vec3{1, 2, 3}}, {"b", 2}}).at("product")),
              (Vec3{2, 4, 6}));
    EXPECT_EQ(std::get<Vec3>(call(ops, "Multiply", {{"a", 0.5}, {"b", Vec3{2, 4, 6}}}).at("product")),
              (Vec3{1, 2, 3}));
    EXPECT_THROW(ops.nodeDef("Multiply")->op({{"a", std::string("x")}, {"b", 2}}), std::runtime_error);
    EXPECT_THROW(ops.nodeDef("Multiply")->op({{"a", 2}}), std::runtime_error);
}

TEST_F(BuiltinOps, MakeVector) {
    auto out = call(ops, "MakeVector", {{"x", 1}, {"y", 2.5}, {"z", -1.0f}});
    EXPECT_EQ(std::get<Vec3>(out.at("vec")), (Vec3{1.0f, 2.5f, -1.0f}));
    EXPECT_THROW(ops.nodeDef("MakeVector")->op({{"x", 1}, {"y", 2}}), std::runtime_error);
}

TEST_F(BuiltinOps, EchoCopiesEveryInput) {
    ValueMap in{{"a", 1}, {"b", std::string("two")}};
    auto out = call(ops, "Echo", in);
    EXPECT_EQ(out.size(), 2u);
    EXPECT_EQ(std::get<int>(out.at("a")), 1);
    EXPECT_EQ(std::get<std::string>(out.at("b")), "two");
}

TEST_F(BuiltinOps, TranslateHooks) {
    const OperationDef* def = ops.nodeDef("Translate");
    ValueMap inputs{{"point", Vec3{0, 0, 0}}, {"offset", Vec3{1, 0, 0}}};
    EXPECT_THROW(def->op({{"point", 1}, {"offset", Vec3{}}}), std::runtime_error);

    ExternalParameterValues params;
    // No incoming gizmo: inputs pass through untouched
    auto same = std::get<ValueMap>(def->preGizmo(inputs, {}, params, "n"));
    EXPECT_EQ(std::get<Vec3>(same.at("offset")), (Vec3{1, 0, 0}));
    EXPECT_TRUE(params.empty());

    // offset is not a stored parameter of "n", so nothing is written back
    auto patched = std::get<ValueMap>(def->preGizmo(inputs, {Vec3{0, 2, 0}}, params, "n"));
    EXPECT_EQ(std::get<Vec3>(patched.at("offset")), (Vec3{0, 2, 0}));
    EXPECT_TRUE(params.empty());

    auto gizmos = std::get<GizmoList>(def->postGizmo({{"point", Vec3{}}, {"offset", Vec3{3, 3, 3}}}));
    ASSERT_EQ(gizmos.size(), 1u);
    EXPECT_EQ(std::get<Vec3>(gizmos[0]), (Vec3{3, 3, 3}));
    EXPECT_TRUE(std::get<GizmoList>(def->postGizmo({})).empty());
}
