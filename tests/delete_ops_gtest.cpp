#include "patch_fixture.hpp"
#include "graft/errors.hpp"
#include "graft/ops/delete_ops.hpp"

using namespace graft;

namespace {

const char* kMethod = R"((method :name "run"
  :params [(param :name "a") (param :name "b") (param :name "c")]
  :body (block :statements [(call :name "x") (call :name "y")])))";

class DeleteOpsGTest : public PatchFixture {};

TEST_F(DeleteOpsGTest, KeepsSiblingOrder){
    load(kMethod, kMethod);
    NodeId b = old_at("/params[1]");
    ops::delete_ops::apply(ctx(), DeletePatch{b});
    EXPECT_EQ(names(prev, RoleKind::Parameter), (std::vector<std::string>{"a", "c"}));
    EXPECT_FALSE(F.attached(b));
    EXPECT_EQ(F.at(b).role.kind, RoleKind::None);
    EXPECT_EQ(stats.deleted, 1u);
}

TEST_F(DeleteOpsGTest, RemovesSlotChild){
    load(kMethod, kMethod);
    NodeId body = old_at("/body");
    ops::delete_ops::apply(ctx(), DeletePatch{body});
    EXPECT_EQ(F.slot(prev, "body"), kNoNode);
    // the detached subtree stays intact
    EXPECT_EQ(F.children(body, RoleKind::Statement).size(), 2u);
}

TEST_F(DeleteOpsGTest, RemovesOneValueOfMultiValuedSlot){
    const char* field = R"((field :name "f" :modifiers [(private) (static) (final)]))";
    load(field, field);
    NodeId st = old_at("/modifiers[1]");
    ops::delete_ops::apply(ctx(), DeletePatch{st});
    ASSERT_EQ(F.slot_values(prev, "modifiers").size(), 2u);
    EXPECT_EQ(F.at(F.slot_values(prev, "modifiers")[1]).tag, "final");
    EXPECT_FALSE(F.in_multi_slot(st));
    EXPECT_EQ(old_at("/modifiers[1]"), F.slot_values(prev, "modifiers")[1]);
}

TEST_F(DeleteOpsGTest, SecondDeleteIsAnError){
    load(kMethod, kMethod);
    NodeId a = old_at("/params[0]");
    ops::delete_ops::apply(ctx(), DeletePatch{a});
    try {
        ops::delete_ops::apply(ctx(), DeletePatch{a});
        FAIL() << "expected detached_node_error";
    } catch(const detached_node_error& e){
        EXPECT_EQ(e.code(), "E2001");
        EXPECT_EQ(e.node(), a);
    }
    EXPECT_EQ(stats.deleted, 1u);
}

TEST_F(DeleteOpsGTest, RootCannotBeDeleted){
    load(kMethod, kMethod);
    EXPECT_THROW(ops::delete_ops::apply(ctx(), DeletePatch{prev}), detached_node_error);
}

} // namespace
