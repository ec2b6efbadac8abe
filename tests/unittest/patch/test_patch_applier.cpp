/**
 * ************************************************************************
 *
 * @file test_patch_applier.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-18
 * @version 0.1
 * @brief 补丁应用单元测试：活动树与视图层级同步
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include "src/tx/diff/Differ.hpp"
#include "src/tx/layout/LayoutAdapter.hpp"
#include "src/tx/layout/LayoutNodePool.hpp"
#include "src/tx/managers/ViewRecyclePool.hpp"
#include "src/tx/patch/PatchApplier.hpp"
#include "tests/unittest/fakes/FakeViewWorld.h"
#include "tests/unittest/fakes/TestCollaborators.h"

using namespace tx;
using namespace tx::test;

namespace
{
const Size CONTAINER{320.0F, UNDEFINED_DIMENSION};
}

class PatchApplierTest : public ::testing::Test
{
protected:
    FakeViewHost m_host;
    managers::WidgetTable m_widgets{m_host};
    managers::ViewRecyclePool m_recycle{m_host};
    FixedTextMeasurer m_measurer;
    layout::LayoutNodePool m_pool{64};
    layout::LayoutAdapter m_adapter{m_pool, &m_measurer};
    patch::ViewMaterializer m_views{m_widgets, &m_recycle};
    ThreadAffinity m_affinity;
    patch::PatchApplier m_patcher{m_adapter, m_views, m_affinity};
    diff::Differ m_differ;

    void SetUp() override { registerRecordingHandlers(m_widgets, m_host); }

    /**
     * @brief 布局并创建整棵树的视图，之后清零宿主计数
     */
    std::unique_ptr<Node> mount(std::unique_ptr<Node> tree)
    {
        layout::LayoutAdapter::applyFrames(*tree, m_adapter.computeLayout(*tree, CONTAINER));
        m_views.createViewTree(*tree, ViewHandle{});
        m_host.resetCounters();
        return tree;
    }

    size_t patch(std::unique_ptr<Node>& live, const Node* newTree)
    {
        auto script = m_differ.diff(live.get(), newTree);
        return m_patcher.apply(script, live, CONTAINER);
    }

    static void setText(Node& root, const std::string& id, const std::string& text)
    {
        root.findById(id)->contentAs<TextContent>()->text = text;
    }
};

// 测试 1: 移动只重排视图，不新建
TEST_F(PatchApplierTest, MoveReordersViews)
{
    auto live = mount(makeList("list", {"A", "B", "C", "D"}));
    const ViewHandle movedView = live->findById("item_D")->view();
    auto next = makeList("list", {"D", "A", "B", "C"});

    EXPECT_EQ(patch(live, next.get()), 1U);

    EXPECT_EQ(childIds(*live), (std::vector<std::string>{"item_D", "item_A", "item_B", "item_C"}));
    EXPECT_EQ(m_host.childIdsOf(live->view()), childIds(*live));
    EXPECT_EQ(live->findById("item_D")->view(), movedView);
    EXPECT_EQ(m_host.createCount(), 0U);
}

// 测试 2: 删除的子树视图进入复用池
TEST_F(PatchApplierTest, DeleteRecyclesViews)
{
    auto live = mount(makeList("list", {"A", "B", "C"}));
    const ViewHandle removedView = live->findById("item_B")->view();
    auto next = makeList("list", {"A", "C"});

    patch(live, next.get());

    EXPECT_EQ(m_host.childIdsOf(live->view()), (std::vector<std::string>{"item_A", "item_C"}));
    EXPECT_EQ(m_recycle.pooledCount(NodeKind::VIEW), 1U);
    EXPECT_EQ(m_recycle.pooledCount(NodeKind::TEXT), 1U);
    EXPECT_FALSE(m_host.view(removedView).parent.valid());
    EXPECT_EQ(m_host.destroyCount(), 0U);
}

// 测试 3: 插入优先复用刚回收的视图
TEST_F(PatchApplierTest, InsertReusesRecycledViews)
{
    auto live = mount(makeList("list", {"A", "B"}));
    auto next = makeList("list", {"A", "C"});

    patch(live, next.get());

    EXPECT_EQ(m_host.createCount(), 0U);
    EXPECT_EQ(m_host.childIdsOf(live->view()), (std::vector<std::string>{"item_A", "item_C"}));
    const Node* inserted = live->findById("label_C");
    ASSERT_NE(inserted, nullptr);
    EXPECT_EQ(m_host.view(inserted->view()).nodeId, "label_C");
    EXPECT_EQ(m_host.view(inserted->view()).content, inserted->content());
    EXPECT_TRUE(treeEquals(*live, *next));
}

// 测试 4: 根类型变化时整树替换
TEST_F(PatchApplierTest, RootReplace)
{
    auto live = mount(makeList("list", {"A", "B"}));
    const ViewHandle oldRootView = live->view();
    auto next = makeNode("list", NodeKind::SCROLL);
    auto source = makeList("list", {"A"});
    next->addChild(source->childAt(0)->deepClone());

    EXPECT_EQ(patch(live, next.get()), 1U);

    ASSERT_NE(live, nullptr);
    EXPECT_EQ(live->kind(), NodeKind::SCROLL);
    EXPECT_TRUE(live->view().valid());
    EXPECT_NE(live->view(), oldRootView);
    EXPECT_EQ(m_host.view(live->view()).kind, NodeKind::SCROLL);
    EXPECT_EQ(m_host.childIdsOf(live->view()), (std::vector<std::string>{"item_A"}));
}

// 测试 5: 新树为空时删除整树
TEST_F(PatchApplierTest, RootDelete)
{
    auto live = mount(makeList("list", {"A"}));
    EXPECT_EQ(patch(live, nullptr), 1U);
    EXPECT_EQ(live, nullptr);
    EXPECT_EQ(m_recycle.totalPooled(), 3U);
}

// 测试 6: 只刷新内容变化的视图
TEST_F(PatchApplierTest, UpdateTouchesChangedViewsOnly)
{
    auto live = mount(makeList("list", {"A", "B"}));
    const ViewHandle changed = live->findById("label_B")->view();
    const ViewHandle untouched = live->findById("label_A")->view();
    const size_t untouchedBefore = m_host.view(untouched).updateCount;

    auto next = makeList("list", {"A", "B"});
    setText(*next, "label_B", "changed");
    patch(live, next.get());

    EXPECT_EQ(m_host.view(changed).content, NodeContent{TextContent{"changed"}});
    EXPECT_EQ(m_host.view(untouched).updateCount, untouchedBefore);
    EXPECT_EQ(m_host.updateCount(), 1U);
}

// 测试 7: 无差异时不做任何事
TEST_F(PatchApplierTest, EmptyScriptIsNoop)
{
    auto live = mount(makeList("list", {"A"}));
    auto same = live->deepClone();
    EXPECT_EQ(patch(live, same.get()), 0U);
    EXPECT_EQ(m_host.updateCount(), 0U);
    EXPECT_EQ(m_host.attachCount(), 0U);
}

// 测试 8: 快速更新按位置复制内容
TEST_F(PatchApplierTest, QuickUpdateCopiesContent)
{
    auto live = mount(makeList("list", {"A", "B"}));
    auto bound = live->deepClone();
    setText(*bound, "label_A", "fresh");

    m_patcher.quickUpdate(*live, *bound, CONTAINER);

    const Node* label = live->findById("label_A");
    EXPECT_EQ(label->contentAs<TextContent>()->text, "fresh");
    EXPECT_EQ(m_host.view(label->view()).content, label->content());
    EXPECT_EQ(m_host.updateCount(), 1U);
}

// 测试 9: 快速更新遇到结构不一致时跳过该分支
TEST_F(PatchApplierTest, QuickUpdateSkipsMismatchedBranch)
{
    auto live = mount(makeList("list", {"A", "B"}));
    auto bound = makeList("list", {"A", "B", "C"});
    setText(*bound, "label_A", "fresh");

    m_patcher.quickUpdate(*live, *bound, CONTAINER);
    EXPECT_EQ(live->findById("label_A")->contentAs<TextContent>()->text, "item A");
    EXPECT_EQ(live->childCount(), 2U);
}

// 测试 10: 容器尺寸变化后刷新全部 frame
TEST_F(PatchApplierTest, RefreshAppliesNewSize)
{
    auto live = mount(makeList("list", {"A"}));
    m_patcher.refresh(*live, Size{200.0F, UNDEFINED_DIMENSION});

    EXPECT_FLOAT_EQ(m_host.view(live->view()).frame.width, 200.0F);
    EXPECT_FLOAT_EQ(m_host.view(live->findById("item_A")->view()).frame.width, 200.0F);
}

// 测试 11: 样式变化使扁平化节点获得自己的视图
TEST_F(PatchApplierTest, UnflattenCreatesHostView)
{
    auto build = [](bool visible)
    {
        auto root = makeNode("root");
        auto wrapper = makeNode("wrapper");
        if (visible) wrapper->mutableStyle().backgroundColor = Color(1.0F, 0.0F, 0.0F);
        wrapper->addChild(makeText("inner", "hi"));
        root->addChild(std::move(wrapper));
        return root;
    };
    auto live = mount(build(false));
    ASSERT_TRUE(live->findById("wrapper")->flattened());
    EXPECT_EQ(m_host.childIdsOf(live->view()), (std::vector<std::string>{"inner"}));

    auto next = build(true);
    patch(live, next.get());

    const Node* wrapper = live->findById("wrapper");
    EXPECT_FALSE(wrapper->flattened());
    ASSERT_TRUE(wrapper->view().valid());
    EXPECT_EQ(m_host.childIdsOf(live->view()), (std::vector<std::string>{"wrapper"}));
    EXPECT_EQ(m_host.childIdsOf(wrapper->view()), (std::vector<std::string>{"inner"}));
}

// 测试 12: applyUpdate 合并绑定差异
TEST(PatchApplierStaticTest, ApplyUpdateMergesBindings)
{
    auto node = makeNode("n");
    node->setBinding("keep", 1);
    node->setBinding("drop", 2);
    node->markApplied();

    diff::UpdateOp op;
    op.id = "n";
    op.bindingChanges = diff::BindingChanges{.changed = {{"keep", 3}, {"add", "x"}}, .removed = {"drop"}};
    patch::PatchApplier::applyUpdate(*node, op);

    EXPECT_EQ(node->bindings().at("keep"), 3);
    EXPECT_EQ(node->bindings().at("add"), "x");
    EXPECT_FALSE(node->bindings().contains("drop"));
    EXPECT_TRUE(node->needsViewUpdate());
}

// 测试 13: 改名在子节点操作之后生效
TEST(PatchApplierStaticTest, RenameAppliedAfterChildOps)
{
    diff::Differ differ;
    auto oldTree = makeNode("list");
    auto row = makeKeyed("row_1", "k");
    row->addChild(makeText("cell", "a"));
    oldTree->addChild(std::move(row));

    auto newTree = makeNode("list");
    auto renamed = makeKeyed("row_2", "k");
    renamed->addChild(makeText("cell", "a"));
    renamed->addChild(makeText("extra", "b"));
    newTree->addChild(std::move(renamed));

    auto live = oldTree->deepClone();
    std::unordered_set<const Node*> changed;
    patch::PatchApplier::applyToTree(differ.diff(oldTree.get(), newTree.get()), live, {}, &changed);

    EXPECT_TRUE(treeEquals(*live, *newTree));
    ASSERT_EQ(changed.size(), 1U);
    EXPECT_EQ((*changed.begin())->id(), "row_2");
}
