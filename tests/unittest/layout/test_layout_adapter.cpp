/**
 * ************************************************************************
 *
 * @file test_layout_adapter.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-17
 * @version 0.1
 * @brief 布局适配器单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "src/tx/layout/LayoutAdapter.hpp"
#include "src/tx/layout/LayoutNodePool.hpp"
#include "tests/unittest/fakes/TestCollaborators.h"
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tx;
using namespace tx::test;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::Return;
using ::testing::Throw;

class LayoutAdapterTest : public ::testing::Test
{
protected:
    layout::LayoutNodePool m_pool{32};
    layout::LayoutAdapter m_adapter{m_pool};

    void TearDown() override { EXPECT_EQ(m_pool.checkedOutCount(), 0U); }

    static bool noSlotsHeld(const Node& root)
    {
        bool clean = true;
        root.visit([&clean](const Node& node) { clean = clean && !node.hasLayoutSlot(); });
        return clean;
    }
};

// 测试 1: 纵向排列固定尺寸子节点
TEST_F(LayoutAdapterTest, ColumnOfFixedBoxes)
{
    auto root = makeBox("root", 300.0F, 200.0F);
    root->addChild(makeBox("a", 100.0F, 50.0F));
    root->addChild(makeBox("b", 100.0F, 50.0F));

    auto frames = m_adapter.computeLayout(*root, Size{300.0F, 200.0F});

    EXPECT_EQ(frames.at("root"), (Frame{0.0F, 0.0F, 300.0F, 200.0F}));
    EXPECT_EQ(frames.at("a"), (Frame{0.0F, 0.0F, 100.0F, 50.0F}));
    EXPECT_EQ(frames.at("b"), (Frame{0.0F, 50.0F, 100.0F, 50.0F}));
    EXPECT_TRUE(noSlotsHeld(*root));
}

// 测试 2: 横向 flexGrow 平分剩余空间
TEST_F(LayoutAdapterTest, RowFlexGrow)
{
    auto root = makeBox("root", 300.0F, 100.0F);
    root->mutableStyle().flexDirection = policies::FlexDirection::ROW;
    for (const char* id : {"left", "right"})
    {
        auto child = makeNode(id);
        child->mutableStyle().flexGrow = 1.0F;
        root->addChild(std::move(child));
    }

    auto frames = m_adapter.computeLayout(*root, Size{300.0F, 100.0F});

    EXPECT_FLOAT_EQ(frames.at("left").width, 150.0F);
    EXPECT_FLOAT_EQ(frames.at("right").x, 150.0F);
    EXPECT_FLOAT_EQ(frames.at("right").height, 100.0F);
}

// 测试 3: 高度为 NaN 时由内容撑开
TEST_F(LayoutAdapterTest, UndefinedHeightWrapsContent)
{
    auto root = makeNode("root");
    root->mutableStyle().width = Dimension::Point(200.0F);
    root->mutableStyle().padding = EdgeInsets::All(10.0F);
    root->addChild(makeBox("a", 50.0F, 40.0F));
    root->addChild(makeBox("b", 50.0F, 40.0F));

    auto frames = m_adapter.computeLayout(*root, Size{200.0F, UNDEFINED_DIMENSION});

    EXPECT_FLOAT_EQ(frames.at("root").height, 100.0F);
    EXPECT_EQ(frames.at("b"), (Frame{10.0F, 50.0F, 50.0F, 40.0F}));
}

// 测试 4: 百分比宽度
TEST_F(LayoutAdapterTest, PercentWidth)
{
    auto root = makeBox("root", 200.0F, 100.0F);
    auto half = makeNode("half");
    half->mutableStyle().width = Dimension::Percent(50.0F);
    half->mutableStyle().height = Dimension::Point(10.0F);
    root->addChild(std::move(half));

    auto frames = m_adapter.computeLayout(*root, Size{200.0F, 100.0F});
    EXPECT_FLOAT_EQ(frames.at("half").width, 100.0F);
}

// 测试 5: 文本节点通过测量回调取得高度
TEST_F(LayoutAdapterTest, TextUsesMeasurer)
{
    MockTextMeasurer measurer;
    layout::LayoutAdapter adapter(m_pool, &measurer);
    EXPECT_CALL(measurer, measure(_, _)).Times(AtLeast(1)).WillRepeatedly(Return(Size{60.0F, 24.0F}));

    auto root = makeNode("root");
    root->mutableStyle().width = Dimension::Point(200.0F);
    root->addChild(makeText("title", "Hello"));

    auto frames = adapter.computeLayout(*root, Size{200.0F, UNDEFINED_DIMENSION});

    EXPECT_FLOAT_EQ(frames.at("title").height, 24.0F);
    EXPECT_FLOAT_EQ(frames.at("root").height, 24.0F);
}

// 测试 6: 测量异常按零尺寸处理
TEST_F(LayoutAdapterTest, MeasurerExceptionYieldsZero)
{
    MockTextMeasurer measurer;
    layout::LayoutAdapter adapter(m_pool, &measurer);
    EXPECT_CALL(measurer, measure(_, _)).WillRepeatedly(Throw(std::runtime_error("font missing")));

    auto root = makeNode("root");
    root->mutableStyle().width = Dimension::Point(200.0F);
    root->addChild(makeText("title", "Hello"));

    auto frames = adapter.computeLayout(*root, Size{200.0F, UNDEFINED_DIMENSION});
    EXPECT_FLOAT_EQ(frames.at("title").height, 0.0F);
}

// 测试 7: 容器节点不挂测量回调
TEST_F(LayoutAdapterTest, ContainersAreNotMeasured)
{
    MockTextMeasurer measurer;
    layout::LayoutAdapter adapter(m_pool, &measurer);
    EXPECT_CALL(measurer, measure(_, _)).Times(0);

    auto root = makeBox("root", 100.0F, 100.0F);
    root->addChild(makeBox("inner", 10.0F, 10.0F));
    (void)adapter.computeLayout(*root, Size{100.0F, 100.0F});
}

// 测试 8: id 重复视为结构异常，不泄漏布局节点
TEST_F(LayoutAdapterTest, DuplicateIdsFail)
{
    auto root = makeBox("root", 100.0F, 100.0F);
    root->addChild(makeBox("dup", 10.0F, 10.0F));
    root->addChild(makeBox("dup", 10.0F, 10.0F));

    auto result = m_adapter.tryComputeLayout(*root, Size{100.0F, 100.0F});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), RenderError::LAYOUT_FAILURE);
    EXPECT_TRUE(m_adapter.computeLayout(*root, Size{100.0F, 100.0F}).empty());
    EXPECT_TRUE(noSlotsHeld(*root));

    // 不同父节点下的同名节点同样会在结果表中冲突
    auto cousins = makeBox("root", 100.0F, 100.0F);
    auto left = makeBox("left", 50.0F, 50.0F);
    left->addChild(makeBox("leaf", 10.0F, 10.0F));
    auto right = makeBox("right", 50.0F, 50.0F);
    right->addChild(makeBox("leaf", 10.0F, 10.0F));
    cousins->addChild(std::move(left));
    cousins->addChild(std::move(right));

    auto nested = m_adapter.tryComputeLayout(*cousins, Size{100.0F, 100.0F});
    ASSERT_FALSE(nested.has_value());
    EXPECT_EQ(nested.error(), RenderError::LAYOUT_FAILURE);
    EXPECT_TRUE(noSlotsHeld(*cousins));
}

// 测试 9: 相同输入得到相同结果
TEST_F(LayoutAdapterTest, Deterministic)
{
    auto root = makeList("list", {"1", "2", "3"});
    root->mutableStyle().width = Dimension::Point(320.0F);

    FixedTextMeasurer measurer;
    layout::LayoutAdapter adapter(m_pool, &measurer);
    auto first = adapter.computeLayout(*root, Size{320.0F, UNDEFINED_DIMENSION});
    auto second = adapter.computeLayout(*root, Size{320.0F, UNDEFINED_DIMENSION});

    EXPECT_EQ(first, second);
    EXPECT_EQ(first.size(), root->subtreeSize());
}

// 测试 10: 扁平化节点的偏移累加到子孙
TEST_F(LayoutAdapterTest, ApplyFramesFoldsFlattenedOffsets)
{
    auto root = makeBox("root", 300.0F, 300.0F);
    auto wrapper = makeNode("wrapper");
    wrapper->mutableStyle().margin.top = 20.0F;
    wrapper->mutableStyle().padding = EdgeInsets::All(5.0F);
    wrapper->addChild(makeBox("inner", 50.0F, 50.0F));
    root->addChild(std::move(wrapper));

    auto frames = m_adapter.computeLayout(*root, Size{300.0F, 300.0F});
    layout::LayoutAdapter::applyFrames(*root, frames);

    const Node* flat = root->findById("wrapper");
    EXPECT_TRUE(flat->flattened());
    EXPECT_FLOAT_EQ(flat->layoutResult().y, 20.0F);
    EXPECT_FALSE(root->flattened());

    const Frame& inner = root->findById("inner")->layoutResult();
    EXPECT_FLOAT_EQ(inner.x, 5.0F);
    EXPECT_FLOAT_EQ(inner.y, 25.0F);
    EXPECT_FLOAT_EQ(inner.width, 50.0F);
}

// 测试 11: 缺失的 frame 按零处理
TEST_F(LayoutAdapterTest, ApplyEmptyFramesZeroes)
{
    auto root = makeBox("root", 300.0F, 300.0F);
    root->addChild(makeText("t", "x"));
    root->findById("t")->setLayoutResult(Frame{1.0F, 2.0F, 3.0F, 4.0F});

    layout::LayoutAdapter::applyFrames(*root, {});
    EXPECT_EQ(root->findById("t")->layoutResult(), Frame{});
}

// 测试 12: 多线程同时布局互不干扰
TEST_F(LayoutAdapterTest, ConcurrentLayouts)
{
    FixedTextMeasurer measurer;
    layout::LayoutAdapter adapter(m_pool, &measurer);

    auto reference = makeList("list", {"a", "b", "c", "d"});
    reference->mutableStyle().width = Dimension::Point(200.0F);
    const auto expected = adapter.computeLayout(*reference, Size{200.0F, UNDEFINED_DIMENSION});

    std::vector<std::thread> threads;
    std::vector<layout::FrameMap> results(4);
    for (size_t t = 0; t < results.size(); ++t)
    {
        threads.emplace_back(
            [&, t]
            {
                auto tree = reference->deepClone();
                for (int i = 0; i < 20; ++i)
                {
                    results[t] = adapter.computeLayout(*tree, Size{200.0F, UNDEFINED_DIMENSION});
                }
            });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }
    for (const auto& frames : results)
    {
        EXPECT_EQ(frames, expected);
    }
}
