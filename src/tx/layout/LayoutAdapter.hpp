/**
 * ************************************************************************
 *
 * @file LayoutAdapter.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-06
 * @version 0.1
 * @brief 组件树 -> Yoga 布局适配器
 *
 * 每次调用临时建立一棵池化 Yoga 节点树，求解后按节点 id 读回 frame，
 * 返回前归还全部节点。适配器本身不保存跨调用状态，可在多个线程上
 * 对互不相干的树并发调用。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <yoga/Yoga.h>
#include <deque>
#include <expected>
#include <string>
#include <unordered_map>
#include <vector>
#include "LayoutNodePool.hpp"
#include "../common/Errors.hpp"
#include "../common/Style.hpp"
#include "../common/Types.hpp"
#include "../core/Node.hpp"
#include "../interface/ITextMeasurer.hpp"

namespace tx::layout
{

using FrameMap = std::unordered_map<std::string, Frame>;

class LayoutAdapter
{
public:
    explicit LayoutAdapter(LayoutNodePool& pool, interface::ITextMeasurer* measurer = nullptr)
        : m_pool(pool), m_measurer(measurer)
    {
    }

    /**
     * @brief 计算整棵树的布局
     * @param containerSize 任一分量为 NaN 时该方向由内容撑开
     * @return id -> frame；树为空或结构异常时返回空表并记录日志
     *
     * 结果按 id 索引，因此 id 必须在整棵树内唯一（不只是同一父节点下），
     * 任意两个节点 id 相同都按结构异常处理。
     */
    [[nodiscard]] FrameMap computeLayout(Node& root, Size containerSize) const;

    /**
     * @brief 与 computeLayout 相同，但把结构异常作为 LAYOUT_FAILURE 返回
     */
    [[nodiscard]] std::expected<FrameMap, RenderError> tryComputeLayout(Node& root, Size containerSize) const;

    /**
     * @brief 把 frame 写回节点，扁平化节点的偏移累加到子孙节点上
     *
     * 缺失 frame 的节点按零尺寸处理。
     */
    static void applyFrames(Node& root, const FrameMap& frames);

    /**
     * @brief 把样式写入原生节点
     */
    static void applyStyle(YGNodeRef node, const Style& style);

    [[nodiscard]] LayoutNodePool& pool() const noexcept { return m_pool; }

private:
    struct MeasureContext
    {
        const Node* node = nullptr;
        interface::ITextMeasurer* measurer = nullptr;
    };

    static YGSize measureCallback(
        YGNodeConstRef ygNode, float width, YGMeasureMode widthMode, float height, YGMeasureMode heightMode);

    static bool validate(const Node& root);

    YGNodeRef buildTree(Node& node, std::deque<MeasureContext>& contexts, std::vector<LayoutSlot>& acquired) const;

    void collectFrames(const Node& node, FrameMap& frames) const;

    void releaseTree(Node& node) const;

    static void applyFramesRecursive(Node& node, const FrameMap& frames, const Vec2& parentOffset);

    LayoutNodePool& m_pool;
    interface::ITextMeasurer* m_measurer;
};

} // namespace tx::layout
