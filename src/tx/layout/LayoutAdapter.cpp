/**
 * ************************************************************************
 *
 * @file LayoutAdapter.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-06
 * @version 0.1
 * @brief 组件树 -> Yoga 布局适配器实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "LayoutAdapter.hpp"

#include <cmath>
#include <exception>
#include <unordered_set>
#include "../singleton/Logger.hpp"

namespace tx::layout
{

namespace
{

YGFlexDirection toYoga(policies::FlexDirection direction)
{
    switch (direction)
    {
        case policies::FlexDirection::ROW:
            return YGFlexDirectionRow;
        case policies::FlexDirection::ROW_REVERSE:
            return YGFlexDirectionRowReverse;
        case policies::FlexDirection::COLUMN_REVERSE:
            return YGFlexDirectionColumnReverse;
        case policies::FlexDirection::COLUMN:
            break;
    }
    return YGFlexDirectionColumn;
}

YGWrap toYoga(policies::FlexWrap wrap)
{
    switch (wrap)
    {
        case policies::FlexWrap::WRAP:
            return YGWrapWrap;
        case policies::FlexWrap::WRAP_REVERSE:
            return YGWrapWrapReverse;
        case policies::FlexWrap::NO_WRAP:
            break;
    }
    return YGWrapNoWrap;
}

YGJustify toYoga(policies::Justify justify)
{
    switch (justify)
    {
        case policies::Justify::CENTER:
            return YGJustifyCenter;
        case policies::Justify::FLEX_END:
            return YGJustifyFlexEnd;
        case policies::Justify::SPACE_BETWEEN:
            return YGJustifySpaceBetween;
        case policies::Justify::SPACE_AROUND:
            return YGJustifySpaceAround;
        case policies::Justify::SPACE_EVENLY:
            return YGJustifySpaceEvenly;
        case policies::Justify::FLEX_START:
            break;
    }
    return YGJustifyFlexStart;
}

YGAlign toYoga(policies::Align align)
{
    switch (align)
    {
        case policies::Align::AUTO:
            return YGAlignAuto;
        case policies::Align::CENTER:
            return YGAlignCenter;
        case policies::Align::FLEX_END:
            return YGAlignFlexEnd;
        case policies::Align::STRETCH:
            return YGAlignStretch;
        case policies::Align::BASELINE:
            return YGAlignBaseline;
        case policies::Align::SPACE_BETWEEN:
            return YGAlignSpaceBetween;
        case policies::Align::SPACE_AROUND:
            return YGAlignSpaceAround;
        case policies::Align::FLEX_START:
            break;
    }
    return YGAlignFlexStart;
}

YGOverflow toYoga(policies::Overflow overflow)
{
    switch (overflow)
    {
        case policies::Overflow::HIDDEN:
            return YGOverflowHidden;
        case policies::Overflow::SCROLL:
            return YGOverflowScroll;
        case policies::Overflow::VISIBLE:
            break;
    }
    return YGOverflowVisible;
}

interface::MeasureMode fromYoga(YGMeasureMode mode)
{
    switch (mode)
    {
        case YGMeasureModeExactly:
            return interface::MeasureMode::EXACTLY;
        case YGMeasureModeAtMost:
            return interface::MeasureMode::AT_MOST;
        case YGMeasureModeUndefined:
            break;
    }
    return interface::MeasureMode::UNDEFINED;
}

float finiteOrZero(float value)
{
    return std::isnan(value) ? 0.0F : value;
}

} // namespace

FrameMap LayoutAdapter::computeLayout(Node& root, Size containerSize) const
{
    auto result = tryComputeLayout(root, containerSize);
    if (!result) [[unlikely]]
    {
        return {};
    }
    return std::move(*result);
}

std::expected<FrameMap, RenderError> LayoutAdapter::tryComputeLayout(Node& root, Size containerSize) const
{
    // 1. 结构校验：id 必须唯一，否则 frame 映射有歧义
    if (!validate(root)) [[unlikely]]
    {
        return std::unexpected(RenderError::LAYOUT_FAILURE);
    }

    // 2. 建立池化节点树（测量上下文在整个求解期间保持地址稳定）
    std::deque<MeasureContext> contexts;
    std::vector<LayoutSlot> acquired;
    acquired.reserve(root.subtreeSize());
    YGNodeRef ygRoot = buildTree(root, contexts, acquired);
    if (ygRoot == nullptr) [[unlikely]]
    {
        Logger::error("[LayoutAdapter] 根节点 {} 无法取得布局节点", root.id());
        releaseTree(root);
        return std::unexpected(RenderError::LAYOUT_FAILURE);
    }

    // 3. 求解，NaN 分量交给内容决定
    YGNodeCalculateLayout(ygRoot, containerSize.width, containerSize.height, YGDirectionLTR);

    // 4. 读回 frame
    FrameMap frames;
    frames.reserve(acquired.size());
    collectFrames(root, frames);

    // 5. 归还全部节点
    releaseTree(root);
    return frames;
}

bool LayoutAdapter::validate(const Node& root)
{
    if (root.id().empty())
    {
        Logger::error("[LayoutAdapter] 根节点缺少 id，跳过布局");
        return false;
    }

    std::unordered_set<std::string_view> seen;
    bool ok = true;
    root.visit(
        [&](const Node& node)
        {
            if (!ok) return;
            if (!seen.insert(node.id()).second)
            {
                Logger::error("[LayoutAdapter] 节点 id 重复: {}，跳过布局", node.id());
                ok = false;
            }
        });
    return ok;
}

YGNodeRef LayoutAdapter::buildTree(Node& node,
                                   std::deque<MeasureContext>& contexts,
                                   std::vector<LayoutSlot>& acquired) const
{
    const LayoutSlot slot = m_pool.acquire();
    acquired.push_back(slot);
    node.setLayoutSlot(slot);

    YGNodeRef ygNode = m_pool.resolve(slot);
    if (ygNode == nullptr) [[unlikely]]
    {
        return nullptr;
    }

    applyStyle(ygNode, node.style());

    // 叶子文本类节点挂测量回调
    if (node.childCount() == 0 && m_measurer != nullptr && isMeasuredKind(node.kind()))
    {
        contexts.push_back(MeasureContext{&node, m_measurer});
        YGNodeSetContext(ygNode, &contexts.back());
        YGNodeSetMeasureFunc(ygNode, &LayoutAdapter::measureCallback);
    }

    for (size_t i = 0; i < node.childCount(); ++i)
    {
        YGNodeRef childNode = buildTree(*node.childAt(i), contexts, acquired);
        if (childNode == nullptr) [[unlikely]]
        {
            return nullptr;
        }
        YGNodeInsertChild(ygNode, childNode, i);
    }
    return ygNode;
}

void LayoutAdapter::collectFrames(const Node& node, FrameMap& frames) const
{
    if (YGNodeRef ygNode = m_pool.resolve(node.layoutSlot()); ygNode != nullptr)
    {
        frames.emplace(node.id(),
                       Frame{finiteOrZero(YGNodeLayoutGetLeft(ygNode)),
                             finiteOrZero(YGNodeLayoutGetTop(ygNode)),
                             finiteOrZero(YGNodeLayoutGetWidth(ygNode)),
                             finiteOrZero(YGNodeLayoutGetHeight(ygNode))});
    }

    for (const auto& child : node.children())
    {
        collectFrames(*child, frames);
    }
}

void LayoutAdapter::releaseTree(Node& node) const
{
    // 后序：先子后父
    for (const auto& child : node.children())
    {
        releaseTree(*child);
    }
    if (node.hasLayoutSlot())
    {
        m_pool.release(node.layoutSlot());
        node.clearLayoutSlot();
    }
}

YGSize LayoutAdapter::measureCallback(
    YGNodeConstRef ygNode, float width, YGMeasureMode widthMode, float height, YGMeasureMode heightMode)
{
    const auto* context = static_cast<const MeasureContext*>(YGNodeGetContext(ygNode));
    if (context == nullptr || context->node == nullptr || context->measurer == nullptr) [[unlikely]]
    {
        return YGSize{0.0F, 0.0F};
    }

    const interface::MeasureConstraints constraints{width, fromYoga(widthMode), height, fromYoga(heightMode)};
    try
    {
        const Size measured = context->measurer->measure(*context->node, constraints);
        return YGSize{finiteOrZero(measured.width), finiteOrZero(measured.height)};
    }
    catch (const std::exception& e)
    {
        // 异常不能穿过 Yoga 求解过程，按零尺寸继续
        Logger::error("[LayoutAdapter] 节点 {} 测量失败: {}", context->node->id(), e.what());
        return YGSize{0.0F, 0.0F};
    }
}

void LayoutAdapter::applyStyle(YGNodeRef node, const Style& style)
{
    // ========== 尺寸 ==========
    auto setDimension = [node](const Dimension& dim, auto setPoint, auto setPercent, auto setAuto)
    {
        switch (dim.unit)
        {
            case Dimension::Unit::POINT:
                setPoint(node, dim.value);
                break;
            case Dimension::Unit::PERCENT:
                setPercent(node, dim.value);
                break;
            case Dimension::Unit::AUTO:
                setAuto(node);
                break;
        }
    };
    setDimension(style.width, YGNodeStyleSetWidth, YGNodeStyleSetWidthPercent, YGNodeStyleSetWidthAuto);
    setDimension(style.height, YGNodeStyleSetHeight, YGNodeStyleSetHeightPercent, YGNodeStyleSetHeightAuto);
    setDimension(
        style.flexBasis, YGNodeStyleSetFlexBasis, YGNodeStyleSetFlexBasisPercent, YGNodeStyleSetFlexBasisAuto);

    if (style.minWidth) YGNodeStyleSetMinWidth(node, *style.minWidth);
    if (style.minHeight) YGNodeStyleSetMinHeight(node, *style.minHeight);
    if (style.maxWidth) YGNodeStyleSetMaxWidth(node, *style.maxWidth);
    if (style.maxHeight) YGNodeStyleSetMaxHeight(node, *style.maxHeight);

    // ========== 边距 ==========
    YGNodeStyleSetMargin(node, YGEdgeTop, style.margin.top);
    YGNodeStyleSetMargin(node, YGEdgeLeft, style.margin.left);
    YGNodeStyleSetMargin(node, YGEdgeBottom, style.margin.bottom);
    YGNodeStyleSetMargin(node, YGEdgeRight, style.margin.right);

    YGNodeStyleSetPadding(node, YGEdgeTop, style.padding.top);
    YGNodeStyleSetPadding(node, YGEdgeLeft, style.padding.left);
    YGNodeStyleSetPadding(node, YGEdgeBottom, style.padding.bottom);
    YGNodeStyleSetPadding(node, YGEdgeRight, style.padding.right);

    if (style.borderWidth > 0.0F)
    {
        YGNodeStyleSetBorder(node, YGEdgeAll, style.borderWidth);
    }

    // ========== Flex ==========
    YGNodeStyleSetFlexGrow(node, style.flexGrow);
    YGNodeStyleSetFlexShrink(node, style.flexShrink);
    YGNodeStyleSetFlexDirection(node, toYoga(style.flexDirection));
    YGNodeStyleSetFlexWrap(node, toYoga(style.flexWrap));
    YGNodeStyleSetJustifyContent(node, toYoga(style.justifyContent));
    YGNodeStyleSetAlignItems(node, toYoga(style.alignItems));
    YGNodeStyleSetAlignSelf(node, toYoga(style.alignSelf));
    YGNodeStyleSetAlignContent(node, toYoga(style.alignContent));

    // ========== 定位 ==========
    YGNodeStyleSetPositionType(node,
                               style.positionType == policies::PositionType::ABSOLUTE ? YGPositionTypeAbsolute
                                                                                     : YGPositionTypeRelative);
    if (style.position.top) YGNodeStyleSetPosition(node, YGEdgeTop, *style.position.top);
    if (style.position.left) YGNodeStyleSetPosition(node, YGEdgeLeft, *style.position.left);
    if (style.position.bottom) YGNodeStyleSetPosition(node, YGEdgeBottom, *style.position.bottom);
    if (style.position.right) YGNodeStyleSetPosition(node, YGEdgeRight, *style.position.right);

    // ========== 其他 ==========
    if (style.aspectRatio) YGNodeStyleSetAspectRatio(node, *style.aspectRatio);
    YGNodeStyleSetOverflow(node, toYoga(style.overflow));
    YGNodeStyleSetDisplay(node, style.display == policies::Display::NONE ? YGDisplayNone : YGDisplayFlex);
}

void LayoutAdapter::applyFrames(Node& root, const FrameMap& frames)
{
    applyFramesRecursive(root, frames, Vec2::Zero());
}

void LayoutAdapter::applyFramesRecursive(Node& node, const FrameMap& frames, const Vec2& parentOffset)
{
    auto iter = frames.find(node.id());
    const Frame frame = iter != frames.end() ? iter->second : Frame{};

    Vec2 offsetForChildren = Vec2::Zero();
    if (node.flattenable())
    {
        // 扁平化节点没有视图：保留原始结果，把自身偏移传给子节点
        node.setFlattened(true);
        node.setLayoutResult(frame);
        offsetForChildren = parentOffset + frame.origin();
    }
    else
    {
        node.setFlattened(false);
        node.setLayoutResult(frame.offsetBy(parentOffset));
    }

    for (const auto& child : node.children())
    {
        applyFramesRecursive(*child, frames, offsetForChildren);
    }
}

} // namespace tx::layout
