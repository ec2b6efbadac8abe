/**
 * ************************************************************************
 *
 * @file StyleParser.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-15
 * @version 0.1
 * @brief 样式解析实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "StyleParser.hpp"

#include <array>
#include <charconv>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace tx::parse
{

namespace
{

using policies::Align;
using policies::Display;
using policies::FlexDirection;
using policies::FlexWrap;
using policies::Justify;
using policies::Overflow;
using policies::PositionType;
using policies::TextAlign;
using policies::Visibility;

// ===================== 枚举映射表 =====================

template <typename T, size_t N>
using NameTable = std::array<std::pair<std::string_view, T>, N>;

constexpr NameTable<FlexDirection, 4> FLEX_DIRECTIONS{{
    {"row", FlexDirection::ROW},
    {"row-reverse", FlexDirection::ROW_REVERSE},
    {"column", FlexDirection::COLUMN},
    {"column-reverse", FlexDirection::COLUMN_REVERSE},
}};

constexpr NameTable<FlexWrap, 3> FLEX_WRAPS{{
    {"nowrap", FlexWrap::NO_WRAP},
    {"wrap", FlexWrap::WRAP},
    {"wrap-reverse", FlexWrap::WRAP_REVERSE},
}};

constexpr NameTable<Justify, 6> JUSTIFIES{{
    {"flex-start", Justify::FLEX_START},
    {"flex-end", Justify::FLEX_END},
    {"center", Justify::CENTER},
    {"space-between", Justify::SPACE_BETWEEN},
    {"space-around", Justify::SPACE_AROUND},
    {"space-evenly", Justify::SPACE_EVENLY},
}};

constexpr NameTable<Align, 8> ALIGNS{{
    {"auto", Align::AUTO},
    {"flex-start", Align::FLEX_START},
    {"flex-end", Align::FLEX_END},
    {"center", Align::CENTER},
    {"stretch", Align::STRETCH},
    {"baseline", Align::BASELINE},
    {"space-between", Align::SPACE_BETWEEN},
    {"space-around", Align::SPACE_AROUND},
}};

constexpr NameTable<PositionType, 2> POSITION_TYPES{{
    {"relative", PositionType::RELATIVE},
    {"absolute", PositionType::ABSOLUTE},
}};

constexpr NameTable<Overflow, 3> OVERFLOWS{{
    {"visible", Overflow::VISIBLE},
    {"hidden", Overflow::HIDDEN},
    {"scroll", Overflow::SCROLL},
}};

constexpr NameTable<Display, 2> DISPLAYS{{
    {"flex", Display::FLEX},
    {"none", Display::NONE},
}};

constexpr NameTable<Visibility, 2> VISIBILITIES{{
    {"visible", Visibility::VISIBLE},
    {"hidden", Visibility::HIDDEN},
}};

constexpr NameTable<TextAlign, 6> TEXT_ALIGNS{{
    {"left", TextAlign::LEFT},
    {"center", TextAlign::CENTER},
    {"right", TextAlign::RIGHT},
    {"justified", TextAlign::JUSTIFIED},
    {"start", TextAlign::START},
    {"end", TextAlign::END},
}};

template <typename T, size_t N>
std::optional<T> lookup(const NameTable<T, N>& table, const nlohmann::json& value)
{
    if (!value.is_string()) return std::nullopt;
    const auto& text = value.get_ref<const std::string&>();
    for (const auto& [name, entry] : table)
    {
        if (name == text) return entry;
    }
    return std::nullopt;
}

std::optional<float> toFloat(const nlohmann::json& value)
{
    if (!value.is_number()) return std::nullopt;
    return value.get<float>();
}

std::optional<float> parseNumberText(std::string_view text)
{
    float result = 0.0F;
    auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (error != std::errc{} || end != text.data() + text.size()) return std::nullopt;
    return result;
}

// ===================== 样式键 =====================

enum class StyleKey : uint8_t
{
    WIDTH, HEIGHT, MIN_WIDTH, MIN_HEIGHT, MAX_WIDTH, MAX_HEIGHT,
    MARGIN, PADDING,
    MARGIN_TOP, MARGIN_LEFT, MARGIN_BOTTOM, MARGIN_RIGHT, MARGIN_HORIZONTAL, MARGIN_VERTICAL,
    PADDING_TOP, PADDING_LEFT, PADDING_BOTTOM, PADDING_RIGHT, PADDING_HORIZONTAL, PADDING_VERTICAL,
    FLEX_GROW, FLEX_SHRINK, FLEX_BASIS, FLEX_DIRECTION, FLEX_WRAP,
    JUSTIFY_CONTENT, ALIGN_ITEMS, ALIGN_SELF, ALIGN_CONTENT,
    POSITION_TYPE, TOP, LEFT, BOTTOM, RIGHT,
    ASPECT_RATIO, OVERFLOW, DISPLAY, VISIBILITY,
    BACKGROUND_COLOR, CORNER_RADIUS, BORDER_WIDTH, BORDER_COLOR,
    SHADOW_COLOR, SHADOW_OFFSET, SHADOW_RADIUS, SHADOW_OPACITY,
    OPACITY, CLIPS_TO_BOUNDS,
    FONT_SIZE, FONT_WEIGHT, TEXT_COLOR, COLOR, TEXT_ALIGN, LINE_HEIGHT, LETTER_SPACING, NUMBER_OF_LINES
};

const std::unordered_map<std::string_view, StyleKey>& styleKeys()
{
    static const std::unordered_map<std::string_view, StyleKey> KEYS{
        {"width", StyleKey::WIDTH},
        {"height", StyleKey::HEIGHT},
        {"minWidth", StyleKey::MIN_WIDTH},
        {"minHeight", StyleKey::MIN_HEIGHT},
        {"maxWidth", StyleKey::MAX_WIDTH},
        {"maxHeight", StyleKey::MAX_HEIGHT},
        {"margin", StyleKey::MARGIN},
        {"padding", StyleKey::PADDING},
        {"marginTop", StyleKey::MARGIN_TOP},
        {"marginLeft", StyleKey::MARGIN_LEFT},
        {"marginBottom", StyleKey::MARGIN_BOTTOM},
        {"marginRight", StyleKey::MARGIN_RIGHT},
        {"marginHorizontal", StyleKey::MARGIN_HORIZONTAL},
        {"marginVertical", StyleKey::MARGIN_VERTICAL},
        {"paddingTop", StyleKey::PADDING_TOP},
        {"paddingLeft", StyleKey::PADDING_LEFT},
        {"paddingBottom", StyleKey::PADDING_BOTTOM},
        {"paddingRight", StyleKey::PADDING_RIGHT},
        {"paddingHorizontal", StyleKey::PADDING_HORIZONTAL},
        {"paddingVertical", StyleKey::PADDING_VERTICAL},
        {"flexGrow", StyleKey::FLEX_GROW},
        {"flexShrink", StyleKey::FLEX_SHRINK},
        {"flexBasis", StyleKey::FLEX_BASIS},
        {"flexDirection", StyleKey::FLEX_DIRECTION},
        {"flexWrap", StyleKey::FLEX_WRAP},
        {"justifyContent", StyleKey::JUSTIFY_CONTENT},
        {"alignItems", StyleKey::ALIGN_ITEMS},
        {"alignSelf", StyleKey::ALIGN_SELF},
        {"alignContent", StyleKey::ALIGN_CONTENT},
        {"position", StyleKey::POSITION_TYPE}, // positionType 的别名
        {"positionType", StyleKey::POSITION_TYPE},
        {"top", StyleKey::TOP},
        {"left", StyleKey::LEFT},
        {"bottom", StyleKey::BOTTOM},
        {"right", StyleKey::RIGHT},
        {"aspectRatio", StyleKey::ASPECT_RATIO},
        {"overflow", StyleKey::OVERFLOW},
        {"display", StyleKey::DISPLAY},
        {"visibility", StyleKey::VISIBILITY},
        {"backgroundColor", StyleKey::BACKGROUND_COLOR},
        {"cornerRadius", StyleKey::CORNER_RADIUS},
        {"borderRadius", StyleKey::CORNER_RADIUS},
        {"borderWidth", StyleKey::BORDER_WIDTH},
        {"borderColor", StyleKey::BORDER_COLOR},
        {"shadowColor", StyleKey::SHADOW_COLOR},
        {"shadowOffset", StyleKey::SHADOW_OFFSET},
        {"shadowRadius", StyleKey::SHADOW_RADIUS},
        {"shadowOpacity", StyleKey::SHADOW_OPACITY},
        {"opacity", StyleKey::OPACITY},
        {"clipsToBounds", StyleKey::CLIPS_TO_BOUNDS},
        {"fontSize", StyleKey::FONT_SIZE},
        {"fontWeight", StyleKey::FONT_WEIGHT},
        {"textColor", StyleKey::TEXT_COLOR},
        {"color", StyleKey::COLOR},
        {"textAlign", StyleKey::TEXT_ALIGN},
        {"lineHeight", StyleKey::LINE_HEIGHT},
        {"letterSpacing", StyleKey::LETTER_SPACING},
        {"numberOfLines", StyleKey::NUMBER_OF_LINES},
        {"lines", StyleKey::NUMBER_OF_LINES},
    };
    return KEYS;
}

/**
 * @brief 需要在全部键处理完之后再合并的快捷属性
 */
struct Shorthands
{
    std::optional<float> marginHorizontal;
    std::optional<float> marginVertical;
    std::optional<float> paddingHorizontal;
    std::optional<float> paddingVertical;
    std::optional<Color> color;
};

template <typename T>
bool assign(std::optional<T> parsed, T& target)
{
    if (!parsed) return false;
    target = *parsed;
    return true;
}

template <typename T>
bool assign(std::optional<T> parsed, std::optional<T>& target)
{
    if (!parsed) return false;
    target = parsed;
    return true;
}

bool applyKey(StyleKey key, const nlohmann::json& value, Style& style, Shorthands& shorthands)
{
    switch (key)
    {
        // ========== 尺寸 ==========
        case StyleKey::WIDTH:
            return assign(StyleParser::parseDimension(value), style.width);
        case StyleKey::HEIGHT:
            return assign(StyleParser::parseDimension(value), style.height);
        case StyleKey::MIN_WIDTH:
            return assign(toFloat(value), style.minWidth);
        case StyleKey::MIN_HEIGHT:
            return assign(toFloat(value), style.minHeight);
        case StyleKey::MAX_WIDTH:
            return assign(toFloat(value), style.maxWidth);
        case StyleKey::MAX_HEIGHT:
            return assign(toFloat(value), style.maxHeight);

        // ========== 边距 ==========
        case StyleKey::MARGIN:
            return assign(StyleParser::parseEdgeInsets(value), style.margin);
        case StyleKey::PADDING:
            return assign(StyleParser::parseEdgeInsets(value), style.padding);
        case StyleKey::MARGIN_TOP:
            return assign(toFloat(value), style.margin.top);
        case StyleKey::MARGIN_LEFT:
            return assign(toFloat(value), style.margin.left);
        case StyleKey::MARGIN_BOTTOM:
            return assign(toFloat(value), style.margin.bottom);
        case StyleKey::MARGIN_RIGHT:
            return assign(toFloat(value), style.margin.right);
        case StyleKey::MARGIN_HORIZONTAL:
            return assign(toFloat(value), shorthands.marginHorizontal);
        case StyleKey::MARGIN_VERTICAL:
            return assign(toFloat(value), shorthands.marginVertical);
        case StyleKey::PADDING_TOP:
            return assign(toFloat(value), style.padding.top);
        case StyleKey::PADDING_LEFT:
            return assign(toFloat(value), style.padding.left);
        case StyleKey::PADDING_BOTTOM:
            return assign(toFloat(value), style.padding.bottom);
        case StyleKey::PADDING_RIGHT:
            return assign(toFloat(value), style.padding.right);
        case StyleKey::PADDING_HORIZONTAL:
            return assign(toFloat(value), shorthands.paddingHorizontal);
        case StyleKey::PADDING_VERTICAL:
            return assign(toFloat(value), shorthands.paddingVertical);

        // ========== Flex ==========
        case StyleKey::FLEX_GROW:
            return assign(toFloat(value), style.flexGrow);
        case StyleKey::FLEX_SHRINK:
            return assign(toFloat(value), style.flexShrink);
        case StyleKey::FLEX_BASIS:
            return assign(StyleParser::parseDimension(value), style.flexBasis);
        case StyleKey::FLEX_DIRECTION:
            return assign(lookup(FLEX_DIRECTIONS, value), style.flexDirection);
        case StyleKey::FLEX_WRAP:
            return assign(lookup(FLEX_WRAPS, value), style.flexWrap);
        case StyleKey::JUSTIFY_CONTENT:
            return assign(lookup(JUSTIFIES, value), style.justifyContent);
        case StyleKey::ALIGN_ITEMS:
            return assign(lookup(ALIGNS, value), style.alignItems);
        case StyleKey::ALIGN_SELF:
            return assign(lookup(ALIGNS, value), style.alignSelf);
        case StyleKey::ALIGN_CONTENT:
            return assign(lookup(ALIGNS, value), style.alignContent);

        // ========== 定位 ==========
        case StyleKey::POSITION_TYPE:
            return assign(lookup(POSITION_TYPES, value), style.positionType);
        case StyleKey::TOP:
            return assign(toFloat(value), style.position.top);
        case StyleKey::LEFT:
            return assign(toFloat(value), style.position.left);
        case StyleKey::BOTTOM:
            return assign(toFloat(value), style.position.bottom);
        case StyleKey::RIGHT:
            return assign(toFloat(value), style.position.right);

        // ========== 其他布局 ==========
        case StyleKey::ASPECT_RATIO:
            return assign(toFloat(value), style.aspectRatio);
        case StyleKey::OVERFLOW:
            return assign(lookup(OVERFLOWS, value), style.overflow);
        case StyleKey::DISPLAY:
            return assign(lookup(DISPLAYS, value), style.display);
        case StyleKey::VISIBILITY:
            return assign(lookup(VISIBILITIES, value), style.visibility);

        // ========== 装饰 ==========
        case StyleKey::BACKGROUND_COLOR:
            return assign(StyleParser::parseColor(value), style.backgroundColor);
        case StyleKey::CORNER_RADIUS:
            return assign(toFloat(value), style.cornerRadius);
        case StyleKey::BORDER_WIDTH:
            return assign(toFloat(value), style.borderWidth);
        case StyleKey::BORDER_COLOR:
            return assign(StyleParser::parseColor(value), style.borderColor);
        case StyleKey::SHADOW_COLOR:
            return assign(StyleParser::parseColor(value), style.shadowColor);
        case StyleKey::SHADOW_OFFSET:
        {
            if (!value.is_array() || value.size() < 2) return false;
            auto x = toFloat(value[0]);
            auto y = toFloat(value[1]);
            if (!x || !y) return false;
            style.shadowOffsetX = *x;
            style.shadowOffsetY = *y;
            return true;
        }
        case StyleKey::SHADOW_RADIUS:
            return assign(toFloat(value), style.shadowRadius);
        case StyleKey::SHADOW_OPACITY:
            return assign(toFloat(value), style.shadowOpacity);
        case StyleKey::OPACITY:
            return assign(toFloat(value), style.opacity);
        case StyleKey::CLIPS_TO_BOUNDS:
            if (!value.is_boolean()) return false;
            style.clipsToBounds = value.get<bool>();
            return true;

        // ========== 文本 ==========
        case StyleKey::FONT_SIZE:
            return assign(toFloat(value), style.fontSize);
        case StyleKey::FONT_WEIGHT:
            if (value.is_string())
            {
                style.fontWeight = value.get<std::string>();
                return true;
            }
            if (value.is_number_integer())
            {
                style.fontWeight = std::to_string(value.get<int>());
                return true;
            }
            return false;
        case StyleKey::TEXT_COLOR:
            return assign(StyleParser::parseColor(value), style.textColor);
        case StyleKey::COLOR:
            return assign(StyleParser::parseColor(value), shorthands.color);
        case StyleKey::TEXT_ALIGN:
            return assign(lookup(TEXT_ALIGNS, value), style.textAlign);
        case StyleKey::LINE_HEIGHT:
            return assign(toFloat(value), style.lineHeight);
        case StyleKey::LETTER_SPACING:
            return assign(toFloat(value), style.letterSpacing);
        case StyleKey::NUMBER_OF_LINES:
            if (!value.is_number()) return false;
            style.numberOfLines = static_cast<int>(value.get<double>());
            return true;
    }
    return false;
}

} // namespace

std::expected<Style, std::string> StyleParser::parse(const nlohmann::json& json)
{
    Style style;
    if (json.is_null())
    {
        return style;
    }
    if (!json.is_object())
    {
        return std::unexpected(std::string("style must be an object"));
    }

    // 1. 逐键写入
    Shorthands shorthands;
    const auto& keys = styleKeys();
    for (const auto& [name, value] : json.items())
    {
        auto iter = keys.find(name);
        if (iter == keys.end())
        {
            continue;
        }
        if (!applyKey(iter->second, value, style, shorthands))
        {
            return std::unexpected(name + ": unsupported value " + value.dump());
        }
    }

    // 2. 合并快捷属性
    if (shorthands.marginHorizontal)
    {
        style.margin.left = style.margin.right = *shorthands.marginHorizontal;
    }
    if (shorthands.marginVertical)
    {
        style.margin.top = style.margin.bottom = *shorthands.marginVertical;
    }
    if (shorthands.paddingHorizontal)
    {
        style.padding.left = style.padding.right = *shorthands.paddingHorizontal;
    }
    if (shorthands.paddingVertical)
    {
        style.padding.top = style.padding.bottom = *shorthands.paddingVertical;
    }
    if (!style.textColor && shorthands.color)
    {
        style.textColor = shorthands.color;
    }
    return style;
}

std::optional<Dimension> StyleParser::parseDimension(const nlohmann::json& value)
{
    if (value.is_number())
    {
        return Dimension::Point(value.get<float>());
    }
    if (!value.is_string())
    {
        return std::nullopt;
    }

    std::string_view text = value.get_ref<const std::string&>();
    if (text == "auto")
    {
        return Dimension::Auto();
    }
    if (text.ends_with('%'))
    {
        if (auto percent = parseNumberText(text.substr(0, text.size() - 1)))
        {
            return Dimension::Percent(*percent);
        }
        return std::nullopt;
    }
    if (auto point = parseNumberText(text))
    {
        return Dimension::Point(*point);
    }
    return std::nullopt;
}

std::optional<EdgeInsets> StyleParser::parseEdgeInsets(const nlohmann::json& value)
{
    if (auto all = toFloat(value))
    {
        return EdgeInsets::All(*all);
    }

    if (value.is_array())
    {
        std::array<float, 4> edges{};
        if (value.size() != 2 && value.size() != 4) return std::nullopt;
        for (size_t i = 0; i < value.size(); ++i)
        {
            auto edge = toFloat(value[i]);
            if (!edge) return std::nullopt;
            edges[i] = *edge;
        }
        if (value.size() == 2)
        {
            return EdgeInsets::Symmetric(edges[0], edges[1]);
        }
        // [top, right, bottom, left]
        return EdgeInsets{edges[0], edges[3], edges[2], edges[1]};
    }

    if (value.is_object())
    {
        EdgeInsets insets;
        auto read = [&value](const char* name, float& out)
        {
            auto iter = value.find(name);
            if (iter == value.end()) return true;
            auto parsed = toFloat(*iter);
            if (!parsed) return false;
            out = *parsed;
            return true;
        };
        if (!read("top", insets.top) || !read("left", insets.left) || !read("bottom", insets.bottom) ||
            !read("right", insets.right))
        {
            return std::nullopt;
        }
        return insets;
    }
    return std::nullopt;
}

std::optional<Color> StyleParser::parseColor(const nlohmann::json& value)
{
    if (value.is_string())
    {
        return Color::fromHex(value.get_ref<const std::string&>());
    }
    if (value.is_number_integer())
    {
        return Color::fromARGB(static_cast<uint32_t>(value.get<int64_t>()));
    }
    return std::nullopt;
}

} // namespace tx::parse
