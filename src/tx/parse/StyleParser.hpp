/**
 * ************************************************************************
 *
 * @file StyleParser.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-15
 * @version 0.1
 * @brief JSON 样式对象 -> Style
 *
 * 尺寸接受数字、"auto"、"50%"；四边值接受数字、[v, h]、[t, r, b, l]
 * 或 {top, left, bottom, right}。marginHorizontal 等快捷键在逐边键之后合并，
 * textColor 优先于 color。未知键忽略，已知键取值无法识别时报错。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <optional>
#include <string>
#include "../common/Style.hpp"
#include "../common/Types.hpp"

namespace tx::parse
{

class StyleParser
{
public:
    /**
     * @return 错误时返回出错的键名与原因
     */
    static std::expected<Style, std::string> parse(const nlohmann::json& json);

    static std::optional<Dimension> parseDimension(const nlohmann::json& value);
    static std::optional<EdgeInsets> parseEdgeInsets(const nlohmann::json& value);

    /**
     * @brief 字符串按十六进制解析，整数按 0xAARRGGBB 解析
     */
    static std::optional<Color> parseColor(const nlohmann::json& value);
};

} // namespace tx::parse
