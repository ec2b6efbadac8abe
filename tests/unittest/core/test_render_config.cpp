/**
 * ************************************************************************
 *
 * @file test_render_config.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-17
 * @version 0.1
 * @brief 渲染配置单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include "src/tx/config/RenderConfig.hpp"
#include <filesystem>
#include <fstream>

using namespace tx;

class RenderConfigTest : public ::testing::Test
{
protected:
    std::filesystem::path m_tempFile;

    void SetUp() override
    {
        m_tempFile = std::filesystem::temp_directory_path() / "templatex_config_test.json";
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove(m_tempFile, ec);
    }

    void writeFile(const std::string& text)
    {
        std::ofstream out(m_tempFile);
        out << text;
    }
};

// 测试 1: 预设
TEST_F(RenderConfigTest, Presets)
{
    const auto defaults = RenderConfig::defaults();
    EXPECT_EQ(defaults.syncFlushTimeoutMs, 100U);
    EXPECT_TRUE(defaults.enableViewReuse);
    EXPECT_EQ(defaults.maxDiffDepth, 50U);

    const auto fast = RenderConfig::highPerformance();
    EXPECT_GT(fast.layoutPoolMaxIdle, defaults.layoutPoolMaxIdle);
    EXPECT_GT(fast.heightCacheCapacity, defaults.heightCacheCapacity);

    const auto debug = RenderConfig::debug();
    EXPECT_TRUE(debug.enablePerformanceMonitor);
    EXPECT_TRUE(debug.enableVerboseLogging);
    EXPECT_TRUE(debug.debugPlaceholders);
}

// 测试 2: 缺省键保持默认值，未知键忽略
TEST_F(RenderConfigTest, FromJsonPartial)
{
    const nlohmann::json json = {{"syncFlushTimeoutMs", 250}, {"enableViewReuse", false}, {"somethingElse", 1}};
    auto config = RenderConfig::fromJson(json);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->syncFlushTimeoutMs, 250U);
    EXPECT_FALSE(config->enableViewReuse);
    EXPECT_EQ(config->heightCacheCapacity, 500U);
}

// 测试 3: 类型不符与负数被拒绝
TEST_F(RenderConfigTest, FromJsonRejectsBadValues)
{
    auto wrongType = RenderConfig::fromJson({{"enableViewReuse", "yes"}});
    ASSERT_FALSE(wrongType.has_value());
    EXPECT_EQ(wrongType.error(), ConfigError::INVALID_VALUE);

    auto negative = RenderConfig::fromJson({{"maxDiffDepth", -3}});
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error(), ConfigError::INVALID_VALUE);

    auto notObject = RenderConfig::fromJson(nlohmann::json::array({1, 2}));
    ASSERT_FALSE(notObject.has_value());
    EXPECT_EQ(notObject.error(), ConfigError::INVALID_VALUE);
}

// 测试 4: 从文件加载
TEST_F(RenderConfigTest, LoadFromFile)
{
    writeFile(R"({"pipelinePoolCapacity": 3, "enablePerformanceMonitor": true})");
    auto config = loadRenderConfig(m_tempFile);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->pipelinePoolCapacity, 3U);
    EXPECT_TRUE(config->enablePerformanceMonitor);
}

// 测试 5: 文件缺失与内容损坏
TEST_F(RenderConfigTest, LoadErrors)
{
    auto missing = loadRenderConfig(m_tempFile.parent_path() / "templatex_no_such_file.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), ConfigError::FILE_NOT_FOUND);

    writeFile("{ not json");
    auto broken = loadRenderConfig(m_tempFile);
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error(), ConfigError::PARSE_ERROR);
}
