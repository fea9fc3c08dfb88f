#include "AppConfig.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

ParseResult parse(const std::vector<const char*>& rest, AppConfig& cfg, std::string& error) {
    std::vector<const char*> argv{"obj_viewer"};
    argv.insert(argv.end(), rest.begin(), rest.end());
    return parseArgs((int)argv.size(), argv.data(), cfg, error);
}

} // namespace

TEST(AppConfig, Defaults) {
    AppConfig cfg;
    EXPECT_EQ(cfg.width, 1280);
    EXPECT_EQ(cfg.height, 720);
    EXPECT_FLOAT_EQ(cfg.fovyDeg, 45.0f);
    EXPECT_FLOAT_EQ(cfg.znear, 0.1f);
    EXPECT_FLOAT_EQ(cfg.zfar, 100.0f);
    EXPECT_TRUE(cfg.vsync);
    EXPECT_EQ(cfg.resolvedModelPath(), "assets/cube.obj");

    std::vector<std::string> tex = cfg.resolvedTexturePaths();
    ASSERT_EQ(tex.size(), 2u);
    EXPECT_EQ(tex[0], "assets/road01.png");
    EXPECT_EQ(tex[1], "assets/dirt01.png");
}

TEST(AppConfig, NoArgumentsKeepsDefaults) {
    AppConfig cfg;
    std::string error;
    EXPECT_EQ(parse({}, cfg, error), ParseResult::Ok);
    EXPECT_TRUE(error.empty());
    EXPECT_EQ(cfg.width, 1280);
    EXPECT_TRUE(cfg.modelPath.empty());
}

TEST(AppConfig, ParsesOptions) {
    AppConfig cfg;
    std::string error;
    ASSERT_EQ(parse({"--width", "800", "--height", "600", "--fov", "60", "--speed", "2.5",
                     "--sensitivity", "0.1", "--shaders", "glsl", "--assets", "/data",
                     "--no-vsync", "scene.gltf"},
                    cfg, error),
              ParseResult::Ok)
        << error;

    EXPECT_EQ(cfg.width, 800);
    EXPECT_EQ(cfg.height, 600);
    EXPECT_FLOAT_EQ(cfg.fovyDeg, 60.0f);
    EXPECT_FLOAT_EQ(cfg.moveSpeed, 2.5f);
    EXPECT_FLOAT_EQ(cfg.sensitivity, 0.1f);
    EXPECT_EQ(cfg.shaderDir, "glsl");
    EXPECT_EQ(cfg.assetDir, "/data");
    EXPECT_FALSE(cfg.vsync);
    EXPECT_EQ(cfg.resolvedModelPath(), "scene.gltf");
    EXPECT_EQ(cfg.resolvedTexturePaths()[0], "/data/road01.png");
}

TEST(AppConfig, HelpStopsParsing) {
    AppConfig cfg;
    std::string error;
    EXPECT_EQ(parse({"--help"}, cfg, error), ParseResult::Help);
    EXPECT_EQ(parse({"--width", "640", "-h", "--bogus"}, cfg, error), ParseResult::Help);
    EXPECT_NE(std::string(usageText()).find("--fov"), std::string::npos);
}

TEST(AppConfig, RejectsBadInput) {
    struct Case {
        std::vector<const char*> args;
        const char* message;
    };
    const Case cases[] = {
        {{"--width"}, "missing value for --width"},
        {{"--width", "0"}, "invalid value '0' for --width"},
        {{"--height", "12abc"}, "invalid value '12abc' for --height"},
        {{"--width", "20000"}, "invalid value '20000' for --width"},
        {{"--fov", "180"}, "invalid value '180' for --fov"},
        {{"--speed", "-1"}, "invalid value '-1' for --speed"},
        {{"--sensitivity", "fast"}, "invalid value 'fast' for --sensitivity"},
        {{"--sensitivity", "inf"}, "invalid value 'inf' for --sensitivity"},
        {{"--speed", "nan"}, "invalid value 'nan' for --speed"},
        {{"--fov", "1e39"}, "invalid value '1e39' for --fov"},
        {{"--bogus", "1"}, "unknown option --bogus"},
        {{"a.obj", "b.obj"}, "more than one model path given"},
    };
    for (const Case& c : cases) {
        AppConfig cfg;
        std::string error;
        EXPECT_EQ(parse(c.args, cfg, error), ParseResult::Error) << c.message;
        EXPECT_EQ(error, c.message);
    }
}
