#include "config.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <fstream>

using namespace facewatch;
using facewatch::testutil::TempDir;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { Config::getInstance().clear(); }
    void TearDown() override { Config::getInstance().clear(); }

    std::string writeConfig(const std::string& text) {
        std::string path = dir_.file("facewatch.conf");
        std::ofstream(path) << text;
        return path;
    }

    TempDir dir_;
};

TEST_F(ConfigTest, ParsesSectionsAndTypes) {
    auto& config = Config::getInstance();
    ASSERT_TRUE(config.load(writeConfig(
        "# comment\n"
        "[recognition]\n"
        "classifiers_dir = /var/lib/facewatch\n"
        "face_margin = 0.2\n"
        "\n"
        "[notify]\n"
        "period_seconds=3\n"
        "mode = per_identity\n"
        "[control]\n"
        "enabled = yes\n"
        "port = 43210\n"
        "[person:Jane Doe]\n"
        "position = CTO\n")));

    EXPECT_EQ(config.getString("recognition", "classifiers_dir"), std::optional<std::string>("/var/lib/facewatch"));
    EXPECT_DOUBLE_EQ(*config.getDouble("recognition", "face_margin"), 0.2);
    EXPECT_EQ(config.getInt("notify", "period_seconds"), std::optional<int>(3));
    EXPECT_EQ(config.getBool("control", "enabled"), std::optional<bool>(true));
    EXPECT_EQ(config.getString("person:Jane Doe", "position"), std::optional<std::string>("CTO"));
    EXPECT_FALSE(config.getString("notify", "missing").has_value());
    EXPECT_TRUE(config.getValidationErrors().empty());
}

TEST_F(ConfigTest, MissingRecognitionSectionIsInvalid) {
    auto& config = Config::getInstance();
    EXPECT_FALSE(config.load(writeConfig("[notify]\nprobability = 0.5\n")));
    ASSERT_EQ(config.getValidationErrors().size(), 1u);
}

TEST_F(ConfigTest, OutOfRangeValuesAreReported) {
    auto& config = Config::getInstance();
    EXPECT_FALSE(config.load(writeConfig(
        "[recognition]\n"
        "[notify]\n"
        "probability = 1.5\n"
        "mode = sometimes\n"
        "[control]\n"
        "port = 70000\n")));
    EXPECT_EQ(config.getValidationErrors().size(), 3u);
}

TEST_F(ConfigTest, UnreadableFile) {
    EXPECT_FALSE(Config::getInstance().load(dir_.file("absent.conf")));
}

TEST_F(ConfigTest, NonNumericValuesAreNotNumbers) {
    auto& config = Config::getInstance();
    ASSERT_TRUE(config.load(writeConfig("[recognition]\n[person:Jane]\nage = unknown\n")));
    EXPECT_FALSE(config.getInt("person:Jane", "age").has_value());
    EXPECT_FALSE(config.getDouble("person:Jane", "age").has_value());
    EXPECT_FALSE(config.getBool("person:Jane", "age").has_value());
}

TEST_F(ConfigTest, LaterFilesOverrideEarlierValues) {
    auto& config = Config::getInstance();
    ASSERT_TRUE(config.load(writeConfig("[recognition]\nclassifier_encoding = utf-8\n[notify]\nstay_seconds = 60\n")));
    const std::string override_path = dir_.file("override.conf");
    std::ofstream(override_path) << "[notify]\nstay_seconds = 120\n";
    ASSERT_TRUE(config.load(override_path));
    EXPECT_EQ(config.getString("recognition", "classifier_encoding"), std::optional<std::string>("utf-8"));
    EXPECT_EQ(config.getInt("notify", "stay_seconds"), std::optional<int>(120));
}

TEST_F(ConfigTest, MalformedLinesAreReportedWithLineNumber) {
    auto& config = Config::getInstance();
    const std::string path = writeConfig("[recognition]\nface_margin 0.2\n");
    EXPECT_FALSE(config.load(path));
    ASSERT_EQ(config.getValidationErrors().size(), 1u);
    EXPECT_EQ(config.getValidationErrors()[0], path + ":2: expected key = value");
}

TEST_F(ConfigTest, QuotedValuesKeepBlanks) {
    auto& config = Config::getInstance();
    ASSERT_TRUE(config.load(writeConfig("[recognition]\n[person:Jane]\ncompany = \"  ACME \"\n")));
    EXPECT_EQ(config.getString("person:Jane", "company"), std::optional<std::string>("  ACME "));
}

TEST_F(ConfigTest, BooleansAreValidated) {
    auto& config = Config::getInstance();
    EXPECT_FALSE(config.load(writeConfig("[recognition]\ndebug = maybe\n")));
    ASSERT_EQ(config.getValidationErrors().size(), 1u);
    EXPECT_NE(config.getValidationErrors()[0].find("[recognition].debug"), std::string::npos);
}
