/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <string>

#include <gtest/gtest.h>

#include <llvm/Support/Error.h>

#include <covflow/YAML/ConfigurationFile.hpp>
#include <covflow/YAML/YAMLParser.hpp>

namespace covflow::yaml {
    namespace {

        std::string parse_failure(llvm::StringRef text) {
            auto config = YAMLParser("inline.yaml").parse< Configuration >(text);
            if (config) {
                return {};
            }
            return llvm::toString(config.takeError());
        }

        TEST(ConfigurationTest, ParsesAllSections) {
            auto config = YAMLParser().parse< Configuration >(
                "apiVersion: covflow/v1\n"
                "analysis:\n"
                "  normalize_frames: false\n"
                "  on_unsupported: abort\n"
                "report:\n"
                "  format: text\n"
                "  include_unmarked: true\n"
            );
            ASSERT_TRUE(static_cast< bool >(config)) << llvm::toString(config.takeError());
            EXPECT_EQ(config->api_version, "covflow/v1");
            EXPECT_FALSE(config->analysis.normalize_frames);
            EXPECT_EQ(config->analysis.on_unsupported, UnsupportedPolicy::Abort);
            EXPECT_EQ(config->report.format, ReportFormat::Text);
            EXPECT_TRUE(config->report.include_unmarked);
        }

        TEST(ConfigurationTest, MissingKeysKeepDefaults) {
            auto config = YAMLParser().parse< Configuration >("report:\n  format: json\n");
            ASSERT_TRUE(static_cast< bool >(config)) << llvm::toString(config.takeError());
            EXPECT_TRUE(config->api_version.empty());
            EXPECT_TRUE(config->analysis.normalize_frames);
            EXPECT_EQ(config->analysis.on_unsupported, UnsupportedPolicy::Skip);
            EXPECT_EQ(config->report.format, ReportFormat::Json);
            EXPECT_FALSE(config->report.include_unmarked);
        }

        TEST(ConfigurationTest, RejectsUnknownPolicy) {
            auto message = parse_failure("analysis:\n  on_unsupported: ignore\n");
            ASSERT_FALSE(message.empty());
            EXPECT_NE(message.find("inline.yaml"), std::string::npos) << message;
        }

        TEST(ConfigurationTest, RejectsOtherApiVersion) {
            auto message = parse_failure("apiVersion: covflow/v2\n");
            EXPECT_NE(message.find("covflow/v2"), std::string::npos) << message;
        }

        TEST(ConfigurationTest, AppliesToOptions) {
            Configuration config;
            config.analysis.normalize_frames = false;
            config.analysis.on_unsupported   = UnsupportedPolicy::Abort;
            config.report.format             = ReportFormat::Text;
            config.report.include_unmarked   = true;

            Options options;
            options.input_file = "in.json";
            apply_configuration(config, options);

            EXPECT_FALSE(options.normalize_frames);
            EXPECT_EQ(options.on_unsupported, UnsupportedPolicy::Abort);
            EXPECT_EQ(options.format, ReportFormat::Text);
            EXPECT_TRUE(options.include_unmarked);
            EXPECT_EQ(options.input_file, "in.json");
        }

        TEST(ConfigurationTest, SerializedConfigurationParsesBack) {
            Configuration config;
            config.api_version             = "covflow/v1";
            config.analysis.on_unsupported = UnsupportedPolicy::Abort;

            auto text = YAMLParser::serialize(config);
            EXPECT_NE(text.find("apiVersion:"), std::string::npos) << text;
            EXPECT_NE(text.find("abort"), std::string::npos) << text;

            auto reparsed = YAMLParser().parse< Configuration >(text);
            ASSERT_TRUE(static_cast< bool >(reparsed)) << llvm::toString(reparsed.takeError());
            EXPECT_EQ(reparsed->analysis.on_unsupported, UnsupportedPolicy::Abort);
        }

        TEST(ConfigurationTest, LoadsConfigurationFile) {
            auto config = utils::loadConfiguration(COVFLOW_TEST_INPUTS_DIR "/covflow.yaml");
            ASSERT_TRUE(static_cast< bool >(config)) << llvm::toString(config.takeError());
            EXPECT_FALSE(config->analysis.normalize_frames);
            EXPECT_EQ(config->report.format, ReportFormat::Text);
        }

        TEST(ConfigurationTest, MissingFileNamesThePath) {
            auto config = utils::loadConfiguration(COVFLOW_TEST_INPUTS_DIR "/absent.yaml");
            ASSERT_FALSE(static_cast< bool >(config));
            auto message = llvm::toString(config.takeError());
            EXPECT_NE(message.find("absent.yaml"), std::string::npos) << message;
        }

    } // namespace
} // namespace covflow::yaml
