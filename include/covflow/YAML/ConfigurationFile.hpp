/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/YAMLTraits.h>

#include <covflow/Util/Options.hpp>

namespace covflow::yaml {

    // Only document version understood by this release
    inline constexpr llvm::StringLiteral api_version = "covflow/v1";

    struct AnalysisConfig
    {
        bool normalize_frames            = true;
        UnsupportedPolicy on_unsupported = UnsupportedPolicy::Skip;
    };

    struct ReportConfig
    {
        ReportFormat format   = ReportFormat::Json;
        bool include_unmarked = false;
    };

    struct Configuration
    {
        std::string api_version;
        AnalysisConfig analysis;
        ReportConfig report;
    };

    // Copies the file settings into run options.
    void apply_configuration(const Configuration &config, Options &options);

    namespace utils {

        llvm::Expected< Configuration > loadConfiguration(const std::string &file_path);

    } // namespace utils

} // namespace covflow::yaml

namespace llvm::yaml {

    template<>
    struct ScalarEnumerationTraits< covflow::UnsupportedPolicy >
    {
        static void enumeration(IO &io, covflow::UnsupportedPolicy &policy) {
            io.enumCase(policy, "skip", covflow::UnsupportedPolicy::Skip);
            io.enumCase(policy, "abort", covflow::UnsupportedPolicy::Abort);
        }
    };

    template<>
    struct ScalarEnumerationTraits< covflow::ReportFormat >
    {
        static void enumeration(IO &io, covflow::ReportFormat &format) {
            io.enumCase(format, "json", covflow::ReportFormat::Json);
            io.enumCase(format, "text", covflow::ReportFormat::Text);
        }
    };

    // Parse analysis section
    template<>
    struct MappingTraits< covflow::yaml::AnalysisConfig >
    {
        static void mapping(IO &io, covflow::yaml::AnalysisConfig &analysis) {
            io.mapOptional("normalize_frames", analysis.normalize_frames, true);
            io.mapOptional(
                "on_unsupported", analysis.on_unsupported, covflow::UnsupportedPolicy::Skip
            );
        }
    };

    // Parse report section
    template<>
    struct MappingTraits< covflow::yaml::ReportConfig >
    {
        static void mapping(IO &io, covflow::yaml::ReportConfig &report) {
            io.mapOptional("format", report.format, covflow::ReportFormat::Json);
            io.mapOptional("include_unmarked", report.include_unmarked, false);
        }
    };

    // Parse Configuration
    template<>
    struct MappingTraits< covflow::yaml::Configuration >
    {
        static void mapping(IO &io, covflow::yaml::Configuration &config) {
            io.mapOptional("apiVersion", config.api_version);
            io.mapOptional("analysis", config.analysis);
            io.mapOptional("report", config.report);

            if (!io.outputting() && !config.api_version.empty()
                && config.api_version != covflow::yaml::api_version)
            {
                io.setError(
                    "Unsupported apiVersion '" + config.api_version + "', expected '"
                    + covflow::yaml::api_version.str() + "'"
                );
            }
        }
    };

} // namespace llvm::yaml
