/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <covflow/YAML/ConfigurationFile.hpp>
#include <covflow/YAML/YAMLParser.hpp>

namespace covflow::yaml {

    void apply_configuration(const Configuration &config, Options &options) {
        options.normalize_frames = config.analysis.normalize_frames;
        options.on_unsupported   = config.analysis.on_unsupported;
        options.format           = config.report.format;
        options.include_unmarked = config.report.include_unmarked;
    }

    namespace utils {

        llvm::Expected< Configuration > loadConfiguration(const std::string &file_path) {
            return YAMLParser::parse_file< Configuration >(file_path);
        }

    } // namespace utils

} // namespace covflow::yaml
