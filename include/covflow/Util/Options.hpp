/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>

namespace covflow {

    // What the driver does with a method that fails analysis
    enum class UnsupportedPolicy : uint8_t { Skip, Abort };

    enum class ReportFormat : uint8_t { Json, Text };

    struct Options
    {
        bool normalize_frames             = true;
        UnsupportedPolicy on_unsupported  = UnsupportedPolicy::Skip;
        ReportFormat format               = ReportFormat::Json;
        bool include_unmarked             = false;
        bool print_normalized             = false;
        bool verbose                      = false;

        // Stop the run on the first method that fails analysis
        bool fail_fast = false;

        std::string output_file;
        std::string input_file;
        std::string config_file;
    };

} // namespace covflow
