/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <covflow/Bytecode/Instructions.hpp>
#include <covflow/Flow/LabelFlowInfo.hpp>
#include <covflow/Util/Options.hpp>

namespace covflow::flow {

    enum class MethodStatus : uint8_t { Analyzed, Unsupported, Inconsistent };

    struct LabelReport
    {
        std::string name;
        LabelFlowInfo info;
        bool needs_probe = false;
    };

    struct MethodReport
    {
        std::string name;
        std::string descriptor;
        MethodStatus status = MethodStatus::Analyzed;

        // Set for methods that were rejected by the analysis
        std::string error;

        // Placed labels in stream order
        std::vector< LabelReport > labels;

        unsigned probe_count() const;
    };

    struct ClassReport
    {
        std::string name;
        std::vector< MethodReport > methods;
    };

    /**
     * @brief Collects the flow information of every label placed in the method.
     *
     * Labels without any recorded attribute are left out unless
     * @p include_unmarked is set.
     */
    MethodReport make_method_report(
        const bytecode::MethodBody &method, const LabelFlowInfoStore &store,
        bool include_unmarked
    );

    // Consumes the analysis error and records it on a report for the method.
    MethodReport make_rejected_report(const bytecode::MethodBody &method, llvm::Error err);

    /**
     * @brief Runs mark_labels on every method of the class and reports the results.
     *
     * Methods are normalized in place. A method that fails analysis is kept
     * in the report as rejected, unless options.fail_fast is set or the
     * failure is an unsupported construct under UnsupportedPolicy::Abort. In
     * those cases the failure is returned and no report is produced.
     */
    llvm::Expected< ClassReport >
    analyze_class(bytecode::ClassFile &class_file, const Options &options);

    void write_json_report(const ClassReport &report, llvm::raw_ostream &os);

    void write_text_report(const ClassReport &report, llvm::raw_ostream &os);

    void write_report(const ClassReport &report, ReportFormat format, llvm::raw_ostream &os);

    llvm::StringRef to_string(MethodStatus status);

} // namespace covflow::flow
