/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <optional>

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/DenseMap.h>

#include <covflow/Bytecode/Instructions.hpp>

namespace covflow::flow {

    /**
     * @brief Control-flow attributes recorded for a single label.
     *
     * Invariant: is_multi_target implies is_target.
     */
    struct LabelFlowInfo
    {
        bool is_target       = false;
        bool is_multi_target = false;
        bool is_successor    = false;

        // Line of the line marker this label starts, recorded when a call
        // instruction executes while that marker is active.
        std::optional< uint32_t > method_invocation_line;

        // Only meaningful while a single switch instruction is processed.
        bool done = false;
    };

    /**
     * @brief Identity keyed table of LabelFlowInfo records.
     *
     * One store belongs to one analysis run. Labels that were never touched
     * read as a default constructed record.
     */
    class LabelFlowInfoStore
    {
      public:
        void mark_target(bytecode::Label label);

        void mark_successor(bytecode::Label label);

        void set_method_invocation_line(bytecode::Label label, uint32_t line);

        void reset_done(bytecode::Label label);

        void reset_done(llvm::ArrayRef< bytecode::Label > labels);

        bool is_done(bytecode::Label label) const;

        void mark_done(bytecode::Label label);

        LabelFlowInfo get(bytecode::Label label) const;

        bool is_target(bytecode::Label label) const { return get(label).is_target; }

        bool is_multi_target(bytecode::Label label) const {
            return get(label).is_multi_target;
        }

        bool is_successor(bytecode::Label label) const { return get(label).is_successor; }

        std::optional< uint32_t > method_invocation_line(bytecode::Label label) const {
            return get(label).method_invocation_line;
        }

        // A probe is needed where fall-through meets another incoming edge,
        // or where a line containing a call begins.
        bool needs_probe(bytecode::Label label) const;

        // Number of labels with a record.
        unsigned size() const { return infos.size(); }

      private:
        llvm::DenseMap< bytecode::Label, LabelFlowInfo > infos;
    };

} // namespace covflow::flow
