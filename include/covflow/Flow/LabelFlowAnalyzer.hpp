/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>

#include <llvm/ADT/ArrayRef.h>
#include <llvm/Support/Error.h>

#include <covflow/Bytecode/MethodVisitor.hpp>
#include <covflow/Flow/LabelFlowInfo.hpp>
#include <covflow/Util/Options.hpp>

namespace covflow::flow {

    /**
     * @brief Method visitor that records control-flow attributes of labels.
     *
     * The analyzer walks the try-catch blocks and then the instruction stream
     * of a single method. It marks labels as jump targets, detects labels
     * reached from more than one edge, marks labels reached by falling through
     * from the previous instruction, and remembers which line markers cover a
     * method invocation. Results are written into the LabelFlowInfoStore given
     * at construction.
     *
     * An analyzer instance holds the traversal state of one run and must not
     * be reused for another method.
     */
    class LabelFlowAnalyzer final : public bytecode::MethodVisitor
    {
      public:
        LabelFlowAnalyzer(LabelFlowInfoStore &store, std::string method_name)
            : store(store), method_name(std::move(method_name)) {}

        llvm::Error visit_try_catch_block(const bytecode::TryCatchBlock &block) override;

        llvm::Error visit_insn(const bytecode::InsnNode &insn) override;

        llvm::Error visit_int_insn(const bytecode::IntInsnNode &insn) override;

        llvm::Error visit_var_insn(const bytecode::VarInsnNode &insn) override;

        llvm::Error visit_type_insn(const bytecode::TypeInsnNode &insn) override;

        llvm::Error visit_field_insn(const bytecode::FieldInsnNode &insn) override;

        llvm::Error visit_method_insn(const bytecode::MethodInsnNode &insn) override;

        llvm::Error
        visit_invoke_dynamic_insn(const bytecode::InvokeDynamicInsnNode &insn) override;

        llvm::Error visit_jump_insn(const bytecode::JumpInsnNode &insn) override;

        llvm::Error visit_label(const bytecode::LabelNode &label) override;

        llvm::Error visit_ldc_insn(const bytecode::LdcInsnNode &insn) override;

        llvm::Error visit_iinc_insn(const bytecode::IincInsnNode &insn) override;

        llvm::Error visit_table_switch_insn(const bytecode::TableSwitchInsnNode &insn) override;

        llvm::Error
        visit_lookup_switch_insn(const bytecode::LookupSwitchInsnNode &insn) override;

        llvm::Error
        visit_multi_anew_array_insn(const bytecode::MultiANewArrayInsnNode &insn) override;

        llvm::Error visit_line_number(const bytecode::LineNumberNode &line) override;

        // True if the next label is reachable from the last visited instruction.
        bool has_successor() const { return successor; }

        // True until the first instruction of the method has been visited.
        bool is_first() const { return first; }

        // Most recently visited line marker
        const std::optional< bytecode::LineNumberNode > &active_line() const {
            return line_start;
        }

      private:
        // Applies the fall-through effect of an opcode; fails on subroutines.
        llvm::Error transfer(bytecode::Opcode opcode);

        void visit_switch(bytecode::Label default_target, llvm::ArrayRef< bytecode::Label > targets);

        void set_target_if_not_done(bytecode::Label label);

        void mark_method_invocation_line();

        LabelFlowInfoStore &store;
        std::string method_name;

        bool successor = false;
        bool first     = true;
        std::optional< bytecode::LineNumberNode > line_start;
    };

    /**
     * @brief Checks that every label the method refers to is placed exactly
     *        once, and that every instruction node carries an opcode of the
     *        matching operand form.
     *
     * @return StructuralInconsistencyError describing the first violation.
     */
    llvm::Error validate_method(const bytecode::MethodBody &method);

    /**
     * @brief Computes the label flow information of a single method.
     *
     * Validates the method, normalizes line markers in front of frames (unless
     * disabled in @p options) and runs a fresh LabelFlowAnalyzer. No store is
     * returned when any step fails.
     */
    llvm::Expected< LabelFlowInfoStore >
    mark_labels(bytecode::MethodBody &method, const Options &options);

} // namespace covflow::flow
