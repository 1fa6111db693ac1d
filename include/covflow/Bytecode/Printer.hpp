/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <llvm/Support/raw_ostream.h>

#include <covflow/Bytecode/MethodVisitor.hpp>

namespace covflow::bytecode {

    /**
     * @brief Writes a method body as one element per line.
     *
     * Labels are printed by display name and flush left, everything else is
     * indented. The output is meant for humans and is not parsed back.
     */
    class InstructionPrinter final : public MethodVisitor
    {
      public:
        InstructionPrinter(const MethodBody &method, llvm::raw_ostream &os)
            : method(method), os(os) {}

        llvm::Error visit_try_catch_block(const TryCatchBlock &block) override;

        llvm::Error visit_insn(const InsnNode &insn) override;

        llvm::Error visit_int_insn(const IntInsnNode &insn) override;

        llvm::Error visit_var_insn(const VarInsnNode &insn) override;

        llvm::Error visit_type_insn(const TypeInsnNode &insn) override;

        llvm::Error visit_field_insn(const FieldInsnNode &insn) override;

        llvm::Error visit_method_insn(const MethodInsnNode &insn) override;

        llvm::Error visit_invoke_dynamic_insn(const InvokeDynamicInsnNode &insn) override;

        llvm::Error visit_jump_insn(const JumpInsnNode &insn) override;

        llvm::Error visit_label(const LabelNode &label) override;

        llvm::Error visit_ldc_insn(const LdcInsnNode &insn) override;

        llvm::Error visit_iinc_insn(const IincInsnNode &insn) override;

        llvm::Error visit_table_switch_insn(const TableSwitchInsnNode &insn) override;

        llvm::Error visit_lookup_switch_insn(const LookupSwitchInsnNode &insn) override;

        llvm::Error visit_multi_anew_array_insn(const MultiANewArrayInsnNode &insn) override;

        llvm::Error visit_frame(const FrameNode &frame) override;

        llvm::Error visit_line_number(const LineNumberNode &line) override;

      private:
        void print_entries(llvm::ArrayRef< FrameEntry > entries);

        const MethodBody &method;
        llvm::raw_ostream &os;
    };

    // Prints the method header followed by its try-catch blocks and instructions.
    void print_method(const MethodBody &method, llvm::raw_ostream &os);

    llvm::StringRef to_string(FrameType type);

    llvm::StringRef to_string(VerificationType type);

} // namespace covflow::bytecode
