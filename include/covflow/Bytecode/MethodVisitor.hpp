/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <llvm/Support/Error.h>

#include <covflow/Bytecode/Instructions.hpp>

namespace covflow::bytecode {

    /**
     * @brief Receives the elements of a method body in stream order.
     *
     * Every callback returns an llvm::Error; the first failing callback stops
     * the traversal and its error is handed back to the caller of accept().
     * The default implementations ignore the element.
     */
    class MethodVisitor
    {
      public:
        virtual ~MethodVisitor() = default;

        virtual llvm::Error visit_try_catch_block(const TryCatchBlock &) {
            return llvm::Error::success();
        }

        virtual llvm::Error visit_insn(const InsnNode &) { return llvm::Error::success(); }

        virtual llvm::Error visit_int_insn(const IntInsnNode &) {
            return llvm::Error::success();
        }

        virtual llvm::Error visit_var_insn(const VarInsnNode &) {
            return llvm::Error::success();
        }

        virtual llvm::Error visit_type_insn(const TypeInsnNode &) {
            return llvm::Error::success();
        }

        virtual llvm::Error visit_field_insn(const FieldInsnNode &) {
            return llvm::Error::success();
        }

        virtual llvm::Error visit_method_insn(const MethodInsnNode &) {
            return llvm::Error::success();
        }

        virtual llvm::Error visit_invoke_dynamic_insn(const InvokeDynamicInsnNode &) {
            return llvm::Error::success();
        }

        virtual llvm::Error visit_jump_insn(const JumpInsnNode &) {
            return llvm::Error::success();
        }

        virtual llvm::Error visit_label(const LabelNode &) { return llvm::Error::success(); }

        virtual llvm::Error visit_ldc_insn(const LdcInsnNode &) {
            return llvm::Error::success();
        }

        virtual llvm::Error visit_iinc_insn(const IincInsnNode &) {
            return llvm::Error::success();
        }

        virtual llvm::Error visit_table_switch_insn(const TableSwitchInsnNode &) {
            return llvm::Error::success();
        }

        virtual llvm::Error visit_lookup_switch_insn(const LookupSwitchInsnNode &) {
            return llvm::Error::success();
        }

        virtual llvm::Error visit_multi_anew_array_insn(const MultiANewArrayInsnNode &) {
            return llvm::Error::success();
        }

        virtual llvm::Error visit_frame(const FrameNode &) { return llvm::Error::success(); }

        virtual llvm::Error visit_line_number(const LineNumberNode &) {
            return llvm::Error::success();
        }
    };

    // Dispatches a single stream element to the matching callback.
    llvm::Error accept(const Node &node, MethodVisitor &visitor);

    // Visits the instruction list in order.
    llvm::Error accept(const InstructionList &instructions, MethodVisitor &visitor);

    // Visits the try-catch blocks first, then the instruction list.
    llvm::Error accept(const MethodBody &method, MethodVisitor &visitor);

} // namespace covflow::bytecode
