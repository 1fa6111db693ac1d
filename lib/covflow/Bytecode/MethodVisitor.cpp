/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <covflow/Bytecode/MethodVisitor.hpp>
#include <covflow/Util/Common.hpp>

namespace covflow::bytecode {

    llvm::Error accept(const Node &node, MethodVisitor &visitor) {
        return std::visit(
            overloaded{
                [&](const InsnNode &insn) { return visitor.visit_insn(insn); },
                [&](const IntInsnNode &insn) { return visitor.visit_int_insn(insn); },
                [&](const VarInsnNode &insn) { return visitor.visit_var_insn(insn); },
                [&](const TypeInsnNode &insn) { return visitor.visit_type_insn(insn); },
                [&](const FieldInsnNode &insn) { return visitor.visit_field_insn(insn); },
                [&](const MethodInsnNode &insn) { return visitor.visit_method_insn(insn); },
                [&](const InvokeDynamicInsnNode &insn) {
                    return visitor.visit_invoke_dynamic_insn(insn);
                },
                [&](const JumpInsnNode &insn) { return visitor.visit_jump_insn(insn); },
                [&](const LabelNode &label) { return visitor.visit_label(label); },
                [&](const LdcInsnNode &insn) { return visitor.visit_ldc_insn(insn); },
                [&](const IincInsnNode &insn) { return visitor.visit_iinc_insn(insn); },
                [&](const TableSwitchInsnNode &insn) {
                    return visitor.visit_table_switch_insn(insn);
                },
                [&](const LookupSwitchInsnNode &insn) {
                    return visitor.visit_lookup_switch_insn(insn);
                },
                [&](const MultiANewArrayInsnNode &insn) {
                    return visitor.visit_multi_anew_array_insn(insn);
                },
                [&](const FrameNode &frame) { return visitor.visit_frame(frame); },
                [&](const LineNumberNode &line) { return visitor.visit_line_number(line); },
            },
            node
        );
    }

    llvm::Error accept(const InstructionList &instructions, MethodVisitor &visitor) {
        for (const auto &node : instructions) {
            if (auto err = accept(node, visitor)) {
                return err;
            }
        }
        return llvm::Error::success();
    }

    llvm::Error accept(const MethodBody &method, MethodVisitor &visitor) {
        for (const auto &block : method.try_catch_blocks) {
            if (auto err = visitor.visit_try_catch_block(block)) {
                return err;
            }
        }
        return accept(method.instructions, visitor);
    }

} // namespace covflow::bytecode
