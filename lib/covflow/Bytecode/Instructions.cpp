/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <string>

#include <covflow/Bytecode/Instructions.hpp>
#include <covflow/Util/Common.hpp>

namespace covflow::bytecode {

    std::optional< Opcode > opcode_of(const Node &node) {
        return std::visit(
            overloaded{
                [](const InsnNode &insn) -> std::optional< Opcode > { return insn.opcode; },
                [](const IntInsnNode &insn) -> std::optional< Opcode > { return insn.opcode; },
                [](const VarInsnNode &insn) -> std::optional< Opcode > { return insn.opcode; },
                [](const TypeInsnNode &insn) -> std::optional< Opcode > { return insn.opcode; },
                [](const FieldInsnNode &insn) -> std::optional< Opcode > {
                    return insn.opcode;
                },
                [](const MethodInsnNode &insn) -> std::optional< Opcode > {
                    return insn.opcode;
                },
                [](const InvokeDynamicInsnNode &) -> std::optional< Opcode > {
                    return Opcode::INVOKEDYNAMIC;
                },
                [](const JumpInsnNode &insn) -> std::optional< Opcode > { return insn.opcode; },
                [](const LabelNode &) -> std::optional< Opcode > { return std::nullopt; },
                [](const LdcInsnNode &) -> std::optional< Opcode > { return Opcode::LDC; },
                [](const IincInsnNode &) -> std::optional< Opcode > { return Opcode::IINC; },
                [](const TableSwitchInsnNode &) -> std::optional< Opcode > {
                    return Opcode::TABLESWITCH;
                },
                [](const LookupSwitchInsnNode &) -> std::optional< Opcode > {
                    return Opcode::LOOKUPSWITCH;
                },
                [](const MultiANewArrayInsnNode &) -> std::optional< Opcode > {
                    return Opcode::MULTIANEWARRAY;
                },
                [](const FrameNode &) -> std::optional< Opcode > { return std::nullopt; },
                [](const LineNumberNode &) -> std::optional< Opcode > { return std::nullopt; },
            },
            node
        );
    }

    std::optional< OperandForm > form_of(const Node &node) {
        return std::visit(
            overloaded{
                [](const InsnNode &) -> std::optional< OperandForm > {
                    return OperandForm::Insn;
                },
                [](const IntInsnNode &) -> std::optional< OperandForm > {
                    return OperandForm::Int;
                },
                [](const VarInsnNode &) -> std::optional< OperandForm > {
                    return OperandForm::Var;
                },
                [](const TypeInsnNode &) -> std::optional< OperandForm > {
                    return OperandForm::Type;
                },
                [](const FieldInsnNode &) -> std::optional< OperandForm > {
                    return OperandForm::Field;
                },
                [](const MethodInsnNode &) -> std::optional< OperandForm > {
                    return OperandForm::Method;
                },
                [](const InvokeDynamicInsnNode &) -> std::optional< OperandForm > {
                    return OperandForm::InvokeDynamic;
                },
                [](const JumpInsnNode &) -> std::optional< OperandForm > {
                    return OperandForm::Jump;
                },
                [](const LabelNode &) -> std::optional< OperandForm > { return std::nullopt; },
                [](const LdcInsnNode &) -> std::optional< OperandForm > {
                    return OperandForm::Ldc;
                },
                [](const IincInsnNode &) -> std::optional< OperandForm > {
                    return OperandForm::Iinc;
                },
                [](const TableSwitchInsnNode &) -> std::optional< OperandForm > {
                    return OperandForm::TableSwitch;
                },
                [](const LookupSwitchInsnNode &) -> std::optional< OperandForm > {
                    return OperandForm::LookupSwitch;
                },
                [](const MultiANewArrayInsnNode &) -> std::optional< OperandForm > {
                    return OperandForm::MultiANewArray;
                },
                [](const FrameNode &) -> std::optional< OperandForm > { return std::nullopt; },
                [](const LineNumberNode &) -> std::optional< OperandForm > {
                    return std::nullopt;
                },
            },
            node
        );
    }

    Label MethodBody::new_label(std::string label_name) {
        Label label{ static_cast< unsigned >(label_names.size()) };
        if (label_name.empty()) {
            label_name = generated_label_prefix + std::to_string(label.id);
        }
        label_names.emplace_back(std::move(label_name));
        return label;
    }

    const std::string &MethodBody::label_name(Label label) const {
        static const std::string unknown = "<unknown>";
        if (label.id >= label_names.size()) {
            return unknown;
        }
        return label_names[label.id];
    }

} // namespace covflow::bytecode
