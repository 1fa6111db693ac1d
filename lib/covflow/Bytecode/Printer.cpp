/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <variant>

#include <llvm/ADT/StringExtras.h>

#include <covflow/Bytecode/Printer.hpp>
#include <covflow/Util/Common.hpp>
#include <covflow/Util/Log.hpp>

namespace covflow::bytecode {

    namespace {
        constexpr const char *indent = "    ";
    } // namespace

    llvm::StringRef to_string(FrameType type) {
        switch (type) {
            case FrameType::New:
                return "new";
            case FrameType::Full:
                return "full";
            case FrameType::Append:
                return "append";
            case FrameType::Chop:
                return "chop";
            case FrameType::Same:
                return "same";
            case FrameType::Same1:
                return "same1";
        }
        UNREACHABLE("unknown frame type {0}", static_cast< unsigned >(type));
    }

    llvm::StringRef to_string(VerificationType type) {
        switch (type) {
            case VerificationType::Top:
                return "top";
            case VerificationType::Integer:
                return "int";
            case VerificationType::Float:
                return "float";
            case VerificationType::Long:
                return "long";
            case VerificationType::Double:
                return "double";
            case VerificationType::Null:
                return "null";
            case VerificationType::UninitializedThis:
                return "uninitialized_this";
        }
        UNREACHABLE("unknown verification type {0}", static_cast< unsigned >(type));
    }

    llvm::Error InstructionPrinter::visit_try_catch_block(const TryCatchBlock &block) {
        os << indent << "TRYCATCH " << method.label_name(block.start) << " "
           << method.label_name(block.end) << " -> " << method.label_name(block.handler);
        if (block.type) {
            os << " " << *block.type;
        } else {
            os << " *";
        }
        os << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_insn(const InsnNode &insn) {
        os << indent << to_string(insn.opcode) << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_int_insn(const IntInsnNode &insn) {
        os << indent << to_string(insn.opcode) << " " << insn.operand << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_var_insn(const VarInsnNode &insn) {
        os << indent << to_string(insn.opcode) << " " << insn.var << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_type_insn(const TypeInsnNode &insn) {
        os << indent << to_string(insn.opcode) << " " << insn.type << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_field_insn(const FieldInsnNode &insn) {
        os << indent << to_string(insn.opcode) << " " << insn.owner << "." << insn.name << " : "
           << insn.descriptor << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_method_insn(const MethodInsnNode &insn) {
        os << indent << to_string(insn.opcode) << " " << insn.owner << "." << insn.name
           << insn.descriptor;
        if (insn.is_interface) {
            os << " (itf)";
        }
        os << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_invoke_dynamic_insn(const InvokeDynamicInsnNode &insn) {
        os << indent << "INVOKEDYNAMIC " << insn.name << insn.descriptor;
        if (!insn.bootstrap.empty()) {
            os << " [" << insn.bootstrap << "]";
        }
        os << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_jump_insn(const JumpInsnNode &insn) {
        os << indent << to_string(insn.opcode) << " " << method.label_name(insn.target) << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_label(const LabelNode &label) {
        os << method.label_name(label.label) << ":\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_ldc_insn(const LdcInsnNode &insn) {
        os << indent << "LDC " << insn.constant << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_iinc_insn(const IincInsnNode &insn) {
        os << indent << "IINC " << insn.var << " " << insn.increment << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_table_switch_insn(const TableSwitchInsnNode &insn) {
        os << indent << "TABLESWITCH\n";
        auto key = static_cast< int64_t >(insn.min);
        for (auto target : insn.targets) {
            os << indent << indent << key++ << ": " << method.label_name(target) << "\n";
        }
        os << indent << indent << "default: " << method.label_name(insn.default_target) << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_lookup_switch_insn(const LookupSwitchInsnNode &insn) {
        os << indent << "LOOKUPSWITCH\n";
        for (size_t i = 0; i < insn.keys.size() && i < insn.targets.size(); ++i) {
            os << indent << indent << insn.keys[i] << ": " << method.label_name(insn.targets[i])
               << "\n";
        }
        os << indent << indent << "default: " << method.label_name(insn.default_target) << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_multi_anew_array_insn(const MultiANewArrayInsnNode &insn
    ) {
        os << indent << "MULTIANEWARRAY " << insn.descriptor << " "
           << static_cast< unsigned >(insn.dimensions) << "\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_frame(const FrameNode &frame) {
        os << indent << "FRAME " << to_string(frame.type) << " [";
        print_entries(frame.locals);
        os << "] [";
        print_entries(frame.stack);
        os << "]\n";
        return llvm::Error::success();
    }

    llvm::Error InstructionPrinter::visit_line_number(const LineNumberNode &line) {
        os << indent << "LINE " << line.line << " " << method.label_name(line.start) << "\n";
        return llvm::Error::success();
    }

    void InstructionPrinter::print_entries(llvm::ArrayRef< FrameEntry > entries) {
        llvm::ListSeparator separator(" ");
        for (const auto &entry : entries) {
            os << separator;
            std::visit(
                overloaded{
                    [&](VerificationType type) { os << to_string(type); },
                    [&](const ObjectType &object) { os << object.internal_name; },
                    [&](Label label) { os << "uninitialized(" << method.label_name(label) << ")"; },
                },
                entry
            );
        }
    }

    void print_method(const MethodBody &method, llvm::raw_ostream &os) {
        os << "method " << method.name << method.descriptor << "\n";
        InstructionPrinter printer(method, os);
        // The printer never fails
        llvm::cantFail(accept(method, printer));
    }

} // namespace covflow::bytecode
