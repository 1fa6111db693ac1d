/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <covflow/Bytecode/Opcode.hpp>
#include <covflow/Util/Log.hpp>

namespace covflow::bytecode {

    std::string_view to_string(OperandForm form) {
        switch (form) {
            case OperandForm::Insn:
                return "insn";
            case OperandForm::Int:
                return "int";
            case OperandForm::Var:
                return "var";
            case OperandForm::Type:
                return "type";
            case OperandForm::Field:
                return "field";
            case OperandForm::Method:
                return "method";
            case OperandForm::InvokeDynamic:
                return "invokedynamic";
            case OperandForm::Jump:
                return "jump";
            case OperandForm::Ldc:
                return "ldc";
            case OperandForm::Iinc:
                return "iinc";
            case OperandForm::TableSwitch:
                return "tableswitch";
            case OperandForm::LookupSwitch:
                return "lookupswitch";
            case OperandForm::MultiANewArray:
                return "multianewarray";
        }
        UNREACHABLE("unknown operand form {0}", static_cast< int >(form));
    }

    std::string_view to_string(FlowKind kind) {
        switch (kind) {
            case FlowKind::Other:
                return "other";
            case FlowKind::Call:
                return "call";
            case FlowKind::ConditionalJump:
                return "conditional-jump";
            case FlowKind::UnconditionalJump:
                return "unconditional-jump";
            case FlowKind::Switch:
                return "switch";
            case FlowKind::Terminal:
                return "terminal";
            case FlowKind::Subroutine:
                return "subroutine";
        }
        UNREACHABLE("unknown flow kind {0}", static_cast< int >(kind));
    }

} // namespace covflow::bytecode
