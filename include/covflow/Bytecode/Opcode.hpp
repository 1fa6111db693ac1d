/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "Opcodes.def"

namespace covflow::bytecode {

    // Shape of the operands carried by an instruction node.
    enum class OperandForm : uint8_t {
        Insn,
        Int,
        Var,
        Type,
        Field,
        Method,
        InvokeDynamic,
        Jump,
        Ldc,
        Iinc,
        TableSwitch,
        LookupSwitch,
        MultiANewArray
    };

    // Control-flow effect of an opcode on the instruction that follows it.
    enum class FlowKind : uint8_t {
        Other,
        Call,
        ConditionalJump,
        UnconditionalJump,
        Switch,
        Terminal,
        Subroutine
    };

    enum class Opcode : uint8_t {
#define X(name, code, form, flow) name = (code), // NOLINT(cppcoreguidelines-macro-usage)
        JVM_OPCODES
#undef X
    };

    struct OpcodeInfo
    {
        Opcode opcode;
        std::string_view name;
        OperandForm form;
        FlowKind flow;
    };

    template< typename EnumType, size_t N >
    struct OpcodeTable
    {
        std::array< OpcodeInfo, N > entries;

        constexpr const OpcodeInfo *find(EnumType val) const {
            for (const auto &entry : entries) {
                if (entry.opcode == val) {
                    return &entry;
                }
            }
            return nullptr;
        }

        constexpr std::optional< EnumType > from_string(std::string_view s) const {
            for (const auto &entry : entries) {
                if (entry.name == s) {
                    return entry.opcode;
                }
            }
            return std::nullopt;
        }
    };

    constexpr size_t num_opcodes = []() constexpr {
        size_t count = 0;
#define X(name, code, form, flow) ++count; // NOLINT(cppcoreguidelines-macro-usage)
        JVM_OPCODES
#undef X
        return count;
    }();

    constexpr OpcodeTable< Opcode, num_opcodes > opcode_table{ {
#define X(name, code, form, flow) \
    OpcodeInfo{ Opcode::name, #name, OperandForm::form, FlowKind::flow },
        JVM_OPCODES
#undef X
    } };

    constexpr std::string_view to_string(Opcode opcode) {
        const auto *info = opcode_table.find(opcode);
        return info != nullptr ? info->name : "UNKNOWN";
    }

    constexpr std::optional< Opcode > from_string(std::string_view mnemonic) {
        return opcode_table.from_string(mnemonic);
    }

    // Every enumerator comes from JVM_OPCODES, so the lookups below always
    // find an entry for a well-formed Opcode value.
    constexpr OperandForm operand_form(Opcode opcode) {
        return opcode_table.find(opcode)->form;
    }

    constexpr FlowKind flow_kind(Opcode opcode) { return opcode_table.find(opcode)->flow; }

    std::string_view to_string(OperandForm form);

    std::string_view to_string(FlowKind kind);

} // namespace covflow::bytecode
