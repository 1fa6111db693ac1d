/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <list>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <llvm/ADT/DenseMapInfo.h>

#include <covflow/Bytecode/Opcode.hpp>

namespace covflow::bytecode {

    /**
     * @brief Position marker inside a method body.
     *
     * Labels compare by identity. The identity is a handle handed out by the
     * owning MethodBody; two labels are equal only if they denote the same
     * position, regardless of their display names.
     */
    struct Label
    {
        unsigned id;

        friend bool operator==(const Label &lhs, const Label &rhs) = default;
    };

    enum class VerificationType : uint8_t {
        Top,
        Integer,
        Float,
        Long,
        Double,
        Null,
        UninitializedThis
    };

    // Reference to a class type in a frame slot
    struct ObjectType
    {
        std::string internal_name;

        friend bool operator==(const ObjectType &lhs, const ObjectType &rhs) = default;
    };

    // A frame slot is a primitive verification type, an object type, or the
    // label of the NEW instruction that created a still uninitialized value.
    using FrameEntry = std::variant< VerificationType, ObjectType, Label >;

    enum class FrameType : uint8_t { New, Full, Append, Chop, Same, Same1 };

    struct InsnNode
    {
        Opcode opcode;
    };

    struct IntInsnNode
    {
        Opcode opcode;
        int32_t operand;
    };

    struct VarInsnNode
    {
        Opcode opcode;
        uint16_t var;
    };

    struct TypeInsnNode
    {
        Opcode opcode;
        std::string type;
    };

    struct FieldInsnNode
    {
        Opcode opcode;
        std::string owner;
        std::string name;
        std::string descriptor;
    };

    struct MethodInsnNode
    {
        Opcode opcode;
        std::string owner;
        std::string name;
        std::string descriptor;
        bool is_interface;
    };

    struct InvokeDynamicInsnNode
    {
        std::string name;
        std::string descriptor;
        std::string bootstrap;
    };

    struct JumpInsnNode
    {
        Opcode opcode;
        Label target;
    };

    struct LabelNode
    {
        Label label;
    };

    struct LdcInsnNode
    {
        std::string constant;
    };

    struct IincInsnNode
    {
        uint16_t var;
        int16_t increment;
    };

    struct TableSwitchInsnNode
    {
        int32_t min;
        int32_t max;
        Label default_target;
        std::vector< Label > targets;
    };

    struct LookupSwitchInsnNode
    {
        Label default_target;
        std::vector< int32_t > keys;
        std::vector< Label > targets;
    };

    struct MultiANewArrayInsnNode
    {
        std::string descriptor;
        uint8_t dimensions;
    };

    struct FrameNode
    {
        FrameType type;
        std::vector< FrameEntry > locals;
        std::vector< FrameEntry > stack;
    };

    struct LineNumberNode
    {
        uint32_t line;
        Label start;
    };

    using Node = std::variant<
        InsnNode, IntInsnNode, VarInsnNode, TypeInsnNode, FieldInsnNode, MethodInsnNode,
        InvokeDynamicInsnNode, JumpInsnNode, LabelNode, LdcInsnNode, IincInsnNode,
        TableSwitchInsnNode, LookupSwitchInsnNode, MultiANewArrayInsnNode, FrameNode,
        LineNumberNode >;

    // Opcode carried by the node, if the node is a real instruction.
    std::optional< Opcode > opcode_of(const Node &node);

    // Operand form the node kind implies, if the node is a real instruction.
    std::optional< OperandForm > form_of(const Node &node);

    // Elements keep their address when others are inserted or removed, so
    // iterators stay valid across the normalizer's edits.
    using InstructionList = std::list< Node >;

    struct TryCatchBlock
    {
        Label start;
        Label end;
        Label handler;
        std::optional< std::string > type;
    };

    // Names of generated labels start with this character. Loaded method
    // bodies may not use it.
    inline constexpr char generated_label_prefix = '~';

    class MethodBody
    {
      public:
        MethodBody() = default;
        MethodBody(std::string name, std::string descriptor)
            : name(std::move(name)), descriptor(std::move(descriptor)) {}

        // Allocates a fresh label. An empty name yields a generated one.
        Label new_label(std::string label_name = {});

        const std::string &label_name(Label label) const;

        unsigned label_count() const { return static_cast< unsigned >(label_names.size()); }

        std::string name;
        std::string descriptor;
        InstructionList instructions;
        std::vector< TryCatchBlock > try_catch_blocks;

      private:
        std::vector< std::string > label_names;
    };

    struct ClassFile
    {
        std::string name;
        std::vector< MethodBody > methods;
    };

} // namespace covflow::bytecode

namespace llvm {

    template<>
    struct DenseMapInfo< covflow::bytecode::Label >
    {
        static inline covflow::bytecode::Label getEmptyKey() {
            return { DenseMapInfo< unsigned >::getEmptyKey() };
        }

        static inline covflow::bytecode::Label getTombstoneKey() {
            return { DenseMapInfo< unsigned >::getTombstoneKey() };
        }

        static unsigned getHashValue(const covflow::bytecode::Label &label) {
            return DenseMapInfo< unsigned >::getHashValue(label.id);
        }

        static bool
        isEqual(const covflow::bytecode::Label &lhs, const covflow::bytecode::Label &rhs) {
            return lhs == rhs;
        }
    };

} // namespace llvm
