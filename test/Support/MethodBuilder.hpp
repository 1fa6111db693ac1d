/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include <llvm/ADT/StringMap.h>

#include <covflow/Bytecode/Instructions.hpp>

namespace covflow::test {

    // Assembles method bodies for tests. Labels are referred to by name and
    // allocated on first use.
    class MethodBuilder
    {
      public:
        explicit MethodBuilder(std::string name = "test", std::string descriptor = "()V")
            : method(std::move(name), std::move(descriptor)) {}

        bytecode::Label label(const std::string &name) {
            auto iter = labels.find(name);
            if (iter != labels.end()) {
                return iter->second;
            }
            auto label = method.new_label(name);
            labels.try_emplace(name, label);
            return label;
        }

        MethodBuilder &place(const std::string &name) {
            return add(bytecode::LabelNode{ label(name) });
        }

        MethodBuilder &insn(bytecode::Opcode opcode) { return add(bytecode::InsnNode{ opcode }); }

        MethodBuilder &var(bytecode::Opcode opcode, uint16_t index) {
            return add(bytecode::VarInsnNode{ opcode, index });
        }

        MethodBuilder &jump(bytecode::Opcode opcode, const std::string &target) {
            return add(bytecode::JumpInsnNode{ opcode, label(target) });
        }

        MethodBuilder &invoke(const std::string &callee = "callee") {
            return add(bytecode::MethodInsnNode{ bytecode::Opcode::INVOKESTATIC, "Owner", callee,
                                                 "()V", false });
        }

        MethodBuilder &line(uint32_t number, const std::string &start) {
            return add(bytecode::LineNumberNode{ number, label(start) });
        }

        MethodBuilder &frame(std::vector< bytecode::FrameEntry > stack = {}) {
            return add(bytecode::FrameNode{ bytecode::FrameType::Full, {}, std::move(stack) });
        }

        MethodBuilder &table_switch(
            int32_t min, const std::string &default_target,
            std::initializer_list< std::string > targets
        ) {
            bytecode::TableSwitchInsnNode insn{ min,
                                                min + static_cast< int32_t >(targets.size()) - 1,
                                                label(default_target),
                                                {} };
            for (const auto &target : targets) {
                insn.targets.push_back(label(target));
            }
            return add(std::move(insn));
        }

        MethodBuilder &lookup_switch(
            const std::string &default_target, std::initializer_list< int32_t > keys,
            std::initializer_list< std::string > targets
        ) {
            bytecode::LookupSwitchInsnNode insn{ label(default_target), keys, {} };
            for (const auto &target : targets) {
                insn.targets.push_back(label(target));
            }
            return add(std::move(insn));
        }

        MethodBuilder &try_catch(
            const std::string &start, const std::string &end, const std::string &handler
        ) {
            method.try_catch_blocks.push_back(
                bytecode::TryCatchBlock{ label(start), label(end), label(handler),
                                         "java/lang/Exception" }
            );
            return *this;
        }

        MethodBuilder &add(bytecode::Node node) {
            method.instructions.emplace_back(std::move(node));
            return *this;
        }

        bytecode::MethodBody &body() { return method; }

      private:
        bytecode::MethodBody method;
        llvm::StringMap< bytecode::Label > labels;
    };

} // namespace covflow::test
