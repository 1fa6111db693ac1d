/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <string>
#include <variant>

#include <llvm/ADT/DenseSet.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/FormatVariadic.h>

#include <covflow/Flow/FlowError.hpp>
#include <covflow/Flow/FrameNormalizer.hpp>
#include <covflow/Flow/LabelFlowAnalyzer.hpp>
#include <covflow/Util/Common.hpp>

namespace covflow::flow {

    using namespace covflow::bytecode;

    llvm::Error LabelFlowAnalyzer::visit_try_catch_block(const TryCatchBlock &block) {
        // Enforce a probe at the start of the protected range. If the range
        // also starts the method, the entry marking makes it a multitarget.
        store.mark_target(block.start);

        // The handler is entered from anywhere inside the range
        store.mark_target(block.handler);
        return llvm::Error::success();
    }

    llvm::Error LabelFlowAnalyzer::transfer(Opcode opcode) {
        switch (flow_kind(opcode)) {
            case FlowKind::Subroutine:
                return llvm::make_error< UnsupportedConstructError >(opcode, method_name);
            case FlowKind::UnconditionalJump:
            case FlowKind::Switch:
            case FlowKind::Terminal:
                successor = false;
                break;
            case FlowKind::ConditionalJump:
            case FlowKind::Call:
            case FlowKind::Other:
                successor = true;
                break;
        }
        first = false;
        return llvm::Error::success();
    }

    llvm::Error LabelFlowAnalyzer::visit_insn(const InsnNode &insn) {
        return transfer(insn.opcode);
    }

    llvm::Error LabelFlowAnalyzer::visit_int_insn(const IntInsnNode &insn) {
        return transfer(insn.opcode);
    }

    llvm::Error LabelFlowAnalyzer::visit_var_insn(const VarInsnNode &insn) {
        return transfer(insn.opcode);
    }

    llvm::Error LabelFlowAnalyzer::visit_type_insn(const TypeInsnNode &insn) {
        return transfer(insn.opcode);
    }

    llvm::Error LabelFlowAnalyzer::visit_field_insn(const FieldInsnNode &insn) {
        return transfer(insn.opcode);
    }

    llvm::Error LabelFlowAnalyzer::visit_method_insn(const MethodInsnNode &insn) {
        if (auto err = transfer(insn.opcode)) {
            return err;
        }
        mark_method_invocation_line();
        return llvm::Error::success();
    }

    llvm::Error LabelFlowAnalyzer::visit_invoke_dynamic_insn(const InvokeDynamicInsnNode &) {
        if (auto err = transfer(Opcode::INVOKEDYNAMIC)) {
            return err;
        }
        mark_method_invocation_line();
        return llvm::Error::success();
    }

    llvm::Error LabelFlowAnalyzer::visit_jump_insn(const JumpInsnNode &insn) {
        if (auto err = transfer(insn.opcode)) {
            return err;
        }
        store.mark_target(insn.target);
        return llvm::Error::success();
    }

    llvm::Error LabelFlowAnalyzer::visit_label(const LabelNode &node) {
        if (first) {
            store.mark_target(node.label);
        }
        if (successor) {
            store.mark_successor(node.label);
        }
        return llvm::Error::success();
    }

    llvm::Error LabelFlowAnalyzer::visit_ldc_insn(const LdcInsnNode &) {
        return transfer(Opcode::LDC);
    }

    llvm::Error LabelFlowAnalyzer::visit_iinc_insn(const IincInsnNode &) {
        return transfer(Opcode::IINC);
    }

    llvm::Error LabelFlowAnalyzer::visit_table_switch_insn(const TableSwitchInsnNode &insn) {
        if (auto err = transfer(Opcode::TABLESWITCH)) {
            return err;
        }
        visit_switch(insn.default_target, insn.targets);
        return llvm::Error::success();
    }

    llvm::Error LabelFlowAnalyzer::visit_lookup_switch_insn(const LookupSwitchInsnNode &insn) {
        if (auto err = transfer(Opcode::LOOKUPSWITCH)) {
            return err;
        }
        visit_switch(insn.default_target, insn.targets);
        return llvm::Error::success();
    }

    llvm::Error
    LabelFlowAnalyzer::visit_multi_anew_array_insn(const MultiANewArrayInsnNode &) {
        return transfer(Opcode::MULTIANEWARRAY);
    }

    llvm::Error LabelFlowAnalyzer::visit_line_number(const LineNumberNode &line) {
        line_start = line;
        return llvm::Error::success();
    }

    void LabelFlowAnalyzer::visit_switch(Label default_target, llvm::ArrayRef< Label > targets) {
        // Several case keys may share a destination; that is still a single
        // edge out of this switch.
        store.reset_done(default_target);
        store.reset_done(targets);
        set_target_if_not_done(default_target);
        for (auto label : targets) {
            set_target_if_not_done(label);
        }
        store.reset_done(default_target);
        store.reset_done(targets);
    }

    void LabelFlowAnalyzer::set_target_if_not_done(Label label) {
        if (!store.is_done(label)) {
            store.mark_target(label);
            store.mark_done(label);
        }
    }

    void LabelFlowAnalyzer::mark_method_invocation_line() {
        if (line_start) {
            store.set_method_invocation_line(line_start->start, line_start->line);
        }
    }

    namespace {

        llvm::Error inconsistency(const MethodBody &method, const std::string &message) {
            return llvm::make_error< StructuralInconsistencyError >(message, method.name);
        }

        // Label references of a node, in operand order
        llvm::SmallVector< Label, 4 > referenced_labels(const Node &node) {
            return std::visit(
                overloaded{
                    [](const JumpInsnNode &insn) -> llvm::SmallVector< Label, 4 > {
                        return { insn.target };
                    },
                    [](const TableSwitchInsnNode &insn) -> llvm::SmallVector< Label, 4 > {
                        llvm::SmallVector< Label, 4 > labels{ insn.default_target };
                        labels.append(insn.targets.begin(), insn.targets.end());
                        return labels;
                    },
                    [](const LookupSwitchInsnNode &insn) -> llvm::SmallVector< Label, 4 > {
                        llvm::SmallVector< Label, 4 > labels{ insn.default_target };
                        labels.append(insn.targets.begin(), insn.targets.end());
                        return labels;
                    },
                    [](const LineNumberNode &line) -> llvm::SmallVector< Label, 4 > {
                        return { line.start };
                    },
                    [](const auto &) -> llvm::SmallVector< Label, 4 > { return {}; },
                },
                node
            );
        }

    } // namespace

    llvm::Error validate_method(const MethodBody &method) {
        llvm::DenseSet< Label > placed;
        for (const auto &node : method.instructions) {
            const auto *label = std::get_if< LabelNode >(&node);
            if (label == nullptr) {
                continue;
            }
            if (!placed.insert(label->label).second) {
                return inconsistency(
                    method,
                    llvm::formatv(
                        "label '{0}' is placed more than once", method.label_name(label->label)
                    )
                );
            }
        }

        auto check_placed = [&](Label label, llvm::StringRef user) -> llvm::Error {
            if (placed.count(label) != 0) {
                return llvm::Error::success();
            }
            return inconsistency(
                method,
                llvm::formatv(
                    "{0} refers to label '{1}' which is not placed in the method", user,
                    method.label_name(label)
                )
            );
        };

        for (const auto &block : method.try_catch_blocks) {
            for (auto label : { block.start, block.end, block.handler }) {
                if (auto err = check_placed(label, "try-catch block")) {
                    return err;
                }
            }
        }

        for (const auto &node : method.instructions) {
            auto opcode = opcode_of(node);
            if (opcode && operand_form(*opcode) != *form_of(node)) {
                return inconsistency(
                    method,
                    llvm::formatv(
                        "opcode {0} expects a {1} instruction, found a {2} instruction",
                        to_string(*opcode), to_string(operand_form(*opcode)),
                        to_string(*form_of(node))
                    )
                );
            }

            std::string user = opcode ? std::string(to_string(*opcode)) : "line number";
            for (auto label : referenced_labels(node)) {
                if (auto err = check_placed(label, user)) {
                    return err;
                }
            }
        }

        return llvm::Error::success();
    }

    llvm::Expected< LabelFlowInfoStore > mark_labels(MethodBody &method, const Options &options) {
        if (auto err = validate_method(method)) {
            return std::move(err);
        }

        if (options.normalize_frames) {
            auto rewrites = normalize_frame_boundaries(method);
            if (!rewrites) {
                return rewrites.takeError();
            }
        }

        LabelFlowInfoStore store;
        LabelFlowAnalyzer analyzer(store, method.name);
        if (auto err = bytecode::accept(method, analyzer)) {
            return std::move(err);
        }
        return store;
    }

} // namespace covflow::flow
