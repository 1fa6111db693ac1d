/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <iterator>
#include <variant>

#include <llvm/ADT/DenseMap.h>
#include <llvm/ADT/DenseSet.h>
#include <llvm/Support/FormatVariadic.h>

#include <covflow/Flow/FlowError.hpp>
#include <covflow/Flow/FrameNormalizer.hpp>

namespace covflow::flow {

    using namespace covflow::bytecode;

    namespace {

        llvm::DenseSet< Label > collect_placed_labels(const InstructionList &instructions) {
            llvm::DenseSet< Label > placed;
            for (const auto &node : instructions) {
                if (const auto *label = std::get_if< LabelNode >(&node)) {
                    placed.insert(label->label);
                }
            }
            return placed;
        }

        // Second phase: a frame may refer to an old label before the line
        // marker that triggered its rewrite shows up in the stream, so the
        // frames are only patched after every rewrite is known.
        void patch_frames(
            InstructionList &instructions, const llvm::DenseMap< Label, Label > &replacements
        ) {
            for (auto &node : instructions) {
                auto *frame = std::get_if< FrameNode >(&node);
                if (frame == nullptr) {
                    continue;
                }
                for (auto &entry : frame->stack) {
                    auto *label = std::get_if< Label >(&entry);
                    if (label == nullptr) {
                        continue;
                    }
                    auto iter = replacements.find(*label);
                    if (iter != replacements.end()) {
                        *label = iter->second;
                    }
                }
            }
        }

    } // namespace

    llvm::Expected< unsigned > normalize_frame_boundaries(MethodBody &method) {
        auto &instructions = method.instructions;
        auto placed        = collect_placed_labels(instructions);

        llvm::DenseMap< Label, Label > labels_to_patch;
        unsigned rewrites = 0;

        for (auto iter = instructions.begin(); iter != instructions.end();) {
            auto next  = std::next(iter);
            auto *line = std::get_if< LineNumberNode >(&*iter);
            if (line == nullptr || next == instructions.end()
                || !std::holds_alternative< FrameNode >(*next))
            {
                iter = next;
                continue;
            }

            if (placed.count(line->start) == 0) {
                return llvm::make_error< StructuralInconsistencyError >(
                    llvm::formatv(
                        "line {0} starts at label '{1}' which is not placed in the method",
                        line->line, method.label_name(line->start)
                    )
                        .str(),
                    method.name
                );
            }

            auto new_label  = method.new_label();
            auto after_frame = std::next(next);

            // FRAME; NOP; L'; LINE(start = L')
            instructions.insert(after_frame, InsnNode{ Opcode::NOP });
            instructions.insert(after_frame, LabelNode{ new_label });
            instructions.splice(after_frame, instructions, iter);
            placed.insert(new_label);

            labels_to_patch[line->start] = new_label;
            line->start                  = new_label;
            ++rewrites;

            // iter still points at the moved line marker; look at it again in
            // case another frame follows.
        }

        if (!labels_to_patch.empty()) {
            patch_frames(instructions, labels_to_patch);
        }

        return rewrites;
    }

} // namespace covflow::flow
