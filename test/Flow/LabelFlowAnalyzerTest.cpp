/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <llvm/Support/Error.h>

#include <covflow/Flow/FlowError.hpp>
#include <covflow/Flow/LabelFlowAnalyzer.hpp>

#include "Support/MethodBuilder.hpp"

namespace covflow::flow {
    namespace {

        using bytecode::Opcode;
        using test::MethodBuilder;

        LabelFlowInfoStore analyze(MethodBuilder &builder, Options options = {}) {
            auto store = mark_labels(builder.body(), options);
            EXPECT_TRUE(static_cast< bool >(store)) << llvm::toString(store.takeError());
            return store ? std::move(*store) : LabelFlowInfoStore{};
        }

        TEST(LabelFlowAnalyzerTest, StraightLineMethodHasSingleEntryTarget) {
            MethodBuilder builder;
            builder.place("L0")
                .line(1, "L0")
                .insn(Opcode::ICONST_0)
                .var(Opcode::ISTORE, 1)
                .place("L1")
                .line(2, "L1")
                .var(Opcode::ILOAD, 1)
                .place("L2")
                .insn(Opcode::IRETURN);

            auto store = analyze(builder);
            auto l0    = builder.label("L0");
            auto l1    = builder.label("L1");
            auto l2    = builder.label("L2");

            EXPECT_TRUE(store.is_target(l0));
            EXPECT_FALSE(store.is_multi_target(l0));
            EXPECT_FALSE(store.is_successor(l0));

            for (auto label : { l1, l2 }) {
                EXPECT_FALSE(store.is_target(label));
                EXPECT_FALSE(store.is_multi_target(label));
                EXPECT_TRUE(store.is_successor(label));
                EXPECT_FALSE(store.needs_probe(label));
            }
        }

        TEST(LabelFlowAnalyzerTest, IfElseTargetsAreSingleEdges) {
            MethodBuilder builder;
            builder.place("L0")
                .var(Opcode::ILOAD, 0)
                .jump(Opcode::IFEQ, "L1")
                .insn(Opcode::ICONST_1)
                .var(Opcode::ISTORE, 1)
                .jump(Opcode::GOTO, "L2")
                .place("L1")
                .insn(Opcode::ICONST_2)
                .var(Opcode::ISTORE, 1)
                .place("L2")
                .insn(Opcode::RETURN);

            auto store = analyze(builder);
            auto l1    = builder.label("L1");
            auto l2    = builder.label("L2");

            EXPECT_TRUE(store.is_target(l1));
            EXPECT_FALSE(store.is_multi_target(l1));
            EXPECT_FALSE(store.is_successor(l1));

            EXPECT_TRUE(store.is_target(l2));
            EXPECT_FALSE(store.is_multi_target(l2));
            EXPECT_TRUE(store.is_successor(l2));
            EXPECT_FALSE(store.needs_probe(l2));
        }

        TEST(LabelFlowAnalyzerTest, ConditionalJumpFallsThroughToNextLabel) {
            MethodBuilder builder;
            builder.place("L0")
                .var(Opcode::ALOAD, 0)
                .jump(Opcode::IFNULL, "L2")
                .place("L1")
                .insn(Opcode::RETURN)
                .place("L2")
                .insn(Opcode::RETURN);

            auto store = analyze(builder);
            EXPECT_TRUE(store.is_successor(builder.label("L1")));
            EXPECT_FALSE(store.is_target(builder.label("L1")));
            EXPECT_TRUE(store.is_target(builder.label("L2")));
            EXPECT_FALSE(store.is_successor(builder.label("L2")));
        }

        TEST(LabelFlowAnalyzerTest, TwoJumpsToOneLabelMakeJoinPoint) {
            MethodBuilder builder;
            builder.place("L0")
                .var(Opcode::ILOAD, 0)
                .jump(Opcode::IFEQ, "L3")
                .var(Opcode::ILOAD, 1)
                .jump(Opcode::IFNE, "L3")
                .insn(Opcode::ICONST_0)
                .var(Opcode::ISTORE, 2)
                .place("L3")
                .insn(Opcode::RETURN);

            auto store = analyze(builder);
            auto l3    = builder.label("L3");

            EXPECT_TRUE(store.is_target(l3));
            EXPECT_TRUE(store.is_multi_target(l3));
            EXPECT_TRUE(store.is_successor(l3));
            EXPECT_TRUE(store.needs_probe(l3));
        }

        TEST(LabelFlowAnalyzerTest, BackwardJumpMarksLoopHead) {
            MethodBuilder builder;
            builder.place("L0")
                .insn(Opcode::ICONST_0)
                .var(Opcode::ISTORE, 1)
                .place("L1")
                .add(bytecode::IincInsnNode{ 1, 1 })
                .var(Opcode::ILOAD, 1)
                .add(bytecode::IntInsnNode{ Opcode::BIPUSH, 10 })
                .jump(Opcode::IF_ICMPLT, "L1")
                .insn(Opcode::RETURN);

            auto store = analyze(builder);
            auto l1    = builder.label("L1");

            EXPECT_TRUE(store.is_target(l1));
            EXPECT_FALSE(store.is_multi_target(l1));
            EXPECT_TRUE(store.is_successor(l1));
            EXPECT_FALSE(store.needs_probe(l1));
        }

        TEST(LabelFlowAnalyzerTest, DuplicateSwitchCasesMarkOnce) {
            MethodBuilder builder;
            builder.place("L0")
                .var(Opcode::ILOAD, 0)
                .table_switch(0, "L3", { "L1", "L1", "L2" })
                .place("L1")
                .insn(Opcode::RETURN)
                .place("L2")
                .insn(Opcode::RETURN)
                .place("L3")
                .insn(Opcode::RETURN);

            auto store = analyze(builder);
            for (const auto *name : { "L1", "L2", "L3" }) {
                auto label = builder.label(name);
                EXPECT_TRUE(store.is_target(label)) << name;
                EXPECT_FALSE(store.is_multi_target(label)) << name;
                EXPECT_FALSE(store.is_successor(label)) << name;
                EXPECT_FALSE(store.get(label).done) << name;
            }
        }

        TEST(LabelFlowAnalyzerTest, DefaultSharedWithCaseMarksOnce) {
            MethodBuilder builder;
            builder.place("L0")
                .var(Opcode::ILOAD, 0)
                .lookup_switch("L1", { 1, 5, 9 }, { "L1", "L2", "L1" })
                .place("L1")
                .insn(Opcode::RETURN)
                .place("L2")
                .insn(Opcode::RETURN);

            auto store = analyze(builder);
            EXPECT_TRUE(store.is_target(builder.label("L1")));
            EXPECT_FALSE(store.is_multi_target(builder.label("L1")));
            EXPECT_TRUE(store.is_target(builder.label("L2")));
        }

        TEST(LabelFlowAnalyzerTest, SecondSwitchToSameLabelMakesJoinPoint) {
            MethodBuilder builder;
            builder.place("L0")
                .var(Opcode::ILOAD, 0)
                .table_switch(0, "L9", { "L1", "L1" })
                .place("L1")
                .var(Opcode::ILOAD, 1)
                .lookup_switch("L9", { 3 }, { "L2" })
                .place("L2")
                .insn(Opcode::RETURN)
                .place("L9")
                .insn(Opcode::RETURN);

            auto store = analyze(builder);
            EXPECT_FALSE(store.is_multi_target(builder.label("L1")));
            EXPECT_TRUE(store.is_target(builder.label("L9")));
            EXPECT_TRUE(store.is_multi_target(builder.label("L9")));
            EXPECT_FALSE(store.is_successor(builder.label("L2")));
        }

        TEST(LabelFlowAnalyzerTest, TryStartAndHandlerAreTargets) {
            MethodBuilder builder;
            builder.try_catch("L1", "L2", "L3")
                .place("L0")
                .insn(Opcode::NOP)
                .place("L1")
                .invoke()
                .place("L2")
                .jump(Opcode::GOTO, "L4")
                .place("L3")
                .var(Opcode::ASTORE, 1)
                .place("L4")
                .insn(Opcode::RETURN);

            auto store = analyze(builder);
            auto l1    = builder.label("L1");
            auto l2    = builder.label("L2");
            auto l3    = builder.label("L3");

            EXPECT_TRUE(store.is_target(l1));
            EXPECT_FALSE(store.is_multi_target(l1));
            EXPECT_TRUE(store.is_successor(l1));
            EXPECT_FALSE(store.is_target(l2));
            EXPECT_TRUE(store.is_target(l3));
            EXPECT_FALSE(store.is_successor(l3));
        }

        TEST(LabelFlowAnalyzerTest, TryBlockAtMethodEntryMakesEntryJoinPoint) {
            MethodBuilder builder;
            builder.try_catch("L0", "L1", "L2")
                .place("L0")
                .invoke()
                .place("L1")
                .insn(Opcode::RETURN)
                .place("L2")
                .var(Opcode::ASTORE, 0)
                .insn(Opcode::RETURN);

            auto store = analyze(builder);
            EXPECT_TRUE(store.is_target(builder.label("L0")));
            EXPECT_TRUE(store.is_multi_target(builder.label("L0")));
        }

        TEST(LabelFlowAnalyzerTest, CallRecordsActiveLine) {
            MethodBuilder builder;
            builder.place("L0")
                .line(41, "L0")
                .insn(Opcode::ICONST_0)
                .var(Opcode::ISTORE, 1)
                .place("L1")
                .line(42, "L1")
                .invoke()
                .place("L2")
                .insn(Opcode::RETURN);

            auto store = analyze(builder);
            EXPECT_FALSE(store.method_invocation_line(builder.label("L0")).has_value());
            ASSERT_TRUE(store.method_invocation_line(builder.label("L1")).has_value());
            EXPECT_EQ(*store.method_invocation_line(builder.label("L1")), 42u);
            EXPECT_TRUE(store.needs_probe(builder.label("L1")));
            EXPECT_FALSE(store.method_invocation_line(builder.label("L2")).has_value());
        }

        TEST(LabelFlowAnalyzerTest, InvokeDynamicRecordsActiveLine) {
            MethodBuilder builder;
            builder.place("L0")
                .line(7, "L0")
                .add(bytecode::InvokeDynamicInsnNode{ "run", "()Ljava/lang/Runnable;", "" })
                .insn(Opcode::ARETURN);

            auto store = analyze(builder);
            ASSERT_TRUE(store.method_invocation_line(builder.label("L0")).has_value());
            EXPECT_EQ(*store.method_invocation_line(builder.label("L0")), 7u);
        }

        TEST(LabelFlowAnalyzerTest, CallWithoutLineRecordsNothing) {
            MethodBuilder builder;
            builder.place("L0").invoke().place("L1").insn(Opcode::RETURN);

            auto store = analyze(builder);
            EXPECT_FALSE(store.method_invocation_line(builder.label("L0")).has_value());
            EXPECT_FALSE(store.method_invocation_line(builder.label("L1")).has_value());
            EXPECT_FALSE(store.needs_probe(builder.label("L1")));
        }

        TEST(LabelFlowAnalyzerTest, ThrowEndsFallThrough) {
            MethodBuilder builder;
            builder.place("L0")
                .var(Opcode::ALOAD, 0)
                .insn(Opcode::ATHROW)
                .place("L1")
                .insn(Opcode::RETURN);

            auto store = analyze(builder);
            EXPECT_FALSE(store.is_successor(builder.label("L1")));
            EXPECT_FALSE(store.is_target(builder.label("L1")));
        }

        TEST(LabelFlowAnalyzerTest, LabelsBeforeFirstInstructionAreEntryTargets) {
            MethodBuilder builder;
            builder.place("L0").place("L1").insn(Opcode::RETURN);

            auto store = analyze(builder);
            EXPECT_TRUE(store.is_target(builder.label("L0")));
            EXPECT_TRUE(store.is_target(builder.label("L1")));
            EXPECT_FALSE(store.is_successor(builder.label("L1")));
        }

        TEST(LabelFlowAnalyzerTest, VisitorTracksTraversalState) {
            LabelFlowInfoStore store;
            LabelFlowAnalyzer analyzer(store, "state");
            bytecode::MethodBody method("state", "()V");
            auto label = method.new_label("L0");

            EXPECT_TRUE(analyzer.is_first());
            EXPECT_FALSE(analyzer.has_successor());
            EXPECT_FALSE(analyzer.active_line().has_value());

            ASSERT_FALSE(static_cast< bool >(analyzer.visit_line_number({ 3, label })));
            ASSERT_TRUE(analyzer.active_line().has_value());
            EXPECT_EQ(analyzer.active_line()->line, 3u);

            ASSERT_FALSE(static_cast< bool >(analyzer.visit_insn({ Opcode::NOP })));
            EXPECT_FALSE(analyzer.is_first());
            EXPECT_TRUE(analyzer.has_successor());

            ASSERT_FALSE(static_cast< bool >(analyzer.visit_jump_insn({ Opcode::GOTO, label })));
            EXPECT_FALSE(analyzer.has_successor());
            EXPECT_TRUE(store.is_target(label));
        }

        TEST(LabelFlowAnalyzerTest, SubroutinesAreRejected) {
            for (auto opcode : { Opcode::JSR, Opcode::JSR_W }) {
                MethodBuilder builder("legacy");
                builder.place("L0")
                    .jump(opcode, "L1")
                    .insn(Opcode::RETURN)
                    .place("L1")
                    .var(Opcode::ASTORE, 1)
                    .var(Opcode::RET, 1);

                auto store = mark_labels(builder.body(), Options{});
                ASSERT_FALSE(static_cast< bool >(store));

                bool unsupported = false;
                llvm::handleAllErrors(
                    store.takeError(),
                    [&](const UnsupportedConstructError &err) {
                        unsupported = true;
                        EXPECT_EQ(err.get_opcode(), opcode);
                        EXPECT_EQ(err.get_method(), "legacy");
                    },
                    [](const llvm::ErrorInfoBase &err) { ADD_FAILURE() << err.message(); }
                );
                EXPECT_TRUE(unsupported);
            }
        }

        TEST(LabelFlowAnalyzerTest, RetIsRejected) {
            MethodBuilder builder;
            builder.place("L0").var(Opcode::RET, 1);

            auto store = mark_labels(builder.body(), Options{});
            ASSERT_FALSE(static_cast< bool >(store));
            auto err = store.takeError();
            EXPECT_TRUE(err.isA< UnsupportedConstructError >());
            llvm::consumeError(std::move(err));
        }

        TEST(LabelFlowAnalyzerTest, JumpToUnplacedLabelIsInconsistent) {
            MethodBuilder builder;
            builder.place("L0").jump(Opcode::GOTO, "nowhere").insn(Opcode::RETURN);

            auto store = mark_labels(builder.body(), Options{});
            ASSERT_FALSE(static_cast< bool >(store));
            auto err = store.takeError();
            EXPECT_TRUE(err.isA< StructuralInconsistencyError >());
            EXPECT_NE(llvm::toString(std::move(err)).find("nowhere"), std::string::npos);
        }

        TEST(LabelFlowAnalyzerTest, SwitchToUnplacedLabelIsInconsistent) {
            MethodBuilder builder;
            builder.place("L0")
                .var(Opcode::ILOAD, 0)
                .table_switch(0, "L0", { "missing" })
                .insn(Opcode::RETURN);

            auto err = validate_method(builder.body());
            EXPECT_TRUE(err.isA< StructuralInconsistencyError >());
            llvm::consumeError(std::move(err));
        }

        TEST(LabelFlowAnalyzerTest, HandlerEndMustBePlaced) {
            MethodBuilder builder;
            builder.try_catch("L0", "end", "L0").place("L0").insn(Opcode::RETURN);

            auto err = validate_method(builder.body());
            EXPECT_TRUE(err.isA< StructuralInconsistencyError >());
            llvm::consumeError(std::move(err));
        }

        TEST(LabelFlowAnalyzerTest, LabelPlacedTwiceIsInconsistent) {
            MethodBuilder builder;
            builder.place("L0").insn(Opcode::NOP).place("L0").insn(Opcode::RETURN);

            auto err = validate_method(builder.body());
            EXPECT_TRUE(err.isA< StructuralInconsistencyError >());
            llvm::consumeError(std::move(err));
        }

        TEST(LabelFlowAnalyzerTest, OpcodeOfWrongFormIsInconsistent) {
            MethodBuilder builder;
            builder.place("L0").insn(Opcode::GOTO);

            auto err = validate_method(builder.body());
            EXPECT_TRUE(err.isA< StructuralInconsistencyError >());
            EXPECT_NE(llvm::toString(std::move(err)).find("GOTO"), std::string::npos);
        }

        TEST(LabelFlowAnalyzerTest, LinesInFrontOfFramesAreNormalizedFirst) {
            MethodBuilder builder;
            builder.place("L0")
                .var(Opcode::ILOAD, 0)
                .jump(Opcode::IFEQ, "L1")
                .invoke()
                .place("L1")
                .line(9, "L1")
                .frame()
                .invoke()
                .insn(Opcode::RETURN);

            auto store = analyze(builder);

            // The call is now attributed to the label behind the frame
            auto l1 = builder.label("L1");
            EXPECT_FALSE(store.method_invocation_line(l1).has_value());

            const bytecode::LineNumberNode *line = nullptr;
            for (const auto &node : builder.body().instructions) {
                if (const auto *candidate = std::get_if< bytecode::LineNumberNode >(&node)) {
                    line = candidate;
                }
            }
            ASSERT_NE(line, nullptr);
            EXPECT_NE(line->start, l1);
            EXPECT_EQ(store.method_invocation_line(line->start), 9u);
            EXPECT_TRUE(store.is_successor(line->start));
            EXPECT_TRUE(store.needs_probe(line->start));
        }

        TEST(LabelFlowAnalyzerTest, NormalizationCanBeDisabled) {
            MethodBuilder builder;
            builder.place("L0").line(9, "L0").frame().invoke().insn(Opcode::RETURN);

            Options options;
            options.normalize_frames = false;
            auto store               = analyze(builder, options);

            EXPECT_EQ(builder.body().instructions.size(), 5u);
            EXPECT_EQ(store.method_invocation_line(builder.label("L0")), 9u);
        }

    } // namespace
} // namespace covflow::flow
