/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <covflow/Flow/LabelFlowInfo.hpp>

namespace covflow::flow {

    void LabelFlowInfoStore::mark_target(bytecode::Label label) {
        auto &info = infos[label];
        if (info.is_target) {
            info.is_multi_target = true;
        } else {
            info.is_target = true;
        }
    }

    void LabelFlowInfoStore::mark_successor(bytecode::Label label) {
        infos[label].is_successor = true;
    }

    void LabelFlowInfoStore::set_method_invocation_line(bytecode::Label label, uint32_t line) {
        infos[label].method_invocation_line = line;
    }

    void LabelFlowInfoStore::reset_done(bytecode::Label label) {
        auto iter = infos.find(label);
        if (iter != infos.end()) {
            iter->second.done = false;
        }
    }

    void LabelFlowInfoStore::reset_done(llvm::ArrayRef< bytecode::Label > labels) {
        for (auto label : labels) {
            reset_done(label);
        }
    }

    bool LabelFlowInfoStore::is_done(bytecode::Label label) const {
        auto iter = infos.find(label);
        return iter != infos.end() && iter->second.done;
    }

    void LabelFlowInfoStore::mark_done(bytecode::Label label) { infos[label].done = true; }

    LabelFlowInfo LabelFlowInfoStore::get(bytecode::Label label) const {
        auto iter = infos.find(label);
        if (iter == infos.end()) {
            return {};
        }
        return iter->second;
    }

    bool LabelFlowInfoStore::needs_probe(bytecode::Label label) const {
        auto info = get(label);
        return info.is_successor
            && (info.is_multi_target || info.method_invocation_line.has_value());
    }

} // namespace covflow::flow
