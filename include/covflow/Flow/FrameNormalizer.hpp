/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <llvm/Support/Error.h>

#include <covflow/Bytecode/Instructions.hpp>

namespace covflow::flow {

    /**
     * @brief Moves line markers that sit directly in front of a frame.
     *
     * For every `LINE(start = L); FRAME` pair the stream is rewritten to
     * `FRAME; NOP; L'; LINE(start = L')` where L' is a fresh label. The NOP
     * gives L' an instruction of its own, so a probe inserted at L' lands
     * after the frame. Once all pairs are rewritten, every frame whose stack
     * still refers to an old start label is patched to the replacement.
     *
     * Running the normalizer on its own output performs no rewrite.
     *
     * @return Number of line markers that were moved, or a
     *         StructuralInconsistencyError when a moved line marker starts at
     *         a label that is not placed in the stream.
     */
    llvm::Expected< unsigned > normalize_frame_boundaries(bytecode::MethodBody &method);

} // namespace covflow::flow
