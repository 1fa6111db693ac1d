/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <system_error>
#include <utility>

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <covflow/Bytecode/Opcode.hpp>

namespace covflow::flow {

    /**
     * @brief A subroutine instruction (JSR, JSR_W or RET) was found.
     *
     * The whole method is unanalyzable. Callers decide whether to skip the
     * method or abort the run.
     */
    class UnsupportedConstructError : public llvm::ErrorInfo< UnsupportedConstructError >
    {
      public:
        static char ID; // NOLINT

        UnsupportedConstructError(bytecode::Opcode opcode, std::string method)
            : opcode(opcode), method(std::move(method)) {}

        void log(llvm::raw_ostream &os) const override;

        std::error_code convertToErrorCode() const override;

        bytecode::Opcode get_opcode() const { return opcode; }

        const std::string &get_method() const { return method; }

      private:
        bytecode::Opcode opcode;
        std::string method;
    };

    /**
     * @brief The method body violates the structure the analysis relies on.
     *
     * Raised for references to labels that are not placed in the instruction
     * stream, labels placed more than once, and instruction nodes whose
     * opcode does not fit the node kind.
     */
    class StructuralInconsistencyError
        : public llvm::ErrorInfo< StructuralInconsistencyError >
    {
      public:
        static char ID; // NOLINT

        StructuralInconsistencyError(std::string message, std::string method)
            : message(std::move(message)), method(std::move(method)) {}

        void log(llvm::raw_ostream &os) const override;

        std::error_code convertToErrorCode() const override;

        const std::string &get_message() const { return message; }

        const std::string &get_method() const { return method; }

      private:
        std::string message;
        std::string method;
    };

} // namespace covflow::flow
