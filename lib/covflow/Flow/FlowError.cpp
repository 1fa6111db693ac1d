/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <covflow/Flow/FlowError.hpp>

namespace covflow::flow {

    char UnsupportedConstructError::ID    = 0;
    char StructuralInconsistencyError::ID = 0;

    void UnsupportedConstructError::log(llvm::raw_ostream &os) const {
        os << "unsupported construct in method '" << method
           << "': subroutine instruction " << bytecode::to_string(opcode);
    }

    std::error_code UnsupportedConstructError::convertToErrorCode() const {
        return std::make_error_code(std::errc::not_supported);
    }

    void StructuralInconsistencyError::log(llvm::raw_ostream &os) const {
        os << "structural inconsistency in method '" << method << "': " << message;
    }

    std::error_code StructuralInconsistencyError::convertToErrorCode() const {
        return std::make_error_code(std::errc::invalid_argument);
    }

} // namespace covflow::flow
