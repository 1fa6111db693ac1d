/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <covflow/YAML/YAMLParser.hpp>

#include <llvm/Support/ErrorOr.h>

namespace covflow::yaml {

    llvm::Expected< std::unique_ptr< llvm::MemoryBuffer > >
    YAMLParser::read_file(const std::string &file_path) {
        auto buffer = llvm::MemoryBuffer::getFile(file_path);
        if (!buffer) {
            return llvm::createStringError(
                buffer.getError(), "cannot read '%s': %s", file_path.c_str(),
                buffer.getError().message().c_str()
            );
        }
        return std::move(buffer.get());
    }

    void YAMLParser::record_diagnostic(const llvm::SMDiagnostic &diag, void *context) {
        auto &message = *static_cast< std::string * >(context);
        if (!message.empty()) {
            return;
        }
        llvm::raw_string_ostream os(message);
        os << diag.getLineNo() << ":" << (diag.getColumnNo() + 1) << ": " << diag.getMessage();
    }

} // namespace covflow::yaml
