/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/FormatVariadic.h>
#include <llvm/Support/raw_ostream.h>

enum LogLevel { INFO, WARNING, ERROR };

// Reports go to stdout, so every log level is written to stderr.
#define LOG(level) \
    (((level) == INFO)          ? llvm::errs() << "[INFO] " \
         : ((level) == WARNING) ? llvm::errs() << "[WARNING] " \
         : ((level) == ERROR)   ? llvm::errs() << "[ERROR] " \
                                : llvm::errs() \
    ) << "(" \
      << __FILE__ << ":" << __LINE__ << ") "

#define UNREACHABLE(...) \
    do { \
        LOG(ERROR) << llvm::formatv(__VA_ARGS__); \
        llvm_unreachable(nullptr); \
    } while (0)
