/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>
#include <utility>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/SourceMgr.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

namespace covflow::yaml {

    // Reads and writes documents that have llvm::yaml traits. Failures come
    // back as errors carrying the first YAML diagnostic, prefixed with the
    // source name.
    class YAMLParser
    {
      public:
        explicit YAMLParser(std::string source_name = "<string>")
            : source_name(std::move(source_name)) {}

        template< typename T >
        llvm::Expected< T > parse(llvm::StringRef content) const;

        // Reads the file and parses it; the path becomes the source name.
        template< typename T >
        static llvm::Expected< T > parse_file(const std::string &file_path);

        template< typename T >
        static std::string serialize(const T &object);

        llvm::StringRef get_source_name() const { return source_name; }

      private:
        static llvm::Expected< std::unique_ptr< llvm::MemoryBuffer > >
        read_file(const std::string &file_path);

        // Keeps the first diagnostic llvm::yaml::Input reports.
        static void record_diagnostic(const llvm::SMDiagnostic &diag, void *context);

        std::string source_name;
    };

    template< typename T >
    llvm::Expected< T > YAMLParser::parse(llvm::StringRef content) const {
        std::string diagnostic;
        llvm::yaml::Input input(content, nullptr, &YAMLParser::record_diagnostic, &diagnostic);

        T result;
        input >> result;

        if (auto ec = input.error()) {
            if (diagnostic.empty()) {
                diagnostic = ec.message();
            }
            return llvm::createStringError(
                ec, "%s: %s", source_name.c_str(), diagnostic.c_str()
            );
        }
        return result;
    }

    template< typename T >
    llvm::Expected< T > YAMLParser::parse_file(const std::string &file_path) {
        auto buffer = read_file(file_path);
        if (!buffer) {
            return buffer.takeError();
        }
        return YAMLParser(file_path).parse< T >((*buffer)->getBuffer());
    }

    template< typename T >
    std::string YAMLParser::serialize(const T &object) {
        std::string text;
        llvm::raw_string_ostream stream(text);
        llvm::yaml::Output output(stream);

        // yaml::Output wants a mutable reference
        T copy = object;
        output << copy;
        return stream.str();
    }

} // namespace covflow::yaml
