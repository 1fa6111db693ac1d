/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/JSON.h>

#include <covflow/Bytecode/Instructions.hpp>

namespace covflow::bytecode {

    using JsonArray  = llvm::json::Array;
    using JsonObject = llvm::json::Object;
    using JsonValue  = llvm::json::Value;

    // Label names are scoped to a single method.
    using LabelMap = llvm::StringMap< Label >;

    class JsonParser
    {
      public:
        llvm::Expected< ClassFile > deserialize_class(const JsonObject &root);

        llvm::Expected< MethodBody > deserialize_method(const JsonObject &method_obj);

      private:
        // Create instruction node from the json object
        llvm::Expected< Node >
        create_node(const JsonObject &node_obj, MethodBody &method, LabelMap &labels);

        llvm::Expected< TryCatchBlock >
        create_try_catch_block(const JsonObject &block_obj, MethodBody &method, LabelMap &labels);

        llvm::Expected< FrameNode >
        create_frame(const JsonObject &frame_obj, MethodBody &method, LabelMap &labels);

        llvm::Expected< FrameEntry >
        create_frame_entry(const JsonValue &entry, MethodBody &method, LabelMap &labels);

        llvm::Expected< TableSwitchInsnNode >
        create_table_switch(const JsonObject &switch_obj, MethodBody &method, LabelMap &labels);

        llvm::Expected< LookupSwitchInsnNode >
        create_lookup_switch(const JsonObject &switch_obj, MethodBody &method, LabelMap &labels);

        // Resolves a label name, allocating the label on first reference.
        llvm::Expected< Label >
        resolve_label(llvm::StringRef name, MethodBody &method, LabelMap &labels);

        llvm::Expected< Label > get_label(
            const JsonObject &obj, llvm::StringRef field, MethodBody &method, LabelMap &labels
        );

        llvm::Expected< std::vector< Label > > get_label_array(
            const JsonObject &obj, llvm::StringRef field, MethodBody &method, LabelMap &labels
        );

        llvm::Expected< Opcode > get_opcode(const JsonObject &obj);

        llvm::Expected< std::string > get_string(const JsonObject &obj, llvm::StringRef field);

        llvm::Expected< int64_t > get_integer(
            const JsonObject &obj, llvm::StringRef field, int64_t min_value, int64_t max_value
        );
    };

    // Reads a JSON document from disk and deserializes the class it describes.
    llvm::Expected< ClassFile > load_class_file(llvm::StringRef file_path);

} // namespace covflow::bytecode
