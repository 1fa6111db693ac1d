/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <limits>
#include <memory>
#include <optional>
#include <system_error>

#include <llvm/ADT/StringSwitch.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/FormatVariadic.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>

#include <covflow/Bytecode/JsonDeserialize.hpp>

namespace covflow::bytecode {

    namespace {

        enum class NodeKind : uint8_t {
            Insn,
            Int,
            Var,
            Type,
            Field,
            Method,
            InvokeDynamic,
            Jump,
            Label,
            Ldc,
            Iinc,
            TableSwitch,
            LookupSwitch,
            MultiANewArray,
            Frame,
            Line,
            Invalid
        };

        NodeKind convert_to_kind(llvm::StringRef kind) {
            return llvm::StringSwitch< NodeKind >(kind)
                .Case("insn", NodeKind::Insn)
                .Case("int", NodeKind::Int)
                .Case("var", NodeKind::Var)
                .Case("type", NodeKind::Type)
                .Case("field", NodeKind::Field)
                .Case("method", NodeKind::Method)
                .Case("invokedynamic", NodeKind::InvokeDynamic)
                .Case("jump", NodeKind::Jump)
                .Case("label", NodeKind::Label)
                .Case("ldc", NodeKind::Ldc)
                .Case("iinc", NodeKind::Iinc)
                .Case("tableswitch", NodeKind::TableSwitch)
                .Case("lookupswitch", NodeKind::LookupSwitch)
                .Case("multianewarray", NodeKind::MultiANewArray)
                .Case("frame", NodeKind::Frame)
                .Case("line", NodeKind::Line)
                .Default(NodeKind::Invalid);
        }

        std::optional< FrameType > convert_to_frame_type(llvm::StringRef type) {
            return llvm::StringSwitch< std::optional< FrameType > >(type)
                .Case("new", FrameType::New)
                .Case("full", FrameType::Full)
                .Case("append", FrameType::Append)
                .Case("chop", FrameType::Chop)
                .Case("same", FrameType::Same)
                .Case("same1", FrameType::Same1)
                .Default(std::nullopt);
        }

        std::optional< VerificationType > convert_to_verification_type(llvm::StringRef type) {
            return llvm::StringSwitch< std::optional< VerificationType > >(type)
                .Case("top", VerificationType::Top)
                .Case("int", VerificationType::Integer)
                .Case("float", VerificationType::Float)
                .Case("long", VerificationType::Long)
                .Case("double", VerificationType::Double)
                .Case("null", VerificationType::Null)
                .Case("uninitialized_this", VerificationType::UninitializedThis)
                .Default(std::nullopt);
        }

        llvm::Error parse_error(const llvm::Twine &message) {
            return llvm::createStringError(
                std::make_error_code(std::errc::invalid_argument), "%s", message.str().c_str()
            );
        }

    } // namespace

    llvm::Expected< ClassFile > JsonParser::deserialize_class(const JsonObject &root) {
        ClassFile class_file;
        if (auto name = root.getString("class")) {
            class_file.name = name->str();
        }

        const auto *methods = root.getArray("methods");
        if (methods == nullptr) {
            return parse_error("class object has no 'methods' array");
        }

        for (const auto &method_value : *methods) {
            const auto *method_obj = method_value.getAsObject();
            if (method_obj == nullptr) {
                return parse_error("'methods' entries must be objects");
            }

            auto method = deserialize_method(*method_obj);
            if (!method) {
                return method.takeError();
            }
            class_file.methods.emplace_back(std::move(*method));
        }

        return class_file;
    }

    llvm::Expected< MethodBody > JsonParser::deserialize_method(const JsonObject &method_obj) {
        auto name = get_string(method_obj, "name");
        if (!name) {
            return name.takeError();
        }

        MethodBody method(*name, "");
        if (auto descriptor = method_obj.getString("descriptor")) {
            method.descriptor = descriptor->str();
        }

        LabelMap labels;

        // Prefix nested errors with the method and the position in the stream
        auto in_method = [&](llvm::Error err, const llvm::Twine &where) {
            return parse_error(
                "method '" + method.name + "' " + where + ": " + llvm::toString(std::move(err))
            );
        };

        const auto *instructions = method_obj.getArray("instructions");
        if (instructions == nullptr) {
            return parse_error("method '" + method.name + "' has no 'instructions' array");
        }

        for (size_t index = 0; index < instructions->size(); ++index) {
            const auto *node_obj = (*instructions)[index].getAsObject();
            if (node_obj == nullptr) {
                return parse_error(
                    "method '" + method.name + "' instruction " + llvm::Twine(index)
                    + ": expected an object"
                );
            }

            auto node = create_node(*node_obj, method, labels);
            if (!node) {
                return in_method(node.takeError(), "instruction " + llvm::Twine(index));
            }
            method.instructions.emplace_back(std::move(*node));
        }

        if (const auto *blocks = method_obj.getArray("try_catch_blocks")) {
            for (size_t index = 0; index < blocks->size(); ++index) {
                const auto *block_obj = (*blocks)[index].getAsObject();
                if (block_obj == nullptr) {
                    return parse_error(
                        "method '" + method.name + "' try-catch block " + llvm::Twine(index)
                        + ": expected an object"
                    );
                }

                auto block = create_try_catch_block(*block_obj, method, labels);
                if (!block) {
                    return in_method(block.takeError(), "try-catch block " + llvm::Twine(index));
                }
                method.try_catch_blocks.emplace_back(std::move(*block));
            }
        }

        return method;
    }

    llvm::Expected< Node >
    JsonParser::create_node(const JsonObject &node_obj, MethodBody &method, LabelMap &labels) {
        auto kind_name = get_string(node_obj, "kind");
        if (!kind_name) {
            return kind_name.takeError();
        }

        switch (convert_to_kind(*kind_name)) {
            case NodeKind::Insn: {
                auto opcode = get_opcode(node_obj);
                if (!opcode) {
                    return opcode.takeError();
                }
                return InsnNode{ *opcode };
            }
            case NodeKind::Int: {
                auto opcode = get_opcode(node_obj);
                if (!opcode) {
                    return opcode.takeError();
                }
                auto operand = get_integer(
                    node_obj, "operand", std::numeric_limits< int32_t >::min(),
                    std::numeric_limits< int32_t >::max()
                );
                if (!operand) {
                    return operand.takeError();
                }
                return IntInsnNode{ *opcode, static_cast< int32_t >(*operand) };
            }
            case NodeKind::Var: {
                auto opcode = get_opcode(node_obj);
                if (!opcode) {
                    return opcode.takeError();
                }
                auto var = get_integer(node_obj, "var", 0, std::numeric_limits< uint16_t >::max());
                if (!var) {
                    return var.takeError();
                }
                return VarInsnNode{ *opcode, static_cast< uint16_t >(*var) };
            }
            case NodeKind::Type: {
                auto opcode = get_opcode(node_obj);
                if (!opcode) {
                    return opcode.takeError();
                }
                auto type = get_string(node_obj, "type");
                if (!type) {
                    return type.takeError();
                }
                return TypeInsnNode{ *opcode, std::move(*type) };
            }
            case NodeKind::Field: {
                auto opcode = get_opcode(node_obj);
                if (!opcode) {
                    return opcode.takeError();
                }
                auto owner      = get_string(node_obj, "owner");
                auto name       = get_string(node_obj, "name");
                auto descriptor = get_string(node_obj, "descriptor");
                if (auto err = llvm::joinErrors(
                        llvm::joinErrors(owner.takeError(), name.takeError()),
                        descriptor.takeError()
                    ))
                {
                    return std::move(err);
                }
                return FieldInsnNode{ *opcode, std::move(*owner), std::move(*name),
                                      std::move(*descriptor) };
            }
            case NodeKind::Method: {
                auto opcode = get_opcode(node_obj);
                if (!opcode) {
                    return opcode.takeError();
                }
                auto owner      = get_string(node_obj, "owner");
                auto name       = get_string(node_obj, "name");
                auto descriptor = get_string(node_obj, "descriptor");
                if (auto err = llvm::joinErrors(
                        llvm::joinErrors(owner.takeError(), name.takeError()),
                        descriptor.takeError()
                    ))
                {
                    return std::move(err);
                }
                bool is_interface = false;
                if (auto value = node_obj.getBoolean("interface")) {
                    is_interface = *value;
                } else {
                    is_interface = *opcode == Opcode::INVOKEINTERFACE;
                }
                return MethodInsnNode{ *opcode, std::move(*owner), std::move(*name),
                                       std::move(*descriptor), is_interface };
            }
            case NodeKind::InvokeDynamic: {
                auto name       = get_string(node_obj, "name");
                auto descriptor = get_string(node_obj, "descriptor");
                if (auto err = llvm::joinErrors(name.takeError(), descriptor.takeError())) {
                    return std::move(err);
                }
                std::string bootstrap;
                if (auto value = node_obj.getString("bootstrap")) {
                    bootstrap = value->str();
                }
                return InvokeDynamicInsnNode{ std::move(*name), std::move(*descriptor),
                                              std::move(bootstrap) };
            }
            case NodeKind::Jump: {
                auto opcode = get_opcode(node_obj);
                if (!opcode) {
                    return opcode.takeError();
                }
                auto target = get_label(node_obj, "target", method, labels);
                if (!target) {
                    return target.takeError();
                }
                return JumpInsnNode{ *opcode, *target };
            }
            case NodeKind::Label: {
                auto label = get_label(node_obj, "name", method, labels);
                if (!label) {
                    return label.takeError();
                }
                return LabelNode{ *label };
            }
            case NodeKind::Ldc: {
                const auto *constant = node_obj.get("constant");
                if (constant == nullptr) {
                    return parse_error("missing field 'constant'");
                }
                if (auto text = constant->getAsString()) {
                    return LdcInsnNode{ text->str() };
                }
                std::string rendered;
                llvm::raw_string_ostream os(rendered);
                os << *constant;
                return LdcInsnNode{ os.str() };
            }
            case NodeKind::Iinc: {
                auto var = get_integer(node_obj, "var", 0, std::numeric_limits< uint16_t >::max());
                if (!var) {
                    return var.takeError();
                }
                auto increment = get_integer(
                    node_obj, "increment", std::numeric_limits< int16_t >::min(),
                    std::numeric_limits< int16_t >::max()
                );
                if (!increment) {
                    return increment.takeError();
                }
                return IincInsnNode{ static_cast< uint16_t >(*var),
                                     static_cast< int16_t >(*increment) };
            }
            case NodeKind::TableSwitch: {
                auto insn = create_table_switch(node_obj, method, labels);
                if (!insn) {
                    return insn.takeError();
                }
                return std::move(*insn);
            }
            case NodeKind::LookupSwitch: {
                auto insn = create_lookup_switch(node_obj, method, labels);
                if (!insn) {
                    return insn.takeError();
                }
                return std::move(*insn);
            }
            case NodeKind::MultiANewArray: {
                auto descriptor = get_string(node_obj, "descriptor");
                if (!descriptor) {
                    return descriptor.takeError();
                }
                auto dimensions =
                    get_integer(node_obj, "dimensions", 1, std::numeric_limits< uint8_t >::max());
                if (!dimensions) {
                    return dimensions.takeError();
                }
                return MultiANewArrayInsnNode{ std::move(*descriptor),
                                               static_cast< uint8_t >(*dimensions) };
            }
            case NodeKind::Frame: {
                auto frame = create_frame(node_obj, method, labels);
                if (!frame) {
                    return frame.takeError();
                }
                return std::move(*frame);
            }
            case NodeKind::Line: {
                auto line = get_integer(node_obj, "line", 0, std::numeric_limits< uint32_t >::max());
                if (!line) {
                    return line.takeError();
                }
                auto start = get_label(node_obj, "start", method, labels);
                if (!start) {
                    return start.takeError();
                }
                return LineNumberNode{ static_cast< uint32_t >(*line), *start };
            }
            case NodeKind::Invalid:
                break;
        }

        return parse_error("unknown node kind '" + *kind_name + "'");
    }

    llvm::Expected< TryCatchBlock > JsonParser::create_try_catch_block(
        const JsonObject &block_obj, MethodBody &method, LabelMap &labels
    ) {
        auto start   = get_label(block_obj, "start", method, labels);
        auto end     = get_label(block_obj, "end", method, labels);
        auto handler = get_label(block_obj, "handler", method, labels);
        if (auto err = llvm::joinErrors(
                llvm::joinErrors(start.takeError(), end.takeError()), handler.takeError()
            ))
        {
            return std::move(err);
        }

        TryCatchBlock block{ *start, *end, *handler, std::nullopt };
        if (auto type = block_obj.getString("type")) {
            block.type = type->str();
        }
        return block;
    }

    llvm::Expected< FrameNode >
    JsonParser::create_frame(const JsonObject &frame_obj, MethodBody &method, LabelMap &labels) {
        auto type_name = get_string(frame_obj, "type");
        if (!type_name) {
            return type_name.takeError();
        }

        auto type = convert_to_frame_type(*type_name);
        if (!type) {
            return parse_error("unknown frame type '" + *type_name + "'");
        }

        FrameNode frame{ *type, {}, {} };
        auto read_entries = [&](llvm::StringRef field,
                                std::vector< FrameEntry > &entries) -> llvm::Error {
            const auto *array = frame_obj.getArray(field);
            if (array == nullptr) {
                return llvm::Error::success();
            }
            for (const auto &value : *array) {
                auto entry = create_frame_entry(value, method, labels);
                if (!entry) {
                    return entry.takeError();
                }
                entries.emplace_back(std::move(*entry));
            }
            return llvm::Error::success();
        };

        if (auto err = read_entries("locals", frame.locals)) {
            return std::move(err);
        }
        if (auto err = read_entries("stack", frame.stack)) {
            return std::move(err);
        }
        return frame;
    }

    llvm::Expected< FrameEntry >
    JsonParser::create_frame_entry(const JsonValue &entry, MethodBody &method, LabelMap &labels) {
        if (auto name = entry.getAsString()) {
            if (auto type = convert_to_verification_type(*name)) {
                return *type;
            }
            return parse_error("unknown verification type '" + *name + "'");
        }

        const auto *entry_obj = entry.getAsObject();
        if (entry_obj == nullptr) {
            return parse_error("frame entries must be strings or objects");
        }

        if (auto object = entry_obj->getString("object")) {
            return ObjectType{ object->str() };
        }

        if (entry_obj->get("uninitialized") != nullptr) {
            auto label = get_label(*entry_obj, "uninitialized", method, labels);
            if (!label) {
                return label.takeError();
            }
            return *label;
        }

        return parse_error("frame entry needs an 'object' or 'uninitialized' field");
    }

    llvm::Expected< TableSwitchInsnNode > JsonParser::create_table_switch(
        const JsonObject &switch_obj, MethodBody &method, LabelMap &labels
    ) {
        auto min = get_integer(
            switch_obj, "min", std::numeric_limits< int32_t >::min(),
            std::numeric_limits< int32_t >::max()
        );
        auto max = get_integer(
            switch_obj, "max", std::numeric_limits< int32_t >::min(),
            std::numeric_limits< int32_t >::max()
        );
        if (auto err = llvm::joinErrors(min.takeError(), max.takeError())) {
            return std::move(err);
        }
        if (*max < *min) {
            return parse_error(llvm::formatv("tableswitch range [{0}, {1}] is empty", *min, *max));
        }

        auto default_target = get_label(switch_obj, "default", method, labels);
        if (!default_target) {
            return default_target.takeError();
        }
        auto targets = get_label_array(switch_obj, "targets", method, labels);
        if (!targets) {
            return targets.takeError();
        }

        auto expected = static_cast< size_t >(*max - *min + 1);
        if (targets->size() != expected) {
            return parse_error(
                llvm::formatv(
                    "tableswitch over [{0}, {1}] needs {2} targets, found {3}", *min, *max,
                    expected, targets->size()
                )
            );
        }

        return TableSwitchInsnNode{ static_cast< int32_t >(*min), static_cast< int32_t >(*max),
                                    *default_target, std::move(*targets) };
    }

    llvm::Expected< LookupSwitchInsnNode > JsonParser::create_lookup_switch(
        const JsonObject &switch_obj, MethodBody &method, LabelMap &labels
    ) {
        auto default_target = get_label(switch_obj, "default", method, labels);
        if (!default_target) {
            return default_target.takeError();
        }
        auto targets = get_label_array(switch_obj, "targets", method, labels);
        if (!targets) {
            return targets.takeError();
        }

        const auto *key_array = switch_obj.getArray("keys");
        if (key_array == nullptr) {
            return parse_error("missing or invalid field 'keys'");
        }

        std::vector< int32_t > keys;
        for (const auto &value : *key_array) {
            auto key = value.getAsInteger();
            if (!key || *key < std::numeric_limits< int32_t >::min()
                || *key > std::numeric_limits< int32_t >::max())
            {
                return parse_error("lookupswitch keys must be 32-bit integers");
            }
            keys.push_back(static_cast< int32_t >(*key));
        }

        if (keys.size() != targets->size()) {
            return parse_error(
                llvm::formatv(
                    "lookupswitch has {0} keys but {1} targets", keys.size(), targets->size()
                )
            );
        }

        return LookupSwitchInsnNode{ *default_target, std::move(keys), std::move(*targets) };
    }

    llvm::Expected< Label >
    JsonParser::resolve_label(llvm::StringRef name, MethodBody &method, LabelMap &labels) {
        auto iter = labels.find(name);
        if (iter != labels.end()) {
            return iter->second;
        }
        if (name.startswith(llvm::StringRef(&generated_label_prefix, 1))) {
            return parse_error(
                "label name '" + name + "' uses the reserved prefix '"
                + llvm::Twine(generated_label_prefix) + "'"
            );
        }
        auto label = method.new_label(name.str());
        labels.try_emplace(name, label);
        return label;
    }

    llvm::Expected< Label > JsonParser::get_label(
        const JsonObject &obj, llvm::StringRef field, MethodBody &method, LabelMap &labels
    ) {
        auto name = get_string(obj, field);
        if (!name) {
            return name.takeError();
        }
        return resolve_label(*name, method, labels);
    }

    llvm::Expected< std::vector< Label > > JsonParser::get_label_array(
        const JsonObject &obj, llvm::StringRef field, MethodBody &method, LabelMap &labels
    ) {
        const auto *array = obj.getArray(field);
        if (array == nullptr) {
            return parse_error("missing or invalid field '" + field + "'");
        }

        std::vector< Label > result;
        result.reserve(array->size());
        for (const auto &value : *array) {
            auto name = value.getAsString();
            if (!name || name->empty()) {
                return parse_error("entries of '" + field + "' must be label names");
            }
            auto label = resolve_label(*name, method, labels);
            if (!label) {
                return label.takeError();
            }
            result.push_back(*label);
        }
        return result;
    }

    llvm::Expected< Opcode > JsonParser::get_opcode(const JsonObject &obj) {
        auto mnemonic = get_string(obj, "opcode");
        if (!mnemonic) {
            return mnemonic.takeError();
        }
        if (auto opcode = from_string(*mnemonic)) {
            return *opcode;
        }
        return parse_error("unknown opcode '" + *mnemonic + "'");
    }

    llvm::Expected< std::string >
    JsonParser::get_string(const JsonObject &obj, llvm::StringRef field) {
        if (auto value = obj.getString(field)) {
            if (!value->empty()) {
                return value->str();
            }
        }
        return parse_error("missing or invalid field '" + field + "'");
    }

    llvm::Expected< int64_t > JsonParser::get_integer(
        const JsonObject &obj, llvm::StringRef field, int64_t min_value, int64_t max_value
    ) {
        auto value = obj.getInteger(field);
        if (!value) {
            return parse_error("missing or invalid field '" + field + "'");
        }
        if (*value < min_value || *value > max_value) {
            return parse_error(
                llvm::formatv(
                    "field '{0}' value {1} is outside [{2}, {3}]", field, *value, min_value,
                    max_value
                )
            );
        }
        return *value;
    }

    llvm::Expected< ClassFile > load_class_file(llvm::StringRef file_path) {
        auto file_or_err = llvm::MemoryBuffer::getFile(file_path);
        if (std::error_code error_code = file_or_err.getError()) {
            return llvm::createStringError(
                error_code, "error reading json file '%s': %s", file_path.str().c_str(),
                error_code.message().c_str()
            );
        }

        std::unique_ptr< llvm::MemoryBuffer > buffer = std::move(file_or_err.get());
        auto json = llvm::json::parse(buffer->getBuffer());
        if (!json) {
            return json.takeError();
        }

        const auto *root = json->getAsObject();
        if (root == nullptr) {
            return parse_error("top-level JSON value must be an object");
        }
        return JsonParser().deserialize_class(*root);
    }

} // namespace covflow::bytecode
