/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <variant>

#include <llvm/Support/JSON.h>

#include <covflow/Flow/FlowError.hpp>
#include <covflow/Flow/FlowReport.hpp>
#include <covflow/Flow/LabelFlowAnalyzer.hpp>
#include <covflow/Util/Log.hpp>

namespace covflow::flow {

    llvm::StringRef to_string(MethodStatus status) {
        switch (status) {
            case MethodStatus::Analyzed:
                return "analyzed";
            case MethodStatus::Unsupported:
                return "unsupported";
            case MethodStatus::Inconsistent:
                return "inconsistent";
        }
        UNREACHABLE("unknown method status {0}", static_cast< unsigned >(status));
    }

    unsigned MethodReport::probe_count() const {
        unsigned count = 0;
        for (const auto &label : labels) {
            if (label.needs_probe) {
                ++count;
            }
        }
        return count;
    }

    MethodReport make_method_report(
        const bytecode::MethodBody &method, const LabelFlowInfoStore &store,
        bool include_unmarked
    ) {
        MethodReport report{ method.name, method.descriptor, MethodStatus::Analyzed, {}, {} };
        for (const auto &node : method.instructions) {
            const auto *label_node = std::get_if< bytecode::LabelNode >(&node);
            if (label_node == nullptr) {
                continue;
            }

            auto info = store.get(label_node->label);
            bool marked = info.is_target || info.is_successor
                || info.method_invocation_line.has_value();
            if (!marked && !include_unmarked) {
                continue;
            }

            report.labels.push_back(LabelReport{ method.label_name(label_node->label), info,
                                                 store.needs_probe(label_node->label) });
        }
        return report;
    }

    MethodReport make_rejected_report(const bytecode::MethodBody &method, llvm::Error err) {
        MethodReport report{ method.name, method.descriptor, MethodStatus::Inconsistent, {}, {} };
        llvm::handleAllErrors(
            std::move(err),
            [&](const UnsupportedConstructError &unsupported) {
                report.status = MethodStatus::Unsupported;
                report.error  = unsupported.message();
            },
            [&](const llvm::ErrorInfoBase &other) {
                report.status = MethodStatus::Inconsistent;
                report.error  = other.message();
            }
        );
        return report;
    }

    llvm::Expected< ClassReport >
    analyze_class(bytecode::ClassFile &class_file, const Options &options) {
        ClassReport report{ class_file.name, {} };
        for (auto &method : class_file.methods) {
            auto store = mark_labels(method, options);
            if (!store) {
                auto err = store.takeError();
                if (options.fail_fast
                    || (err.isA< UnsupportedConstructError >()
                        && options.on_unsupported == UnsupportedPolicy::Abort))
                {
                    return std::move(err);
                }
                report.methods.emplace_back(make_rejected_report(method, std::move(err)));
                continue;
            }

            report.methods.emplace_back(
                make_method_report(method, *store, options.include_unmarked)
            );
        }
        return report;
    }

    void write_json_report(const ClassReport &report, llvm::raw_ostream &os) {
        llvm::json::OStream json(os, 2);
        json.object([&] {
            json.attribute("class", report.name);
            json.attributeArray("methods", [&] {
                for (const auto &method : report.methods) {
                    json.object([&] {
                        json.attribute("name", method.name);
                        json.attribute("descriptor", method.descriptor);
                        json.attribute("status", to_string(method.status));
                        if (method.status != MethodStatus::Analyzed) {
                            json.attribute("error", method.error);
                            return;
                        }

                        json.attribute("probes", static_cast< int64_t >(method.probe_count()));
                        json.attributeArray("labels", [&] {
                            for (const auto &label : method.labels) {
                                json.object([&] {
                                    json.attribute("label", label.name);
                                    json.attribute("target", label.info.is_target);
                                    json.attribute("multi_target", label.info.is_multi_target);
                                    json.attribute("successor", label.info.is_successor);
                                    if (label.info.method_invocation_line) {
                                        json.attribute(
                                            "method_invocation_line",
                                            static_cast< int64_t >(
                                                *label.info.method_invocation_line
                                            )
                                        );
                                    } else {
                                        json.attribute("method_invocation_line", nullptr);
                                    }
                                    json.attribute("needs_probe", label.needs_probe);
                                });
                            }
                        });
                    });
                }
            });
        });
        os << "\n";
    }

    void write_text_report(const ClassReport &report, llvm::raw_ostream &os) {
        os << "class " << report.name << "\n";
        for (const auto &method : report.methods) {
            os << "method " << method.name << method.descriptor << ": "
               << to_string(method.status);
            if (method.status != MethodStatus::Analyzed) {
                os << " (" << method.error << ")\n";
                continue;
            }
            os << ", " << method.probe_count() << " probe(s)\n";

            for (const auto &label : method.labels) {
                os << "  " << label.name << ":";
                const auto &info = label.info;
                if (!info.is_target && !info.is_successor && !info.method_invocation_line) {
                    os << " -";
                }
                if (info.is_target) {
                    os << " target";
                }
                if (info.is_multi_target) {
                    os << " multitarget";
                }
                if (info.is_successor) {
                    os << " successor";
                }
                if (info.method_invocation_line) {
                    os << " line=" << *info.method_invocation_line;
                }
                if (label.needs_probe) {
                    os << " probe";
                }
                os << "\n";
            }
        }
    }

    void write_report(const ClassReport &report, ReportFormat format, llvm::raw_ostream &os) {
        switch (format) {
            case ReportFormat::Json:
                write_json_report(report, os);
                return;
            case ReportFormat::Text:
                write_text_report(report, os);
                return;
        }
    }

} // namespace covflow::flow
