/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <cstdlib>
#include <optional>
#include <string>

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/raw_ostream.h>

#include <covflow/Bytecode/JsonDeserialize.hpp>
#include <covflow/Bytecode/Printer.hpp>
#include <covflow/Flow/FlowReport.hpp>
#include <covflow/Util/Log.hpp>
#include <covflow/Util/Options.hpp>
#include <covflow/YAML/ConfigurationFile.hpp>

/*************************/
// Command line options
/**************************/

namespace {

    const llvm::cl::opt< std::string > input_filename( // NOLINT(cert-err58-cpp)
        llvm::cl::Positional, llvm::cl::desc("<input JSON file>"),
        llvm::cl::value_desc("filename"), llvm::cl::Required
    );

    const llvm::cl::opt< std::string > output_filename( // NOLINT(cert-err58-cpp)
        "o", llvm::cl::desc("Output file (default: stdout)"), llvm::cl::value_desc("filename"),
        llvm::cl::init("")
    );

    const llvm::cl::opt< std::string > config_filename( // NOLINT(cert-err58-cpp)
        "config", llvm::cl::desc("YAML configuration file"), llvm::cl::value_desc("filename"),
        llvm::cl::init("")
    );

    const llvm::cl::opt< covflow::ReportFormat > report_format( // NOLINT(cert-err58-cpp)
        "format", llvm::cl::desc("Report format"),
        llvm::cl::values(
            clEnumValN(covflow::ReportFormat::Json, "json", "JSON report"),
            clEnumValN(covflow::ReportFormat::Text, "text", "Plain text report")
        ),
        llvm::cl::init(covflow::ReportFormat::Json)
    );

    const llvm::cl::opt< bool > no_normalize( // NOLINT(cert-err58-cpp)
        "no-normalize", llvm::cl::desc("Skip moving line markers in front of frames"),
        llvm::cl::init(false)
    );

    const llvm::cl::opt< bool > include_unmarked( // NOLINT(cert-err58-cpp)
        "include-unmarked", llvm::cl::desc("Also report labels without any flow attribute"),
        llvm::cl::init(false)
    );

    const llvm::cl::opt< bool > print_normalized( // NOLINT(cert-err58-cpp)
        "print-normalized", llvm::cl::desc("Print every method to stderr after normalization"),
        llvm::cl::init(false)
    );

    const llvm::cl::opt< bool > fail_fast( // NOLINT(cert-err58-cpp)
        "fail-fast", llvm::cl::desc("Abort on the first method that fails analysis"),
        llvm::cl::init(false)
    );

    const llvm::cl::opt< bool > verbose( // NOLINT(cert-err58-cpp)
        "verbose", llvm::cl::desc("Enable debug logs"), llvm::cl::init(false)
    );

    // Settings from the configuration file are applied first, explicit
    // command line flags override them.
    std::optional< covflow::Options > build_options() {
        covflow::Options opts;
        opts.input_file  = input_filename.getValue();
        opts.output_file = output_filename.getValue();
        opts.config_file = config_filename.getValue();

        if (!opts.config_file.empty()) {
            auto config = covflow::yaml::utils::loadConfiguration(opts.config_file);
            if (!config) {
                LOG(ERROR) << "Failed to load configuration: "
                           << llvm::toString(config.takeError()) << "\n";
                return std::nullopt;
            }
            covflow::yaml::apply_configuration(*config, opts);
        }

        if (report_format.getNumOccurrences() > 0) {
            opts.format = report_format.getValue();
        }
        if (no_normalize) {
            opts.normalize_frames = false;
        }
        if (include_unmarked) {
            opts.include_unmarked = true;
        }
        if (fail_fast) {
            opts.fail_fast      = true;
            opts.on_unsupported = covflow::UnsupportedPolicy::Abort;
        }
        opts.print_normalized = print_normalized.getValue();
        opts.verbose          = verbose.getValue();
        return opts;
    }

    bool write_output(const covflow::flow::ClassReport &report, const covflow::Options &options) {
        if (options.output_file.empty()) {
            covflow::flow::write_report(report, options.format, llvm::outs());
            return true;
        }

        std::error_code ec;
        llvm::raw_fd_ostream output(options.output_file, ec);
        if (ec) {
            LOG(ERROR) << "Failed to open output file: " << options.output_file << " - "
                       << ec.message() << "\n";
            return false;
        }
        covflow::flow::write_report(report, options.format, output);
        return true;
    }

} // namespace

int main(int argc, char **argv) {
    llvm::InitLLVM init(argc, argv);
    llvm::cl::ParseCommandLineOptions(
        argc, argv, "covflow-analyze computes coverage probe points of method bodies\n"
    );

    auto options = build_options();
    if (!options) {
        return EXIT_FAILURE;
    }

    auto class_file = covflow::bytecode::load_class_file(options->input_file);
    if (!class_file) {
        LOG(ERROR) << "Failed to load " << options->input_file << ": "
                   << llvm::toString(class_file.takeError()) << "\n";
        return EXIT_FAILURE;
    }

    if (options->verbose) {
        LOG(INFO) << "Loaded " << class_file->methods.size() << " method(s) of class '"
                  << class_file->name << "'\n";
    }

    auto report = covflow::flow::analyze_class(*class_file, *options);
    if (!report) {
        LOG(ERROR) << "Aborting: " << llvm::toString(report.takeError()) << "\n";
        return EXIT_FAILURE;
    }

    for (const auto &method_report : report->methods) {
        if (method_report.status != covflow::flow::MethodStatus::Analyzed) {
            LOG(WARNING) << "Skipping method " << method_report.name << method_report.descriptor
                         << ": " << method_report.error << "\n";
        } else if (options->verbose) {
            LOG(INFO) << "Method " << method_report.name << method_report.descriptor << ": "
                      << method_report.labels.size() << " label(s), "
                      << method_report.probe_count() << " probe(s)\n";
        }
    }

    if (options->print_normalized) {
        for (const auto &method : class_file->methods) {
            covflow::bytecode::print_method(method, llvm::errs());
        }
    }

    return write_output(*report, *options) ? EXIT_SUCCESS : EXIT_FAILURE;
}
