#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "jsguard/frontend/parser.hpp"
#include "jsguard/frontend/source_loader.hpp"
#include "jsguard/frontend/static_analyzer.hpp"
#include "jsguard/frontend/tokenizer.hpp"
#include "jsguard/report/issue_report.hpp"
#include "jsguard/report/report_writer.hpp"
#include "llvm/Support/raw_ostream.h"

namespace {

enum class ReportFormat {
    Text,
    Json,
};

struct CliOptions {
    bool show_help = false;
    bool verbose = false;
    bool dump_tokens = false;
    std::string input_path;
    std::string output_path;
    ReportFormat format = ReportFormat::Text;
};

void PrintHelp() {
    llvm::outs()
        << "jsguard - static analyzer for JavaScript sources\n"
        << "Usage:\n"
        << "  jsguard <file.js> [options]\n\n"
        << "Options:\n"
        << "  -h, --help               Show this help\n"
        << "  -o, --output <file>      Write the report to <file>\n"
        << "  --format text|json       Report format (default: text)\n"
        << "  --tokens                 Print the token stream and exit\n"
        << "  --verbose                Print extra information\n\n"
        << "Environment:\n"
        << "  JSGUARD_FORMAT           Default report format (text or json)\n\n"
        << "Examples:\n"
        << "  jsguard app.js\n"
        << "  jsguard app.js --format json -o report.json\n";
}

bool ParseFormat(const std::string& value, ReportFormat* out_format) {
    if (value == "text") {
        *out_format = ReportFormat::Text;
        return true;
    }
    if (value == "json") {
        *out_format = ReportFormat::Json;
        return true;
    }
    return false;
}

bool ParseArgs(int argc, char* argv[], CliOptions* out_options, std::string* out_error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            out_options->show_help = true;
            continue;
        }

        if (arg == "--verbose") {
            out_options->verbose = true;
            continue;
        }

        if (arg == "--tokens") {
            out_options->dump_tokens = true;
            continue;
        }

        if (arg == "--format") {
            if (i + 1 >= argc) {
                *out_error = "Missing value for --format.";
                return false;
            }

            const std::string value = argv[++i];
            if (!ParseFormat(value, &out_options->format)) {
                *out_error = "Invalid format: " + value;
                return false;
            }
            continue;
        }

        if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                *out_error = "Missing value for --output.";
                return false;
            }
            out_options->output_path = argv[++i];
            continue;
        }

        if (!arg.empty() && arg[0] == '-') {
            *out_error = "Unknown option: " + arg;
            return false;
        }

        if (out_options->input_path.empty()) {
            out_options->input_path = arg;
        } else {
            *out_error = "Multiple input files given.";
            return false;
        }
    }

    if (out_options->input_path.empty() && !out_options->show_help) {
        *out_error = "Please provide a file to analyze.";
        return false;
    }

    return true;
}

std::string RenderReport(const std::vector<jsguard::frontend::Issue>& issues, ReportFormat format) {
    std::string rendered;
    llvm::raw_string_ostream stream(rendered);
    if (format == ReportFormat::Json) {
        jsguard::report::WriteJsonReport(issues, stream);
    } else {
        stream << jsguard::report::FormatIssues(issues) << "\n";
    }
    stream.flush();
    return rendered;
}

}  // namespace

int main(int argc, char* argv[]) {
    CliOptions options;

    if (const char* env_format = std::getenv("JSGUARD_FORMAT"); env_format != nullptr) {
        ReportFormat parsed_format = ReportFormat::Text;
        if (ParseFormat(env_format, &parsed_format)) {
            options.format = parsed_format;
        }
    }

    std::string cli_error;
    if (!ParseArgs(argc, argv, &options, &cli_error)) {
        llvm::errs() << "Error: " << cli_error << "\n";
        llvm::errs() << "Use --help to see available options.\n";
        return 1;
    }

    if (options.show_help) {
        PrintHelp();
        return 0;
    }

    std::string source_text;
    std::string load_error;
    if (!jsguard::frontend::LoadSourceText(options.input_path, &source_text, &load_error)) {
        llvm::errs() << "Error: " << load_error << "\n";
        return 1;
    }

    std::vector<jsguard::frontend::Token> tokens = jsguard::frontend::Tokenizer::Tokenize(source_text);
    if (options.verbose) {
        llvm::errs() << "[jsguard] tokens: " << tokens.size() << "\n";
    }

    if (options.dump_tokens) {
        jsguard::report::WriteTokenDump(tokens, llvm::outs());
        return 0;
    }

    jsguard::frontend::Parser parser(std::move(tokens));
    jsguard::frontend::ParseResult parsed = parser.Parse();
    if (options.verbose) {
        llvm::errs() << "[jsguard] statements: " << parsed.program.body.size() << "\n";
        for (const auto& diagnostic : parsed.errors) {
            llvm::errs() << "[jsguard] parse error: " << diagnostic.message << "\n";
        }
    }

    jsguard::frontend::StaticAnalyzer analyzer;
    const std::vector<jsguard::frontend::Issue> issues = analyzer.Analyze(parsed.program);
    if (options.verbose) {
        llvm::errs() << "[jsguard] issues: " << issues.size() << "\n";
    }

    if (!options.output_path.empty()) {
        std::string write_error;
        if (!jsguard::report::WriteReportFile(
                options.output_path,
                RenderReport(issues, options.format),
                &write_error)) {
            llvm::errs() << "Error: " << write_error << "\n";
            return 1;
        }

        llvm::outs() << "Analysis complete. Results saved to " << options.output_path << "\n";
        return 0;
    }

    if (options.format == ReportFormat::Json) {
        jsguard::report::WriteJsonReport(issues, llvm::outs());
    } else {
        jsguard::report::WriteTextReport(issues, llvm::outs());
    }

    return 0;
}
