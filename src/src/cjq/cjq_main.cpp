// cjq - path queries over JSON files, backed by cJSON

#include <cjb/cjb.h>
#include <cjb/cjq/cli_args.h>
#include <cjb/cjq/navigator.h>
#include <cjb/cjq/output_formatter.h>
#include <cjb/cjq/path_parser.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

std::string readInput(const cjb::cjq::CliArgs& args) {
    std::stringstream buffer;
    if (args.readsStdin()) {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream file(args.getFilePath(), std::ios::binary);
    if (not file.is_open()) throw std::runtime_error("Failed to open file: " + args.getFilePath());
    buffer << file.rdbuf();
    return buffer.str();
}

void showHelp() {
    std::cout << "cjq - query JSON files by path\n\n";
    std::cout << "Usage:\n";
    std::cout << "  cjq <file> --get <path> [--default <value>] [--as-json]\n";
    std::cout << "  cjq <file> --count <path>\n";
    std::cout << "  cjq <file> --has <path>\n";
    std::cout << "  cjq <file>\n\n";
    std::cout << "Actions:\n";
    std::cout << "  --get, -g <path>     Print the value at path\n";
    std::cout << "  --count <path>       Number of elements or members at path\n";
    std::cout << "  --has <path>         Exit 0 if path exists, 1 otherwise\n";
    std::cout << "  (default)            Pretty-print the whole document\n\n";
    std::cout << "Options:\n";
    std::cout << "  --default, -d <val>  Printed when the --get path is missing\n";
    std::cout << "  --as-json            Print strings and scalars as JSON\n";
    std::cout << "  --compact            No whitespace in JSON output\n";
    std::cout << "  --verbose, -v        Diagnostics on stderr\n";
    std::cout << "  <file> may be '-' to read standard input\n\n";
    std::cout << "Path syntax:\n";
    std::cout << "  Keys separated by /: server/port\n";
    std::cout << "  Array indices:       users/0/name\n";
    std::cout << "  Wildcards:           users/*/email\n\n";
    std::cout << "cJSON " << cjb::library_version() << "\n";
}

int run(const cjb::cjq::CliArgs& args) {
    using Action = cjb::cjq::CliArgs::Action;

    const bool verbose = args.verbose();
    std::string content = readInput(args);
    if (verbose) std::cerr << "cjq: read " << content.size() << " bytes from " << args.getFilePath() << "\n";

    cjb::Value doc = cjb::parse(content);
    if (verbose) std::cerr << "cjq: parsed " << cjb::kind_name(doc.kind()) << " document\n";

    const cjb::Format format = args.compact() ? cjb::Format::Compact : cjb::Format::Pretty;
    cjb::cjq::PathParser pathParser;
    cjb::cjq::Navigator navigator;
    cjb::cjq::OutputFormatter formatter(format);

    switch (args.getAction()) {
        case Action::PRINT:
            std::cout << doc.dump(format) << "\n";
            return 0;

        case Action::GET: {
            auto segments = pathParser.parse(args.getPath());
            try {
                if (cjb::cjq::hasWildcard(segments)) {
                    auto results = navigator.navigateWildcard(doc, segments);
                    if (verbose) std::cerr << "cjq: wildcard matched " << results.size() << " values\n";
                    if (results.empty() and args.hasDefault())
                        std::cout << args.getDefault() << "\n";
                    else if (args.outputAsJson())
                        std::cout << formatter.formatJson(results) << "\n";
                    else if (not results.empty())
                        std::cout << formatter.formatRaw(results) << "\n";
                } else {
                    auto result = navigator.navigate(doc, segments);
                    std::cout << (args.outputAsJson() ? formatter.formatJson(result) : formatter.formatRaw(result))
                              << "\n";
                }
            } catch (const cjb::TypeMismatch& e) {
                if (not args.hasDefault()) throw;
                if (verbose) std::cerr << "cjq: using default (" << e.what() << ")\n";
                std::cout << args.getDefault() << "\n";
            }
            return 0;
        }

        case Action::COUNT: {
            auto result = navigator.navigate(doc, pathParser.parse(args.getPath()));
            std::cout << result.size() << "\n";
            return 0;
        }

        case Action::HAS: {
            auto segments = pathParser.parse(args.getPath());
            try {
                navigator.navigate(doc, segments);
                return 0;
            } catch (const cjb::TypeMismatch& e) {
                if (verbose) std::cerr << "cjq: " << e.what() << "\n";
                return 1;
            }
        }

        case Action::HELP:
            break;
    }
    showHelp();
    return 0;
}

}  // namespace

int main(int argc, const char* argv[]) {
    try {
        cjb::cjq::CliArgs args(argc, argv);
        if (args.getAction() == cjb::cjq::CliArgs::Action::HELP) {
            showHelp();
            return 0;
        }
        return run(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Run 'cjq --help' for usage.\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
