#include <iostream>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <algorithm>
#include <stdexcept>

// --- Headers required for extraction ---
#include "flb_container.hpp"
#include "extractor.hpp"

// --- Headers required for rebuilding ---
#include "flb_builder.hpp"

#include "reporter.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

struct ExtractOptions {
    std::string file_path;
    std::optional<std::string> extract_path;
};

struct RebuildOptions {
    fs::path input_dir;
    fs::path output_file;
};

void printUsage(const char* progName) {
    std::cerr << "A tool to extract and rebuild FLB3 network adapter firmware." << std::endl;
    std::cerr << "Usage: " << progName << " <command> [options]" << std::endl << std::endl;
    std::cerr << "Commands:" << std::endl;
    std::cerr << "  extract    Extract an FLB3 file to a folder." << std::endl;
    std::cerr << "  rebuild    Rebuild an extracted folder into an FLB3 file (alias: repack)." << std::endl << std::endl;
    std::cerr << "Options for 'extract':" << std::endl;
    std::cerr << "  " << progName << " extract <flb_file> [-d <path>]" << std::endl;
    std::cerr << "    <flb_file>           Path to the input FLB3 firmware file." << std::endl;
    std::cerr << "    -d, --dest <path>    The directory to extract chunks to." << std::endl;
    std::cerr << "                         (If not specified, only chunk info will be printed)." << std::endl << std::endl;
    std::cerr << "Options for 'rebuild':" << std::endl;
    std::cerr << "  " << progName << " rebuild <input_dir> <output_file>" << std::endl;
    std::cerr << "    <input_dir>          Directory containing chunk_NNN.bin and chunk_NNN.json files." << std::endl;
    std::cerr << "    <output_file>        Path for the new output FLB3 file." << std::endl << std::endl;
    std::cerr << "General Options:" << std::endl;
    std::cerr << "  --debug              Output debugging information (like payload hex previews)." << std::endl;
    std::cerr << "  -h, --help           Show this help message and exit." << std::endl;
}

void run_extract(const ExtractOptions& options, Reporter& reporter) {
    std::vector<char> input_data = read_filepath(options.file_path);

    if (input_data.size() < sizeof(FLB_MAGIC) || !std::equal(FLB_MAGIC, FLB_MAGIC + sizeof(FLB_MAGIC), input_data.begin())) {
        reporter.warning("File does not appear to be FLB3, continuing anyway... this is not likely going to work");
    }

    FlbContainer container = FlbContainer::parse(input_data, reporter);
    reporter.info("Parsed " + std::to_string(container.chunks.size()) + " chunks");

    if (options.extract_path.has_value()) {
        extract_chunks(container, *options.extract_path, reporter);
    }
}

void run_rebuild(const RebuildOptions& options, Reporter& reporter) {
    FlbBuilder builder(options.input_dir);
    builder.build(options.output_file, reporter);
}

int main(int argc, char* argv[]) {
    // Handle help and global options in priority
    bool debug = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--debug") {
            debug = true;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        std::cerr << "Error: No command specified. Use 'extract' or 'rebuild'." << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    ConsoleReporter reporter(debug);

    try {
        const std::string& command = args[0];

        if (command == "extract") {
            ExtractOptions options;

            for (size_t i = 1; i < args.size(); ++i) {
                const std::string& arg = args[i];
                if (arg == "-d" || arg == "--dest") {
                    if (i + 1 < args.size()) {
                        options.extract_path = args[++i];
                    } else {
                        std::cerr << "Error: " << arg << " option requires an argument." << std::endl;
                        printUsage(argv[0]);
                        return 1;
                    }
                } else {
                    if (!options.file_path.empty()) {
                        std::cerr << "Error: Multiple input files specified for extract. Only one is allowed." << std::endl;
                        printUsage(argv[0]);
                        return 1;
                    }
                    options.file_path = arg;
                }
            }

            if (options.file_path.empty()) {
                std::cerr << "Error: Input FLB3 file not specified for extract command." << std::endl;
                printUsage(argv[0]);
                return 1;
            }

            run_extract(options, reporter);

        } else if (command == "rebuild" || command == "repack") {
            if (args.size() != 3) {
                std::cerr << "Error: Invalid number of arguments for rebuild command." << std::endl;
                std::cerr << "Usage: " << argv[0] << " rebuild <input_dir> <output_file>" << std::endl;
                return 1;
            }

            RebuildOptions options{args[1], args[2]};
            run_rebuild(options, reporter);
        } else {
            std::cerr << "Error: Unknown command '" << command << "'. Use 'extract' or 'rebuild'." << std::endl;
            printUsage(argv[0]);
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "An error occurred: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
