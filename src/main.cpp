//
//  main.cpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "logging.hpp"
#include "report_json.hpp"
#include "tafforge.hpp"
#include <nlohmann/json.hpp>

tafforge::LogVerbosity parse_level(const std::string &s) {
    if (s == "debug") return tafforge::LogVerbosity::Debug;
    if (s == "info") return tafforge::LogVerbosity::Info;
    if (s == "warn" || s == "warning") return tafforge::LogVerbosity::Warn;
    return tafforge::LogVerbosity::Error;
}

void print_usage() {
    std::cerr << "TafForge " << tafforge::version_string() << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  tafforge info <file.taf>\n"
              << "  tafforge validate <file.taf> [--no-hash-check] [--tolerance BYTES]\n"
              << "  tafforge compare <a.taf> <b.taf> [--detailed]\n"
              << "  tafforge split <file.taf> <output-dir>\n"
              << "Options:\n"
              << "  --log-level LEVEL   Set logging verbosity: error|warn|info|debug "
              << "(default: warn).\n"
              << "  --detailed          Compare page by page.\n"
              << "  --no-hash-check     Skip the audio SHA-1 check when validating.\n"
              << "  --tolerance BYTES   Allowed dataLength deviation (default: 4096).\n"
              << "Results are written to stdout as JSON.\n";
}

// Error kind for messages: which stage of the codec gave up.
const char *error_kind(const std::exception &e) {
    if (dynamic_cast<const tafforge::HeaderDecodeError *>(&e)) return "header";
    if (dynamic_cast<const tafforge::HeaderEncodeError *>(&e)) return "header-encode";
    if (dynamic_cast<const tafforge::StreamFormatError *>(&e)) return "audio-stream";
    if (dynamic_cast<const tafforge::IncompleteReadError *>(&e)) return "truncated";
    return "io";
}

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "TafForge " << tafforge::version_string() << "\n";
        return 0;
    }

    std::vector<std::string> positional;
    tafforge::ValidationOptions validation;
    tafforge::CompareOptions comparison;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--detailed") {
            comparison.detailed = true;
        } else if (arg == "--no-hash-check") {
            validation.verify_audio_hash = false;
        } else if (arg == "--tolerance" && i + 1 < argc) {
            try {
                validation.data_length_tolerance = std::stoull(argv[++i]);
            } catch (const std::exception &) {
                std::cerr << "Invalid --tolerance value: " << argv[i] << "\n";
                return 2;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            tafforge::set_log_verbosity(parse_level(argv[i + 1]));
            ++i;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }
    const std::string command = positional[0];
    const std::vector<std::string> args(positional.begin() + 1, positional.end());

    try {
        if (command == "info" && args.size() == 1) {
            const auto info = tafforge::read_header_info(args[0]);
            std::cout << tafforge::render(tafforge::to_json(info)) << "\n";
            return 0;
        }
        if (command == "validate" && args.size() == 1) {
            auto report = tafforge::validate_file(args[0], validation);
            std::cout << tafforge::render(tafforge::to_json(report)) << "\n";
            return report.valid ? 0 : 1;
        }
        if (command == "compare" && args.size() == 2) {
            auto result = tafforge::compare(args[0], args[1], comparison);
            std::cout << tafforge::render(tafforge::to_json(result)) << "\n";
            return result.identical ? 0 : 1;
        }
        if (command == "split" && args.size() == 2) {
            auto outputs = tafforge::split(args[0], args[1]);
            std::cout << tafforge::render(nlohmann::json(outputs)) << "\n";
            return 0;
        }
    } catch (const tafforge::TafError &e) {
        TF_LOG("error", "tafforge " << command << " [" << error_kind(e) << "] " << args[0] << ": "
                                    << e.what());
        return 1;
    } catch (const std::exception &e) {
        TF_LOG("error", "tafforge " << command << ": " << e.what());
        return 1;
    }

    std::cerr << "Invalid arguments. See usage.\n";
    print_usage();
    return 2;
}
