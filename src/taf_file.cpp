//
//  taf_file.cpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "taf_file.hpp"

#include <cerrno>
#include <filesystem>
#include <system_error>

#include "logging.hpp"
#include "taf_errors.hpp"

namespace tafforge {

std::optional<TafFile> open_taf(const std::string &path) {
    std::error_code ec;
    const std::filesystem::path p(path);
    if (!std::filesystem::is_regular_file(p, ec)) {
        TF_LOG("io", "not a regular file: " << path);
        return std::nullopt;
    }
    const auto size = std::filesystem::file_size(p, ec);
    if (ec) {
        TF_LOG("warn", "cannot stat " << path << ": " << ec.message());
        return std::nullopt;
    }
    TafFile file;
    file.path = path;
    file.total_size = static_cast<uint64_t>(size);
    return file;
}

std::ifstream open_input(const TafFile &file) {
    std::ifstream in(file.path, std::ios::binary);
    if (!in.is_open()) {
        throw TafError("open failed for " + file.path + " errno=" + std::to_string(errno) + " (" +
                       std::generic_category().message(errno) + ")");
    }
    return in;
}

}  // namespace tafforge
