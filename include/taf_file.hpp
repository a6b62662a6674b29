//
//  taf_file.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>

#include "tonie_header.hpp"

namespace tafforge {

/// One container on disk. The header region size and audio offset never vary.
struct TafFile {
    std::string path;
    uint64_t total_size = 0;

    static constexpr uint64_t header_region_size = kTafHeaderRegionSize;
    static constexpr uint64_t audio_region_offset = kTafAudioOffset;

    uint64_t audio_size() const {
        return total_size > audio_region_offset ? total_size - audio_region_offset : 0;
    }
};

/// Stat a path; std::nullopt when it does not exist or is not a regular file.
std::optional<TafFile> open_taf(const std::string &path);

/// Open the file for binary reading. Throws TafError when it cannot be opened.
std::ifstream open_input(const TafFile &file);

}  // namespace tafforge
