//
//  taf_validator.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "opus_stream.hpp"
#include "tonie_header.hpp"

namespace tafforge {

struct ValidationOptions {
    uint64_t data_length_tolerance = 4096;  ///< bytes dataLength may differ before it is fatal
    bool verify_audio_hash = true;           ///< compare SHA-1 of the audio region with the header
    bool verify_checksums = true;            ///< recompute every page CRC
};

/// Last stage a validation reached.
enum class ValidationStage { Missing, Header, DataLength, AudioStream, Complete };

const char *to_string(ValidationStage stage);

struct ValidationReport {
    bool valid = false;
    ValidationStage stage = ValidationStage::Missing;
    std::string message;                ///< set when the file is missing
    std::vector<std::string> warnings;  ///< non-fatal findings, in check order

    uint64_t file_size = 0;
    std::optional<HeaderReadResult> header;
    std::optional<AudioStreamInfo> audio;
    std::optional<StreamSummary> stream;
};

/**
 * @brief Validate a TAF file, short-circuiting on the first fatal problem.
 *
 * Order: exists and >= 4096 bytes, header decodes, dataLength matches the audio region within
 * tolerance, audio region starts with OpusHead + OpusTags. Whole-stream checks (hash, checksums,
 * serials, alignment, chapter indices) only add warnings.
 *
 * A missing file yields `valid == false` with stage Missing and never throws.
 * @throws HeaderDecodeError for a short file, an undecodable header or a dataLength mismatch.
 * @throws StreamFormatError when the audio region is not Opus-in-Ogg.
 */
ValidationReport validate_file(const std::string &path, const ValidationOptions &options = {});

/// true for a valid file, false for a missing one; throws like validate_file() otherwise.
bool check_valid(const std::string &path);

}  // namespace tafforge
