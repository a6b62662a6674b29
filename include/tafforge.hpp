//
//  tafforge.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "chapter_splitter.hpp"
#include "header_info.hpp"
#include "taf_comparator.hpp"
#include "taf_errors.hpp"
#include "taf_validator.hpp"
#include "tonie_header.hpp"

namespace tafforge {

/// @defgroup api TafForge Public API
/// Operations exposed to the CLI and other front ends:
/// - read_header_info(): header, audio and stream facts of one file
/// - check_valid() / validate_file(): structural validity
/// - compare(): summary and page-level diff of two files
/// - split(): one playable Opus file per chapter
/// @{

/**
 * @brief Return the TafForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/// @}

}  // namespace tafforge
