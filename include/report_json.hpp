//
//  report_json.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "header_info.hpp"
#include "taf_comparator.hpp"
#include "taf_validator.hpp"

namespace tafforge {

// JSON renderings used by the CLI. Field names are snake_case; digests are lowercase hex.
nlohmann::json to_json(const TafHeaderInfo &info);
nlohmann::json to_json(const ValidationReport &report);
nlohmann::json to_json(const ComparisonResult &result);

// Pretty-printed output. Tag strings are not guaranteed UTF-8; invalid sequences become U+FFFD.
std::string render(const nlohmann::json &j);

}  // namespace tafforge
