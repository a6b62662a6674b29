//
//  tafforge.cpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tafforge.hpp"
#include "tafforge_version.hpp"

namespace tafforge {

std::string version_string() { return TAFFORGE_VERSION_DISPLAY; }

}  // namespace tafforge
