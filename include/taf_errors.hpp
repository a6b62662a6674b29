//
//  taf_errors.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tafforge {

/// Base of every error raised by the container codec.
class TafError : public std::runtime_error {
   public:
    explicit TafError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief The stream ended before a structural field was complete.
 *
 * Recoverable: page iteration treats it as "no further pages".
 */
class IncompleteReadError : public TafError {
   public:
    IncompleteReadError(const std::string &what, uint64_t offset, uint64_t wanted,
                        uint64_t available)
        : TafError(what + " (offset " + std::to_string(offset) + ", wanted " +
                   std::to_string(wanted) + " bytes, got " + std::to_string(available) + ")"),
          offset_(offset),
          wanted_(wanted),
          available_(available) {}

    uint64_t offset() const { return offset_; }
    uint64_t wanted() const { return wanted_; }
    uint64_t available() const { return available_; }

   private:
    uint64_t offset_;
    uint64_t wanted_;
    uint64_t available_;
};

/**
 * @brief The header region could not be decoded.
 *
 * Carries the offset of the failing structure, the length it declared and the number of bytes
 * actually left in the file so callers can print an actionable message.
 */
class HeaderDecodeError : public TafError {
   public:
    HeaderDecodeError(const std::string &what, uint64_t offset, uint64_t declared_length,
                      uint64_t remaining)
        : TafError("header decode error: " + what + " (offset " + std::to_string(offset) +
                   ", declared length " + std::to_string(declared_length) + ", remaining " +
                   std::to_string(remaining) + ")"),
          offset_(offset),
          declared_length_(declared_length),
          remaining_(remaining) {}

    uint64_t offset() const { return offset_; }
    uint64_t declared_length() const { return declared_length_; }
    uint64_t remaining() const { return remaining_; }

   private:
    uint64_t offset_;
    uint64_t declared_length_;
    uint64_t remaining_;
};

/// A header does not fit into the fixed header region.
class HeaderEncodeError : public TafError {
   public:
    explicit HeaderEncodeError(const std::string &what)
        : TafError("header encode error: " + what) {}
};

/// The audio region is not an Opus-in-Ogg stream (or holds nothing usable).
class StreamFormatError : public TafError {
   public:
    explicit StreamFormatError(const std::string &what)
        : TafError("stream format error: " + what) {}
};

}  // namespace tafforge
