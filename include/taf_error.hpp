//
//  taf_error.hpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <stdexcept>
#include <string>

enum class TafErrorKind {
    None = 0,
    MalformedHeader,  // structural/layout violation on read
    HashMismatch,     // embedded SHA-1 does not match the audio region
    HeaderOverflow,   // header message does not fit the fixed block
    EncodeError,      // packet/page construction or packet source failure
    IoError,          // underlying sink/source failure
    InvalidArgument,  // caller asked for something the file does not have
};

inline const char *taf_error_kind_name(TafErrorKind kind) {
    switch (kind) {
        case TafErrorKind::None:
            return "None";
        case TafErrorKind::MalformedHeader:
            return "MalformedHeader";
        case TafErrorKind::HashMismatch:
            return "HashMismatch";
        case TafErrorKind::HeaderOverflow:
            return "HeaderOverflow";
        case TafErrorKind::EncodeError:
            return "EncodeError";
        case TafErrorKind::IoError:
            return "IoError";
        case TafErrorKind::InvalidArgument:
            return "InvalidArgument";
    }
    return "Unknown";
}

// Typed failure thrown by the container codec. Public entry points in tafforge.hpp
// convert it into a TafStatus.
class TafError : public std::runtime_error {
   public:
    TafError(TafErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    TafErrorKind kind() const { return kind_; }

   private:
    TafErrorKind kind_;
};
