#pragma once

#include <stdexcept>
#include <string>

namespace routematch::track {

///
/// Empty or structurally invalid input (too few points, negative tolerance, ...).
///
class invalid_input_error : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

///
/// Two sequences that must pair up positionally have different lengths.
///
class length_mismatch_error : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;

    ///
    /// Builds the message from the two offending lengths.
    ///
    /// @param what Description of the paired sequences
    /// @param expected Length required by the receiver
    /// @param actual Length supplied by the caller
    ///
    length_mismatch_error(const std::string& what, std::size_t expected, std::size_t actual)
        : std::invalid_argument{what + ": expected " + std::to_string(expected) + " values, got " + std::to_string(actual)} {}
};

///
/// An operation needing elevation found none (or not enough) on the points.
///
class no_elevation_data_error : public std::domain_error {
   public:
    using std::domain_error::domain_error;
};

///
/// No pair of boundary points lies within the alignment tolerance.
///
class no_alignment_found_error : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

///
/// Alignment would leave a track with fewer than two points.
///
class insufficient_overlap_error : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

}  // namespace routematch::track
