#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base class of every structural error raised while decoding or encoding FLB3 data.
class FlbError : public std::runtime_error {
public:
    explicit FlbError(const std::string& what) : std::runtime_error(what) {}
};

// Fewer bytes remain than a fixed-width record needs.
class TruncatedInputError : public FlbError {
public:
    using FlbError::FlbError;
};

// A fixed-width field cannot hold the value (text too long, non-ASCII, length overflow).
class FieldTooLongError : public FlbError {
public:
    using FlbError::FlbError;
};

// The derived device list length is not a multiple of the entry size.
class MisalignedDeviceListError : public FlbError {
public:
    using FlbError::FlbError;
};

// header_length is smaller than the two fixed sub-headers.
class NegativeDeviceListLengthError : public FlbError {
public:
    using FlbError::FlbError;
};

// The buffer ends inside a chunk.
class TrailingDataError : public FlbError {
public:
    using FlbError::FlbError;
};

// A chunk sidecar is absent or does not match the metadata schema.
class MissingOrInvalidMetadataError : public FlbError {
public:
    using FlbError::FlbError;
};

#endif // ERRORS_HPP
