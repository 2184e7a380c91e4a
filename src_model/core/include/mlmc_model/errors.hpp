#pragma once

#include <stdexcept>
#include <string>

namespace mlmc::model {

/**
 * \brief Root of every exception raised by the data model library.
 *
 * Nothing in the library catches these; they propagate to the immediate caller.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed construction argument (cost, delimiter, file name, header skip).
class InvalidParameterError : public Error {
public:
    using Error::Error;
};

/// A data file could not be located, opened or read.
class DataFileError : public Error {
public:
    using Error::Error;
};

/// Table content is unusable: NaN cells, ragged rows, mismatched row counts, duplicate inputs.
class DataValidationError : public Error {
public:
    using Error::Error;
};

/// Query is not numeric at all (e.g. the text "five").
class SampleTypeError : public Error {
public:
    using Error::Error;
};

/// Query is numeric but cannot be answered.
class SampleValueError : public Error {
public:
    using Error::Error;
};

/// Query has the wrong shape (several rows, no values, wrong column count).
class SampleShapeError : public SampleValueError {
public:
    using SampleValueError::SampleValueError;
};

/// No stored input row equals the query.
class SampleNotFoundError : public SampleValueError {
public:
    using SampleValueError::SampleValueError;
};

}  // namespace mlmc::model
