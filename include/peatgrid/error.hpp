#pragma once

#include <stdexcept>
#include <string>

namespace peatgrid {

    class Error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // The input layer could not be opened or parsed.
    class SourceUnavailable : public Error {
      public:
        using Error::Error;
    };

    // The output layer could not be created.
    class SinkUnavailable : public Error {
      public:
        using Error::Error;
    };

    // Undefined or unsupported reference system, or a coordinate the transform cannot handle.
    class ReprojectionFailure : public Error {
      public:
        using Error::Error;
    };

    class InvalidParameter : public Error {
      public:
        using Error::Error;
    };

} // namespace peatgrid
