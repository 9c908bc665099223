#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// A projection or training set is below the floor needed for a computation
class InsufficientDataError : public std::runtime_error {
public:
  explicit InsufficientDataError(const std::string &what)
      : std::runtime_error(what) {}
};

// A prediction was requested before any model was fit
class ModelNotReadyError : public std::runtime_error {
public:
  explicit ModelNotReadyError(const std::string &what)
      : std::runtime_error(what) {}
};

// A fit attempt failed (non-finite input, singular system, ...)
class TrainingError : public std::runtime_error {
public:
  explicit TrainingError(const std::string &what) : std::runtime_error(what) {}
};

// Raised by the readers for payloads that cannot become a TelemetrySample
class MalformedSampleError : public std::runtime_error {
public:
  explicit MalformedSampleError(const std::string &what)
      : std::runtime_error(what) {}
};

#endif // ERRORS_HPP
