#pragma once

#include <stdexcept>
#include <string>

namespace amtraj {

class TrajectoryError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Missing or unreadable path, failing read, corrupt compressed data.
class IOError : public TrajectoryError {
  public:
    using TrajectoryError::TrajectoryError;
};

// Content does not match the fixed-width trajectory layout.
class FormatError : public TrajectoryError {
  public:
    using TrajectoryError::TrajectoryError;
};

// Operation needs an open stream and does not reopen on its own.
class ClosedHandleError : public TrajectoryError {
  public:
    using TrajectoryError::TrajectoryError;
};

class IndexError : public TrajectoryError {
  public:
    using TrajectoryError::TrajectoryError;
};

}  // namespace amtraj
