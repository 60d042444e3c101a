#pragma once

#include <stdexcept>
#include <string>

namespace vigil {

/** Base class for every error raised by the training engine. */
class VigilError : public std::runtime_error {
  public:
    explicit VigilError(const std::string& message) : std::runtime_error(message) {}
};

/** Invalid configuration value or network description. */
class ConfigError : public VigilError {
  public:
    explicit ConfigError(const std::string& message) : VigilError("config error: " + message) {}
};

/** Training or inference requested before `initialize_network`. */
class NotInitializedError : public VigilError {
  public:
    explicit NotInitializedError(const std::string& message)
        : VigilError("not initialized: " + message) {}
};

/** Parameter, gradient or feature shapes disagree with the network config. */
class ShapeError : public VigilError {
  public:
    explicit ShapeError(const std::string& message) : VigilError("shape error: " + message) {}
};

/** Not enough buffered experiences to form the requested batch. */
class InsufficientDataError : public VigilError {
  public:
    explicit InsufficientDataError(const std::string& message)
        : VigilError("insufficient data: " + message) {}
};

/**
 * The watchdog ran out of resets.
 *
 * Training is halted once this is raised; every later training call raises it
 * again until a checkpoint is loaded or the network is re-initialized.
 */
class ResetBudgetExceeded : public VigilError {
  public:
    explicit ResetBudgetExceeded(const std::string& message)
        : VigilError("reset budget exceeded: " + message) {}
};

/** Failure reading or writing a checkpoint file. */
class CheckpointIOError : public VigilError {
  public:
    explicit CheckpointIOError(const std::string& message)
        : VigilError("checkpoint io error: " + message) {}
};

} // namespace vigil
