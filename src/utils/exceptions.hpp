#pragma once

#include <stdexcept>
#include <string>

namespace gpusched {
// =============================================================================
// Base class for all scheduler-related exceptions
// =============================================================================

class GpuSchedulerException : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// =============================================================================
// Capacity and device errors
// =============================================================================

/// Thrown when no device (or the requested device) can hold a reservation
class InsufficientCapacityException : public GpuSchedulerException {
 public:
  using GpuSchedulerException::GpuSchedulerException;
};

/// Thrown when a device id is not part of the inventory
class UnknownDeviceException : public GpuSchedulerException {
 public:
  using GpuSchedulerException::GpuSchedulerException;
};

/// Thrown when the only devices able to run a job are quarantined
class DeviceUnhealthyException : public InsufficientCapacityException {
 public:
  using InsufficientCapacityException::InsufficientCapacityException;
};

/// Thrown when evicting idle models cannot free the requested VRAM
class EvictionFailedException : public GpuSchedulerException {
 public:
  using GpuSchedulerException::GpuSchedulerException;
};

/// Thrown when an operation would break the ledger accounting
class LedgerInvariantException : public GpuSchedulerException {
 public:
  using GpuSchedulerException::GpuSchedulerException;
};

// =============================================================================
// Job lifecycle errors
// =============================================================================

/// Thrown when a queued job exceeds the configured maximum wait
class QueueTimeoutException : public GpuSchedulerException {
 public:
  using GpuSchedulerException::GpuSchedulerException;
};

/// Thrown when a priority tier has reached its configured capacity
class QueueFullException : public GpuSchedulerException {
 public:
  using GpuSchedulerException::GpuSchedulerException;
};

/// Thrown when a submission is malformed
class InvalidJobException : public GpuSchedulerException {
 public:
  using GpuSchedulerException::GpuSchedulerException;
};

/// Thrown when a job id is not known to the scheduler
class UnknownJobException : public GpuSchedulerException {
 public:
  using GpuSchedulerException::GpuSchedulerException;
};

/// Thrown when a job is asked to make a transition its state forbids
class InvalidJobTransitionException : public GpuSchedulerException {
 public:
  using GpuSchedulerException::GpuSchedulerException;
};

// =============================================================================
// Startup errors
// =============================================================================

/// Thrown when the device inventory or runtime settings are unusable
class ConfigurationException : public GpuSchedulerException {
 public:
  using GpuSchedulerException::GpuSchedulerException;
};

}  // namespace gpusched
