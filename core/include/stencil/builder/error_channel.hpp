// stencil/builder/error_channel.hpp - Out-of-band error reporting
//
// Deferred merge failures that complete after construction has returned
// are delivered here instead of to the construction call.
//
#pragma once

#include <mutex>

#include "stencil/basic/diagnostic.hpp"
#include "stencil/basic/error.hpp"

namespace stencil
{

/**
 * Receiver for errors that have no synchronous caller left.
 *
 * report() may be called from any thread.
 */
class ErrorChannel
{
public:
  virtual ~ErrorChannel() = default;

  virtual void report(const ResolveError & error) = 0;
};

/**
 * ErrorChannel collecting errors as diagnostics.
 */
class DiagnosticChannel : public ErrorChannel
{
public:
  DiagnosticChannel() = default;

  void report(const ResolveError & error) override;

  /// Copy of the collected diagnostics
  [[nodiscard]] DiagnosticBag snapshot() const;

  /// Move the collected diagnostics into `bag`, leaving this channel empty
  void drain_into(DiagnosticBag & bag);

  [[nodiscard]] size_t size() const;

private:
  mutable std::mutex mutex_;
  DiagnosticBag bag_;
};

}  // namespace stencil
