// stencil/builder/error_channel.cpp - Diagnostic error channel
//
#include "stencil/builder/error_channel.hpp"

#include <utility>

namespace stencil
{

void DiagnosticChannel::report(const ResolveError & error)
{
  Diagnostic diag = error.to_diagnostic();
  std::lock_guard<std::mutex> lock(mutex_);
  bag_.add(std::move(diag));
}

DiagnosticBag DiagnosticChannel::snapshot() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return bag_;
}

void DiagnosticChannel::drain_into(DiagnosticBag & bag)
{
  std::lock_guard<std::mutex> lock(mutex_);
  bag.merge(std::move(bag_));
  bag_.clear();
}

size_t DiagnosticChannel::size() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return bag_.size();
}

}  // namespace stencil
