// stencil/node/deferred_merge.cpp - Deferred subtree completion cell
//
#include "stencil/node/deferred_merge.hpp"

#include <utility>

namespace stencil
{

std::shared_ptr<DeferredMerge> DeferredMerge::create()
{
  return std::shared_ptr<DeferredMerge>(new DeferredMerge());
}

TemplateCallback DeferredMerge::callback()
{
  auto self = shared_from_this();
  return [self](ResolveResult<LayoutTemplate> result) { self->complete(std::move(result)); };
}

bool DeferredMerge::complete(ResolveResult<LayoutTemplate> result)
{
  LateHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (completed_) {
      return false;
    }
    completed_ = true;
    if (construction_live_) {
      early_.emplace(std::move(result));
      return true;
    }
    handler = std::move(late_handler_);
  }

  if (handler) {
    handler(std::move(result));
  }
  return true;
}

std::optional<ResolveResult<LayoutTemplate>> DeferredMerge::seal(LateHandler late_handler)
{
  std::lock_guard<std::mutex> lock(mutex_);
  construction_live_ = false;
  if (early_) {
    std::optional<ResolveResult<LayoutTemplate>> out = std::move(early_);
    early_.reset();
    return out;
  }
  if (!completed_) {
    late_handler_ = std::move(late_handler);
  }
  return std::nullopt;
}

bool DeferredMerge::is_completed() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_;
}

bool DeferredMerge::is_sealed() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return !construction_live_;
}

}  // namespace stencil
