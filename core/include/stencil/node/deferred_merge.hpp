// stencil/node/deferred_merge.hpp - Completion cell for deferred subtrees
//
// Decides, under one lock, whether a loader result is handled by the
// construction call (synchronous path) or by a late handler (asynchronous
// path).
//
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "stencil/basic/result.hpp"
#include "stencil/loader/template_loader.hpp"
#include "stencil/node/layout_template.hpp"

namespace stencil
{

/**
 * Promise-like cell receiving at most one deferred subtree result.
 *
 * While construction is live, a result is stashed for the construction
 * call. seal() ends the live window: a stashed result is handed back to
 * the caller, and any later result goes to the late handler installed by
 * seal(). Results after the first are ignored.
 */
class DeferredMerge : public std::enable_shared_from_this<DeferredMerge>
{
public:
  using LateHandler = std::function<void(ResolveResult<LayoutTemplate>)>;

  static std::shared_ptr<DeferredMerge> create();

  /// Callback for the producer; keeps the cell alive until invoked
  [[nodiscard]] TemplateCallback callback();

  /**
   * Deliver a result.
   *
   * @return false if a result was already delivered
   */
  bool complete(ResolveResult<LayoutTemplate> result);

  /**
   * End the construction window.
   *
   * @return The result delivered before this call, if any; otherwise the
   *         late handler receives the result when it arrives
   */
  [[nodiscard]] std::optional<ResolveResult<LayoutTemplate>> seal(LateHandler late_handler);

  [[nodiscard]] bool is_completed() const;

  [[nodiscard]] bool is_sealed() const;

private:
  DeferredMerge() = default;

  mutable std::mutex mutex_;
  bool construction_live_ = true;
  bool completed_ = false;
  std::optional<ResolveResult<LayoutTemplate>> early_;
  LateHandler late_handler_;
};

}  // namespace stencil
