// stencil/builder/node_builder.hpp - Layout tree construction
//
// Builds LayoutNode trees from templates, applies resolved values to target
// objects and merges deferred subtrees.
//
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "stencil/basic/result.hpp"
#include "stencil/builder/error_channel.hpp"
#include "stencil/loader/template_loader.hpp"
#include "stencil/node/deferred_merge.hpp"
#include "stencil/node/layout_node.hpp"
#include "stencil/node/layout_template.hpp"
#include "stencil/resolution/expression_resolver.hpp"
#include "stencil/types/type_registry.hpp"
#include "stencil/types/value.hpp"

namespace stencil
{

/// Produces a deferred subtree by eventually invoking the callback
using SubtreeProducer = std::function<void(TemplateCallback)>;

/**
 * Options for a construction call.
 */
struct BuildOptions
{
  /// Constants seeded on the root node (template constants win)
  ValueMap constants;

  /// Initial state of the root node
  ValueMap state;
};

/**
 * Tree construction layer.
 *
 * The only component that writes to target objects. A builder is cheap to
 * copy; it shares its registry, resolver, loader and error channel with
 * every deferred merge it schedules, so those outlive the builder itself.
 */
class NodeBuilder
{
public:
  NodeBuilder(
    std::shared_ptr<const TypeRegistry> registry,
    std::shared_ptr<const ExpressionResolver> resolver,
    std::shared_ptr<TemplateLoader> loader = nullptr,
    std::shared_ptr<ErrorChannel> errors = nullptr);

  /**
   * Build a node tree.
   *
   * Local constants, state, properties and declared children are resolved
   * first; if that fails no template is requested. External templates are
   * then requested from the loader in declaration order; a result
   * that arrives before this call returns is merged here, and a merge error
   * fails the call with MergeFailure. Results arriving later are merged
   * asynchronously and failures go to the error channel.
   */
  [[nodiscard]] ResolveResult<LayoutNodePtr> build(
    const LayoutTemplate & tmpl, const BuildOptions & options = {}) const;

  /**
   * Attach a deferred subtree to a Ready node.
   *
   * @param node Node to merge into
   * @param producer Invoked once with the completion callback
   * @param channel Receives errors of a merge completing after return
   * @return MergeFailure if the producer completed synchronously with an
   *         error, or if the node cannot accept a deferred subtree
   */
  std::optional<ResolveError> attach_deferred_subtree(
    const LayoutNodePtr & node, const SubtreeProducer & producer,
    std::shared_ptr<ErrorChannel> channel) const;

  /**
   * Replace the root state and re-resolve the subtree.
   *
   * Each property is applied all-or-nothing: a property whose new value
   * fails to resolve keeps its previous value.
   *
   * @return The first error encountered (DuplicateSymbol leaves everything unchanged)
   */
  std::optional<ResolveError> update_state(const LayoutNodePtr & node, ValueMap state) const;

  [[nodiscard]] const TypeRegistry & registry() const noexcept { return *context_->registry; }

private:
  struct Context
  {
    std::shared_ptr<const TypeRegistry> registry;
    std::shared_ptr<const ExpressionResolver> resolver;
    std::shared_ptr<TemplateLoader> loader;
    std::shared_ptr<ErrorChannel> errors;
  };

  /// Deferred subtrees found during one construction call; nothing is
  /// requested until the declared tree has been built
  struct Construction
  {
    std::vector<std::pair<LayoutNodePtr, SubtreeProducer>> pending;
    std::shared_ptr<ErrorChannel> channel;
  };

  static ResolveResult<LayoutNodePtr> build_node(
    const std::shared_ptr<const Context> & ctx, const LayoutTemplate & tmpl,
    const LayoutNodePtr & parent,
    const BuildOptions * root_options, Construction & construction);

  static std::optional<ResolveError> apply_properties(LayoutNode & node);

  static std::optional<ResolveError> merge_into(
    const std::shared_ptr<const Context> & ctx, const LayoutNodePtr & node,
    ResolveResult<LayoutTemplate> loaded, Construction & construction);

  static std::optional<ResolveError> finish_construction(
    const std::shared_ptr<const Context> & ctx, Construction & construction);

  static DeferredMerge::LateHandler late_handler(
    const std::shared_ptr<const Context> & ctx, const LayoutNodePtr & node,
    std::shared_ptr<ErrorChannel> channel);

  static std::optional<ResolveError> refresh(LayoutNode & node);

  std::shared_ptr<const Context> context_;
};

}  // namespace stencil
