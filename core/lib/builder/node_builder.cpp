// stencil/builder/node_builder.cpp - Layout tree construction
//
#include "stencil/builder/node_builder.hpp"

#include <set>
#include <string>
#include <utility>

namespace stencil
{

namespace
{

ResolveError as_merge_failure(ResolveError error)
{
  if (error.kind == ErrorKind::MergeFailure) {
    return error;
  }
  return ResolveError::merge_failure(std::move(error));
}

}  // namespace

NodeBuilder::NodeBuilder(
  std::shared_ptr<const TypeRegistry> registry,
  std::shared_ptr<const ExpressionResolver> resolver, std::shared_ptr<TemplateLoader> loader,
  std::shared_ptr<ErrorChannel> errors)
: context_(std::make_shared<const Context>(
    Context{std::move(registry), std::move(resolver), std::move(loader), std::move(errors)}))
{
}

// ============================================================================
// Public API
// ============================================================================

ResolveResult<LayoutNodePtr> NodeBuilder::build(
  const LayoutTemplate & tmpl, const BuildOptions & options) const
{
  Construction construction;
  construction.channel = context_->errors;

  auto root = build_node(context_, tmpl, nullptr, &options, construction);
  if (!root) {
    return root;
  }

  if (auto err = finish_construction(context_, construction)) {
    return std::move(*err);
  }
  return root;
}

std::optional<ResolveError> NodeBuilder::attach_deferred_subtree(
  const LayoutNodePtr & node, const SubtreeProducer & producer,
  std::shared_ptr<ErrorChannel> channel) const
{
  if (!node || !producer) {
    return ResolveError::merge_failure(
      ResolveError::type_mismatch("deferred subtree needs a node and a producer"));
  }
  if (node->state() != NodeState::Ready) {
    return ResolveError::merge_failure(ResolveError::type_mismatch(
      "'" + node->class_name() + "' node is " + std::string(to_string(node->state())) +
      " and cannot accept a deferred subtree"));
  }

  node->set_state(NodeState::AwaitingMerge);
  Construction construction;
  construction.channel = std::move(channel);
  construction.pending.emplace_back(node, producer);
  return finish_construction(context_, construction);
}

std::optional<ResolveError> NodeBuilder::update_state(const LayoutNodePtr & node, ValueMap state) const
{
  if (auto err = node->symbols().replace_state(std::move(state))) {
    err->message = "state key '" + err->subject + "' collides with a constant";
    return err;
  }
  return refresh(*node);
}

// ============================================================================
// Construction
// ============================================================================

ResolveResult<LayoutNodePtr> NodeBuilder::build_node(
  const std::shared_ptr<const Context> & ctx, const LayoutTemplate & tmpl,
  const LayoutNodePtr & parent, const BuildOptions * root_options, Construction & construction)
{
  auto fail = [&tmpl](ResolveError error) -> ResolveResult<LayoutNodePtr> {
    error.in_template(tmpl.relative_path);
    return error;
  };

  if (tmpl.class_name.empty()) {
    return fail(ResolveError::type_mismatch("template node has no class"));
  }

  auto descriptors = ctx->registry->descriptors_for(tmpl.class_name);
  if (!descriptors) {
    return fail(std::move(descriptors).error());
  }
  auto target = ctx->registry->create_target(tmpl.class_name);
  if (!target) {
    return fail(std::move(target).error());
  }

  auto node = std::make_shared<LayoutNode>(
    tmpl.class_name, tmpl.outlet, parent, std::move(target).value(), descriptors.value(),
    ctx->resolver);

  // Constants, then state
  const ValueMap constants =
    root_options != nullptr ? merge_constants({root_options->constants, tmpl.constants})
                            : tmpl.constants;
  for (const auto & [name, value] : constants) {
    if (auto err = node->symbols().define(name, value, true)) {
      return fail(std::move(*err));
    }
  }
  if (root_options != nullptr && !root_options->state.empty()) {
    if (auto err = node->symbols().replace_state(root_options->state)) {
      err->message = "state key '" + err->subject + "' collides with a constant";
      return fail(std::move(*err));
    }
  }

  // Own properties
  std::set<std::string> seen;
  for (const auto & [name, source] : tmpl.expressions) {
    (void)source;
    if (descriptors.value()->find(name) == descriptors.value()->end()) {
      return fail(ResolveError::unknown_property(name, tmpl.class_name));
    }
    if (!seen.insert(name).second) {
      ResolveError err = ResolveError::duplicate_symbol(name);
      err.message = "property '" + name + "' is declared twice";
      err.in_property(tmpl.class_name, name);
      return fail(std::move(err));
    }
  }
  node->set_expressions(tmpl.expressions);
  if (auto err = apply_properties(*node)) {
    return fail(std::move(*err));
  }

  // Declared children, in declaration order
  for (const auto & child_tmpl : tmpl.children) {
    auto child = build_node(ctx, child_tmpl, node, nullptr, construction);
    if (!child) {
      return child;
    }
    node->attach_child(std::move(child).value());
  }

  // External subtree
  if (tmpl.has_deferred_subtree()) {
    if (!ctx->loader) {
      return fail(ResolveError::merge_failure(
        ResolveError::resource_error(tmpl.template_path, "no template loader configured")));
    }
    node->set_state(NodeState::AwaitingMerge);
    construction.pending.emplace_back(
      node, [loader = ctx->loader, path = tmpl.template_path,
             relative_to = tmpl.relative_path](TemplateCallback done) {
        loader->load(path, relative_to, std::move(done));
      });
  } else {
    node->set_state(NodeState::Ready);
  }
  return node;
}

std::optional<ResolveError> NodeBuilder::apply_properties(LayoutNode & node)
{
  // Resolve everything before touching the target
  std::vector<std::pair<const std::string *, Value>> resolved;
  resolved.reserve(node.expressions().size());
  for (const auto & [name, source] : node.expressions()) {
    (void)source;
    auto value = node.evaluate_property(name);
    if (!value) {
      return std::move(value).error();
    }
    resolved.emplace_back(&name, std::move(value).value());
  }

  for (const auto & [name, value] : resolved) {
    if (auto err = node.target().set(*name, value)) {
      err->in_property(node.class_name(), *name);
      return err;
    }
  }
  return std::nullopt;
}

// ============================================================================
// Deferred Merge
// ============================================================================

std::optional<ResolveError> NodeBuilder::finish_construction(
  const std::shared_ptr<const Context> & ctx, Construction & construction)
{
  for (auto & [node, producer] : construction.pending) {
    auto cell = DeferredMerge::create();
    producer(cell->callback());
    auto early = cell->seal(late_handler(ctx, node, construction.channel));
    if (!early) {
      continue;
    }
    if (auto err = merge_into(ctx, node, std::move(*early), construction)) {
      // Later subtrees of a failed construction are never requested
      ResolveError wrapped = as_merge_failure(std::move(*err));
      node->fail_merge(wrapped);
      return wrapped;
    }
  }
  return std::nullopt;
}

std::optional<ResolveError> NodeBuilder::merge_into(
  const std::shared_ptr<const Context> & ctx, const LayoutNodePtr & node,
  ResolveResult<LayoutTemplate> loaded, Construction & construction)
{
  if (!loaded) {
    return std::move(loaded).error();
  }
  const LayoutTemplate & tmpl = loaded.value();

  if (!tmpl.class_name.empty() && !ctx->registry->is_kind_of(node->class_name(), tmpl.class_name)) {
    ResolveError err = ResolveError::type_mismatch(
      "cannot merge a '" + tmpl.class_name + "' template into a '" + node->class_name() + "' node");
    err.in_template(tmpl.relative_path);
    return err;
  }

  // The loaded root contributes its children only; its own constants and
  // expressions are not applied to the existing node.
  Construction nested;
  nested.channel = construction.channel;
  std::vector<LayoutNodePtr> children;
  children.reserve(tmpl.children.size());
  for (const auto & child_tmpl : tmpl.children) {
    auto child = build_node(ctx, child_tmpl, node, nullptr, nested);
    if (!child) {
      return std::move(child).error();
    }
    children.push_back(std::move(child).value());
  }
  if (auto err = finish_construction(ctx, nested)) {
    return err;
  }

  node->append_merged(std::move(children));
  return std::nullopt;
}

DeferredMerge::LateHandler NodeBuilder::late_handler(
  const std::shared_ptr<const Context> & ctx, const LayoutNodePtr & node,
  std::shared_ptr<ErrorChannel> channel)
{
  std::weak_ptr<LayoutNode> weak = node;
  return [ctx, weak, channel](ResolveResult<LayoutTemplate> loaded) {
    LayoutNodePtr target = weak.lock();
    if (!target) {
      return;
    }
    Construction construction;
    construction.channel = channel;
    if (auto err = merge_into(ctx, target, std::move(loaded), construction)) {
      ResolveError wrapped = as_merge_failure(std::move(*err));
      target->fail_merge(wrapped);
      if (channel) {
        channel->report(wrapped);
      }
    }
  };
}

// ============================================================================
// State Update
// ============================================================================

std::optional<ResolveError> NodeBuilder::refresh(LayoutNode & node)
{
  std::optional<ResolveError> first;
  auto previous = node.clear_property_cache();

  for (const auto & [name, source] : node.expressions()) {
    (void)source;
    auto old = previous.find(name);
    auto value = node.evaluate_property(name);
    if (!value) {
      if (!first) first = std::move(value).error();
      if (old != previous.end()) node.restore_property(name, old->second);
      continue;
    }
    if (old != previous.end() && old->second == value.value()) {
      continue;
    }
    if (auto err = node.target().set(name, value.value())) {
      err->in_property(node.class_name(), name);
      if (!first) first = std::move(*err);
      if (old != previous.end()) node.restore_property(name, old->second);
    }
  }

  for (const auto & child : node.children()) {
    if (auto err = refresh(*child); err && !first) {
      first = std::move(err);
    }
  }
  return first;
}

}  // namespace stencil
