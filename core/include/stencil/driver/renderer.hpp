// stencil/driver/renderer.hpp - Render driver
//
// Single entry point for the load / register / build pipeline.
// Used by the CLI and embeddable in other tools.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "stencil/basic/diagnostic.hpp"
#include "stencil/node/layout_node.hpp"
#include "stencil/project/project_config.hpp"
#include "stencil/resolution/expression_evaluator.hpp"
#include "stencil/types/value.hpp"

namespace stencil
{

// ============================================================================
// Render Options
// ============================================================================

struct RenderOptions
{
  /// Project configuration file (searched upward from the template otherwise)
  std::optional<std::filesystem::path> config_path;

  /// Additional template search paths (searched before the project's)
  std::vector<std::filesystem::path> search_paths;

  /// Initial root state
  ValueMap state;

  /// Evaluator for composed expressions
  std::shared_ptr<const ExpressionEvaluator> evaluator;

  /// Enable verbose output
  bool verbose = false;
};

// ============================================================================
// Render Result
// ============================================================================

struct RenderResult
{
  /// Whether every template was built without errors
  bool success = false;

  /// Collected diagnostics (including late merge failures)
  DiagnosticBag diagnostics;

  /// Built trees, one per rendered template
  std::vector<LayoutNodePtr> roots;
};

// ============================================================================
// Renderer
// ============================================================================

/**
 * Driver that orchestrates the render pipeline:
 * 1. Project configuration loading
 * 2. Type catalog registration
 * 3. Template loading
 * 4. Tree construction (including deferred merges)
 */
class Renderer
{
public:
  /**
   * Render a single template file.
   *
   * @param file Path to the JSON template
   * @param options Render options
   */
  [[nodiscard]] static RenderResult render_file(
    const std::filesystem::path & file, const RenderOptions & options);

  /**
   * Render every entry point of a project.
   *
   * @param config Project configuration (from stencil.yaml)
   * @param options Render options (config_path is ignored)
   */
  [[nodiscard]] static RenderResult render_project(
    const ProjectConfig & config, const RenderOptions & options);

private:
  static void render_entries(
    const ProjectConfig & config, const std::vector<std::filesystem::path> & entries,
    const RenderOptions & options, RenderResult & result);
};

}  // namespace stencil
