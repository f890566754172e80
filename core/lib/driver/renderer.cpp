// stencil/driver/renderer.cpp - Render driver implementation
//
#include "stencil/driver/renderer.hpp"

#include <iostream>

#include "stencil/builder/error_channel.hpp"
#include "stencil/builder/node_builder.hpp"
#include "stencil/loader/file_template_loader.hpp"
#include "stencil/resolution/expression_resolver.hpp"
#include "stencil/types/type_registry.hpp"

namespace stencil
{

namespace fs = std::filesystem;

RenderResult Renderer::render_file(const fs::path & file, const RenderOptions & options)
{
  RenderResult result;

  if (!fs::exists(file)) {
    result.diagnostics.report_error(
      Location{file.string(), "", ""}, "file not found: " + file.string());
    return result;
  }

  // Project configuration: explicit, or the nearest stencil.yaml
  ProjectConfig config;
  std::optional<fs::path> config_path = options.config_path;
  if (!config_path) {
    config_path = find_project_config(fs::absolute(file).parent_path());
  }
  if (config_path) {
    if (options.verbose) {
      std::cerr << "Using config: " << config_path->string() << "\n";
    }
    auto loaded = load_project_config(*config_path);
    if (!loaded.success) {
      result.diagnostics.report_error(Location{config_path->string(), "", ""}, loaded.error);
      return result;
    }
    config = std::move(loaded.config);
  } else {
    result.diagnostics
      .report_warning(
        Location{file.string(), "", ""},
        std::string("no ") + k_project_config_file_name + " found; no target types are registered")
      .with_help("create a project file next to the template or pass --config");
  }

  render_entries(config, {fs::absolute(file)}, options, result);
  return result;
}

RenderResult Renderer::render_project(const ProjectConfig & config, const RenderOptions & options)
{
  RenderResult result;
  if (config.templates.entry_points.empty()) {
    result.diagnostics
      .report_error(
        Location{(config.project_root / k_project_config_file_name).string(), "", ""},
        "no entry points configured (templates.entry_points)")
      .with_help("list layout files under templates.entry_points, or pass a file to render");
    return result;
  }
  render_entries(config, config.templates.entry_points, options, result);
  return result;
}

void Renderer::render_entries(
  const ProjectConfig & config, const std::vector<fs::path> & entries,
  const RenderOptions & options, RenderResult & result)
{
  auto registry = std::make_shared<TypeRegistry>();
  if (auto err = register_project_types(*registry, config)) {
    err->report(result.diagnostics);
    return;
  }
  if (options.verbose) {
    std::cerr << "Registered " << registry->type_names().size() << " target types\n";
  }

  std::vector<fs::path> search_paths = options.search_paths;
  search_paths.insert(
    search_paths.end(), config.templates.search_paths.begin(), config.templates.search_paths.end());

  auto loader = std::make_shared<FileTemplateLoader>(std::move(search_paths));
  auto channel = std::make_shared<DiagnosticChannel>();
  auto resolver = std::make_shared<const ExpressionResolver>(options.evaluator);
  const NodeBuilder builder(registry, resolver, loader, channel);

  BuildOptions build_options;
  build_options.constants = config.constants;
  build_options.state = options.state;

  bool ok = true;
  for (const auto & entry : entries) {
    if (options.verbose) {
      std::cerr << "Rendering: " << entry.string() << "\n";
    }

    auto tmpl = loader->load_file(entry.string());
    if (!tmpl) {
      tmpl.error().report(result.diagnostics);
      ok = false;
      continue;
    }

    auto root = builder.build(tmpl.value(), build_options);
    if (!root) {
      root.error().report(result.diagnostics);
      ok = false;
      continue;
    }
    result.roots.push_back(std::move(root).value());
  }

  // The file loader is synchronous, so every merge has completed by now
  channel->drain_into(result.diagnostics);
  result.success = ok && !result.diagnostics.has_errors();
}

}  // namespace stencil
