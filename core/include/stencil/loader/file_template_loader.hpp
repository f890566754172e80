// stencil/loader/file_template_loader.hpp - Template loading from disk
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "stencil/basic/result.hpp"
#include "stencil/loader/template_loader.hpp"

namespace stencil
{

/**
 * Synchronous loader for JSON template files.
 *
 * Path resolution order:
 * 1. `~/...` expands to the home directory
 * 2. absolute paths are used as is
 * 3. paths relative to the directory of the referencing template
 * 4. each search path, in order
 * 5. the working directory
 */
class FileTemplateLoader : public TemplateLoader
{
public:
  explicit FileTemplateLoader(std::vector<std::filesystem::path> search_paths = {});

  /// Completes before returning
  void load(const std::string & path, const std::string & relative_to, TemplateCallback callback) override;

  /// Load and parse a template file
  [[nodiscard]] ResolveResult<LayoutTemplate> load_file(
    const std::string & path, const std::string & relative_to = {}) const;

  /// Locate a template file; std::nullopt if no candidate exists
  [[nodiscard]] std::optional<std::filesystem::path> resolve_path(
    const std::string & path, const std::string & relative_to) const;

  [[nodiscard]] const std::vector<std::filesystem::path> & search_paths() const noexcept
  {
    return search_paths_;
  }

private:
  std::vector<std::filesystem::path> search_paths_;
};

}  // namespace stencil
