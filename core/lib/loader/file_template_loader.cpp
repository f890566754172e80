// stencil/loader/file_template_loader.cpp - Template loading from disk
//
#include "stencil/loader/file_template_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include "stencil/loader/template_json.hpp"

namespace stencil
{

namespace fs = std::filesystem;

FileTemplateLoader::FileTemplateLoader(std::vector<fs::path> search_paths)
: search_paths_(std::move(search_paths))
{
}

void FileTemplateLoader::load(
  const std::string & path, const std::string & relative_to, TemplateCallback callback)
{
  callback(load_file(path, relative_to));
}

ResolveResult<LayoutTemplate> FileTemplateLoader::load_file(
  const std::string & path, const std::string & relative_to) const
{
  const auto resolved = resolve_path(path, relative_to);
  if (!resolved) {
    return ResolveError::resource_error(path, "template not found: " + path);
  }

  std::ifstream file(*resolved);
  if (!file) {
    return ResolveError::resource_error(path, "cannot open template: " + resolved->string());
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();

  return parse_template(buffer.str(), resolved->string());
}

std::optional<fs::path> FileTemplateLoader::resolve_path(
  const std::string & path, const std::string & relative_to) const
{
  if (path.empty()) {
    return std::nullopt;
  }

  std::error_code ec;
  auto existing = [&ec](const fs::path & candidate) -> std::optional<fs::path> {
    if (fs::is_regular_file(candidate, ec)) {
      return fs::absolute(candidate, ec).lexically_normal();
    }
    return std::nullopt;
  };

  if (path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
    const char * home = std::getenv("HOME");
    if (home == nullptr) {
      return std::nullopt;
    }
    return existing(fs::path(home) / path.substr(path.size() > 1 ? 2 : 1));
  }

  const fs::path p(path);
  if (p.is_absolute()) {
    return existing(p);
  }

  if (!relative_to.empty()) {
    if (auto found = existing(fs::path(relative_to).parent_path() / p)) {
      return found;
    }
  }

  for (const auto & dir : search_paths_) {
    if (auto found = existing(dir / p)) {
      return found;
    }
  }

  // Finally, the working directory
  return existing(p);
}

}  // namespace stencil
