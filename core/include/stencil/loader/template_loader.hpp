// stencil/loader/template_loader.hpp - Template resource loading interface
#pragma once

#include <functional>
#include <string>

#include "stencil/basic/result.hpp"
#include "stencil/node/layout_template.hpp"

namespace stencil
{

/// Completion callback; invoked exactly once with a template or an error
using TemplateCallback = std::function<void(ResolveResult<LayoutTemplate>)>;

/**
 * Loads external templates.
 *
 * Implementations may invoke the callback before load() returns or later
 * from any thread.
 */
class TemplateLoader
{
public:
  virtual ~TemplateLoader() = default;

  /**
   * Load a template.
   *
   * @param path Path as written in the referencing template
   * @param relative_to Path of the referencing template (may be empty)
   * @param callback Completion callback
   */
  virtual void load(const std::string & path, const std::string & relative_to, TemplateCallback callback) = 0;
};

}  // namespace stencil
