// stencil/basic/diagnostic_printer.hpp
//
// Prints diagnostics with template location and property context
// in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "stencil/basic/diagnostic.hpp"

namespace stencil
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E1003]: undefined symbol 'mode'
 *     --> layouts/main.json
 *      |
 *      = Label.textAlignment: UndefinedSymbol
 *      |
 *      = help: define 'mode' as a constant or state value
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print a single diagnostic.
  void print(const Diagnostic & diag);

  /// Print all diagnostics from a DiagnosticBag, errors first.
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label(const Label & label);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace stencil
