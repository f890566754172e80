// tests/unit/project/test_project_config.cpp - Unit tests for stencil.yaml handling
//
// Tests configuration parsing, constant typing and registration of the
// target type catalog.
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "stencil/project/project_config.hpp"
#include "stencil/types/type_registry.hpp"

using namespace stencil;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

const char * const k_full_config = R"(
package:
  name: inbox
  version: "1.0.0"
templates:
  entry_points: [layouts/main.json]
  search_paths: [layouts/shared, /opt/templates]
constants:
  title: Inbox
  quoted: "42"
  count: 3
  ratio: 0.5
  enabled: true
  mode: {$enum: ContentMode, $raw: 4}
  margins: {top: 4, left: 8}
  nothing: ~
types:
  Label:
    parent: View
    properties:
      text: text
      numberOfLines: int
      textAlignment:
        name: TextAlignment
        enum: {left: 0, right: 1}
  View:
    properties:
      hidden: bool
      alpha: float
      tag: int?
      insets:
        name: Insets
        fields:
          top: float
          left: float
          bottom: float?
      backgroundImage:
        object: Image
        optional: true
)";

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(ProjectConfig, ParsesSections)
{
  const auto result = parse_project_config(k_full_config, "/work/app");
  ASSERT_TRUE(result.success) << result.error;
  const ProjectConfig & config = result.config;

  EXPECT_EQ(config.package.name, "inbox");
  EXPECT_EQ(config.package.version, "1.0.0");

  ASSERT_EQ(config.templates.entry_points.size(), 1U);
  EXPECT_EQ(config.templates.entry_points[0], std::filesystem::path("/work/app/layouts/main.json"));
  ASSERT_EQ(config.templates.search_paths.size(), 2U);
  EXPECT_EQ(config.templates.search_paths[0], std::filesystem::path("/work/app/layouts/shared"));
  EXPECT_EQ(config.templates.search_paths[1], std::filesystem::path("/opt/templates"));

  ASSERT_EQ(config.types.size(), 2U);
  EXPECT_EQ(config.types[0].name, "Label");
  EXPECT_EQ(config.types[0].parent, "View");
  ASSERT_EQ(config.types[0].properties.size(), 3U);
  EXPECT_EQ(config.types[0].properties[2].kind, "enum");
  ASSERT_EQ(config.types[0].properties[2].enum_cases.size(), 2U);
  EXPECT_EQ(config.types[0].properties[2].enum_cases[1].first, "right");
  EXPECT_EQ(config.types[0].properties[2].enum_cases[1].second, 1);
}

TEST(ProjectConfig, ConstantTyping)
{
  const auto result = parse_project_config(k_full_config, "/work/app");
  ASSERT_TRUE(result.success) << result.error;
  const ValueMap & constants = result.config.constants;

  EXPECT_EQ(constants.at("title"), Value::make_string("Inbox"));
  EXPECT_EQ(constants.at("quoted"), Value::make_string("42"));
  EXPECT_EQ(constants.at("count"), Value::make_integer(3));
  EXPECT_EQ(constants.at("ratio"), Value::make_float(0.5));
  EXPECT_EQ(constants.at("enabled"), Value::make_bool(true));
  EXPECT_EQ(constants.at("mode"), Value::make_enum("ContentMode", 4));
  EXPECT_TRUE(constants.at("nothing").is_null());

  const Value & margins = constants.at("margins");
  ASSERT_TRUE(margins.is_struct());
  EXPECT_EQ(*margins.field("left"), Value::make_integer(8));
}

TEST(ProjectConfig, EmptyDocument)
{
  const auto result = parse_project_config("", "/work/app");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.types.empty());
  EXPECT_TRUE(result.config.templates.entry_points.empty());
}

TEST(ProjectConfig, Errors)
{
  auto bad_yaml = parse_project_config("types: [unclosed", "/");
  EXPECT_FALSE(bad_yaml.success);
  EXPECT_NE(bad_yaml.error.find("failed to parse YAML"), std::string::npos);

  auto bad_kind = parse_project_config("types:\n  View:\n    properties:\n      alpha: double\n", "/");
  EXPECT_FALSE(bad_kind.success);
  EXPECT_NE(bad_kind.error.find("unknown type 'double'"), std::string::npos);

  auto list_constant = parse_project_config("constants:\n  xs: [1, 2]\n", "/");
  EXPECT_FALSE(list_constant.success);

  auto bad_entries = parse_project_config("templates:\n  entry_points: main.json\n", "/");
  EXPECT_FALSE(bad_entries.success);

  auto missing = load_project_config("/nonexistent/stencil.yaml");
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("not found"), std::string::npos);
}

// ============================================================================
// Type Catalog
// ============================================================================

TEST(ProjectConfig, RegistersTypesParentFirst)
{
  const auto result = parse_project_config(k_full_config, "/work/app");
  ASSERT_TRUE(result.success) << result.error;

  TypeRegistry registry;
  auto err = register_project_types(registry, result.config);
  ASSERT_FALSE(err.has_value()) << err->describe();

  EXPECT_TRUE(registry.is_kind_of("Label", "View"));
  EXPECT_EQ(registry.type_names().front(), "View");

  auto alignment = registry.descriptor_for("Label", "textAlignment");
  ASSERT_TRUE(alignment);
  EXPECT_EQ(alignment.value()->describe(), "enum TextAlignment");
  ASSERT_NE(alignment.value()->find_case("right"), nullptr);
  EXPECT_EQ(*alignment.value()->find_case("right"), Value::make_enum("TextAlignment", 1));

  auto tag = registry.descriptor_for("Label", "tag");
  ASSERT_TRUE(tag);
  EXPECT_TRUE(tag.value()->is_optional());

  auto insets = registry.descriptor_for("View", "insets");
  ASSERT_TRUE(insets);
  EXPECT_EQ(insets.value()->describe(), "Insets");
  ASSERT_EQ(insets.value()->fields().size(), 3U);
  EXPECT_TRUE(insets.value()->fields()[2].type->is_optional());

  auto image = registry.descriptor_for("View", "backgroundImage");
  ASSERT_TRUE(image);
  EXPECT_EQ(image.value()->describe(), "object Image?");
}

TEST(ProjectConfig, EnumNameDefaultsToPropertyName)
{
  PropertySpec spec;
  spec.name = "contentMode";
  spec.kind = "enum";
  spec.enum_cases = {{"center", 4}};

  auto descriptor = make_descriptor(spec);
  ASSERT_TRUE(descriptor);
  EXPECT_EQ(descriptor.value()->name(), "contentMode");

  spec.enum_cases.emplace_back("center", 5);
  auto duplicate = make_descriptor(spec);
  ASSERT_FALSE(duplicate);
  EXPECT_EQ(duplicate.error().kind, ErrorKind::DuplicateSymbol);
}

TEST(ProjectConfig, InheritanceErrors)
{
  const auto cyclic = parse_project_config(
    "types:\n  A:\n    parent: B\n  B:\n    parent: A\n", "/");
  ASSERT_TRUE(cyclic.success) << cyclic.error;
  TypeRegistry registry;
  auto err = register_project_types(registry, cyclic.config);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, ErrorKind::UndefinedSymbol);

  const auto orphan = parse_project_config("types:\n  Label:\n    parent: View\n", "/");
  ASSERT_TRUE(orphan.success) << orphan.error;
  TypeRegistry other;
  auto orphan_err = register_project_types(other, orphan.config);
  ASSERT_TRUE(orphan_err.has_value());
  EXPECT_EQ(orphan_err->subject, "View");

  // Cases may share a raw value
  const auto shared_raw = parse_project_config(
    "types:\n  View:\n    properties:\n      mode:\n        enum: {a: 0, b: 0}\n", "/");
  ASSERT_TRUE(shared_raw.success) << shared_raw.error;
  TypeRegistry third;
  EXPECT_FALSE(register_project_types(third, shared_raw.config).has_value());
}

// ============================================================================
// File Discovery
// ============================================================================

TEST(ProjectConfig, FindsConfigUpward)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "stencil_config_test");
  const auto nested = temp_dir.path / "layouts" / "screens";
  std::filesystem::create_directories(nested);
  {
    std::ofstream f(temp_dir.path / "stencil.yaml");
    f << "package:\n  name: demo\ntemplates:\n  entry_points: [layouts/main.json]\n";
  }

  auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename().string(), k_project_config_file_name);

  auto loaded = load_project_config(*found);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.config.package.name, "demo");
  EXPECT_EQ(
    loaded.config.templates.entry_points[0],
    std::filesystem::absolute(temp_dir.path) / "layouts" / "main.json");
}
