// tests/unit/types/test_type_registry.cpp - Unit tests for the target type catalog
//

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "stencil/types/type_registry.hpp"
#include "unit/test_catalog.hpp"

using namespace stencil;
using stencil::test_support::make_test_registry;

TEST(TypesRegistry, InheritedDescriptors)
{
  auto registry = make_test_registry();

  auto field = registry->descriptors_for("TextField");
  ASSERT_TRUE(field);
  const PropertyTypes & props = *field.value();
  EXPECT_NE(props.find("returnKeyType"), props.end());
  EXPECT_NE(props.find("text"), props.end());
  EXPECT_NE(props.find("alpha"), props.end());

  auto view = registry->descriptors_for("View");
  ASSERT_TRUE(view);
  EXPECT_EQ(view.value()->find("text"), view.value()->end());
}

TEST(TypesRegistry, ChildOverridesParent)
{
  TypeRegistry registry;
  ASSERT_FALSE(registry.register_type("Base", "", [] {
    PropertyTypes p;
    p["value"] = TypeDescriptor::make_integer();
    return p;
  }));
  ASSERT_FALSE(registry.register_type("Derived", "Base", [] {
    PropertyTypes p;
    p["value"] = TypeDescriptor::make_text();
    return p;
  }));

  EXPECT_EQ(registry.descriptor_for("Derived", "value").value()->kind(), DescriptorKind::Text);
  EXPECT_EQ(registry.descriptor_for("Base", "value").value()->kind(), DescriptorKind::Integer);
}

TEST(TypesRegistry, Errors)
{
  auto registry = make_test_registry();

  auto dup = registry->register_type("View", "", [] { return PropertyTypes{}; });
  ASSERT_TRUE(dup.has_value());
  EXPECT_EQ(dup->kind, ErrorKind::DuplicateSymbol);

  auto orphan = registry->register_type("Switch", "Control", [] { return PropertyTypes{}; });
  ASSERT_TRUE(orphan.has_value());
  EXPECT_EQ(orphan->kind, ErrorKind::UndefinedSymbol);
  EXPECT_FALSE(registry->has_type("Switch"));

  auto unknown_type = registry->descriptors_for("Slider");
  ASSERT_FALSE(unknown_type);
  EXPECT_EQ(unknown_type.error().kind, ErrorKind::UndefinedSymbol);

  auto unknown_prop = registry->descriptor_for("Button", "text");
  ASSERT_FALSE(unknown_prop);
  EXPECT_EQ(unknown_prop.error().kind, ErrorKind::UnknownProperty);
  EXPECT_EQ(unknown_prop.error().target_type, "Button");
}

TEST(TypesRegistry, KindOf)
{
  auto registry = make_test_registry();
  EXPECT_TRUE(registry->is_kind_of("TextField", "View"));
  EXPECT_TRUE(registry->is_kind_of("Label", "Label"));
  EXPECT_FALSE(registry->is_kind_of("Button", "Label"));
  EXPECT_FALSE(registry->is_kind_of("Slider", "View"));
  EXPECT_EQ(registry->parent_of("Label"), "View");
  EXPECT_EQ(registry->type_names().front(), "View");
}

TEST(TypesRegistry, DescriptorSetsAreCached)
{
  int calls = 0;
  TypeRegistry registry;
  ASSERT_FALSE(registry.register_type("View", "", [&calls] {
    ++calls;
    PropertyTypes p;
    p["hidden"] = TypeDescriptor::make_bool();
    return p;
  }));

  auto first = registry.descriptors_for("View");
  auto second = registry.descriptors_for("View");
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(first.value(), second.value());
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(registry.cached_count(), 1U);
}

TEST(TypesRegistry, ConcurrentFirstLookup)
{
  std::atomic<int> calls{0};
  TypeRegistry registry;
  ASSERT_FALSE(registry.register_type("View", "", [&calls] {
    ++calls;
    PropertyTypes p;
    p["hidden"] = TypeDescriptor::make_bool();
    return p;
  }));

  std::vector<PropertyTypesPtr> seen(8);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < seen.size(); ++i) {
    threads.emplace_back([&registry, &seen, i] { seen[i] = registry.descriptors_for("View").value(); });
  }
  for (auto & t : threads) {
    t.join();
  }

  EXPECT_EQ(calls.load(), 1);
  for (const auto & s : seen) {
    EXPECT_EQ(s, seen.front());
  }
}

TEST(TypesRegistry, ProvidersMayQueryTheRegistry)
{
  TypeRegistry registry;
  ASSERT_FALSE(registry.register_type("View", "", [] {
    PropertyTypes p;
    p["hidden"] = TypeDescriptor::make_bool();
    return p;
  }));
  ASSERT_FALSE(registry.register_type("Label", "View", [&registry] {
    PropertyTypes p;
    // Reuses a descriptor declared on another type
    auto hidden = registry.descriptor_for("View", "hidden");
    if (hidden && registry.has_type("Label") && registry.is_kind_of("Label", "View")) {
      p["collapsed"] = hidden.value();
    }
    return p;
  }));

  auto set = registry.descriptors_for("Label");
  ASSERT_TRUE(set) << set.error().describe();
  ASSERT_EQ(set.value()->size(), 2U);
  EXPECT_EQ(set.value()->at("collapsed"), set.value()->at("hidden"));
  EXPECT_EQ(registry.cached_count(), 2U);
}

namespace
{

class CountingTarget : public RecordingTarget
{
public:
  explicit CountingTarget(std::string type_name) : RecordingTarget(std::move(type_name)) {}
};

}  // namespace

TEST(TypesRegistry, TargetFactoryInherited)
{
  TypeRegistry registry;
  ASSERT_FALSE(registry.register_type(
    "View", "", [] { return PropertyTypes{}; },
    [](const std::string & name) { return std::make_unique<CountingTarget>(name); }));
  ASSERT_FALSE(registry.register_type("Label", "View", [] { return PropertyTypes{}; }));

  auto target = registry.create_target("Label");
  ASSERT_TRUE(target);
  EXPECT_EQ(target.value()->type_name(), "Label");
  EXPECT_NE(dynamic_cast<CountingTarget *>(target.value().get()), nullptr);

  auto fallback = make_test_registry()->create_target("Button");
  ASSERT_TRUE(fallback);
  EXPECT_NE(dynamic_cast<RecordingTarget *>(fallback.value().get()), nullptr);
}
