#include <gtest/gtest.h>

#include "codegraph/module_resolver.hpp"

namespace codegraph {
namespace {

class ModuleResolverTest : public ::testing::Test {
protected:
    ModuleResolver resolver;
};

TEST_F(ModuleResolverTest, UnknownModuleIsAbsent) {
    EXPECT_FALSE(resolver.resolve("pkg.mod").has_value());
    EXPECT_FALSE(resolver.contains("pkg.mod"));
}

TEST_F(ModuleResolverTest, RegisteredModuleResolves) {
    resolver.register_module("pkg.mod", "/proj/pkg/mod.py");
    ASSERT_TRUE(resolver.resolve("pkg.mod").has_value());
    EXPECT_EQ(*resolver.resolve("pkg.mod"), "/proj/pkg/mod.py");
}

TEST_F(ModuleResolverTest, RegistrationIsIdempotent) {
    resolver.register_module("pkg.mod", "/proj/pkg/mod.py");
    resolver.register_module("pkg.mod", "/proj/pkg/mod.py");
    EXPECT_EQ(resolver.size(), 1u);
    EXPECT_EQ(*resolver.resolve("pkg.mod"), "/proj/pkg/mod.py");
}

TEST_F(ModuleResolverTest, LastRegistrationWins) {
    resolver.register_module("pkg.mod", "/old/pkg/mod.py");
    resolver.register_module("pkg.mod", "/new/pkg/mod.py");
    EXPECT_EQ(resolver.size(), 1u);
    EXPECT_EQ(*resolver.resolve("pkg.mod"), "/new/pkg/mod.py");
}

// =============================================================================
// Defining module lookup
// =============================================================================

TEST_F(ModuleResolverTest, DefiningModuleOfFunction) {
    resolver.register_module("proj.a", "/proj/a.py");
    auto module = resolver.defining_module("proj.a.f");
    ASSERT_TRUE(module.has_value());
    EXPECT_EQ(*module, "proj.a");
}

TEST_F(ModuleResolverTest, DefiningModuleOfMethodSkipsClassName) {
    resolver.register_module("proj.a", "/proj/a.py");
    resolver.register_class("proj.a.Class");
    EXPECT_EQ(*resolver.defining_module("proj.a.Class.method"), "proj.a");
    EXPECT_EQ(*resolver.resolve_symbol("proj.a.Class.method"), "/proj/a.py");
}

TEST_F(ModuleResolverTest, DefiningModuleSkipsNestedClasses) {
    resolver.register_module("proj.a", "/proj/a.py");
    resolver.register_class("proj.a.Outer");
    resolver.register_class("proj.a.Outer.Inner");
    EXPECT_EQ(*resolver.defining_module("proj.a.Outer.Inner"), "proj.a");
    EXPECT_EQ(*resolver.defining_module("proj.a.Outer.Inner.method"), "proj.a");
}

TEST_F(ModuleResolverTest, UnknownMiddleComponentDoesNotResolve) {
    resolver.register_module("proj.a", "/proj/a.py");
    EXPECT_FALSE(resolver.defining_module("proj.a.Unknown.method").has_value());
}

TEST_F(ModuleResolverTest, ImmediatePrefixWinsOverParentPackage) {
    resolver.register_module("pkg", "/proj/pkg/__init__.py");
    resolver.register_module("pkg.sub", "/proj/pkg/sub.py");
    EXPECT_EQ(*resolver.defining_module("pkg.sub.f"), "pkg.sub");
    EXPECT_EQ(*resolver.defining_module("pkg.g"), "pkg");
}

TEST_F(ModuleResolverTest, ParentPackageDoesNotCoverUnknownSubmodule) {
    resolver.register_module("pkg", "/proj/pkg/__init__.py");
    EXPECT_FALSE(resolver.defining_module("pkg.mod.f").has_value());
    EXPECT_FALSE(resolver.resolve_symbol("pkg.mod.f").has_value());

    resolver.register_module("pkg.mod", "/proj/pkg/mod.py");
    EXPECT_EQ(*resolver.resolve_symbol("pkg.mod.f"), "/proj/pkg/mod.py");
}

TEST_F(ModuleResolverTest, ModuleIsNotItsOwnDefiningModule) {
    resolver.register_module("pkg.sub", "/proj/pkg/sub.py");
    EXPECT_FALSE(resolver.defining_module("pkg.sub").has_value());
}

TEST_F(ModuleResolverTest, BareNameHasNoDefiningModule) {
    resolver.register_module("len", "/proj/len.py");
    EXPECT_FALSE(resolver.defining_module("len").has_value());
}

TEST_F(ModuleResolverTest, UnregisteredPrefixDoesNotResolve) {
    resolver.register_module("proj.a", "/proj/a.py");
    EXPECT_FALSE(resolver.defining_module("external.lib.h").has_value());
    EXPECT_FALSE(resolver.resolve_symbol("external.lib.h").has_value());
}

TEST_F(ModuleResolverTest, LeadingDotDoesNotLoop) {
    EXPECT_FALSE(resolver.defining_module(".f").has_value());
    EXPECT_FALSE(resolver.defining_module(".").has_value());
}

} // namespace
} // namespace codegraph
