// File: tests/unit/test_grammar_registry.cpp
// Purpose: Exercise grammar name resolution and search path handling.
// Key invariants: Earlier search directories win; builtins are listed sorted.
// Ownership/Lifetime: Temporary directories are removed by each test.
// Links: src/grammar/GrammarRegistry.cpp

#include <gtest/gtest.h>

#include "grammar/GrammarLoader.hpp"
#include "grammar/GrammarRegistry.hpp"
#include "grammar/SharedLibrary.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace tardi::grammar;
namespace fs = std::filesystem;

namespace
{

/// Scratch directory under the system temp dir, removed on destruction.
struct TempDir
{
    fs::path path;

    explicit TempDir(const std::string &leaf)
        : path(fs::temp_directory_path() / ("tardi-registry-" + leaf))
    {
        fs::remove_all(path);
        fs::create_directories(path);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    fs::path touch(const std::string &name) const
    {
        std::ofstream(path / name) << "not a library";
        return path / name;
    }
};

} // namespace

TEST(GrammarRegistry, BuiltinsIncludeTardi)
{
    const GrammarRegistry registry = GrammarRegistry::withBuiltins();
    EXPECT_TRUE(registry.findBuiltin("tardi").has_value());
    EXPECT_FALSE(registry.findBuiltin("python").has_value());
    ASSERT_EQ(registry.builtinNames().size(), 1u);
    EXPECT_EQ(registry.builtinNames()[0], "tardi");
}

TEST(GrammarRegistry, BuiltinNamesAreSorted)
{
    GrammarRegistry registry;
    registry.registerBuiltin("zeta", nullptr);
    registry.registerBuiltin("alpha", nullptr);
    registry.registerBuiltin("mid", nullptr);
    const auto names = registry.builtinNames();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "alpha");
    EXPECT_EQ(names[1], "mid");
    EXPECT_EQ(names[2], "zeta");
}

TEST(GrammarRegistry, EntrySymbolFollowsTreeSitterConvention)
{
    EXPECT_EQ(GrammarRegistry::entrySymbol("tardi"), "tree_sitter_tardi");
    EXPECT_EQ(GrammarRegistry::entrySymbol("c-sharp"), "tree_sitter_c_sharp");
}

TEST(GrammarRegistry, LibraryFileNamesInProbeOrder)
{
    const std::string suffix(SharedLibrary::suffix());
    const auto names = GrammarRegistry::libraryFileNames("tardi");
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "libtree-sitter-tardi" + suffix);
    EXPECT_EQ(names[1], "tree-sitter-tardi" + suffix);
    EXPECT_EQ(names[2], "tardi" + suffix);
}

TEST(GrammarRegistry, SearchPathListSkipsEmptyEntries)
{
    GrammarRegistry registry;
#ifdef _WIN32
    registry.addSearchPathList("a;;b;");
#else
    registry.addSearchPathList("a::b:");
#endif
    ASSERT_EQ(registry.searchPaths().size(), 2u);
    EXPECT_EQ(registry.searchPaths()[0].generic_string(), "a");
    EXPECT_EQ(registry.searchPaths()[1].generic_string(), "b");
}

TEST(GrammarRegistry, FindLibraryPrefersEarlierDirectory)
{
    const std::string suffix(SharedLibrary::suffix());
    TempDir first("first");
    TempDir second("second");
    const fs::path inSecond = second.touch("libtree-sitter-demo" + suffix);
    const fs::path inFirst = first.touch("demo" + suffix);

    GrammarRegistry registry;
    registry.addSearchPath(first.path);
    registry.addSearchPath(second.path);

    auto found = registry.findLibrary("demo");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->generic_string(), inFirst.generic_string());

    GrammarRegistry reversed;
    reversed.addSearchPath(second.path);
    reversed.addSearchPath(first.path);
    found = reversed.findLibrary("demo");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->generic_string(), inSecond.generic_string());
}

TEST(GrammarRegistry, FindLibraryIgnoresMissingDirectories)
{
    GrammarRegistry registry;
    registry.addSearchPath(fs::temp_directory_path() / "tardi-registry-does-not-exist");
    EXPECT_FALSE(registry.findLibrary("tardi").has_value());
}

TEST(GrammarRegistry, UnknownGrammarListsSearchedPaths)
{
    GrammarRegistry registry;
    registry.addSearchPath("/nonexistent/one");
    registry.addSearchPath("/nonexistent/two");

    auto language = GrammarLoader(registry).load("nosuch");
    ASSERT_FALSE(language);
    EXPECT_EQ(language.error().message,
              "no grammar named 'nosuch' (searched: /nonexistent/one, /nonexistent/two)");

    const GrammarRegistry empty;
    auto bare = GrammarLoader(empty).load("nosuch");
    ASSERT_FALSE(bare);
    EXPECT_EQ(bare.error().message, "no grammar named 'nosuch' (searched: no search paths)");
}
