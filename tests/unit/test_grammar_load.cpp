// File: tests/unit/test_grammar_load.cpp
// Purpose: Verify the Tardi grammar loads through the tree-sitter runtime.
// Key invariants: A failed load surfaces only as "Error loading Tardi grammar";
//                 loading twice yields the same outcome.
// Ownership/Lifetime: Tests own their registries, loaders and handles.
// Links: src/grammar/GrammarLoader.cpp, src/grammar/GrammarVerifier.cpp

#include <gtest/gtest.h>

#include "tardi/grammar/Grammar.hpp"

#include <string>

using namespace tardi::grammar;

TEST(GrammarLoad, CanLoadGrammar)
{
    const GrammarRegistry registry = GrammarRegistry::withBuiltins();
    const GrammarLoader loader(registry);

    auto language = loader.load("tardi");
    if (!language)
    {
        FAIL() << loadFailureMessage("tardi") << ": " << language.error().message;
    }
    EXPECT_NE(language.value().get(), nullptr);
    EXPECT_EQ(language.value().name(), "tardi");
    EXPECT_EQ(language.value().origin(), LanguageOrigin::Builtin);
}

TEST(GrammarLoad, ParserAcceptsLoadedGrammar)
{
    const GrammarRegistry registry = GrammarRegistry::withBuiltins();
    auto language = GrammarLoader(registry).load("tardi");
    ASSERT_TRUE(language);

    Parser parser;
    EXPECT_TRUE(parser.setLanguage(language.value()));
    Tree tree = parser.parse("1 2 +");
    ASSERT_TRUE(tree);
    EXPECT_FALSE(tree.hasError());
}

TEST(GrammarLoad, LoadingTwiceIsIdempotent)
{
    const GrammarRegistry registry = GrammarRegistry::withBuiltins();
    const GrammarLoader loader(registry);

    auto first = loader.load("tardi");
    auto second = loader.load("tardi");
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value().get(), second.value().get());
    EXPECT_EQ(first.value().info(), second.value().info());
}

TEST(GrammarLoad, VerifierReportsSuccess)
{
    const GrammarRegistry registry = GrammarRegistry::withBuiltins();
    const GrammarLoader loader(registry);
    const GrammarVerifier verifier(loader);

    const VerificationReport report = verifier.verify("tardi");
    EXPECT_TRUE(report.passed());
    EXPECT_TRUE(report.loaded);
    EXPECT_TRUE(report.failureMessage.empty());
    EXPECT_TRUE(report.diagnostics.empty());
    EXPECT_EQ(report.attempts, 1u);
    EXPECT_EQ(report.displayName, "Tardi");
    ASSERT_TRUE(report.info.has_value());
    EXPECT_EQ(report.info->name, "tardi");
    EXPECT_TRUE(runtimeAbiWindow().contains(report.info->abiVersion));
    EXPECT_GT(report.info->symbolCount, 0u);
}

TEST(GrammarLoad, RepeatedVerificationAgrees)
{
    const GrammarRegistry registry = GrammarRegistry::withBuiltins();
    const GrammarLoader loader(registry);
    const GrammarVerifier verifier(loader);

    VerifyOptions options;
    options.repeat = 3;
    const VerificationReport report = verifier.verify("tardi", options);
    EXPECT_TRUE(report.passed());
    EXPECT_EQ(report.attempts, 3u);
}

TEST(GrammarLoad, FailureUsesFixedMessage)
{
    const GrammarRegistry registry; // nothing registered, no search paths
    const GrammarLoader loader(registry);
    const GrammarVerifier verifier(loader);

    const VerificationReport report = verifier.verify("tardi");
    EXPECT_FALSE(report.passed());
    EXPECT_FALSE(report.loaded);
    EXPECT_FALSE(report.info.has_value());
    EXPECT_FALSE(report.language);
    EXPECT_EQ(report.failureMessage, "Error loading Tardi grammar");

    ASSERT_EQ(report.diagnostics.size(), 2u);
    EXPECT_EQ(report.diagnostics[0].severity, tardi::support::Severity::Error);
    EXPECT_EQ(report.diagnostics[0].message, "Error loading Tardi grammar");
    EXPECT_EQ(report.diagnostics[1].severity, tardi::support::Severity::Note);
    EXPECT_NE(report.diagnostics[1].message.find("no grammar named 'tardi'"), std::string::npos);
}

TEST(GrammarLoad, FailedLoadsAreIdempotent)
{
    const GrammarRegistry registry;
    const GrammarLoader loader(registry);
    const GrammarVerifier verifier(loader);

    const VerificationReport first = verifier.verify("tardi");
    const VerificationReport second = verifier.verify("tardi");
    EXPECT_EQ(first.loaded, second.loaded);
    EXPECT_EQ(first.failureMessage, second.failureMessage);
    ASSERT_EQ(first.diagnostics.size(), second.diagnostics.size());
    for (size_t i = 0; i < first.diagnostics.size(); ++i)
        EXPECT_EQ(first.diagnostics[i].message, second.diagnostics[i].message);
}

TEST(GrammarLoad, EntryPointReturningNothingFails)
{
    GrammarRegistry registry;
    registry.registerBuiltin("empty", +[]() -> const TSLanguage * { return nullptr; });
    const GrammarLoader loader(registry);

    auto language = loader.load("empty");
    ASSERT_FALSE(language);
    EXPECT_EQ(language.error().message, "entry point 'tree_sitter_empty' returned no language");

    const VerificationReport report = GrammarVerifier(loader).verify("empty");
    EXPECT_EQ(report.failureMessage, "Error loading Empty grammar");
}

namespace
{
unsigned flakyCalls = 0;

/// Returns the Tardi language once, then nothing.
const TSLanguage *flakyEntry()
{
    if (flakyCalls++ != 0)
        return nullptr;
    auto tardi = GrammarRegistry::withBuiltins().findBuiltin("tardi");
    return tardi ? (*tardi)() : nullptr;
}
} // namespace

TEST(GrammarLoad, ChangedOutcomeBetweenAttemptsFails)
{
    flakyCalls = 0;
    GrammarRegistry registry;
    registry.registerBuiltin("flaky", &flakyEntry);
    const GrammarLoader loader(registry);
    const GrammarVerifier verifier(loader);

    VerifyOptions options;
    options.repeat = 2;
    const VerificationReport report = verifier.verify("flaky", options);
    EXPECT_TRUE(report.loaded);
    EXPECT_FALSE(report.passed());
    EXPECT_EQ(report.attempts, 2u);
    ASSERT_EQ(report.diagnostics.size(), 2u);
    EXPECT_EQ(report.diagnostics[0].severity, tardi::support::Severity::Error);
    EXPECT_EQ(report.diagnostics[0].message, "grammar load outcome changed between attempts");
    EXPECT_EQ(report.diagnostics[1].severity, tardi::support::Severity::Note);
    EXPECT_EQ(report.diagnostics[1].message,
              "attempt 2 failed: entry point 'tree_sitter_flaky' returned no language");
}

TEST(GrammarLoad, NullEntryPointFails)
{
    GrammarRegistry registry;
    registry.registerBuiltin("absent", nullptr);
    auto language = GrammarLoader(registry).load("absent");
    ASSERT_FALSE(language);
    EXPECT_EQ(language.error().message, "missing entry symbol 'tree_sitter_absent'");
}

TEST(GrammarLoad, DisplayNameCapitalisesFirstLetter)
{
    EXPECT_EQ(displayName("tardi"), "Tardi");
    EXPECT_EQ(displayName("Tardi"), "Tardi");
    EXPECT_EQ(displayName("c_sharp"), "C_sharp");
    EXPECT_EQ(displayName(""), "");
    EXPECT_EQ(loadFailureMessage("tardi"), "Error loading Tardi grammar");
}
