// File: tests/unit/test_diagnostics.cpp
// Purpose: Unit tests for the diagnostic engine, Expected and source tracking.
// Key invariants: Diagnostics print as "path:line:col: severity: message".
// Ownership/Lifetime: Tests own their engines and source managers.
// Links: src/support/diag_expected.cpp, src/support/diagnostics.cpp

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_location.hpp"
#include "support/source_manager.hpp"

#include <sstream>
#include <string>

using namespace tardi::support;

TEST(Diagnostics, PrintsWithoutLocation)
{
    std::ostringstream os;
    printDiag(makeError({}, "Error loading Tardi grammar"), os);
    EXPECT_EQ(os.str(), "error: Error loading Tardi grammar\n");
}

TEST(Diagnostics, PrintsFileLineAndColumn)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("samples/hello.tardi");

    std::ostringstream os;
    printDiag(makeError(SourceLoc{id, 3, 7}, "syntax error"), os, &sm);
    printDiag(makeNote(SourceLoc{id, 3, 0}, "here"), os, &sm);
    printDiag(makeNote(SourceLoc{id, 0, 0}, "file only"), os, &sm);
    EXPECT_EQ(os.str(),
              "samples/hello.tardi:3:7: error: syntax error\n"
              "samples/hello.tardi:3: note: here\n"
              "samples/hello.tardi: note: file only\n");
}

TEST(Diagnostics, UnknownFileOmitsPath)
{
    SourceManager sm;
    std::ostringstream os;
    printDiag(makeError(SourceLoc{42, 1, 1}, "lost"), os, &sm);
    EXPECT_EQ(os.str(), "error: lost\n");
}

TEST(Diagnostics, EngineCountsBySeverity)
{
    DiagnosticEngine engine;
    engine.report(makeError({}, "first"));
    engine.report(makeNote({}, "context"));
    engine.report(Diagnostic{Severity::Warning, "careful", {}});
    EXPECT_EQ(engine.errorCount(), 1u);
    EXPECT_EQ(engine.warningCount(), 1u);
    ASSERT_EQ(engine.diagnostics().size(), 3u);

    DiagnosticEngine merged;
    merged.append(engine.diagnostics());
    EXPECT_EQ(merged.errorCount(), 1u);
    EXPECT_EQ(merged.warningCount(), 1u);

    std::ostringstream os;
    merged.printAll(os);
    EXPECT_EQ(os.str(), "error: first\nnote: context\nwarning: careful\n");
}

TEST(Diagnostics, ExpectedCarriesValueOrError)
{
    Expected<int> ok(7);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 7);

    Expected<int> bad(makeError({}, "boom"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "boom");

    Expected<void> done;
    EXPECT_TRUE(done);
    Expected<void> failed(makeError({}, "nope"));
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().severity, Severity::Error);
}

TEST(SourceManager, DeduplicatesNormalizedPaths)
{
    SourceManager sm;
    const uint32_t a = sm.addFile("dir/./file.tardi");
    const uint32_t b = sm.addFile("dir/sub/../file.tardi");
    const uint32_t c = sm.addFile("other.tardi");
    EXPECT_NE(a, 0u);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(sm.getPath(a), "dir/file.tardi");
    EXPECT_EQ(sm.getPath(0), "");
    EXPECT_EQ(sm.getPath(99), "");
}

TEST(SourceLocation, PointsAreOneBased)
{
    const SourceLoc loc = locFromPoint(5, 0, 0);
    EXPECT_EQ(loc.file_id, 5u);
    EXPECT_EQ(loc.line, 1u);
    EXPECT_EQ(loc.column, 1u);
    EXPECT_TRUE(loc.isValid());
    EXPECT_FALSE(SourceLoc{}.isValid());
}
