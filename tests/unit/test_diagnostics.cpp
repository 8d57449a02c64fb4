// File: tests/unit/test_diagnostics.cpp
// Purpose: Check diagnostic rendering and the engine's severity bookkeeping.
// Key invariants: Locations print as `path:line:col:` only when known; the
//                 summary line is omitted for clean builds.
// Ownership/Lifetime: Engines and source managers are test locals.

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <sstream>

using namespace themebuild::support;

TEST(Diagnostics, RendersLocationAndCode)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("themes/./dusk.txt");

    std::ostringstream out;
    printDiag(makeError(SourceLoc{id, 3, 9}, "bad thing", "T1003"), out, &sm);
    EXPECT_EQ(out.str(), "themes/dusk.txt:3:9: error[T1003]: bad thing\n");

    std::ostringstream lineOnly;
    printDiag(makeWarning(SourceLoc{id, 4}, "careful"), lineOnly, &sm);
    EXPECT_EQ(lineOnly.str(), "themes/dusk.txt:4: warning: careful\n");

    std::ostringstream unknown;
    printDiag(makeNote({}, "hello"), unknown, &sm);
    EXPECT_EQ(unknown.str(), "note: hello\n");
}

TEST(Diagnostics, EngineCountsAndSummary)
{
    DiagnosticEngine diags;
    std::ostringstream clean;
    diags.report(makeNote({}, "trace"));
    diags.printSummary(clean);
    EXPECT_EQ(clean.str(), "");

    diags.report(makeWarning({}, "w1"));
    diags.report(makeWarning({}, "w2"));
    EXPECT_EQ(diags.warningCount(), 2u);
    EXPECT_EQ(diags.errorCount(), 0u);

    std::ostringstream warned;
    diags.printSummary(warned);
    EXPECT_EQ(warned.str(), "2 warnings generated.\n");

    diags.report(makeError({}, "e1"));
    std::ostringstream both;
    diags.printSummary(both);
    EXPECT_EQ(both.str(), "2 warnings, 1 error generated.\n");

    std::ostringstream all;
    diags.printAll(all);
    EXPECT_EQ(all.str(), "note: trace\nwarning: w1\nwarning: w2\nerror: e1\n");
}
