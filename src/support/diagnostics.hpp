//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares diagnostic engine for errors, warnings and notes.
// Key invariants: Counts reflect reported diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace themebuild::support
{

class SourceManager;

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional source location
    std::string code;    ///< Stable diagnostic code, e.g. "T0001"; may be empty
};

/// @brief Collects diagnostics and prints them in order.
/// @details A build records advisory warnings (resource collisions, unreadable
///          glob matches) and trace notes here; fatal problems travel back to
///          the caller through Expected instead.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    /// @param d Diagnostic to store.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param os Output stream.
    /// @param sm Optional source manager for location info.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

    /// @brief Print a one-line `N warnings, M errors` tally; prints nothing
    ///        when neither was reported.
    void printSummary(std::ostream &os) const;

    /// @brief Access every recorded diagnostic in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};
} // namespace themebuild::support
