//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the build
// pipeline: the Expected<void> specialisation, severity naming, diagnostic
// factories and the single printer that every tool uses to render a Diag.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.

#include "diag_expected.hpp"

namespace themebuild::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
///
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Report whether the Expected<void> represents a successful outcome.
///
/// @return True if the instance holds no diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
///
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

Diag Expected<void>::takeError()
{
    return std::move(*error_);
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg, std::string code)
{
    return Diag{Severity::Error, std::move(msg), loc, std::move(code)};
}

Diag makeWarning(SourceLoc loc, std::string msg, std::string code)
{
    return Diag{Severity::Warning, std::move(msg), loc, std::move(code)};
}

Diag makeNote(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Note, std::move(msg), loc, {}};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a valid location is available the message is prefixed with
///          "<path>:<line>:<column>:" following the common compiler
///          diagnostic style.  A diagnostic code, when present, is appended in
///          brackets after the severity.  The function always emits a trailing
///          newline so multiple diagnostics appear as a contiguous block.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param sm Optional source manager for mapping file identifiers to paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.file_id != 0)
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.line != 0)
            {
                os << ':' << diag.loc.line;
                if (diag.loc.column != 0)
                {
                    os << ':' << diag.loc.column;
                }
            }
            os << ": ";
        }
    }
    os << detail::diagSeverityToString(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';
}
} // namespace themebuild::support
