/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     A theme build keeps going after advisory problems, so warnings and trace
 *     notes accumulate here and are only rendered once the build has finished
 *     or failed.  Rendering goes through printDiag so queued diagnostics and
 *     the fatal Diag returned by the build share one format.
 */

#include "diagnostics.hpp"
#include "diag_expected.hpp"
#include "source_manager.hpp"

#include <utility>

namespace themebuild::support
{
namespace
{
void printCount(std::ostream &os, size_t n, const char *noun)
{
    os << n << ' ' << noun;
    if (n != 1)
        os << 's';
}
} // namespace

void DiagnosticEngine::report(Diagnostic d)
{
    switch (d.severity)
    {
        case Severity::Error:
            ++errors_;
            break;
        case Severity::Warning:
            ++warnings_;
            break;
        case Severity::Note:
            break;
    }
    diags_.push_back(std::move(d));
}

/// @brief Render every queued diagnostic in report order.
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const Diagnostic &d : diags_)
        printDiag(d, os, sm);
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

void DiagnosticEngine::printSummary(std::ostream &os) const
{
    if (warnings_ == 0 && errors_ == 0)
        return;
    printCount(os, warnings_, "warning");
    if (errors_ != 0)
    {
        os << ", ";
        printCount(os, errors_, "error");
    }
    os << " generated.\n";
}
} // namespace themebuild::support
