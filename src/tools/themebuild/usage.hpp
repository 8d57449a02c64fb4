//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/themebuild/usage.hpp
// Purpose: Help and version text of the themebuild driver.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>

namespace themebuild::tools
{

void printUsage(std::ostream &os);

void printVersion(std::ostream &os);

} // namespace themebuild::tools
