//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/themebuild/version.hpp
// Purpose: Release version reported by `themebuild --version`.
//
//===----------------------------------------------------------------------===//

#pragma once

#define THEMEBUILD_VERSION_MAJOR 0
#define THEMEBUILD_VERSION_MINOR 3
#define THEMEBUILD_VERSION_PATCH 0
#define THEMEBUILD_VERSION_STR "0.3.0"
