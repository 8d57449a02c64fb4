//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "tools/themebuild/usage.hpp"

#include "themebuild/version.hpp"

namespace themebuild::tools
{

void printVersion(std::ostream &os)
{
    os << "themebuild v" << THEMEBUILD_VERSION_STR << "\n";
    os << "Theme descriptor compiler\n";
}

void printUsage(std::ostream &os)
{
    os << "themebuild v" << THEMEBUILD_VERSION_STR << " - Theme descriptor compiler\n"
       << "\n"
       << "Usage: themebuild [options] <descriptor> <output-dir>\n"
       << "\n"
       << "Expands <descriptor> and stages the theme in <output-dir>:\n"
       << "  <output-dir>/<name>.ReaperTheme      merged configuration\n"
       << "  <output-dir>/<name>/rtconfig.txt     expanded descriptor\n"
       << "  <output-dir>/<name>/...              resources\n"
       << "\n"
       << "Options:\n"
       << "  -o, --overwrite                Write into an existing output directory\n"
       << "  --name NAME                    Theme name (default: output directory name)\n"
       << "  --trace                        Report every file, script and resource\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n"
       << "\n"
       << "Examples:\n"
       << "  themebuild theme/rtconfig.txt build/MyTheme\n"
       << "  themebuild -o --name MyTheme theme/rtconfig.txt out\n"
       << "\n";
}

} // namespace themebuild::tools
