//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "descriptor/Content.hpp"

#include <type_traits>

namespace themebuild::descriptor
{

std::string renderSource(const Content &items)
{
    std::string out;
    for (const auto &item : items)
    {
        std::visit(
            [&out](const auto &node)
            {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, Newline>)
                    out.push_back('\n');
                else if constexpr (std::is_same_v<T, Code> || std::is_same_v<T, Comment>)
                    out.append(node.span.text);
                else if constexpr (std::is_same_v<T, Expression>)
                {
                    out.append("#{");
                    out.append(node.source);
                    out.push_back('}');
                }
                else
                    out.append(node.line.text);
            },
            item);
    }
    return out;
}

} // namespace themebuild::descriptor
