#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace vmr::core
{
    // Joins arguments with single spaces for a POSIX shell. Arguments that
    // contain a space are wrapped in double quotes; nothing else is escaped.
    [[nodiscard]] inline std::wstring shell_join(const std::span<const std::wstring> args)
    {
        std::wstring joined;
        for (size_t index = 0; index < args.size(); ++index)
        {
            const std::wstring& arg = args[index];
            if (index > 0)
            {
                joined.push_back(L' ');
            }

            if (arg.find(L' ') != std::wstring::npos)
            {
                joined.push_back(L'"');
                joined.append(arg);
                joined.push_back(L'"');
            }
            else
            {
                joined.append(arg);
            }
        }
        return joined;
    }
}
