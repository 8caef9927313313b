#pragma once

namespace vmr::logging
{
    enum class LogLevel
    {
        trace = 0,
        debug = 1,
        info = 2,
        warning = 3,
        error = 4,
    };
}

