#pragma once

namespace vmr::app
{
    // Top-level orchestration: configuration -> logging -> CLI parse ->
    // compute service binding -> subcommand dispatch. Returns the process
    // exit code.
    class Application final
    {
    public:
        [[nodiscard]] int run();
    };
}
