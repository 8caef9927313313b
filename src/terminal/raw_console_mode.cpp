#include "terminal/raw_console_mode.hpp"

#include <utility>

namespace vmr::terminal
{
    RawConsoleMode::~RawConsoleMode() noexcept
    {
        restore();
    }

    RawConsoleMode::RawConsoleMode(RawConsoleMode&& other) noexcept :
        _input(std::exchange(other._input, core::HandleView{})),
        _input_mode(other._input_mode),
        _output(std::exchange(other._output, core::HandleView{})),
        _output_mode(other._output_mode),
        _input_code_page(other._input_code_page),
        _output_code_page(other._output_code_page)
    {
    }

    RawConsoleMode& RawConsoleMode::operator=(RawConsoleMode&& other) noexcept
    {
        if (this != &other)
        {
            restore();
            _input = std::exchange(other._input, core::HandleView{});
            _input_mode = other._input_mode;
            _output = std::exchange(other._output, core::HandleView{});
            _output_mode = other._output_mode;
            _input_code_page = other._input_code_page;
            _output_code_page = other._output_code_page;
        }
        return *this;
    }

    std::expected<RawConsoleMode, DWORD> RawConsoleMode::enter(const core::HandleView input, const core::HandleView output) noexcept
    {
        DWORD input_mode = 0;
        if (!input || ::GetConsoleMode(input.get(), &input_mode) == FALSE)
        {
            return std::unexpected(input ? ::GetLastError() : ERROR_INVALID_HANDLE);
        }

        if (::SetConsoleMode(input.get(), compute_raw_input_mode(input_mode)) == FALSE)
        {
            return std::unexpected(::GetLastError());
        }

        RawConsoleMode mode{};
        mode._input = input;
        mode._input_mode = input_mode;
        mode._input_code_page = ::GetConsoleCP();
        mode._output_code_page = ::GetConsoleOutputCP();
        (void)::SetConsoleCP(CP_UTF8);
        (void)::SetConsoleOutputCP(CP_UTF8);

        DWORD output_mode = 0;
        if (output && ::GetConsoleMode(output.get(), &output_mode) != FALSE)
        {
            if (::SetConsoleMode(output.get(), output_mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != FALSE)
            {
                mode._output = output;
                mode._output_mode = output_mode;
            }
        }

        return mode;
    }

    void RawConsoleMode::restore() noexcept
    {
        if (!_input)
        {
            return;
        }

        (void)::SetConsoleMode(_input.get(), _input_mode);
        if (_output)
        {
            (void)::SetConsoleMode(_output.get(), _output_mode);
        }
        if (_input_code_page != 0)
        {
            (void)::SetConsoleCP(_input_code_page);
        }
        if (_output_code_page != 0)
        {
            (void)::SetConsoleOutputCP(_output_code_page);
        }

        _input = core::HandleView{};
        _output = core::HandleView{};
    }
}
