#include <cstdio>
#include <Windows.h>

bool run_unique_handle_tests();
bool run_config_tests();
bool run_logger_tests();
bool run_fast_number_tests();
bool run_command_line_tests();
bool run_system_document_tests();
bool run_completion_waiter_tests();
bool run_compute_system_control_tests();
bool run_virtual_machine_tests();
bool run_guest_process_tests();
bool run_terminal_tests();
bool run_stream_io_tests();
bool run_console_pipe_tests();
bool run_console_command_tests();
bool run_interactive_session_tests();
bool run_console_ctrl_signal_tests();

int main()
{
    int failed = 0;
    const bool trace_enabled = ::GetEnvironmentVariableW(L"VMRUNNER_TEST_TRACE", nullptr, 0) != 0;
    const auto trace = [&](const wchar_t* name) {
        if (trace_enabled)
        {
            fwprintf(stderr, L"[TRACE] %ls\n", name);
            (void)fflush(stderr);
        }
    };

    trace(L"unique handle");
    if (!run_unique_handle_tests())
    {
        fwprintf(stderr, L"[FAIL] unique handle tests\n");
        ++failed;
    }

    trace(L"config");
    if (!run_config_tests())
    {
        fwprintf(stderr, L"[FAIL] config tests\n");
        ++failed;
    }

    trace(L"logger");
    if (!run_logger_tests())
    {
        fwprintf(stderr, L"[FAIL] logger tests\n");
        ++failed;
    }

    trace(L"fast number");
    if (!run_fast_number_tests())
    {
        fwprintf(stderr, L"[FAIL] fast number tests\n");
        ++failed;
    }

    trace(L"command line");
    if (!run_command_line_tests())
    {
        fwprintf(stderr, L"[FAIL] command line tests\n");
        ++failed;
    }

    trace(L"system document");
    if (!run_system_document_tests())
    {
        fwprintf(stderr, L"[FAIL] system document tests\n");
        ++failed;
    }

    trace(L"completion waiter");
    if (!run_completion_waiter_tests())
    {
        fwprintf(stderr, L"[FAIL] completion waiter tests\n");
        ++failed;
    }

    trace(L"compute system control");
    if (!run_compute_system_control_tests())
    {
        fwprintf(stderr, L"[FAIL] compute system control tests\n");
        ++failed;
    }

    trace(L"virtual machine");
    if (!run_virtual_machine_tests())
    {
        fwprintf(stderr, L"[FAIL] virtual machine tests\n");
        ++failed;
    }

    trace(L"guest process");
    if (!run_guest_process_tests())
    {
        fwprintf(stderr, L"[FAIL] guest process tests\n");
        ++failed;
    }

    trace(L"terminal");
    if (!run_terminal_tests())
    {
        fwprintf(stderr, L"[FAIL] terminal tests\n");
        ++failed;
    }

    trace(L"stream io");
    if (!run_stream_io_tests())
    {
        fwprintf(stderr, L"[FAIL] stream io tests\n");
        ++failed;
    }

    trace(L"console pipe");
    if (!run_console_pipe_tests())
    {
        fwprintf(stderr, L"[FAIL] console pipe tests\n");
        ++failed;
    }

    trace(L"console command");
    if (!run_console_command_tests())
    {
        fwprintf(stderr, L"[FAIL] console command tests\n");
        ++failed;
    }

    trace(L"interactive session");
    if (!run_interactive_session_tests())
    {
        fwprintf(stderr, L"[FAIL] interactive session tests\n");
        ++failed;
    }

    trace(L"console ctrl signal");
    if (!run_console_ctrl_signal_tests())
    {
        fwprintf(stderr, L"[FAIL] console ctrl signal tests\n");
        ++failed;
    }

    if (failed == 0)
    {
        fwprintf(stderr, L"[PASS] all tests\n");
        return 0;
    }

    return 1;
}
