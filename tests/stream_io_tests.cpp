#include "core/stream_io.hpp"

#include "console/console_pipe.hpp"
#include "core/unique_handle.hpp"
#include "core/worker_thread.hpp"
#include "test_pipes.hpp"

#include <Windows.h>

#include <array>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace
{
    using vmr::tests::PipeServer;

    [[nodiscard]] bool test_writer_detects_overlapped_handle()
    {
        auto server = PipeServer::listen(L"writer");
        if (!server)
        {
            fwprintf(stderr, L"[stream io] failed to create writer pipe (error=%lu)\n", server.error());
            return false;
        }

        vmr::core::UniqueHandle client(::CreateFileW(server->name().c_str(), GENERIC_READ, 0, nullptr, OPEN_EXISTING, 0, nullptr));
        if (!client.valid() || !server->wait_connected(5'000))
        {
            fwprintf(stderr, L"[stream io] writer pipe did not connect (error=%lu)\n", ::GetLastError());
            return false;
        }

        constexpr std::string_view payload = "hello from overlapped writer";

        // No mode hint: the first synchronous attempt fails and the writer
        // switches to overlapped I/O on its own.
        vmr::core::StreamWriter writer(server->view());
        auto written = writer.write_all(vmr::core::as_bytes(payload));
        if (!written || written.value() != payload.size())
        {
            fwprintf(stderr, L"[stream io] writer.write_all failed (error=%lu)\n", written ? 0UL : written.error());
            return false;
        }

        std::vector<char> captured(payload.size(), '\0');
        size_t total_read = 0;
        while (total_read < captured.size())
        {
            DWORD read = 0;
            if (::ReadFile(client.get(), captured.data() + total_read, static_cast<DWORD>(captured.size() - total_read), &read, nullptr) == FALSE || read == 0)
            {
                break;
            }
            total_read += static_cast<size_t>(read);
        }

        return total_read == payload.size() && std::string_view(captured.data(), captured.size()) == payload;
    }

    [[nodiscard]] bool test_overlapped_reader()
    {
        auto server = PipeServer::listen(L"reader");
        if (!server)
        {
            return false;
        }

        vmr::core::UniqueHandle client(::CreateFileW(server->name().c_str(), GENERIC_WRITE, 0, nullptr, OPEN_EXISTING, 0, nullptr));
        if (!client.valid() || !server->wait_connected(5'000))
        {
            return false;
        }

        constexpr std::string_view payload = "hello from overlapped reader";
        DWORD written = 0;
        if (::WriteFile(client.get(), payload.data(), static_cast<DWORD>(payload.size()), &written, nullptr) == FALSE)
        {
            fwprintf(stderr, L"[stream io] WriteFile failed (error=%lu)\n", ::GetLastError());
            return false;
        }

        std::vector<std::byte> captured(payload.size());
        auto reader = vmr::core::StreamReader::overlapped(server->view());

        size_t total_read = 0;
        while (total_read < captured.size())
        {
            auto read = reader.read(std::span<std::byte>(captured.data() + total_read, captured.size() - total_read));
            if (!read)
            {
                fwprintf(stderr, L"[stream io] reader.read failed (error=%lu)\n", read.error());
                return false;
            }
            if (read.value() == 0)
            {
                break;
            }
            total_read += static_cast<size_t>(read.value());
        }

        return total_read == payload.size() && std::memcmp(captured.data(), payload.data(), payload.size()) == 0;
    }

    [[nodiscard]] bool test_synchronous_pipe_end_of_stream()
    {
        HANDLE read_end = nullptr;
        HANDLE write_end = nullptr;
        if (::CreatePipe(&read_end, &write_end, nullptr, 0) == FALSE)
        {
            return false;
        }
        vmr::core::UniqueHandle reader_handle(read_end);
        vmr::core::UniqueHandle writer_handle(write_end);

        vmr::core::StreamWriter writer(writer_handle.view());
        if (!writer.write_all(vmr::core::as_bytes("abc")))
        {
            return false;
        }
        writer_handle.reset();

        vmr::core::StreamReader reader(reader_handle.view());
        std::array<std::byte, 16> buffer{};
        auto first = reader.read(buffer);
        if (!first || first.value() != 3)
        {
            return false;
        }

        // A closed anonymous pipe reports ERROR_BROKEN_PIPE, which callers
        // treat as a normal end.
        auto second = reader.read(buffer);
        return !second && vmr::core::is_end_of_stream_error(second.error());
    }

    [[nodiscard]] bool test_null_handle_is_rejected()
    {
        vmr::core::StreamReader reader;
        std::array<std::byte, 4> buffer{};
        auto read = reader.read(buffer);
        return !read && read.error() == ERROR_INVALID_HANDLE;
    }

    struct PendingRead final
    {
        vmr::core::HandleView channel;
        std::string received;
        DWORD error{ ERROR_SUCCESS };
    };

    // A read pending on the overlapped console handle must not hold up a
    // write on the same handle from another thread.
    [[nodiscard]] bool test_duplex_on_single_handle()
    {
        auto server = PipeServer::listen(L"duplex");
        if (!server)
        {
            return false;
        }

        auto client = vmr::console::open_console_pipe(server->name(), vmr::console::PipeOpenPolicy{ .timeout_ms = 2'000 });
        if (!client || !server->wait_connected(5'000))
        {
            return false;
        }

        auto pending = std::make_shared<PendingRead>();
        pending->channel = client->view();
        auto thread = vmr::core::start_thread([pending]() noexcept {
            auto reader = vmr::core::StreamReader::overlapped(pending->channel);
            std::array<std::byte, 64> buffer{};
            auto read = reader.read(buffer);
            if (!read)
            {
                pending->error = read.error();
                return;
            }
            pending->received.assign(reinterpret_cast<const char*>(buffer.data()), read.value());
        });
        if (!thread)
        {
            return false;
        }

        // Give the reader time to park in ReadFile.
        ::Sleep(50);

        auto writer = vmr::core::StreamWriter::overlapped(client->view());
        auto written = writer.write_all(vmr::core::as_bytes("ping"));
        if (!written)
        {
            fwprintf(stderr, L"[stream io] duplex write failed (error=%lu)\n", written.error());
            (void)::CancelIoEx(client->get(), nullptr);
            (void)::WaitForSingleObject(thread->get(), 5'000);
            return false;
        }

        const std::string request = vmr::tests::read_overlapped(server->view(), 4, 2'000);
        if (request != "ping" || !vmr::tests::write_overlapped(server->view(), "pong"))
        {
            (void)::CancelIoEx(client->get(), nullptr);
            (void)::WaitForSingleObject(thread->get(), 5'000);
            return false;
        }

        if (::WaitForSingleObject(thread->get(), 5'000) != WAIT_OBJECT_0)
        {
            (void)::CancelIoEx(client->get(), nullptr);
            (void)::WaitForSingleObject(thread->get(), 5'000);
            return false;
        }

        return pending->error == ERROR_SUCCESS && pending->received == "pong";
    }

    [[nodiscard]] bool test_cancel_unblocks_pending_read()
    {
        auto server = PipeServer::listen(L"cancel");
        if (!server)
        {
            return false;
        }

        auto client = vmr::console::open_console_pipe(server->name(), vmr::console::PipeOpenPolicy{ .timeout_ms = 2'000 });
        if (!client || !server->wait_connected(5'000))
        {
            return false;
        }

        auto pending = std::make_shared<PendingRead>();
        pending->channel = client->view();
        auto thread = vmr::core::start_thread([pending]() noexcept {
            auto reader = vmr::core::StreamReader::overlapped(pending->channel);
            std::array<std::byte, 16> buffer{};
            auto read = reader.read(buffer);
            pending->error = read ? ERROR_SUCCESS : read.error();
        });
        if (!thread)
        {
            return false;
        }

        ::Sleep(50);
        (void)::CancelIoEx(client->get(), nullptr);
        if (::WaitForSingleObject(thread->get(), 5'000) != WAIT_OBJECT_0)
        {
            return false;
        }

        return vmr::core::is_cancellation_error(pending->error);
    }
}

bool run_stream_io_tests()
{
    if (!test_writer_detects_overlapped_handle())
    {
        fwprintf(stderr, L"[stream io] test_writer_detects_overlapped_handle failed\n");
        return false;
    }

    if (!test_overlapped_reader())
    {
        fwprintf(stderr, L"[stream io] test_overlapped_reader failed\n");
        return false;
    }

    if (!test_synchronous_pipe_end_of_stream())
    {
        fwprintf(stderr, L"[stream io] test_synchronous_pipe_end_of_stream failed\n");
        return false;
    }

    if (!test_null_handle_is_rejected())
    {
        fwprintf(stderr, L"[stream io] test_null_handle_is_rejected failed\n");
        return false;
    }

    if (!test_duplex_on_single_handle())
    {
        fwprintf(stderr, L"[stream io] test_duplex_on_single_handle failed\n");
        return false;
    }

    if (!test_cancel_unblocks_pending_read())
    {
        fwprintf(stderr, L"[stream io] test_cancel_unblocks_pending_read failed\n");
        return false;
    }

    return true;
}
