#include "hcs/system_document.hpp"

#include "core/shell_join.hpp"
#include "core/utf8.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace vmr::hcs
{
    namespace
    {
        using Json = nlohmann::ordered_json;

        [[nodiscard]] std::string utf8(const std::wstring_view text)
        {
            return core::to_utf8(text);
        }

        [[nodiscard]] std::wstring serialize(const Json& document)
        {
            return core::from_utf8(document.dump());
        }
    }

    std::wstring join_windows_path(const std::wstring_view directory, const std::wstring_view file_name)
    {
        std::wstring path(directory);
        if (!path.empty() && path.back() != L'\\' && path.back() != L'/')
        {
            path.push_back(L'\\');
        }
        path.append(file_name);
        return path;
    }

    std::expected<std::wstring, DocumentError> build_system_document(const VmSettings& settings)
    {
        if (settings.image_dir.empty())
        {
            return std::unexpected(DocumentError{ .message = L"image directory must not be empty" });
        }

        const std::wstring kernel_args = settings.kernel_args.empty() ? std::wstring(default_kernel_command_line) : settings.kernel_args;
        const std::wstring pipe_name = settings.pipe_name.empty() ? std::format(L"\\\\.\\pipe\\{}-console", settings.id) : settings.pipe_name;

        Json document;
        document["Owner"] = "vmrunner";
        document["SchemaVersion"] = { { "Major", 2 }, { "Minor", 1 } };

        Json& vm = document["VirtualMachine"];
        vm["Chipset"]["LinuxKernelDirect"] = {
            { "KernelFilePath", utf8(join_windows_path(settings.image_dir, L"vmlinuz")) },
            { "InitRdPath", utf8(join_windows_path(settings.image_dir, L"initrd")) },
            { "KernelCmdLine", utf8(kernel_args) },
        };
        vm["ComputeTopology"]["Memory"]["SizeInMB"] = settings.memory_mb;
        vm["ComputeTopology"]["Processor"]["Count"] = settings.cpu_count;
        vm["Devices"]["Scsi"]["0"]["Attachments"]["0"] = {
            { "Type", "VirtualDisk" },
            { "Path", utf8(join_windows_path(settings.image_dir, L"rootfs.vhdx")) },
        };
        vm["Devices"]["ComPorts"]["0"]["NamedPipe"] = utf8(pipe_name);

        return serialize(document);
    }

    std::wstring build_process_parameters(const std::span<const std::wstring> args)
    {
        static const std::wstring default_shell[] = { L"/bin/sh" };
        const std::span<const std::wstring> effective = args.empty() ? std::span<const std::wstring>(default_shell) : args;

        Json parameters;
        parameters["ApplicationName"] = utf8(effective.front());
        parameters["CommandLine"] = utf8(core::shell_join(effective));
        parameters["WorkingDirectory"] = "/";
        parameters["CreateStdInPipe"] = true;
        parameters["CreateStdOutPipe"] = true;
        parameters["CreateStdErrPipe"] = true;
        parameters["EmulateConsole"] = false;
        return serialize(parameters);
    }
}
