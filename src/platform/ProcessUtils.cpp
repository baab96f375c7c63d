#include "ProcessUtils.hpp"

#include <plog/Log.h>

#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#endif

namespace utils
{

std::filesystem::path ProcessUtils::GetExecutablePath()
{
#ifdef _WIN32
    std::wstring buffer(MAX_PATH, L'\0');
    DWORD size = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
    if (size == 0)
    {
        PLOG_ERROR << "GetModuleFileNameW failed: " << GetLastError();
        return {};
    }

    while (size == buffer.size())
    {
        buffer.resize(buffer.size() * 2, L'\0');
        size = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (size == 0)
        {
            PLOG_ERROR << "GetModuleFileNameW failed: " << GetLastError();
            return {};
        }
    }
    buffer.resize(size);

    return std::filesystem::path(buffer);
#elif defined(__APPLE__)
    std::uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::string buffer(size, '\0');
    if (_NSGetExecutablePath(buffer.data(), &size) != 0)
    {
        PLOG_ERROR << "_NSGetExecutablePath failed";
        return {};
    }
    buffer.resize(std::strlen(buffer.c_str()));

    std::error_code ec;
    auto exePath = std::filesystem::canonical(buffer, ec);
    if (ec)
    {
        PLOG_ERROR << "Failed to resolve " << buffer << ": " << ec.message();
        return {};
    }
    return exePath;
#else
    std::error_code ec;
    auto exePath = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec)
    {
        PLOG_ERROR << "Failed to read /proc/self/exe: " << ec.message();
        return {};
    }
    return exePath;
#endif
}

std::filesystem::path ProcessUtils::FindInPath(const std::string& program)
{
    if (program.find('/') != std::string::npos || program.find('\\') != std::string::npos)
        return std::filesystem::exists(program) ? std::filesystem::path(program) : std::filesystem::path();

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return {};

#ifdef _WIN32
    const char separator = ';';
    const std::vector<std::string> suffixes = { ".exe", ".cmd", ".bat", "" };
#else
    const char separator = ':';
    const std::vector<std::string> suffixes = { "" };
#endif

    std::string paths(path_env);
    std::size_t start = 0;
    while (start <= paths.size())
    {
        std::size_t end = paths.find(separator, start);
        if (end == std::string::npos)
            end = paths.size();

        std::filesystem::path dir = paths.substr(start, end - start);
        if (dir.empty())
            dir = ".";
        for (const auto& suffix : suffixes)
        {
            std::filesystem::path candidate = dir / (program + suffix);
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec))
            {
#ifndef _WIN32
                if (access(candidate.c_str(), X_OK) != 0)
                    continue;
#endif
                return candidate;
            }
        }
        start = end + 1;
    }
    return {};
}

std::string ProcessUtils::QuoteWindowsArgument(const std::string& arg)
{
    std::string quoted = "\"";
    std::size_t backslashes = 0;
    for (char c : arg)
    {
        if (c == '\\')
        {
            ++backslashes;
            continue;
        }
        if (c == '"')
        {
            quoted.append(backslashes * 2 + 1, '\\');
        }
        else
        {
            quoted.append(backslashes, '\\');
        }
        backslashes = 0;
        quoted += c;
    }
    quoted.append(backslashes * 2, '\\');
    quoted += '"';
    return quoted;
}

CommandResult ProcessUtils::Run(const std::vector<std::string>& args, bool mergeStderr)
{
    CommandResult result;
    if (args.empty())
        return result;

    const std::filesystem::path exePath = FindInPath(args.front());
    if (exePath.empty())
    {
        PLOG_DEBUG << "Executable not found on PATH: " << args.front();
        return result;
    }

#ifdef _WIN32
    SECURITY_ATTRIBUTES sa = { sizeof(sa), nullptr, TRUE };
    HANDLE hStdoutRead = nullptr;
    HANDLE hStdoutWrite = nullptr;
    if (!CreatePipe(&hStdoutRead, &hStdoutWrite, &sa, 0))
    {
        PLOG_ERROR << "CreatePipe failed: " << GetLastError();
        return result;
    }
    SetHandleInformation(hStdoutRead, HANDLE_FLAG_INHERIT, 0);

    HANDLE hNul = CreateFileA("NUL", GENERIC_WRITE, FILE_SHARE_WRITE, &sa, OPEN_EXISTING, 0, nullptr);

    std::string cmdLine = QuoteWindowsArgument(exePath.string());
    for (std::size_t i = 1; i < args.size(); ++i)
    {
        cmdLine += " " + QuoteWindowsArgument(args[i]);
    }

    STARTUPINFOA si = { sizeof(si) };
    PROCESS_INFORMATION pi = {};
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = hStdoutWrite;
    si.hStdError = mergeStderr ? hStdoutWrite : hNul;

    if (!CreateProcessA(nullptr, const_cast<char*>(cmdLine.c_str()), nullptr, nullptr, TRUE, CREATE_NO_WINDOW,
                        nullptr, nullptr, &si, &pi))
    {
        PLOG_ERROR << "CreateProcessA failed: " << GetLastError();
        CloseHandle(hStdoutRead);
        CloseHandle(hStdoutWrite);
        if (hNul != INVALID_HANDLE_VALUE)
            CloseHandle(hNul);
        return result;
    }
    CloseHandle(hStdoutWrite);
    if (hNul != INVALID_HANDLE_VALUE)
        CloseHandle(hNul);

    char buffer[4096];
    DWORD bytesRead = 0;
    while (ReadFile(hStdoutRead, buffer, sizeof(buffer), &bytesRead, nullptr) && bytesRead > 0)
    {
        result.output.append(buffer, bytesRead);
    }
    CloseHandle(hStdoutRead);

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD exitCode = 1;
    GetExitCodeProcess(pi.hProcess, &exitCode);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);

    result.launched = true;
    result.exit_code = static_cast<int>(exitCode);
    return result;
#else
    int pipefd[2];
    if (pipe(pipefd) == -1)
    {
        PLOG_ERROR << "pipe() failed: " << strerror(errno);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        PLOG_ERROR << "fork() failed: " << strerror(errno);
        close(pipefd[0]);
        close(pipefd[1]);
        return result;
    }

    if (pid == 0)
    {
        // Child process
        close(pipefd[0]);
        dup2(pipefd[1], STDOUT_FILENO);
        if (mergeStderr)
        {
            dup2(pipefd[1], STDERR_FILENO);
        }
        else
        {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0)
            {
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
        }
        close(pipefd[1]);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(exePath.c_str()));
        for (std::size_t i = 1; i < args.size(); ++i)
        {
            argv.push_back(const_cast<char*>(args[i].c_str()));
        }
        argv.push_back(nullptr);

        execv(exePath.c_str(), argv.data());
        _exit(127);
    }

    // Parent process
    close(pipefd[1]);

    char buffer[4096];
    while (true)
    {
        ssize_t n = read(pipefd[0], buffer, sizeof(buffer));
        if (n > 0)
        {
            result.output.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        break;
    }
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            PLOG_ERROR << "waitpid() failed: " << strerror(errno);
            return result;
        }
    }

    result.launched = true;
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return result;
#endif
}

} // namespace utils
