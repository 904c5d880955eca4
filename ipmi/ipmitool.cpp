// SPDX-License-Identifier: Apache-2.0

#include "ipmi/ipmitool.hpp"

#include "errors/exception.hpp"
#include "util.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <phosphor-logging/log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace fan_control
{

using namespace phosphor::logging;

/* Exit status a child reports when execvp() itself failed. */
static constexpr int execFailedStatus = 127;

std::string joinCommandLine(const std::vector<std::string>& argv)
{
    std::string line;
    for (const auto& arg : argv)
    {
        if (!line.empty())
        {
            line += ' ';
        }
        line += arg;
    }
    return line;
}

std::vector<std::string>
    IpmiTool::commandLine(const std::vector<std::string>& args) const
{
    std::vector<std::string> argv;

    argv.reserve(1 + _config.interfaceArgs.size() + args.size());
    argv.emplace_back(_config.tool);
    argv.insert(argv.end(), _config.interfaceArgs.begin(),
                _config.interfaceArgs.end());
    argv.insert(argv.end(), args.begin(), args.end());

    return argv;
}

std::string IpmiTool::run(const std::vector<std::string>& argv,
                          bool mergeStderr, int* status)
{
    auto line = joinCommandLine(argv);

    log<level::DEBUG>("Running ipmitool", entry("COMMAND=%s", line.c_str()));
    if (debugEnabled)
    {
        std::cerr << "running: " << line << "\n";
    }

    /* The child must not allocate, so prepare argv up front. */
    std::vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto& arg : argv)
    {
        cargs.push_back(const_cast<char*>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0)
    {
        throw IpmiToolException(std::string("pipe failed: ") +
                                std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0)
    {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw IpmiToolException(std::string("fork failed: ") +
                                std::strerror(err));
    }

    if (pid == 0)
    {
        ::dup2(fds[1], STDOUT_FILENO);
        if (mergeStderr)
        {
            ::dup2(fds[1], STDERR_FILENO);
        }
        ::execvp(cargs[0], cargs.data());
        ::_exit(execFailedStatus);
    }

    ::close(fds[1]);

    std::string output;
    std::array<char, 256> buffer;
    for (;;)
    {
        ssize_t n = ::read(fds[0], buffer.data(), buffer.size());
        if (n == 0)
        {
            break;
        }
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            break;
        }
        output.append(buffer.data(), static_cast<size_t>(n));
    }
    ::close(fds[0]);

    int wstatus = 0;
    while (::waitpid(pid, &wstatus, 0) < 0)
    {
        if (errno != EINTR)
        {
            throw IpmiToolException(std::string("waitpid failed: ") +
                                    std::strerror(errno));
        }
    }

    *status = WIFEXITED(wstatus) ? WEXITSTATUS(wstatus) : -1;
    if (*status != 0)
    {
        log<level::ERR>("ipmitool invocation failed",
                        entry("COMMAND=%s", line.c_str()),
                        entry("STATUS=%d", *status));
    }

    return output;
}

static std::string describeStatus(int status)
{
    if (status < 0)
    {
        return "terminated by signal";
    }
    return "exit status " + std::to_string(status);
}

std::string IpmiTool::raw(const std::vector<std::string>& args)
{
    std::vector<std::string> command = {"raw", _config.oemNetFn};
    command.insert(command.end(), args.begin(), args.end());

    int status = 0;
    auto output = run(commandLine(command), true, &status);
    if (status != 0)
    {
        throw IpmiToolException(describeStatus(status) + ": " + output);
    }

    return output;
}

std::string IpmiTool::sensorList()
{
    int status = 0;
    auto output = run(commandLine({"sensor", "list"}), false, &status);
    if (status != 0)
    {
        throw IpmiToolException(describeStatus(status));
    }

    return output;
}

} // namespace fan_control
