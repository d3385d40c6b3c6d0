#include "nsis_make/Process.hpp"
#include "platform/ProcessImpl.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace nsismake::process {

    ChildProcess::~ChildProcess()
    {
        closeOutput();
        destroy();
    }

    ChildProcess::ChildProcess(ChildProcess&& other) noexcept
        : handles_(std::exchange(other.handles_, NativeHandles{}))
    {
    }

    ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept
    {
        if (this != &other)
        {
            closeOutput();
            destroy();
            handles_ = std::exchange(other.handles_, NativeHandles{});
        }
        return *this;
    }

    long ChildProcess::read(char* buf, std::size_t size, int timeoutMs)
    {
        if (handles_.output == -1) return -1;
        return detail::readPlatform(handles_, buf, size, timeoutMs);
    }

    void ChildProcess::closeOutput() noexcept
    {
        detail::closeOutputPlatform(handles_);
    }

    bool ChildProcess::wait(int& exitCode, std::uint32_t* sysError)
    {
        if (handles_.process == -1) return false;
        return detail::waitPlatform(handles_, exitCode, sysError);
    }

    void ChildProcess::destroy() noexcept
    {
        detail::destroyPlatform(handles_);
    }

    namespace {
        char upperAscii(char c) noexcept
        {
            return (c >= 'a' && c <= 'z') ? char(c - 'a' + 'A') : c;
        }

        bool lessNoCase(const std::string& a, const std::string& b) noexcept
        {
            return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                [](char x, char y) {
                    return (unsigned char)upperAscii(x) < (unsigned char)upperAscii(y);
                });
        }
    } // namespace

    EnvironmentBlock mergeEnvironment(const std::map<std::string, std::string>& base,
        const std::map<std::string, std::string>& overrides, bool caseInsensitiveNames)
    {
        EnvironmentBlock env(base.begin(), base.end());

        for (const auto& kv : overrides)
        {
            //---Переопределение заменяет все совпадающие имена (на Windows - Path и PATH)
            env.erase(std::remove_if(env.begin(), env.end(), [&](const auto& e) {
                return caseInsensitiveNames
                    ? !lessNoCase(e.first, kv.first) && !lessNoCase(kv.first, e.first)
                    : e.first == kv.first;
            }), env.end());
            env.push_back(kv);
        }

        if (caseInsensitiveNames)
            std::stable_sort(env.begin(), env.end(), [](const auto& a, const auto& b) { return lessNoCase(a.first, b.first); });
        else
            std::sort(env.begin(), env.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
        return env;
    }

// Реализация публичной функции запуска процесса
// Проверяет аргументы и рабочий каталог, затем делегирует detail::startPlatform()
    bool start(const std::vector<std::string>& command, const RunOptions& opt,
        ChildProcess& child, RunResult& out)
    {
        out = {};
        if (command.empty() || command.front().empty())
        {
            out.sysError = (std::uint32_t)std::errc::invalid_argument;
            out.error = "empty command line";
            return false;
        }

        //---Рабочий каталог создаёт вызывающий код, здесь только проверка
        if (!opt.workingDir.empty())
        {
            std::error_code ec;
            if (!fs::is_directory(opt.workingDir, ec))
            {
                out.sysError = (std::uint32_t)std::errc::no_such_file_or_directory;
                out.error = "working directory does not exist: " + opt.workingDir.string();
                return false;
            }
        }

        child = ChildProcess{};
        return detail::startPlatform(command, opt, child.handles(), out);
    }

} // namespace nsismake::process
