#if !defined(_WIN32)

#include "platform/ProcessImpl.hpp"
#include "platform/PlatformImpl.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <glog/logging.h>

namespace nsismake::process::detail {

    namespace {
        //---Время на корректное завершение после SIGTERM, затем SIGKILL
        constexpr auto kTerminateGrace = std::chrono::milliseconds(5000);

        void closeFd(int& fd) noexcept
        {
            if (fd >= 0) ::close(fd);
            fd = -1;
        }

        bool setCloexec(int fd) noexcept
        {
            const int flags = ::fcntl(fd, F_GETFD);
            return flags >= 0 && ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
        }

        //---Код завершения из статуса waitpid (сигнал → 128 + номер)
        int decodeStatus(int status) noexcept
        {
            if (WIFEXITED(status)) return WEXITSTATUS(status);
            if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
            return 1;
        }

        //---Сообщение дочернего процесса родителю через канал статуса (только async-signal-safe вызовы)
        [[noreturn]] void failChild(int statusFd, int err) noexcept
        {
            ssize_t r;
            do {
                r = ::write(statusFd, &err, sizeof(err));
            } while (r < 0 && errno == EINTR);
            _exit(127);
        }
    } // namespace

	//---Платформенно-специфичная реализация запуска процесса для POSIX
    bool startPlatform(const std::vector<std::string>& command, const RunOptions& opt,
        NativeHandles& handles, RunResult& out)
    {
        //---Всё, что требует выделения памяти, готовим до fork()
        std::vector<std::string> argvStorage(command.begin(), command.end());
        std::vector<char*> argv;
        argv.reserve(argvStorage.size() + 1);
        for (auto& s : argvStorage) argv.push_back(s.data());
        argv.push_back(nullptr);

        const EnvironmentBlock env = mergeEnvironment(platform::environment(), opt.environment, false);

        std::vector<std::string> envStorage;
        envStorage.reserve(env.size());
        for (const auto& kv : env) envStorage.push_back(kv.first + "=" + kv.second);
        std::vector<char*> envp;
        envp.reserve(envStorage.size() + 1);
        for (auto& s : envStorage) envp.push_back(s.data());
        envp.push_back(nullptr);

        const std::string cwd = opt.workingDir.string();

        //---Канал вывода и канал статуса exec (закрывается при успешном exec)
        int outPipe[2] = { -1, -1 };
        int statusPipe[2] = { -1, -1 };
        if (::pipe(outPipe) != 0 || ::pipe(statusPipe) != 0 ||
            !setCloexec(outPipe[0]) || !setCloexec(statusPipe[0]) || !setCloexec(statusPipe[1]))
        {
            out.sysError = (std::uint32_t)errno;
            out.error = std::string("pipe() failed: ") + std::strerror(errno);
            closeFd(outPipe[0]); closeFd(outPipe[1]);
            closeFd(statusPipe[0]); closeFd(statusPipe[1]);
            return false;
        }

        const int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

        pid_t pid = fork();
        if (pid < 0)
        {
            out.sysError = (std::uint32_t)errno;
            out.error = std::string("fork() failed: ") + std::strerror(errno);
            closeFd(outPipe[0]); closeFd(outPipe[1]);
            closeFd(statusPipe[0]); closeFd(statusPipe[1]);
            if (devNull >= 0) ::close(devNull);
            return false;
        }

        if (pid == 0)
        {
            //---stdout и stderr в один канал, stdin из /dev/null
            if (devNull >= 0) ::dup2(devNull, STDIN_FILENO);
            if (::dup2(outPipe[1], STDOUT_FILENO) < 0 || ::dup2(outPipe[1], STDERR_FILENO) < 0)
                failChild(statusPipe[1], errno);
            ::close(outPipe[1]);

            if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
                failChild(statusPipe[1], errno);

            ::execve(argv[0], argv.data(), envp.data());
            failChild(statusPipe[1], errno);
        }

        if (devNull >= 0) ::close(devNull);
        closeFd(outPipe[1]);
        closeFd(statusPipe[1]);

        //---Ждём закрытия канала статуса: 0 байт - exec выполнен, иначе errno ребёнка
        int childErr = 0;
        ssize_t n;
        do {
            n = ::read(statusPipe[0], &childErr, sizeof(childErr));
        } while (n < 0 && errno == EINTR);
        closeFd(statusPipe[0]);

        if (n == (ssize_t)sizeof(childErr))
        {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            closeFd(outPipe[0]);

            out.started = false;
            out.sysError = (std::uint32_t)childErr;
            out.error = "unable to execute " + command.front() + ": " + std::strerror(childErr);
            return false;
        }

        handles.process = pid;
        handles.output = outPipe[0];
        out.started = true;
        return true;
    }

    long readPlatform(NativeHandles& handles, char* buf, std::size_t size, int timeoutMs)
    {
        if (timeoutMs >= 0)
        {
            pollfd pfd{};
            pfd.fd = (int)handles.output;
            pfd.events = POLLIN;
            int r;
            do {
                r = ::poll(&pfd, 1, timeoutMs);
            } while (r < 0 && errno == EINTR);
            if (r < 0) return -1;
            if (r == 0) return kReadTimedOut;
        }

        ssize_t n;
        do {
            n = ::read((int)handles.output, buf, size);
        } while (n < 0 && errno == EINTR);
        return (long)n;
    }

    void closeOutputPlatform(NativeHandles& handles) noexcept
    {
        int fd = (int)handles.output;
        closeFd(fd);
        handles.output = -1;
    }

    bool waitPlatform(NativeHandles& handles, int& exitCode, std::uint32_t* sysError)
    {
        int status = 0;
        //---EINTR не повторяется: прерывание ожидания обрабатывает вызывающий код
        if (::waitpid((pid_t)handles.process, &status, 0) < 0)
        {
            if (sysError) *sysError = (std::uint32_t)errno;
            return false;
        }
        handles.process = -1;
        exitCode = decodeStatus(status);
        return true;
    }

    void destroyPlatform(NativeHandles& handles) noexcept
    {
        if (handles.process == -1) return;
        const pid_t pid = (pid_t)handles.process;
        handles.process = -1;

        ::kill(pid, SIGTERM);

        //---Ждём завершения, при превышении таймаута - SIGKILL
        const auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
        int status = 0;
        for (;;)
        {
            const pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid || (r < 0 && errno != EINTR)) return;
            if (std::chrono::steady_clock::now() >= deadline) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        LOG(WARNING) << "Process " << pid << " did not terminate in time, killing it";
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }

} // namespace nsismake::process::detail
#endif
