#ifdef _WIN32

#include "platform/ProcessImpl.hpp"
#include "platform/PlatformImpl.hpp"
#include <windows.h>
#include <vector>
#include <glog/logging.h>

namespace nsismake::process::detail {

    namespace {
        //---Время на завершение после TerminateProcess
        constexpr DWORD kTerminateWaitMs = 5000;
        //---Интервал опроса канала вывода
        constexpr DWORD kPeekIntervalMs = 20;

        HANDLE toHandle(std::intptr_t h) noexcept { return reinterpret_cast<HANDLE>(h); }
        std::intptr_t fromHandle(HANDLE h) noexcept { return reinterpret_cast<std::intptr_t>(h); }

	    //--- Преобразование строки UTF-8 в широкую строку (UTF-16) для Windows API
        std::wstring utf8ToWide(const std::string& s)
        {
            if (s.empty()) return {};
            int n = MultiByteToWideChar(CP_UTF8, 0, s.c_str(), (int)s.size(), nullptr, 0);
            if (n == 0)
            {
                LOG(ERROR) << "Failed to get required buffer size for UTF-8 to wide conversion";
                return {};
            }
            std::wstring w((size_t)n, L'\0');
            MultiByteToWideChar(CP_UTF8, 0, s.c_str(), (int)s.size(), w.data(), n);
            return w;
        }

        //---Кавычки вокруг аргумента с пробелами. Кавычки внутри аргумента уже экранированы
        //   formatStringArgument() по правилам makensis, поэтому здесь не трогаются
        std::wstring quoteWindowsArg(std::wstring_view arg)
        {
            if (arg.empty()) return L"\"\"";

            const bool needQuotes = arg.find_first_of(L" \t") != std::wstring_view::npos;
            const bool quoted = arg.size() >= 2 && arg.front() == L'"' && arg.back() == L'"';
            if (!needQuotes || quoted) return std::wstring(arg);

            std::wstring out;
            out.reserve(arg.size() + 2);
            out.push_back(L'"');
            out.append(arg);

            //---Удваиваем слеши перед закрывающей кавычкой
            std::size_t bsCount = 0;
            for (auto it = arg.rbegin(); it != arg.rend() && *it == L'\\'; ++it) ++bsCount;
            out.append(bsCount, L'\\');

            out.push_back(L'"');
            return out;
        }
	    //---Построение командной строки для CreateProcess
        std::wstring buildCommandLine(const std::vector<std::string>& command)
        {
            std::wstring cmd;
            for (const auto& a : command)
            {
                if (!cmd.empty()) cmd.push_back(L' ');
                cmd += quoteWindowsArg(utf8ToWide(a));
            }
            return cmd;
        }

        //---Блок окружения для CREATE_UNICODE_ENVIRONMENT: "k=v\0...\0\0",
        //   имена без учёта регистра, отсортированы без учёта регистра
        std::vector<wchar_t> buildEnvironmentBlock(const std::map<std::string, std::string>& overrides)
        {
            std::vector<wchar_t> block;
            for (const auto& kv : mergeEnvironment(platform::environment(), overrides, true))
            {
                const std::wstring entry = utf8ToWide(kv.first + "=" + kv.second);
                block.insert(block.end(), entry.begin(), entry.end());
                block.push_back(L'\0');
            }
            if (block.empty()) block.push_back(L'\0');
            block.push_back(L'\0');
            return block;
        }
    } // namespace

	//---Платформенно-специфичная реализация запуска процесса для Windows
    bool startPlatform(const std::vector<std::string>& command, const RunOptions& opt,
        NativeHandles& handles, RunResult& out)
    {
        //---Анонимный канал: запись наследуется ребёнком, чтение - нет
        SECURITY_ATTRIBUTES sa{};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;

        HANDLE readPipe = nullptr;
        HANDLE writePipe = nullptr;
        if (!CreatePipe(&readPipe, &writePipe, &sa, 0) ||
            !SetHandleInformation(readPipe, HANDLE_FLAG_INHERIT, 0))
        {
            out.sysError = GetLastError();
            out.error = "CreatePipe failed";
            if (readPipe) CloseHandle(readPipe);
            if (writePipe) CloseHandle(writePipe);
            return false;
        }

        STARTUPINFOW si{};
        si.cb = sizeof(si);
        si.dwFlags = STARTF_USESTDHANDLES;
        si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
        si.hStdOutput = writePipe;                  // stdout и stderr в один канал
        si.hStdError = writePipe;

        PROCESS_INFORMATION pi{};

        const std::wstring exeW = utf8ToWide(command.front());
        std::wstring cmdLine = buildCommandLine(command);
        std::vector<wchar_t> buf(cmdLine.begin(), cmdLine.end());
        buf.push_back(L'\0');

        std::vector<wchar_t> envBlock = buildEnvironmentBlock(opt.environment);

        const std::wstring cwdW = opt.workingDir.empty() ? L"" : opt.workingDir.wstring();
        const wchar_t* cwdPtr = opt.workingDir.empty() ? nullptr : cwdW.c_str();

        //---Создание процесса
        BOOL ok = CreateProcessW(
            exeW.c_str(),          // Имя исполняемого файла
            buf.data(),            // Командная строка (mutable)
            nullptr, nullptr,      // Атрибуты безопасности
            TRUE,                  // Наследование дескрипторов канала
            CREATE_NO_WINDOW | CREATE_UNICODE_ENVIRONMENT,
            envBlock.data(),       // Объединённое окружение
            cwdPtr,                // Рабочая директория
            &si,
            &pi
        );

        //---Пишущий конец нужен только ребёнку: иначе ReadFile не получит конец потока
        CloseHandle(writePipe);

        if (!ok)
        {
            out.started = false;
            out.sysError = GetLastError();
            out.error = "CreateProcessW failed for " + command.front();
            CloseHandle(readPipe);
            LOG(ERROR) << "Failed to create process " << command.front() << " with error: " << out.sysError;
            return false;
        }

        CloseHandle(pi.hThread);
        handles.process = fromHandle(pi.hProcess);
        handles.output = fromHandle(readPipe);
        out.started = true;
        return true;
    }

    long readPlatform(NativeHandles& handles, char* buf, std::size_t size, int timeoutMs)
    {
        //---Анонимный канал не поддерживает ожидание с таймаутом: опрашиваем PeekNamedPipe
        if (timeoutMs >= 0)
        {
            const ULONGLONG deadline = GetTickCount64() + (ULONGLONG)timeoutMs;
            for (;;)
            {
                DWORD available = 0;
                if (!PeekNamedPipe(toHandle(handles.output), nullptr, 0, nullptr, &available, nullptr))
                    return GetLastError() == ERROR_BROKEN_PIPE ? 0 : -1;
                if (available > 0) break;
                if (GetTickCount64() >= deadline) return kReadTimedOut;
                Sleep(kPeekIntervalMs);
            }
        }

        DWORD n = 0;
        if (!ReadFile(toHandle(handles.output), buf, (DWORD)size, &n, nullptr))
        {
            //---Ребёнок закрыл канал - обычный конец потока
            return GetLastError() == ERROR_BROKEN_PIPE ? 0 : -1;
        }
        return (long)n;
    }

    void closeOutputPlatform(NativeHandles& handles) noexcept
    {
        if (handles.output == -1) return;
        CloseHandle(toHandle(handles.output));
        handles.output = -1;
    }

    bool waitPlatform(NativeHandles& handles, int& exitCode, std::uint32_t* sysError)
    {
        HANDLE h = toHandle(handles.process);
        if (WaitForSingleObject(h, INFINITE) != WAIT_OBJECT_0)
        {
            if (sysError) *sysError = GetLastError();
            LOG(ERROR) << "WaitForSingleObject failed with error " << GetLastError();
            return false;
        }

        DWORD code = 0;
        if (!GetExitCodeProcess(h, &code))
        {
            if (sysError) *sysError = GetLastError();
            LOG(ERROR) << "Failed to get exit code with error " << GetLastError();
            return false;
        }

        CloseHandle(h);
        handles.process = -1;
        exitCode = (int)code;
        return true;
    }

    void destroyPlatform(NativeHandles& handles) noexcept
    {
        if (handles.process == -1) return;
        HANDLE h = toHandle(handles.process);
        handles.process = -1;

        DWORD code = 0;
        if (GetExitCodeProcess(h, &code) && code == STILL_ACTIVE)
        {
            TerminateProcess(h, 1);
            WaitForSingleObject(h, kTerminateWaitMs);
        }
        CloseHandle(h);
    }

} // namespace nsismake::process::detail
#endif
