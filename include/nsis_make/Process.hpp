#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace nsismake::process {

    namespace fs = std::filesystem;

    //---Результат read(): данных нет за отведённое время, поток ещё открыт
    constexpr long kReadTimedOut = -2;

    struct RunOptions final {
        fs::path workingDir;                              // Рабочий каталог (должен существовать; пустой - текущий)
        std::map<std::string, std::string> environment;   // Добавляется к окружению родителя, переопределяет совпадающие
    };

    struct RunResult final {
        bool started = false;         // Успешно ли запущен процесс
        std::uint32_t sysError = 0;   // Код системной ошибки (GetLastError() на Windows или errno на POSIX)
        std::string error;            // Описание ошибки запуска
    };

    //---Платформенные дескрипторы: pid/fd на POSIX, HANDLE на Windows. -1 - нет дескриптора
    struct NativeHandles final {
        std::intptr_t process = -1;
        std::intptr_t output = -1;    // Чтение объединённого stdout+stderr
    };

    //---Запущенный дочерний процесс. Владеет дескриптором процесса и каналом вывода
    class ChildProcess final {
    public:
        ChildProcess() = default;
        ~ChildProcess();

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;
        ChildProcess(ChildProcess&& other) noexcept;
        ChildProcess& operator=(ChildProcess&& other) noexcept;

        bool running() const noexcept { return handles_.process != -1; }

        //---Чтение из канала вывода. > 0 - прочитано байт, 0 - конец потока,
        //   kReadTimedOut - нет данных за timeoutMs (< 0 - ждать без ограничения), иначе < 0 - ошибка
        long read(char* buf, std::size_t size, int timeoutMs = -1);
        //---Закрытие канала вывода (вызывается читателем)
        void closeOutput() noexcept;

        //---Ожидание завершения. false - ожидание прервано или завершилось ошибкой
        bool wait(int& exitCode, std::uint32_t* sysError = nullptr);
        //---Принудительное завершение и освобождение дескриптора процесса
        void destroy() noexcept;

        NativeHandles& handles() noexcept { return handles_; }

    private:
        NativeHandles handles_;
    };

    using EnvironmentBlock = std::vector<std::pair<std::string, std::string>>;

    //---Окружение дочернего процесса: base, поверх него overrides, упорядочено по имени
    //   caseInsensitiveNames - правила Windows: имена совпадают без учёта регистра,
    //   сортировка тоже без учёта регистра (требование CreateProcessW)
    EnvironmentBlock mergeEnvironment(const std::map<std::string, std::string>& base,
        const std::map<std::string, std::string>& overrides, bool caseInsensitiveNames);

    //---Запускает makensis (command[0] - путь к исполняемому файлу)
    // 
    // Параметры:
    //   command - аргументы, включая исполняемый файл
    //   opt - рабочий каталог и переопределения окружения
    //   child - дескриптор запущенного процесса (при успехе)
    //   out - результат запуска
    // Возвращает:
    //   true - процесс запущен, stderr объединён с stdout
    //   false - ошибка запуска (процесс не создан)
    // Примечание:
    //   Функция не блокирующая - ожидание через ChildProcess::wait()
    bool start(const std::vector<std::string>& command, const RunOptions& opt,
        ChildProcess& child, RunResult& out);

} // namespace nsismake::process
