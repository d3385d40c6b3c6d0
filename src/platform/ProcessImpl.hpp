#pragma once
#include "nsis_make/Process.hpp"

namespace nsismake::process::detail {

// Платформенно-специфичная реализация процессов
// Определяется в соответствующих файлах реализации:
//   - ProcessWin.cpp для Windows
//   - ProcessPosix.cpp для Linux и macOS
    bool startPlatform(const std::vector<std::string>& command, const RunOptions& opt,
        NativeHandles& handles, RunResult& out);

    long readPlatform(NativeHandles& handles, char* buf, std::size_t size, int timeoutMs);

    void closeOutputPlatform(NativeHandles& handles) noexcept;

    bool waitPlatform(NativeHandles& handles, int& exitCode, std::uint32_t* sysError);

    void destroyPlatform(NativeHandles& handles) noexcept;

} // namespace nsismake::process::detail
