#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include "nsis_make/ProcessOutputHandler.hpp"

namespace nsismake {

	namespace process { class ChildProcess; }

	//---Синтетический код завершения при прерванном ожидании
	constexpr int kInterruptedExitCode = -1;

	//---Итог выполнения makensis
	struct ProcessResult final {
		int exitCode = 0;
		std::int64_t elapsedMillis = 0;	// От начала запуска до завершения процесса
		bool interrupted = false;
	};

	//---Ожидание завершения процесса. Прерванное ожидание → процесс уничтожается,
	//   exitCode = kInterruptedExitCode
	ProcessResult waitForExit(process::ChildProcess& child, std::chrono::steady_clock::time_point started);

	//---Оценка результата
	// Возвращает:
	//   true - код 0; в sink выводится строка с временем выполнения
	//   false - иначе; error указывает на вывод makensis выше
	bool evaluate(const ProcessResult& result, const LineSink& sink, std::string* error);

};//---namespace nsismake
