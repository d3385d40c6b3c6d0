#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include "nsis_make/Platform.hpp"

namespace nsismake {

	namespace process { class ChildProcess; }

	//---Приёмник строк вывода. Вызывается в потоке обработчика, по одной строке
	using LineSink = std::function<void(const std::string&)>;

	//---Кодировка вывода makensis
	enum class OutputEncoding {
		Utf8,
		PlatformDefault				// Кодировка консоли (ANSI на Windows)
	};

	//---Кодировка, в которой makensis пишет в консоль на данной платформе
	OutputEncoding defaultOutputEncoding(OsType os) noexcept;

	//---Построчное чтение объединённого вывода процесса в отдельном потоке
	//   Ошибки чтения завершают цикл без сообщения: итог определяет код завершения процесса
	class ProcessOutputHandler final {
	public:
		ProcessOutputHandler(process::ChildProcess& child, LineSink sink, OutputEncoding encoding);
		~ProcessOutputHandler();

		ProcessOutputHandler(const ProcessOutputHandler&) = delete;
		ProcessOutputHandler& operator=(const ProcessOutputHandler&) = delete;

		//---Запуск потока чтения
		void startThread();
		//---Ожидание конца потока вывода (без ограничения по времени)
		void join();
		//---Ожидание конца потока вывода не дольше grace, затем чтение прекращается.
		//   Поток может держать открытым фоновый процесс, унаследовавший канал
		// Возвращает:
		//   true - поток вывода закрыт, прочитан целиком
		//   false - чтение остановлено по таймауту
		bool finish(std::chrono::milliseconds grace);

	private:
		void run();
		void emit(std::string line);

		process::ChildProcess& child_;
		LineSink sink_;
		OutputEncoding encoding_;
		std::thread thread_;

		std::atomic<bool> stop_{ false };
		std::mutex mutex_;
		std::condition_variable doneCv_;
		bool done_ = false;
	};

};//---namespace nsismake
