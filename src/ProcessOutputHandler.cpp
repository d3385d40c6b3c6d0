#include "nsis_make/ProcessOutputHandler.hpp"
#include "nsis_make/Process.hpp"
#include "platform/PlatformImpl.hpp"

#include <array>
#include <utility>

namespace nsismake {

	namespace {
		constexpr std::size_t kBufferSize = 1024;
		//---Период проверки запроса на остановку
		constexpr int kPollIntervalMs = 100;
	} // namespace

	OutputEncoding defaultOutputEncoding(OsType os) noexcept {
		return os == OsType::Windows ? OutputEncoding::PlatformDefault : OutputEncoding::Utf8;
	}

	ProcessOutputHandler::ProcessOutputHandler(process::ChildProcess& child, LineSink sink, OutputEncoding encoding)
		: child_(child), sink_(std::move(sink)), encoding_(encoding) {
	}

	ProcessOutputHandler::~ProcessOutputHandler() {
		stop_ = true;
		join();
	}

	void ProcessOutputHandler::startThread() {
		thread_ = std::thread(&ProcessOutputHandler::run, this);
	}

	void ProcessOutputHandler::join() {
		if (thread_.joinable()) thread_.join();
	}

	bool ProcessOutputHandler::finish(std::chrono::milliseconds grace) {
		if (!thread_.joinable()) return true;

		bool drained;
		{
			std::unique_lock<std::mutex> lock(mutex_);
			drained = doneCv_.wait_for(lock, grace, [this] { return done_; });
		}
		if (!drained) stop_ = true;
		join();
		return drained;
	}
	//------------------------------------------------------------
	//	Передача строки приёмнику (без \r, в UTF-8)
	//------------------------------------------------------------
	void ProcessOutputHandler::emit(std::string line) {
		if (!line.empty() && line.back() == '\r') line.pop_back();
		if (encoding_ == OutputEncoding::PlatformDefault) line = platform::decodeNativeText(line);
		if (sink_) sink_(line);
	}
	//------------------------------------------------------------
	//	Цикл чтения: до конца потока, ошибки или запроса остановки
	//------------------------------------------------------------
	void ProcessOutputHandler::run() {
		std::array<char, kBufferSize> buf{};
		std::string pending;

		bool eof = false;
		for (;;)
		{
			const long n = child_.read(buf.data(), buf.size(), kPollIntervalMs);
			if (n == process::kReadTimedOut)
			{
				if (stop_) break;
				continue;
			}
			if (n <= 0)
			{
				eof = true;
				break;
			}

			pending.append(buf.data(), (std::size_t)n);

			//---Отдаём все завершённые строки
			std::size_t begin = 0;
			for (std::size_t nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n', begin))
			{
				emit(pending.substr(begin, nl - begin));
				begin = nl + 1;
			}
			pending.erase(0, begin);

			if (stop_) break;
		}

		//---Последняя строка без перевода строки
		if (!pending.empty()) emit(std::move(pending));

		child_.closeOutput();

		//---Остановка по запросу не считается концом потока
		std::lock_guard<std::mutex> lock(mutex_);
		done_ = eof;
		doneCv_.notify_all();
	}
}; //---namespace nsismake
