#include "nsis_make/ExitEvaluator.hpp"
#include "nsis_make/Process.hpp"

#include <sstream>
#include <glog/logging.h>

namespace nsismake {

	//------------------------------------------------------------
	//	Ожидание завершения процесса
	//------------------------------------------------------------
	ProcessResult waitForExit(process::ChildProcess& child, std::chrono::steady_clock::time_point started) {
		ProcessResult result;

		int code = 0;
		std::uint32_t sysError = 0;
		if (child.wait(code, &sysError))
		{
			result.exitCode = code;
		}
		else
		{
			//---Ожидание прервано: процесс завершается принудительно, запуск считается неудачным
			LOG(WARNING) << "Waiting for makensis was interrupted (error " << sysError << "), destroying the process";
			child.destroy();
			result.exitCode = kInterruptedExitCode;
			result.interrupted = true;
		}

		result.elapsedMillis = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - started).count();
		return result;
	}
	//------------------------------------------------------------
	//	Оценка кода завершения
	//------------------------------------------------------------
	bool evaluate(const ProcessResult& result, const LineSink& sink, std::string* error) {
		if (result.exitCode != 0 || result.interrupted)
		{
			if (error)
			{
				std::ostringstream os;
				os << "Execution of makensis compiler failed";
				if (result.interrupted) os << " (interrupted)";
				else os << " with exit code " << result.exitCode;
				os << ". See output above for details.";
				*error = os.str();
			}
			return false;
		}

		if (sink) sink("Execution completed in " + std::to_string(result.elapsedMillis) + "ms");
		return true;
	}
}; //---namespace nsismake
