#include "nsis_make/Logging.hpp"

#include <filesystem>
#include <system_error>
#include <glog/logging.h>

namespace nsismake {

	namespace fs = std::filesystem;

	//---Инициализация логгера
	void initLogging(const char* programName, const std::string& logDir) {

		bool toFiles = false;
		if (!logDir.empty())
		{
			//---Создание директории для логов
			std::error_code ec;
			fs::create_directories(fs::path(logDir), ec);
			toFiles = !ec;

			if (toFiles)
			{
				const fs::path dir(logDir);
				google::SetLogFilenameExtension(".txt"); // Расширение
				google::SetLogDestination(google::GLOG_INFO, (dir / "info").string().c_str());
				google::SetLogDestination(google::GLOG_WARNING, (dir / "warning").string().c_str());
				google::SetLogDestination(google::GLOG_ERROR, (dir / "error").string().c_str());
				google::SetLogDestination(google::GLOG_FATAL, (dir / "fatal").string().c_str());
			}
		}

		//---Без каталога логов пишем только в консоль
		FLAGS_logtostderr = !toFiles;
		FLAGS_alsologtostderr = toFiles;
		FLAGS_colorlogtostderr = true;

		google::InitGoogleLogging(programName); // Инициализация

		if (!logDir.empty() && !toFiles)
			LOG(WARNING) << "Unable to create log directory " << logDir << ", logging to stderr only";
	}
}; //---namespace nsismake
