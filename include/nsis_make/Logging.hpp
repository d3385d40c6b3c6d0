#pragma once
#include <string>

namespace nsismake {

	//---Инициализация glog: вывод в stderr, файлы логов в logDir (если задан)
	void initLogging(const char* programName, const std::string& logDir);

};//---namespace nsismake
