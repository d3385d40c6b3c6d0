#pragma once
#include <string>
#include <iostream>
#include "nsis_make/Invocation.hpp"

namespace nsismake {

	//---Команды CLI
	enum class CliCommand {
	Help,
	Make,
	Invalid
	};

	//---Опции командной строки
	struct CliOptions final {

		//---Команда
		CliCommand cmd = CliCommand::Make;

		//---Параметры запуска makensis
		InvocationConfig config;

		std::string manifest;		//	Файл манифеста артефактов (пусто - только лог)
		std::string logDir;			//	Каталог файлов glog (пусто - только stderr)
		std::string invalidReason;	//	Причина CliCommand::Invalid
	};

	CliOptions parseCli(int argc, char** argv);
	void printHelp(std::ostream& os);

};//---namespace nsismake
