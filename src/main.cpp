#include <iostream>
#include <memory>
#include "nsis_make/Cli.hpp"
#include "nsis_make/IArtifactSink.hpp"
#include "nsis_make/Logging.hpp"
#include "nsis_make/Make.hpp"

int main(int argc, char** argv) {

	//---Разбор аргументов командной строки
	const nsismake::CliOptions opt = nsismake::parseCli(argc, argv);

	//---Если запрошена справка или опции некорректны → вывод справки и выход
	if (opt.cmd == nsismake::CliCommand::Help || opt.cmd == nsismake::CliCommand::Invalid)
	{
		if (opt.cmd == nsismake::CliCommand::Invalid) std::cerr << "nsis-make: " << opt.invalidReason << "\n\n";
		nsismake::printHelp(std::cout);
		return (opt.cmd == nsismake::CliCommand::Invalid) ? 2 : 0;
	}

	//---Инициализация логгера
	nsismake::initLogging(argv[0], opt.logDir);

	//---Куда передаётся собранный установщик
	std::unique_ptr<nsismake::IArtifactSink> artifacts;
	if (opt.manifest.empty()) artifacts = std::make_unique<nsismake::LogArtifactSink>();
	else artifacts = std::make_unique<nsismake::ManifestArtifactSink>(opt.manifest);

	//---Запуск makensis
	return nsismake::runMake(opt.config, nsismake::hostOsType(), *artifacts);
}
