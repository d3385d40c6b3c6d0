#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "nsis_make/Platform.hpp"

namespace nsismake {

	namespace fs = std::filesystem;

	//---Элементы PATH в виде путей. Пустые элементы пропускаются, некорректные - с предупреждением
	std::vector<fs::path> splitOsPath(const std::string& osPath, OsType os);

	//---Расширения из PATHEXT без ведущих точек, в порядке перечисления
	std::vector<std::string> splitPathExtensions(const std::string& pathExt, OsType os);

	//---Расширение имени файла без точки или nullopt, если его нет
	std::optional<std::string> getExtension(const fs::path& file, OsType os);

	//--Поиск относительного имени исполняемого файла:
	//	Каталоги: текущий, затем элементы osPath по порядку
	//	Расширения (только Windows и только если у имени нет расширения): элементы pathExt,
	//	имя без расширения проверяется последним
	//	Внешний цикл - по расширениям, внутренний - по каталогам
	//	Возвращает первый существующий обычный файл (canonical) или nullopt
	std::optional<fs::path> findInOsPath(const fs::path& relativePath, OsType os,
		const std::string& osPath, const std::string& pathExt);

	//---То же, значения PATH и PATHEXT берутся из окружения текущего процесса
	std::optional<fs::path> findInOsPath(const fs::path& relativePath, OsType os);

	//--Определение пути к makensis:
	//	Абсолютный путь → должен существовать как обычный файл
	//	Относительный → поиск через findInOsPath()
	//	Пустой путь → ошибка
	fs::path resolveExecutable(const std::string& configured, OsType os, std::string* error);

	//---Поиск каталога данных NSIS (NSISDIR) рядом с makensis: каталог, содержащий Stubs
	std::optional<fs::path> findNsisDir(const fs::path& makensis, OsType os);

};//---namespace nsismake
