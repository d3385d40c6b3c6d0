#pragma once
#include <filesystem>
#include <string>
#include "nsis_make/Platform.hpp"

namespace nsismake {

	namespace fs = std::filesystem;

	//---Форматирование значения для параметра /X командной строки makensis
	// 
	// Параметры:
	//   source - исходная строка
	//   alwaysQuote - true: всегда заключать в кавычки; false: только если
	//                 строка содержит пробельные символы, ", ' или `
	//   os - платформа, определяющая представление кавычек и экранирование
	// Возвращает:
	//   Пустая строка → пара кавычек
	//   Windows: кавычка \", обратные слеши удваиваются, " → $\\\"
	//   Остальные: кавычка ", " → $\"
	std::string formatStringArgument(const std::string& source, bool alwaysQuote, OsType os);

	//---То же для пути
	std::string formatStringArgument(const fs::path& path, bool alwaysQuote, OsType os);

	//---Нужны ли кавычки для строки
	bool quotesNeeded(const std::string& source) noexcept;

};//---namespace nsismake
