#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

namespace nsismake {

	namespace fs = std::filesystem;

	struct InvocationConfig;

	//---Директивы, которые будут переданы через /X и не должны встречаться в скрипте
	struct ScriptChecks final {
		bool outFile = false;			// OutFile (задан outputFile)
		bool finalCompressor = false;	// SetCompressor (задано сжатие с /FINAL)
	};

	//---Результат предварительной проверки скрипта
	struct PreflightResult final {
		bool ok = true;
		fs::path file;
		std::size_t line = 0;			// Нумерация с 1
		std::string directive;

		std::string message() const;
	};

	//---Набор проверок для конфигурации
	ScriptChecks checksFor(const InvocationConfig& config);

	//---Совпадает ли строка скрипта с директивой (после ведущих пробелов, с учётом регистра, по границе слова)
	bool lineStartsWithDirective(const std::string& line, const std::string& directive) noexcept;

	//---Построчная проверка скрипта (UTF-8). Первое совпадение → ok = false
	//   Нечитаемый файл не считается конфликтом: ошибку выдаст makensis
	PreflightResult validateScript(const fs::path& scriptPath, const ScriptChecks& checks);

};//---namespace nsismake
