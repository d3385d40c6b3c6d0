#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "nsis_make/Invocation.hpp"
#include "nsis_make/Platform.hpp"

namespace nsismake {

	namespace fs = std::filesystem;

	struct PreflightResult;

	//---Приведение уровня вывода к диапазону [0, 4]
	constexpr int clampVerbosity(int level) noexcept {
		return level < kMinVerbosity ? kMinVerbosity : (level > kMaxVerbosity ? kMaxVerbosity : level);
	}

	//---Классификатор с ровно одним ведущим дефисом ("" для пустого)
	std::string normalizeClassifier(const std::string& classifier);

	//---Сжатие совпадает с поведением makensis по умолчанию (флаги не нужны)
	bool isDefaultCompression(const CompressionSpec& spec) noexcept;

	//--Определение пути установщика:
	//	Относительный outputFile → buildDirectory / outputFile
	//	Классификатор вставляется перед расширением имени файла
	//	Родительский каталог создаётся сразу (makensis может писать туда немедленно)
	bool resolveOutputFile(const std::string& outputFile, const fs::path& buildDirectory,
		const std::string& classifier, ResolvedOutputFile& out, std::string* error);

	//---Построение командной строки makensis
	// 
	// Порядок аргументов:
	//   makensis [/X!include hdr] [/XOutFile out] [/NOCD] /V<n>
	//            [/XSetCompressor [/FINAL] [/SOLID] ALG] [/XSetCompressorDictSize n] script
	// Возвращает:
	//   false - если скрипт не прошёл предварительную проверку
	bool buildCommand(const InvocationConfig& config, const fs::path& executable,
		const PreflightResult& preflight, const std::optional<ResolvedOutputFile>& outputFile,
		OsType os, Command& out, std::string* error);

	//---Переопределения окружения для makensis, включая NSISDIR (явный или найденный)
	std::map<std::string, std::string> buildEnvironment(const InvocationConfig& config,
		const fs::path& executable, OsType os);

};//---namespace nsismake
