#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nsismake {

	namespace fs = std::filesystem;

	//---Алгоритм сжатия makensis (SetCompressor)
	enum class CompressionType {
		Zlib,						// DEFLATE (по умолчанию)
		Bzip2,						// Burrows–Wheeler
		Lzma						// Lempel–Ziv–Markov, как в 7-zip
	};

	//---Размер словаря LZMA по умолчанию (КБ)
	constexpr int kDefaultLzmaDictSize = 8;

	//---Допустимый диапазон уровня вывода makensis (/V0 - /V4)
	constexpr int kMinVerbosity = 0;
	constexpr int kMaxVerbosity = 4;

	//---Параметры сжатия
	struct CompressionSpec final {
		CompressionType type = CompressionType::Zlib;
		bool isFinal = false;		//	SetCompressor /FINAL
		bool isSolid = false;		//	SetCompressor /SOLID
		int dictSizeKb = kDefaultLzmaDictSize;	// Имеет смысл только для LZMA
	};

	//---Параметры одного запуска makensis
	struct InvocationConfig final {

		std::string makensisBin = "makensis";	// Имя или путь к makensis
		fs::path scriptFile = "setup.nsi";		// Основной скрипт

		std::optional<std::string> outputFile;	// Установщик; относительный путь → от buildDirectory
		fs::path buildDirectory;				// Каталог результатов сборки
		std::string classifier;					// Вставляется перед расширением outputFile

		std::optional<fs::path> workingFolder;	// Явный рабочий каталог (→ /NOCD)
		fs::path baseDirectory;					// Рабочий каталог по умолчанию

		int verbosity = 2;
		std::optional<CompressionSpec> compression;

		bool injectHeaderFile = true;			// Подключать headerFile через /X!include
		fs::path headerFile;

		std::map<std::string, std::string> environment;	// Переопределения окружения
		bool autoNsisDir = true;				// Определять NSISDIR автоматически
		std::optional<fs::path> nsisDir;		// Явный NSISDIR

		bool attachArtifact = true;
		bool disabled = false;
	};

	//---Итоговый путь установщика
	struct ResolvedOutputFile final {
		fs::path absolutePath;
		bool parentDirectoryEnsured = false;
	};

	//---Командная строка makensis. Порядок аргументов - контракт с компилятором
	struct Command final {
		std::vector<std::string> args;
		std::optional<ResolvedOutputFile> outputFile;	// Для передачи артефакта после сборки
	};

	//---Имя алгоритма для SetCompressor: ZLIB, BZIP2, LZMA
	const char* compressionTypeName(CompressionType type) noexcept;

	//---Разбор имени алгоритма без учёта регистра
	bool parseCompressionType(std::string value, CompressionType& out);

};//---namespace nsismake
