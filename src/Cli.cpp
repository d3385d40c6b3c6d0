#include "nsis_make/Cli.hpp"
#include <charconv>
#include <filesystem>
#include <initializer_list>
#include <iomanip>
#include <string_view>
#include <system_error>
#include <vector>

namespace nsismake {

	namespace fs = std::filesystem;

	//------------------------------------------------------------
	//	Значение аргумента вида key=value. Парные кавычки вокруг значения снимаются
	//------------------------------------------------------------
	static bool valueOf(std::string_view arg, std::string_view key, std::string& value) {
		if (arg.size() <= key.size() || arg[key.size()] != '=' || arg.compare(0, key.size(), key) != 0)
			return false;

		std::string_view v = arg.substr(key.size() + 1);
		if (v.size() >= 2 && v.front() == v.back() && (v.front() == '"' || v.front() == '\''))
			v = v.substr(1, v.size() - 2);

		value.assign(v.data(), v.size());
		return true;
	}
	//------------------------------------------------------------
	//	Все значения ключа (для повторяемых опций)
	//------------------------------------------------------------
	static std::vector<std::string> getAllKv(int argc, char** argv, const std::string& key) {
		std::vector<std::string> values;
		std::string v;
		for (int i = 1; i < argc; i++)
		{
			if (valueOf(argv[i], key, v)) values.push_back(v);
		}
		return values;
	}
	//------------------------------------------------------------
	//	Получение значения ключа из аргументов командной строки (первое вхождение)
	//------------------------------------------------------------
	static std::string getKv(int argc, char** argv, const std::string& key) {
		const std::vector<std::string> values = getAllKv(argc, argv, key);
		return values.empty() ? std::string{} : values.front();
	}
	//------------------------------------------------------------
	//	Проверка наличия флага в аргументах командной строки
	//------------------------------------------------------------
	static bool hasFlag(int argc, char** argv, std::string_view flag) {
		for (int i = 1; i < argc; i++)
		{
			if (argv[i] == flag) return true;
		}
		return false;
	}
	//------------------------------------------------------------
	//	Разбор целого числа
	//------------------------------------------------------------
	static bool parseInt(const std::string& v, int& out) {
		const char* first = v.data();
		const char* last = v.data() + v.size();
		auto [ptr, ec] = std::from_chars(first, last, out);
		return ec == std::errc() && ptr == last;
	}
	//------------------------------------------------------------
	//	Относительный путь → от базового каталога
	//------------------------------------------------------------
	static fs::path resolveAgainst(const fs::path& base, const std::string& v) {
		fs::path p(v);
		if (p.is_relative()) p = base / p;
		return p.lexically_normal();
	}
	//------------------------------------------------------------
	//	Ошибка разбора → Invalid
	//------------------------------------------------------------
	static CliOptions invalid(CliOptions o, const std::string& reason) {
		o.cmd = CliCommand::Invalid;
		o.invalidReason = reason;
		return o;
	}
	//------------------------------------------------------------
	//---Парсинг опций командной строки
	//------------------------------------------------------------
	CliOptions parseCli(int argc, char** argv) {

		//---Результирующие опции
		CliOptions o;
		InvocationConfig& c = o.config;

		if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h"))
		{
			o.cmd = CliCommand::Help;
			return o;
		}

		//---Базовый каталог проекта
		{
			const std::string base = getKv(argc, argv, "--base-dir");
			std::error_code ec;
			c.baseDirectory = base.empty() ? fs::current_path(ec) : fs::absolute(fs::path(base), ec);
			if (ec) return invalid(o, "unable to resolve the base directory: " + ec.message());
			c.baseDirectory = c.baseDirectory.lexically_normal();
		}

		//---makensis и скрипт
		const std::string bin = getKv(argc, argv, "--makensis");
		if (!bin.empty()) c.makensisBin = bin;

		const std::string script = getKv(argc, argv, "--script");
		c.scriptFile = resolveAgainst(c.baseDirectory, script.empty() ? "setup.nsi" : script);

		//---Результат
		const std::string buildDir = getKv(argc, argv, "--build-dir");
		c.buildDirectory = resolveAgainst(c.baseDirectory, buildDir.empty() ? "target" : buildDir);

		const std::string output = getKv(argc, argv, "--output");
		if (!output.empty()) c.outputFile = output;
		c.classifier = getKv(argc, argv, "--classifier");

		const std::string workDir = getKv(argc, argv, "--working-dir");
		if (!workDir.empty()) c.workingFolder = resolveAgainst(c.baseDirectory, workDir);

		//---Уровень вывода (вне диапазона - приводится при построении команды)
		const std::string verbosity = getKv(argc, argv, "--verbosity");
		if (!verbosity.empty() && !parseInt(verbosity, c.verbosity))
			return invalid(o, "invalid --verbosity value: " + verbosity);

		//---Сжатие
		const std::string compression = getKv(argc, argv, "--compression");
		const bool isFinal = hasFlag(argc, argv, "--compression-final");
		const bool isSolid = hasFlag(argc, argv, "--compression-solid");
		const std::string dictSize = getKv(argc, argv, "--dict-size");
		if (!compression.empty() || isFinal || isSolid || !dictSize.empty())
		{
			CompressionSpec spec;
			if (!compression.empty() && !parseCompressionType(compression, spec.type))
				return invalid(o, "invalid --compression value: " + compression);
			spec.isFinal = isFinal;
			spec.isSolid = isSolid;
			if (!dictSize.empty() && (!parseInt(dictSize, spec.dictSizeKb) || spec.dictSizeKb <= 0))
				return invalid(o, "invalid --dict-size value: " + dictSize);
			c.compression = spec;
		}

		//---Заголовочный файл с defines проекта
		const std::string header = getKv(argc, argv, "--header");
		c.headerFile = header.empty() ? c.buildDirectory / "project.nsh" : resolveAgainst(c.baseDirectory, header);
		c.injectHeaderFile = !hasFlag(argc, argv, "--no-header");

		//---Окружение
		for (const std::string& kv : getAllKv(argc, argv, "--env"))
		{
			const std::size_t eq = kv.find('=');
			if (eq == std::string::npos || eq == 0) return invalid(o, "invalid --env value (expected NAME=VALUE): " + kv);
			c.environment[kv.substr(0, eq)] = kv.substr(eq + 1);
		}

		const std::string nsisDir = getKv(argc, argv, "--nsis-dir");
		if (!nsisDir.empty()) c.nsisDir = resolveAgainst(c.baseDirectory, nsisDir);
		c.autoNsisDir = !hasFlag(argc, argv, "--no-auto-nsis-dir");

		//---Флаги
		c.attachArtifact = !hasFlag(argc, argv, "--no-attach");
		c.disabled = hasFlag(argc, argv, "--disabled");

		o.manifest = getKv(argc, argv, "--manifest");
		o.logDir = getKv(argc, argv, "--log-dir");

		//---Возврат опций
		return o;
	}
	namespace {
		struct HelpOption {
			const char* option;
			const char* text;
		};

		constexpr int kHelpColumn = 32;

		//---Раздел справки: заголовок и опции в две колонки
		void printSection(std::ostream& os, const char* title, std::initializer_list<HelpOption> options)
		{
			os << "\n" << title << ":\n";
			for (const HelpOption& o : options)
				os << "  " << std::left << std::setw(kHelpColumn) << o.option << o.text << "\n";
		}
	} // namespace
	//------------------------------------------------------------
	//	Вывод справки по использованию
	//------------------------------------------------------------
	void printHelp(std::ostream& os)
	{
		os <<
			"nsis-make\n\n"
			"Usage:\n"
			"  nsis-make [options]\n";

		printSection(os, "Compiler options", {
			{ "--makensis=<bin>", "makensis name or path (default: makensis, searched in PATH)" },
			{ "--script=<file>", "Setup script (default: setup.nsi)" },
			{ "--base-dir=<dir>", "Project base directory (default: current directory)" },
			{ "--working-dir=<dir>", "Run makensis in <dir> and pass /NOCD" },
			{ "--verbosity=<0..4>", "makensis verbosity, clamped to 0..4 (default: 2)" },
		});
		printSection(os, "Output options", {
			{ "--output=<file>", "Installer file, relative to --build-dir (passed as /XOutFile)" },
			{ "--build-dir=<dir>", "Build output directory (default: target)" },
			{ "--classifier=<c>", "Inserted before the installer extension as -<c>" },
			{ "--no-attach", "Do not attach the installer as a build artifact" },
			{ "--manifest=<file>", "Append attached artifacts to <file>" },
		});
		printSection(os, "Compression options", {
			{ "--compression=zlib|bzip2|lzma", "SetCompressor algorithm" },
			{ "--compression-final", "SetCompressor /FINAL" },
			{ "--compression-solid", "SetCompressor /SOLID" },
			{ "--dict-size=<kb>", "LZMA dictionary size (default: 8)" },
		});
		printSection(os, "Environment options", {
			{ "--header=<file>", "Header file to !include (default: <build-dir>/project.nsh)" },
			{ "--no-header", "Do not include the header file" },
			{ "--env=NAME=VALUE", "Environment variable for makensis (repeatable)" },
			{ "--nsis-dir=<dir>", "NSISDIR passed to makensis" },
			{ "--no-auto-nsis-dir", "Do not detect NSISDIR" },
			{ "--disabled", "Do nothing" },
			{ "--log-dir=<dir>", "Write log files to <dir>" },
		});

		os <<
			"\nExamples:\n"
			"  nsis-make --script=setup.nsi --output=app-setup.exe\n"
			"  nsis-make --output=app-setup.exe --classifier=win64 --compression=lzma --compression-final --dict-size=64\n"
			"  nsis-make --makensis=/opt/nsis/bin/makensis --nsis-dir=/opt/nsis/share/nsis --verbosity=4\n";
	}
};//---namespace nsismake
