#include "nsis_make/CommandBuilder.hpp"
#include "nsis_make/ArgumentFormatter.hpp"
#include "nsis_make/PathResolver.hpp"
#include "nsis_make/ScriptValidator.hpp"
#include "platform/PlatformImpl.hpp"

#include <cctype>
#include <system_error>
#include <glog/logging.h>

namespace nsismake {

	namespace {
		constexpr const char* kNsisDirVariable = "NSISDIR";

		bool isBlank(const std::string& s)
		{
			for (char c : s)
			{
				if (!std::isspace(static_cast<unsigned char>(c))) return false;
			}
			return true;
		}
	} // namespace

	//------------------------------------------------------------
	//	Нормализация классификатора
	//------------------------------------------------------------
	std::string normalizeClassifier(const std::string& classifier) {
		if (isBlank(classifier)) return {};

		const std::size_t first = classifier.find_first_not_of('-');
		if (first == std::string::npos) return {};

		return "-" + classifier.substr(first);
	}

	bool isDefaultCompression(const CompressionSpec& spec) noexcept {
		return spec.type == CompressionType::Zlib && !spec.isFinal && !spec.isSolid;
	}
	//------------------------------------------------------------
	//	Путь установщика с классификатором
	//------------------------------------------------------------
	bool resolveOutputFile(const std::string& outputFile, const fs::path& buildDirectory,
		const std::string& classifier, ResolvedOutputFile& out, std::string* error) {

		out = {};
		if (isBlank(outputFile))
		{
			if (error) *error = "The output file name is empty";
			return false;
		}

		fs::path p(outputFile);
		if (p.is_relative()) p = buildDirectory / p;

		//---Вставка классификатора перед последней точкой имени (или в конец, если точки нет).
		//   ".exe" → "-win64.exe": имя из одного расширения тоже считается расширением
		const std::string suffix = normalizeClassifier(classifier);
		if (!suffix.empty())
		{
			std::string name = p.filename().string();
			const std::size_t dot = name.rfind('.');
			if (dot == std::string::npos) name += suffix;
			else name.insert(dot, suffix);
			p.replace_filename(name);
		}

		std::error_code ec;
		fs::path abs = fs::absolute(p, ec);
		if (ec)
		{
			if (error) *error = "Unable to resolve the absolute path of " + p.string() + ": " + ec.message();
			return false;
		}
		out.absolutePath = abs.lexically_normal();

		//---Создаём родительский каталог до запуска makensis
		const fs::path parent = out.absolutePath.parent_path();
		if (!parent.empty() && !fs::is_directory(parent, ec))
		{
			ec.clear();
			fs::create_directories(parent, ec);
			if (ec)
			{
				if (error) *error = "Can't create target directory " + parent.string() + ": " + ec.message();
				return false;
			}
			LOG(INFO) << "Directory created: " << parent;
		}
		out.parentDirectoryEnsured = true;
		return true;
	}
	//------------------------------------------------------------
	//	Командная строка makensis
	//------------------------------------------------------------
	bool buildCommand(const InvocationConfig& config, const fs::path& executable,
		const PreflightResult& preflight, const std::optional<ResolvedOutputFile>& outputFile,
		OsType os, Command& out, std::string* error) {

		out = {};
		if (!preflight.ok)
		{
			if (error) *error = preflight.message();
			return false;
		}

		const std::string p = optionPrefix(os);
		auto& args = out.args;

		//--- 1) makensis
		args.push_back(executable.string());

		//--- 2) Заголовочный файл с defines проекта
		if (config.injectHeaderFile && !config.headerFile.empty())
		{
			std::error_code ec;
			if (fs::is_regular_file(config.headerFile, ec))
			{
				args.push_back(p + "X!include " + formatStringArgument(config.headerFile, false, os));
			}
			else
			{
				VLOG(1) << "Header file " << config.headerFile << " does not exist, not including it";
			}
		}

		//--- 3) Файл установщика
		if (outputFile)
		{
			args.push_back(p + "XOutFile " + formatStringArgument(outputFile->absolutePath, false, os));
			out.outputFile = outputFile;
		}

		//--- 4) Процесс запускается в заданном каталоге, makensis не должен переходить в каталог скрипта
		if (config.workingFolder) args.push_back(p + "NOCD");

		//--- 5) Уровень вывода
		args.push_back(p + "V" + std::to_string(clampVerbosity(config.verbosity)));

		//--- 6) Сжатие
		if (config.compression && !isDefaultCompression(*config.compression))
		{
			const CompressionSpec& c = *config.compression;
			std::string setCompressor = p + "XSetCompressor ";
			if (c.isFinal) setCompressor += "/FINAL ";
			if (c.isSolid) setCompressor += "/SOLID ";
			setCompressor += compressionTypeName(c.type);
			args.push_back(setCompressor);

			if (c.type == CompressionType::Lzma && c.dictSizeKb != kDefaultLzmaDictSize)
			{
				args.push_back(p + "XSetCompressorDictSize " + std::to_string(c.dictSizeKb));
			}
		}

		//--- 7) Скрипт - позиционный аргумент, последним
		args.push_back(config.scriptFile.string());
		return true;
	}
	//------------------------------------------------------------
	//	Окружение makensis
	//------------------------------------------------------------
	std::map<std::string, std::string> buildEnvironment(const InvocationConfig& config,
		const fs::path& executable, OsType os) {

		std::map<std::string, std::string> env = config.environment;

		//---Явно заданный NSISDIR
		if (config.nsisDir)
		{
			env[kNsisDirVariable] = config.nsisDir->string();
			return env;
		}

		if (!config.autoNsisDir) return env;
		if (env.count(kNsisDirVariable) || platform::getEnv(kNsisDirVariable)) return env;

		//---Автоопределение (best-effort)
		if (auto dir = findNsisDir(executable, os))
		{
			env[kNsisDirVariable] = dir->string();
		}
		else
		{
			LOG(WARNING) << "Unable to detect NSISDIR for " << executable
				<< ", makensis will use its built-in default";
		}
		return env;
	}
}; //---namespace nsismake
