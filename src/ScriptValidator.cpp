#include "nsis_make/ScriptValidator.hpp"
#include "nsis_make/Invocation.hpp"

#include <fstream>
#include <sstream>
#include <glog/logging.h>

namespace nsismake {

	namespace {
		constexpr const char* kOutFile = "OutFile";
		constexpr const char* kSetCompressor = "SetCompressor";

		//---Символ, продолжающий идентификатор директивы
		bool isWordChar(char c) noexcept
		{
			return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
				(c >= '0' && c <= '9') || c == '_';
		}
	} // namespace

	std::string PreflightResult::message() const {
		if (ok) return {};
		std::ostringstream os;
		os << "Script file " << file.string() << " contains the directive '" << directive
			<< "' on line " << line << ", which conflicts with the plugin configuration."
			<< " Remove it from the script or from the configuration";
		return os.str();
	}
	//------------------------------------------------------------
	//	Набор проверок для конфигурации
	//------------------------------------------------------------
	ScriptChecks checksFor(const InvocationConfig& config) {
		ScriptChecks c;
		c.outFile = config.outputFile.has_value();
		c.finalCompressor = config.compression.has_value() && config.compression->isFinal;
		return c;
	}
	//------------------------------------------------------------
	//	Совпадение директивы в начале строки
	//------------------------------------------------------------
	bool lineStartsWithDirective(const std::string& line, const std::string& directive) noexcept {
		const std::size_t begin = line.find_first_not_of(" \t");
		if (begin == std::string::npos) return false;
		if (line.compare(begin, directive.size(), directive) != 0) return false;

		const std::size_t after = begin + directive.size();
		return after == line.size() || !isWordChar(line[after]);
	}
	//------------------------------------------------------------
	//	Построчная проверка скрипта
	//------------------------------------------------------------
	PreflightResult validateScript(const fs::path& scriptPath, const ScriptChecks& checks) {

		PreflightResult result;
		result.file = scriptPath;

		if (!checks.outFile && !checks.finalCompressor) return result;

		std::ifstream in(scriptPath, std::ios::binary);
		if (!in)
		{
			LOG(WARNING) << "Unable to read script file " << scriptPath << " for validation";
			return result;
		}

		std::string line;
		std::size_t lineNo = 0;
		while (std::getline(in, line))
		{
			++lineNo;

			//---BOM UTF-8 и CR от переводов строк Windows
			if (lineNo == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
			if (!line.empty() && line.back() == '\r') line.pop_back();

			const char* hit = nullptr;
			if (checks.outFile && lineStartsWithDirective(line, kOutFile)) hit = kOutFile;
			else if (checks.finalCompressor && lineStartsWithDirective(line, kSetCompressor)) hit = kSetCompressor;

			if (hit)
			{
				result.ok = false;
				result.line = lineNo;
				result.directive = hit;
				return result;
			}
		}
		return result;
	}
}; //---namespace nsismake
