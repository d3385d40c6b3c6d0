#include "nsis_make/ArgumentFormatter.hpp"

namespace nsismake {

	namespace {
		//---Замена всех вхождений подстроки
		std::string replaceAll(std::string s, const std::string& from, const std::string& to)
		{
			std::size_t pos = 0;
			while ((pos = s.find(from, pos)) != std::string::npos)
			{
				s.replace(pos, from.size(), to);
				pos += to.size();
			}
			return s;
		}
	} // namespace

	//------------------------------------------------------------
	//	Пробельные символы и кавычки требуют заключения в кавычки
	//------------------------------------------------------------
	bool quotesNeeded(const std::string& source) noexcept {
		for (char c : source)
		{
			switch (c)
			{
			case ' ': case '\t': case '\n': case '\v': case '\f': case '\r':
			case '"': case '\'': case '`':
				return true;
			default:
				break;
			}
		}
		return false;
	}
	//------------------------------------------------------------
	//	Форматирование строкового аргумента
	//------------------------------------------------------------
	std::string formatStringArgument(const std::string& source, bool alwaysQuote, OsType os) {

		const bool windows = os == OsType::Windows;
		const std::string quote = windows ? "\\\"" : "\"";

		if (source.empty()) return quote + quote;

		if (!alwaysQuote && !quotesNeeded(source)) return source;

		//---Порядок важен: сначала слеши, потом кавычки (иначе слеши из $\\\" удвоятся)
		std::string escaped = windows
			? replaceAll(replaceAll(source, "\\", "\\\\"), "\"", "$\\\\\\\"")
			: replaceAll(source, "\"", "$\\\"");

		return quote + escaped + quote;
	}

	std::string formatStringArgument(const fs::path& path, bool alwaysQuote, OsType os) {
		return formatStringArgument(path.string(), alwaysQuote, os);
	}
}; //---namespace nsismake
