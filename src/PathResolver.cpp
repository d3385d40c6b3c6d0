#include "nsis_make/PathResolver.hpp"
#include "platform/PlatformImpl.hpp"

#include <cctype>
#include <system_error>
#include <glog/logging.h>

namespace nsismake {

	namespace {
		//------------------------------------------------------------
		//	Пустая строка или только пробельные символы
		//------------------------------------------------------------
		bool isBlank(const std::string& s)
		{
			for (char c : s)
			{
				if (!std::isspace(static_cast<unsigned char>(c))) return false;
			}
			return true;
		}
		//------------------------------------------------------------
		//	Разбиение строки по разделителю
		//------------------------------------------------------------
		std::vector<std::string> split(const std::string& s, char sep)
		{
			std::vector<std::string> out;
			std::size_t begin = 0;
			for (;;)
			{
				const std::size_t end = s.find(sep, begin);
				out.push_back(s.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
				if (end == std::string::npos) break;
				begin = end + 1;
			}
			return out;
		}
		//------------------------------------------------------------
		//	Проверка элемента PATH на символы, недопустимые в пути
		//------------------------------------------------------------
		bool isValidPathElement(const std::string& s, OsType os)
		{
			for (char c : s)
			{
				if (c == '\0') return false;
				if (os != OsType::Windows) continue;

				const unsigned char u = static_cast<unsigned char>(c);
				if (u < 0x20) return false;
				switch (c)
				{
				case '<': case '>': case '"': case '|': case '?': case '*':
					return false;
				default:
					break;
				}
			}
			return true;
		}
		//------------------------------------------------------------
		//	Существует и является обычным файлом
		//------------------------------------------------------------
		bool isRegularFile(const fs::path& p)
		{
			std::error_code ec;
			return fs::is_regular_file(p, ec);
		}
		//------------------------------------------------------------
		//	Каталог данных NSIS содержит подкаталог Stubs
		//------------------------------------------------------------
		bool looksLikeNsisDir(const fs::path& dir)
		{
			std::error_code ec;
			return fs::is_directory(dir / "Stubs", ec);
		}
		//------------------------------------------------------------
		//	canonical() с откатом на исходный путь
		//------------------------------------------------------------
		fs::path realPathOrSelf(const fs::path& p)
		{
			std::error_code ec;
			fs::path real = fs::canonical(p, ec);
			if (ec)
			{
				LOG(WARNING) << "Could not get the real path of " << p << ": " << ec.message();
				return p;
			}
			return real;
		}
	} // namespace

	//------------------------------------------------------------
	//	Элементы PATH
	//------------------------------------------------------------
	std::vector<fs::path> splitOsPath(const std::string& osPath, OsType os) {
		std::vector<fs::path> result;
		if (isBlank(osPath)) return result;

		for (const std::string& element : split(osPath, pathListSeparator(os)))
		{
			if (isBlank(element)) continue;
			if (!isValidPathElement(element, os))
			{
				LOG(WARNING) << "Unable to resolve PATH element \"" << element
					<< "\" to a folder, it will be ignored";
				continue;
			}
			result.emplace_back(element);
		}
		return result;
	}
	//------------------------------------------------------------
	//	Расширения из PATHEXT
	//------------------------------------------------------------
	std::vector<std::string> splitPathExtensions(const std::string& pathExt, OsType os) {
		std::vector<std::string> result;
		if (isBlank(pathExt)) return result;

		for (const std::string& element : split(pathExt, pathListSeparator(os)))
		{
			const std::size_t first = element.find_first_not_of('.');
			if (first == std::string::npos) continue;

			std::string ext = element.substr(first);
			if (isBlank(ext)) continue;
			result.push_back(std::move(ext));
		}
		return result;
	}
	//------------------------------------------------------------
	//	Расширение имени файла
	//------------------------------------------------------------
	std::optional<std::string> getExtension(const fs::path& file, OsType os) {
		std::string name = file.filename().string();
		//---На POSIX-хосте fs::path не делит "a\b" на компоненты
		if (os == OsType::Windows)
		{
			const std::size_t bs = name.find_last_of('\\');
			if (bs != std::string::npos) name = name.substr(bs + 1);
		}
		if (isBlank(name)) return std::nullopt;

		const std::size_t point = name.find_last_of('.');
		if (point == std::string::npos || point + 1 == name.size()) return std::nullopt;

		return name.substr(point + 1);
	}
	//------------------------------------------------------------
	//	Поиск исполняемого файла по PATH
	//------------------------------------------------------------
	std::optional<fs::path> findInOsPath(const fs::path& relativePath, OsType os,
		const std::string& osPath, const std::string& pathExt) {

		if (relativePath.empty()) return std::nullopt;
		if (relativePath.is_absolute())
		{
			LOG(ERROR) << "findInOsPath: relative path expected, got " << relativePath;
			return std::nullopt;
		}

		//---Каталоги поиска: текущий каталог, затем PATH
		std::vector<fs::path> dirs;
		std::error_code ec;
		fs::path cwd = fs::current_path(ec);
		if (!ec) dirs.push_back(cwd);
		for (auto& d : splitOsPath(osPath, os)) dirs.push_back(std::move(d));

		//---Расширения: PATHEXT (Windows, имя без расширения), затем имя как есть
		std::vector<std::string> extensions;
		if (os == OsType::Windows && !getExtension(relativePath, os))
		{
			for (auto& e : splitPathExtensions(pathExt, os)) extensions.push_back("." + e);
		}
		extensions.emplace_back();

		for (const std::string& extension : extensions)
		{
			for (const fs::path& dir : dirs)
			{
				const fs::path candidate = extension.empty()
					? dir / relativePath
					: dir / fs::path(relativePath.string() + extension);

				if (!isRegularFile(candidate)) continue;

				VLOG(1) << "Resolved " << candidate << " from " << relativePath << " using OS path";
				return realPathOrSelf(candidate);
			}
		}
		VLOG(1) << "Failed to resolve " << relativePath << " using OS path";
		return std::nullopt;
	}

	std::optional<fs::path> findInOsPath(const fs::path& relativePath, OsType os) {
		return findInOsPath(relativePath, os,
			platform::getEnv("PATH").value_or(std::string{}),
			platform::getEnv("PATHEXT").value_or(std::string{}));
	}
	//------------------------------------------------------------
	//	Определение пути к makensis
	//------------------------------------------------------------
	fs::path resolveExecutable(const std::string& configured, OsType os, std::string* error) {

		if (isBlank(configured))
		{
			if (error) *error = "The makensis executable is not configured";
			return {};
		}

		const fs::path p(configured);
		if (p.is_absolute())
		{
			if (isRegularFile(p)) return p;
			if (error) *error = "The makensis executable does not exist: " + p.string();
			return {};
		}

		if (auto found = findInOsPath(p, os)) return *found;

		if (error) *error = "Unable to find \"" + configured + "\" in the OS path";
		return {};
	}
	//------------------------------------------------------------
	//	Поиск NSISDIR
	//------------------------------------------------------------
	std::optional<fs::path> findNsisDir(const fs::path& makensis, OsType os) {

		const fs::path binDir = makensis.parent_path();
		std::vector<fs::path> candidates;

		if (os == OsType::Windows)
		{
			//---Стандартная установка: makensis.exe в корне каталога NSIS или в его подкаталоге Bin
			candidates.push_back(binDir);
			candidates.push_back(binDir.parent_path());
		}
		else
		{
			//---Пакеты дистрибутивов, Homebrew (через canonical путь в Cellar), MacPorts
			candidates.push_back(binDir / ".." / "share" / "nsis");
			candidates.push_back(binDir / ".." / "share");
			candidates.push_back(binDir / ".." / ".." / "share" / "nsis");
			candidates.emplace_back("/usr/share/nsis");
			candidates.emplace_back("/usr/local/share/nsis");
			candidates.emplace_back("/opt/local/share/nsis");
		}

		for (const fs::path& c : candidates)
		{
			if (c.empty() || !looksLikeNsisDir(c)) continue;
			fs::path dir = realPathOrSelf(c.lexically_normal());
			VLOG(1) << "Detected NSISDIR " << dir << " for " << makensis;
			return dir;
		}
		return std::nullopt;
	}
}; //---namespace nsismake
