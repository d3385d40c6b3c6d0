#if !defined(_WIN32)
#include "platform/PlatformImpl.hpp"
#include <cstdlib>
#include <sys/utsname.h>
#include <unistd.h>

extern char** environ;

namespace nsismake::platform {

	//---Имя ОС из uname(): "Linux", "Darwin", ...
	std::string hostOsName()
	{
		struct utsname u {};
		if (::uname(&u) != 0) return {};
		return std::string(u.sysname);
	}
	//---Значение переменной окружения
	std::optional<std::string> getEnv(const std::string& name)
	{
		const char* v = std::getenv(name.c_str());
		if (!v) return std::nullopt;
		return std::string(v);
	}
	//---Копия окружения текущего процесса
	std::map<std::string, std::string> environment()
	{
		std::map<std::string, std::string> env;
		for (char** e = environ; e && *e; ++e)
		{
			const std::string kv(*e);
			const std::size_t eq = kv.find('=');
			if (eq == std::string::npos || eq == 0) continue;
			env.emplace(kv.substr(0, eq), kv.substr(eq + 1));
		}
		return env;
	}
	//---Вне Windows makensis пишет в консоль в UTF-8
	std::string decodeNativeText(const std::string& text)
	{
		return text;
	}

} // namespace nsismake::platform
#endif
