#pragma once
#include <map>
#include <optional>
#include <string>

namespace nsismake {

	//---Платформенно-зависимые реализации
	namespace platform {

		//---Имя ОС ("Linux", "Darwin", "Windows", ...)
		std::string hostOsName();
		//---Значение переменной окружения текущего процесса (nullopt, если не задана)
		std::optional<std::string> getEnv(const std::string& name);
		//---Копия окружения текущего процесса (UTF-8)
		std::map<std::string, std::string> environment();
		//---Перекодировка текста из кодировки консоли платформы в UTF-8
		std::string decodeNativeText(const std::string& text);
	}

} // namespace nsismake
