#include "nsis_make/Platform.hpp"
#include "platform/PlatformImpl.hpp"

namespace nsismake {

	//------------------------------------------------------------
	//	Проверка, что строка начинается с префикса
	//------------------------------------------------------------
	static bool startsWith(std::string_view s, std::string_view p) noexcept {
		return s.size() >= p.size() && s.substr(0, p.size()) == p;
	}
	//------------------------------------------------------------
	//	Классификация ОС по имени
	//------------------------------------------------------------
	OsType resolveOsType(std::string_view osName) noexcept {
		if (startsWith(osName, "Linux")) return OsType::Linux;
		if (startsWith(osName, "Mac") || startsWith(osName, "Darwin")) return OsType::MacOs;
		if (startsWith(osName, "Windows")) return OsType::Windows;
		return OsType::Other;
	}
	//------------------------------------------------------------
	//	ОС текущего процесса
	//------------------------------------------------------------
	OsType hostOsType() {
		return resolveOsType(platform::hostOsName());
	}

	const char* osTypeName(OsType os) noexcept {
		switch (os)
		{
		case OsType::Linux:   return "Linux";
		case OsType::MacOs:   return "macOS";
		case OsType::Windows: return "Windows";
		default:              return "Other";
		}
	}

	const char* optionPrefix(OsType os) noexcept {
		return os == OsType::Windows ? "/" : "-";
	}

	char pathListSeparator(OsType os) noexcept {
		return os == OsType::Windows ? ';' : ':';
	}
}; //---namespace nsismake
