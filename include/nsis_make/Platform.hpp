#pragma once
#include <string>
#include <string_view>

namespace nsismake {

	//---Семейство ОС, от которого зависят префикс опций, кавычки и поиск в PATH
	enum class OsType {
		Linux,
		MacOs,
		Windows,
		Other						// Неподдерживаемые платформы
	};

	//---Классификация по имени ОС (Linux*, Mac* / Darwin*, Windows*, иначе Other)
	OsType resolveOsType(std::string_view osName) noexcept;

	//---ОС текущего процесса. Вызывается один раз, дальше значение передаётся явно
	OsType hostOsType();

	//---Имя для логов
	const char* osTypeName(OsType os) noexcept;

	//---Префикс опций makensis: "/" на Windows, "-" на остальных
	const char* optionPrefix(OsType os) noexcept;

	//---Разделитель элементов PATH / PATHEXT
	char pathListSeparator(OsType os) noexcept;

};//---namespace nsismake
