#ifdef _WIN32
#include "platform/PlatformImpl.hpp"
#include <windows.h>
#include <vector>
#include <glog/logging.h>

namespace nsismake::platform {

	namespace {
		//--- Преобразование широкой строки (UTF-16) в UTF-8
		std::string wideToUtf8(const wchar_t* w, int len)
		{
			if (len == 0) return {};
			int n = WideCharToMultiByte(CP_UTF8, 0, w, len, nullptr, 0, nullptr, nullptr);
			if (n <= 0)
			{
				LOG(WARNING) << "WideCharToMultiByte failed with error " << GetLastError();
				return {};
			}
			std::string s((size_t)n, '\0');
			WideCharToMultiByte(CP_UTF8, 0, w, len, s.data(), n, nullptr, nullptr);
			return s;
		}
		//--- Преобразование строки в кодировке codePage в широкую строку
		std::wstring toWide(const std::string& s, UINT codePage)
		{
			if (s.empty()) return {};
			int n = MultiByteToWideChar(codePage, 0, s.c_str(), (int)s.size(), nullptr, 0);
			if (n <= 0)
			{
				LOG(WARNING) << "MultiByteToWideChar failed with error " << GetLastError();
				return {};
			}
			std::wstring w((size_t)n, L'\0');
			MultiByteToWideChar(codePage, 0, s.c_str(), (int)s.size(), w.data(), n);
			return w;
		}
	} // namespace

	std::string hostOsName()
	{
		return "Windows";
	}
	//---Значение переменной окружения (через W-API, чтобы не терять не-ASCII символы)
	std::optional<std::string> getEnv(const std::string& name)
	{
		const std::wstring wname = toWide(name, CP_UTF8);
		DWORD n = GetEnvironmentVariableW(wname.c_str(), nullptr, 0);
		if (n == 0) return std::nullopt;
		std::vector<wchar_t> buf(n, L'\0');
		n = GetEnvironmentVariableW(wname.c_str(), buf.data(), (DWORD)buf.size());
		return wideToUtf8(buf.data(), (int)n);
	}
	//---Копия окружения текущего процесса. Записи вида "=C:=C:\" пропускаются
	std::map<std::string, std::string> environment()
	{
		std::map<std::string, std::string> env;
		LPWCH block = GetEnvironmentStringsW();
		if (!block)
		{
			LOG(WARNING) << "GetEnvironmentStringsW failed with error " << GetLastError();
			return env;
		}
		for (const wchar_t* p = block; *p; p += wcslen(p) + 1)
		{
			const std::string kv = wideToUtf8(p, (int)wcslen(p));
			const std::size_t eq = kv.find('=');
			if (eq == std::string::npos || eq == 0) continue;
			env.emplace(kv.substr(0, eq), kv.substr(eq + 1));
		}
		FreeEnvironmentStringsW(block);
		return env;
	}
	//---makensis на Windows пишет в консоль в кодировке ANSI
	std::string decodeNativeText(const std::string& text)
	{
		const std::wstring w = toWide(text, CP_ACP);
		return wideToUtf8(w.c_str(), (int)w.size());
	}

} // namespace nsismake::platform
#endif
