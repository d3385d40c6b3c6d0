#include "nsis_make/Invocation.hpp"

namespace nsismake {

	const char* compressionTypeName(CompressionType type) noexcept {
		switch (type)
		{
		case CompressionType::Bzip2: return "BZIP2";
		case CompressionType::Lzma:  return "LZMA";
		default:                     return "ZLIB";
		}
	}
	//------------------------------------------------------------
	//	Разбор имени алгоритма (--compression=zlib|bzip2|lzma)
	//------------------------------------------------------------
	bool parseCompressionType(std::string v, CompressionType& out) {

		//---Приводим к нижнему регистру
		for (char& c : v) if (c >= 'A' && c <= 'Z') c = char(c - 'A' + 'a');

		if (v == "zlib") { out = CompressionType::Zlib; return true; }
		if (v == "bzip2") { out = CompressionType::Bzip2; return true; }
		if (v == "lzma") { out = CompressionType::Lzma; return true; }

		return false;
	}
}; //---namespace nsismake
