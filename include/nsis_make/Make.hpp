#pragma once
#include "nsis_make/Invocation.hpp"
#include "nsis_make/Platform.hpp"
#include "nsis_make/ProcessOutputHandler.hpp"
#include <string>

namespace nsismake {

	class IArtifactSink;

	//---Приёмник вывода makensis по умолчанию: LOG(INFO) с префиксом [MAKENSIS]
	LineSink makensisLogSink();

	//---Причина, по которой установщик не передаётся приёмнику артефактов (пусто - передаётся)
	std::string artifactSkipReason(const InvocationConfig& config);

	//---Оркестратор: проверка скрипта, поиск makensis, запуск, ожидание, передача артефакта
	// Возвращает:
	//   0 - успех (или выполнение отключено), 1 - ошибка
	int runMake(const InvocationConfig& config, OsType os, IArtifactSink& artifacts,
		const LineSink& sink = makensisLogSink());

};//---namespace nsismake
