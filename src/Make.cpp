#include "nsis_make/Make.hpp"
#include "nsis_make/CommandBuilder.hpp"
#include "nsis_make/ExitEvaluator.hpp"
#include "nsis_make/IArtifactSink.hpp"
#include "nsis_make/PathResolver.hpp"
#include "nsis_make/Process.hpp"
#include "nsis_make/ScriptValidator.hpp"

#include <chrono>
#include <sstream>
#include <glog/logging.h>

namespace nsismake {

	namespace {
		constexpr const char* kArtifactType = "exe";
		//---Время на дочитывание вывода после завершения makensis
		constexpr std::chrono::milliseconds kOutputDrainGrace{ 1000 };

		//------------------------------------------------------------
		//	Логирование ошибки и возврат кода ошибки
		//------------------------------------------------------------
		int fail(const std::string& msg)
		{
			LOG(ERROR) << msg;
			return 1;
		}
		//------------------------------------------------------------
		//	Команда и окружение в лог (подробный уровень)
		//------------------------------------------------------------
		void logInvocation(const Command& command, const process::RunOptions& opt)
		{
			if (!VLOG_IS_ON(1)) return;

			std::ostringstream os;
			for (const auto& a : command.args) os << " [" << a << "]";
			VLOG(1) << "directory: " << (opt.workingDir.empty() ? std::string("<current>") : opt.workingDir.string());
			VLOG(1) << "command:" << os.str();
			for (const auto& kv : opt.environment) VLOG(1) << "  " << kv.first << ": " << kv.second;
		}
	} // namespace

	std::string artifactSkipReason(const InvocationConfig& config) {
		if (!config.attachArtifact) return "attaching is disabled";
		if (!config.outputFile) return "no output file is configured, the script decides where the installer goes";
		return {};
	}

	LineSink makensisLogSink() {
		return [](const std::string& line) { LOG(INFO) << "[MAKENSIS] " << line; };
	}
	//------------------------------------------------------------
	//	Оркестратор запуска makensis
	//------------------------------------------------------------
	int runMake(const InvocationConfig& config, OsType os, IArtifactSink& artifacts, const LineSink& sink) {

		if (config.disabled)
		{
			LOG(INFO) << "NSIS make is disabled, not doing anything";
			return 0;
		}

		//--- 1) Директивы скрипта, конфликтующие с флагами /X
		const PreflightResult preflight = validateScript(config.scriptFile, checksFor(config));
		if (!preflight.ok) return fail(preflight.message());

		//--- 2) makensis
		std::string err;
		const fs::path makensis = resolveExecutable(config.makensisBin, os, &err);
		if (makensis.empty()) return fail(err);
		VLOG(1) << "Using makensis " << makensis << " on " << osTypeName(os);

		//--- 3) Файл установщика (каталог создаётся до запуска)
		std::optional<ResolvedOutputFile> outputFile;
		if (config.outputFile)
		{
			ResolvedOutputFile resolved;
			if (!resolveOutputFile(*config.outputFile, config.buildDirectory, config.classifier, resolved, &err))
				return fail(err);
			outputFile = resolved;
		}

		//--- 4) Командная строка и окружение
		Command command;
		if (!buildCommand(config, makensis, preflight, outputFile, os, command, &err)) return fail(err);

		process::RunOptions opt;
		opt.workingDir = config.workingFolder ? *config.workingFolder : config.baseDirectory;
		opt.environment = buildEnvironment(config, makensis, os);
		logInvocation(command, opt);

		//--- 5) Запуск, чтение вывода в отдельном потоке, ожидание
		const auto started = std::chrono::steady_clock::now();
		process::ChildProcess child;
		process::RunResult rr;
		if (!process::start(command.args, opt, child, rr))
		{
			std::ostringstream msg;
			msg << "Unable to execute makensis: " << rr.error << " (sysError=" << rr.sysError << ")";
			return fail(msg.str());
		}

		ProcessOutputHandler output(child, sink, defaultOutputEncoding(os));
		output.startThread();

		//---Итог определяет код завершения, а не конец потока вывода
		const ProcessResult result = waitForExit(child, started);
		if (!output.finish(kOutputDrainGrace))
		{
			LOG(WARNING) << "makensis has exited but its output stream is still open after "
				<< kOutputDrainGrace.count() << "ms (inherited by a background process?), not waiting for it";
		}

		if (!evaluate(result, sink, &err)) return fail(err);

		//--- 6) Регистрация установщика
		const std::string skipReason = artifactSkipReason(config);
		if (!skipReason.empty())
		{
			LOG(INFO) << "Installer is not attached: " << skipReason;
			return 0;
		}
		if (!artifacts.attach(command.outputFile->absolutePath, kArtifactType, config.classifier, &err))
			return fail(err.empty() ? "attach failed." : err);
		return 0;
	}
}; //---namespace nsismake
