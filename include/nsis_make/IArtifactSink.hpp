#pragma once
#include <filesystem>
#include <string>

namespace nsismake {

	namespace fs = std::filesystem;

	//---Интерфейс регистрации результата сборки
	class IArtifactSink {
	public:
		virtual ~IArtifactSink() = default;

		virtual bool attach(const fs::path& file, const std::string& type,
			const std::string& classifier, std::string* error) = 0;
	};

	//---Только запись в лог
	class LogArtifactSink final : public IArtifactSink {
	public:
		bool attach(const fs::path& file, const std::string& type,
			const std::string& classifier, std::string* error) override;
	};

	//---Дописывает строку "type<TAB>classifier<TAB>path" в файл манифеста
	class ManifestArtifactSink final : public IArtifactSink {
	public:
		explicit ManifestArtifactSink(fs::path manifest);

		bool attach(const fs::path& file, const std::string& type,
			const std::string& classifier, std::string* error) override;

	private:
		fs::path manifest_;
	};
};//---namespace nsismake
