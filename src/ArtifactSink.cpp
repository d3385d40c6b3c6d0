#include "nsis_make/IArtifactSink.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <glog/logging.h>

namespace nsismake {

	bool LogArtifactSink::attach(const fs::path& file, const std::string& type,
		const std::string& classifier, std::string* /*error*/) {
		LOG(INFO) << "Artifact (" << type << (classifier.empty() ? "" : ", " + classifier) << "): " << file.string();
		return true;
	}

	ManifestArtifactSink::ManifestArtifactSink(fs::path manifest)
		: manifest_(std::move(manifest)) {
	}
	//------------------------------------------------------------
	//	Добавление записи в манифест
	//------------------------------------------------------------
	bool ManifestArtifactSink::attach(const fs::path& file, const std::string& type,
		const std::string& classifier, std::string* error) {

		std::error_code ec;
		const fs::path parent = manifest_.parent_path();
		if (!parent.empty()) fs::create_directories(parent, ec);

		std::ofstream f(manifest_, std::ios::binary | std::ios::app);
		if (!f)
		{
			if (error) *error = "Failed to open artifact manifest for writing: " + manifest_.string();
			return false;
		}

		f << type << '\t' << classifier << '\t' << file.string() << '\n';
		f.flush();
		if (!f)
		{
			if (error) *error = "Failed to write artifact manifest: " + manifest_.string();
			return false;
		}

		LOG(INFO) << "Attached " << file.string() << " to " << manifest_.string();
		return true;
	}
};//---namespace nsismake
