#include "Logging.hpp"

#include "Logger/LogConfig.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>

namespace quorum {

static Logging::LogConfig config;

//! Game records go to a file only. The console belongs to the application using the library.
//! Release builds skip debug entries.
static void InitializeLogger() {
	config.SetLogEnabled(true);
#ifdef NDEBUG
	config.SetMinLogLevel(Logging::LogLevel::Info);
#else
	config.SetMinLogLevel(Logging::LogLevel::Any);
#endif

	const auto logPath = Logging::GetDefaultLogDir("Quorum/Core");

	std::error_code ec{};
	if (std::filesystem::create_directories(logPath, ec); ec) {
		std::cerr << std::format("[Logger] Could not create directory: {}\nMoves and rejections will not be recorded.\n", logPath.string());
		return;
	}
	config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logPath / "game.log"));
}

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, InitializeLogger);

	return Logging::Logger(config);
}

} // namespace quorum
