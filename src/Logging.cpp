#include "service_control/Logging.hpp"

#include <filesystem>
#include <glog/logging.h>

namespace svcctl {

	namespace fs = std::filesystem;

	//---Инициализация логгера
	void initLogging(const char* programName, const std::string& logDir) {

		bool toFiles = false;
		if (!logDir.empty())
		{
			//---Создание директории для логов
			std::error_code ec;
			fs::create_directories(logDir, ec);
			toFiles = !ec;
		}

		if (toFiles)
		{
			const fs::path dir(logDir);
			google::SetLogFilenameExtension(".txt"); // Расширение
			google::SetLogDestination(google::GLOG_INFO, (dir / "info").string().c_str()); // Путь и название логов для ошибок, предупреждений и информации
			google::SetLogDestination(google::GLOG_WARNING, (dir / "warning").string().c_str());
			google::SetLogDestination(google::GLOG_ERROR, (dir / "error").string().c_str());
			google::SetLogDestination(google::GLOG_FATAL, (dir / "fatal").string().c_str());

			//---Настройка вывода в консоль
			FLAGS_alsologtostderr = true;
		}
		else
		{
			//---Без каталога только консоль
			FLAGS_logtostderr = true;
		}
		FLAGS_colorlogtostderr = true;

		google::InitGoogleLogging(programName); // Инициализация

		if (!logDir.empty() && !toFiles)
			LOG(WARNING) << "Cannot create log directory " << logDir << ", logging to stderr";
	}
}; //---namespace svcctl
