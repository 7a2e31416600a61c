#pragma once
#include <string>

namespace svcctl {

	//---Инициализация glog
	//	logDir пустой → только stderr, иначе файлы info/warning/error/fatal в logDir
	void initLogging(const char* programName, const std::string& logDir);

};//---namespace svcctl
