#pragma once
#include <filesystem>

namespace svcctl {

	//---Платформенно-зависимые реализации
	namespace platform {
		namespace fs = std::filesystem;

		//---Получение пути к собственному исполняемому файлу
		fs::path selfExePath();
	}

} // namespace svcctl
