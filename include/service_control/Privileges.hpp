#pragma once
#include <string>

#include "Process.hpp"
#include "ServiceError.hpp"

namespace svcctl {

	//---Проверка прав администратора через `id -g`
	//	gid == 0      → ErrorCode::None
	//	gid != 0      → ErrorCode::InsufficientPrivileges
	//	нет вывода/id → ErrorCode::UnsupportedSystem
	ServiceError checkPrivileges(process::ICommandRunner& runner);

	//---Разбор вывода `id -g`. false, если это не число
	bool parseGroupId(const std::string& output, unsigned long& gid);

};//---namespace svcctl
