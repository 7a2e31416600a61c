#include "service_control/Privileges.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

#include <glog/logging.h>

namespace svcctl {

	//------------------------------------------------------------
	//	Разбор вывода `id -g`
	//------------------------------------------------------------
	bool parseGroupId(const std::string& output, unsigned long& gid) {

		//---Обрезка пробелов и перевода строки
		size_t b = 0;
		size_t e = output.size();
		while (b < e && std::isspace(static_cast<unsigned char>(output[b]))) b++;
		while (e > b && std::isspace(static_cast<unsigned char>(output[e - 1]))) e--;
		if (b == e) return false;

		const std::string s = output.substr(b, e - b);
		for (char c : s)
		{
			if (!std::isdigit(static_cast<unsigned char>(c))) return false;
		}

		errno = 0;
		const unsigned long v = std::strtoul(s.c_str(), nullptr, 10);
		if (errno == ERANGE || v > 0xFFFFFFFFul) return false;

		gid = v;
		return true;
	}
	//------------------------------------------------------------
	//	Проверка прав администратора
	//------------------------------------------------------------
	ServiceError checkPrivileges(process::ICommandRunner& runner) {

		process::RunResult rr;
		const bool ok = runner.run("id", { "-g" }, rr);

		unsigned long gid = 0;
		if (!ok || !rr.started || rr.exitCode != 0 || !parseGroupId(rr.output, gid))
		{
			LOG(WARNING) << "privilege check: `id -g` unavailable (exitCode=" << rr.exitCode << ")";
			return makeError(ErrorCode::UnsupportedSystem);
		}

		if (gid != 0) return makeError(ErrorCode::InsufficientPrivileges);

		return {};
	}
}; //---namespace svcctl
