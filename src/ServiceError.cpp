#include "service_control/ServiceError.hpp"

namespace svcctl {

	//------------------------------------------------------------
	//	Описание состояния для человека
	//------------------------------------------------------------
	std::string RuntimeStatus::describe() const {
		if (!running) return "Service is stopped";
		if (pid) return "Service (pid  " + std::to_string(*pid) + ") is running...";
		return "Service is running...";
	}
	//------------------------------------------------------------
	//	Имя кода ошибки
	//------------------------------------------------------------
	const char* toString(ErrorCode code) {
		switch (code)
		{
		case ErrorCode::None:					return "None";
		case ErrorCode::UnsupportedSystem:		return "UnsupportedSystem";
		case ErrorCode::InsufficientPrivileges:	return "InsufficientPrivileges";
		case ErrorCode::AlreadyInstalled:		return "AlreadyInstalled";
		case ErrorCode::NotInstalled:			return "NotInstalled";
		case ErrorCode::AlreadyRunning:			return "AlreadyRunning";
		case ErrorCode::AlreadyStopped:			return "AlreadyStopped";
		case ErrorCode::InvalidArgument:		return "InvalidArgument";
		case ErrorCode::TemplateError:			return "TemplateError";
		case ErrorCode::IoError:				return "IoError";
		case ErrorCode::CommandFailed:			return "CommandFailed";
		}
		return "Unknown";
	}
	//------------------------------------------------------------
	//	Стандартный текст ошибки
	//------------------------------------------------------------
	std::string defaultMessage(ErrorCode code) {
		switch (code)
		{
		case ErrorCode::None:					return {};
		case ErrorCode::UnsupportedSystem:		return "unsupported system";
		case ErrorCode::InsufficientPrivileges:	return "you must have root user privileges. Possibly using 'sudo' command should help";
		case ErrorCode::AlreadyInstalled:		return "service has already been installed";
		case ErrorCode::NotInstalled:			return "service is not installed";
		case ErrorCode::AlreadyRunning:			return "service is already running";
		case ErrorCode::AlreadyStopped:			return "service has already been stopped";
		case ErrorCode::InvalidArgument:		return "invalid service name (allowed: A-Za-z0-9_.@-)";
		case ErrorCode::TemplateError:			return "invalid descriptor template";
		case ErrorCode::IoError:				return "filesystem error";
		case ErrorCode::CommandFailed:			return "native command failed";
		}
		return "unknown error";
	}
	//------------------------------------------------------------
	//	Сборка ошибки
	//------------------------------------------------------------
	ServiceError makeError(ErrorCode code, std::string detail) {
		ServiceError e;
		e.code = code;
		e.detail = detail.empty() ? defaultMessage(code) : std::move(detail);
		return e;
	}
}; //---namespace svcctl
