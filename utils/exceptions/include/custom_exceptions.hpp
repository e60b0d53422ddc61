#pragma once

#include <stdexcept>
#include <string>

class SystemException : public std::runtime_error {
   public:
	explicit SystemException(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigException : public SystemException {
   public:
	explicit ConfigException(const std::string& msg) : SystemException("ConfigException: " + msg) {}
};

class SocketException : public SystemException {
   public:
	explicit SocketException(const std::string& msg) : SystemException("SocketException: " + msg) {}
};

class InvalidAddressException : public SocketException {
   public:
	explicit InvalidAddressException(const std::string& msg) : SocketException("InvalidAddressException: " + msg) {}
};

class ConnectionException : public SocketException {
   public:
	explicit ConnectionException(const std::string& msg) : SocketException("ConnectionException: " + msg) {}
};

class TransmissionException : public SystemException {
   public:
	explicit TransmissionException(const std::string& msg) : SystemException("TransmissionException: " + msg) {}
};

class SandboxException : public SystemException {
   public:
	explicit SandboxException(const std::string& msg) : SystemException(msg) {}
};

// Thrown before anything is executed; entry() names the offending archive member.
class InvalidArchiveException : public SandboxException {
   public:
	InvalidArchiveException(const std::string& entry, const std::string& msg)
	    : SandboxException("InvalidArchiveException: " + msg), entry_(entry), detail_(msg) {}

	const std::string& entry() const { return entry_; }
	const std::string& detail() const { return detail_; }

   private:
	std::string entry_;
	std::string detail_;
};

class WorkspaceException : public SandboxException {
   public:
	explicit WorkspaceException(const std::string& msg) : SandboxException("WorkspaceException: " + msg) {}
};

class ProcessException : public SandboxException {
   public:
	explicit ProcessException(const std::string& msg) : SandboxException("ProcessException: " + msg) {}
};
