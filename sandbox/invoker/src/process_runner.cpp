#include "process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string_view>

#include "unique_fd.hpp"

extern char** environ;

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace texbox {

namespace {

constexpr size_t READ_CHUNK = 16 * 1024;
constexpr int EXEC_FAILED_EXIT = 127;

// The child keeps 0-2 and its exec status pipe, moved here; everything above
// is closed before execve.
constexpr int STATUS_FD = 3;

// Every process started by one run_process() call carries this variable in
// its environment, which is how descendants that left the process group are
// found again.
constexpr const char* RUN_MARKER_VAR = "TEXBOX_RUN_ID";

std::atomic<uint64_t> run_counter{0};

// Upper bound on a single poll() so that the leader's exit is noticed even
// while descendants keep the pipes open.
constexpr std::chrono::milliseconds POLL_SLICE(50);

struct Capture {
	UniqueFd fd;
	std::string* text;
	bool* truncated;
};

void make_pipe(UniqueFd& read_end, UniqueFd& write_end, Logger& logger) {
	int fds[2];
	if (::pipe2(fds, O_CLOEXEC) < 0) {
		logger.error("pipe2 failed: " + std::string(std::strerror(errno)));
		throw ProcessException("pipe2() failed");
	}
	read_end.reset(fds[0]);
	write_end.reset(fds[1]);
}

bool is_executable_file(const fs::path& path) {
	struct stat st;
	return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

// Everything the child needs is laid out before fork(), the child only calls
// async-signal-safe functions.
struct ExecImage {
	std::string path;
	std::vector<std::string> args;
	std::vector<std::string> envs;
	std::vector<char*> argv;
	std::vector<char*> envp;

	int max_fd;

	ExecImage(const fs::path& executable, const ProcessSpec& spec, const std::string& run_marker)
	    : path(executable.string()), args(spec.argv), max_fd(open_fd_limit()) {
		for (char** it = environ; it && *it; it++) {
			std::string_view entry(*it);
			std::string_view key = entry.substr(0, entry.find('='));
			bool overridden = key == RUN_MARKER_VAR || std::any_of(spec.env.begin(), spec.env.end(),
			                                                       [&](const auto& kv) { return kv.first == key; });
			if (!overridden) {
				envs.emplace_back(entry);
			}
		}
		for (const auto& [key, value] : spec.env) {
			if (key != RUN_MARKER_VAR) {
				envs.push_back(key + "=" + value);
			}
		}
		envs.push_back(run_marker);

		for (auto& arg : args) {
			argv.push_back(arg.data());
		}
		argv.push_back(nullptr);
		for (auto& env : envs) {
			envp.push_back(env.data());
		}
		envp.push_back(nullptr);
	}

	static int open_fd_limit() {
		struct rlimit rl;
		if (::getrlimit(RLIMIT_NOFILE, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY && rl.rlim_cur < 65536) {
			return static_cast<int>(rl.rlim_cur);
		}
		return 65536;
	}
};

// Descriptors the daemon holds (log files, client sockets, other requests'
// pipes) must not reach the engine.
void close_inherited_fds(int max_fd) {
#ifdef SYS_close_range
	if (::syscall(SYS_close_range, STATUS_FD + 1, ~0U, 0) == 0) {
		return;
	}
#endif
	for (int fd = STATUS_FD + 1; fd < max_fd; fd++) {
		::close(fd);
	}
}

[[noreturn]] void run_child(const ExecImage& image, const char* work_dir, int devnull, int out_fd, int err_fd,
                            int status_fd) {
	::setpgid(0, 0);

	sigset_t all;
	sigemptyset(&all);
	sigprocmask(SIG_SETMASK, &all, nullptr);
	struct sigaction sa{};
	sa.sa_handler = SIG_DFL;
	sigemptyset(&sa.sa_mask);
	sigaction(SIGPIPE, &sa, nullptr);
	sigaction(SIGINT, &sa, nullptr);
	sigaction(SIGTERM, &sa, nullptr);

	if (::dup2(devnull, STDIN_FILENO) < 0 || ::dup2(out_fd, STDOUT_FILENO) < 0 ||
	    ::dup2(err_fd, STDERR_FILENO) < 0 || ::chdir(work_dir) < 0) {
		int err = errno;
		ssize_t ignored = ::write(status_fd, &err, sizeof(err));
		(void)ignored;
		_exit(EXEC_FAILED_EXIT);
	}

	if (status_fd != STATUS_FD) {
		if (::dup2(status_fd, STATUS_FD) < 0) {
			int err = errno;
			ssize_t ignored = ::write(status_fd, &err, sizeof(err));
			(void)ignored;
			_exit(EXEC_FAILED_EXIT);
		}
		status_fd = STATUS_FD;
	}
	::fcntl(status_fd, F_SETFD, FD_CLOEXEC);
	close_inherited_fds(image.max_fd);

	::execve(image.path.c_str(), image.argv.data(), image.envp.data());

	int err = errno;
	ssize_t ignored = ::write(status_fd, &err, sizeof(err));
	(void)ignored;
	_exit(EXEC_FAILED_EXIT);
}

void read_available(Capture& capture, size_t max_bytes, Logger& logger) {
	char buf[READ_CHUNK];
	ssize_t n = ::read(capture.fd.get(), buf, sizeof(buf));
	if (n < 0) {
		if (errno == EINTR || errno == EAGAIN) {
			return;
		}
		logger.warning("read from child pipe failed: " + std::string(std::strerror(errno)));
		capture.fd.reset();
		return;
	}
	if (n == 0) {
		capture.fd.reset();
		return;
	}

	size_t room = max_bytes > capture.text->size() ? max_bytes - capture.text->size() : 0;
	size_t keep = std::min(room, static_cast<size_t>(n));
	capture.text->append(buf, keep);
	if (keep < static_cast<size_t>(n)) {
		*capture.truncated = true;
	}
}

void kill_group(pid_t pgid, Logger& logger) {
	if (::killpg(pgid, SIGKILL) < 0 && errno != ESRCH) {
		logger.warning("killpg(" + std::to_string(pgid) + ") failed: " + std::strerror(errno));
	}
}

int reap(pid_t pid, Logger& logger) {
	int status = 0;
	while (::waitpid(pid, &status, 0) < 0) {
		if (errno != EINTR) {
			logger.error("waitpid(" + std::to_string(pid) + ") failed: " + std::strerror(errno));
			throw ProcessException("waitpid() failed");
		}
	}
	return status;
}

bool carries_marker(const fs::path& proc_dir, const std::string& marker) {
	std::ifstream in(proc_dir / "environ", std::ios::binary);
	if (!in) {
		return false;
	}
	std::string environment((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
	for (size_t pos = environment.find(marker); pos != std::string::npos; pos = environment.find(marker, pos + 1)) {
		bool starts = pos == 0 || environment[pos - 1] == '\0';
		size_t end = pos + marker.size();
		if (starts && (end == environment.size() || environment[end] == '\0')) {
			return true;
		}
	}
	return false;
}

// Kills processes of this run that escaped the process group (setsid, or
// setpgid into a group of their own). Repeats until a pass finds nothing, so
// that a straggler forking during the sweep is caught too, but never past
// until.
void sweep_escaped(const std::string& marker, Clock::time_point until, Logger& logger) {
	pid_t self = ::getpid();
	size_t killed = 0;
	for (;;) {
		size_t found = 0;
		std::error_code ec;
		for (const auto& entry : fs::directory_iterator("/proc", ec)) {
			std::string name = entry.path().filename().string();
			if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
				continue;
			}
			pid_t pid = static_cast<pid_t>(std::stol(name));
			if (pid == self || !carries_marker(entry.path(), marker)) {
				continue;
			}
			if (::kill(pid, SIGKILL) == 0) {
				found++;
			} else if (errno != ESRCH) {
				logger.warning("kill(" + std::to_string(pid) + ") failed: " + std::strerror(errno));
			}
		}
		if (ec) {
			logger.warning("Cannot scan /proc for escaped processes: " + ec.message());
			return;
		}
		killed += found;
		if (found == 0 || Clock::now() >= until) {
			break;
		}
	}
	if (killed > 0) {
		logger.warning("Killed " + std::to_string(killed) + " process(es) that left the process group");
	}
}

// True once the leader has terminated. The zombie is left in place so that
// its pid, and with it the process group id, cannot be recycled before the
// group has been killed.
bool leader_exited(pid_t pid, Logger& logger) {
	siginfo_t info{};
	if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
		if (errno == EINTR) {
			return false;
		}
		logger.error("waitid(" + std::to_string(pid) + ") failed: " + std::strerror(errno));
		throw ProcessException("waitid() failed");
	}
	return info.si_pid == pid;
}

}  // namespace

fs::path resolve_executable(const std::string& name) {
	if (name.empty()) {
		return {};
	}
	if (name.find('/') != std::string::npos) {
		fs::path path = fs::absolute(name);
		return is_executable_file(path) ? path : fs::path();
	}

	const char* env_path = std::getenv("PATH");
	std::string_view paths = (env_path && *env_path) ? env_path : "/usr/local/bin:/usr/bin:/bin";
	while (!paths.empty()) {
		size_t pos = paths.find(':');
		std::string_view dir = (pos == std::string_view::npos) ? paths : paths.substr(0, pos);
		fs::path candidate = (dir.empty() ? fs::current_path() : fs::path(std::string(dir))) / name;
		if (is_executable_file(candidate)) {
			return candidate;
		}
		if (pos == std::string_view::npos) {
			break;
		}
		paths.remove_prefix(pos + 1);
	}
	return {};
}

ProcessOutcome run_process(const ProcessSpec& spec, Logger& logger) {
	if (spec.argv.empty()) {
		throw ProcessException("empty command line");
	}

	fs::path executable = resolve_executable(spec.argv[0]);
	if (executable.empty()) {
		logger.error("Executable '" + spec.argv[0] + "' not found");
		throw ProcessException("executable '" + spec.argv[0] + "' not found");
	}

	std::string run_marker = std::string(RUN_MARKER_VAR) + "=" + std::to_string(::getpid()) + "-" +
	                         std::to_string(++run_counter) + "-" +
	                         std::to_string(Clock::now().time_since_epoch().count());
	ExecImage image(executable, spec, run_marker);
	std::string work_dir = spec.work_dir.string();

	UniqueFd devnull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
	if (!devnull.valid()) {
		logger.error("open(/dev/null) failed: " + std::string(std::strerror(errno)));
		throw ProcessException("cannot open /dev/null");
	}

	UniqueFd out_read, out_write, err_read, err_write, status_read, status_write;
	make_pipe(out_read, out_write, logger);
	make_pipe(err_read, err_write, logger);
	make_pipe(status_read, status_write, logger);

	Clock::time_point started = Clock::now();

	pid_t pid = ::fork();
	if (pid < 0) {
		logger.error("fork failed: " + std::string(std::strerror(errno)));
		throw ProcessException("fork() failed");
	}
	if (pid == 0) {
		run_child(image, work_dir.c_str(), devnull.get(), out_write.get(), err_write.get(), status_write.get());
	}

	// Also done here: whichever side runs first, the group exists before we
	// might have to kill it.
	if (::setpgid(pid, pid) < 0 && errno != EACCES && errno != ESRCH) {
		logger.warning("setpgid(" + std::to_string(pid) + ") failed: " + std::strerror(errno));
	}

	out_write.reset();
	err_write.reset();
	status_write.reset();

	int child_errno = 0;
	ssize_t got;
	do {
		got = ::read(status_read.get(), &child_errno, sizeof(child_errno));
	} while (got < 0 && errno == EINTR);
	if (got == sizeof(child_errno)) {
		reap(pid, logger);
		logger.error("Cannot start '" + executable.string() + "' in " + work_dir + ": " + std::strerror(child_errno));
		throw ProcessException("cannot start '" + spec.argv[0] + "': " + std::strerror(child_errno));
	}
	logger.debug("Started pid " + std::to_string(pid) + ": " + executable.string());

	ProcessOutcome outcome;
	Capture captures[2] = {{std::move(out_read), &outcome.stdout_text, &outcome.stdout_truncated},
	                       {std::move(err_read), &outcome.stderr_text, &outcome.stderr_truncated}};

	Clock::time_point deadline = started + spec.timeout;
	Clock::time_point drain_deadline;
	bool reaped = false;
	int status = 0;

	for (;;) {
		Clock::time_point now = Clock::now();

		if (!reaped) {
			if (leader_exited(pid, logger)) {
				kill_group(pid, logger);
				status = reap(pid, logger);
				reaped = true;
				drain_deadline = Clock::now() + spec.kill_grace;
				sweep_escaped(run_marker, drain_deadline, logger);
			} else if (now >= deadline) {
				logger.warning("Pid " + std::to_string(pid) + " exceeded " + std::to_string(spec.timeout.count()) +
				               " ms, killing its process group");
				outcome.timed_out = true;
				kill_group(pid, logger);
				status = reap(pid, logger);
				reaped = true;
				drain_deadline = Clock::now() + spec.kill_grace;
				sweep_escaped(run_marker, drain_deadline, logger);
			}
		}

		bool open_streams = captures[0].fd.valid() || captures[1].fd.valid();
		if (reaped && (!open_streams || Clock::now() >= drain_deadline)) {
			if (open_streams) {
				logger.warning("Output of pid " + std::to_string(pid) + " still open after grace period, dropping it");
			}
			break;
		}

		Clock::time_point wake = reaped ? drain_deadline : std::min(deadline, Clock::now() + POLL_SLICE);
		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(wake - Clock::now());
		int wait_ms = static_cast<int>(std::clamp<int64_t>(remaining.count(), 0, POLL_SLICE.count()));

		if (!open_streams) {
			// Leader still running with both streams closed.
			::poll(nullptr, 0, wait_ms);
			continue;
		}

		pollfd fds[2];
		Capture* owners[2];
		nfds_t nfds = 0;
		for (auto& capture : captures) {
			if (capture.fd.valid()) {
				fds[nfds] = {capture.fd.get(), POLLIN, 0};
				owners[nfds] = &capture;
				nfds++;
			}
		}

		int ready = ::poll(fds, nfds, wait_ms);
		if (ready < 0) {
			if (errno == EINTR) {
				continue;
			}
			logger.error("poll failed: " + std::string(std::strerror(errno)));
			if (!reaped) {
				kill_group(pid, logger);
				reap(pid, logger);
				sweep_escaped(run_marker, Clock::now() + spec.kill_grace, logger);
			}
			throw ProcessException("poll() failed");
		}
		for (nfds_t i = 0; i < nfds; i++) {
			if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
				read_available(*owners[i], spec.max_capture_bytes, logger);
			}
		}
	}

	outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
	if (WIFEXITED(status)) {
		outcome.exit_code = WEXITSTATUS(status);
	} else if (WIFSIGNALED(status)) {
		outcome.term_signal = WTERMSIG(status);
		outcome.exit_code = 128 + outcome.term_signal;
	}

	logger.debug("Pid " + std::to_string(pid) + " finished after " + std::to_string(outcome.elapsed.count()) +
	             " ms, exit code " + std::to_string(outcome.exit_code) + (outcome.timed_out ? " (timed out)" : ""));
	return outcome;
}

}  // namespace texbox
