//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// command_decryptor.cpp
//
// Spawns an age-compatible tool and exchanges data over pipes. The ciphertext
// is written to the child's stdin while stdout and stderr are drained, so a
// large container cannot deadlock the exchange.
//===----------------------------------------------------------------------===//

#include "rage/command_decryptor.hpp"
#include "rage/rage_exception.hpp"

#include "duckdb/common/string_util.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

// Debug logging controlled by DUCK_RAGE_DEBUG environment variable
static int GetRageDecryptDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("DUCK_RAGE_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define DUCK_RAGE_DECRYPT_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                     \
		if (GetRageDecryptDebugLevel() >= lvl)                               \
			fprintf(stderr, "[DUCK_RAGE DECRYPT] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace duckdb {
namespace rage {

// Exit status used by the child when exec fails
static constexpr int EXEC_FAILURE_EXIT_CODE = 127;
// Diagnostics kept from the tool's stderr
static constexpr size_t MAX_ERROR_OUTPUT = 4096;

bool IsAllowedDecryptCommand(const std::string &command) {
	auto name = command;
#ifdef _WIN32
	auto separator = name.find_last_of("/\\");
#else
	auto separator = name.find_last_of('/');
#endif
	if (separator != std::string::npos) {
		name = name.substr(separator + 1);
	}
#ifdef _WIN32
	name = StringUtil::Lower(name);
	if (StringUtil::EndsWith(name, ".exe")) {
		name = name.substr(0, name.size() - 4);
	}
#endif
	return name == "rage" || name == "age";
}

CommandDecryptor::CommandDecryptor(std::string command, int64_t max_output_size)
    : command_(std::move(command)), max_output_size_(max_output_size) {
}

std::string CommandDecryptor::GetName() const {
	return command_;
}

#ifdef _WIN32

SecureBuffer CommandDecryptor::Decrypt(const std::vector<uint8_t> &container, const std::string &identity_path) {
	throw DecryptionException("Decryption through '%s' is not supported on Windows", command_);
}

#else

namespace {

// Owns one pipe end
class PipeFd {
public:
	PipeFd() : fd_(-1) {}
	~PipeFd() {
		Close();
	}
	PipeFd(const PipeFd &) = delete;
	PipeFd &operator=(const PipeFd &) = delete;

	int Get() const {
		return fd_;
	}
	void Reset(int fd) {
		Close();
		fd_ = fd;
	}
	bool IsOpen() const {
		return fd_ >= 0;
	}
	void Close() {
		if (fd_ >= 0) {
			close(fd_);
			fd_ = -1;
		}
	}

private:
	int fd_;
};

// Kills and reaps the child if it was not waited for
class ChildProcess {
public:
	explicit ChildProcess(pid_t pid) : pid_(pid), reaped_(false) {}
	~ChildProcess() {
		if (!reaped_) {
			kill(pid_, SIGKILL);
			int status;
			while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
			}
		}
	}
	ChildProcess(const ChildProcess &) = delete;
	ChildProcess &operator=(const ChildProcess &) = delete;

	int Wait() {
		int status = 0;
		while (waitpid(pid_, &status, 0) < 0) {
			if (errno != EINTR) {
				reaped_ = true;
				throw DecryptionException("Failed to wait for decryption command: %s", std::string(strerror(errno)));
			}
		}
		reaped_ = true;
		return status;
	}

private:
	pid_t pid_;
	bool reaped_;
};

// Blocks SIGPIPE on the calling thread so a child that exits early surfaces as EPIPE.
// Any SIGPIPE raised meanwhile is consumed before the old mask is restored.
class SigpipeGuard {
public:
	SigpipeGuard() : raised_(false) {
		sigemptyset(&mask_);
		sigaddset(&mask_, SIGPIPE);
		pthread_sigmask(SIG_BLOCK, &mask_, &old_mask_);
	}
	~SigpipeGuard() {
		if (raised_) {
			sigset_t pending;
			sigemptyset(&pending);
			if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE)) {
				int sig;
				sigwait(&mask_, &sig);
			}
		}
		pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
	}
	void MarkRaised() {
		raised_ = true;
	}

private:
	sigset_t mask_;
	sigset_t old_mask_;
	bool raised_;
};

void CreatePipe(PipeFd &read_end, PipeFd &write_end) {
	int fds[2];
#ifdef __linux__
	// Atomic: a fork on another thread never inherits these ends
	if (pipe2(fds, O_CLOEXEC) != 0) {
		throw DecryptionException("Failed to create pipe for decryption command: %s", std::string(strerror(errno)));
	}
	read_end.Reset(fds[0]);
	write_end.Reset(fds[1]);
#else
	if (pipe(fds) != 0) {
		throw DecryptionException("Failed to create pipe for decryption command: %s", std::string(strerror(errno)));
	}
	read_end.Reset(fds[0]);
	write_end.Reset(fds[1]);
	fcntl(fds[0], F_SETFD, FD_CLOEXEC);
	fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
}

void SetNonBlocking(int fd) {
	int flags = fcntl(fd, F_GETFL, 0);
	if (flags >= 0) {
		fcntl(fd, F_SETFL, flags | O_NONBLOCK);
	}
}

bool IsRetryable(int err) {
	return err == EAGAIN || err == EWOULDBLOCK || err == EINTR;
}

}  // namespace

SecureBuffer CommandDecryptor::Decrypt(const std::vector<uint8_t> &container, const std::string &identity_path) {
	PipeFd stdin_read, stdin_write;
	PipeFd stdout_read, stdout_write;
	PipeFd stderr_read, stderr_write;
	CreatePipe(stdin_read, stdin_write);
	CreatePipe(stdout_read, stdout_write);
	CreatePipe(stderr_read, stderr_write);

	// argv is built before fork; the child does no allocation of its own
	std::vector<std::string> args = {command_, "-d", "-i", identity_path};
	std::vector<char *> argv;
	for (auto &arg : args) {
		argv.push_back(&arg[0]);
	}
	argv.push_back(nullptr);

	DUCK_RAGE_DECRYPT_DEBUG_LOG(1, "spawning '%s -d -i %s' (%llu bytes of ciphertext)", command_.c_str(),
	                            identity_path.c_str(), (unsigned long long)container.size());

	pid_t pid = fork();
	if (pid < 0) {
		throw DecryptionException("Failed to start decryption command '%s': %s", command_,
		                          std::string(strerror(errno)));
	}
	if (pid == 0) {
		dup2(stdin_read.Get(), STDIN_FILENO);
		dup2(stdout_write.Get(), STDOUT_FILENO);
		dup2(stderr_write.Get(), STDERR_FILENO);
		execvp(argv[0], argv.data());
		_exit(EXEC_FAILURE_EXIT_CODE);
	}

	ChildProcess child(pid);
	stdin_read.Close();
	stdout_write.Close();
	stderr_write.Close();

	SetNonBlocking(stdin_write.Get());
	SetNonBlocking(stdout_read.Get());
	SetNonBlocking(stderr_read.Get());

	SecureBuffer cleartext;
	std::string error_output;
	bool output_too_large = false;
	size_t written = 0;
	if (container.empty()) {
		stdin_write.Close();
	}

	char chunk[4096];
	{
		SigpipeGuard sigpipe_guard;
		while (stdin_write.IsOpen() || stdout_read.IsOpen() || stderr_read.IsOpen()) {
			struct pollfd fds[3];
			PipeFd *owners[3];
			nfds_t count = 0;
			if (stdin_write.IsOpen()) {
				fds[count] = {stdin_write.Get(), POLLOUT, 0};
				owners[count++] = &stdin_write;
			}
			if (stdout_read.IsOpen()) {
				fds[count] = {stdout_read.Get(), POLLIN, 0};
				owners[count++] = &stdout_read;
			}
			if (stderr_read.IsOpen()) {
				fds[count] = {stderr_read.Get(), POLLIN, 0};
				owners[count++] = &stderr_read;
			}

			int rc = poll(fds, count, -1);
			if (rc < 0) {
				if (errno == EINTR) {
					continue;
				}
				SecureZero(chunk, sizeof(chunk));
				throw DecryptionException("poll() failed while running decryption command: %s",
				                          std::string(strerror(errno)));
			}

			for (nfds_t i = 0; i < count; i++) {
				if (fds[i].revents == 0) {
					continue;
				}
				auto &owner = *owners[i];
				if (&owner == &stdin_write) {
					ssize_t n = write(owner.Get(), container.data() + written, container.size() - written);
					if (n > 0) {
						written += static_cast<size_t>(n);
						if (written == container.size()) {
							owner.Close();
						}
					} else if (n < 0 && IsRetryable(errno)) {
						continue;
					} else {
						// Child stopped reading; its exit status tells why
						if (n < 0 && errno == EPIPE) {
							sigpipe_guard.MarkRaised();
						}
						owner.Close();
					}
					continue;
				}

				ssize_t n = read(owner.Get(), chunk, sizeof(chunk));
				if (n > 0) {
					if (&owner == &stdout_read) {
						if (static_cast<int64_t>(cleartext.GetSize()) + n > max_output_size_) {
							output_too_large = true;
							owner.Close();
						} else {
							cleartext.Append(chunk, static_cast<idx_t>(n));
						}
					} else if (error_output.size() < MAX_ERROR_OUTPUT) {
						error_output.append(chunk, std::min(static_cast<size_t>(n), MAX_ERROR_OUTPUT - error_output.size()));
					}
				} else if (n < 0 && IsRetryable(errno)) {
					continue;
				} else {
					owner.Close();
				}
			}
		}
	}
	SecureZero(chunk, sizeof(chunk));

	int status = child.Wait();
	StringUtil::Trim(error_output);

	if (output_too_large) {
		throw DecryptionException("Decrypted content exceeds the maximum size of %lld bytes", max_output_size_);
	}
	if (WIFSIGNALED(status)) {
		throw DecryptionException("Decryption command '%s' was terminated by signal %d", command_, WTERMSIG(status));
	}
	int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
	DUCK_RAGE_DECRYPT_DEBUG_LOG(1, "'%s' exited with code %d, %llu bytes of output", command_.c_str(), exit_code,
	                            (unsigned long long)cleartext.GetSize());

	if (exit_code == EXEC_FAILURE_EXIT_CODE) {
		throw DecryptionException("Decryption command '%s' could not be executed. Install rage (or age) and make "
		                          "sure it is on PATH, or set duck_rage_decrypt_command",
		                          command_);
	}
	if (exit_code != 0) {
		throw DecryptionException("Failed to decrypt with identity '%s' using '%s' (exit code %d): %s", identity_path,
		                          command_, exit_code, error_output);
	}
	return cleartext;
}

#endif

}  // namespace rage
}  // namespace duckdb
