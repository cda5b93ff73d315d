#if defined(__linux__)

#include "uplink/os/service_control.hpp"

#include <cerrno>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace uplink::os {

namespace {

/// RAII wrapper so every exit path destroys the file actions.
struct FileActions {
    posix_spawn_file_actions_t fa;
    bool ok{false};
    FileActions() noexcept { ok = posix_spawn_file_actions_init(&fa) == 0; }
    ~FileActions() { if (ok) posix_spawn_file_actions_destroy(&fa); }
    FileActions(const FileActions&) = delete;
    FileActions& operator=(const FileActions&) = delete;
};

} // namespace

uplink_detail::expected<void, ServiceError>
InitScriptServiceControl::restart(std::string_view service) {
    if (service.empty() || service.find('/') != std::string_view::npos) {
        return uplink_detail::unexpected(ServiceError::InvalidName);
    }

    std::string script = init_dir_ + "/" + std::string(service);
    std::string verb = "restart";
    char* argv[] = {script.data(), verb.data(), nullptr};

    FileActions actions;
    if (!actions.ok ||
        posix_spawn_file_actions_addopen(&actions.fa, STDIN_FILENO, "/dev/null", O_RDONLY, 0) != 0 ||
        posix_spawn_file_actions_addopen(&actions.fa, STDOUT_FILENO, "/dev/null", O_WRONLY, 0) != 0 ||
        posix_spawn_file_actions_adddup2(&actions.fa, STDOUT_FILENO, STDERR_FILENO) != 0) {
        return uplink_detail::unexpected(ServiceError::SpawnFailed);
    }

    pid_t pid = -1;
    if (posix_spawn(&pid, script.c_str(), &actions.fa, nullptr, argv, environ) != 0) {
        return uplink_detail::unexpected(ServiceError::SpawnFailed);
    }

    int status = 0;
    pid_t rc;
    do {
        rc = waitpid(pid, &status, 0);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) return uplink_detail::unexpected(ServiceError::SpawnFailed);

    if (WIFSIGNALED(status)) return uplink_detail::unexpected(ServiceError::Signalled);
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return uplink_detail::unexpected(ServiceError::NonZeroExit);
    }
    return {};
}

} // namespace uplink::os
#endif
