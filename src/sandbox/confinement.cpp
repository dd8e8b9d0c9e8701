#include "sandbox/confinement.hpp"

#include <cerrno>

#include <fcntl.h>
#include <linux/landlock.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandforge::sandbox {
namespace {

// Write-side rights every ABI knows about.
constexpr __u64 kWriteAccessV1 =
    LANDLOCK_ACCESS_FS_WRITE_FILE |
    LANDLOCK_ACCESS_FS_REMOVE_DIR |
    LANDLOCK_ACCESS_FS_REMOVE_FILE |
    LANDLOCK_ACCESS_FS_MAKE_CHAR |
    LANDLOCK_ACCESS_FS_MAKE_DIR |
    LANDLOCK_ACCESS_FS_MAKE_REG |
    LANDLOCK_ACCESS_FS_MAKE_SOCK |
    LANDLOCK_ACCESS_FS_MAKE_FIFO |
    LANDLOCK_ACCESS_FS_MAKE_BLOCK |
    LANDLOCK_ACCESS_FS_MAKE_SYM;

__u64 WriteAccessFor(int abi) {
    __u64 access = kWriteAccessV1;
    if (abi >= 2) {
        access |= LANDLOCK_ACCESS_FS_REFER;
    }
#ifdef LANDLOCK_ACCESS_FS_TRUNCATE
    if (abi >= 3) {
        access |= LANDLOCK_ACCESS_FS_TRUNCATE;
    }
#endif
    return access;
}

int LastError() {
    return errno != 0 ? errno : EPERM;
}

}  // namespace

std::string ToString(NetworkIsolation isolation) {
    switch (isolation) {
        case NetworkIsolation::kNetNamespace: return "net-namespace";
        case NetworkIsolation::kUserNetNamespace: return "user-net-namespace";
        case NetworkIsolation::kNone: break;
    }
    return "none";
}

int LandlockAbiVersion() {
    const long abi = ::syscall(SYS_landlock_create_ruleset, nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
    return abi < 0 ? 0 : static_cast<int>(abi);
}

NetworkIsolation DetectNetworkIsolation() {
    const pid_t pid = ::fork();
    if (pid < 0) {
        return NetworkIsolation::kNone;
    }
    if (pid == 0) {
        if (EnterNetworkIsolation(NetworkIsolation::kNetNamespace) == 0) {
            ::_exit(1);
        }
        if (EnterNetworkIsolation(NetworkIsolation::kUserNetNamespace) == 0) {
            ::_exit(2);
        }
        ::_exit(0);
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return NetworkIsolation::kNone;
        }
    }
    if (!WIFEXITED(status)) {
        return NetworkIsolation::kNone;
    }
    switch (WEXITSTATUS(status)) {
        case 1: return NetworkIsolation::kNetNamespace;
        case 2: return NetworkIsolation::kUserNetNamespace;
        default: return NetworkIsolation::kNone;
    }
}

int EnterNetworkIsolation(NetworkIsolation isolation) {
    int flags = 0;
    switch (isolation) {
        case NetworkIsolation::kNetNamespace: flags = CLONE_NEWNET; break;
        case NetworkIsolation::kUserNetNamespace: flags = CLONE_NEWUSER | CLONE_NEWNET; break;
        case NetworkIsolation::kNone: return 0;
    }
    return ::unshare(flags) == 0 ? 0 : LastError();
}

int RestrictWritesBeneath(const char* directory, int abi) {
    if (abi < 1) {
        return EOPNOTSUPP;
    }
    const __u64 access = WriteAccessFor(abi);
    landlock_ruleset_attr ruleset{};
    ruleset.handled_access_fs = access;
    const long ruleset_fd = ::syscall(SYS_landlock_create_ruleset, &ruleset, sizeof(ruleset), 0);
    if (ruleset_fd < 0) {
        return LastError();
    }
    const int fd = static_cast<int>(ruleset_fd);
    const int dir_fd = ::open(directory, O_PATH | O_CLOEXEC);
    if (dir_fd < 0) {
        const int error = LastError();
        ::close(fd);
        return error;
    }
    landlock_path_beneath_attr rule{};
    rule.allowed_access = access;
    rule.parent_fd = dir_fd;
    int error = 0;
    if (::syscall(SYS_landlock_add_rule, fd, LANDLOCK_RULE_PATH_BENEATH, &rule, 0) != 0) {
        error = LastError();
    } else if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        error = LastError();
    } else if (::syscall(SYS_landlock_restrict_self, fd, 0) != 0) {
        error = LastError();
    }
    ::close(dir_fd);
    ::close(fd);
    return error;
}

}  // namespace sandforge::sandbox
