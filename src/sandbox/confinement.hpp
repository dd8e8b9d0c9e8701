#pragma once

#include <string>

namespace sandforge::sandbox {

// Kernel facilities that keep a candidate process away from the network.
enum class NetworkIsolation {
    kNone,
    // unshare(CLONE_NEWNET); needs CAP_SYS_ADMIN.
    kNetNamespace,
    // unshare(CLONE_NEWUSER | CLONE_NEWNET); needs unprivileged user namespaces.
    kUserNetNamespace,
};

std::string ToString(NetworkIsolation isolation);

// Highest Landlock ABI version the running kernel supports, 0 when Landlock
// is compiled out or disabled.
int LandlockAbiVersion();

// Forks a throwaway child and reports the first isolation flavour that
// unshare() accepts on this host.
NetworkIsolation DetectNetworkIsolation();

// The functions below run between fork and exec, so they only make raw
// system calls and report failure as an errno value (0 on success).

// Moves the calling process into a fresh network namespace.
int EnterNetworkIsolation(NetworkIsolation isolation);

// Denies every filesystem write outside `directory` for the calling process
// and everything it executes. Reads are left alone.
int RestrictWritesBeneath(const char* directory, int abi);

}  // namespace sandforge::sandbox
