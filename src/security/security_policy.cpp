#include "security/security_policy.hpp"

namespace sandforge::security {

SecurityPolicy DefaultSecurityPolicy() {
    SecurityPolicy policy{};
    policy.forbidden_modules = {
        "_thread", "asyncio", "bdb", "builtins", "code", "codeop",
        "ctypes", "dbm", "fcntl", "fileinput", "ftplib", "gc",
        "genericpath", "glob", "http", "importlib", "inspect", "io",
        "linecache", "marshal", "mmap", "multiprocessing", "nt", "ntpath",
        "os", "pathlib", "pdb", "pickle", "pkgutil", "platform",
        "posix", "posixpath", "pty", "requests", "resource", "runpy",
        "selectors", "shelve", "shutil", "signal", "site", "smtplib",
        "socket", "socketserver", "sqlite3", "ssl", "subprocess", "sys",
        "sysconfig", "tarfile", "telnetlib", "tempfile", "threading", "trace",
        "traceback", "urllib", "webbrowser", "zipfile", "zipimport"};
    policy.forbidden_calls = {
        "__import__", "breakpoint", "compile", "delattr", "dir", "eval",
        "exec", "exit", "getattr", "globals", "hasattr", "help",
        "input", "locals", "memoryview", "open", "quit", "setattr",
        "vars"};
    policy.forbidden_methods = {
        "execl", "execv", "execve", "fork", "kill", "popen",
        "spawnl", "spawnv", "system"};
    policy.forbidden_names = {
        "__builtins__", "__loader__", "__spec__"};
    policy.allowed_dunders = {
        "__class_getitem__", "__doc__", "__init__", "__len__", "__name__",
        "__repr__", "__str__"};
    policy.forbidden_attributes = {
        "f_back", "f_builtins", "f_code", "f_generator", "f_globals", "f_lasti",
        "f_locals", "f_trace"};
    policy.forbidden_attribute_prefixes = {
        "ag_", "co_", "cr_", "gi_", "tb_"};
    return policy;
}

}  // namespace sandforge::security
