//
// Created by gregorian-rayne on 2/5/26.
//

#include "fdeps/resolve/stdlib_modules.hpp"
#include "fdeps/types.hpp"

#include <algorithm>

namespace fdeps::resolve {

    namespace {

    constexpr std::string_view STDLIB_MODULES[] = {
        "__future__", "_thread", "abc", "argparse", "array", "ast", "asyncio",
        "atexit", "base64", "binascii", "bisect", "builtins", "bz2", "calendar",
        "cmath", "cmd", "codecs", "collections", "colorsys", "concurrent",
        "configparser", "contextlib", "contextvars", "copy", "copyreg", "cProfile",
        "csv", "ctypes", "curses", "dataclasses", "datetime", "dbm", "decimal",
        "difflib", "dis", "doctest", "email", "encodings", "enum", "errno",
        "faulthandler", "fcntl", "filecmp", "fileinput", "fnmatch", "fractions",
        "ftplib", "functools", "gc", "getopt", "getpass", "gettext", "glob",
        "graphlib", "grp", "gzip", "hashlib", "heapq", "hmac", "html", "http",
        "imaplib", "importlib", "inspect", "io", "ipaddress", "itertools", "json",
        "keyword", "linecache", "locale", "logging", "lzma", "mailbox", "marshal",
        "math", "mimetypes", "mmap", "multiprocessing", "netrc", "numbers",
        "operator", "optparse", "os", "pathlib", "pdb", "pickle", "pkgutil",
        "platform", "plistlib", "posixpath", "pprint", "profile", "pstats", "pty",
        "pwd", "queue", "random", "re", "readline", "reprlib", "resource", "sched",
        "secrets", "select", "selectors", "shelve", "shlex", "shutil", "signal",
        "site", "smtplib", "socket", "socketserver", "sqlite3", "ssl", "stat",
        "statistics", "string", "struct", "subprocess", "sys", "sysconfig",
        "tarfile", "tempfile", "textwrap", "threading", "time", "timeit", "tkinter",
        "token", "tokenize", "tomllib", "trace", "traceback", "types", "typing",
        "unicodedata", "unittest", "urllib", "uuid", "venv", "warnings", "wave",
        "weakref", "webbrowser", "xml", "xmlrpc", "zipfile", "zipimport", "zlib",
        "zoneinfo"
    };

    }  // namespace

    bool is_stdlib_module(const std::string_view module_name) {
        const auto top = top_level_module(module_name);
        if (top.empty()) {
            return false;
        }
        return std::ranges::find(STDLIB_MODULES, top) != std::ranges::end(STDLIB_MODULES);
    }

}  // namespace fdeps::resolve
