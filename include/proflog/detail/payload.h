// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include <string_view>

namespace proflog {

// Written to <scratch>/sitecustomize.py. A Python interpreter started with the
// scratch directory on PYTHONPATH imports it at startup; it then appends one
// line describing the current stack to <scratch>/<pid> on every SIGUSR1.
//
// Knobs, all optional:
//   PROFLOG_STACKTRACE_PYTHON_PACKAGES  comma separated module prefixes; the
//                                       stack is reported from the innermost
//                                       frame in one of them
//   PROFLOG_STACKTRACE_SIZE             number of frames per line
//   PROFLOG_STACKTRACE_EXTRA            non-empty: prefix frames with file:line
constexpr std::string_view python_payload = R"__(import atexit
import os
import pathlib
import signal
import traceback

_SAMPLE_DIR = os.environ.get("PROFLOG_STACKTRACE_DIR")
_WITH_LOCATION = bool(os.environ.get("PROFLOG_STACKTRACE_EXTRA", ""))
_DEPTH = int(os.environ.get("PROFLOG_STACKTRACE_SIZE", "9999"))
_PACKAGES = os.environ.get("PROFLOG_STACKTRACE_PYTHON_PACKAGES", "").split(",")

_BLUE = "\x1b[0;34m"
_RESET = "\x1b[0m"
_SEPARATOR = " " + _BLUE + "←" + _RESET + " "

_sample_file = None


def _innermost_relevant(frame):
    while frame is not None and frame.f_back is not None:
        module = frame.f_globals.get("__name__", "")
        if any(module.startswith(p) for p in _PACKAGES):
            break
        frame = frame.f_back
    return frame


def _describe(entry):
    text = (entry.line or "?").strip() if _WITH_LOCATION else (entry.line or "").strip()
    if not _WITH_LOCATION:
        return text
    location = "%s:%d" % (pathlib.Path(entry.filename).name, entry.lineno)
    return (_BLUE + location + _RESET + " " + text).strip()


def _on_sample_request(signum, frame):
    if _sample_file is None:
        return
    try:
        stack = traceback.extract_stack(_innermost_relevant(frame))
        innermost_first = list(reversed(stack))[:_DEPTH]
        _sample_file.write(_SEPARATOR.join(_describe(e) for e in innermost_first) + "\n")
        _sample_file.flush()
    except Exception:
        # Sampling must never disturb the program being observed.
        pass


def _remove_sample_file():
    if _sample_file is not None:
        pathlib.Path(_sample_file.name).unlink(missing_ok=True)


def _install():
    global _sample_file
    if not _SAMPLE_DIR:
        return
    # The parent starts signalling once the file exists, so the handler
    # has to be in place before the file is created.
    signal.signal(signal.SIGUSR1, _on_sample_request)
    pathlib.Path(_SAMPLE_DIR).mkdir(parents=True, exist_ok=True)
    _sample_file = open(pathlib.Path(_SAMPLE_DIR) / str(os.getpid()), "w+")
    atexit.register(_remove_sample_file)


_install()
)__";

} // namespace proflog
