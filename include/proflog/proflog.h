// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

///\file
///\brief Public facade for proflog.
///
///  proflog runs one command, shows its output line by line with the time each
///  line has been current, and, for Python programs, the code location the
///  program is executing right now. This header gathers the pieces:
///
///  - *Launching* (pipe_set.h, error_channel.h, launcher.h, process_handle.h):
///    fork/exec with a one-shot error report from the child, so that a failed
///    exec is a launch_error rather than a child that exits with 127.
///  - *Log reading* (line_framer.h, log_multiplexer.h, renderer.h,
///    terminal.h): a poll() loop over the child's pipes that redraws a live
///    region at the bottom of the terminal.
///  - *Stack sampling* (sample_correlator.h, scratch_workspace.h, payload.h,
///    environment.h): the side channel through which an instrumented child
///    reports where it is.
///  - *Utilities* (config.h, logging.h, exception.h, utility.h, unique_fd.h).


#ifndef __cpp_inline_variables
#error Inline variables are not supported. proflog requires this and other C++17 features.
#endif

#if !defined(__unix__) && !defined(__APPLE__)
#error proflog only supports POSIX systems.
#endif


#include "detail/config.h"
#include "detail/logging.h"
#include "detail/exception.h"
#include "detail/utility.h"
#include "detail/unique_fd.h"

#include "detail/pipe_set.h"
#include "detail/error_channel.h"
#include "detail/environment.h"
#include "detail/process_handle.h"
#include "detail/launcher.h"

#include "detail/line_framer.h"
#include "detail/terminal.h"
#include "detail/renderer.h"
#include "detail/sample_correlator.h"
#include "detail/log_multiplexer.h"

#include "detail/payload.h"
#include "detail/scratch_workspace.h"
