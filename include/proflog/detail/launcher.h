// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"
#include "environment.h"
#include "error_channel.h"
#include "exception.h"
#include "logging.h"
#include "pipe_set.h"
#include "process_handle.h"
#include "unique_fd.h"
#include "utility.h"

#include <cerrno>
#include <optional>
#include <string>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace proflog {


struct Launch_request
{
    std::vector<std::string>        argv;               // argv[0] is the program
    std::optional<Environment_map>  environment;        // absent: inherit ours
    std::optional<std::string>      working_directory;
    std::optional<gid_t>            gid;
    std::optional<uid_t>            uid;
    Stdio_dispositions              stdio;
};



namespace detail {

// Everything the child needs between fork and exec, prepared in advance.
// Only plain pointers and integers; the storage belongs to launch().
struct Child_plan
{
    char* const*            argv                = nullptr;
    char* const*            envp                = nullptr;
    const cstring_vector*   candidates          = nullptr;
    const char*             working_directory   = nullptr;

    bool                    set_gid             = false;
    gid_t                   gid                 = 0;
    bool                    set_uid             = false;
    uid_t                   uid                 = 0;

    Stdio                   stdin_mode          = Stdio::inherit;
    Stdio                   stdout_mode         = Stdio::inherit;
    Stdio                   stderr_mode         = Stdio::inherit;
    int                     stdin_end           = -1;
    int                     stdout_end          = -1;
    int                     stderr_end          = -1;
    int                     progress_end        = -1;
    int                     null_fd             = -1;

    const Error_channel*    errors              = nullptr;
};


// Makes `from` available as `to` in the exec'd image.
inline bool install_descriptor(int from, int to) noexcept
{
    if (from == to) {
        // dup2() would be a no-op and leave close-on-exec set
        const int flags = fcntl_retry(from, F_GETFD);
        return flags != -1 && fcntl_retry(from, F_SETFD, flags & ~FD_CLOEXEC) != -1;
    }
    int rv = -1;
    do {
        rv = ::dup2(from, to);
    } while (rv == -1 && errno == EINTR);
    return rv != -1;
}


inline bool setup_child_stream(Stdio mode, int pipe_end, int fileno, int null_fd) noexcept
{
    switch (mode) {
        case Stdio::inherit:
            return true;
        case Stdio::pipe:
            return install_descriptor(pipe_end, fileno);
        case Stdio::ignore:
            return install_descriptor(null_fd, fileno);
        case Stdio::close:
            if (::close(fileno) == -1 && errno != EBADF && errno != EINTR) {
                return false;
            }
            return true;
    }
    errno = EINVAL;
    return false;
}


// The child half of launch(). Runs in the copy of the parent's address space
// left by fork(): it only makes direct system calls, and every exit path goes
// through execve() or Error_channel::report_and_exit().
[[noreturn]] inline void exec_child(const Child_plan& plan) noexcept
{
    const Error_channel& errors = *plan.errors;
    using stage = launch_error::stage;

    if (!setup_child_stream(plan.stdin_mode, plan.stdin_end, STDIN_FILENO, plan.null_fd)) {
        errors.report_and_exit(stage::rewire_stdin, errno);
    }
    if (!setup_child_stream(plan.stdout_mode, plan.stdout_end, STDOUT_FILENO, plan.null_fd)) {
        errors.report_and_exit(stage::rewire_stdout, errno);
    }
    if (!setup_child_stream(plan.stderr_mode, plan.stderr_end, STDERR_FILENO, plan.null_fd)) {
        errors.report_and_exit(stage::rewire_stderr, errno);
    }

    if (plan.working_directory && ::chdir(plan.working_directory) == -1) {
        errors.report_and_exit(stage::change_directory, errno);
    }

    if (plan.progress_end >= 0 && !install_descriptor(plan.progress_end, progress_fileno)) {
        errors.report_and_exit(stage::install_progress_channel, errno);
    }

    // group first, as it can no longer be changed once the user id is dropped
    if (plan.set_gid && ::setregid(plan.gid, plan.gid) == -1) {
        errors.report_and_exit(stage::set_group, errno);
    }
    if (plan.set_uid && ::setreuid(plan.uid, plan.uid) == -1) {
        errors.report_and_exit(stage::set_user, errno);
    }

    const cstring_vector& candidates = *plan.candidates;
    bool seen_eacces = false;
    int last_errno = ENOENT;
    for (size_t i = 0; i < candidates.size(); ++i) {
        ::execve(candidates[i], plan.argv, plan.envp);

        last_errno = errno;
        if (last_errno == EACCES) {
            seen_eacces = true;
            continue;
        }
        if (last_errno == ENOENT || last_errno == ENOTDIR) {
            continue;
        }
        errors.report_and_exit(stage::replace_program, last_errno);
    }
    errors.report_and_exit(stage::replace_program, seen_eacces ? EACCES : last_errno);
}


inline Unique_fd open_null_device(const std::string& program)
{
    int fd = -1;
    do {
        fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    } while (fd == -1 && errno == EINTR);
    if (fd == -1 || !lift_descriptor(fd, progress_fileno)) {
        const int saved_errno = errno;
        close_retaining_errno(fd);
        throw launch_error(launch_error::stage::open_null_device, saved_errno, program);
    }
    return Unique_fd(fd);
}


inline void reap(pid_t pid) noexcept
{
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            break;
        }
    }
}

} // namespace detail



// Exit code for a run that never got past launch(), following the shell
// convention for commands that are missing or not executable.
inline int exit_code_for(const launch_error& e)
{
    if (e.failed_stage() == launch_error::stage::replace_program) {
        if (e.errno_value() == ENOENT || e.errno_value() == ENOTDIR) {
            return exit_code_not_found;
        }
        if (e.errno_value() == EACCES) {
            return exit_code_not_executable;
        }
    }
    return exit_code_launch_failure;
}


// Starts request.argv as a child process.
//
// Returns once the child has either exec'd, in which case the handle owns the
// parent ends of every piped stream, or failed, in which case the child has
// already been reaped and launch_error names the failing step.
inline Process_handle launch(const Launch_request& request)
{
    if (request.argv.empty() || request.argv.front().empty()) {
        throw launch_error(launch_error::stage::prepare, EINVAL);
    }
    const std::string& program = request.argv.front();

    // Phase 1: everything that allocates.

    Pipe_set pipes = Pipe_set::allocate(request.stdio, program);

    Error_channel errors;
    errors.open(program);

    Unique_fd null_device;
    if (request.stdio.any_ignored()) {
        null_device = detail::open_null_device(program);
    }

    Environment_map env = request.environment ? *request.environment : current_environment();
    if (request.stdio.progress_channel) {
        env[progress_fd_variable] = std::to_string(progress_fileno);
    }

    const cstring_vector argv_block(request.argv);
    const cstring_vector envp_block(environment_block(env));
    const cstring_vector candidates(exec_candidates(
        program, search_path(request.environment ? &*request.environment : nullptr)));

    detail::Child_plan plan;
    plan.argv               = argv_block.v();
    plan.envp               = envp_block.v();
    plan.candidates         = &candidates;
    plan.working_directory  = request.working_directory ? request.working_directory->c_str() : nullptr;
    plan.set_gid            = request.gid.has_value();
    plan.gid                = request.gid.value_or(0);
    plan.set_uid            = request.uid.has_value();
    plan.uid                = request.uid.value_or(0);
    plan.stdin_mode         = request.stdio.stdin_mode;
    plan.stdout_mode        = request.stdio.stdout_mode;
    plan.stderr_mode        = request.stdio.effective_stderr_mode();
    plan.stdin_end          = pipes.child_stdin();
    plan.stdout_end         = pipes.child_stdout();
    plan.stderr_end         = pipes.child_stderr();
    plan.progress_end       = pipes.child_progress();
    plan.null_fd            = null_device.get();
    plan.errors             = &errors;

    ls_debug() << "launching " << program << " (" << candidates.size() << " candidate paths)";

    pid_t pid = -1;
    do {
        pid = ::fork();
    } while (pid == -1 && errno == EINTR);

    if (pid == -1) {
        throw launch_error(launch_error::stage::fork, errno, program);
    }

    if (pid == 0) {
        // Phase 2
        detail::exec_child(plan);
    }

    // Parent: the child holds its own copies now.
    pipes.close_child_ends();
    null_device.reset();

    if (auto failure = errors.receive(program)) {
        if (failure->failed_stage() == launch_error::stage::read_error_channel) {
            // the outcome is unknown, and the child may be running the program by now
            ::kill(pid, SIGKILL);
        }
        detail::reap(pid);
        ls_debug() << "launch of " << program << " failed: " << failure->what();
        throw *failure;
    }

    ls_debug() << "launched " << program << " as pid " << pid;
    return Process_handle(
        pid,
        pipes.release_parent_stdin(),
        pipes.release_parent_stdout(),
        pipes.release_parent_stderr(),
        pipes.release_parent_progress());
}

} // namespace proflog
