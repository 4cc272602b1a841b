// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

//
// proflog <command> [args]...
//
// Runs the command with its stdout and stderr merged into one pipe. Each line
// it prints stays on a live row together with the time it has been the latest
// line; a Python command additionally gets a second row showing the code it is
// executing, sampled through sitecustomize.py from a scratch directory.
//

#include <proflog/proflog.h>

#include <chrono>
#include <cstdio>
#include <string>
#include <vector>


using namespace proflog;


namespace {

int run(const std::vector<std::string>& command)
{
    Scratch_workspace workspace = Scratch_workspace::create();

    Launch_request request;
    request.argv = command;
    request.environment = child_environment(workspace.path(), current_environment());
    request.stdio.stdin_mode   = Stdio::inherit;
    request.stdio.stdout_mode  = Stdio::pipe;
    request.stdio.merge_stderr = true;

    const auto start = std::chrono::steady_clock::now();

    Process_handle child;
    try {
        child = launch(request);
    }
    catch (const launch_error& e) {
        ls_error() << e.what();
        return exit_code_for(e);
    }

    Renderer renderer;
    Sample_correlator correlator(
        child.pid(),
        Sample_correlator::sample_path_for(workspace.path(), child.pid()));

    Log_multiplexer multiplexer(renderer, &correlator);
    multiplexer.set_stdout_stream(Stream_id::merged);

    const Exit_status status = multiplexer.run(child);

    const auto total = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    renderer.write_summary(total, status);

    ls_debug() << multiplexer.records() << " records, "
               << correlator.signals_sent() << " sample requests";

    // A failed cleanup is reported, but does not change the exit code.
    workspace.remove();
    return status.exit_code();
}

} // namespace


int main(int argc, char* argv[])
{
    if (argc < 2) {
        std::fprintf(stderr, "Usage: proflog <command> [args]...\n");
        return exit_code_usage;
    }

    try {
        return run(std::vector<std::string>(argv + 1, argv + argc));
    }
    catch (const workspace_error& e) {
        ls_error() << e.what();
        return exit_code_launch_failure;
    }
}
