#include "test_utils.h"

#include <chrono>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <signal.h>

namespace {

constexpr std::string_view k_failure_prefix = "log_multiplexer_test: ";

using proflog::test::contains;
using proflog::test::require_true;

const std::string bar = " \xe2\x94\x82 ";

struct Capture
{
    Capture() : file(std::tmpfile())
    {
        require_true(file != nullptr, k_failure_prefix, "tmpfile() failed");
    }
    ~Capture() { std::fclose(file); }

    std::string text() { return proflog::test::file_contents(file); }

    FILE* file;
};

struct Observed
{
    std::string text;
    proflog::Stream_id stream;
};

struct Run_result
{
    proflog::Exit_status status;
    std::vector<Observed> records;
    std::string output;
};

Run_result run_script(const std::string& script, proflog::Stdio_dispositions stdio,
                      proflog::Stream_id stdout_id = proflog::Stream_id::stdout_stream)
{
    auto request = proflog::test::shell_request(script);
    request.stdio = stdio;

    Capture out;
    proflog::Renderer renderer(out.file, false, [] { return 80; });
    proflog::Log_multiplexer multiplexer(renderer);
    multiplexer.set_stdout_stream(stdout_id);

    Run_result result;
    multiplexer.set_record_observer([&](const proflog::Line_record& record) {
        result.records.push_back({record.text, record.stream});
    });

    auto child = proflog::launch(request);
    result.status = multiplexer.run(child);
    result.output = out.text();
    require_true(multiplexer.records() == result.records.size(), k_failure_prefix,
                 "the observer sees every record");
    return result;
}

proflog::Stdio_dispositions stdout_only()
{
    proflog::Stdio_dispositions stdio;
    stdio.stdout_mode = proflog::Stdio::pipe;
    return stdio;
}

void test_single_line()
{
    auto result = run_script("echo hello", stdout_only());
    require_true(result.status.exit_code() == 0, k_failure_prefix, "echo exits 0");
    require_true(result.records.size() == 1 && result.records[0].text == "hello", k_failure_prefix,
                 "one line makes one record");
    require_true(contains(result.output, "00:00.0"), k_failure_prefix, "the record shows its age");
    require_true(contains(result.output, bar + "hello\n"), k_failure_prefix,
                 "the last record is left on its own finished row");
}

void test_unterminated_tail_is_a_record()
{
    auto result = run_script("printf 'a\\nb\\nc'", stdout_only());
    require_true(result.records.size() == 3, k_failure_prefix, "three records");
    require_true(result.records[0].text == "a" && result.records[1].text == "b" &&
                 result.records[2].text == "c", k_failure_prefix, "records keep their order");

    const auto a = result.output.find(bar + "a\n");
    const auto b = result.output.find(bar + "b\n");
    const auto c = result.output.find(bar + "c\n");
    require_true(a != std::string::npos && b != std::string::npos && c != std::string::npos,
                 k_failure_prefix, "every record ends up on a finished row");
    require_true(a < b && b < c, k_failure_prefix, "rows are finished in arrival order");
}

void test_separate_streams_are_labelled()
{
    proflog::Stdio_dispositions stdio;
    stdio.stdout_mode = proflog::Stdio::pipe;
    stdio.stderr_mode = proflog::Stdio::pipe;

    auto result = run_script("echo out; echo err >&2", stdio);
    require_true(result.records.size() == 2, k_failure_prefix, "one record per stream");

    bool saw_out = false;
    bool saw_err = false;
    for (const auto& r : result.records) {
        saw_out |= r.text == "out" && r.stream == proflog::Stream_id::stdout_stream;
        saw_err |= r.text == "err" && r.stream == proflog::Stream_id::stderr_stream;
    }
    require_true(saw_out && saw_err, k_failure_prefix, "records carry the stream they came from");
}

void test_merged_stream()
{
    proflog::Stdio_dispositions stdio;
    stdio.stdout_mode = proflog::Stdio::pipe;
    stdio.merge_stderr = true;

    auto result = run_script("echo one; echo two >&2; echo three", stdio, proflog::Stream_id::merged);
    require_true(result.records.size() == 3, k_failure_prefix, "merged lines are all records");
    require_true(result.records[0].text == "one" && result.records[1].text == "two" &&
                 result.records[2].text == "three", k_failure_prefix,
                 "a merged pipe keeps the order the child wrote in");
    for (const auto& r : result.records) {
        require_true(r.stream == proflog::Stream_id::merged, k_failure_prefix, "merged records are labelled");
    }
}

void test_progress_records_are_not_drawn()
{
    proflog::Stdio_dispositions stdio = stdout_only();
    stdio.progress_channel = true;

    auto result = run_script("echo 'step 1' >&3; echo visible", stdio);

    bool saw_progress = false;
    for (const auto& r : result.records) {
        saw_progress |= r.text == "step 1" && r.stream == proflog::Stream_id::progress;
    }
    require_true(saw_progress, k_failure_prefix, "progress lines reach the observer");
    require_true(!contains(result.output, "step 1"), k_failure_prefix, "progress lines are not drawn");
    require_true(contains(result.output, bar + "visible\n"), k_failure_prefix, "output lines are drawn");
}

void test_killed_child()
{
    auto result = run_script("echo before; kill -9 $$", stdout_only());
    require_true(result.status.how == proflog::Exit_status::kind::signaled, k_failure_prefix,
                 "the child was killed");
    require_true(result.status.exit_code() == 128 + SIGKILL, k_failure_prefix, "a kill maps to 128+signal");
    require_true(contains(result.output, bar + "before\n"), k_failure_prefix,
                 "output before the kill is kept");
}

void test_exit_code_passthrough()
{
    auto result = run_script("echo x; exit 7", stdout_only());
    require_true(result.status.exit_code() == 7, k_failure_prefix, "the child's exit code passes through");
}

void test_silent_child()
{
    auto result = run_script("true", stdout_only());
    require_true(result.records.empty(), k_failure_prefix, "no output, no records");
    require_true(result.output.empty(), k_failure_prefix, "nothing is drawn without a record");
    require_true(result.status.exit_code() == 0, k_failure_prefix, "the child is still reaped");
}

int g_sample_signals = 0;

int counting_kill(pid_t, int sig)
{
    if (sig == SIGUSR1) {
        ++g_sample_signals;
    }
    return 0;
}

void test_sample_row_is_shown()
{
    proflog::test::Scratch_directory dir("multiplexer_sample");
    proflog::test::Override_guard guard(&counting_kill);
    g_sample_signals = 0;

    auto request = proflog::test::shell_request("echo start; sleep 0.5; echo done");
    request.stdio = stdout_only();
    auto child = proflog::launch(request);

    const std::string path = proflog::Sample_correlator::sample_path_for(dir.string(), child.pid());
    proflog::test::write_file(path, "frame1\nframe2");

    Capture out;
    proflog::Renderer renderer(out.file, false, [] { return 80; });
    proflog::Sample_correlator correlator(child.pid(), path, std::chrono::milliseconds(10));
    proflog::Log_multiplexer multiplexer(renderer, &correlator);

    const auto status = multiplexer.run(child);
    const std::string text = out.text();

    require_true(status.exit_code() == 0, k_failure_prefix, "the child finishes normally");
    require_true(g_sample_signals > 0, k_failure_prefix, "the child is asked for samples while it runs");
    require_true(contains(text, "executing" + bar + "frame1"), k_failure_prefix,
                 "the last complete sample is drawn below the record");
    require_true(!contains(text, "frame2"), k_failure_prefix, "the record being written is never drawn");
    require_true(text.size() > 5 && text.compare(text.size() - 5, 5, "done\n") == 0, k_failure_prefix,
                 "closing leaves only the last record behind");
}

} // namespace

int main()
{
    test_single_line();
    test_unterminated_tail_is_a_record();
    test_separate_streams_are_labelled();
    test_merged_stream();
    test_progress_records_are_not_drawn();
    test_killed_child();
    test_exit_code_passthrough();
    test_silent_child();
    test_sample_row_is_shown();
    return 0;
}
