#include "test_utils.h"

#include <chrono>
#include <cstdio>
#include <string>

#include <unistd.h>

namespace {

constexpr std::string_view k_failure_prefix = "renderer_test: ";

using proflog::test::contains;
using proflog::test::require_true;
using std::chrono::milliseconds;

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

void test_format_elapsed()
{
    require_true(proflog::format_elapsed(milliseconds(0)) == "00:00.000", k_failure_prefix, "zero");
    require_true(proflog::format_elapsed(milliseconds(1234)) == "00:01.234", k_failure_prefix, "seconds");
    require_true(proflog::format_elapsed(milliseconds(61005)) == "01:01.005", k_failure_prefix, "minutes");
    require_true(proflog::format_elapsed(milliseconds(100 * 60 * 1000)) == "100:00.000", k_failure_prefix,
                 "minutes are not wrapped");
    require_true(proflog::format_elapsed(milliseconds(-5)) == "00:00.000", k_failure_prefix,
                 "negative durations clamp to zero");
}

void test_format_binary_size()
{
    require_true(proflog::format_binary_size(512) == "512B", k_failure_prefix, "bytes");
    require_true(proflog::format_binary_size(1536) == "1.5KiB", k_failure_prefix, "kibibytes");
    require_true(proflog::format_binary_size(12ull * 1024 * 1024) == "12.0MiB", k_failure_prefix, "mebibytes");
    require_true(proflog::format_binary_size(3ull * 1024 * 1024 * 1024) == "3.0GiB", k_failure_prefix, "gibibytes");
}

void test_display_truncate()
{
    require_true(proflog::display_truncate("short", 10) == "short", k_failure_prefix,
                 "fitting text is unchanged");
    require_true(proflog::display_truncate("abcdef", 6) == "abcdef", k_failure_prefix,
                 "exactly fitting text is unchanged");
    require_true(proflog::display_truncate("abcdef", 3) == "ab\xe2\x80\xa6", k_failure_prefix,
                 "cut text ends with an ellipsis within the limit");
    require_true(proflog::display_truncate("\xc3\xa9\xc3\xa9\xc3\xa9", 2) == "\xc3\xa9\xe2\x80\xa6", k_failure_prefix,
                 "multi-byte characters count as one column and are never split");
    require_true(proflog::display_truncate("\x1b[0;34mabc\x1b[0m", 3) == "\x1b[0;34mabc\x1b[0m", k_failure_prefix,
                 "escape sequences take no columns");
    require_true(proflog::display_truncate("\x1b[0;34mabcdef\x1b[0m", 3) == "\x1b[0;34mab\xe2\x80\xa6", k_failure_prefix,
                 "escape sequences before the cut are kept");
    require_true(proflog::display_truncate("anything", 0).empty(), k_failure_prefix,
                 "no columns, no text");
}

void test_terminal_columns_fallback()
{
    int fds[2];
    require_true(::pipe(fds) == 0, k_failure_prefix, "pipe() failed");
    const int columns = proflog::terminal_columns(fds[1]);
    ::close(fds[0]);
    ::close(fds[1]);
    require_true(columns == proflog::fallback_terminal_columns, k_failure_prefix,
                 "a pipe is not a terminal");
}

void test_live_render_overwrites_in_place()
{
    Capture out;
    proflog::Renderer renderer(out.file, false, [] { return 80; });

    renderer.render_live(milliseconds(0), "hello", std::nullopt);
    require_true(out.text() == "00:00.000" + bar + "hello", k_failure_prefix,
                 "first render draws one row without moving the cursor");
    require_true(renderer.live_rows() == 1, k_failure_prefix, "one row is live");

    renderer.render_live(milliseconds(42), "hello", std::nullopt);
    require_true(out.text() == "00:00.000" + bar + "hello" + "\r\x1b[J" + "00:00.042" + bar + "hello",
                 k_failure_prefix, "a redraw erases the live row first");

    renderer.finalize();
    const std::string finalized = out.text();
    require_true(finalized.size() > 1 && finalized.back() == '\n', k_failure_prefix,
                 "finalize ends the row");
    require_true(renderer.live_rows() == 0, k_failure_prefix, "nothing is live after finalize");

    renderer.finalize();
    require_true(out.text() == finalized, k_failure_prefix, "a second finalize draws nothing");
}

void test_sample_row()
{
    Capture out;
    proflog::Renderer renderer(out.file, false, [] { return 80; });

    renderer.render_live(milliseconds(5), "working", std::string("compute() <- main()"));
    require_true(renderer.live_rows() == 2, k_failure_prefix, "a held sample adds a row");
    require_true(out.text() == "00:00.005" + bar + "working\nexecuting" + bar + "compute() <- main()",
                 k_failure_prefix, "the sample row follows the record row");

    renderer.render_live(milliseconds(6), "working", std::nullopt);
    require_true(contains(out.text(), "\r\x1b[A\x1b[J00:00.006"), k_failure_prefix,
                 "erasing two rows moves up once");
    require_true(renderer.live_rows() == 1, k_failure_prefix, "without a sample one row is live");

    renderer.render_live(milliseconds(7), "working", std::string("again"));
    renderer.finalize();
    const std::string text = out.text();
    const std::string tail = "\r\x1b[A\x1b[J00:00.007" + bar + "working\n";
    require_true(text.size() >= tail.size() && text.compare(text.size() - tail.size(), tail.size(), tail) == 0,
                 k_failure_prefix, "finalize drops the sample row and keeps the record");
}

void test_long_lines_are_truncated()
{
    Capture out;
    proflog::Renderer renderer(out.file, false, [] { return 20; });

    renderer.render_live(milliseconds(0), "0123456789abcdef", std::nullopt);
    const std::string expected_text = "0123\xe2\x80\xa6";
    require_true(out.text() == "00:00.000" + bar + expected_text, k_failure_prefix,
                 "lines are cut to the width left after the prefix");
}

void test_color()
{
    Capture out;
    proflog::Renderer renderer(out.file, true, [] { return 80; });
    renderer.render_live(milliseconds(0), "x", std::string("y"));
    const std::string text = out.text();
    require_true(contains(text, "\x1b[0;34m00:00.000\x1b[0m"), k_failure_prefix, "timestamps are blue");
    require_true(contains(text, "\x1b[0;34mexecuting\x1b[0m"), k_failure_prefix, "the label is blue");
}

void test_summary()
{
    {
        Capture out;
        proflog::Renderer renderer(out.file, false, [] { return 80; });
        renderer.render_live(milliseconds(0), "last", std::nullopt);

        proflog::Exit_status status;
        status.how = proflog::Exit_status::kind::exited;
        status.code = 0;
        status.max_rss_kib = 2048;
        renderer.write_summary(milliseconds(1500), status);

        const std::string text = out.text();
        require_true(contains(text, "last\nTotal execution time 00:01.500\n"), k_failure_prefix,
                     "the summary starts below the finalized record");
        require_true(contains(text, "Terminated with code 0 (OK)\n"), k_failure_prefix, "exit line");
        require_true(contains(text, "Resource usage summary:\n    Memory: 2.0MiB\n"), k_failure_prefix,
                     "memory line");
    }
    {
        Capture out;
        proflog::Renderer renderer(out.file, false, [] { return 80; });
        proflog::Exit_status status;
        status.how = proflog::Exit_status::kind::exited;
        status.code = 4;
        renderer.write_summary(milliseconds(0), status);
        require_true(contains(out.text(), "Terminated with code 4 (NOK)\n"), k_failure_prefix, "failed exit");
    }
    {
        Capture out;
        proflog::Renderer renderer(out.file, false, [] { return 80; });
        proflog::Exit_status status;
        status.how = proflog::Exit_status::kind::signaled;
        status.code = 9;
        renderer.write_summary(milliseconds(0), status);
        const std::string text = out.text();
        require_true(contains(text, "Terminated by signal 9\n"), k_failure_prefix, "signal line");
        require_true(!contains(text, "Memory"), k_failure_prefix, "no memory line for signals");
        require_true(status.exit_code() == 137, k_failure_prefix, "signal exit code");
    }
    {
        proflog::Exit_status stopped;
        stopped.how = proflog::Exit_status::kind::stopped;
        stopped.code = 19;
        proflog::Exit_status unknown;
        require_true(stopped.exit_code() == proflog::exit_code_stopped, k_failure_prefix, "stopped exit code");
        require_true(unknown.exit_code() == proflog::exit_code_unexpected_wait, k_failure_prefix,
                     "unexpected wait exit code");
    }
}

} // namespace

int main()
{
    test_format_elapsed();
    test_format_binary_size();
    test_display_truncate();
    test_terminal_columns_fallback();
    test_live_render_overwrites_in_place();
    test_sample_row();
    test_long_lines_are_truncated();
    test_color();
    test_summary();
    return 0;
}
