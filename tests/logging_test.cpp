//
// proflog::Log_stream Test
//
// Validates the message stream every diagnostic goes through:
// - Moved-from streams stay silent and moved-to streams emit once
// - Move assignment replaces the destination's content
// - Postfix survives a move
// - The ls_* factories prefix and terminate every line
// - Disabled streams emit nothing
// - The default sink can be restored
// - Sinks that may throw are rejected at compile time
//

#include <proflog/detail/logging.h>

#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace {

struct Captured
{
    proflog::log_level level;
    std::string message;
};

using throwing_sink = void(*)(proflog::log_level, const char*, void*);
static_assert(!std::is_convertible<throwing_sink, proflog::log_callback_fn>::value,
              "a sink called from a noexcept destructor must itself be noexcept");

std::mutex g_log_mutex;
std::vector<Captured> g_captured_logs;

void test_log_callback(proflog::log_level level, const char* message, void* user_data) noexcept
{
    if (message) {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        g_captured_logs.push_back({level, message});
    }
    if (user_data) {
        ++*static_cast<int*>(user_data);
    }
}

void reset_captured_logs()
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_captured_logs.clear();
}

int count_logs_containing(const std::string& substr)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    int count = 0;
    for (const auto& log : g_captured_logs) {
        if (log.message.find(substr) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

const Captured* last_log()
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_captured_logs.empty() ? nullptr : &g_captured_logs.back();
}

int test_move_constructor()
{
    reset_captured_logs();

    {
        proflog::Log_stream source(proflog::log_level::info);
        source << "child_exited";

        proflog::Log_stream destination(std::move(source));
        destination << "_with_code_" << 3;
        source << "_ignored";
    }

    if (count_logs_containing("child_exited_with_code_3") != 1) {
        std::fprintf(stderr, "Move constructor: expected exactly one combined message\n");
        return 1;
    }
    if (count_logs_containing("_ignored") != 0) {
        std::fprintf(stderr, "Move constructor: moved-from stream must not output\n");
        return 1;
    }
    return 0;
}

int test_move_assignment()
{
    reset_captured_logs();

    {
        proflog::Log_stream active(proflog::log_level::warning);
        active << "will_be_replaced";

        proflog::Log_stream source(proflog::log_level::error);
        source << "replacement";

        active = std::move(source);
        active << "_content";
    }

    if (count_logs_containing("replacement_content") != 1) {
        std::fprintf(stderr, "Move assignment: expected replacement_content once\n");
        return 1;
    }
    if (count_logs_containing("will_be_replaced") != 0) {
        std::fprintf(stderr, "Move assignment: replaced content must not be logged\n");
        return 1;
    }
    const Captured* log = last_log();
    if (!log || log->level != proflog::log_level::error) {
        std::fprintf(stderr, "Move assignment: the level must move with the content\n");
        return 1;
    }
    return 0;
}

int test_postfix_preserved()
{
    reset_captured_logs();

    {
        proflog::Log_stream source(proflog::log_level::info, true, "_postfix");
        source << "postfix_test";
        proflog::Log_stream destination(std::move(source));
    }

    if (count_logs_containing("postfix_test_postfix") != 1) {
        std::fprintf(stderr, "Postfix should be preserved after move\n");
        return 1;
    }
    return 0;
}

int test_factories_prefix_and_terminate()
{
    reset_captured_logs();

    proflog::ls_info() << "info line";
    proflog::ls_warning() << "warning line";
    proflog::ls_error() << "error line";

    const char* expected[] = {
        "proflog: info line\n",
        "proflog: warning: warning line\n",
        "proflog: error: error line\n"};
    const proflog::log_level levels[] = {
        proflog::log_level::info,
        proflog::log_level::warning,
        proflog::log_level::error};

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_captured_logs.size() != 3) {
        std::fprintf(stderr, "Factories: expected 3 messages, got %zu\n", g_captured_logs.size());
        return 1;
    }
    for (size_t i = 0; i < 3; ++i) {
        if (g_captured_logs[i].message != expected[i] || g_captured_logs[i].level != levels[i]) {
            std::fprintf(stderr, "Factories: unexpected message '%s'\n", g_captured_logs[i].message.c_str());
            return 1;
        }
    }
    return 0;
}

int test_debug_follows_trace_flag()
{
    reset_captured_logs();

    proflog::ls_debug() << "trace_only";

    const int expected = proflog::trace_enabled() ? 1 : 0;
    if (count_logs_containing("proflog: trace: trace_only") != expected) {
        std::fprintf(stderr, "Debug messages must follow PROFLOG_TRACE\n");
        return 1;
    }
    return 0;
}

int test_disabled_stream_no_output()
{
    reset_captured_logs();

    {
        proflog::Log_stream stream(proflog::log_level::info, false, "\n");
        stream << "disabled_stream_test";
    }

    if (count_logs_containing("disabled_stream_test") != 0) {
        std::fprintf(stderr, "Disabled stream: message should not have been logged\n");
        return 1;
    }
    return 0;
}

int test_user_data_and_restore()
{
    int calls = 0;
    proflog::set_log_callback(test_log_callback, &calls);
    proflog::ls_info() << "counted";

    void* user_data = nullptr;
    if (proflog::get_log_callback(&user_data) != &test_log_callback || user_data != &calls || calls != 1) {
        std::fprintf(stderr, "User data must be passed to the callback\n");
        return 1;
    }

    proflog::set_log_callback(nullptr);
    if (proflog::get_log_callback(&user_data) != &proflog::detail::default_log_callback || user_data) {
        std::fprintf(stderr, "nullptr must restore the default sink\n");
        return 1;
    }

    proflog::set_log_callback(test_log_callback);
    return 0;
}

} // namespace

int main()
{
    proflog::set_log_callback(test_log_callback);

    struct Named_test
    {
        const char* name;
        int (*fn)();
    };

    const Named_test tests[] = {
        {"test_move_constructor", &test_move_constructor},
        {"test_move_assignment", &test_move_assignment},
        {"test_postfix_preserved", &test_postfix_preserved},
        {"test_factories_prefix_and_terminate", &test_factories_prefix_and_terminate},
        {"test_debug_follows_trace_flag", &test_debug_follows_trace_flag},
        {"test_disabled_stream_no_output", &test_disabled_stream_no_output},
        {"test_user_data_and_restore", &test_user_data_and_restore},
    };

    for (const auto& test : tests) {
        if (test.fn() != 0) {
            std::fprintf(stderr, "%s failed\n", test.name);
            return 1;
        }
        std::fprintf(stderr, "%s passed\n", test.name);
    }

    proflog::set_log_callback(nullptr);
    std::fprintf(stderr, "All Log_stream tests passed\n");
    return 0;
}
