#include "marquee/core/error_codes.hpp"
#include "marquee/core/view.hpp"
#include "marquee/core/view_stream.hpp"
#include "marquee/format/text_width.hpp"
#include "marquee/models/models.hpp"
#include "virtual_screen.hpp"

#include <chrono>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace marquee;
using namespace std::chrono_literals;
using core::Clock;
using core::Destination;
using core::Options;
using core::View;
using core::ViewError;
using core::ViewErrorCode;
using core::ViewState;

static int g_pass = 0;
static int g_fail = 0;

template <class T>
static void check_eq(const char* label, T got, T expected) {
    if (got == expected) {
        ++g_pass;
    } else {
        std::fprintf(stderr, "FAIL %s\n", label);
        ++g_fail;
    }
}

static void check_bytes(const char* label, const std::string& got, const std::string& expected) {
    if (got == expected) {
        ++g_pass;
    } else {
        std::fprintf(stderr, "FAIL %s\n  got:      %s\n  expected: %s\n", label,
                     format::showControlCharacters(got).c_str(),
                     format::showControlCharacters(expected).c_str());
        ++g_fail;
    }
}

static bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static const std::string ERASE_ONE = "\r\x1b[1A\x1b[0K";
static const Clock::time_point T0 = Clock::time_point() + 1000s;

struct TaskModel : core::Model {
    int n = 0;
    
    std::string render(size_t) override {
        return "task " + std::to_string(n);
    }
    
    std::string finalMessage() override {
        return "finished " + std::to_string(n);
    }
};

// Records the width it was last rendered at and always draws ten columns.
struct WidthModel : core::Model {
    size_t seen = 0;
    
    std::string render(size_t width) override {
        seen = width;
        return "0123456789";
    }
};

using Counter = models::BasicModel<int>;
using Text = models::BasicModel<std::string>;

static Counter counterModel() {
    return Counter(0, [](const int& n) { return std::to_string(n) + "/10"; });
}

static Text textModel(const std::string& initial = "") {
    return Text(initial, [](const std::string& s) { return s; });
}

static Options captureOptions() {
    return Options().withDestination(Destination::CAPTURE)
                    .withUpdateInterval(0ms)
                    .withPrintHoldoff(0ms);
}

static Options fakeClockOptions(std::chrono::milliseconds interval, std::chrono::milliseconds holdoff) {
    return Options().withDestination(Destination::CAPTURE)
                    .withUpdateInterval(interval)
                    .withPrintHoldoff(holdoff)
                    .withFakeClock(true);
}

static void setText(View<Text>& view, const std::string& text) {
    view.update([&](Text& model) { model.value() = text; });
}

// Writer with a caller-controlled width and interactivity.
class ScriptedWriter : public core::TerminalWriter {
public:
    ScriptedWriter(std::shared_ptr<core::CaptureBuffer> buffer,
                   std::shared_ptr<std::optional<size_t>> width,
                   bool interactive)
        : buffer_(std::move(buffer)),
          width_(std::move(width)),
          interactive_(interactive) {}
    
    bool write(const std::string& bytes) override {
        buffer_->append(bytes);
        return true;
    }
    bool flush() override { return true; }
    std::optional<size_t> width() const override { return *width_; }
    bool isInteractive() const override { return interactive_; }

private:
    std::shared_ptr<core::CaptureBuffer> buffer_;
    std::shared_ptr<std::optional<size_t>> width_;
    bool interactive_;
};

class BrokenWriter : public core::TerminalWriter {
public:
    explicit BrokenWriter(bool fail_write) : fail_write_(fail_write) {}
    
    bool write(const std::string&) override { return !fail_write_; }
    bool flush() override { return fail_write_; }
    std::optional<size_t> width() const override { return 80; }
    bool isInteractive() const override { return true; }

private:
    bool fail_write_;
};

struct FatalCalled {
    ViewErrorCode code;
};

// ----- painting -----

static void test_counter_scenario() {
    View<Counter> view(counterModel(), captureOptions());
    auto buffer = view.capturedOutput();
    
    std::string expected;
    for (int i = 1; i <= 10; ++i) {
        view.update([i](Counter& model) { model.value() = i; });
        if (i == 1) {
            expected += "\x1b[0K1/10\n";
        } else {
            expected += ERASE_ONE + std::to_string(i) + "/10\n";
        }
    }
    check_bytes("counter_bytes", buffer->contents(), expected);
    
    VirtualScreen screen;
    screen.feed(buffer->contents());
    check_eq("counter_visible", screen.lines(), std::vector<std::string>{"10/10"});
    check_eq("counter_state", view.state(), ViewState::PAINTED);
    
    view.finish();
    check_bytes("counter_finish", buffer->contents(), expected + ERASE_ONE);
    
    VirtualScreen after;
    after.feed(buffer->contents());
    check_eq("counter_erased", after.lines().empty(), true);
    check_eq("counter_paints", view.stats().paints, uint64_t(10));
    check_eq("counter_erases", view.stats().erases, uint64_t(1));
}

static void test_identical_renders_suppressed() {
    View<Counter> view(Counter(0, [](const int& n) { return "hundreds=" + std::to_string(n / 100); }),
                       captureOptions());
    for (int i = 0; i < 200; ++i) {
        view.update([i](Counter& model) { model.value() = i; });
    }
    check_bytes("identical_bytes", view.capturedOutput()->contents(),
                "\x1b[0Khundreds=0\n\r\x1b[1A\x1b[0Khundreds=1\n");
    auto stats = view.stats();
    check_eq("identical_updates", stats.updates, uint64_t(200));
    check_eq("identical_paints", stats.paints, uint64_t(2));
    check_eq("identical_suppressed", stats.identical_suppressed, uint64_t(198));
}

static void test_update_returns_value() {
    View<Counter> view(counterModel(), captureOptions());
    int result = view.update([](Counter& model) { return ++model.value() * 10; });
    check_eq("update_result", result, 10);
    int seen = view.inspectModel([](const Counter& model) { return model.value(); });
    check_eq("inspect_model", seen, 1);
}

static void test_multiline_model() {
    View<Text> view(textModel(), captureOptions());
    setText(view, "first\nsecond\n");
    check_bytes("multiline_trailing_newline", view.capturedOutput()->contents(),
                "\x1b[0Kfirst\n\x1b[0Ksecond\n");
    
    setText(view, "one");
    VirtualScreen screen;
    screen.feed(view.capturedOutput()->contents());
    check_eq("multiline_shrunk", screen.lines(), std::vector<std::string>{"one"});
}

static void test_carriage_returns_stripped() {
    View<Text> view(textModel(), captureOptions());
    setText(view, "ab\rcd");
    check_bytes("strip_cr", view.capturedOutput()->contents(), "\x1b[0Kabcd\n");
    
    bool sanitized = false;
    auto lines = core::splitRenderedLines("x\r\ny\n\n", &sanitized);
    check_eq("split_lines", lines, std::vector<std::string>{"x", "y", ""});
    check_eq("split_sanitized", sanitized, true);
}

static void test_control_characters_sanitized() {
    bool sanitized = true;
    auto tabbed = core::splitRenderedLines("a\tb\n\x1b[1mc\x1b[0m", &sanitized);
    check_eq("split_tab_expanded", tabbed, (std::vector<std::string>{"a       b", "\x1b[1mc\x1b[0m"}));
    check_eq("split_tab_not_flagged", sanitized, false);
    
    auto breaks = core::splitRenderedLines("a\vb\fc\x07" "d\x7f", &sanitized);
    check_eq("split_controls_removed", breaks, std::vector<std::string>{"abcd"});
    check_eq("split_controls_flagged", sanitized, true);
    
    View<Text> view(textModel(), captureOptions());
    setText(view, "a\vb\fc");
    check_bytes("vt_ff_stripped", view.capturedOutput()->contents(), "\x1b[0Kabc\n");
}

static void test_tabs_never_wrap() {
    auto buffer = std::make_shared<core::CaptureBuffer>();
    auto width = std::make_shared<std::optional<size_t>>(10);
    View<Text> view(textModel(), captureOptions(),
                    std::make_unique<ScriptedWriter>(buffer, width, true));
    setText(view, "\t\t\tab");
    check_bytes("tabs_cut_to_width", buffer->contents(), "\x1b[0K" + std::string(10, ' ') + "\n");
    
    VirtualScreen screen;
    screen.feed(buffer->contents());
    view.finish();
    check_eq("tabs_one_row", screen.cursorRow(), size_t(1));
}

static void test_empty_render_erases() {
    View<Text> view(textModel("shown"), captureOptions());
    view.update([](Text&) {});
    setText(view, "");
    check_bytes("empty_render", view.capturedOutput()->contents(), "\x1b[0Kshown\n" + ERASE_ONE);
    check_eq("empty_render_state", view.state(), ViewState::IDLE);
}

// ----- text interleaving -----

static void test_text_interleaving() {
    View<Text> view(textModel(), captureOptions());
    auto buffer = view.capturedOutput();
    
    setText(view, "A");
    check_eq("interleave_painted", view.state(), ViewState::PAINTED);
    view.message("B\n");
    check_eq("interleave_idle", view.state(), ViewState::IDLE);
    setText(view, "C");
    
    check_bytes("interleave_bytes", buffer->contents(),
                "\x1b[0KA\n" + ERASE_ONE + "B\n" + "\x1b[0KC\n");
    
    VirtualScreen screen;
    screen.feed(buffer->contents());
    check_eq("interleave_screen", screen.lines(), (std::vector<std::string>{"B", "C"}));
}

static void test_print_holdoff() {
    View<Text> view(textModel(), fakeClockOptions(0ms, 100ms));
    auto buffer = view.capturedOutput();
    
    view.setFakeClock(T0);
    setText(view, "A");
    view.message("log\n");
    
    view.setFakeClock(T0 + 50ms);
    setText(view, "B");
    check_eq("holdoff_not_painted", view.state(), ViewState::IDLE);
    check_eq("holdoff_rate_limited", view.stats().rate_limited, uint64_t(1));
    
    view.setFakeClock(T0 + 150ms);
    setText(view, "C");
    check_eq("holdoff_painted", view.state(), ViewState::PAINTED);
    
    VirtualScreen screen;
    screen.feed(buffer->contents());
    check_eq("holdoff_screen", screen.lines(), (std::vector<std::string>{"log", "C"}));
}

static void test_incomplete_line_blocks_paint() {
    View<Text> view(textModel(), captureOptions());
    auto buffer = view.capturedOutput();
    
    setText(view, "p1");
    view.message("partial");
    std::string after_partial = buffer->contents();
    check_bytes("incomplete_erased", after_partial, "\x1b[0Kp1\n" + ERASE_ONE + "partial");
    
    setText(view, "p2");
    view.suspend();
    view.resume();
    check_bytes("incomplete_blocked", buffer->contents(), after_partial);
    
    view.message(" done\n");
    setText(view, "p3");
    VirtualScreen screen;
    screen.feed(buffer->contents());
    check_eq("incomplete_screen", screen.lines(), (std::vector<std::string>{"partial done", "p3"}));
}

static void test_write_and_messagef() {
    View<Text> view(textModel(), captureOptions().withEnabled(false));
    const char raw[] = "raw bytes\n";
    view.write(raw, sizeof(raw) - 1);
    view.write(raw, 0);
    view.messagef("{} of {}\n", 3, 7);
    check_bytes("write_messagef", view.capturedOutput()->contents(), "raw bytes\n3 of 7\n");
    check_eq("write_count", view.stats().text_writes, uint64_t(2));
}

static void test_view_stream() {
    View<TaskModel> view(TaskModel(), captureOptions());
    auto buffer = view.capturedOutput();
    view.update([](TaskModel& model) { model.n = 1; });
    {
        core::ViewStream<TaskModel> out(view);
        out << "hello " << 42 << "\n";
        check_bytes("stream_line", buffer->contents(), "\x1b[0Ktask 1\n" + ERASE_ONE + "hello 42\n");
        out << "tail";
        check_eq("stream_buffered", endsWith(buffer->contents(), "tail"), false);
    }
    check_eq("stream_flushed_on_close", endsWith(buffer->contents(), "hello 42\ntail"), true);
}

// ----- rate limiting -----

static void test_burst_rate_limited() {
    View<Counter> view(counterModel(), fakeClockOptions(100ms, 100ms));
    for (int i = 1; i <= 10; ++i) {
        view.setFakeClock(T0 + std::chrono::milliseconds(i * 5));
        view.update([i](Counter& model) { model.value() = i; });
    }
    check_eq("burst_paints", view.stats().paints <= 2, true);
    check_eq("burst_limited", view.stats().rate_limited, uint64_t(9));
}

static void test_spaced_updates_paint() {
    View<Counter> view(counterModel(), fakeClockOptions(100ms, 100ms));
    for (int i = 1; i <= 10; ++i) {
        view.setFakeClock(T0 + std::chrono::milliseconds(i * 150));
        view.update([i](Counter& model) { model.value() = i; });
    }
    check_eq("spaced_paints", view.stats().paints, uint64_t(10));
}

static void test_fake_clock_requires_option() {
    View<Counter> view(counterModel(), captureOptions());
    try {
        view.setFakeClock(T0);
        check_eq("fake_clock_throws", false, true);
    } catch (const ViewError& e) {
        check_eq("fake_clock_code", e.code(), ViewErrorCode::FAKE_CLOCK_DISABLED);
    }
}

// ----- suspend and resume -----

static void test_suspend_then_update() {
    View<Counter> view(Counter(0, [](const int& n) { return std::to_string(n); }),
                       fakeClockOptions(3600000ms, 0ms));
    auto buffer = view.capturedOutput();
    view.setFakeClock(T0);
    
    view.update([](Counter& model) { model.value() = 1; });
    view.update([](Counter& model) { model.value() = 2; });
    check_eq("suspend_limited", view.stats().paints, uint64_t(1));
    
    view.suspend();
    check_eq("suspend_state", view.state(), ViewState::SUSPENDED);
    view.message("while hidden\n");
    check_eq("suspend_stays", view.state(), ViewState::SUSPENDED);
    
    view.update([](Counter& model) { model.value() = 3; });
    check_eq("suspend_one_paint", view.stats().paints, uint64_t(2));
    check_eq("suspend_painted", view.state(), ViewState::PAINTED);
    check_bytes("suspend_bytes", buffer->contents(),
                "\x1b[0K1\n" + ERASE_ONE + "while hidden\n" + "\x1b[0K3\n");
}

static void test_hide_and_resume() {
    View<TaskModel> view(TaskModel(), fakeClockOptions(3600000ms, 0ms));
    view.setFakeClock(T0);
    view.update([](TaskModel& model) { model.n = 1; });
    
    view.resume();
    check_eq("resume_noop_when_shown", view.stats().paints, uint64_t(1));
    
    view.hide();
    check_eq("hide_state", view.state(), ViewState::SUSPENDED);
    view.resume();
    check_eq("resume_paints", view.stats().paints, uint64_t(2));
    check_eq("resume_state", view.state(), ViewState::PAINTED);
}

// ----- width -----

static void test_width_change_repaints() {
    auto buffer = std::make_shared<core::CaptureBuffer>();
    auto width = std::make_shared<std::optional<size_t>>(80);
    View<WidthModel> view(WidthModel(), fakeClockOptions(3600000ms, 0ms),
                          std::make_unique<ScriptedWriter>(buffer, width, true));
    view.setFakeClock(T0);
    
    view.update([](WidthModel&) {});
    *width = size_t(4);
    view.update([](WidthModel&) {});
    
    check_bytes("width_bytes", buffer->contents(), "\x1b[0K0123456789\n\r\x1b[1A\x1b[0K0123\n");
    check_eq("width_seen", view.inspectModel([](const WidthModel& m) { return m.seen; }), size_t(4));
    check_eq("width_no_capture", view.capturedOutput() == nullptr, true);
}

static void test_width_fallback() {
    auto buffer = std::make_shared<core::CaptureBuffer>();
    auto width = std::make_shared<std::optional<size_t>>();
    View<WidthModel> view(WidthModel(), captureOptions(),
                          std::make_unique<ScriptedWriter>(buffer, width, true));
    view.update([](WidthModel&) {});
    check_eq("width_fallback", view.inspectModel([](const WidthModel& m) { return m.seen; }), size_t(80));
}

// ----- disabled views -----

static void test_disabled_forwards_text() {
    View<TaskModel> view(TaskModel(), captureOptions().withEnabled(false));
    auto buffer = view.capturedOutput();
    
    view.update([](TaskModel& model) { model.n = 4; });
    view.message("print line 0\n");
    view.suspend();
    check_eq("disabled_state", view.state(), ViewState::DISABLED);
    check_eq("disabled_flag", view.isEnabled(), false);
    
    TaskModel model = view.finish();
    check_eq("disabled_model", model.n, 4);
    check_bytes("disabled_bytes", buffer->contents(), "print line 0\nfinished 4\n");
}

static void test_non_interactive_writer() {
    auto buffer = std::make_shared<core::CaptureBuffer>();
    auto width = std::make_shared<std::optional<size_t>>(80);
    View<TaskModel> view(TaskModel(), captureOptions(),
                         std::make_unique<ScriptedWriter>(buffer, width, false));
    view.update([](TaskModel& model) { model.n = 1; });
    view.message("plain\n");
    check_eq("non_interactive_state", view.state(), ViewState::DISABLED);
    check_bytes("non_interactive_bytes", buffer->contents(), "plain\n");
}

// ----- ending a view -----

static void test_finish_prints_final_message() {
    View<TaskModel> view(TaskModel(), captureOptions());
    auto buffer = view.capturedOutput();
    view.update([](TaskModel& model) { model.n = 5; });
    
    TaskModel model = view.finish();
    check_eq("finish_model", model.n, 5);
    check_eq("finish_state", view.state(), ViewState::FINISHED);
    check_bytes("finish_bytes", buffer->contents(), "\x1b[0Ktask 5\n" + ERASE_ONE + "finished 5\n");
}

static void test_calls_after_finish_throw() {
    View<TaskModel> view(TaskModel(), captureOptions());
    auto buffer = view.capturedOutput();
    view.update([](TaskModel& model) { model.n = 1; });
    view.finish();
    size_t size = buffer->size();
    
    int thrown = 0;
    try { view.update([](TaskModel& model) { model.n = 2; }); } catch (const ViewError& e) { thrown += e.code() == ViewErrorCode::VIEW_FINISHED; }
    try { view.message("late\n"); } catch (const ViewError& e) { thrown += e.code() == ViewErrorCode::VIEW_FINISHED; }
    try { view.suspend(); } catch (const ViewError& e) { thrown += e.code() == ViewErrorCode::VIEW_FINISHED; }
    try { view.resume(); } catch (const ViewError& e) { thrown += e.code() == ViewErrorCode::VIEW_FINISHED; }
    try { view.finish(); } catch (const ViewError& e) { thrown += e.code() == ViewErrorCode::VIEW_FINISHED; }
    try { view.abandon(); } catch (const ViewError& e) { thrown += e.code() == ViewErrorCode::VIEW_FINISHED; }
    
    check_eq("finished_throws", thrown, 6);
    check_eq("finished_no_bytes", buffer->size(), size);
}

static void test_abandon_leaves_bar() {
    std::shared_ptr<core::CaptureBuffer> buffer;
    std::string before;
    {
        View<TaskModel> view(TaskModel(), captureOptions());
        buffer = view.capturedOutput();
        view.update([](TaskModel& model) { model.n = 7; });
        before = buffer->contents();
        TaskModel model = view.abandon();
        check_eq("abandon_model", model.n, 7);
        check_eq("abandon_state", view.state(), ViewState::FINISHED);
    }
    check_bytes("abandon_bytes", buffer->contents(), before);
    
    VirtualScreen screen;
    screen.feed(buffer->contents());
    check_eq("abandon_screen", screen.lines(), std::vector<std::string>{"task 7"});
}

static void test_destructor_erases() {
    std::shared_ptr<core::CaptureBuffer> buffer;
    {
        View<TaskModel> view(TaskModel(), captureOptions());
        buffer = view.capturedOutput();
        view.update([](TaskModel& model) { model.n = 2; });
    }
    check_bytes("destructor_bytes", buffer->contents(), "\x1b[0Ktask 2\n" + ERASE_ONE);
}

static void test_destructor_after_finish_is_silent() {
    std::shared_ptr<core::CaptureBuffer> buffer;
    size_t size = 0;
    {
        View<TaskModel> view(TaskModel(), captureOptions());
        buffer = view.capturedOutput();
        view.update([](TaskModel& model) { model.n = 3; });
        view.finish();
        size = buffer->size();
    }
    check_eq("destructor_after_finish", buffer->size(), size);
}

// ----- terminal failure -----

static void test_fatal_hook_on_write_failure() {
    auto previous = core::setFatalHook([](ViewErrorCode code, const std::string&) {
        throw FatalCalled{code};
    });
    
    View<TaskModel> view(TaskModel(), captureOptions(), std::make_unique<BrokenWriter>(true));
    try {
        view.update([](TaskModel& model) { model.n = 1; });
        check_eq("fatal_write_called", false, true);
    } catch (const FatalCalled& called) {
        check_eq("fatal_write_code", called.code, ViewErrorCode::TERMINAL_WRITE_FAILED);
    }
    check_eq("fatal_write_not_painted", view.state(), ViewState::IDLE);
    
    View<TaskModel> flushing(TaskModel(), captureOptions(), std::make_unique<BrokenWriter>(false));
    try {
        flushing.message("text\n");
        check_eq("fatal_flush_called", false, true);
    } catch (const FatalCalled& called) {
        check_eq("fatal_flush_code", called.code, ViewErrorCode::TERMINAL_FLUSH_FAILED);
    }
    
    core::setFatalHook(std::move(previous));
}

int main() {
    test_counter_scenario();
    test_identical_renders_suppressed();
    test_update_returns_value();
    test_multiline_model();
    test_carriage_returns_stripped();
    test_control_characters_sanitized();
    test_tabs_never_wrap();
    test_empty_render_erases();
    
    test_text_interleaving();
    test_print_holdoff();
    test_incomplete_line_blocks_paint();
    test_write_and_messagef();
    test_view_stream();
    
    test_burst_rate_limited();
    test_spaced_updates_paint();
    test_fake_clock_requires_option();
    
    test_suspend_then_update();
    test_hide_and_resume();
    
    test_width_change_repaints();
    test_width_fallback();
    
    test_disabled_forwards_text();
    test_non_interactive_writer();
    
    test_finish_prints_final_message();
    test_calls_after_finish_throw();
    test_abandon_leaves_bar();
    test_destructor_erases();
    test_destructor_after_finish_is_silent();
    
    test_fatal_hook_on_write_failure();
    
    std::printf("view: %d passed, %d failed\n", g_pass, g_fail);
    return g_fail ? 1 : 0;
}
