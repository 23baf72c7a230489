#include "commands/command_surface.hpp"
#include "fake_native_windows.hpp"
#include "localization/localizer.hpp"
#include "logging/logger.hpp"

#include <memory>
#include <string>
#include <vector>

namespace
{
    using wh::commands::CommandSurface;
    using wh::commands::RawHandle;
    using wh::embedding::EmbedErrorKind;
    using wh::native::Rect;
    using wh::tests::FakeNativeWindows;
    using wh::tests::FakeWindowSpec;

    class RecordingEventSink final : public wh::events::HostEventSink
    {
    public:
        void emit(const wh::events::HostEventMessage& message) override
        {
            received.push_back(message);
        }

        std::vector<wh::events::HostEventMessage> received;
    };

    struct SurfaceFixture final
    {
        explicit SurfaceFixture(const std::wstring& locale = L"en-US", const bool with_frame = true) :
            localizer(locale)
        {
            if (with_frame)
            {
                frame = windows->create(FakeWindowSpec{
                    .title = L"WindowHub",
                    .class_name = L"WindowHubHostFrame",
                    .process_id = wh::tests::k_host_process_id,
                    .thread_id = wh::tests::k_host_thread_id,
                    .style = WS_OVERLAPPEDWINDOW | WS_CLIPCHILDREN | WS_VISIBLE,
                    .rect = Rect::from_origin_size(200, 100, 1280, 800),
                    .client_offset = { .x = 8, .y = 31 },
                });
                engine.set_host_frame(frame);
            }
        }

        std::shared_ptr<FakeNativeWindows> windows = std::make_shared<FakeNativeWindows>();
        wh::logging::Logger logger{ wh::logging::LogLevel::error };
        wh::embedding::EmbeddingEngine engine{ windows, std::make_shared<wh::tests::RecordingDetachScheduler>(), logger };
        wh::localization::Localizer localizer;
        RecordingEventSink sink;
        CommandSurface surface{ engine, localizer, wh::embedding::EnumerationPolicy{}, &sink };
        wh::core::WindowHandle frame;
    };

    bool test_can_embed_explorer_is_forbidden()
    {
        SurfaceFixture fixture;
        const auto explorer = fixture.windows->create(FakeWindowSpec{ .title = L"This PC", .class_name = L"CabinetWClass" });

        const auto result = fixture.surface.can_embed(explorer.as_uintptr());
        return !result &&
               result.error().kind == EmbedErrorKind::not_embeddable &&
               result.error().message == L"Windows of this type cannot be embedded: CabinetWClass";
    }

    bool test_messages_follow_locale()
    {
        SurfaceFixture fixture(L"zh-CN");
        const auto explorer = fixture.windows->create(FakeWindowSpec{ .title = L"此电脑", .class_name = L"CabinetWClass" });
        const auto own = fixture.windows->create(FakeWindowSpec{ .title = L"设置", .process_id = wh::tests::k_host_process_id });

        const auto forbidden = fixture.surface.embed(explorer.as_uintptr());
        const auto self = fixture.surface.embed(own.as_uintptr());
        return !forbidden &&
               forbidden.error().message == L"不支持嵌入此类型窗口: CabinetWClass" &&
               !self &&
               self.error().kind == EmbedErrorKind::not_embeddable &&
               self.error().message == L"不能嵌入自身";
    }

    bool test_embed_without_frame_reports_no_host_frame()
    {
        SurfaceFixture fixture(L"en-US", false);
        const auto editor = fixture.windows->create(FakeWindowSpec{ .title = L"Editor" });

        const auto result = fixture.surface.embed(editor.as_uintptr());
        return !result &&
               result.error().kind == EmbedErrorKind::no_host_frame &&
               !result.error().message.empty() &&
               fixture.surface.get_main_window_hwnd() == 0;
    }

    bool test_os_failure_names_the_primitive()
    {
        SurfaceFixture fixture;
        const auto editor = fixture.windows->create(FakeWindowSpec{ .title = L"Editor" });
        fixture.windows->fail_next(L"SetParent", ERROR_ACCESS_DENIED);

        const auto result = fixture.surface.embed(editor.as_uintptr());
        return !result &&
               result.error().kind == EmbedErrorKind::os_failure &&
               result.error().message.find(L"SetParent") != std::wstring::npos;
    }

    bool test_embed_update_activate_release_round_trip()
    {
        SurfaceFixture fixture;
        const auto editor = fixture.windows->create(FakeWindowSpec{
            .title = L"Editor",
            .rect = Rect::from_origin_size(40, 50, 700, 500),
        });
        const RawHandle handle = editor.as_uintptr();

        if (!fixture.surface.embed(handle))
        {
            return false;
        }

        const auto updated = fixture.surface.update_window_rect(handle, 0, 40, 1264, 721);
        const auto activated = fixture.surface.activate_window(handle);
        if (!updated || *updated != wh::embedding::WindowOutcome::done ||
            !activated || *activated != wh::embedding::WindowOutcome::done)
        {
            return false;
        }

        if (!fixture.surface.hide_window(handle) || fixture.windows->is_visible(editor) ||
            !fixture.surface.show_window(handle) || !fixture.windows->is_visible(editor))
        {
            return false;
        }

        fixture.surface.release(handle);
        const auto state = fixture.windows->state(editor);
        return !state.spec.parent &&
               state.spec.rect == Rect::from_origin_size(40, 50, 700, 500) &&
               fixture.surface.get_main_window_hwnd() == fixture.frame.as_uintptr();
    }

    bool test_gone_window_queries()
    {
        SurfaceFixture fixture;
        const auto editor = fixture.windows->create(FakeWindowSpec{ .title = L"Editor" });
        const RawHandle handle = editor.as_uintptr();
        if (!fixture.surface.is_window_valid(handle) || fixture.surface.get_window_title(handle) != L"Editor")
        {
            return false;
        }

        fixture.windows->destroy(editor);

        const auto updated = fixture.surface.update_window_rect(handle, 0, 0, 10, 10);
        const auto activated = fixture.surface.activate_window(handle);
        fixture.surface.close_target(handle);
        return !fixture.surface.is_window_valid(handle) &&
               fixture.surface.get_window_title(handle).empty() &&
               updated && *updated == wh::embedding::WindowOutcome::gone &&
               activated && *activated == wh::embedding::WindowOutcome::gone &&
               !fixture.surface.hide_window(handle);
    }

    bool test_enumerate_windows_filters()
    {
        SurfaceFixture fixture;
        (void)fixture.windows->create(FakeWindowSpec{ .title = L"Tray", .class_name = L"Shell_TrayWnd", .rect = Rect::from_origin_size(0, 0, 1920, 200) });
        const auto editor = fixture.windows->create(FakeWindowSpec{ .title = L"Editor", .rect = Rect::from_origin_size(0, 0, 400, 300) });

        const auto listed = fixture.surface.enumerate_windows();
        return listed && listed->size() == 1 && listed->front().window == editor;
    }

    bool test_cursor_hit_test_is_inclusive_below_offset()
    {
        SurfaceFixture fixture;

        // Client origin (208, 131), client size 1264 x 761.
        const auto inside = [&](const int x, const int y) {
            fixture.windows->set_cursor(wh::native::Point{ .x = x, .y = y });
            return fixture.surface.is_cursor_in_client_area(40);
        };

        return inside(208, 171) &&
               !inside(208, 170) &&
               inside(1472, 892) &&
               !inside(1473, 500) &&
               !inside(207, 500) &&
               !inside(500, 893) &&
               inside(800, 500);
    }

    bool test_cursor_hit_test_without_frame()
    {
        SurfaceFixture fixture(L"en-US", false);
        fixture.windows->set_cursor(wh::native::Point{ .x = 10, .y = 10 });
        return !fixture.surface.is_cursor_in_client_area(0);
    }

    bool test_pointer_and_foreground_queries()
    {
        SurfaceFixture fixture;
        const auto editor = fixture.windows->create(FakeWindowSpec{ .title = L"Editor" });
        (void)fixture.windows->bring_to_foreground(editor);
        fixture.windows->set_left_mouse_down(true);

        return fixture.surface.is_mouse_left_down() &&
               fixture.surface.get_foreground_window() == editor.as_uintptr();
    }

    bool test_emit_event_reaches_sink()
    {
        SurfaceFixture fixture;
        const wh::events::HostEventMessage message{ .event = wh::events::HostEvent::switch_tab, .tab_index = 3 };
        if (!fixture.surface.emit_event(message))
        {
            return false;
        }
        return fixture.sink.received.size() == 1 && fixture.sink.received.front() == message;
    }

    bool test_emit_event_without_sink_is_unsupported()
    {
        auto windows = std::make_shared<FakeNativeWindows>();
        wh::logging::Logger logger(wh::logging::LogLevel::error);
        wh::embedding::EmbeddingEngine engine(windows, std::make_shared<wh::tests::RecordingDetachScheduler>(), logger);
        wh::localization::Localizer localizer(L"en-US");
        CommandSurface surface(engine, localizer, wh::embedding::EnumerationPolicy{}, nullptr);

        const auto result = surface.emit_event(wh::events::HostEventMessage{ .event = wh::events::HostEvent::open_search });
        return !result && result.error().kind == EmbedErrorKind::unsupported;
    }
}

bool run_command_surface_tests()
{
    return test_can_embed_explorer_is_forbidden() &&
           test_messages_follow_locale() &&
           test_embed_without_frame_reports_no_host_frame() &&
           test_os_failure_names_the_primitive() &&
           test_embed_update_activate_release_round_trip() &&
           test_gone_window_queries() &&
           test_enumerate_windows_filters() &&
           test_cursor_hit_test_is_inclusive_below_offset() &&
           test_cursor_hit_test_without_frame() &&
           test_pointer_and_foreground_queries() &&
           test_emit_event_reaches_sink() &&
           test_emit_event_without_sink_is_unsupported();
}
