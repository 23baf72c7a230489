#include "embedding/embedding_engine.hpp"

#include "core/assert.hpp"
#include "embedding/window_classifier.hpp"
#include "logging/logger.hpp"

#include <cstdlib>

namespace wh::embedding
{
    namespace
    {
        constexpr int k_geometry_tolerance_px = 1;

        [[nodiscard]] bool is_render_surface_class(const std::wstring_view class_name) noexcept
        {
            return class_name == render_surface_class;
        }

        [[nodiscard]] bool within_tolerance(const int current, const int requested) noexcept
        {
            return std::abs(current - requested) <= k_geometry_tolerance_px;
        }

        [[nodiscard]] EmbedError rejection_to_error(Rejection rejection)
        {
            return EmbedError{
                .kind = EmbedErrorKind::not_embeddable,
                .reason = rejection.reason,
                .detail = std::move(rejection.class_name),
            };
        }

        // Shares input state with a foreign UI thread for the lifetime of
        // one focus hand-off. The matching detach is handed to the
        // scheduler on destruction, never performed inline.
        class ScopedInputAttachment final
        {
        public:
            ScopedInputAttachment(
                native::NativeWindows& windows,
                InputDetachScheduler& scheduler,
                const DWORD source_thread,
                const DWORD target_thread,
                const DWORD detach_delay_ms) noexcept :
                _scheduler(scheduler),
                _source_thread(source_thread),
                _target_thread(target_thread),
                _detach_delay_ms(detach_delay_ms)
            {
                if (target_thread == 0 || source_thread == target_thread)
                {
                    return;
                }
                _attached = windows.attach_input(source_thread, target_thread, true).has_value();
            }

            ~ScopedInputAttachment() noexcept
            {
                if (_attached)
                {
                    _scheduler.schedule_detach(_source_thread, _target_thread, _detach_delay_ms);
                }
            }

            ScopedInputAttachment(const ScopedInputAttachment&) = delete;
            ScopedInputAttachment& operator=(const ScopedInputAttachment&) = delete;

            [[nodiscard]] bool attached() const noexcept
            {
                return _attached;
            }

        private:
            InputDetachScheduler& _scheduler;
            DWORD _source_thread{};
            DWORD _target_thread{};
            DWORD _detach_delay_ms{};
            bool _attached{ false };
        };
    }

    EmbeddingEngine::EmbeddingEngine(
        std::shared_ptr<native::NativeWindows> windows,
        std::shared_ptr<InputDetachScheduler> detach_scheduler,
        logging::Logger& logger,
        const EngineOptions options) :
        _windows(std::move(windows)),
        _detach_scheduler(std::move(detach_scheduler)),
        _logger(logger),
        _options(options)
    {
        WH_ASSERT(_windows != nullptr);
        WH_ASSERT(_detach_scheduler != nullptr);
    }

    void EmbeddingEngine::set_host_frame(const core::WindowHandle frame) noexcept
    {
        _host_frame.store(frame, std::memory_order_release);
    }

    core::WindowHandle EmbeddingEngine::host_frame() const noexcept
    {
        return _host_frame.load(std::memory_order_acquire);
    }

    const EmbedRegistry& EmbeddingEngine::registry() const noexcept
    {
        return _registry;
    }

    native::NativeWindows& EmbeddingEngine::windows() const noexcept
    {
        return *_windows;
    }

    bool EmbeddingEngine::is_embedded(const core::WindowHandle window) const
    {
        return _registry.contains(window);
    }

    EmbedError EmbeddingEngine::failure_for(const core::WindowHandle window, native::NativeError error) const
    {
        if (!_windows->is_valid(window))
        {
            return make_error(EmbedErrorKind::gone);
        }
        return make_os_failure(std::move(error));
    }

    std::expected<void, EmbedError> EmbeddingEngine::can_embed(const core::WindowHandle window) const
    {
        if (!_windows->is_valid(window))
        {
            return std::unexpected(make_error(EmbedErrorKind::gone));
        }

        if (auto verdict = WindowClassifier::classify_window(*_windows, window); !verdict)
        {
            return std::unexpected(rejection_to_error(std::move(verdict.error())));
        }
        return {};
    }

    std::expected<void, EmbedError> EmbeddingEngine::ensure_host_clips_children(const core::WindowHandle frame)
    {
        const auto style = _windows->get_style(frame);
        if (!style)
        {
            return std::unexpected(make_os_failure(style.error()));
        }
        if ((*style & native::styles::host_clip_children) != 0)
        {
            return {};
        }

        if (auto updated = _windows->set_style(frame, *style | native::styles::host_clip_children); !updated)
        {
            return std::unexpected(make_os_failure(std::move(updated.error())));
        }
        _logger.log(logging::LogLevel::debug, L"Host frame 0x{:X} now clips its children", frame.as_uintptr());
        return {};
    }

    std::expected<OriginalState, EmbedError> EmbeddingEngine::capture_state(const core::WindowHandle window) const
    {
        const auto style = _windows->get_style(window);
        if (!style)
        {
            return std::unexpected(failure_for(window, style.error()));
        }
        const auto exstyle = _windows->get_exstyle(window);
        if (!exstyle)
        {
            return std::unexpected(failure_for(window, exstyle.error()));
        }
        const auto rect = _windows->get_window_rect(window);
        if (!rect)
        {
            return std::unexpected(failure_for(window, rect.error()));
        }

        return OriginalState{
            .window = window,
            .style = *style,
            .exstyle = *exstyle,
            .screen_rect = *rect,
        };
    }

    void EmbeddingEngine::roll_back_embed(const OriginalState& state, const bool restore_style)
    {
        if (restore_style)
        {
            if (auto restored = _windows->set_style(state.window, state.style); !restored)
            {
                _logger.log(
                    logging::LogLevel::warning,
                    L"Embed rollback could not restore style of 0x{:X}: {} failed (error={})",
                    state.window.as_uintptr(),
                    restored.error().operation,
                    restored.error().win32_error);
            }
        }
        (void)_registry.remove(state.window);
    }

    std::expected<void, EmbedError> EmbeddingEngine::embed(const core::WindowHandle window)
    {
        const core::WindowHandle frame = host_frame();
        if (!frame)
        {
            return std::unexpected(make_error(EmbedErrorKind::no_host_frame));
        }

        if (auto eligible = can_embed(window); !eligible)
        {
            return eligible;
        }

        if (auto clipped = ensure_host_clips_children(frame); !clipped)
        {
            return clipped;
        }

        auto captured = capture_state(window);
        if (!captured)
        {
            return std::unexpected(std::move(captured.error()));
        }
        const OriginalState state = std::move(captured.value());

        if (!_registry.try_insert(state))
        {
            _logger.log(logging::LogLevel::debug, L"Window 0x{:X} is already embedded", window.as_uintptr());
            return {};
        }

        if (auto styled = _windows->set_style(window, native::styles::to_embedded(state.style)); !styled)
        {
            roll_back_embed(state, false);
            return std::unexpected(failure_for(window, std::move(styled.error())));
        }

        if (auto parented = _windows->set_parent(window, frame); !parented)
        {
            roll_back_embed(state, true);
            return std::unexpected(failure_for(window, std::move(parented.error())));
        }

        // Geometry follows with the UI's first update_rect.
        if (auto raised = _windows->set_pos(window, native::InsertAfter::top, {}, native::placement::raise_in_place); !raised)
        {
            _logger.log(
                logging::LogLevel::warning,
                L"Embedded window 0x{:X} could not be raised: {} failed (error={})",
                window.as_uintptr(),
                raised.error().operation,
                raised.error().win32_error);
        }

        if (auto activated = activate(window); !activated)
        {
            _logger.log(
                logging::LogLevel::warning,
                L"Embedded window 0x{:X} did not take focus: {} (error={})",
                window.as_uintptr(),
                activated.error().detail,
                activated.error().win32_error);
        }

        _logger.log(
            logging::LogLevel::info,
            L"Embedded window 0x{:X} (style 0x{:08X} exstyle 0x{:08X} rect {},{} {}x{})",
            window.as_uintptr(),
            state.style,
            state.exstyle,
            state.screen_rect.left,
            state.screen_rect.top,
            state.screen_rect.width(),
            state.screen_rect.height());
        return {};
    }

    std::expected<WindowOutcome, EmbedError> EmbeddingEngine::update_rect(const core::WindowHandle window, const native::Rect client_rect)
    {
        if (!_windows->is_valid(window))
        {
            return WindowOutcome::gone;
        }
        if (!_registry.contains(window))
        {
            _logger.log(logging::LogLevel::debug, L"Ignoring geometry update for unheld window 0x{:X}", window.as_uintptr());
            return WindowOutcome::done;
        }

        core::WindowHandle reference = _windows->get_parent(window);
        if (!reference)
        {
            reference = host_frame();
        }

        if (const auto current = _windows->get_window_rect(window); current && reference)
        {
            if (const auto top_left = _windows->screen_to_client(reference, current->origin()))
            {
                if (within_tolerance(top_left->x, client_rect.left) &&
                    within_tolerance(top_left->y, client_rect.top) &&
                    within_tolerance(current->width(), client_rect.width()) &&
                    within_tolerance(current->height(), client_rect.height()))
                {
                    return WindowOutcome::done;
                }
            }
        }

        if (auto moved = _windows->set_pos(window, native::InsertAfter::unchanged, client_rect, native::placement::move_resize_quiet); !moved)
        {
            if (!_windows->is_valid(window))
            {
                return WindowOutcome::gone;
            }
            return std::unexpected(make_os_failure(std::move(moved.error())));
        }
        return WindowOutcome::done;
    }

    std::expected<WindowOutcome, EmbedError> EmbeddingEngine::activate(const core::WindowHandle window)
    {
        if (!_windows->is_valid(window))
        {
            return WindowOutcome::gone;
        }
        if (!_registry.contains(window))
        {
            _logger.log(logging::LogLevel::debug, L"Ignoring activation of unheld window 0x{:X}", window.as_uintptr());
            return WindowOutcome::done;
        }

        const ScopedInputAttachment attachment(
            *_windows,
            *_detach_scheduler,
            _windows->current_thread_id(),
            _windows->get_thread_id(window),
            _options.focus_detach_delay_ms);

        if (auto raised = _windows->set_pos(window, native::InsertAfter::top, {}, native::placement::raise_in_place); !raised)
        {
            if (!_windows->is_valid(window))
            {
                return WindowOutcome::gone;
            }
            return std::unexpected(make_os_failure(std::move(raised.error())));
        }

        core::WindowHandle focus_target = _windows->find_descendant(window, &is_render_surface_class);
        if (!focus_target)
        {
            focus_target = window;
        }

        if (auto activated = _windows->set_active(focus_target); !activated)
        {
            _logger.log(logging::LogLevel::debug, L"{} failed for 0x{:X} (error={})", activated.error().operation, focus_target.as_uintptr(), activated.error().win32_error);
        }
        if (auto focused = _windows->set_focus(focus_target); !focused)
        {
            _logger.log(logging::LogLevel::debug, L"{} failed for 0x{:X} (error={})", focused.error().operation, focus_target.as_uintptr(), focused.error().win32_error);
        }

        _logger.log(
            logging::LogLevel::debug,
            L"Focus routed to 0x{:X} inside 0x{:X} (input attached={})",
            focus_target.as_uintptr(),
            window.as_uintptr(),
            attachment.attached());
        return WindowOutcome::done;
    }

    bool EmbeddingEngine::hide(const core::WindowHandle window) noexcept
    {
        if (!_windows->is_valid(window) || !_registry.contains(window))
        {
            return false;
        }
        _windows->hide(window);
        return true;
    }

    bool EmbeddingEngine::show(const core::WindowHandle window) noexcept
    {
        if (!_windows->is_valid(window) || !_registry.contains(window))
        {
            return false;
        }
        _windows->show(window);
        return true;
    }

    bool EmbeddingEngine::looks_embedded(const core::WindowHandle window) const
    {
        if (_windows->get_parent(window))
        {
            return true;
        }
        const auto style = _windows->get_style(window);
        return style && (*style & native::styles::child_marker) != 0;
    }

    void EmbeddingEngine::release(const core::WindowHandle window)
    {
        // Consumed first so concurrent releases restore the window once.
        const std::optional<OriginalState> saved = _registry.remove(window);

        if (!_windows->is_valid(window))
        {
            _logger.log(logging::LogLevel::info, L"Released vanished window 0x{:X} (had state={})", window.as_uintptr(), saved.has_value());
            return;
        }

        const DWORD current_thread = _windows->current_thread_id();
        const DWORD target_thread = _windows->get_thread_id(window);
        if (target_thread != 0 && target_thread != current_thread)
        {
            // Usually not attached any more; the failure is expected then.
            if (auto detached = _windows->attach_input(current_thread, target_thread, false); !detached)
            {
                _logger.log(logging::LogLevel::trace, L"No input attachment to drop for 0x{:X} (error={})", window.as_uintptr(), detached.error().win32_error);
            }
        }

        if (!saved && !looks_embedded(window))
        {
            _logger.log(logging::LogLevel::debug, L"Window 0x{:X} is standalone; nothing to release", window.as_uintptr());
            return;
        }

        if (auto unparented = _windows->set_parent(window, {}); !unparented)
        {
            _logger.log(
                logging::LogLevel::warning,
                L"Release of 0x{:X}: {} failed (error={})",
                window.as_uintptr(),
                unparented.error().operation,
                unparented.error().win32_error);
        }

        const auto warn = [&](const native::NativeResult<void>& result) {
            if (!result)
            {
                _logger.log(
                    logging::LogLevel::warning,
                    L"Release of 0x{:X}: {} failed (error={})",
                    window.as_uintptr(),
                    result.error().operation,
                    result.error().win32_error);
            }
        };

        if (saved)
        {
            warn(_windows->set_style(window, saved->style));
            warn(_windows->set_exstyle(window, saved->exstyle));
            warn(_windows->set_pos(window, native::InsertAfter::top, saved->screen_rect, native::placement::restore_frame));
        }
        else
        {
            _logger.log(logging::LogLevel::warning, L"No saved state for child window 0x{:X}; applying default frame", window.as_uintptr());
            warn(_windows->set_style(window, native::styles::fallback_top_level));
            warn(_windows->set_pos(window, native::InsertAfter::top, native::styles::fallback_screen_rect, native::placement::restore_frame));
        }

        _windows->restore(window);
        (void)_windows->bring_to_foreground(window);

        _logger.log(logging::LogLevel::info, L"Released window 0x{:X}", window.as_uintptr());
    }

    void EmbeddingEngine::close(const core::WindowHandle window)
    {
        release(window);

        if (!_windows->is_valid(window))
        {
            return;
        }
        if (auto posted = _windows->post_close(window); !posted)
        {
            _logger.log(
                logging::LogLevel::warning,
                L"Close request for 0x{:X} not posted: {} failed (error={})",
                window.as_uintptr(),
                posted.error().operation,
                posted.error().win32_error);
        }
    }

    void EmbeddingEngine::release_all()
    {
        for (const core::WindowHandle window : _registry.handles())
        {
            release(window);
        }
    }
}
