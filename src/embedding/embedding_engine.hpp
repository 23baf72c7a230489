#pragma once

// Embedding Engine: per-window state machine that turns a foreign top-level
// window into a child pane of the host frame and back.
//
//   Free --embed--> Embedded --release/close--> Free
//   Embedded --update_rect/activate/hide/show--> Embedded
//
// "Embedded" is exactly "has an `EmbedRegistry` entry". Geometry, focus and
// visibility operations leave windows the engine does not hold untouched.
//
// All calls run on the caller's thread and are non-blocking with respect to
// the foreign UI thread, except that the detach of a focus hand-off is
// deferred to `InputDetachScheduler`. Commands may arrive concurrently; the
// registry serializes state changes, and for a single window the caller's
// issue order is the order applied to the window manager.

#include "core/window_handle.hpp"
#include "embedding/embed_error.hpp"
#include "embedding/embed_registry.hpp"
#include "embedding/input_detach_scheduler.hpp"
#include "native/native_windows.hpp"

#include <Windows.h>

#include <atomic>
#include <expected>
#include <memory>
#include <string_view>

namespace wh::logging
{
    class Logger;
}

namespace wh::embedding
{
    // Browser-style applications keep keyboard focus on this interior
    // widget rather than on their top-level window.
    inline constexpr std::wstring_view render_surface_class = L"Chrome_RenderWidgetHostHWND";

    struct EngineOptions final
    {
        DWORD focus_detach_delay_ms{ 100 };
    };

    class EmbeddingEngine final
    {
    public:
        EmbeddingEngine(
            std::shared_ptr<native::NativeWindows> windows,
            std::shared_ptr<InputDetachScheduler> detach_scheduler,
            logging::Logger& logger,
            EngineOptions options = {});

        EmbeddingEngine(const EmbeddingEngine&) = delete;
        EmbeddingEngine& operator=(const EmbeddingEngine&) = delete;

        // The host frame is fixed for the process lifetime once set.
        void set_host_frame(core::WindowHandle frame) noexcept;
        [[nodiscard]] core::WindowHandle host_frame() const noexcept;

        [[nodiscard]] std::expected<void, EmbedError> can_embed(core::WindowHandle window) const;

        // Idempotent: embedding a held window succeeds without a second
        // saved state.
        [[nodiscard]] std::expected<void, EmbedError> embed(core::WindowHandle window);

        // `client_rect` is in host frame client coordinates. Differences of
        // at most one pixel on every component are absorbed.
        [[nodiscard]] std::expected<WindowOutcome, EmbedError> update_rect(core::WindowHandle window, native::Rect client_rect);

        [[nodiscard]] std::expected<WindowOutcome, EmbedError> activate(core::WindowHandle window);

        // False when the window is gone or not held by the engine.
        bool hide(core::WindowHandle window) noexcept;
        bool show(core::WindowHandle window) noexcept;

        // Best-effort and idempotent; failures past the reparent are logged.
        void release(core::WindowHandle window);

        // `release` followed by an asynchronous close request.
        void close(core::WindowHandle window);

        void release_all();

        [[nodiscard]] bool is_embedded(core::WindowHandle window) const;
        [[nodiscard]] const EmbedRegistry& registry() const noexcept;
        [[nodiscard]] native::NativeWindows& windows() const noexcept;

    private:
        [[nodiscard]] EmbedError failure_for(core::WindowHandle window, native::NativeError error) const;
        [[nodiscard]] std::expected<void, EmbedError> ensure_host_clips_children(core::WindowHandle frame);
        [[nodiscard]] std::expected<OriginalState, EmbedError> capture_state(core::WindowHandle window) const;
        void roll_back_embed(const OriginalState& state, bool restore_style);
        [[nodiscard]] bool looks_embedded(core::WindowHandle window) const;

        std::shared_ptr<native::NativeWindows> _windows;
        std::shared_ptr<InputDetachScheduler> _detach_scheduler;
        logging::Logger& _logger;
        EngineOptions _options;
        EmbedRegistry _registry;
        std::atomic<core::WindowHandle> _host_frame{};
    };
}
