#pragma once

// Command Surface: the request/response verbs the UI collaborator calls.
//
// Handles cross this boundary as plain integers. Every verb maps onto one
// Embedding Engine, Classifier or facade operation; failures come back as
// `CommandError` carrying the stable `EmbedErrorKind` and a localized
// sentence. OS error codes never reach the UI except inside that sentence.
//
// Verbs are re-entrant and may be called from several threads.

#include "embedding/embed_error.hpp"
#include "embedding/embedding_engine.hpp"
#include "embedding/window_enumerator.hpp"
#include "events/host_event.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace wh::localization
{
    class Localizer;
}

namespace wh::commands
{
    struct CommandError final
    {
        embedding::EmbedErrorKind kind{ embedding::EmbedErrorKind::os_failure };
        std::wstring message;
    };

    template<typename T>
    using CommandResult = std::expected<T, CommandError>;

    using RawHandle = std::uintptr_t;

    class CommandSurface final
    {
    public:
        // `event_sink` may be null; `emit_event` then reports `Unsupported`.
        CommandSurface(
            embedding::EmbeddingEngine& engine,
            const localization::Localizer& localizer,
            embedding::EnumerationPolicy enumeration_policy,
            events::HostEventSink* event_sink);

        [[nodiscard]] CommandResult<std::vector<embedding::WindowDescriptor>> enumerate_windows() const;
        [[nodiscard]] CommandResult<void> can_embed(RawHandle handle) const;
        [[nodiscard]] CommandResult<void> embed(RawHandle handle);
        void release(RawHandle handle);
        void close_target(RawHandle handle);

        [[nodiscard]] CommandResult<embedding::WindowOutcome> update_window_rect(RawHandle handle, int x, int y, int width, int height);
        [[nodiscard]] CommandResult<embedding::WindowOutcome> activate_window(RawHandle handle);

        bool hide_window(RawHandle handle) noexcept;
        bool show_window(RawHandle handle) noexcept;

        [[nodiscard]] bool is_window_valid(RawHandle handle) const noexcept;
        [[nodiscard]] std::wstring get_window_title(RawHandle handle) const;
        [[nodiscard]] RawHandle get_foreground_window() const noexcept;
        [[nodiscard]] RawHandle get_main_window_hwnd() const noexcept;

        // Pointer inside the host frame's client area, ignoring the
        // `top_offset` pixels at its top. Edges count as inside.
        [[nodiscard]] bool is_cursor_in_client_area(int top_offset) const noexcept;
        [[nodiscard]] bool is_mouse_left_down() const noexcept;

        [[nodiscard]] CommandResult<void> emit_event(const events::HostEventMessage& message);

        [[nodiscard]] CommandError to_command_error(const embedding::EmbedError& error) const;

    private:
        embedding::EmbeddingEngine& _engine;
        const localization::Localizer& _localizer;
        embedding::EnumerationPolicy _enumeration_policy;
        events::HostEventSink* _event_sink{ nullptr };
    };
}
