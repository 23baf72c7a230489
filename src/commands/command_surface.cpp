#include "commands/command_surface.hpp"

#include "localization/localizer.hpp"

#include <format>

namespace wh::commands
{
    namespace
    {
        [[nodiscard]] core::WindowHandle to_window(const RawHandle handle) noexcept
        {
            return core::WindowHandle::from_uintptr(handle);
        }

        [[nodiscard]] localization::StringId message_id(const embedding::EmbedError& error) noexcept
        {
            using embedding::EmbedErrorKind;
            switch (error.kind)
            {
            case EmbedErrorKind::unsupported:
                return localization::StringId::error_unsupported;
            case EmbedErrorKind::no_host_frame:
                return localization::StringId::error_no_host_frame;
            case EmbedErrorKind::not_embeddable:
                return error.reason == embedding::RejectReason::self_process
                           ? localization::StringId::error_self_process
                           : localization::StringId::error_forbidden_class;
            case EmbedErrorKind::already_embedded:
                return localization::StringId::error_already_embedded;
            case EmbedErrorKind::gone:
                return localization::StringId::error_gone;
            case EmbedErrorKind::os_failure:
                break;
            }
            return localization::StringId::error_os_failure;
        }
    }

    CommandSurface::CommandSurface(
        embedding::EmbeddingEngine& engine,
        const localization::Localizer& localizer,
        embedding::EnumerationPolicy enumeration_policy,
        events::HostEventSink* const event_sink) :
        _engine(engine),
        _localizer(localizer),
        _enumeration_policy(std::move(enumeration_policy)),
        _event_sink(event_sink)
    {
    }

    CommandError CommandSurface::to_command_error(const embedding::EmbedError& error) const
    {
        std::wstring message(_localizer.text(message_id(error)));

        if (error.kind == embedding::EmbedErrorKind::not_embeddable &&
            error.reason == embedding::RejectReason::forbidden_class)
        {
            message = std::format(L"{}: {}", message, error.detail);
        }
        else if (error.kind == embedding::EmbedErrorKind::os_failure)
        {
            message = std::format(L"{}: {} ({})", message, error.detail, error.win32_error);
        }

        return CommandError{ .kind = error.kind, .message = std::move(message) };
    }

    CommandResult<std::vector<embedding::WindowDescriptor>> CommandSurface::enumerate_windows() const
    {
        auto listed = embedding::WindowEnumerator::list_candidates(_engine.windows(), _enumeration_policy);
        if (!listed)
        {
            return std::unexpected(to_command_error(embedding::make_os_failure(std::move(listed.error()))));
        }
        return std::move(listed.value());
    }

    CommandResult<void> CommandSurface::can_embed(const RawHandle handle) const
    {
        if (auto verdict = _engine.can_embed(to_window(handle)); !verdict)
        {
            return std::unexpected(to_command_error(verdict.error()));
        }
        return {};
    }

    CommandResult<void> CommandSurface::embed(const RawHandle handle)
    {
        if (auto embedded = _engine.embed(to_window(handle)); !embedded)
        {
            return std::unexpected(to_command_error(embedded.error()));
        }
        return {};
    }

    void CommandSurface::release(const RawHandle handle)
    {
        _engine.release(to_window(handle));
    }

    void CommandSurface::close_target(const RawHandle handle)
    {
        _engine.close(to_window(handle));
    }

    CommandResult<embedding::WindowOutcome> CommandSurface::update_window_rect(
        const RawHandle handle,
        const int x,
        const int y,
        const int width,
        const int height)
    {
        auto updated = _engine.update_rect(to_window(handle), native::Rect::from_origin_size(x, y, width, height));
        if (!updated)
        {
            return std::unexpected(to_command_error(updated.error()));
        }
        return updated.value();
    }

    CommandResult<embedding::WindowOutcome> CommandSurface::activate_window(const RawHandle handle)
    {
        auto activated = _engine.activate(to_window(handle));
        if (!activated)
        {
            return std::unexpected(to_command_error(activated.error()));
        }
        return activated.value();
    }

    bool CommandSurface::hide_window(const RawHandle handle) noexcept
    {
        return _engine.hide(to_window(handle));
    }

    bool CommandSurface::show_window(const RawHandle handle) noexcept
    {
        return _engine.show(to_window(handle));
    }

    bool CommandSurface::is_window_valid(const RawHandle handle) const noexcept
    {
        return _engine.windows().is_valid(to_window(handle));
    }

    std::wstring CommandSurface::get_window_title(const RawHandle handle) const
    {
        const core::WindowHandle window = to_window(handle);
        if (!_engine.windows().is_valid(window))
        {
            return {};
        }
        return _engine.windows().get_title(window);
    }

    RawHandle CommandSurface::get_foreground_window() const noexcept
    {
        return _engine.windows().foreground_window().as_uintptr();
    }

    RawHandle CommandSurface::get_main_window_hwnd() const noexcept
    {
        return _engine.host_frame().as_uintptr();
    }

    bool CommandSurface::is_cursor_in_client_area(const int top_offset) const noexcept
    {
        const core::WindowHandle frame = _engine.host_frame();
        if (!frame)
        {
            return false;
        }

        native::NativeWindows& windows = _engine.windows();
        const auto cursor = windows.cursor_pos();
        const auto origin = windows.client_to_screen(frame, native::Point{});
        const auto client = windows.get_client_rect(frame);
        if (!cursor || !origin || !client)
        {
            return false;
        }

        const native::Rect content{
            .left = origin->x,
            .top = origin->y + top_offset,
            .right = origin->x + client->width(),
            .bottom = origin->y + client->height(),
        };
        return content.contains_inclusive(*cursor);
    }

    bool CommandSurface::is_mouse_left_down() const noexcept
    {
        return _engine.windows().is_left_mouse_down();
    }

    CommandResult<void> CommandSurface::emit_event(const events::HostEventMessage& message)
    {
        if (_event_sink == nullptr)
        {
            return std::unexpected(to_command_error(embedding::make_error(embedding::EmbedErrorKind::unsupported)));
        }

        _event_sink->emit(message);
        return {};
    }
}
