#pragma once

// Ordered tab list over the embedded windows.
//
// Exactly one tab is shown at a time, laid out at
// `(0, top_offset, client_width, client_height - top_offset)` inside the
// host frame; the others stay embedded but hidden. Tabs whose window
// vanished are dropped on the next geometry update or validity poll.

#include "commands/command_surface.hpp"
#include "events/host_event.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace wh::logging
{
    class Logger;
}

namespace wh::app
{
    class Workspace final
    {
    public:
        Workspace(commands::CommandSurface& commands, logging::Logger& logger, int top_offset) noexcept;

        Workspace(const Workspace&) = delete;
        Workspace& operator=(const Workspace&) = delete;

        // Embeds the window and makes it the active tab. Opening a window
        // that already has a tab only activates that tab.
        [[nodiscard]] commands::CommandResult<void> open_tab(commands::RawHandle handle);

        void resize(int client_width, int client_height);

        // Tab events (switch/next/prev/close-current). Returns false for
        // events owned by the frame (toggle-visibility, open-search).
        bool handle(const events::HostEventMessage& message);

        void poll_validity();

        // Hands every embedded window back to the desktop; the list is empty
        // afterwards.
        void release_all();

        [[nodiscard]] const std::vector<commands::RawHandle>& tabs() const noexcept;
        [[nodiscard]] std::optional<std::size_t> active_index() const noexcept;

    private:
        void select(std::size_t index);
        void layout_active();
        void close_active();
        void drop_tab(std::size_t index);

        commands::CommandSurface& _commands;
        logging::Logger& _logger;
        int _top_offset{ 0 };
        int _client_width{ 0 };
        int _client_height{ 0 };
        std::vector<commands::RawHandle> _tabs;
        std::optional<std::size_t> _active;
    };
}
