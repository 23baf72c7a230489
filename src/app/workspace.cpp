#include "app/workspace.hpp"

#include "logging/logger.hpp"

#include <algorithm>

namespace wh::app
{
    Workspace::Workspace(commands::CommandSurface& commands, logging::Logger& logger, const int top_offset) noexcept :
        _commands(commands),
        _logger(logger),
        _top_offset(std::max(0, top_offset))
    {
    }

    const std::vector<commands::RawHandle>& Workspace::tabs() const noexcept
    {
        return _tabs;
    }

    std::optional<std::size_t> Workspace::active_index() const noexcept
    {
        return _active;
    }

    commands::CommandResult<void> Workspace::open_tab(const commands::RawHandle handle)
    {
        if (const auto existing = std::ranges::find(_tabs, handle); existing != _tabs.end())
        {
            select(static_cast<std::size_t>(existing - _tabs.begin()));
            return {};
        }

        if (auto embedded = _commands.embed(handle); !embedded)
        {
            return embedded;
        }

        _tabs.push_back(handle);
        _logger.log(logging::LogLevel::info, L"Tab {} opened for 0x{:X}", _tabs.size(), handle);
        select(_tabs.size() - 1);
        return {};
    }

    void Workspace::resize(const int client_width, const int client_height)
    {
        _client_width = std::max(0, client_width);
        _client_height = std::max(0, client_height);
        layout_active();
    }

    bool Workspace::handle(const events::HostEventMessage& message)
    {
        switch (message.event)
        {
        case events::HostEvent::switch_tab:
            if (message.tab_index >= 1 && static_cast<std::size_t>(message.tab_index) <= _tabs.size())
            {
                select(static_cast<std::size_t>(message.tab_index) - 1);
            }
            return true;
        case events::HostEvent::next_tab:
            if (_active)
            {
                select((*_active + 1) % _tabs.size());
            }
            return true;
        case events::HostEvent::prev_tab:
            if (_active)
            {
                select((*_active + _tabs.size() - 1) % _tabs.size());
            }
            return true;
        case events::HostEvent::close_current_tab:
            close_active();
            return true;
        case events::HostEvent::open_search:
        case events::HostEvent::toggle_visibility:
            break;
        }
        return false;
    }

    void Workspace::poll_validity()
    {
        bool dropped = false;
        for (std::size_t index = _tabs.size(); index-- > 0;)
        {
            if (!_commands.is_window_valid(_tabs[index]))
            {
                _logger.log(logging::LogLevel::info, L"Window 0x{:X} vanished; closing its tab", _tabs[index]);
                drop_tab(index);
                dropped = true;
            }
        }

        if (dropped && _active)
        {
            select(*_active);
        }
    }

    void Workspace::release_all()
    {
        for (const commands::RawHandle handle : _tabs)
        {
            _commands.release(handle);
        }
        _tabs.clear();
        _active.reset();
    }

    void Workspace::select(const std::size_t index)
    {
        if (index >= _tabs.size())
        {
            return;
        }

        if (_active && *_active != index && *_active < _tabs.size())
        {
            (void)_commands.hide_window(_tabs[*_active]);
        }

        _active = index;
        const commands::RawHandle handle = _tabs[index];
        (void)_commands.show_window(handle);
        layout_active();

        // Layout may have dropped the tab.
        if (!_active || _tabs[*_active] != handle)
        {
            if (_active)
            {
                select(*_active);
            }
            return;
        }

        auto activated = _commands.activate_window(handle);
        if (!activated)
        {
            _logger.log(logging::LogLevel::warning, L"Activating tab 0x{:X} failed: {}", handle, activated.error().message);
        }
        else if (*activated == embedding::WindowOutcome::gone)
        {
            drop_tab(index);
            if (_active)
            {
                select(*_active);
            }
        }
    }

    void Workspace::layout_active()
    {
        if (!_active || _client_width == 0 || _client_height == 0)
        {
            return;
        }

        const std::size_t index = *_active;
        const commands::RawHandle handle = _tabs[index];
        const int content_height = std::max(0, _client_height - _top_offset);
        auto updated = _commands.update_window_rect(handle, 0, _top_offset, _client_width, content_height);
        if (!updated)
        {
            _logger.log(logging::LogLevel::warning, L"Layout of tab 0x{:X} failed: {}", handle, updated.error().message);
            return;
        }

        if (*updated == embedding::WindowOutcome::gone)
        {
            _logger.log(logging::LogLevel::info, L"Window 0x{:X} vanished during layout", handle);
            drop_tab(index);
        }
    }

    void Workspace::close_active()
    {
        if (!_active)
        {
            return;
        }

        const std::size_t index = *_active;
        _commands.close_target(_tabs[index]);
        drop_tab(index);
        if (_active)
        {
            select(*_active);
        }
    }

    // Keeps `_active` pointing at a neighbour; the caller re-selects it.
    void Workspace::drop_tab(const std::size_t index)
    {
        // Consumes the saved state of a vanished window.
        _commands.release(_tabs[index]);
        _tabs.erase(_tabs.begin() + static_cast<std::ptrdiff_t>(index));

        if (_tabs.empty())
        {
            _active.reset();
            return;
        }

        if (!_active)
        {
            return;
        }
        if (*_active > index)
        {
            *_active -= 1;
        }
        else if (*_active >= _tabs.size())
        {
            *_active = _tabs.size() - 1;
        }
    }
}
