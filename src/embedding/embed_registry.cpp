#include "embedding/embed_registry.hpp"

namespace wh::embedding
{
    bool EmbedRegistry::try_insert(const OriginalState& state)
    {
        std::lock_guard lock(_lock);
        return _entries.try_emplace(state.window, state).second;
    }

    std::optional<OriginalState> EmbedRegistry::get(const core::WindowHandle window) const
    {
        std::lock_guard lock(_lock);
        const auto found = _entries.find(window);
        if (found == _entries.end())
        {
            return std::nullopt;
        }
        return found->second;
    }

    std::optional<OriginalState> EmbedRegistry::remove(const core::WindowHandle window)
    {
        std::lock_guard lock(_lock);
        auto node = _entries.extract(window);
        if (node.empty())
        {
            return std::nullopt;
        }
        return node.mapped();
    }

    bool EmbedRegistry::contains(const core::WindowHandle window) const
    {
        std::lock_guard lock(_lock);
        return _entries.contains(window);
    }

    std::size_t EmbedRegistry::size() const
    {
        std::lock_guard lock(_lock);
        return _entries.size();
    }

    std::vector<core::WindowHandle> EmbedRegistry::handles() const
    {
        std::lock_guard lock(_lock);
        std::vector<core::WindowHandle> result;
        result.reserve(_entries.size());
        for (const auto& [window, state] : _entries)
        {
            result.push_back(window);
        }
        return result;
    }
}
