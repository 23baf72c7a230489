#pragma once

// Saved pre-embed state of every window the core currently holds.
//
// Invariant: a handle has an entry iff the core considers that window
// embedded. Entries are created only by `embed` and consumed only by
// `release`/`close`, exactly once.
//
// The mutex here is the only cross-thread synchronization inside the
// embedding core. It is never held while calling into the window manager.

#include "core/window_handle.hpp"
#include "native/geometry.hpp"
#include "native/window_styles.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace wh::embedding
{
    struct OriginalState final
    {
        core::WindowHandle window{};
        native::StyleBits style{ 0 };
        native::StyleBits exstyle{ 0 };
        native::Rect screen_rect{};
    };

    class EmbedRegistry final
    {
    public:
        EmbedRegistry() = default;

        EmbedRegistry(const EmbedRegistry&) = delete;
        EmbedRegistry& operator=(const EmbedRegistry&) = delete;

        // False when an entry for `state.window` already exists; the
        // existing entry is left untouched.
        [[nodiscard]] bool try_insert(const OriginalState& state);

        [[nodiscard]] std::optional<OriginalState> get(core::WindowHandle window) const;

        // Removes and returns the entry. Concurrent callers for the same
        // handle observe the entry at most once.
        std::optional<OriginalState> remove(core::WindowHandle window);

        [[nodiscard]] bool contains(core::WindowHandle window) const;
        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] std::vector<core::WindowHandle> handles() const;

    private:
        mutable std::mutex _lock;
        std::unordered_map<core::WindowHandle, OriginalState> _entries;
    };
}
