#pragma once

// Deferred release of a thread-input attachment made for a focus hand-off.
//
// `AttachThreadInput` shares focus and key state between the host UI thread
// and a foreign UI thread so `SetFocus` may cross the boundary. Detaching
// right away can drop the focus messages still queued for the foreign
// thread; keeping the link makes a hung foreign thread stall the host. The
// link is therefore broken after a short delay on a thread of its own.
//
// Every successful attach is matched by exactly one scheduled detach. Tasks
// are fire-and-forget and never cancelled.

#include "native/native_windows.hpp"

#include <Windows.h>

#include <memory>

namespace wh::embedding
{
    class InputDetachScheduler
    {
    public:
        virtual ~InputDetachScheduler() = default;

        virtual void schedule_detach(DWORD source_thread, DWORD target_thread, DWORD delay_ms) noexcept = 0;
    };

    class ThreadInputDetachScheduler final : public InputDetachScheduler
    {
    public:
        explicit ThreadInputDetachScheduler(std::shared_ptr<native::NativeWindows> windows) noexcept;

        // Spawns a short-lived worker. When the worker cannot be created the
        // detach runs inline so the attachment is never leaked.
        void schedule_detach(DWORD source_thread, DWORD target_thread, DWORD delay_ms) noexcept override;

    private:
        struct Task final
        {
            std::shared_ptr<native::NativeWindows> windows;
            DWORD source_thread{};
            DWORD target_thread{};
            DWORD delay_ms{};
        };

        static DWORD WINAPI thread_proc(void* param) noexcept;

        std::shared_ptr<native::NativeWindows> _windows;
    };
}
