#include "embedding/input_detach_scheduler.hpp"

#include "core/unique_resource.hpp"

#include <new>

namespace wh::embedding
{
    ThreadInputDetachScheduler::ThreadInputDetachScheduler(std::shared_ptr<native::NativeWindows> windows) noexcept :
        _windows(std::move(windows))
    {
    }

    DWORD WINAPI ThreadInputDetachScheduler::thread_proc(void* param) noexcept
    {
        // The worker owns its task; the scheduler may already be gone.
        std::unique_ptr<Task> task(static_cast<Task*>(param));
        if (task == nullptr || task->windows == nullptr)
        {
            return 0;
        }

        ::Sleep(task->delay_ms);
        const auto detached = task->windows->attach_input(task->source_thread, task->target_thread, false);
        return detached ? 0 : detached.error().win32_error;
    }

    void ThreadInputDetachScheduler::schedule_detach(const DWORD source_thread, const DWORD target_thread, const DWORD delay_ms) noexcept
    {
        if (_windows == nullptr || source_thread == target_thread)
        {
            return;
        }

        std::unique_ptr<Task> task(new (std::nothrow) Task{
            .windows = _windows,
            .source_thread = source_thread,
            .target_thread = target_thread,
            .delay_ms = delay_ms,
        });
        if (task != nullptr)
        {
            core::UniqueHandle thread(::CreateThread(
                nullptr,
                0,
                &ThreadInputDetachScheduler::thread_proc,
                task.get(),
                0,
                nullptr));
            if (thread.valid())
            {
                // Ownership moved to the worker; the handle is closed here
                // because nobody joins it.
                (void)task.release();
                return;
            }
        }

        (void)_windows->attach_input(source_thread, target_thread, false);
    }
}
