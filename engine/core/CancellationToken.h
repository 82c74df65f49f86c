// Thread-safe cancellation flag that can interrupt a long-running blocking call.
#pragma once

#include <functional>
#include <mutex>

namespace Forge {

class CancellationToken {
public:
    // Sets the flag and fires the bound interrupt hook, if any. Safe from any thread.
    void cancel();
    bool cancelled() const;

    // Installs the hook fired by cancel(). Fires immediately when already cancelled.
    void bind(std::function<void()> interrupt);
    // Removes the hook; once this returns the hook is never fired again.
    void unbind();

private:
    mutable std::mutex mutex_;
    bool cancelled_{false};
    std::function<void()> interrupt_;
};

// Binds for the lifetime of the scope. A null token makes this a no-op.
class CancellationScope {
public:
    CancellationScope(CancellationToken* token, std::function<void()> interrupt);
    ~CancellationScope();

    CancellationScope(const CancellationScope&) = delete;
    CancellationScope& operator=(const CancellationScope&) = delete;

private:
    CancellationToken* token_{nullptr};
};

}  // namespace Forge
