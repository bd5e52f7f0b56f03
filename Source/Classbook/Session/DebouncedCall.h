#pragma once

#include <juce_events/juce_events.h>
#include <functional>

namespace Classbook::Session
{
    // Single-slot debounce: every trigger() re-arms the one pending call.
    class DebouncedCall : private juce::Timer
    {
    public:
        DebouncedCall(int delayMs, std::function<void()> callbackToUse)
            : delay(juce::jmax(1, delayMs)),
              callback(std::move(callbackToUse))
        {
        }

        ~DebouncedCall() override
        {
            stopTimer();
        }

        void trigger()
        {
            startTimer(delay);
        }

        void cancel()
        {
            stopTimer();
        }

        bool isPending() const noexcept
        {
            return isTimerRunning();
        }

        // Fires a pending call right away. Returns false when nothing was pending.
        bool flush()
        {
            if (!isTimerRunning())
                return false;

            fire();
            return true;
        }

        void setDelay(int delayMs) noexcept
        {
            delay = juce::jmax(1, delayMs);
        }

        int getDelay() const noexcept
        {
            return delay;
        }

    private:
        void timerCallback() override
        {
            fire();
        }

        void fire()
        {
            stopTimer();
            if (callback != nullptr)
                callback();
        }

        int delay = 200;
        std::function<void()> callback;

        JUCE_DECLARE_NON_COPYABLE (DebouncedCall)
    };
}
