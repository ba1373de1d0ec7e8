module;
#include <cstdint>
#include <expected>
#include <string_view>

export module Graphics:FrameStateMachine;

import Core;

export namespace Graphics
{
    // Idle -> FrameAcquired -> CommandsRecorded -> Submitted -> Presented -> Idle
    enum class FrameState : uint8_t
    {
        Idle,
        FrameAcquired,
        CommandsRecorded,
        Submitted,
        Presented
    };

    [[nodiscard]] constexpr std::string_view FrameStateToString(FrameState state)
    {
        switch (state)
        {
            case FrameState::Idle:             return "Idle";
            case FrameState::FrameAcquired:    return "FrameAcquired";
            case FrameState::CommandsRecorded: return "CommandsRecorded";
            case FrameState::Submitted:        return "Submitted";
            case FrameState::Presented:        return "Presented";
            default:                           return "Unknown";
        }
    }

    // Idle -> Idle covers a skipped frame or a failed acquisition.
    [[nodiscard]] constexpr bool IsValidTransition(FrameState from, FrameState to)
    {
        switch (from)
        {
            case FrameState::Idle:             return to == FrameState::FrameAcquired || to == FrameState::Idle;
            case FrameState::FrameAcquired:    return to == FrameState::CommandsRecorded;
            case FrameState::CommandsRecorded: return to == FrameState::Submitted;
            case FrameState::Submitted:        return to == FrameState::Presented;
            case FrameState::Presented:        return to == FrameState::Idle;
            default:                           return false;
        }
    }

    // Bounded acquisition: one attempt, and on a transient surface error one
    // reconfigure followed by exactly one more attempt. Whatever the second attempt
    // returns is final for this tick.
    //
    //   acquire():     -> Core::Expected<T>
    //   reconfigure(): -> Core::Result
    template <typename AcquireFn, typename ReconfigureFn>
    [[nodiscard]] auto AcquireWithRetry(AcquireFn&& acquire, ReconfigureFn&& reconfigure) -> decltype(acquire())
    {
        auto first = acquire();
        if (first || !Core::IsTransientSurfaceError(first.error())) return first;

        Core::Log::Warn("Frame acquisition failed ({}), reconfiguring and retrying once.",
                        Core::ErrorCodeToString(first.error()));

        if (auto reconfigured = reconfigure(); !reconfigured)
        {
            return std::unexpected(reconfigured.error());
        }

        auto second = acquire();
        if (!second)
        {
            Core::Log::Error("Frame acquisition failed again after reconfigure ({}).",
                             Core::ErrorCodeToString(second.error()));
        }
        return second;
    }
}
