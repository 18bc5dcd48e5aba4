// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <functional>
#include <memory>

namespace FSE {

/**
 * @brief One-shot boolean pulse driven by an external event source
 *
 * Turns "event X fired" into a transition condition without tying the
 * engine to any particular signal mechanism. The host supplies a subscribe
 * function: it receives a trigger to call whenever the event fires and
 * returns the matching unsubscribe function.
 *
 * consume() reports true exactly once per fire, then resets. A pulse
 * registered through StateMachine::addEventTransition() is discarded each
 * time its source state is entered, so only events fired while that state
 * is active count. The
 * subscription is released when the PulseCondition is destroyed; when the
 * event source dies first, the host calls detach() so no stale unsubscribe
 * runs.
 *
 * @code
 * auto pulse = FSE::PulseCondition::create([&hurtbox](FSE::PulseCondition::Trigger trigger) {
 *     auto id = hurtbox.onHit.connect(std::move(trigger));
 *     return [&hurtbox, id]() { hurtbox.onHit.disconnect(id); };
 * });
 * machine.addGlobalTransition(Move::Hurt, pulse->asCondition());
 * @endcode
 */
class PulseCondition : public std::enable_shared_from_this<PulseCondition> {
    // Restricts construction to create() while keeping make_shared usable
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    using Trigger = std::function<void()>;
    using Unsubscribe = std::function<void()>;
    using Subscribe = std::function<Unsubscribe(Trigger)>;

    /**
     * @brief Create a pulse and subscribe it to its source
     * @param subscribe Subscription function (may be empty, leaving the pulse fire()-only)
     */
    static std::shared_ptr<PulseCondition> create(Subscribe subscribe);

    explicit PulseCondition(PrivateTag) {}
    ~PulseCondition();

    PulseCondition(const PulseCondition &) = delete;
    PulseCondition &operator=(const PulseCondition &) = delete;

    /**
     * @brief Arm the pulse (what the subscription trigger calls)
     */
    void fire() {
        pending_ = true;
    }

    /**
     * @brief Read and reset the pulse
     * @return true if fire() happened since the last consume()
     */
    bool consume();

    /**
     * @brief Drop a pending pulse without reporting it
     */
    void discard() {
        pending_ = false;
    }

    bool isPending() const {
        return pending_;
    }

    bool isSubscribed() const {
        return static_cast<bool>(unsubscribe_);
    }

    /**
     * @brief Release the subscription now (idempotent)
     */
    void unsubscribe();

    /**
     * @brief Forget the subscription without calling unsubscribe (source already destroyed)
     */
    void detach();

    /**
     * @brief Condition functor sharing ownership of this pulse
     *
     * The pulse, and therefore its subscription, lives as long as the
     * transition holding the returned functor.
     */
    std::function<bool()> asCondition();

private:
    bool pending_ = false;
    Unsubscribe unsubscribe_;
};

}  // namespace FSE
