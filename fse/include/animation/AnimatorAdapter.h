// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "animation/IAnimator.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace FSE {

/**
 * @brief Playback request handed to a concrete backend
 */
struct AnimationRequest {
    std::string name;
    float speed = 1.0f;
    float blend = 0.0f;
    bool loop = false;
};

/**
 * @brief Common base for backend adapters
 *
 * Validates the request, asks the backend to start playback and keeps the
 * completion callback per animation name. The backend's own "finished"
 * notification is forwarded to notifyFinished(), which fires the stored
 * callback once and forgets it.
 */
class AnimatorAdapter : public IAnimator {
public:
    void playAnimation(const std::string &name, float speed, float blend, bool loop,
                       std::function<void()> onFinished = nullptr) override;

    /**
     * @brief Report that the backend finished playing an animation
     * @return true if a completion callback was pending for it
     */
    bool notifyFinished(const std::string &name);

    bool hasPendingCallback(const std::string &name) const {
        return finishCallbacks_.find(name) != finishCallbacks_.end();
    }

protected:
    /**
     * @brief Whether the backend knows this animation
     */
    virtual bool hasAnimation(const std::string &name) const = 0;

    /**
     * @brief Start playback on the backend
     */
    virtual void startPlayback(const AnimationRequest &request) = 0;

private:
    std::unordered_map<std::string, std::function<void()>> finishCallbacks_;
};

/**
 * @brief Adapter for backends exposed as plain callables
 *
 * @code
 * FSE::CallbackAnimator animator(
 *     [&sprite](const FSE::AnimationRequest &req) { sprite.play(req.name, req.speed, req.loop); },
 *     [&sprite](const std::string &name) { return sprite.frames().contains(name); });
 * sprite.onFinished = [&animator](const std::string &name) { animator.notifyFinished(name); };
 * @endcode
 */
class CallbackAnimator : public AnimatorAdapter {
public:
    using PlayFunction = std::function<void(const AnimationRequest &)>;
    using LookupFunction = std::function<bool(const std::string &)>;

    /**
     * @param play Starts playback on the backend
     * @param lookup Reports whether an animation exists (empty accepts every name)
     */
    explicit CallbackAnimator(PlayFunction play, LookupFunction lookup = nullptr);

protected:
    bool hasAnimation(const std::string &name) const override;
    void startPlayback(const AnimationRequest &request) override;

private:
    PlayFunction play_;
    LookupFunction lookup_;
};

}  // namespace FSE
