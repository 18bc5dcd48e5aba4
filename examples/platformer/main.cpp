#include "animation/AnimatorAdapter.h"
#include "common/Logger.h"
#include "runtime/StateMachineBuilder.h"
#include <iostream>
#include <string>

namespace {

enum class Player { Idle, Run, Jump, Fall };

std::string playerName(FSE::StateId id) {
    switch (id.as<Player>()) {
    case Player::Idle:
        return "Idle";
    case Player::Run:
        return "Run";
    case Player::Jump:
        return "Jump";
    case Player::Fall:
        return "Fall";
    }
    return "Unknown";
}

// Prints every change the machine reports
class ConsoleObserver : public FSE::IStateMachineObserver {
public:
    void onStateChanged(const std::optional<FSE::StateId> &from, FSE::StateId to) override {
        std::cout << "  [state] " << (from ? playerName(*from) : "None") << " -> " << playerName(to) << "\n";
    }

    void onStateTimeout(FSE::StateId state) override {
        std::cout << "  [timeout] " << playerName(state) << "\n";
    }
};

}  // namespace

int main() {
    using FSE::TickKind;

    FSE::Logger::initialize();

    std::cout << "=== Platformer Example ===" << "\n\n";

    bool moveHeld = false;
    bool jumpPressed = false;
    bool grounded = true;

    auto animator = std::make_shared<FSE::CallbackAnimator>([](const FSE::AnimationRequest &request) {
        std::cout << "  [anim] " << request.name << (request.loop ? " (loop)" : "") << "\n";
    });
    ConsoleObserver observer;

    auto machine =
        FSE::StateMachineBuilder().withAnimator(animator).withObserver(&observer).withIdFormatter(playerName).build();

    machine->addState(Player::Idle)->setAnimationData("idle", 1.0f, 0.1f, true).addTag("grounded");
    machine->addState(Player::Run, nullptr, nullptr, nullptr, 0.1f)
        ->setAnimationData("run", 1.2f, 0.1f, true)
        .addTag("grounded");
    machine->addState(Player::Jump, nullptr, [&] { grounded = false; }, nullptr, 0.0f, 0.5f)
        ->setAnimationData("jump")
        .setRestartId(Player::Fall);
    machine->addState(Player::Fall, nullptr, nullptr, [&] { grounded = true; })->setAnimationData("fall", 1.0f, 0.05f, true);

    machine->addTransition(Player::Idle, Player::Run, [&] { return moveHeld; });
    machine->addTransition(Player::Run, Player::Idle, [&] { return !moveHeld; });
    machine->addTransition(Player::Fall, Player::Idle, [&] { return !moveHeld; }, 0.25f);
    machine->addTransition(Player::Fall, Player::Run, [&] { return moveHeld; }, 0.25f);
    machine->addGlobalTransition(Player::Jump, [&] { return jumpPressed && machine->isInStateWithTag("grounded"); })
        ->setHighestPriority()
        .forceInstant();

    std::cout << machine->debugAllTransitions() << "\n\n";

    const double frame = 1.0 / 20.0;
    for (int i = 0; i < 40; ++i) {
        moveHeld = i >= 2 && i < 30;
        jumpPressed = i == 6;

        machine->update(TickKind::Physics, frame);
    }

    std::cout << "\nFinal: " << machine->debugCurrentTransition() << (grounded ? " (grounded)" : "") << "\n";

    FSE::Logger::flush();
    return 0;
}
