#include "common/Logger.h"
#include "runtime/StateMachine.h"
#include "runtime/StateMachineBuilder.h"
#include <benchmark/benchmark.h>
#include <memory>
#include <string>

using namespace FSE;

// 60 Hz physics step
static constexpr double FRAME_DELTA = 1.0 / 60.0;

// ============================================================================
// Benchmark Fixture
// ============================================================================

class StateMachineFixture : public benchmark::Fixture {
protected:
    void SetUp(const ::benchmark::State & /*state*/) override {
        Logger::setLevel(LogLevel::Warn);
    }

    void TearDown(const ::benchmark::State & /*state*/) override {}

    // States 0..numStates-1 in a ring, each with `numTransitions` edges of which only the last fires
    std::unique_ptr<StateMachine> createRing(int numStates, int numTransitions, const bool *advance) {
        auto machine = StateMachineBuilder().build();
        for (int i = 0; i < numStates; ++i) {
            machine->addState(StateId(static_cast<StateId::ValueType>(i)));
        }

        for (int i = 0; i < numStates; ++i) {
            StateId from(static_cast<StateId::ValueType>(i));
            StateId next(static_cast<StateId::ValueType>((i + 1) % numStates));
            for (int t = 0; t < numTransitions - 1; ++t) {
                machine->addTransition(from, next, [] { return false; })->setPriority(numTransitions - t);
            }
            machine->addTransition(from, next, [advance] { return *advance; });
        }
        return machine;
    }
};

// ============================================================================
// Micro-Benchmarks: Frame Updates
// ============================================================================

// Measure update() when no condition holds
BENCHMARK_F(StateMachineFixture, IdleFrame)(benchmark::State &state) {
    bool advance = false;
    auto machine = createRing(3, 1, &advance);

    for (auto _ : state) {
        machine->update(TickKind::Physics, FRAME_DELTA);
        benchmark::DoNotOptimize(machine->getStateTime());
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel("3-state ring, no transition");
}

// Measure update() when every frame changes state
BENCHMARK_F(StateMachineFixture, TransitionEveryFrame)(benchmark::State &state) {
    bool advance = true;
    auto machine = createRing(3, 1, &advance);

    for (auto _ : state) {
        machine->update(TickKind::Physics, FRAME_DELTA);
        benchmark::DoNotOptimize(machine->getCurrentStateId());
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel("3-state ring, one transition per frame");
}

// Measure ranked evaluation cost against the number of candidate transitions
BENCHMARK_DEFINE_F(StateMachineFixture, CandidateScalability)(benchmark::State &state) {
    const int numTransitions = static_cast<int>(state.range(0));
    bool advance = true;
    auto machine = createRing(4, numTransitions, &advance);

    for (auto _ : state) {
        machine->update(TickKind::Physics, FRAME_DELTA);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel(std::to_string(numTransitions) + " transitions per state");
}
BENCHMARK_REGISTER_F(StateMachineFixture, CandidateScalability)->Arg(1)->Arg(8)->Arg(32);

// Measure global transitions evaluated after an empty local list
BENCHMARK_F(StateMachineFixture, GlobalTransitions)(benchmark::State &state) {
    auto machine = StateMachineBuilder().build();
    for (StateId::ValueType i = 0; i < 8; ++i) {
        machine->addState(StateId(i));
    }
    for (StateId::ValueType i = 0; i < 8; ++i) {
        machine->addGlobalTransition(StateId(i), [] { return false; });
    }

    for (auto _ : state) {
        machine->update(TickKind::Physics, FRAME_DELTA);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel("8 global transitions, none firing");
}

// ============================================================================
// Construction
// ============================================================================

BENCHMARK_F(StateMachineFixture, StateMachineCreation)(benchmark::State &state) {
    bool advance = false;
    for (auto _ : state) {
        auto machine = createRing(10, 2, &advance);
        benchmark::DoNotOptimize(machine.get());
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel("10 states, 20 transitions");
}

BENCHMARK_MAIN();
