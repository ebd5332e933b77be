#pragma once

#include <string>

// Cancellation flag observed by the command executor at its wait point.
class InterruptSource {
public:
    virtual ~InterruptSource() = default;

    virtual bool pending() const = 0;
    virtual void clear() = 0;
};

// Synchronous yes/no question put to whoever drives the command.
class Prompter {
public:
    virtual ~Prompter() = default;

    // Returns default_answer on empty input or end of input, and
    // interrupt_answer when `interrupts` fires while waiting.
    virtual bool confirm(const std::string& question, bool default_answer,
                         bool interrupt_answer, InterruptSource& interrupts) = 0;
};

namespace platform {

// Turns SIGINT into a pending flag for its lifetime; the previous
// disposition is restored on destruction. Watches may nest.
class SigintWatch : public InterruptSource {
public:
    SigintWatch();
    ~SigintWatch() override;

    SigintWatch(const SigintWatch&) = delete;
    SigintWatch& operator=(const SigintWatch&) = delete;

    bool pending() const override;
    void clear() override;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

} // namespace platform
