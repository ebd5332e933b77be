#include "interrupt.hpp"

#ifndef _WIN32
#  include <signal.h>
#endif

namespace platform {

#ifdef _WIN32

// Console Ctrl-C is not routed into the flag on Windows; the process
// keeps its default behaviour.
struct SigintWatch::Impl {};

SigintWatch::SigintWatch() : impl_(new Impl) {}
SigintWatch::~SigintWatch() { delete impl_; }
bool SigintWatch::pending() const { return false; }
void SigintWatch::clear() {}

#else

static volatile sig_atomic_t g_sigint_flag = 0;

static void sigint_handler(int) {
    g_sigint_flag = 1;
}

struct SigintWatch::Impl {
    struct sigaction old_sa;
    sig_atomic_t old_flag;
};

SigintWatch::SigintWatch() : impl_(new Impl) {
    impl_->old_flag = g_sigint_flag;
    g_sigint_flag = 0;

    struct sigaction sa;
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART: blocking reads return EINTR
    sigaction(SIGINT, &sa, &impl_->old_sa);
}

SigintWatch::~SigintWatch() {
    sigaction(SIGINT, &impl_->old_sa, nullptr);
    g_sigint_flag = impl_->old_flag;
    delete impl_;
}

bool SigintWatch::pending() const {
    return g_sigint_flag != 0;
}

void SigintWatch::clear() {
    g_sigint_flag = 0;
}

#endif

} // namespace platform
