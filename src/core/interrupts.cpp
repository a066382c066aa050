/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/interrupts.hpp"

#include <csignal>

std::atomic<bool> g_interrupted{false};

void signal_handler(int) noexcept {
    g_interrupted = true;
}

SignalGuard::SignalGuard() {
    g_interrupted = false;

    struct sigaction sa = {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);

    // No SA_RESTART: a blocked poll() must return EINTR so the flag is seen.
    sigaction(SIGINT, &sa, &old_int_);
    sigaction(SIGTERM, &sa, &old_term_);
}

SignalGuard::~SignalGuard() {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGTERM, &old_term_, nullptr);
}
