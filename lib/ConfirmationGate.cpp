/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Explicit accept / cancel checkpoint in front of every system modification
 */

#include "ConfirmationGate.hpp"
#include "Log.hpp"
#include <stdexcept>
#include <utility>

namespace RebaseKit {

const char* toString(ConfirmationGate::State state) {
    switch (state) {
    case ConfirmationGate::State::Pending:
        return "Pending";
    case ConfirmationGate::State::Confirmed:
        return "Confirmed";
    case ConfirmationGate::State::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

ConfirmationGate::ConfirmationGate(ConfirmationPrompt& prompt) : prompt{prompt} {
}

ConfirmationGate::~ConfirmationGate() {
    try {
        dismiss();
    } catch (const std::exception &e) {
        rklog.error("ERROR: ", e.what());
    }
}

void ConfirmationGate::open(const OperationConfirmation& confirmation, ResolvedCallback onResolved) {
    if (opened)
        throw std::logic_error{"Confirmation gate has already been opened."};
    opened = true;
    this->confirmation = confirmation;
    this->onResolved = std::move(onResolved);
    rklog.debug("Asking for confirmation: ", confirmation.title);
    prompt.present(this->confirmation, *this);
}

void ConfirmationGate::confirm() {
    resolve(State::Confirmed);
}

void ConfirmationGate::cancel() {
    resolve(State::Cancelled);
}

void ConfirmationGate::dismiss() {
    if (opened && state == State::Pending)
        rklog.debug("Confirmation dismissed: ", confirmation.title);
    resolve(State::Cancelled);
}

void ConfirmationGate::resolve(State result) {
    if (!opened || state != State::Pending)
        return;
    state = result;
    rklog.debug("Confirmation ", toString(result), ": ", confirmation.title);
    // The continuation may destroy the gate; don't touch members afterwards
    ResolvedCallback callback = std::move(onResolved);
    onResolved = nullptr;
    if (callback)
        callback(result == State::Confirmed);
}

} // namespace RebaseKit
