/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Explicit accept / cancel checkpoint in front of every system modification
 */

#ifndef R_K_CONFIRMATIONGATE_H
#define R_K_CONFIRMATIONGATE_H

#include "Command.hpp"
#include <functional>
#include <string>
#include <vector>

namespace RebaseKit {

class ConfirmationGate;

struct OperationConfirmation {
    std::string title;
    std::string description;
    // Display copy only; the executed argument vector is kept by the caller
    std::string command;
    std::vector<std::string> warnings;
    bool requiresReboot = false;
};

/**
 * @brief User facing collaborator presenting the confirmation
 *
 * present() may resolve the gate right away (e.g. a terminal prompt or --yes) or keep
 * a reference and resolve it later from the owning context.
 */
class ConfirmationPrompt {
public:
    virtual ~ConfirmationPrompt() = default;
    virtual void present(const OperationConfirmation& confirmation, ConfirmationGate& gate) = 0;
};

class ConfirmationGate {
public:
    enum class State {
        Pending, Confirmed, Cancelled
    };
    using ResolvedCallback = std::function<void(bool confirmed)>;

    explicit ConfirmationGate(ConfirmationPrompt& prompt);
    // Dismisses the gate if it is still pending
    virtual ~ConfirmationGate();
    ConfirmationGate(const ConfirmationGate&) = delete;
    void operator=(const ConfirmationGate&) = delete;

    /**
     * @brief Present the confirmation and register the continuation
     * @param onResolved called exactly once, with true on confirm() and false otherwise
     *
     * A gate can only be opened once.
     */
    void open(const OperationConfirmation& confirmation, ResolvedCallback onResolved);
    void confirm();
    void cancel();
    void dismiss();

    State getState() const { return state; }
    bool isOpen() const { return opened; }
    const OperationConfirmation& getConfirmation() const { return confirmation; }
private:
    void resolve(State result);
    ConfirmationPrompt& prompt;
    OperationConfirmation confirmation;
    ResolvedCallback onResolved;
    State state = State::Pending;
    bool opened = false;
};

const char* toString(ConfirmationGate::State state);

} // namespace RebaseKit

#endif // R_K_CONFIRMATIONGATE_H
