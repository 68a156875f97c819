/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  The user facing rebase and rollback operations
 */

#include "Orchestrator.hpp"
#include "ExecutionEngine.hpp"
#include "Log.hpp"
#include "OperationLock.hpp"
#include "ProgressTracker.hpp"
#include "Scheduler.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace RebaseKit {

const char* toString(OperationState state) {
    switch (state) {
    case OperationState::Idle:
        return "Idle";
    case OperationState::Validating:
        return "Validating";
    case OperationState::AwaitingConfirmation:
        return "AwaitingConfirmation";
    case OperationState::Executing:
        return "Executing";
    case OperationState::Completed:
        return "Completed";
    case OperationState::Cancelled:
        return "Cancelled";
    case OperationState::Rejected:
        return "Rejected";
    }
    return "Unknown";
}

const char* toString(OrchestratorError error) {
    switch (error) {
    case OrchestratorError::None:
        return "None";
    case OrchestratorError::OperationInProgress:
        return "OperationInProgress";
    case OrchestratorError::NoCurrentDeploymentTarget:
        return "NoCurrentDeploymentTarget";
    case OrchestratorError::UnknownDeployment:
        return "UnknownDeployment";
    case OrchestratorError::StatusUnavailable:
        return "StatusUnavailable";
    }
    return "Unknown";
}

Invocation::Invocation(OperationType type, ConfirmationPrompt& prompt, std::function<void(const OperationOutcome&)> onDone)
    : type{type}, onDone{std::move(onDone)}, gate{std::make_unique<ConfirmationGate>(prompt)} {
}

bool Invocation::isFinished() const {
    return currentState == OperationState::Completed || currentState == OperationState::Cancelled ||
           currentState == OperationState::Rejected;
}

CancelResult Invocation::cancel() {
    switch (currentState) {
    case OperationState::AwaitingConfirmation:
        gate->cancel();
        return {true, "Operation cancelled."};
    case OperationState::Executing:
        rklog.info("Ignoring cancel request for running ", toString(type), ".");
        return {false, "The operation is already running and can't be interrupted safely; "
                       "it will continue until rpm-ostree has finished."};
    case OperationState::Completed:
    case OperationState::Cancelled:
    case OperationState::Rejected:
        return {false, "The operation has already finished."};
    default:
        return {false, "The operation hasn't been started yet."};
    }
}

void Invocation::finish(OperationOutcome outcome) {
    if (isFinished())
        return;
    currentState = outcome.state;
    result = std::move(outcome);
    auto callback = std::move(onDone);
    onDone = nullptr;
    if (callback)
        callback(*result);
}

Orchestrator::Orchestrator(ExecutionEngine& engine, StatusReader& statusReader, HistoryLedger& ledger,
                           ConfirmationPrompt& prompt, ProgressSink& progress, Scheduler& scheduler,
                           OperationLock& lock, CommandValidator validator)
    : engine{engine}, statusReader{statusReader}, ledger{ledger}, prompt{prompt}, progress{progress},
      scheduler{scheduler}, lock{lock}, validator{std::move(validator)} {
}

Orchestrator::~Orchestrator() {
    // Dismissing a gate finishes its invocation, which removes it from the list
    std::vector<std::shared_ptr<Invocation>> pending = active;
    for (auto& invocation: pending) {
        if (invocation->state() == OperationState::AwaitingConfirmation) {
            try {
                invocation->gate->dismiss();
            } catch (const std::exception &e) {
                rklog.error("ERROR: ", e.what());
            }
        }
    }
}

bool Orchestrator::isExecuting() const {
    return lock.isHeld();
}

std::vector<Deployment> Orchestrator::listDeployments() {
    return statusReader.read();
}

std::shared_ptr<Invocation> Orchestrator::start(OperationType type, DoneCallback onDone) {
    auto invocation = std::make_shared<Invocation>(type, prompt, std::move(onDone));
    active.push_back(invocation);
    if (lock.isHeld()) {
        reject(invocation, OrchestratorError::OperationInProgress,
               "Another operation is already in progress; please wait until it has finished.");
        return invocation;
    }
    invocation->currentState = OperationState::Validating;
    return invocation;
}

std::shared_ptr<Invocation> Orchestrator::rebaseTo(const std::string& imageRef, DoneCallback onDone) {
    auto invocation = start(OperationType::Rebase, std::move(onDone));
    if (invocation->isFinished())
        return invocation;

    Command command{ALLOWED_PROGRAM, "rebase", imageTransport + imageRef};
    try {
        validator.validateImageReference(imageRef);
        CommandValidator::validate(command);
    } catch (const ValidationException &e) {
        rklog.info("Rejecting rebase to '", imageRef, "': ", e.what());
        reject(invocation, OrchestratorError::None, e.what(), e.kind);
        return invocation;
    }

    std::string name = friendlyImageName(imageRef);
    OperationConfirmation confirmation;
    confirmation.title = "Rebase to " + name;
    confirmation.description = "The system will be rebased to " + imageRef +
        ". The new image is downloaded and staged as a new deployment which becomes active after a reboot.";
    confirmation.command = toDisplayString(command);
    confirmation.warnings = {
        "Back up important data before changing the system image.",
        "Layered packages or local changes that don't apply to the new image may be lost.",
        "A reboot is required to apply the new image."
    };
    confirmation.requiresReboot = true;
    requestConfirmation(invocation, confirmation, command, imageRef);
    return invocation;
}

std::shared_ptr<Invocation> Orchestrator::rollbackTo(const std::string& deploymentId, DoneCallback onDone) {
    auto invocation = start(OperationType::Rollback, std::move(onDone));
    if (invocation->isFinished())
        return invocation;

    std::vector<Deployment> deployments;
    try {
        deployments = statusReader.read();
    } catch (const StatusException &e) {
        rklog.error("Deployment status unavailable: ", e.what());
        reject(invocation, OrchestratorError::StatusUnavailable, e.what());
        return invocation;
    }

    const Deployment* target = findDeployment(deploymentId, deployments);
    if (target == nullptr) {
        reject(invocation, OrchestratorError::UnknownDeployment, "Unknown deployment '" + deploymentId + "'.");
        return invocation;
    }
    std::optional<Command> command = generateRollbackCommand(deploymentId, deployments);
    if (target->isBooted || !command) {
        reject(invocation, OrchestratorError::NoCurrentDeploymentTarget,
               "Deployment " + target->id + " is the currently booted deployment; there is nothing to roll back to.");
        return invocation;
    }
    try {
        CommandValidator::validate(*command);
    } catch (const ValidationException &e) {
        reject(invocation, OrchestratorError::None, e.what(), e.kind);
        return invocation;
    }

    std::string name = friendlyImageName(target->origin);
    OperationConfirmation confirmation;
    confirmation.title = "Roll back to " + name + " " + target->version;
    confirmation.description = "Deployment " + target->id + " (" + target->origin + ", deployed " +
        target->timestamp + ") will become the default for the next boot.";
    confirmation.command = toDisplayString(*command);
    confirmation.warnings = {
        "Back up important data before switching deployments.",
        "Changes made since this deployment was created, such as layered packages, may be lost.",
        "A reboot is required to boot into the selected deployment."
    };
    confirmation.requiresReboot = true;
    requestConfirmation(invocation, confirmation, *command, target->origin);
    return invocation;
}

void Orchestrator::requestConfirmation(const std::shared_ptr<Invocation>& invocation,
                                       const OperationConfirmation& confirmation, const Command& command,
                                       const std::string& imageName) {
    invocation->currentState = OperationState::AwaitingConfirmation;
    std::string title = confirmation.title;
    invocation->gate->open(confirmation, [this, invocation, title, command, imageName](bool confirmed) {
        if (!confirmed) {
            rklog.info(title, " cancelled.");
            OperationOutcome outcome;
            outcome.state = OperationState::Cancelled;
            outcome.message = "Operation cancelled by user.";
            finish(invocation, outcome);
            return;
        }
        execute(invocation, title, command, imageName);
    });
}

void Orchestrator::execute(const std::shared_ptr<Invocation>& invocation, const std::string& title,
                           const Command& command, const std::string& imageName) {
    std::shared_ptr<OperationLease> lease;
    try {
        lease = lock.tryAcquire();
    } catch (const std::runtime_error &e) {
        reject(invocation, OrchestratorError::None, e.what());
        return;
    }
    if (!lease) {
        reject(invocation, OrchestratorError::OperationInProgress,
               "Another operation is already in progress; please wait until it has finished.");
        return;
    }

    invocation->currentState = OperationState::Executing;
    rklog.info(title, ": executing `", toDisplayString(command), "`.");
    progress.started(title);

    scheduler.runInBackground([this, invocation, title, command, imageName, lease = std::move(lease)]() mutable {
        ExecutionResult result;
        try {
            result = engine.executePrivileged(command, [this](const std::string& line) {
                scheduler.deliver([this, line]() { progress.line(line); });
            });
        } catch (const std::exception &e) {
            rklog.error("ERROR: ", e.what());
            result.success = false;
            result.errorKind = RuntimeErrorKind::Unknown;
            result.output.push_back(e.what());
        }
        // The lease travels with the result so it is released in the delivery context
        scheduler.deliver([this, invocation, title, command, imageName, result, lease = std::move(lease)]() mutable {
            OperationOutcome outcome = complete(title, command, imageName, invocation->operationType(), result);
            lease.reset();
            finish(invocation, std::move(outcome));
        });
    });
}

OperationOutcome Orchestrator::complete(const std::string& title, const Command& command, const std::string& imageName,
                                        OperationType type, const ExecutionResult& result) {
    OperationOutcome outcome;
    outcome.state = OperationState::Completed;
    outcome.success = result.success;
    outcome.errorKind = result.errorKind;
    outcome.output = result.output;
    if (result.success) {
        outcome.message = title + " completed successfully. Reboot to apply the changes.";
    } else {
        outcome.message = ErrorClassifier::userMessage(result.errorKind, result.output);
        outcome.remedy = ErrorClassifier::remedyFor(result.errorKind);
    }

    try {
        ledger.addEntry(toDisplayString(command), result.success, imageName, type,
                        result.success ? std::string{} : outcome.message);
    } catch (const std::exception &e) {
        rklog.error("ERROR: Could not record history entry: ", e.what());
    }

    progress.finished(result.success, outcome.message);
    if (result.success)
        rklog.info(outcome.message);
    else
        rklog.error(title, " failed (", toString(result.errorKind), "): ", outcome.message);
    return outcome;
}

void Orchestrator::reject(const std::shared_ptr<Invocation>& invocation, OrchestratorError error,
                          const std::string& message, std::optional<ValidationError> validationError) {
    OperationOutcome outcome;
    outcome.state = OperationState::Rejected;
    outcome.orchestratorError = error;
    outcome.validationError = validationError;
    outcome.message = message;
    finish(invocation, std::move(outcome));
}

void Orchestrator::finish(const std::shared_ptr<Invocation>& invocation, OperationOutcome outcome) {
    active.erase(std::remove(active.begin(), active.end(), invocation), active.end());
    invocation->finish(std::move(outcome));
}

} // namespace RebaseKit
