/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  The user facing operations: rebase to an image and roll back to a
  deployment. Each call runs through validation, confirmation, execution in
  the background and the history ledger; the result is reported through a
  callback in the scheduler's delivery context.
 */

#ifndef R_K_ORCHESTRATOR_H
#define R_K_ORCHESTRATOR_H

#include "Command.hpp"
#include "CommandValidator.hpp"
#include "ConfirmationGate.hpp"
#include "Deployment.hpp"
#include "ErrorClassifier.hpp"
#include "Exceptions.hpp"
#include "HistoryLedger.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace RebaseKit {

class ExecutionEngine;
class OperationLock;
class ProgressSink;
class Scheduler;
class StatusReader;
struct ExecutionResult;

enum class OperationState {
    Idle, Validating, AwaitingConfirmation, Executing, Completed, Cancelled, Rejected
};

enum class OrchestratorError {
    None, OperationInProgress, NoCurrentDeploymentTarget, UnknownDeployment, StatusUnavailable
};

const char* toString(OperationState state);
const char* toString(OrchestratorError error);

struct OperationOutcome {
    OperationState state = OperationState::Idle;
    bool success = false;
    RuntimeErrorKind errorKind = RuntimeErrorKind::None;
    OrchestratorError orchestratorError = OrchestratorError::None;
    std::optional<ValidationError> validationError;
    // Always set for terminal states
    std::string message;
    // Only for Auth and Busy failures
    std::optional<Remedy> remedy;
    std::vector<std::string> output;
};

struct CancelResult {
    bool accepted = false;
    std::string message;
};

class Orchestrator;

/**
 * @brief Handle of a single rebase or rollback request
 */
class Invocation {
public:
    Invocation(OperationType type, ConfirmationPrompt& prompt, std::function<void(const OperationOutcome&)> onDone);

    OperationState state() const { return currentState; }
    OperationType operationType() const { return type; }
    bool isFinished() const;
    // Set once the invocation reached a terminal state
    const std::optional<OperationOutcome>& outcome() const { return result; }

    /**
     * @brief Withdraw the request
     *
     * Only possible while the confirmation is pending; once rpm-ostree is running the
     * operation can't be interrupted safely and the request is refused with an explanation.
     */
    CancelResult cancel();
private:
    friend class Orchestrator;
    void finish(OperationOutcome outcome);
    OperationType type;
    OperationState currentState = OperationState::Idle;
    std::optional<OperationOutcome> result;
    std::function<void(const OperationOutcome&)> onDone;
    std::unique_ptr<ConfirmationGate> gate;
};

class Orchestrator {
public:
    static constexpr const char* DEFAULT_IMAGE_TRANSPORT = "ostree-unverified-registry:";
    using DoneCallback = std::function<void(const OperationOutcome&)>;

    /**
     * All collaborators must outlive the orchestrator, which in turn must outlive every
     * invocation that is still executing.
     */
    Orchestrator(ExecutionEngine& engine, StatusReader& statusReader, HistoryLedger& ledger,
                 ConfirmationPrompt& prompt, ProgressSink& progress, Scheduler& scheduler,
                 OperationLock& lock, CommandValidator validator = CommandValidator{});
    // Dismisses all pending confirmations
    virtual ~Orchestrator();
    Orchestrator(const Orchestrator&) = delete;
    void operator=(const Orchestrator&) = delete;

    /**
     * @brief Prefix put in front of the image reference in the rebase command
     */
    void setImageTransport(const std::string& transport) { imageTransport = transport; }
    const std::string& getImageTransport() const { return imageTransport; }

    /**
     * @brief Rebase the system to the given image, e.g. "ghcr.io/ublue-os/bluefin:stable"
     * @param onDone called exactly once with the terminal outcome
     */
    std::shared_ptr<Invocation> rebaseTo(const std::string& imageRef, DoneCallback onDone);

    /**
     * @brief Make an existing deployment the default one for the next boot
     * @param deploymentId id or checksum prefix as shown by listDeployments()
     * @param onDone called exactly once with the terminal outcome
     */
    std::shared_ptr<Invocation> rollbackTo(const std::string& deploymentId, DoneCallback onDone);

    /**
     * @brief Current deployments; throws a StatusException if the status is unavailable
     */
    std::vector<Deployment> listDeployments();

    bool isExecuting() const;
private:
    std::shared_ptr<Invocation> start(OperationType type, DoneCallback onDone);
    void reject(const std::shared_ptr<Invocation>& invocation, OrchestratorError error, const std::string& message,
                std::optional<ValidationError> validationError = std::nullopt);
    void requestConfirmation(const std::shared_ptr<Invocation>& invocation, const OperationConfirmation& confirmation,
                             const Command& command, const std::string& imageName);
    void execute(const std::shared_ptr<Invocation>& invocation, const std::string& title, const Command& command,
                 const std::string& imageName);
    OperationOutcome complete(const std::string& title, const Command& command, const std::string& imageName,
                              OperationType type, const ExecutionResult& result);
    void finish(const std::shared_ptr<Invocation>& invocation, OperationOutcome outcome);

    ExecutionEngine& engine;
    StatusReader& statusReader;
    HistoryLedger& ledger;
    ConfirmationPrompt& prompt;
    ProgressSink& progress;
    Scheduler& scheduler;
    OperationLock& lock;
    CommandValidator validator;
    std::string imageTransport = DEFAULT_IMAGE_TRANSPORT;
    // Invocations which haven't reached a terminal state yet
    std::vector<std::shared_ptr<Invocation>> active;
};

} // namespace RebaseKit

#endif // R_K_ORCHESTRATOR_H
