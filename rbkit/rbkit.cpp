/* SPDX-License-Identifier: GPL-2.0-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  rbkit - rebase or roll back an image based system
 */

#include "rbkit.hpp"
#include "CommandValidator.hpp"
#include "Configuration.hpp"
#include "ConfirmationGate.hpp"
#include "Deployment.hpp"
#include "ErrorClassifier.hpp"
#include "ExecutionEngine.hpp"
#include "Log.hpp"
#include "OperationLock.hpp"
#include "Orchestrator.hpp"
#include "PrivilegeEscalator.hpp"
#include "ProcessSpawner.hpp"
#include "ProgressTracker.hpp"
#include "RegistryAllowList.hpp"
#include "RegistryBrowser.hpp"
#include "Scheduler.hpp"
#include "Util.hpp"
#include <getopt.h>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;
using namespace RebaseKit;

namespace {

void logPendingSignal() {
    int signal = PendingSignal::take();
    if (signal != 0)
        rklog.debug("rbkit: Received signal ", signal);
}

class TerminalPrompt : public ConfirmationPrompt {
public:
    explicit TerminalPrompt(bool assumeYes) : assumeYes{assumeYes} {}
    void present(const OperationConfirmation& confirmation, ConfirmationGate& gate) override {
        cout << confirmation.title << "\n\n";
        cout << confirmation.description << "\n\n";
        cout << "Command: " << confirmation.command << "\n";
        for (auto& warning: confirmation.warnings) {
            cout << "Warning: " << warning << "\n";
        }
        if (confirmation.requiresReboot)
            cout << "A reboot will be required.\n";
        cout << endl;

        if (assumeYes) {
            gate.confirm();
            return;
        }
        cout << "Continue? [y/N] " << flush;
        string answer;
        if (!getline(cin, answer)) {
            gate.dismiss();
            return;
        }
        Util::trim(answer);
        answer = Util::toLower(answer);
        if (answer == "y" || answer == "yes")
            gate.confirm();
        else
            gate.cancel();
    }
private:
    bool assumeYes;
};

class ConsoleProgress : public ProgressTracker {
public:
    void started(const string& operation) override {
        ProgressTracker::started(operation);
        cout << operation << "..." << endl;
    }
    void line(const string& text) override {
        ProgressTracker::line(text);
        if (getPercent())
            cout << "[" << *getPercent() << "%] ";
        cout << ProgressTracker::stripAnsi(text) << endl;
        if (!getStage().empty() && getStage() != lastStage) {
            lastStage = getStage();
            rklog.info("Stage: ", lastStage);
        }
    }
private:
    string lastStage;
};

// Everything needed to run an operation, wired with the system configuration
struct Session {
    ForkExecSpawner spawner;
    PkexecEscalator escalator;
    ExecutionEngine engine{spawner, escalator, ErrorClassifier::fromConfig(config)};
    StatusReader statusReader{spawner};
    HistoryLedger ledger{};
    TerminalPrompt prompt;
    ConsoleProgress progress;
    BackgroundScheduler scheduler;
    OperationLock lock{config.get("LOCKFILE")};
    Orchestrator orchestrator{engine, statusReader, ledger, prompt, progress, scheduler, lock,
                              CommandValidator{RegistryAllowList::fromConfig(config)}};

    explicit Session(bool assumeYes) : prompt{assumeYes} {
        string transport = config.get("IMAGE_TRANSPORT");
        if (!transport.empty())
            orchestrator.setImageTransport(transport);
    }

    // Waits for the operation to finish and prints its result
    int run(const function<shared_ptr<Invocation>(Orchestrator::DoneCallback)>& operation) {
        optional<OperationOutcome> outcome;
        operation([&outcome](const OperationOutcome& o) { outcome = o; });
        scheduler.waitUntil([&outcome] { return outcome.has_value(); });
        logPendingSignal();

        switch (outcome->state) {
        case OperationState::Completed:
            if (outcome->success) {
                cout << outcome->message << endl;
                return 0;
            }
            if (outcome->remedy)
                cerr << "Suggested action: " << outcome->remedy->description << endl;
            throw runtime_error{outcome->message};
        case OperationState::Cancelled:
            cout << outcome->message << endl;
            return 2;
        default:
            throw runtime_error{outcome->message};
        }
    }
};

string parseNextArgument(char *argv[], int& i, const string& option) {
    if (argv[i + 1] == nullptr)
        throw invalid_argument{"Missing argument for '" + option + "'."};
    return argv[++i];
}

} // namespace

void RBKit::displayHelp() {
    cout << "Syntax: rbkit [option...] command\n";
    cout << "\n";
    cout << "Rebase or roll back an image based (rpm-ostree) system\n";
    cout << "\n";
    cout << "Operation Commands:\n";
    cout << "rebase <image>\n";
    cout << "\tRebases the system to the given container image, e.g.\n";
    cout << "\tghcr.io/ublue-os/bluefin:stable; the image has to match one of the\n";
    cout << "\tallowed registries and repositories. A reboot is required afterwards.\n";
    cout << "rollback <ID>\n";
    cout << "\tMakes the deployment with the given ID (or checksum prefix) the default\n";
    cout << "\tfor the next boot\n";
    cout << "\n";
    cout << "Operation Options:\n";
    cout << "--yes, -y                    Don't ask for confirmation\n";
    cout << "\n";
    cout << "Query Commands:\n";
    cout << "deployments\n";
    cout << "\tPrints a list of all deployments\n";
    cout << "images [--branch stable|testing|all] [--days <N>|--all-dates] [<repository>]\n";
    cout << "\tLists the image tags available in the registry, newest first, by default\n";
    cout << "\tthe stable tags of the last " << RegistryBrowser::RECENT_DAYS << " days of the booted image's repository;\n";
    cout << "\trequires skopeo\n";
    cout << "history [--limit <N>] [--type rebase|rollback] [--failed|--succeeded]\n";
    cout << "\tPrints the most recent operations, newest first\n";
    cout << "report\n";
    cout << "\tPrints an audit report of the recorded operations as JSON\n";
    cout << "export-history <file>\n";
    cout << "\tWrites the recorded operations to the given file as JSON\n";
    cout << "clear-history\n";
    cout << "\tDeletes all recorded operations\n";
    cout << "\n";
    cout << "Generic Options:\n";
    cout << "--help, -h                   Display this help and exit\n";
    cout << "--quiet, -q                  Decrease verbosity\n";
    cout << "--verbose, -v                Increase verbosity\n";
    cout << "--version, -V                Display version and exit\n" << endl;
}

int RBKit::parseOptions(int argc, char *argv[]) {
    static const char optstring[] = "+hqvVy";
    static const struct option longopts[] = {
        { "help", no_argument, nullptr, 'h' },
        { "quiet", no_argument, nullptr, 'q' },
        { "verbose", no_argument, nullptr, 'v' },
        { "version", no_argument, nullptr, 'V' },
        { "yes", no_argument, nullptr, 'y' },
        { 0, 0, 0, 0 }
    };

    int c;
    int lopt_idx;

    while ((c = getopt_long(argc, argv, optstring, longopts, &lopt_idx)) != -1) {
        switch (c) {
        case 'h':
            displayHelp();
            return 0;
        case 'q':
            rklog.level = RKLogLevel::Error;
            break;
        case 'v':
            rklog.level = RKLogLevel::Debug;
            break;
        case 'V':
            cout << VERSION << endl;
            return 0;
        case 'y':
            assumeYes = true;
            break;
        case '?':
            displayHelp();
            return -1;
        }
    }

    return optind;
}

Request RBKit::parseRequest(char *argv[]) {
    if (argv[0] == nullptr) {
        throw invalid_argument{"Missing command. See --help for usage information."};
    }
    string arg = argv[0];
    if (arg == "rebase") {
        if (argv[1] == nullptr)
            throw invalid_argument{"Missing image for 'rebase'."};
        return RebaseRequest{argv[1]};
    }
    else if (arg == "rollback") {
        if (argv[1] == nullptr)
            throw invalid_argument{"Missing deployment ID for 'rollback'. See 'rbkit deployments'."};
        return RollbackRequest{argv[1]};
    }
    else if (arg == "deployments") {
        return ListDeploymentsRequest{};
    }
    else if (arg == "history") {
        HistoryRequest request;
        for (int i = 1; argv[i] != nullptr; i++) {
            string option = argv[i];
            if (option == "--limit") {
                string value = parseNextArgument(argv, i, option);
                try {
                    request.limit = stoul(value);
                } catch (const exception &) {
                    throw invalid_argument{"Invalid limit '" + value + "'."};
                }
            } else if (option == "--type") {
                string value = parseNextArgument(argv, i, option);
                request.type = operationTypeFromString(value);
                if (!request.type)
                    throw invalid_argument{"Invalid operation type '" + value + "', expected rebase or rollback."};
            } else if (option == "--failed") {
                request.success = false;
            } else if (option == "--succeeded") {
                request.success = true;
            } else {
                throw invalid_argument{"Unknown option '" + option + "' for 'history'."};
            }
        }
        return request;
    }
    else if (arg == "images") {
        ImagesRequest request;
        for (int i = 1; argv[i] != nullptr; i++) {
            string option = argv[i];
            if (option == "--branch") {
                string value = parseNextArgument(argv, i, option);
                optional<ImageBranch> branch = imageBranchFromString(value);
                if (!branch)
                    throw invalid_argument{"Invalid branch '" + value + "', expected stable, testing or all."};
                request.branch = *branch;
            } else if (option == "--days") {
                string value = parseNextArgument(argv, i, option);
                try {
                    request.days = stoi(value);
                } catch (const exception &) {
                    throw invalid_argument{"Invalid number of days '" + value + "'."};
                }
                if (*request.days < 0)
                    throw invalid_argument{"Invalid number of days '" + value + "'."};
            } else if (option == "--all-dates") {
                request.days.reset();
            } else if (!option.empty() && option[0] != '-' && !request.repository) {
                request.repository = option;
            } else {
                throw invalid_argument{"Unknown option '" + option + "' for 'images'."};
            }
        }
        return request;
    }
    else if (arg == "clear-history") {
        return ClearHistoryRequest{};
    }
    else if (arg == "report") {
        return ReportRequest{};
    }
    else if (arg == "export-history") {
        if (argv[1] == nullptr)
            throw invalid_argument{"Missing file name for 'export-history'."};
        return ExportHistoryRequest{argv[1]};
    }
    else {
        displayHelp();
        throw invalid_argument{"Unknown command or option '" + arg + "'."};
    }
}

int RBKit::processCommand(char *argv[]) {
    Request request = parseRequest(argv);
    return visit([this](const auto& r) { return handle(r); }, request);
}

int RBKit::handle(const RebaseRequest& request) {
    Session session{assumeYes};
    return session.run([&](Orchestrator::DoneCallback onDone) {
        return session.orchestrator.rebaseTo(request.imageRef, onDone);
    });
}

int RBKit::handle(const RollbackRequest& request) {
    Session session{assumeYes};
    return session.run([&](Orchestrator::DoneCallback onDone) {
        return session.orchestrator.rollbackTo(request.deploymentId, onDone);
    });
}

int RBKit::handle(const ListDeploymentsRequest&) {
    ForkExecSpawner spawner;
    StatusReader statusReader{spawner};
    bool first = true;
    for (auto& deployment: statusReader.read()) {
        if (!first)
            cout << "\n";
        cout << formatDeploymentInfo(deployment) << endl;
        first = false;
    }
    return 0;
}

int RBKit::handle(const ImagesRequest& request) {
    ForkExecSpawner spawner;
    string repository;
    if (request.repository) {
        repository = *request.repository;
    } else {
        StatusReader statusReader{spawner};
        vector<Deployment> deployments = statusReader.read();
        const Deployment* booted = bootedDeployment(deployments);
        if (booted == nullptr)
            throw runtime_error{"No booted deployment found."};
        repository = RegistryBrowser::repositoryFromOrigin(booted->origin);
        rklog.info("Listing images of ", repository, ".");
    }

    RegistryBrowser browser{spawner, RegistryAllowList::fromConfig(config)};
    vector<RegistryImage> images = request.days
        ? browser.getRecentImages(repository, *request.days, request.branch)
        : browser.listImageTags(repository, request.branch);
    if (images.empty()) {
        cout << "No " << toString(request.branch) << " images found for " << repository << "." << endl;
        return 0;
    }
    for (auto& image: images) {
        cout << image.reference() << "\t" << image.formattedDate();
        if (optional<long> age = image.ageDays())
            cout << "\t" << *age << " days old";
        cout << endl;
    }
    return 0;
}

int RBKit::handle(const HistoryRequest& request) {
    HistoryLedger ledger{};
    for (auto& entry: ledger.query(request.type, request.success, request.limit)) {
        cout << entry.formattedTime() << "\t" << toString(entry.operationType) << "\t"
             << (entry.success ? "OK" : "FAILED") << "\t" << entry.command << endl;
        if (!entry.errorMessage.empty())
            cout << "\t" << entry.errorMessage << endl;
    }
    return 0;
}

int RBKit::handle(const ClearHistoryRequest&) {
    HistoryLedger ledger{};
    ledger.clear();
    cout << "History cleared." << endl;
    return 0;
}

int RBKit::handle(const ReportRequest&) {
    HistoryLedger ledger{};
    cout << ledger.securityReport().toJson() << endl;
    return 0;
}

int RBKit::handle(const ExportHistoryRequest& request) {
    HistoryLedger ledger{};
    ledger.exportTo(request.file);
    cout << "History exported to " << request.file << "." << endl;
    return 0;
}

void interrupt(int signal) {
    // rpm-ostree receives the signal as well, being part of the same process group;
    // it decides on its own whether the transaction can be aborted. The logger takes a
    // lock, so the signal is only logged once the operation has finished.
    PendingSignal::record(signal);
}

RBKit::RBKit(int argc, char *argv[]) {
    signal(SIGHUP, interrupt);
    signal(SIGQUIT, interrupt);
    signal(SIGTERM, interrupt);

    rklog.level = RKLogLevel::Info;

    int ret = parseOptions(argc, argv);
    if (ret <= 0) {
        throw ret;
    }

    rklog.info("rbkit ", VERSION, " started");

    string optionsline = "Options: ";
    for(int i = 1; i < argc; ++i)
        optionsline.append(argv[i]).append(" ");
    rklog.debug(optionsline);

    ret = processCommand(&argv[ret]);
    logPendingSignal();
    if (ret != 0) {
        throw ret;
    }

    rklog.info("rbkit finished.");
}
