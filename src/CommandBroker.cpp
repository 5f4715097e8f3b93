/**
 * CommandBroker.cpp - Request -> suggestion -> confirmation -> execution
 */

#include "shlama/CommandBroker.hpp"
#include "shlama/Console.hpp"
#include "shlama/Executor.hpp"
#include "shlama/OllamaClient.hpp"
#include "shlama/ServerLauncher.hpp"

#include <istream>
#include <ostream>

namespace shlama {

const char* brokerStateName(BrokerState state) {
    switch (state) {
        case BrokerState::Idle: return "Idle";
        case BrokerState::ValidatingInput: return "ValidatingInput";
        case BrokerState::EnsuringServer: return "EnsuringServer";
        case BrokerState::Generating: return "Generating";
        case BrokerState::AwaitingConfirmation: return "AwaitingConfirmation";
        case BrokerState::Executing: return "Executing";
        case BrokerState::Done: return "Done";
        case BrokerState::Failed: return "Failed";
    }
    return "Unknown";
}

CommandBroker::CommandBroker(const Configuration& config, ServerMonitor& server,
                             CommandGenerator& generator, Executor& executor,
                             std::istream& input, Console& console)
    : config_(config),
      server_(server),
      generator_(generator),
      executor_(executor),
      input_(input),
      console_(console) {}

std::string CommandBroker::joinRequest(const std::vector<std::string>& tokens) {
    std::string request;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) request += " ";
        request += tokens[i];
    }
    return trim(request);
}

bool CommandBroker::isConfirmation(const std::string& line) {
    std::string answer = line;
    while (!answer.empty() && (answer.back() == '\r' || answer.back() == '\n')) {
        answer.pop_back();
    }
    return answer == "y" || answer == "Y";
}

void CommandBroker::enter(BrokerOutcome& outcome, BrokerState state) {
    console_.debug(std::string(brokerStateName(outcome.state)) + " -> " + brokerStateName(state));
    outcome.state = state;
}

BrokerOutcome& CommandBroker::fail(BrokerOutcome& outcome, ErrorKind kind,
                                   const std::string& message) {
    console_.error(message);
    outcome.error = kind;
    enter(outcome, BrokerState::Failed);
    return outcome;
}

std::string CommandBroker::serverRemediation() const {
    if (isLoopbackUrl(config_.server_url)) {
        return "Could not reach or start Ollama at " + config_.server_url + ".\n"
               "Install it from https://ollama.com, then run 'ollama serve' and try again.";
    }
    return "Could not reach the inference server at " + config_.server_url + ".\n"
           "Remote servers are not started automatically; check that it is running "
           "or fix OLLAMA_HOST.";
}

BrokerOutcome CommandBroker::run(const std::vector<std::string>& request_tokens) {
    BrokerOutcome outcome;
    
    enter(outcome, BrokerState::ValidatingInput);
    std::string request = joinRequest(request_tokens);
    if (request.empty()) {
        return fail(outcome, ErrorKind::Usage,
                    "No request provided. Usage: shlama \"describe what you want to do\"");
    }
    
    enter(outcome, BrokerState::EnsuringServer);
    if (!server_.ensureReady()) {
        return fail(outcome, ErrorKind::ServerUnavailable, serverRemediation());
    }
    
    enter(outcome, BrokerState::Generating);
    console_.debug("Model: " + config_.model + ", request: " + request);
    GenerateResponse response = generator_.generateCommand(request);
    if (!response.success || response.content.empty()) {
        ErrorKind kind = response.kind == ErrorKind::EmptySuggestion || response.success
            ? ErrorKind::EmptySuggestion
            : ErrorKind::Inference;
        console_.debug(response.error);
        return fail(outcome, kind, "Failed to generate command: " +
                    (response.error.empty() ? std::string("empty response") : response.error));
    }
    outcome.suggestion = response.content;
    
    enter(outcome, BrokerState::AwaitingConfirmation);
    console_.suggestion(outcome.suggestion);
    console_.prompt("\nExecute? [y/N] ");
    
    std::string answer;
    if (!std::getline(input_, answer)) {
        console_.out() << "\n";
        answer.clear();
    }
    
    if (!isConfirmation(answer)) {
        console_.info("Command not executed.");
        enter(outcome, BrokerState::Done);
        return outcome;
    }
    
    enter(outcome, BrokerState::Executing);
    outcome.executed = true;
    ExecutionResult result = executor_.run(outcome.suggestion);
    outcome.exit_status = result.exit_status;
    
    if (!result.started) {
        outcome.error = ErrorKind::Execution;
        console_.error("Could not run the command: " + result.error);
    } else if (result.exit_status != 0) {
        outcome.error = ErrorKind::Execution;
        console_.warn("The command ran but failed (" + result.error + ").");
        console_.warn("It may have made partial changes before failing.");
    } else {
        console_.success("Done.");
    }
    
    enter(outcome, BrokerState::Done);
    return outcome;
}

} // namespace shlama
