/**
 * CommandBroker.hpp - Request -> suggestion -> confirmation -> execution
 */

#pragma once

#include "shlama/Config.hpp"
#include "shlama/Errors.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace shlama {

class CommandGenerator;
class Console;
class Executor;
class ServerMonitor;

enum class BrokerState {
    Idle,
    ValidatingInput,
    EnsuringServer,
    Generating,
    AwaitingConfirmation,
    Executing,
    Done,
    Failed
};

const char* brokerStateName(BrokerState state);

struct BrokerOutcome {
    BrokerState state = BrokerState::Idle;
    ErrorKind error = ErrorKind::None;
    std::string suggestion;
    bool executed = false;
    int exit_status = 0;
};

class CommandBroker {
public:
    CommandBroker(const Configuration& config, ServerMonitor& server, CommandGenerator& generator,
                  Executor& executor, std::istream& input, Console& console);
    
    // Runs one request to Done or Failed; every failure is reported before returning
    BrokerOutcome run(const std::vector<std::string>& request_tokens);
    
    static std::string joinRequest(const std::vector<std::string>& tokens);
    
    // Exactly "y" or "Y"; anything else, including an empty line, declines
    static bool isConfirmation(const std::string& line);
    
private:
    const Configuration& config_;
    ServerMonitor& server_;
    CommandGenerator& generator_;
    Executor& executor_;
    std::istream& input_;
    Console& console_;
    
    void enter(BrokerOutcome& outcome, BrokerState state);
    BrokerOutcome& fail(BrokerOutcome& outcome, ErrorKind kind, const std::string& message);
    std::string serverRemediation() const;
};

} // namespace shlama
