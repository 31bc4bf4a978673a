// File: src/cli/careledger_cli.hpp
//
// CareLedger CLI class definition
// Extracted for testability

#ifndef CARELEDGER_CLI_HPP
#define CARELEDGER_CLI_HPP

#include "cli/cli_config.hpp"
#include "service/memory_service.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace careledger {

/// ANSI color codes for terminal output
namespace Color {
    inline const char* RESET = "\033[0m";
    inline const char* RED = "\033[31m";
    inline const char* GREEN = "\033[32m";
    inline const char* YELLOW = "\033[33m";
    inline const char* CYAN = "\033[36m";
    inline const char* BOLD_RED = "\033[1;31m";
    inline const char* BOLD_CYAN = "\033[1;36m";
    inline const char* DIM = "\033[2m";
}

/// Line-oriented command interpreter over a MemoryService
///
/// Commands:
///   ingest <owner> [YYYY-MM-DD] [category] :: <text>
///   query <owner> <text>
///   maintain <owner> [YYYY-MM-DD]
///   purge <owner>
///   timeline <owner>
///   summary <owner>
///   stats | help | quit
class CareLedgerCli {
public:
    /// Opens the store named by the config
    /// @throws StorageError if the store cannot be opened
    explicit CareLedgerCli(const CliConfig& config, std::ostream& out = std::cout);

    /// Read commands from `in` until quit or end of input
    void Run(std::istream& in);

    /// Process a single command line
    void ProcessCommand(const std::string& input);

    bool IsRunning() const { return running_; }
    size_t GetCommandsProcessed() const { return commands_processed_; }
    size_t GetErrorCount() const { return errors_; }

    MemoryService& GetService() { return *service_; }

private:
    CliConfig config_;
    std::ostream& out_;
    std::unique_ptr<MemoryService> service_;

    bool running_ = true;
    bool colors_enabled_ = true;
    size_t commands_processed_ = 0;
    size_t errors_ = 0;

    void PrintWelcome();

    // Commands
    void Ingest(const std::string& args);
    void Query(const std::string& args);
    void Maintain(const std::string& args);
    void Purge(const std::string& args);
    void ShowTimeline(const std::string& args);
    void ShowSummary(const std::string& args);
    void ShowProgression(const std::string& args);
    void ShowStatistics();
    void ShowHelp();

    void PrintOutcome(const QueryOutcome& outcome);

    // Color helpers
    const char* C(const char* color) const { return colors_enabled_ ? color : ""; }
};

} // namespace careledger

#endif // CARELEDGER_CLI_HPP
