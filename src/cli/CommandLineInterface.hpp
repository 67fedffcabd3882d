/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for cadastral-gen
 */

#pragma once

#include "cadastral_generator.hpp"
#include "SimpleCommandLineParser.hpp"
#include "ConfigurationManager.hpp"
#include <string>
#include <vector>

namespace cadgen {

/**
 * @brief Exit status of the command-line tool
 */
enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_PROCESSING_ERROR = 1,
    EXIT_USAGE_ERROR = 2,
    EXIT_CANCELLED = 130
};

/**
 * @brief Parses arguments and merges them over an optional JSON config file
 *
 * Precedence, lowest first: built-in defaults, --config file, the
 * CADGEN_LOG_LEVEL / CADGEN_LOG_FILE environment variables, command-line
 * options.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if the program should run; false after --help, --version,
     *         --create-config or a usage error (see exit_code())
     */
    bool parse_arguments(int argc, char* argv[]);

    const GeneratorConfig& get_config() const { return config_; }
    const RunOptions& get_run_options() const { return run_options_; }

    bool is_dry_run() const { return run_options_.dry_run; }
    bool is_silent() const { return silent_; }

    /**
     * @brief Exit status to use when parse_arguments() returned false
     */
    int exit_code() const { return exit_code_; }

    /**
     * @brief Apply log level, facility levels and log file to the Logger registry
     */
    void configure_logging() const;

    /**
     * @brief Print the effective configuration
     */
    void print_config() const;

private:
    GeneratorConfig config_;
    RunOptions run_options_;
    std::string log_config_;
    bool silent_ = false;
    int exit_code_ = EXIT_OK;

    void register_options(SimpleCommandLineParser& parser) const;

    /**
     * @return false after reporting a malformed value
     */
    bool parse_all_options(const SimpleCommandLineParser& parser);

    // Boolean option parsing with --no- variants
    void parse_boolean_option(const SimpleCommandLineParser& parser,
                              const std::string& positive_flag,
                              const std::string& negative_flag,
                              bool& config_value);

    template <typename T>
    bool parse_number(const SimpleCommandLineParser& parser, const std::string& name, T& target);

    bool parse_logging_options(const SimpleCommandLineParser& parser);

    bool usage_error(const std::string& message);
};

} // namespace cadgen
