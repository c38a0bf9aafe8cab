#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace bootstrap {

/**
 * Command line front end of the bootstrap-token tool.
 *
 * Subcommands:
 *   validate [token] [--file F] [--key K] [--json]
 *   split <token> [--show-secret]
 *   join <id> <secret>
 *   encode <token>
 *   decode <json>
 *
 * Exit codes: 0 success, 1 token rejected, 2 usage error.
 */
class TokenCli {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitInvalid = 1;
    static constexpr int kExitUsage = 2;

    /**
     * Run the tool.
     *
     * @param args Full argument vector, args[0] being the program name
     * @param out Stream for regular output
     * @param err Stream for diagnostics
     * @return Process exit code
     */
    static int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

    /**
     * Set the Crow log level from its name (debug, info, warning, error).
     * @return false if the name is unknown; the level is then left at warning
     */
    static bool setLogLevel(const std::string& log_level);
};

} // namespace bootstrap
