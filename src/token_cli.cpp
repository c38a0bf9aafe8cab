#include "token_cli.hpp"

#include <argparse/argparse.hpp>
#include <crow/json.h>
#include <crow/logging.h>
#include <optional>
#include <stdexcept>

#include "bootstrap_token.hpp"
#include "token_file_loader.hpp"

namespace bootstrap {

namespace {

constexpr const char* kProgramName = "bootstrap-token";
constexpr const char* kVersion = "0.1.0";

int reportError(const Error& error, std::ostream& err) {
    err << "error: " << error.toString() << std::endl;
    return TokenCli::kExitInvalid;
}

int runValidate(const argparse::ArgumentParser& command, std::ostream& out, std::ostream& err) {
    auto raw = command.present("token");
    auto file = command.present("--file");
    bool as_json = command.get<bool>("--json");

    if (raw.has_value() == file.has_value()) {
        err << "error: validate needs either a token argument or --file" << std::endl;
        return TokenCli::kExitUsage;
    }

    std::optional<Result<BootstrapToken>> token;
    if (file) {
        TokenFileLoader loader(*file);
        token.emplace(loader.load(command.get<std::string>("--key")));
    } else {
        token.emplace(BootstrapToken::parse(*raw));
    }

    if (!token->has_value()) {
        if (as_json) {
            out << token->error().toJson().dump() << std::endl;
            return TokenCli::kExitInvalid;
        }
        return reportError(token->error(), err);
    }

    CROW_LOG_DEBUG << "Validated bootstrap token " << token->value();

    if (as_json) {
        crow::json::wvalue result;
        result["success"] = true;
        result["id"] = token->value().id();
        out << result.dump() << std::endl;
    } else {
        out << "valid" << std::endl;
    }
    return TokenCli::kExitOk;
}

int runSplit(const argparse::ArgumentParser& command, std::ostream& out, std::ostream& err) {
    auto token = BootstrapToken::parse(command.get<std::string>("token"));
    if (!token) {
        return reportError(token.error(), err);
    }

    bool show_secret = command.get<bool>("--show-secret");
    out << "id: " << token->id() << std::endl;
    out << "secret: " << (show_secret ? token->secret() : std::string(token->secret().size(), '*')) << std::endl;
    return TokenCli::kExitOk;
}

int runJoin(const argparse::ArgumentParser& command, std::ostream& out, std::ostream& err) {
    auto token = BootstrapToken::fromIdAndSecret(command.get<std::string>("id"),
                                                 command.get<std::string>("secret"));
    if (!token) {
        return reportError(token.error(), err);
    }
    out << token->toString() << std::endl;
    return TokenCli::kExitOk;
}

int runEncode(const argparse::ArgumentParser& command, std::ostream& out, std::ostream& err) {
    auto token = BootstrapToken::parse(command.get<std::string>("token"));
    if (!token) {
        return reportError(token.error(), err);
    }
    out << token->toJson() << std::endl;
    return TokenCli::kExitOk;
}

int runDecode(const argparse::ArgumentParser& command, std::ostream& out, std::ostream& err) {
    auto token = BootstrapToken::fromJson(command.get<std::string>("json"));
    if (!token) {
        return reportError(token.error(), err);
    }
    out << token->toString() << std::endl;
    return TokenCli::kExitOk;
}

} // namespace

bool TokenCli::setLogLevel(const std::string& log_level) {
    if (log_level == "debug") {
        crow::logger::setLogLevel(crow::LogLevel::Debug);
    } else if (log_level == "info") {
        crow::logger::setLogLevel(crow::LogLevel::Info);
    } else if (log_level == "warning") {
        crow::logger::setLogLevel(crow::LogLevel::Warning);
    } else if (log_level == "error") {
        crow::logger::setLogLevel(crow::LogLevel::Error);
    } else {
        crow::logger::setLogLevel(crow::LogLevel::Warning);
        return false;
    }
    return true;
}

int TokenCli::run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    argparse::ArgumentParser program(kProgramName, kVersion, argparse::default_arguments::help, false);
    program.add_description("Validate and convert cluster bootstrap tokens of the form <id>.<secret>");

    program.add_argument("--log-level")
        .help("Set the log level (debug, info, warning, error)")
        .default_value(std::string("warning"));

    argparse::ArgumentParser validate_command("validate", kVersion, argparse::default_arguments::help, false);
    validate_command.add_description("Check that a token is well formed");
    validate_command.add_argument("token")
        .help("Token in the form <id>.<secret>")
        .nargs(argparse::nargs_pattern::optional);
    validate_command.add_argument("-f", "--file")
        .help("Read the token from a YAML file instead");
    validate_command.add_argument("-k", "--key")
        .help("Key holding the token in the YAML file")
        .default_value(std::string("token"));
    validate_command.add_argument("--json")
        .help("Print the result as JSON")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser split_command("split", kVersion, argparse::default_arguments::help, false);
    split_command.add_description("Print the id and secret of a token");
    split_command.add_argument("token")
        .help("Token in the form <id>.<secret>");
    split_command.add_argument("--show-secret")
        .help("Print the secret instead of masking it")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser join_command("join", kVersion, argparse::default_arguments::help, false);
    join_command.add_description("Combine an id and a secret into a token");
    join_command.add_argument("id")
        .help("Token id");
    join_command.add_argument("secret")
        .help("Token secret");

    argparse::ArgumentParser encode_command("encode", kVersion, argparse::default_arguments::help, false);
    encode_command.add_description("Print a token as a JSON string");
    encode_command.add_argument("token")
        .help("Token in the form <id>.<secret>");

    argparse::ArgumentParser decode_command("decode", kVersion, argparse::default_arguments::help, false);
    decode_command.add_description("Read a token from a JSON string");
    decode_command.add_argument("json")
        .help("JSON string literal, including the quotes");

    program.add_subparser(validate_command);
    program.add_subparser(split_command);
    program.add_subparser(join_command);
    program.add_subparser(encode_command);
    program.add_subparser(decode_command);

    // argparse prints the help text itself; a subcommand's missing
    // positionals still make parse_args throw after that
    auto help_requested = [&]() {
        for (const argparse::ArgumentParser* parser : {&program, &validate_command, &split_command,
                                                       &join_command, &encode_command, &decode_command}) {
            if (parser->is_used("--help")) {
                return true;
            }
        }
        return false;
    };

    try {
        program.parse_args(args);
    } catch (const std::exception& e) {
        if (help_requested()) {
            return kExitOk;
        }
        err << e.what() << std::endl;
        err << program;
        return kExitUsage;
    }

    if (help_requested()) {
        return kExitOk;
    }

    std::string log_level = program.get<std::string>("--log-level");
    if (!setLogLevel(log_level)) {
        err << "Invalid log level: " << log_level << ". Using default (warning)." << std::endl;
    }

    if (program.is_subcommand_used(validate_command)) {
        return runValidate(validate_command, out, err);
    } else if (program.is_subcommand_used(split_command)) {
        return runSplit(split_command, out, err);
    } else if (program.is_subcommand_used(join_command)) {
        return runJoin(join_command, out, err);
    } else if (program.is_subcommand_used(encode_command)) {
        return runEncode(encode_command, out, err);
    } else if (program.is_subcommand_used(decode_command)) {
        return runDecode(decode_command, out, err);
    }

    err << program;
    return kExitUsage;
}

} // namespace bootstrap
