#include "textsplit/cli/options.hpp"

#include <sstream>

namespace textsplit::cli {
namespace {

Result<CliOptions> usage_error(const std::string& message) {
    return Err<CliOptions>(ErrorCode::InvalidArgument, message);
}

std::optional<Command> command_from(const std::string& word) {
    if (word == "split") return Command::Split;
    if (word == "join") return Command::Join;
    if (word == "pack") return Command::Pack;
    if (word == "unpack") return Command::Unpack;
    if (word == "help") return Command::Help;
    return std::nullopt;
}

} // namespace

const char* command_name(Command command) {
    switch (command) {
        case Command::Help: return "help";
        case Command::Split: return "split";
        case Command::Join: return "join";
        case Command::Pack: return "pack";
        case Command::Unpack: return "unpack";
    }
    return "unknown";
}

Result<CliOptions> parse_cli(const std::vector<std::string>& args) {
    CliOptions options;
    std::vector<std::string> positionals;
    bool help_requested = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            help_requested = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= args.size()) {
                return usage_error(arg + " requires a file argument");
            }
            options.config_file = std::filesystem::path(args[++i]);
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= args.size()) {
                return usage_error(arg + " requires a level argument");
            }
            options.log_level = args[++i];
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else if (arg == "-k" || arg == "--keep-archive") {
            options.keep_archive = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return usage_error("unknown option: " + arg);
        } else {
            positionals.push_back(arg);
        }
    }

    if (help_requested || positionals.empty()) {
        options.command = Command::Help;
        return Ok(std::move(options));
    }

    const auto command = command_from(positionals.front());
    if (!command) {
        return usage_error("unknown command: " + positionals.front());
    }
    options.command = *command;
    const std::vector<std::string> operands(positionals.begin() + 1, positionals.end());

    if (options.keep_archive && options.command != Command::Pack) {
        return usage_error("--keep-archive only applies to pack");
    }

    switch (options.command) {
        case Command::Help:
            if (!operands.empty()) {
                return usage_error("help takes no arguments");
            }
            break;
        case Command::Split:
            if (operands.size() != 2) {
                return usage_error("split expects <file> <chunk-bytes>");
            }
            options.path = operands[0];
            options.chunk_size = operands[1];
            break;
        case Command::Join:
            if (operands.size() != 1) {
                return usage_error("join expects <base-path>");
            }
            options.path = operands[0];
            break;
        case Command::Pack:
            if (operands.empty() || operands.size() > 2) {
                return usage_error("pack expects <file> [chunk-bytes]");
            }
            options.path = operands[0];
            if (operands.size() == 2) {
                options.chunk_size = operands[1];
            }
            break;
        case Command::Unpack:
            if (operands.empty() || operands.size() > 2) {
                return usage_error("unpack expects <file> [dest-dir]");
            }
            options.path = operands[0];
            if (operands.size() == 2) {
                options.dest_dir = std::filesystem::path(operands[1]);
            }
            break;
    }

    return Ok(std::move(options));
}

std::string usage() {
    std::ostringstream out;
    out << "Usage: textsplit [options] <command> [arguments]\n"
        << "\n"
        << "Commands:\n"
        << "  split <file> <chunk-bytes>   Write <file>.partNNN.txt base64 chunks of at most\n"
        << "                               <chunk-bytes> raw bytes each (max 999 chunks)\n"
        << "  join <base-path>             Rebuild <base-path> from <base-path>.part*.txt and\n"
        << "                               delete the chunk files\n"
        << "  pack <file> [chunk-bytes]    Compress to <file>.zip, then split the archive\n"
        << "  unpack <file> [dest-dir]     Join <file>.zip, then extract it\n"
        << "  help                         Show this message\n"
        << "\n"
        << "Options:\n"
        << "  -c, --config <file>          JSON config file\n"
        << "  -l, --log-level <level>      trace, debug, info, warn, error, critical, off\n"
        << "  -q, --quiet                  Only log warnings and errors\n"
        << "  -k, --keep-archive           pack: keep the intermediate .zip\n"
        << "  -h, --help                   Show this message\n";
    return out.str();
}

} // namespace textsplit::cli
