#include "veil_config.hpp"
#include "veil_errors.hpp"
#include "veil_logger.hpp"
#include "veil_stego.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace veil;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_STEGO_ERROR = 1;
constexpr int EXIT_USAGE = 2;

/// Bad command line; reported with the command's usage line
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ============================================================================
// ArgumentParser
// ============================================================================

class ArgumentParser {
public:
    using Handler = std::function<int(const std::vector<std::string>&)>;

    struct Command {
        std::string name;
        std::string description;
        Handler handler;
        std::vector<std::string> args_help;
    };

    ArgumentParser(const std::string& prog_name, const std::string& version)
        : prog_name_(prog_name), version_(version) {}

    void add_command(
        const std::string& name,
        const std::string& description,
        Handler handler,
        const std::vector<std::string>& args_help = {}
    ) {
        commands_[name] = {name, description, std::move(handler), args_help};
    }

    int parse_and_execute(int argc, char* argv[]) {
        if (argc < 2) {
            print_usage(std::cerr);
            return EXIT_USAGE;
        }

        std::string cmd = argv[1];
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage(std::cout);
            return EXIT_OK;
        }
        if (cmd == "version" || cmd == "--version" || cmd == "-v") {
            std::cout << prog_name_ << " " << version_ << std::endl;
            return EXIT_OK;
        }

        auto it = commands_.find(cmd);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage(std::cerr);
            return EXIT_USAGE;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        try {
            return it->second.handler(args);
        } catch (const UsageError& e) {
            std::cerr << "[!] " << e.what() << "\n";
            print_command(std::cerr, it->second);
            return EXIT_USAGE;
        } catch (const std::invalid_argument& e) {
            std::cerr << "[!] " << e.what() << "\n";
            return EXIT_USAGE;
        } catch (const StegoError& e) {
            std::cerr << "[!] " << e.what() << "\n";
            return EXIT_STEGO_ERROR;
        }
    }

private:
    void print_command(std::ostream& os, const Command& cmd) const {
        os << "  " << prog_name_ << " " << cmd.name;
        for (const auto& arg : cmd.args_help)
            os << " " << arg;
        os << "\n    " << cmd.description << "\n\n";
    }

    void print_usage(std::ostream& os) const {
        os << prog_name_ << " " << version_ << " - steganographic payload hiding\n";
        os << "\nUsage: " << prog_name_ << " <command> [options]\n\n";
        os << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            print_command(os, cmd);
        }
        os << "  help\n    Show this help message\n\n";
        os << "  version\n    Show version information\n\n";
        os << "Carrier types: image, audio, video, document\n";
    }

    std::string prog_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

// ============================================================================
// Utility functions
// ============================================================================

std::string get_option(const std::vector<std::string>& args, const std::string& option,
                       const std::string& default_val = "") {
    auto it = std::find(args.begin(), args.end(), option);
    if (it != args.end() && ++it != args.end()) return *it;
    return default_val;
}

bool has_option(const std::vector<std::string>& args, const std::string& option) {
    return std::find(args.begin(), args.end(), option) != args.end();
}

// Arguments that are neither an --option nor its value
std::vector<std::string> positionals(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i].rfind("--", 0) == 0 || args[i] == "-t") {
            ++i;
            continue;
        }
        out.push_back(args[i]);
    }
    return out;
}

std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw UsageError("cannot open " + path);
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)),
                                std::istreambuf_iterator<char>());
}

void write_file(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error("cannot write " + path.string());
    }
}

// Loads --config and applies the log.* keys
void configure(const std::vector<std::string>& args) {
    Config& cfg = Config::instance();
    std::string path = get_option(args, "--config");
    if (!path.empty() && !cfg.loadFromFile(path)) {
        throw UsageError("cannot read config file " + path);
    }

    Logger& log = Logger::instance();
    log.setLevel(Logger::levelFromString(cfg.get("log.level", "info")));
    log.setConsoleOutput(cfg.getBool("log.console", true));
    std::string log_file = cfg.get("log.file");
    if (!log_file.empty() && !log.setFileOutput(log_file)) {
        std::cerr << "[!] cannot open log file " << log_file << "\n";
    }
}

// ============================================================================
// Handlers
// ============================================================================

int handle_hide(const std::vector<std::string>& args) {
    configure(args);
    auto pos = positionals(args);
    bool text_mode = has_option(args, "-t");
    size_t expected = text_mode ? 3 : 4;
    if (pos.size() != expected) {
        throw UsageError("hide expects <type> <carrier> <payload-file|-t text> <out>");
    }

    CarrierType type = carrier_type_from_string(pos[0]);
    std::vector<uint8_t> carrier = read_file(pos[1]);

    std::vector<uint8_t> payload;
    std::string filename;
    std::string out_path;
    if (text_mode) {
        std::string text = get_option(args, "-t");
        payload.assign(text.begin(), text.end());
        out_path = pos[2];
    } else {
        payload = read_file(pos[2]);
        filename = std::filesystem::path(pos[2]).filename().string();
        out_path = pos[3];
    }

    HideOptions options;
    options.codec = CodecOptions::from_config();
    options.redundancy = Redundancy::parse(get_option(args, "--redundancy", "auto"));
    if (has_option(args, "--password")) {
        options.password = get_option(args, "--password");
    }

    std::vector<uint8_t> stego = hide(carrier, type, payload, filename, options);
    write_file(out_path, stego);
    std::cout << "[+] Hidden " << payload.size() << " bytes"
              << (options.password ? " (encrypted)" : "") << " -> " << out_path << "\n";
    return EXIT_OK;
}

int handle_extract(const std::vector<std::string>& args) {
    configure(args);
    auto pos = positionals(args);
    if (pos.size() != 3) {
        throw UsageError("extract expects <type> <stego> <outdir>");
    }

    CarrierType type = carrier_type_from_string(pos[0]);
    std::vector<uint8_t> stego = read_file(pos[1]);
    std::string password = get_option(args, "--password");

    ExtractResult result = extract(stego, type, password, CodecOptions::from_config());

    if (result.content_type == ContentType::Text) {
        std::cout << std::string(result.payload.begin(), result.payload.end()) << "\n";
        return EXIT_OK;
    }

    // Never trust a recovered name as a path
    std::string name = std::filesystem::path(result.original_filename).filename().string();
    if (name.empty() || name == "." || name == "..") name = "extracted.bin";

    std::filesystem::path out_dir(pos[2]);
    std::filesystem::create_directories(out_dir);
    write_file(out_dir / name, result.payload);
    std::cout << "[+] Extracted " << result.payload.size() << " bytes -> "
              << (out_dir / name).string() << "\n";
    return EXIT_OK;
}

int handle_capacity(const std::vector<std::string>& args) {
    configure(args);
    auto pos = positionals(args);
    if (pos.size() != 2) {
        throw UsageError("capacity expects <type> <carrier>");
    }

    CarrierType type = carrier_type_from_string(pos[0]);
    uint64_t bits = capacity(read_file(pos[1]), type, CodecOptions::from_config());
    std::cout << bits << " bits (" << bits / 8 << " bytes) at redundancy 1\n";
    return EXIT_OK;
}

} // namespace

// ============================================================================
// main()
// ============================================================================

int main(int argc, char* argv[]) {
    ArgumentParser parser("veil", "v1.0.0");

    parser.add_command("hide", "Hide a file or text message in a carrier", handle_hide,
                       {"<type>", "<carrier>", "<payload-file|-t text>", "<out>",
                        "[--password P]", "[--redundancy auto|N]", "[--config FILE]"});
    parser.add_command("extract", "Recover a hidden payload", handle_extract,
                       {"<type>", "<stego>", "<outdir>", "[--password P]", "[--config FILE]"});
    parser.add_command("capacity", "Report carrier capacity in bits", handle_capacity,
                       {"<type>", "<carrier>", "[--config FILE]"});

    try {
        return parser.parse_and_execute(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[!] " << e.what() << "\n";
        return EXIT_STEGO_ERROR;
    }
}
