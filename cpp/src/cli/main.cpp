// =============================================================================
// fleetcrypt CLI - radio traffic decoding assistant
// =============================================================================
//
// Usage:
//   fleetcrypt [global options] <command> [args]
//
// Commands:
//   process     Count a clear message or suggest keys for a cipher message
//   confirm     Accept a key for a cipher message and learn its clear words
//   decode      Show what a key turns a cipher message into
//   stats       Show vocabulary and seen-message counts
//   candidates  List stored words of a given length
//   version     Show version information
//   help        Show this help message
//
// Message text is taken from the remaining arguments, or from stdin when none
// are given. Keys are offsets separated by spaces or commas.
//
// Examples:
//   fleetcrypt process "=HQ ENEMY FLEET SIGHTED NORTH FLEET7="
//   fleetcrypt confirm "2,2,2,2,2" < capture.txt
//   fleetcrypt candidates 5 sender
//
// =============================================================================

#include <cstring>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "fleetcrypt/alphabet.hpp"
#include "fleetcrypt/config.hpp"
#include "fleetcrypt/error.hpp"
#include "fleetcrypt/logging.hpp"
#include "fleetcrypt/session.hpp"

namespace fleetcrypt::cli {
    int cmd_process(int argc, char* argv[]);
    int cmd_confirm(int argc, char* argv[]);
    int cmd_decode(int argc, char* argv[]);
    int cmd_stats(int argc, char* argv[]);
    int cmd_candidates(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#ifndef FLEETCRYPT_VERSION
#define FLEETCRYPT_VERSION "0.1.0"
#endif

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"process",    "Count a clear message or suggest keys for a cipher message", fleetcrypt::cli::cmd_process},
    {"confirm",    "Accept a key for a cipher message and learn its words", fleetcrypt::cli::cmd_confirm},
    {"decode",     "Show what a key turns a cipher message into", fleetcrypt::cli::cmd_decode},
    {"stats",      "Show vocabulary and seen-message counts", fleetcrypt::cli::cmd_stats},
    {"candidates", "List stored words of a given length", fleetcrypt::cli::cmd_candidates},
    {"version",    "Show version information", fleetcrypt::cli::cmd_version},
    {"help",       "Show this help message", fleetcrypt::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "fleetcrypt.env";
    std::string data_dir;
    std::string dictionary;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

namespace fleetcrypt::cli {

namespace {

std::string read_message(int argc, char* argv[]) {
    if (argc > 0) {
        std::string text;
        for (int i = 0; i < argc; ++i) {
            if (i) text += ' ';
            text += argv[i];
        }
        return text;
    }
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

Dictionary load_dictionary() {
    Dictionary dictionary;
    std::string path = Config::getInstance().get<std::string>("store.dictionary");
    try {
        dictionary.load(path);
    } catch (const IOError& e) {
        LOG_WARN(e.what());
        LOG_WARN("No dictionary loaded; only numbers will read as clear text");
    }
    return dictionary;
}

std::unique_ptr<Session> open_session(const Dictionary& dictionary) {
    const Config& config = Config::getInstance();

    ParserOptions parser_options;
    parser_options.clear_threshold = config.get<double>("parse.clear_threshold", 0.25);

    EngineOptions engine_options;
    engine_options.group_count = static_cast<size_t>(config.get<int>("infer.group_count", 4));
    engine_options.max_candidates = static_cast<size_t>(config.get<int>("infer.max_candidates", 0));

    SessionOptions session_options;
    session_options.deduplicate = config.get<bool>("session.deduplicate", true);

    return Session::open(dictionary, config.get<std::string>("store.dir", "."),
                         parser_options, engine_options, session_options);
}

void print_message(const Message& message) {
    std::cout << "  sender:   " << message.sender.value_or("(none)") << "\n";
    std::cout << "  receiver: " << message.receiver.value_or("(none)") << "\n";
    std::cout << "  body:     ";
    for (const auto& word : message.body) std::cout << word << ' ';
    std::cout << "\n";
}

void print_candidates(const std::vector<CandidateKey>& candidates) {
    size_t rank = 1;
    for (const auto& candidate : candidates) {
        std::cout << std::setw(3) << rank++ << ". [" << format_key(candidate.offsets) << "]"
                  << " weight " << candidate.weight
                  << (candidate.is_full() ? "" : "  PARTIAL (may help manual decryption)") << "\n";
        for (const auto& match : candidate.matches) {
            std::cout << "       " << field_name(match.field) << " " << match.cipher_word
                      << " -> " << match.clear_word << " (seen " << match.count << "x)\n";
        }
    }
}

int print_outcome(const Outcome& outcome) {
    return std::visit([](const auto& result) -> int {
        using T = std::decay_t<decltype(result)>;
        if constexpr (std::is_same_v<T, Duplicate>) {
            std::cout << "This message has already been seen.\n";
        } else if constexpr (std::is_same_v<T, FrequencyUpdated>) {
            std::cout << "Clear text counted:\n";
            print_message(result.message);
        } else {
            std::cout << "Cipher text:\n";
            print_message(result.message);
            if (result.candidates.empty()) {
                std::cout << "No key suggestions; collect more clear text and try again.\n";
            } else {
                print_candidates(result.candidates);
            }
        }
        return 0;
    }, outcome);
}

// confirm/decode take the key as their first argument
bool take_key(int& argc, char**& argv, OffsetKey& key) {
    if (argc < 1) {
        std::cerr << "Missing key\n";
        return false;
    }
    auto parsed = parse_key(argv[0]);
    if (!parsed) {
        std::cerr << "Invalid key '" << argv[0] << "': expected offsets 0-"
                  << ALPHABET_SIZE - 1 << " separated by spaces or commas\n";
        return false;
    }
    key = *parsed;
    --argc;
    ++argv;
    return true;
}

} // anonymous namespace

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "fleetcrypt - radio traffic decoding assistant\n";
    std::cout << "Version " << FLEETCRYPT_VERSION << "\n\n";
    std::cout << "Usage: fleetcrypt [options] <command> [args]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -d, --data-dir <dir>     Journal directory (default: .)\n";
    std::cout << "  -w, --dictionary <file>  Reference word list (default: words_alpha.txt)\n";
    std::cout << "  -c, --config <file>      Config file (default: fleetcrypt.env)\n";
    std::cout << "  -v, --verbose            Debug logging\n";
    std::cout << "  -q, --quiet              Errors only\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  FC_DATA_DIR, FC_DICTIONARY, FC_GROUP_COUNT, FC_MAX_CANDIDATES,\n";
    std::cout << "  FC_CLEAR_THRESHOLD, FC_DEDUPLICATE, FC_LOG_LEVEL\n";
    std::cout << "\nExamples:\n";
    std::cout << "  fleetcrypt process \"=HQ ENEMY FLEET SIGHTED NORTH FLEET7=\"\n";
    std::cout << "  fleetcrypt confirm \"2,2,2,2,2\" < capture.txt\n";
    std::cout << "  fleetcrypt candidates 5 sender\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "fleetcrypt " << FLEETCRYPT_VERSION << "\n";
    std::cout << "Alphabet: " << ALPHABET << " (" << ALPHABET_SIZE << " symbols)\n";
    return 0;
}

// =============================================================================
// Session Commands
// =============================================================================

int cmd_process(int argc, char* argv[]) {
    std::string text = read_message(argc, argv);
    Dictionary dictionary = load_dictionary();
    auto session = open_session(dictionary);
    return print_outcome(session->process(text));
}

int cmd_confirm(int argc, char* argv[]) {
    OffsetKey key;
    if (!take_key(argc, argv, key)) return 2;

    std::string text = read_message(argc, argv);
    Dictionary dictionary = load_dictionary();
    auto session = open_session(dictionary);
    return print_outcome(session->confirm(text, key));
}

int cmd_decode(int argc, char* argv[]) {
    OffsetKey key;
    if (!take_key(argc, argv, key)) return 2;

    std::string text = read_message(argc, argv);
    Dictionary dictionary = load_dictionary();
    auto session = open_session(dictionary);
    Message clear = session->decode(text, key);
    std::cout << clear.normalized_text << "\n";
    print_message(clear);
    return 0;
}

int cmd_stats([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    Dictionary dictionary = load_dictionary();
    auto session = open_session(dictionary);
    const auto& freq = session->frequency_store();

    std::cout << "Dictionary words: " << dictionary.size() << "\n";
    std::cout << "Seen messages:    " << session->seen_log().size() << "\n";
    for (Field field : {Field::WORD, Field::SENDER, Field::RECEIVER}) {
        std::cout << "Distinct " << std::left << std::setw(9) << (std::string(field_name(field)) + "s:")
                  << freq.size(field) << "\n";
    }
    return 0;
}

int cmd_candidates(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: fleetcrypt candidates <length> [word|sender|receiver]\n";
        return 2;
    }

    int length = 0;
    try {
        length = std::stoi(argv[0]);
    } catch (const std::exception&) {
        length = 0;
    }
    if (length <= 0) {
        std::cerr << "Invalid length '" << argv[0] << "'\n";
        return 2;
    }

    Field field = Field::WORD;
    if (argc > 1) {
        std::string name = argv[1];
        if (name == "sender") field = Field::SENDER;
        else if (name == "receiver") field = Field::RECEIVER;
        else if (name != "word") {
            std::cerr << "Unknown field '" << name << "'\n";
            return 2;
        }
    }

    Dictionary dictionary;
    auto session = open_session(dictionary);
    for (const auto& entry : session->frequency_store().candidates_of_length(static_cast<size_t>(length), field)) {
        std::cout << std::setw(8) << entry.count << "  " << entry.word << "\n";
    }
    return 0;
}

} // namespace fleetcrypt::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-d" || arg == "--data-dir") && i + 1 < argc) {
            g_options.data_dir = argv[++i];
        } else if ((arg == "-w" || arg == "--dictionary") && i + 1 < argc) {
            g_options.dictionary = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            break;
        }
    }

    if (i >= argc) {
        fleetcrypt::cli::cmd_help(0, nullptr);
        return 2;
    }

    fleetcrypt::set_log_output(std::cerr);
    if (!fleetcrypt::init_config(g_options.config_file)) {
        return 1;
    }

    auto& config = fleetcrypt::Config::getInstance();
    if (!g_options.data_dir.empty()) config.set("store.dir", g_options.data_dir);
    if (!g_options.dictionary.empty()) config.set("store.dictionary", g_options.dictionary);
    if (g_options.verbose) fleetcrypt::set_log_level(fleetcrypt::LogLevel::DEBUG);
    if (g_options.quiet) fleetcrypt::set_log_level(fleetcrypt::LogLevel::ERROR);

    std::string name = argv[i];
    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (name == cmd->name) {
            try {
                return cmd->handler(argc - i - 1, argv + i + 1);
            } catch (const fleetcrypt::FleetcryptException& e) {
                std::cerr << e.what() << "\n";
                return 1;
            }
        }
    }

    std::cerr << "Unknown command: " << name << "\n\n";
    fleetcrypt::cli::cmd_help(0, nullptr);
    return 2;
}
