// =============================================================================
// lambdalang CLI - Notation Translator Command-Line Interface
// =============================================================================
//
// Usage:
//   lambdalang [options] <command> [args]
//
// Commands:
//   parse       Tokenize a message and show each token with its meaning
//   en          Translate a message to English
//   zh          Translate a message to Chinese
//   from-en     Convert simple English to notation
//   repl        Interactive session (context persists between lines)
//   vocab       List the vocabulary, a category or a domain
//   version     Show version information
//
// Examples:
//   lambdalang en '?Uk/co'
//   lambdalang zh '{ns:cd}!If/bg'
//   lambdalang from-en "do you know about consciousness?"
//   lambdalang vocab cd
//
// =============================================================================

#include "lambdalang/cli.hpp"

#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include "lambdalang/config.hpp"
#include "lambdalang/encoder.hpp"
#include "lambdalang/error.hpp"
#include "lambdalang/session.hpp"
#include "lambdalang/translator.hpp"
#include "lambdalang/vocabulary.hpp"

// =============================================================================
// Version Info
// =============================================================================

#define LAMBDALANG_VERSION_STRING "0.4.0"

namespace lambdalang::cli {

namespace {

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = kDefaultConfigFile;
    bool config_required = false;
    std::string vocabulary;
    bool verbose = false;
    bool quiet = false;
};

// Everything a command needs from the current invocation
struct Invocation {
    GlobalOptions options;
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
};

using Handler = int (*)(Invocation& inv, int argc, char* argv[]);

int cmd_parse(Invocation& inv, int argc, char* argv[]);
int cmd_en(Invocation& inv, int argc, char* argv[]);
int cmd_zh(Invocation& inv, int argc, char* argv[]);
int cmd_from_en(Invocation& inv, int argc, char* argv[]);
int cmd_repl(Invocation& inv, int argc, char* argv[]);
int cmd_vocab(Invocation& inv, int argc, char* argv[]);
int cmd_version(Invocation& inv, int argc, char* argv[]);
int cmd_help(Invocation& inv, int argc, char* argv[]);

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    Handler handler;
};

const Command g_commands[] = {
    {"parse",   "Tokenize a message and show each token", cmd_parse},
    {"en",      "Translate a message to English", cmd_en},
    {"zh",      "Translate a message to Chinese", cmd_zh},
    {"from-en", "Convert simple English to notation", cmd_from_en},
    {"repl",    "Interactive translation session", cmd_repl},
    {"vocab",   "List vocabulary (all, a category, or a domain)", cmd_vocab},
    {"version", "Show version information", cmd_version},
    {"help",    "Show this help message", cmd_help},
    {nullptr, nullptr, nullptr}
};

void parse_global_options(GlobalOptions& options, int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            options.config_file = argv[++i];
            options.config_required = true;
        } else if (arg == "--vocab" && i + 1 < argc) {
            options.vocabulary = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }
    argc -= i;
    argv += i;
}

// Configuration + vocabulary, loaded on first use by the commands that need it
struct Runtime {
    Config config;
    std::unique_ptr<Translator> translator;
};

std::unique_ptr<Runtime> load_runtime(Invocation& inv) {
    try {
        auto runtime = std::make_unique<Runtime>();
        runtime->config = load_config(inv.options.config_file, inv.options.config_required);
        if (!inv.options.vocabulary.empty()) runtime->config.vocabulary_path = inv.options.vocabulary;
        if (inv.options.verbose) runtime->config.log.level = "debug";
        if (inv.options.quiet) runtime->config.log.level = "error";
        init_logging(runtime->config);

        runtime->translator = std::make_unique<Translator>(Vocabulary::load_file(runtime->config.vocabulary_path));
        return runtime;
    } catch (const LambdaException& e) {
        inv.err << e.what() << "\n";
        return nullptr;
    }
}

std::string join_args(int argc, char* argv[]) {
    std::string text;
    for (int i = 0; i < argc; ++i) {
        if (i > 0) text += " ";
        text += argv[i];
    }
    return text;
}

// =============================================================================
// Commands
// =============================================================================

int cmd_help(Invocation& inv, [[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::ostream& out = inv.out;
    out << "lambdalang - agent notation translator\n";
    out << "Version " << LAMBDALANG_VERSION_STRING << "\n\n";
    out << "Usage: lambdalang [options] <command> [args]\n\n";
    out << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        out << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) out << ' ';
        out << cmd->description << "\n";
    }

    out << "\nGlobal Options:\n";
    out << "  -c, --config <file>     YAML configuration (default: lambdalang.yaml if present)\n";
    out << "      --vocab <file>      Vocabulary source (JSON or YAML)\n";
    out << "  -v, --verbose           Debug logging\n";
    out << "  -q, --quiet             Errors only\n";
    out << "\nEnvironment:\n";
    out << "  LAMBDALANG_VOCAB        Vocabulary source\n";
    out << "  LAMBDALANG_LANG         Default repl language (en|zh)\n";
    out << "  LAMBDALANG_LOG_LEVEL    trace|debug|info|warn|error|critical|off\n";
    out << "  LAMBDALANG_LOG_FILE     Write logs to a file instead of stderr\n";
    out << "\nNotation:\n";
    out << "  {ns:cd}                 Activate domain 'cd'\n";
    out << "  {def:fe=custom}         Define a local meaning\n";
    out << "  de'E  lo-               Select an alternate meaning\n";
    out << "  cd:bg                   Atom from a specific domain\n";

    return kExitOk;
}

int cmd_version(Invocation& inv, [[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    inv.out << "lambdalang " << LAMBDALANG_VERSION_STRING << "\n";

    auto runtime = load_runtime(inv);
    if (!runtime) return kExitConfig;

    const auto& vocab = runtime->translator->vocabulary();
    inv.out << "Vocabulary: " << vocab.version() << " (" << runtime->config.vocabulary_path << ")\n";
    return kExitOk;
}

int cmd_parse(Invocation& inv, int argc, char* argv[]) {
    if (argc < 1) {
        inv.err << "Usage: lambdalang parse <msg>\n";
        return kExitUsage;
    }
    auto runtime = load_runtime(inv);
    if (!runtime) return kExitConfig;

    Context context;
    auto items = runtime->translator->interpret(join_args(argc, argv), context);

    for (const auto& item : items) {
        inv.out << std::left << std::setw(14) << token_kind_name(item.token.kind)
                << std::setw(12) << item.token.text;
        if (item.meaning) {
            inv.out << item.meaning->in(Lang::EN) << " / " << item.meaning->in(Lang::ZH)
                    << "  <" << resolution_source_name(item.meaning->source);
            if (!item.meaning->domain.empty()) inv.out << ":" << item.meaning->domain;
            inv.out << ">";
        } else if (!item.token.is_block()) {
            inv.out << "(unresolved)";
        }
        inv.out << "\n";
    }
    return kExitOk;
}

int translate(Invocation& inv, int argc, char* argv[], Lang lang) {
    if (argc < 1) {
        inv.err << "Usage: lambdalang " << lang_tag(lang) << " <msg>\n";
        return kExitUsage;
    }
    auto runtime = load_runtime(inv);
    if (!runtime) return kExitConfig;

    Context context;
    inv.out << runtime->translator->render(join_args(argc, argv), lang, context) << "\n";
    return kExitOk;
}

int cmd_en(Invocation& inv, int argc, char* argv[]) {
    return translate(inv, argc, argv, Lang::EN);
}

int cmd_zh(Invocation& inv, int argc, char* argv[]) {
    return translate(inv, argc, argv, Lang::ZH);
}

int cmd_from_en(Invocation& inv, int argc, char* argv[]) {
    if (argc < 1) {
        inv.err << "Usage: lambdalang from-en <text>\n";
        return kExitUsage;
    }
    auto runtime = load_runtime(inv);
    if (!runtime) return kExitConfig;

    Encoder encoder(runtime->translator->vocabulary_ptr());
    inv.out << encoder.encode(join_args(argc, argv)) << "\n";
    return kExitOk;
}

int cmd_repl(Invocation& inv, [[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    auto runtime = load_runtime(inv);
    if (!runtime) return kExitConfig;

    Session session(*runtime->translator, runtime->config.language);
    inv.out << "lambdalang " << LAMBDALANG_VERSION_STRING
            << " (:en :zh :ctx :reset :quit)\n";

    std::string line;
    while (!session.finished()) {
        inv.out << "λ> " << std::flush;
        if (!std::getline(inv.in, line)) break;
        std::string reply = session.handle(line);
        if (!reply.empty()) inv.out << reply << "\n";
    }
    return kExitOk;
}

void print_table(std::ostream& out, const AtomTable& table) {
    for (const auto& [key, atom] : table) {
        out << "  " << std::left << std::setw(6) << key
            << atom.gloss.en << " / " << atom.gloss.zh << "\n";
    }
}

int cmd_vocab(Invocation& inv, int argc, char* argv[]) {
    auto runtime = load_runtime(inv);
    if (!runtime) return kExitConfig;
    const Vocabulary& vocab = runtime->translator->vocabulary();
    std::ostream& out = inv.out;

    if (argc >= 1) {
        std::string what = argv[0];
        if (auto category = parse_category(what)) {
            print_table(out, vocab.table(*category));
            return kExitOk;
        }
        if (const Domain* domain = vocab.find_domain(what)) {
            out << domain->code << " - " << domain->name.en << " / " << domain->name.zh << "\n";
            for (const auto& [key, gloss] : domain->atoms) {
                out << "  " << std::left << std::setw(6) << key << gloss.en << " / " << gloss.zh << "\n";
            }
            return kExitOk;
        }
        inv.err << "Unknown category or domain: " << what << "\n";
        return kExitUsage;
    }

    out << "Vocabulary " << vocab.version() << ": " << vocab.atom_count() << " atoms\n";
    for (size_t i = 0; i < kCategoryCount; ++i) {
        auto category = static_cast<Category>(i);
        out << "\n[" << category_name(category) << "] (" << vocab.table(category).size() << ")\n";
        print_table(out, vocab.table(category));
    }

    out << "\n[domains] (" << vocab.domains().size() << ")\n";
    for (const auto& [code, domain] : vocab.domains()) {
        out << "  " << std::left << std::setw(6) << code << domain.name.en << " / " << domain.name.zh
            << " (" << domain.atoms.size() << " atoms)\n";
    }

    out << "\n[disambiguation] (" << vocab.disambiguations().size() << ")\n";
    for (const auto& [key, entry] : vocab.disambiguations()) {
        out << "  " << std::left << std::setw(6) << key << entry.primary.en;
        for (const auto& [marker, gloss] : entry.alternates) {
            out << (marker == kPositionalMarker ? "  " + key + "-" : "  " + key + "'" + marker)
                << "=" << gloss.en;
        }
        out << "\n";
    }
    return kExitOk;
}

} // namespace

// =============================================================================
// Entry Point
// =============================================================================

int run(int argc, char* argv[], std::istream& in, std::ostream& out, std::ostream& err) {
    Invocation inv{GlobalOptions{}, in, out, err};
    parse_global_options(inv.options, argc, argv);

    if (argc < 1) {
        cmd_help(inv, 0, nullptr);
        return kExitUsage;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(inv, argc, argv);
        }
    }

    err << "Unknown command: " << cmd_name << "\n";
    err << "Run 'lambdalang help' for usage.\n";
    return kExitUsage;
}

} // namespace lambdalang::cli
