#include "api/review_cli.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

#include "api/review_session.hpp"
#include "api/snapshot_engine.hpp"
#include "core/policy.hpp"
#include "core/redaction.hpp"
#include "core/snapshot_identity.hpp"
#include "persist/atomic_file.hpp"
#include "persist/engine_config_file.hpp"
#include "persist/pending_artifact.hpp"
#include "util/log.hpp"

namespace api {
namespace {

enum class Command { Pending, Review, Check };

struct RuleSpec {
    core::RedactionActionKind kind{core::RedactionActionKind::ReplaceWith};
    std::string selector;
    std::string argument;
};

struct CliOptions {
    Command command{Command::Pending};
    bool verbose{false};
    bool quiet{false};

    // pending / review
    std::filesystem::path root;
    std::string filter;
    std::optional<Decision> bulk;

    // check
    std::string module_dir;
    std::string module;
    std::string test;
    std::string locator;
    std::string input;
    std::optional<core::Format> format;
    std::string extension{core::kDefaultBinaryExtension};
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::vector<RuleSpec> rules;
    std::optional<std::filesystem::path> config;
    std::optional<std::filesystem::path> workspace;
    std::optional<std::string> update_mode;
    std::optional<core::MismatchAction> on_mismatch;
    std::optional<core::PendingPersistence> pending;
};

void print_usage(std::ostream& err) {
    err << "Usage: snapgate <command> [options]\n"
        << "Commands:\n"
        << "  pending --root <dir> [--filter <glob>]\n"
        << "      List pending snapshots under <dir>\n"
        << "  review --root <dir> [--filter <glob>] [--accept-all|--reject-all|--skip-all]\n"
        << "      Accept, reject or skip each pending snapshot (prompts on stdin\n"
        << "      unless a bulk flag is given)\n"
        << "  check (--locator <file::test> | --module <m> --test <t> [--module-dir <d>])\n"
        << "        --input <file|-> [options]\n"
        << "      Snapshot one value and report the verdict\n"
        << "Check options:\n"
        << "  --format json|csv|text|binary  Input format (default from extension, else json)\n"
        << "  --extension <ext>          Binary snapshot file suffix (default bin)\n"
        << "  --name <name>              Explicit snapshot name\n"
        << "  --description <text>       Stored in the snapshot header\n"
        << "  --redact <sel>=<text>      Replace matches with <text>\n"
        << "  --round <sel>=<digits>     Round floats under matches\n"
        << "  --sort <sel>               Sort matched sequences\n"
        << "  --delete <sel>             Remove matches\n"
        << "  --config <file>            snapgate.json configuration\n"
        << "  --workspace <dir>          Workspace root (overrides SNAPGATE_WORKSPACE)\n"
        << "  --update auto|always|no|force  Update mode (overrides SNAPGATE_UPDATE)\n"
        << "  --on-mismatch fail|warn\n"
        << "  --pending always|on_failure|never\n"
        << "Common options:\n"
        << "  --verbose                  Debug logging\n"
        << "  --quiet                    Errors only\n";
}

bool split_rule(std::string_view spec, std::string& selector, std::string& argument) {
    const auto eq = spec.find('=');
    if (eq == std::string_view::npos) {
        return false;
    }
    selector = std::string(spec.substr(0, eq));
    argument = std::string(spec.substr(eq + 1));
    return true;
}

bool parse_cli(const std::vector<std::string>& args, CliOptions& out, std::ostream& err) {
    if (args.empty()) {
        print_usage(err);
        return false;
    }
    CliOptions opts;
    const std::string& cmd = args[0];
    if (cmd == "pending") {
        opts.command = Command::Pending;
    } else if (cmd == "review") {
        opts.command = Command::Review;
    } else if (cmd == "check") {
        opts.command = Command::Check;
    } else {
        print_usage(err);
        return false;
    }

    const std::size_t argc = args.size();
    for (std::size_t i = 1; i < argc; ++i) {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--root" && has_value) {
            opts.root = args[++i];
        } else if (arg == "--filter" && has_value) {
            opts.filter = args[++i];
        } else if (arg == "--accept-all") {
            opts.bulk = Decision::Accept;
        } else if (arg == "--reject-all") {
            opts.bulk = Decision::Reject;
        } else if (arg == "--skip-all") {
            opts.bulk = Decision::Skip;
        } else if (arg == "--module-dir" && has_value) {
            opts.module_dir = args[++i];
        } else if (arg == "--module" && has_value) {
            opts.module = args[++i];
        } else if (arg == "--test" && has_value) {
            opts.test = args[++i];
        } else if (arg == "--locator" && has_value) {
            opts.locator = args[++i];
        } else if (arg == "--input" && has_value) {
            opts.input = args[++i];
        } else if (arg == "--format" && has_value) {
            opts.format = core::format_from_string(args[++i]);
            if (!opts.format) {
                err << "Unknown format: " << args[i] << "\n";
                return false;
            }
        } else if (arg == "--extension" && has_value) {
            opts.extension = args[++i];
        } else if (arg == "--name" && has_value) {
            opts.name = args[++i];
        } else if (arg == "--description" && has_value) {
            opts.description = args[++i];
        } else if ((arg == "--redact" || arg == "--round") && has_value) {
            RuleSpec spec;
            spec.kind = arg == "--redact" ? core::RedactionActionKind::ReplaceWith
                                          : core::RedactionActionKind::RoundFloat;
            if (!split_rule(args[++i], spec.selector, spec.argument)) {
                err << arg << " expects <selector>=<value>, got: " << args[i] << "\n";
                return false;
            }
            opts.rules.push_back(std::move(spec));
        } else if ((arg == "--sort" || arg == "--delete") && has_value) {
            RuleSpec spec;
            spec.kind = arg == "--sort" ? core::RedactionActionKind::SortSequence
                                        : core::RedactionActionKind::Delete;
            spec.selector = args[++i];
            opts.rules.push_back(std::move(spec));
        } else if (arg == "--config" && has_value) {
            opts.config = std::filesystem::path(args[++i]);
        } else if (arg == "--workspace" && has_value) {
            opts.workspace = std::filesystem::path(args[++i]);
        } else if (arg == "--update" && has_value) {
            opts.update_mode = args[++i];
        } else if (arg == "--on-mismatch" && has_value) {
            opts.on_mismatch = core::mismatch_action_from_string(args[++i]);
            if (!opts.on_mismatch) {
                err << "Unknown --on-mismatch value: " << args[i] << "\n";
                return false;
            }
        } else if (arg == "--pending" && has_value) {
            opts.pending = core::pending_persistence_from_string(args[++i]);
            if (!opts.pending) {
                err << "Unknown --pending value: " << args[i] << "\n";
                return false;
            }
        } else {
            print_usage(err);
            return false;
        }
    }

    if (opts.command != Command::Check && opts.root.empty()) {
        err << "--root is required\n";
        return false;
    }
    if (opts.command == Command::Check) {
        if (opts.input.empty()) {
            err << "--input is required\n";
            return false;
        }
        if (opts.locator.empty() && (opts.module.empty() || opts.test.empty())) {
            err << "check needs --locator or --module and --test\n";
            return false;
        }
    }
    out = std::move(opts);
    return true;
}

std::string format_error(int code, std::string_view description, std::string_view details, std::string_view action) {
    std::ostringstream oss;
    oss << "Exit " << code << ": " << description << "\n"
        << "Details: " << details << "\n"
        << "Action: " << action;
    return oss.str();
}

const char* action_for(core::ErrorKind kind) noexcept {
    switch (kind) {
    case core::ErrorKind::MalformedValue: return "Fix the input value or choose another format";
    case core::ErrorKind::InvalidSelector: return "Fix the redaction selector syntax";
    case core::ErrorKind::InvalidConfig: return "Fix the configuration or command line";
    case core::ErrorKind::StorageIO: return "Check paths, permissions and disk space";
    case core::ErrorKind::CorruptAcceptedFile: return "Restore the snapshot from version control or delete it";
    case core::ErrorKind::CorruptPendingArtifact: return "Delete the pending file and re-run the test";
    case core::ErrorKind::UnknownPendingArtifact: return "Re-run the review to pick up the current pending files";
    case core::ErrorKind::None: break;
    }
    return "None";
}

int report(std::ostream& err, std::string_view what, const core::EngineError& e) {
    const int code = exit_code_for(e.kind);
    err << format_error(code, what, e.describe(), action_for(e.kind)) << std::endl;
    return code;
}

bool build_rules(const std::vector<RuleSpec>& specs, std::vector<core::RedactionRule>& out, core::EngineError& err) {
    std::vector<core::RedactionRule> rules;
    for (const auto& spec : specs) {
        core::RedactionAction action;
        switch (spec.kind) {
        case core::RedactionActionKind::ReplaceWith:
            action = core::RedactionAction::replace_with(core::Value::from_text(spec.argument));
            break;
        case core::RedactionActionKind::RoundFloat: {
            int digits = 0;
            const auto* end = spec.argument.data() + spec.argument.size();
            const auto res = std::from_chars(spec.argument.data(), end, digits);
            if (spec.argument.empty() || res.ec != std::errc() || res.ptr != end || digits < 0) {
                err.set(core::ErrorKind::InvalidConfig, "--round expects a digit count, got '" + spec.argument + "'");
                return false;
            }
            action = core::RedactionAction::round_float(digits);
            break;
        }
        case core::RedactionActionKind::SortSequence:
            action = core::RedactionAction::sort();
            break;
        case core::RedactionActionKind::Delete:
            action = core::RedactionAction::remove();
            break;
        }
        core::RedactionRule rule;
        if (!core::make_rule(spec.selector, std::move(action), rule, err)) {
            return false;
        }
        rules.push_back(std::move(rule));
    }
    out = std::move(rules);
    return true;
}

// Defaults, then the config file, then the environment, then flags.
bool resolve_config(const CliOptions& cli, const CliEnvironment& env, core::EngineConfig& out, core::EngineError& err) {
    core::EngineConfig cfg;
    std::error_code ec;
    cfg.workspace_root = std::filesystem::current_path(ec);
    if (ec) {
        err.set(core::ErrorKind::StorageIO, "Cannot determine current directory", {}, ec.value());
        return false;
    }
    if (cli.config && !persist::load_engine_config(*cli.config, cfg, err)) {
        return false;
    }
    if (env.workspace && !env.workspace->empty()) {
        cfg.workspace_root = *env.workspace;
    }
    if (cli.workspace) {
        cfg.workspace_root = *cli.workspace;
    }
    // One update word wins; --update shadows SNAPGATE_UPDATE entirely.
    if (cli.update_mode) {
        if (!core::apply_update_mode(*cli.update_mode, cfg.policy, err)) {
            return false;
        }
    } else if (env.update_mode && !env.update_mode->empty() &&
               !core::apply_update_mode(*env.update_mode, cfg.policy, err)) {
        err.message = "SNAPGATE_UPDATE: " + err.message;
        return false;
    }
    if (cli.on_mismatch) {
        cfg.policy.on_mismatch = *cli.on_mismatch;
    }
    if (cli.pending) {
        cfg.policy.pending = *cli.pending;
    }
    out = std::move(cfg);
    return true;
}

core::Format infer_format(const CliOptions& cli) {
    if (cli.format) {
        return *cli.format;
    }
    const auto ext = std::filesystem::path(cli.input).extension().string();
    if (ext == ".csv") {
        return core::Format::Csv;
    }
    if (ext == ".txt") {
        return core::Format::Text;
    }
    return core::Format::Json;
}

// Binary bodies are never printed, only their size.
void print_binary_summary(std::ostream& out, const std::optional<std::string>& old_body, const std::string& new_body) {
    out << "binary snapshot: " << new_body.size() << " bytes";
    if (old_body) {
        out << " (accepted: " << old_body->size() << " bytes)";
    }
    out << "\n";
}

void print_body_as_added(std::ostream& out, const std::string& body) {
    std::size_t start = 0;
    while (true) {
        const auto nl = body.find('\n', start);
        out << "+" << body.substr(start, nl == std::string::npos ? std::string::npos : nl - start) << "\n";
        if (nl == std::string::npos) {
            break;
        }
        start = nl + 1;
    }
}

int run_check(const CliOptions& cli, const CliEnvironment& env, std::istream& in, std::ostream& out, std::ostream& err) {
    core::EngineError e;
    core::EngineConfig cfg;
    if (!resolve_config(cli, env, cfg, e)) {
        return report(err, "Invalid configuration", e);
    }

    core::TestIdentity test;
    if (!cli.locator.empty()) {
        if (!core::parse_test_locator(cli.locator, test, e)) {
            return report(err, "Invalid test locator", e);
        }
    } else {
        test = core::TestIdentity{cli.module_dir, cli.module, cli.test};
    }

    AssertOptions options;
    options.explicit_name = cli.name;
    options.description = cli.description;
    options.format = infer_format(cli);
    if (!build_rules(cli.rules, options.rules, e)) {
        return report(err, "Invalid redaction rule", e);
    }

    std::string input;
    if (cli.input == "-") {
        input.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    } else {
        switch (persist::read_file(cli.input, input, e)) {
        case persist::ReadStatus::Ok:
            break;
        case persist::ReadStatus::NotFound:
            e.set(core::ErrorKind::StorageIO, "Input file not found", cli.input);
            return report(err, "Cannot read input", e);
        case persist::ReadStatus::Error:
            return report(err, "Cannot read input", e);
        }
    }

    SnapshotEngine engine(cfg);
    engine.begin_invocation(test);
    AssertOutcome outcome;
    bool ok = false;
    switch (options.format) {
    case core::Format::Json:
        ok = engine.assert_json_text(input, test, options, outcome, e);
        break;
    case core::Format::Csv:
        ok = engine.assert_csv_text(input, test, options, outcome, e);
        break;
    case core::Format::Text:
        ok = engine.assert_text(input, test, options, outcome, e);
        break;
    case core::Format::Binary:
        ok = engine.assert_binary(input, cli.extension, test, options, outcome, e);
        break;
    }
    if (!ok) {
        return report(err, "Snapshot assertion could not run", e);
    }

    out << core::verdict_name(outcome.verdict.kind) << ": " << outcome.accepted_path.string() << "\n";
    if (options.format == core::Format::Binary) {
        if (!outcome.verdict.is_pass()) {
            print_binary_summary(out, std::nullopt, outcome.canonical);
        }
    } else if (outcome.verdict.kind == core::VerdictKind::Mismatch) {
        out << outcome.verdict.render_diff();
    } else if (outcome.verdict.kind == core::VerdictKind::New) {
        print_body_as_added(out, outcome.canonical);
    }
    if (outcome.promoted) {
        out << "accepted: " << outcome.accepted_path.string() << "\n";
    }
    if (outcome.pending_path) {
        out << "pending: " << outcome.pending_path->string() << "\n";
    }
    if (outcome.failed) {
        err << format_error(kExitSnapshotFailure,
                            outcome.verdict.kind == core::VerdictKind::New ? "New snapshot" : "Snapshot mismatch",
                            outcome.accepted_path.string(),
                            "Run `snapgate review` to accept or reject the change")
            << std::endl;
        return kExitSnapshotFailure;
    }
    return kExitSuccess;
}

int run_pending(const CliOptions& cli, std::ostream& out, std::ostream& err) {
    std::vector<PendingHandle> handles;
    core::EngineError e;
    if (!list_pending(ReviewOptions{cli.root, cli.filter}, handles, e)) {
        return report(err, "Cannot list pending snapshots", e);
    }
    int code = kExitSuccess;
    for (const auto& h : handles) {
        core::PendingArtifact artifact;
        core::EngineError item_err;
        if (!persist::read_pending(h.pending_path, artifact, item_err)) {
            out << h.relative << "  <unreadable>\n";
            code = report(err, "Unreadable pending snapshot", item_err);
            continue;
        }
        out << h.relative << "  " << artifact.test.key() << "  " << (artifact.old_body ? "mismatch" : "new") << "\n";
    }
    out << handles.size() << " pending\n";
    return code;
}

std::optional<Decision> prompt(std::istream& in, std::ostream& out) {
    std::string line;
    while (true) {
        out << "[a]ccept [r]eject [s]kip [q]uit: " << std::flush;
        if (!std::getline(in, line)) {
            return std::nullopt;
        }
        if (line == "a" || line == "accept") return Decision::Accept;
        if (line == "r" || line == "reject") return Decision::Reject;
        if (line == "s" || line == "skip") return Decision::Skip;
        if (line == "q" || line == "quit") return std::nullopt;
    }
}

void print_item(std::ostream& out, const PendingHandle& h, const core::PendingArtifact& a, std::size_t idx, std::size_t total) {
    out << "[" << idx << "/" << total << "] " << h.relative << "\n";
    out << "source: " << a.test.key() << "\n";
    if (a.name) {
        out << "name: " << *a.name << "\n";
    }
    if (a.description) {
        out << "description: " << *a.description << "\n";
    }
    if (a.format == core::Format::Binary) {
        print_binary_summary(out, a.old_body, a.new_body);
    } else if (!a.old_body) {
        out << "new snapshot:\n";
        print_body_as_added(out, a.new_body);
    } else {
        out << a.diff;
    }
}

int run_review(const CliOptions& cli, std::istream& in, std::ostream& out, std::ostream& err) {
    ReviewSession session(ReviewOptions{cli.root, cli.filter});
    core::EngineError e;
    if (!session.enumerate(e)) {
        return report(err, "Cannot list pending snapshots", e);
    }
    const std::size_t total = session.items().size();
    int code = kExitSuccess;
    std::size_t idx = 0;
    while (const PendingHandle* h = session.next()) {
        ++idx;
        core::EngineError item_err;
        std::optional<Decision> decision = cli.bulk;
        // Bulk decisions never show the artifact, so an unreadable one can
        // still be rejected or skipped.
        if (!decision) {
            core::PendingArtifact artifact;
            if (!session.load(*h, artifact, item_err)) {
                code = report(err, "Cannot load pending snapshot", item_err);
                continue;
            }
            print_item(out, *h, artifact, idx, total);
            decision = prompt(in, out);
            if (!decision) {
                break;
            }
        }
        if (!session.decide(*h, *decision, item_err)) {
            code = report(err, "Review decision failed", item_err);
            continue;
        }
        if (cli.bulk) {
            out << decision_name(*decision) << ": " << h->relative << "\n";
        }
    }
    const auto& c = session.counts();
    out << "accepted: " << c.accepted << ", rejected: " << c.rejected << ", skipped: " << c.skipped << "\n";
    return code;
}

} // namespace

int exit_code_for(core::ErrorKind kind) noexcept {
    switch (kind) {
    case core::ErrorKind::None: return kExitSuccess;
    case core::ErrorKind::MalformedValue:
    case core::ErrorKind::InvalidSelector:
    case core::ErrorKind::InvalidConfig: return kExitUsage;
    case core::ErrorKind::StorageIO:
    case core::ErrorKind::UnknownPendingArtifact: return kExitIoError;
    case core::ErrorKind::CorruptAcceptedFile:
    case core::ErrorKind::CorruptPendingArtifact: return kExitCorrupt;
    }
    return kExitUsage;
}

CliEnvironment read_cli_environment() {
    CliEnvironment env;
    if (const char* ws = std::getenv("SNAPGATE_WORKSPACE")) {
        env.workspace = ws;
    }
    if (const char* mode = std::getenv("SNAPGATE_UPDATE")) {
        env.update_mode = mode;
    }
    return env;
}

int run_snapgate_cli(const std::vector<std::string>& args,
                     const CliEnvironment& env,
                     std::istream& in,
                     std::ostream& out,
                     std::ostream& err) {
    CliOptions cli;
    if (!parse_cli(args, cli, err)) {
        return kExitUsage;
    }
    const auto previous_level = util::log_level();
    if (cli.quiet) {
        util::set_log_level(util::LogLevel::Error);
    } else if (cli.verbose) {
        util::set_log_level(util::LogLevel::Debug);
    }
    int code = kExitUsage;
    switch (cli.command) {
    case Command::Pending:
        code = run_pending(cli, out, err);
        break;
    case Command::Review:
        code = run_review(cli, in, out, err);
        break;
    case Command::Check:
        code = run_check(cli, env, in, out, err);
        break;
    }
    util::set_log_level(previous_level);
    return code;
}

int run_snapgate_main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return run_snapgate_cli(args, read_cli_environment(), std::cin, std::cout, std::cerr);
}

} // namespace api
