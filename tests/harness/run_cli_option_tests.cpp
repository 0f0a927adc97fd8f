#include <specdoc_tool/cli/Options.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    namespace cli = specdoc_tool::cli;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static cli::Options parse_(const std::vector<std::string_view>& args) {
        std::vector<std::string> storage{};
        storage.reserve(args.size() + 1);
        storage.emplace_back("specdoc");
        for (const auto a : args) {
            storage.emplace_back(a);
        }

        std::vector<char*> argv{};
        argv.reserve(storage.size());
        for (auto& s : storage) {
            argv.push_back(s.data());
        }

        return cli::parse_options(static_cast<int>(argv.size()), argv.data());
    }

    static bool test_no_args_is_usage_() {
        const auto opt = parse_({});
        const auto help = parse_({"--print", "a.md", "--help"});

        bool ok = true;
        ok &= require_(opt.ok && opt.mode == cli::Mode::kUsage, "no arguments prints usage");
        ok &= require_(help.ok && help.mode == cli::Mode::kUsage, "--help wins over a mode");

        std::ostringstream oss;
        cli::print_usage(oss);
        ok &= require_(oss.str().find("--merge <base.md> <delta.md>") != std::string::npos, "usage lists --merge");
        return ok;
    }

    static bool test_single_path_modes_() {
        struct Expect {
            const char* flag;
            cli::Mode mode;
        };
        const Expect modes[] = {
            {"--tokens", cli::Mode::kTokens},
            {"--ast", cli::Mode::kAst},
            {"--print", cli::Mode::kPrint},
            {"--requirements", cli::Mode::kRequirements},
            {"--delta", cli::Mode::kDelta},
            {"--validate", cli::Mode::kValidate},
            {"--tasks", cli::Mode::kTasks},
            {"--sync", cli::Mode::kSync},
        };

        bool ok = true;
        for (const auto& e : modes) {
            const auto opt = parse_({e.flag, "doc.md"});
            ok &= require_(opt.ok && opt.mode == e.mode, e.flag);
            ok &= require_(opt.input == "doc.md", "input path is taken from the mode flag");
            ok &= require_(cli::mode_flag(e.mode) == e.flag, "mode_flag round trip");
        }
        ok &= require_(cli::mode_flag(cli::Mode::kUsage).empty(), "usage has no flag");
        return ok;
    }

    static bool test_query_and_merge_positionals_() {
        bool ok = true;

        const auto q = parse_({"--query", "h3[text^=Requirement] emphasis", "spec.md", "--json"});
        ok &= require_(q.ok && q.mode == cli::Mode::kQuery, "query mode");
        ok &= require_(q.selector == "h3[text^=Requirement] emphasis", "selector is the flag value");
        ok &= require_(q.input == "spec.md", "input is the positional");
        ok &= require_(q.json, "--json");

        const auto q_missing = parse_({"--query", "h1"});
        ok &= require_(!q_missing.ok && q_missing.error == "--query requires exactly one input file", "query without file");

        const auto m = parse_({"--merge", "base.md", "delta.md", "--capability", "archive-workflow", "-o", "out.md"});
        ok &= require_(m.ok && m.mode == cli::Mode::kMerge, "merge mode");
        ok &= require_(m.input == "base.md" && m.delta == "delta.md", "base and delta paths");
        ok &= require_(m.capability == "archive-workflow", "capability");
        ok &= require_(m.out_path.has_value() && *m.out_path == "out.md", "output path");

        const auto m_missing = parse_({"--merge", "base.md"});
        ok &= require_(!m_missing.ok, "merge needs a delta path");
        return ok;
    }

    static bool test_flags_and_values_() {
        bool ok = true;

        const auto v = parse_({"--validate", "spec.md", "--no-strict", "--lang", "ko", "--context", "0", "--verbose"});
        ok &= require_(v.ok, "validate options parse");
        ok &= require_(v.strict.has_value() && !*v.strict, "--no-strict");
        ok &= require_(v.lang.has_value() && *v.lang == "ko", "--lang");
        ok &= require_(v.context_lines.has_value() && *v.context_lines == 0, "--context 0");
        ok &= require_(v.verbose, "--verbose");

        const auto plain = parse_({"--validate", "spec.md"});
        ok &= require_(!plain.strict.has_value() && !plain.lang.has_value() && !plain.context_lines.has_value(),
                       "unset options stay empty so config can fill them");

        const auto t = parse_({"--tasks", "tasks.md", "--change", "add-sync", "--output", "tasks.jsonc"});
        ok &= require_(t.ok && t.change_id == "add-sync", "--change");
        ok &= require_(t.out_path.has_value() && *t.out_path == "tasks.jsonc", "--output");

        const auto s = parse_({"--sync", "tasks.md", "--status", "st.jsonc"});
        ok &= require_(s.ok && s.status_path == "st.jsonc", "--status");

        const auto p = parse_({"--print", "a.md", "--check"});
        ok &= require_(p.ok && p.check, "--check");

        const auto c = parse_({"--config-show", "--format", "json"});
        ok &= require_(c.ok && c.mode == cli::Mode::kConfigShow, "config-show takes no path");
        ok &= require_(c.format == specdoc_tool::config::OutputFormat::kJson, "--format json");

        const auto ver = parse_({"--version"});
        ok &= require_(ver.ok && ver.mode == cli::Mode::kVersion, "--version");
        return ok;
    }

    static bool test_errors_() {
        struct Bad {
            std::vector<std::string_view> args;
            const char* error;
        };
        const Bad cases[] = {
            {{"--print", "a.md", "--ast", "b.md"}, "conflicting modes: --print and --ast"},
            {{"--print"}, "--print requires a path"},
            {{"--print", "a.md", "--frobnicate"}, "unknown option: --frobnicate"},
            {{"--print", "a.md", "extra.md"}, "unexpected argument: extra.md"},
            {{"a.md"}, "missing mode flag before: a.md"},
            {{"--validate", "a.md", "--lang", "fr"}, "unknown --lang value: fr"},
            {{"--validate", "a.md", "--context", "-1"}, "--context requires a non-negative number, got: -1"},
            {{"--validate", "a.md", "--context"}, "--context requires a number"},
            {{"--config-show", "--format", "yaml"}, "unknown --format value: yaml"},
        };

        bool ok = true;
        for (const auto& c : cases) {
            const auto opt = parse_(c.args);
            if (opt.ok || opt.error != c.error) {
                std::cerr << "    expected \"" << c.error << "\", got \"" << opt.error << "\"\n";
                ok = false;
            }
        }
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"no_args_is_usage", test_no_args_is_usage_},
        {"single_path_modes", test_single_path_modes_},
        {"query_and_merge_positionals", test_query_and_merge_positionals_},
        {"flags_and_values", test_flags_and_values_},
        {"errors", test_errors_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
