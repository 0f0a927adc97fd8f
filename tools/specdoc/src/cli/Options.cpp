// tools/specdoc/src/cli/Options.cpp
#include <specdoc_tool/cli/Options.hpp>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace specdoc_tool::cli {

    namespace {

        struct ModeFlag {
            std::string_view flag;
            Mode mode;
            bool takes_path;
        };

        constexpr ModeFlag kModeFlags[] = {
            {"--version", Mode::kVersion, false},
            {"--tokens", Mode::kTokens, true},
            {"--ast", Mode::kAst, true},
            {"--print", Mode::kPrint, true},
            {"--query", Mode::kQuery, true},
            {"--requirements", Mode::kRequirements, true},
            {"--delta", Mode::kDelta, true},
            {"--validate", Mode::kValidate, true},
            {"--tasks", Mode::kTasks, true},
            {"--sync", Mode::kSync, true},
            {"--merge", Mode::kMerge, true},
            {"--config-show", Mode::kConfigShow, false},
        };

        /// @brief 모드 플래그면 해당 항목을 돌려준다.
        const ModeFlag* find_mode_flag(std::string_view a) {
            for (const auto& e : kModeFlags) {
                if (e.flag == a) return &e;
            }
            return nullptr;
        }

        /// @brief 값이 필요한 옵션의 값을 꺼낸다. 없으면 opt 에 오류를 남긴다.
        std::optional<std::string_view> take_value(const std::vector<std::string_view>& args,
                                                   size_t& i,
                                                   Options& opt,
                                                   std::string_view what) {
            if (i + 1 >= args.size()) {
                opt.ok = false;
                opt.error = std::string(args[i]) + " requires " + std::string(what);
                return std::nullopt;
            }
            return args[++i];
        }

        /// @brief `--context N` 의 N (0 이상 정수)
        std::optional<uint32_t> parse_context(std::string_view s) {
            uint32_t v = 0;
            const auto* b = s.data();
            const auto* e = s.data() + s.size();
            const auto r = std::from_chars(b, e, v);
            if (r.ec != std::errc{} || r.ptr != e) return std::nullopt;
            return v;
        }

        void fail(Options& opt, std::string msg) {
            opt.ok = false;
            opt.error = std::move(msg);
        }

    } // namespace

    std::string_view mode_flag(Mode m) {
        for (const auto& e : kModeFlags) {
            if (e.mode == m) return e.flag;
        }
        return {};
    }

    void print_usage(std::ostream& os) {
        os
            << "specdoc\n"
            << "  --version\n"
            << "  --tokens <file>\n"
            << "  --ast <file>\n"
            << "  --print <file> [--check]\n"
            << "  --query \"<selector>\" <file>\n"
            << "  --requirements <file> [--json]\n"
            << "  --delta <file> [--json]\n"
            << "  --validate <file> [--strict|--no-strict]\n"
            << "  --tasks <tasks.md> [--change <id>] [-o <out>]\n"
            << "  --sync <tasks.md> [--status <tasks.jsonc>] [-o <out>]\n"
            << "  --merge <base.md> <delta.md> [--capability <name>] [-o <out>]\n"
            << "  --config-show [--format toml|json]\n"
            << "\n"
            << "Options:\n"
            << "  --lang en|ko|auto   (diagnostic language)\n"
            << "  --context N         (source lines around each diagnostic)\n"
            << "  --verbose           (print parse statistics to stderr)\n"
            << "\n"
            << "Exit codes: 0 ok, 1 diagnostics with errors, 2 usage or I/O error\n";
    }

    Options parse_options(int argc, char** argv) {
        Options opt{};

        if (argc <= 1) {
            opt.mode = Mode::kUsage;
            return opt;
        }

        std::vector<std::string_view> args;
        args.reserve(static_cast<size_t>(argc - 1));
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

        std::vector<std::string_view> positional;
        bool mode_seen = false;

        for (size_t i = 0; i < args.size() && opt.ok; ++i) {
            const std::string_view a = args[i];

            if (const auto* m = find_mode_flag(a)) {
                if (mode_seen) {
                    fail(opt, "conflicting modes: " + std::string(mode_flag(opt.mode)) + " and " + std::string(a));
                    break;
                }
                mode_seen = true;
                opt.mode = m->mode;
                if (!m->takes_path) continue;

                const auto v = take_value(args, i, opt, m->mode == Mode::kQuery ? "a selector" : "a path");
                if (!v) break;
                if (m->mode == Mode::kQuery) opt.selector = std::string(*v);
                else opt.input = std::string(*v);
                continue;
            }

            if (a == "-h" || a == "--help") {
                opt.mode = Mode::kUsage;
                return opt;
            }
            if (a == "--check") { opt.check = true; continue; }
            if (a == "--json") { opt.json = true; continue; }
            if (a == "--strict") { opt.strict = true; continue; }
            if (a == "--no-strict") { opt.strict = false; continue; }
            if (a == "--verbose") { opt.verbose = true; continue; }

            if (a == "--change") {
                if (const auto v = take_value(args, i, opt, "an id")) opt.change_id = std::string(*v);
                continue;
            }
            if (a == "-o" || a == "--output") {
                if (const auto v = take_value(args, i, opt, "a path")) opt.out_path = std::string(*v);
                continue;
            }
            if (a == "--status") {
                if (const auto v = take_value(args, i, opt, "a path")) opt.status_path = std::string(*v);
                continue;
            }
            if (a == "--capability") {
                if (const auto v = take_value(args, i, opt, "a name")) opt.capability = std::string(*v);
                continue;
            }
            if (a == "--format") {
                const auto v = take_value(args, i, opt, "toml|json");
                if (!v) break;
                if (*v == "toml") opt.format = config::OutputFormat::kToml;
                else if (*v == "json") opt.format = config::OutputFormat::kJson;
                else fail(opt, "unknown --format value: " + std::string(*v));
                continue;
            }
            if (a == "--lang") {
                const auto v = take_value(args, i, opt, "en|ko|auto");
                if (!v) break;
                if (*v == "en" || *v == "ko" || *v == "auto") opt.lang = std::string(*v);
                else fail(opt, "unknown --lang value: " + std::string(*v));
                continue;
            }
            if (a == "--context") {
                const auto v = take_value(args, i, opt, "a number");
                if (!v) break;
                if (const auto n = parse_context(*v)) opt.context_lines = *n;
                else fail(opt, "--context requires a non-negative number, got: " + std::string(*v));
                continue;
            }

            if (a.size() > 1 && a[0] == '-') {
                fail(opt, "unknown option: " + std::string(a));
                break;
            }
            positional.push_back(a);
        }

        if (!opt.ok) return opt;

        if (!mode_seen) {
            if (!positional.empty()) fail(opt, "missing mode flag before: " + std::string(positional.front()));
            opt.mode = Mode::kUsage;
            return opt;
        }

        switch (opt.mode) {
            case Mode::kQuery:
                if (positional.size() != 1) {
                    fail(opt, "--query requires exactly one input file");
                    return opt;
                }
                opt.input = std::string(positional.front());
                return opt;

            case Mode::kMerge:
                if (positional.size() != 1) {
                    fail(opt, "--merge requires <base.md> <delta.md>");
                    return opt;
                }
                opt.delta = std::string(positional.front());
                return opt;

            default:
                if (!positional.empty()) {
                    fail(opt, "unexpected argument: " + std::string(positional.front()));
                }
                return opt;
        }
    }

} // namespace specdoc_tool::cli
