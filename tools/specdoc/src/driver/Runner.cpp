// tools/specdoc/src/driver/Runner.cpp
#include <specdoc_tool/driver/Runner.hpp>

#include <specdoc/diag/DiagCode.hpp>
#include <specdoc/diag/Diagnostic.hpp>
#include <specdoc/diag/Render.hpp>
#include <specdoc/doc/Document.hpp>
#include <specdoc/json/Json.hpp>
#include <specdoc/lex/Lexer.hpp>
#include <specdoc/os/File.hpp>
#include <specdoc/print/Printer.hpp>
#include <specdoc/spec/Extract.hpp>
#include <specdoc/spec/Merge.hpp>
#include <specdoc/spec/Validate.hpp>
#include <specdoc/tasks/Sync.hpp>
#include <specdoc/tasks/TaskStore.hpp>
#include <specdoc/tasks/Tasks.hpp>
#include <specdoc/text/SourceManager.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <system_error>
#include <string>
#include <string_view>
#include <vector>


namespace specdoc_tool::driver {

    namespace {

        using specdoc::diag::Language;

        struct DiagOut {
            Language lang = Language::kEn;
            uint32_t context_lines = 2;
            bool json = false;
        };

        /// @brief `auto` 는 LC_ALL, LC_MESSAGES, LANG 순으로 본다.
        Language resolve_lang(const cli::Options& opt, const config::EffectiveSettings& s) {
            const std::string v = opt.lang.value_or(s.diag_lang);
            if (v == "ko") return Language::kKo;
            if (v == "en") return Language::kEn;

            for (const char* key : {"LC_ALL", "LC_MESSAGES", "LANG"}) {
                const char* p = std::getenv(key);
                if (p == nullptr || *p == '\0') continue;
                return (std::string_view(p).substr(0, 2) == "ko") ? Language::kKo : Language::kEn;
            }
            return Language::kEn;
        }

        /// @brief 진단을 설정된 형식으로 stderr 에 출력하고 종료 코드를 반환한다.
        int flush_diags(const specdoc::diag::Bag& bag, const DiagOut& out, const specdoc::SourceManager& sm) {
            for (const auto& d : bag.diags()) {
                if (out.json) {
                    std::cerr << specdoc::diag::render_one_json(d, out.lang, sm) << "\n";
                } else {
                    std::cerr << specdoc::diag::render_one_context(d, out.lang, sm, out.context_lines) << "\n";
                }
            }
            return bag.has_error() ? k_exit_diag : k_exit_ok;
        }

        /// @brief 파일을 SourceManager 에 올린다. 실패하면 kFileReadFailed 를 보고한다.
        std::optional<uint32_t> load_source(specdoc::SourceManager& sm,
                                            const std::string& path,
                                            specdoc::diag::Bag& bag) {
            std::string content;
            std::string err;
            const std::string shown = specdoc::normalize_path(path);

            if (!specdoc::open_file(path, content, err)) {
                const uint32_t fid = sm.add(shown, std::string{});
                specdoc::diag::Diagnostic d(specdoc::diag::Severity::kFatal,
                                            specdoc::diag::Code::kFileReadFailed,
                                            specdoc::Span{fid, 0, 0});
                d.add_arg(path);
                d.add_arg(err);
                bag.add(std::move(d));
                return std::nullopt;
            }
            return sm.add(shown, std::move(content));
        }

        /// @brief 읽기 + 파싱. 실패 시 진단은 bag 에 남는다.
        std::optional<specdoc::Document> load_document(specdoc::SourceManager& sm,
                                                       const std::string& path,
                                                       specdoc::diag::Bag& bag,
                                                       bool verbose) {
            const auto fid = load_source(sm, path, bag);
            if (!fid) return std::nullopt;

            auto doc = specdoc::parse(std::string(sm.content(*fid)), bag, *fid);
            if (doc && verbose) {
                std::cerr << "[specdoc] parsed " << doc->size() << " bytes, "
                          << doc->arena().size() << " nodes (" << path << ")\n";
            }
            return doc;
        }

        /// @brief 읽기 실패는 2, 그 외 오류는 1
        int failure_code(const specdoc::diag::Bag& bag) {
            if (bag.has_code(specdoc::diag::Code::kFileReadFailed) ||
                bag.has_code(specdoc::diag::Code::kFileWriteFailed)) {
                return k_exit_usage;
            }
            return k_exit_diag;
        }

        /// @brief `-o` 가 있으면 파일로, 없으면 stdout 으로.
        bool emit_output(const cli::Options& opt, std::string_view text) {
            if (!opt.out_path) {
                std::cout << text;
                return true;
            }

            std::string err;
            if (!specdoc::write_file(*opt.out_path, text, err)) {
                std::cerr << "error: failed to write '" << *opt.out_path << "': " << err << "\n";
                return false;
            }
            return true;
        }

        std::string quoted(std::string_view s) {
            return "\"" + specdoc::json::escape(s) + "\"";
        }

        /// @brief `changes/<id>/tasks.md` 같은 경로에서 상위 디렉터리 이름
        std::string parent_dir_name(const std::string& path) {
            std::error_code ec;
            auto p = std::filesystem::absolute(std::filesystem::path(path), ec);
            if (ec) p = std::filesystem::path(path);
            return p.parent_path().filename().string();
        }

        // --------------------
        // modes
        // --------------------

        int run_tokens(const cli::Options& opt, const DiagOut& dout) {
            specdoc::SourceManager sm;
            specdoc::diag::Bag bag;

            const auto fid = load_source(sm, opt.input, bag);
            if (!fid) {
                flush_diags(bag, dout, sm);
                return k_exit_usage;
            }

            specdoc::Lexer lex(sm.content(*fid), *fid, &bag);
            const auto toks = lex.lex_all();
            if (bag.has_fatal()) {
                flush_diags(bag, dout, sm);
                return k_exit_diag;
            }

            for (const auto& t : toks) {
                const auto lc = sm.line_col(*fid, t.span.lo);
                std::cout << lc.line << ":" << lc.col << " "
                          << specdoc::syntax::token_kind_name(t.kind)
                          << " [" << t.span.lo << ", " << t.span.hi << ") "
                          << quoted(t.lexeme) << "\n";
            }
            return flush_diags(bag, dout, sm);
        }

        int run_ast(const cli::Options& opt, const DiagOut& dout) {
            specdoc::SourceManager sm;
            specdoc::diag::Bag bag;

            const auto doc = load_document(sm, opt.input, bag, opt.verbose);
            if (!doc) {
                flush_diags(bag, dout, sm);
                return failure_code(bag);
            }

            std::cout << specdoc::print::dump_tree(*doc);
            return flush_diags(bag, dout, sm);
        }

        int run_print(const cli::Options& opt, const DiagOut& dout) {
            specdoc::SourceManager sm;
            specdoc::diag::Bag bag;

            const auto doc = load_document(sm, opt.input, bag, opt.verbose);
            if (!doc) {
                flush_diags(bag, dout, sm);
                return failure_code(bag);
            }

            const std::string printed = doc->print();
            if (!opt.check) {
                return emit_output(opt, printed) ? k_exit_ok : k_exit_usage;
            }

            const std::string& source = doc->text();
            if (printed == source) {
                std::cout << "ok: " << opt.input << " round-trips (" << source.size() << " bytes)\n";
                return k_exit_ok;
            }

            size_t at = 0;
            while (at < printed.size() && at < source.size() && printed[at] == source[at]) ++at;
            const auto lc = doc->line_col(static_cast<uint32_t>(at));
            std::cerr << "error: " << opt.input << ":" << lc.line << ":" << lc.col
                      << ": printed output differs from source at byte " << at << "\n";
            return k_exit_diag;
        }

        int run_query(const cli::Options& opt, const DiagOut& dout) {
            specdoc::SourceManager sm;
            specdoc::diag::Bag bag;

            // 선택자 진단은 file_id 0 을 쓴다
            sm.add("<selector>", opt.selector);

            const auto doc = load_document(sm, opt.input, bag, opt.verbose);
            if (!doc) {
                flush_diags(bag, dout, sm);
                return failure_code(bag);
            }

            const auto matches = doc->query(opt.selector, bag);
            if (!matches) return flush_diags(bag, dout, sm);

            const std::string shown(sm.name(doc->file_id()));
            size_t n = 0;
            for (const auto& h : *matches) {
                const auto& node = doc->node(h.id);
                const auto lc = doc->line_col(node.span.lo);
                std::cout << shown << ":" << lc.line << ":" << lc.col << ": "
                          << specdoc::print::node_summary(*doc, h.id) << "\n";
                ++n;
            }
            if (opt.verbose) std::cerr << "[specdoc] " << n << " match(es)\n";
            return flush_diags(bag, dout, sm);
        }

        std::string requirement_json(const specdoc::Document& doc, const specdoc::spec::Requirement& r) {
            std::ostringstream oss;
            oss << "{\"name\":" << quoted(r.name)
                << ",\"section\":" << quoted(specdoc::spec::delta_section_name(r.section))
                << ",\"line\":" << doc.line_col(r.header_span.lo).line
                << ",\"scenarios\":[";
            for (size_t i = 0; i < r.scenarios.size(); ++i) {
                if (i != 0) oss << ",";
                oss << quoted(r.scenarios[i]);
            }
            oss << "]}";
            return oss.str();
        }

        int run_requirements(const cli::Options& opt, const DiagOut& dout) {
            specdoc::SourceManager sm;
            specdoc::diag::Bag bag;

            const auto doc = load_document(sm, opt.input, bag, opt.verbose);
            if (!doc) {
                flush_diags(bag, dout, sm);
                return failure_code(bag);
            }

            const auto reqs = specdoc::spec::extract_requirements(*doc);

            if (opt.json) {
                std::cout << "{\"requirements\":[";
                for (size_t i = 0; i < reqs.size(); ++i) {
                    if (i != 0) std::cout << ",";
                    std::cout << requirement_json(*doc, reqs[i]);
                }
                std::cout << "]}\n";
                return flush_diags(bag, dout, sm);
            }

            for (const auto& r : reqs) {
                std::cout << "Requirement: " << r.name
                          << " (line " << doc->line_col(r.header_span.lo).line
                          << ", " << r.scenarios.size() << " scenario(s))\n";
                for (const auto& s : r.scenarios) std::cout << "  Scenario: " << s << "\n";
            }
            return flush_diags(bag, dout, sm);
        }

        int run_delta(const cli::Options& opt, const DiagOut& dout) {
            specdoc::SourceManager sm;
            specdoc::diag::Bag bag;

            const auto doc = load_document(sm, opt.input, bag, opt.verbose);
            if (!doc) {
                flush_diags(bag, dout, sm);
                return failure_code(bag);
            }

            const auto plan = specdoc::spec::extract_delta(*doc);
            const auto counts = specdoc::spec::count_delta_changes(plan);

            if (opt.json) {
                std::ostringstream oss;
                auto reqs = [&](const std::vector<specdoc::spec::Requirement>& v) {
                    oss << "[";
                    for (size_t i = 0; i < v.size(); ++i) {
                        if (i != 0) oss << ",";
                        oss << requirement_json(*doc, v[i]);
                    }
                    oss << "]";
                };

                oss << "{\"added\":";
                reqs(plan.added);
                oss << ",\"modified\":";
                reqs(plan.modified);
                oss << ",\"removed\":[";
                for (size_t i = 0; i < plan.removed.size(); ++i) {
                    if (i != 0) oss << ",";
                    oss << quoted(plan.removed[i]);
                }
                oss << "],\"renamed\":[";
                for (size_t i = 0; i < plan.renamed.size(); ++i) {
                    if (i != 0) oss << ",";
                    oss << "{\"from\":" << quoted(plan.renamed[i].from) << ",\"to\":" << quoted(plan.renamed[i].to) << "}";
                }
                oss << "],\"counts\":{\"added\":" << counts.added
                    << ",\"modified\":" << counts.modified
                    << ",\"removed\":" << counts.removed
                    << ",\"renamed\":" << counts.renamed << "}}\n";
                std::cout << oss.str();
                return flush_diags(bag, dout, sm);
            }

            auto section = [](std::string_view title, const std::vector<specdoc::spec::Requirement>& v) {
                if (v.empty()) return;
                std::cout << title << ":\n";
                for (const auto& r : v) std::cout << "  " << r.name << " (" << r.scenarios.size() << " scenario(s))\n";
            };
            section("ADDED", plan.added);
            section("MODIFIED", plan.modified);
            if (!plan.removed.empty()) {
                std::cout << "REMOVED:\n";
                for (const auto& name : plan.removed) std::cout << "  " << name << "\n";
            }
            if (!plan.renamed.empty()) {
                std::cout << "RENAMED:\n";
                for (const auto& r : plan.renamed) std::cout << "  " << r.from << " -> " << r.to << "\n";
            }
            std::cout << specdoc::spec::delta_summary(counts) << "\n";
            return flush_diags(bag, dout, sm);
        }

        int run_validate(const cli::Options& opt, const config::EffectiveSettings& settings, const DiagOut& dout) {
            specdoc::SourceManager sm;
            specdoc::diag::Bag bag;

            const auto doc = load_document(sm, opt.input, bag, opt.verbose);
            if (!doc) {
                flush_diags(bag, dout, sm);
                return failure_code(bag);
            }

            const bool strict = opt.strict.value_or(settings.validate_strict);
            const bool delta = specdoc::spec::looks_like_delta(*doc);
            const bool ok = delta ? specdoc::spec::validate_delta(*doc, bag, strict)
                                  : specdoc::spec::validate_spec(*doc, bag, strict);

            const int rc = flush_diags(bag, dout, sm);
            if (ok) {
                std::cout << opt.input << ": valid " << (delta ? "delta spec" : "spec") << "\n";
                return k_exit_ok;
            }
            return (rc == k_exit_ok) ? k_exit_diag : rc;
        }

        int run_tasks(const cli::Options& opt, const DiagOut& dout) {
            specdoc::SourceManager sm;
            specdoc::diag::Bag bag;

            const auto doc = load_document(sm, opt.input, bag, opt.verbose);
            if (!doc) {
                flush_diags(bag, dout, sm);
                return failure_code(bag);
            }

            const auto list = specdoc::tasks::collect_tasks(*doc);
            const std::string change = opt.change_id.empty() ? parent_dir_name(opt.input) : opt.change_id;

            if (opt.verbose) {
                std::cerr << "[specdoc] " << list.tasks.size() << " task(s), "
                          << list.completed() << " completed\n";
            }
            if (!emit_output(opt, specdoc::tasks::render_task_store(list, change))) return k_exit_usage;
            return flush_diags(bag, dout, sm);
        }

        int run_sync(const cli::Options& opt, const config::EffectiveSettings& settings, const DiagOut& dout) {
            specdoc::SourceManager sm;
            specdoc::diag::Bag bag;

            const auto doc = load_document(sm, opt.input, bag, opt.verbose);
            if (!doc) {
                flush_diags(bag, dout, sm);
                return failure_code(bag);
            }

            std::string status_path = opt.status_path;
            if (status_path.empty()) {
                status_path = (std::filesystem::path(opt.input).parent_path() / settings.tasks_status_file).string();
            }

            const auto sfid = load_source(sm, status_path, bag);
            if (!sfid) {
                flush_diags(bag, dout, sm);
                return k_exit_usage;
            }

            const auto store = specdoc::tasks::read_task_store(sm.content(*sfid), bag, *sfid);
            if (!store) return flush_diags(bag, dout, sm);

            const auto res = specdoc::tasks::sync_tasks(*doc, *store);
            for (const auto& id : res.missing) {
                std::cerr << "warning: task '" << id << "' from " << status_path
                          << " does not appear in " << opt.input << "\n";
            }
            if (opt.verbose) std::cerr << "[specdoc] updated " << res.updated << " task(s)\n";

            if (!emit_output(opt, res.document.print())) return k_exit_usage;
            return flush_diags(bag, dout, sm);
        }

        int run_merge(const cli::Options& opt, const config::EffectiveSettings& settings, const DiagOut& dout) {
            specdoc::SourceManager sm;
            specdoc::diag::Bag bag;

            // base 가 없으면 새 spec 을 만든다
            std::optional<specdoc::Document> base;
            std::error_code ec;
            if (std::filesystem::exists(opt.input, ec)) {
                base = load_document(sm, opt.input, bag, opt.verbose);
                if (!base) {
                    flush_diags(bag, dout, sm);
                    return failure_code(bag);
                }
            } else if (opt.verbose) {
                std::cerr << "[specdoc] " << opt.input << " does not exist, creating a new spec\n";
            }

            const auto delta = load_document(sm, opt.delta, bag, opt.verbose);
            if (!delta) {
                flush_diags(bag, dout, sm);
                return failure_code(bag);
            }

            const bool strict = opt.strict.value_or(settings.validate_strict);
            if (!specdoc::spec::validate_delta(*delta, bag, strict)) return flush_diags(bag, dout, sm);

            const auto plan = specdoc::spec::extract_delta(*delta);
            if (base && !specdoc::spec::validate_pre_merge(*base, *delta, plan, bag)) {
                return flush_diags(bag, dout, sm);
            }

            const std::string capability = opt.capability.empty() ? parent_dir_name(opt.input) : opt.capability;

            specdoc::spec::MergeOptions mopt{};
            mopt.collapse_blank_lines = settings.merge_collapse_blank_lines;

            const auto merged = specdoc::spec::merge_spec(base ? &*base : nullptr, *delta, capability, bag, mopt);
            if (!merged) return flush_diags(bag, dout, sm);

            std::cerr << "merged " << capability << ": " << specdoc::spec::delta_summary(merged->counts) << "\n";
            if (!emit_output(opt, merged->text)) return k_exit_usage;
            return flush_diags(bag, dout, sm);
        }

        int run_config_show(const cli::Options& opt, const config::EffectiveSettings& settings) {
            const auto values = config::settings_to_map(settings);
            if (opt.format == config::OutputFormat::kJson) {
                std::cout << config::render_json(values) << "\n";
            } else {
                std::cout << config::render_toml(values);
            }
            return k_exit_ok;
        }

    } // namespace

    int run(const cli::Options& opt, const config::EffectiveSettings& settings) {
        DiagOut dout{};
        dout.lang = resolve_lang(opt, settings);
        dout.context_lines = opt.context_lines.value_or(static_cast<uint32_t>(settings.diag_context));
        dout.json = (settings.diag_format == "json");

        switch (opt.mode) {
            case cli::Mode::kTokens: return run_tokens(opt, dout);
            case cli::Mode::kAst: return run_ast(opt, dout);
            case cli::Mode::kPrint: return run_print(opt, dout);
            case cli::Mode::kQuery: return run_query(opt, dout);
            case cli::Mode::kRequirements: return run_requirements(opt, dout);
            case cli::Mode::kDelta: return run_delta(opt, dout);
            case cli::Mode::kValidate: return run_validate(opt, settings, dout);
            case cli::Mode::kTasks: return run_tasks(opt, dout);
            case cli::Mode::kSync: return run_sync(opt, settings, dout);
            case cli::Mode::kMerge: return run_merge(opt, settings, dout);
            case cli::Mode::kConfigShow: return run_config_show(opt, settings);
            case cli::Mode::kUsage:
            case cli::Mode::kVersion:
                break;
        }
        return k_exit_usage;
    }

} // namespace specdoc_tool::driver
