#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <cstdlib>

#include <sys/wait.h>

namespace {

const std::string kTmpRoot = "/tmp/specdoc-cli-tests";

std::pair<int, std::string> run_capture(const std::string& command) {
    const std::string tmp = kTmpRoot + "-capture.txt";
    // 사용자 설정과 locale 이 결과에 섞이지 않게 한다
    const std::string env = "XDG_CONFIG_HOME=\"" + kTmpRoot + "/xdg\" SPECDOC_DIAG_LANG= SPECDOC_DIAG_CONTEXT= LC_ALL=C ";
    const std::string full = env + command + " > " + tmp + " 2>&1";
    const int raw = std::system(full.c_str());
    const int rc = (raw != -1 && WIFEXITED(raw)) ? WEXITSTATUS(raw) : -1;

    std::ifstream ifs(tmp, std::ios::binary);
    std::string out;
    if (ifs) {
        out.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    }
    std::remove(tmp.c_str());
    return {rc, out};
}

bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

bool write_text(const std::filesystem::path& path, const std::string& text) {
    std::error_code ec{};
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) return false;
    ofs << text;
    return ofs.good();
}

std::string read_text(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return {};
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::string bin() {
    return "\"" + std::string(SPECDOC_BUILD_BIN) + "\"";
}

std::string case_file(const char* name) {
    return "\"" + std::string(SPECDOC_TEST_CASE_DIR) + "/" + name + "\"";
}

std::string q(const std::filesystem::path& p) {
    return "\"" + p.string() + "\"";
}

bool fail(const char* what, const std::string& out) {
    std::cerr << what << "\n" << out << "\n";
    return false;
}

bool test_help_and_version() {
    auto [rc_ver, out_ver] = run_capture(bin() + " --version");
    if (rc_ver != 0 || !contains(out_ver, "specdoc v")) return fail("version failed", out_ver);

    auto [rc_help, out_help] = run_capture(bin() + " --help");
    if (rc_help != 0 || !contains(out_help, "--merge <base.md> <delta.md>")) return fail("help failed", out_help);

    auto [rc_bad, out_bad] = run_capture(bin() + " --print a.md --bogus");
    if (rc_bad != 2 || !contains(out_bad, "error: unknown option: --bogus")) return fail("usage error failed", out_bad);
    return true;
}

bool test_print_round_trip() {
    for (const char* name : {"spec_basic.md", "tasks_mixed.md", "inline_mix.md", "crlf_no_trailing_newline.md"}) {
        auto [rc, out] = run_capture(bin() + " --print " + case_file(name) + " --check");
        if (rc != 0 || !contains(out, "round-trips")) return fail("print --check failed", out);
    }

    const auto out_path = std::filesystem::path(kTmpRoot) / "printed.md";
    auto [rc, out] = run_capture(bin() + " --print " + case_file("crlf_no_trailing_newline.md") + " -o " + q(out_path));
    const std::string src = read_text(std::filesystem::path(SPECDOC_TEST_CASE_DIR) / "crlf_no_trailing_newline.md");
    if (rc != 0 || src.empty() || read_text(out_path) != src) return fail("print -o must write the source bytes", out);

    auto [rc_missing, out_missing] = run_capture(bin() + " --print " + q(std::filesystem::path(kTmpRoot) / "nope.md"));
    if (rc_missing != 2 || !contains(out_missing, "fatal[FileReadFailed]")) return fail("missing file must exit 2", out_missing);
    return true;
}

bool test_tokens_and_ast() {
    auto [rc_tok, out_tok] = run_capture(bin() + " --tokens " + case_file("tasks_mixed.md"));
    if (rc_tok != 0 || !contains(out_tok, "\"2.2.1\"")) return fail("tokens failed", out_tok);

    auto [rc_ast, out_ast] = run_capture(bin() + " --ast " + case_file("spec_basic.md"));
    if (rc_ast != 0 || !contains(out_ast, "Header(h1) \"Archive Workflow Specification\"")) return fail("ast failed", out_ast);
    return true;
}

bool test_query() {
    auto [rc, out] = run_capture(bin() + " --query h2 " + case_file("spec_basic.md"));
    if (rc != 0 || !contains(out, ":3:1: Header(h2) \"Purpose\"") || !contains(out, "Header(h2) \"Notes\"")) {
        return fail("query h2 failed", out);
    }

    auto [rc_bad, out_bad] = run_capture(bin() + " --query \"h2[\" " + case_file("spec_basic.md"));
    if (rc_bad != 1 || !contains(out_bad, "error[QuerySyntax]")) return fail("bad selector must exit 1", out_bad);
    return true;
}

bool test_requirements_and_delta() {
    auto [rc_req, out_req] = run_capture(bin() + " --requirements " + case_file("spec_basic.md") + " --json");
    if (rc_req != 0 || !contains(out_req, "\"name\":\"Merge Order\"") ||
        !contains(out_req, "\"scenarios\":[\"Untouched block\",\"Trailing spaces\"]")) {
        return fail("requirements --json failed", out_req);
    }

    auto [rc_txt, out_txt] = run_capture(bin() + " --requirements " + case_file("spec_basic.md"));
    if (rc_txt != 0 || !contains(out_txt, "Requirement: Byte Preservation (line 18, 2 scenario(s))")) {
        return fail("requirements text failed", out_txt);
    }

    auto [rc_delta, out_delta] = run_capture(bin() + " --delta " + case_file("delta_all.md"));
    if (rc_delta != 0 || !contains(out_delta, "  OldName -> NewName\n") ||
        !contains(out_delta, "+1 ~1 -1 \xE2\x86\x92" "1")) {
        return fail("delta failed", out_delta);
    }

    auto [rc_dj, out_dj] = run_capture(bin() + " --delta " + case_file("delta_all.md") + " --json");
    if (rc_dj != 0 || !contains(out_dj, "\"renamed\":[{\"from\":\"OldName\",\"to\":\"NewName\"}]")) {
        return fail("delta --json failed", out_dj);
    }
    return true;
}

bool test_validate() {
    auto [rc_spec, out_spec] = run_capture(bin() + " --validate " + case_file("spec_basic.md"));
    if (rc_spec != 0 || !contains(out_spec, ": valid spec")) return fail("spec must validate", out_spec);

    auto [rc_delta, out_delta] = run_capture(bin() + " --validate " + case_file("delta_all.md"));
    if (rc_delta != 0 || !contains(out_delta, ": valid delta spec")) return fail("delta must validate", out_delta);

    const auto soft = std::filesystem::path(kTmpRoot) / "soft" / "spec.md";
    if (!write_text(soft, "## Requirements\n\n### Requirement: Soft\nThe system should work.\n\n#### Scenario: S\n- ok\n")) {
        return false;
    }

    auto [rc_strict, out_strict] = run_capture(bin() + " --validate " + q(soft) + " --strict");
    if (rc_strict != 1 || !contains(out_strict, "error[ReqMissingShallMust]")) return fail("strict must fail", out_strict);

    auto [rc_lax, out_lax] = run_capture(bin() + " --validate " + q(soft) + " --no-strict");
    if (rc_lax != 0 || !contains(out_lax, "warning[ReqMissingShallMust]") || !contains(out_lax, ": valid spec")) {
        return fail("non-strict must pass with a warning", out_lax);
    }

    const auto empty = std::filesystem::path(kTmpRoot) / "empty" / "spec.md";
    if (!write_text(empty, "# Nothing\n\n## Purpose\n\nText.\n")) return false;

    auto [rc_ko, out_ko] = run_capture(bin() + " --validate " + q(empty) + " --lang ko --context 0");
    if (rc_ko != 1 || !contains(out_ko, "error[SpecMissingRequirements]: \xED\x95\x84\xEC\x88\x98")) {
        return fail("korean diagnostics failed", out_ko);
    }
    return true;
}

bool test_tasks_and_sync() {
    const auto dir = std::filesystem::path(kTmpRoot) / "changes" / "add-sync";
    const std::string md =
        "# Tasks\n"
        "\n"
        "## 1. Setup\n"
        "\n"
        "- [ ] 1.1 Create the store\n"
        "- [ ] 1.2 Write the sync\n";
    if (!write_text(dir / "tasks.md", md)) return false;

    auto [rc_tasks, out_tasks] = run_capture(bin() + " --tasks " + q(dir / "tasks.md") + " -o " + q(dir / "tasks.jsonc"));
    const std::string store = read_text(dir / "tasks.jsonc");
    if (rc_tasks != 0 || !contains(store, "\"changeId\": \"add-sync\"") ||
        !contains(store, "\"summary\": {\"total\": 2, \"completed\": 0}")) {
        return fail("tasks must write the store next to tasks.md", out_tasks + store);
    }

    // 생성된 상태 그대로면 sync 는 바이트를 바꾸지 않는다
    auto [rc_same, out_same] = run_capture(bin() + " --sync " + q(dir / "tasks.md"));
    if (rc_same != 0 || out_same != md) return fail("sync with an unchanged store must reproduce the file", out_same);

    const std::string edited =
        "{\n"
        "  \"version\": 1,\n"
        "  \"changeId\": \"add-sync\",\n"
        "  \"tasks\": [\n"
        "    {\"id\": \"1.1\", \"status\": \"completed\"},\n"
        "    {\"id\": \"1.2\", \"status\": \"in_progress\"},\n"
        "    {\"id\": \"3.3\", \"status\": \"completed\"},\n"
        "  ],\n"
        "}\n";
    if (!write_text(dir / "edited.jsonc", edited)) return false;

    auto [rc_sync, out_sync] = run_capture(bin() + " --sync " + q(dir / "tasks.md") + " --status " + q(dir / "edited.jsonc"));
    if (rc_sync != 0 || !contains(out_sync, "- [x] 1.1 Create the store\n- [ ] 1.2 Write the sync\n") ||
        !contains(out_sync, "warning: task '3.3'")) {
        return fail("sync must check completed tasks", out_sync);
    }

    if (!write_text(dir / "broken.jsonc", "{\"version\": 1, \"tasks\": [{\"id\": \"1.1\", \"status\": \"done\"}]}")) {
        return false;
    }
    auto [rc_bad, out_bad] = run_capture(bin() + " --sync " + q(dir / "tasks.md") + " --status " + q(dir / "broken.jsonc"));
    if (rc_bad != 1 || !contains(out_bad, "error[TaskUnknownStatus]")) return fail("unknown status must exit 1", out_bad);

    auto [rc_missing, out_missing] =
        run_capture(bin() + " --sync " + q(dir / "tasks.md") + " --status " + q(dir / "absent.jsonc"));
    if (rc_missing != 2) return fail("missing status file must exit 2", out_missing);
    return true;
}

bool test_merge() {
    const auto cap = std::filesystem::path(kTmpRoot) / "specs" / "archive-workflow";
    std::error_code ec{};
    std::filesystem::create_directories(cap, ec);
    std::filesystem::copy_file(std::filesystem::path(SPECDOC_TEST_CASE_DIR) / "spec_basic.md", cap / "spec.md",
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) return fail("cannot copy base spec", ec.message());

    const std::string delta =
        "## ADDED Requirements\n\n"
        "### Requirement: Extra\nThe archiver SHALL add extra.\n\n#### Scenario: E\n- ok\n\n"
        "## RENAMED Requirements\n\n"
        "- FROM: `### Requirement: Merge Order`\n"
        "- TO: `### Requirement: Operation Order`\n";
    if (!write_text(cap / "delta.md", delta)) return false;

    auto [rc, out] = run_capture(bin() + " --merge " + q(cap / "spec.md") + " " + q(cap / "delta.md") + " -o " + q(cap / "merged.md"));
    const std::string merged = read_text(cap / "merged.md");
    if (rc != 0 || !contains(out, "merged archive-workflow: +1 ~0 -0 \xE2\x86\x92" "1") ||
        !contains(merged, "### Requirement: Operation Order\nThe archiver SHALL apply") ||
        !contains(merged, "### Requirement: Extra\n") ||
        !contains(merged, "#### Scenario: Trailing spaces   \n")) {
        return fail("merge failed", out + merged);
    }

    auto [rc_again, out_again] = run_capture(bin() + " --merge " + q(cap / "merged.md") + " " + q(cap / "delta.md"));
    if (rc_again != 1 || !contains(out_again, "error[MergeMissingBase]") || !contains(out_again, "error[MergeAlreadyExists]")) {
        return fail("applying the delta twice must fail", out_again);
    }

    const auto fresh = std::filesystem::path(kTmpRoot) / "specs" / "new-cap";
    if (!write_text(fresh / "delta.md",
                    "## ADDED Requirements\n\n### Requirement: First\nThe system SHALL start.\n\n#### Scenario: Go\n- go\n")) {
        return false;
    }
    auto [rc_new, out_new] = run_capture(bin() + " --merge " + q(fresh / "spec.md") + " " + q(fresh / "delta.md"));
    if (rc_new != 0 || !contains(out_new, "# New Cap Specification\n\n## Requirements\n\n### Requirement: First\n")) {
        return fail("merge into a missing spec must create one", out_new);
    }

    auto [rc_only, out_only] = run_capture(bin() + " --merge " + q(fresh / "spec.md") + " " + case_file("delta_all.md"));
    if (rc_only != 1 || !contains(out_only, "error[MergeNewSpecOnlyAdded]")) {
        return fail("new spec must reject non-ADDED operations", out_only);
    }
    return true;
}

bool test_config_show() {
    const auto proj = std::filesystem::path(kTmpRoot) / "proj";
    if (!write_text(proj / ".specdoc" / "config.toml", "[diag]\nlang = \"ko\"\n\n[validate]\nstrict = false\n")) return false;

    auto [rc, out] = run_capture("cd " + q(proj) + " && " + bin() + " --config-show --format json");
    if (rc != 0 || !contains(out, "\"diag.lang\":\"ko\"") || !contains(out, "\"validate.strict\":false")) {
        return fail("config-show must see the project config", out);
    }

    auto [rc_toml, out_toml] = run_capture("cd " + q(proj) + " && " + bin() + " --config-show");
    if (rc_toml != 0 || !contains(out_toml, "[diag]\n") || !contains(out_toml, "lang = \"ko\"")) {
        return fail("config-show toml failed", out_toml);
    }

    // 프로젝트 설정의 strict = false 가 validate 기본값이 된다
    const auto soft = proj / "spec.md";
    if (!write_text(soft, "## Requirements\n\n### Requirement: Soft\nThe system should work.\n\n#### Scenario: S\n- ok\n")) {
        return false;
    }
    auto [rc_v, out_v] = run_capture(bin() + " --validate " + q(soft));
    if (rc_v != 0) return fail("project config must relax validation", out_v);
    return true;
}

} // namespace

int main() {
    std::error_code ec{};
    std::filesystem::remove_all(kTmpRoot, ec);
    std::filesystem::create_directories(std::filesystem::path(kTmpRoot) / "xdg", ec);
    if (ec) {
        std::cerr << "cannot create " << kTmpRoot << ": " << ec.message() << "\n";
        return 1;
    }

    struct Case {
        const char* name;
        bool (*fn)();
    };
    const Case cases[] = {
        {"help_and_version", test_help_and_version},
        {"print_round_trip", test_print_round_trip},
        {"tokens_and_ast", test_tokens_and_ast},
        {"query", test_query},
        {"requirements_and_delta", test_requirements_and_delta},
        {"validate", test_validate},
        {"tasks_and_sync", test_tasks_and_sync},
        {"merge", test_merge},
        {"config_show", test_config_show},
    };

    int failed = 0;
    for (const auto& c : cases) {
        if (!c.fn()) {
            std::cerr << "[FAIL] " << c.name << "\n";
            ++failed;
        }
    }

    std::filesystem::remove_all(kTmpRoot, ec);
    if (failed != 0) return 1;
    std::cout << "specdoc cli tests passed\n";
    return 0;
}
