// frontend/src/spec/validate.cpp
#include <specdoc/spec/Validate.hpp>
#include <specdoc/spec/Extract.hpp>
#include <specdoc/spec/Names.hpp>

#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>


namespace specdoc::spec {

    namespace {

        // 시나리오 header 를 잘못 쓴 흔한 형태
        constexpr std::string_view kMalformedScenario[] = {
            "### Scenario:",
            "##### Scenario:",
            "###### Scenario:",
            "**Scenario:",
            "- **Scenario:",
        };

        class RuleSink {
        public:
            RuleSink(diag::Bag& bag, bool strict) : bag_(bag), strict_(strict), before_(bag.issue_count()) {}

            void error(diag::Code code, Span sp, std::initializer_list<std::string_view> args = {}) {
                emit_(diag::Severity::kError, code, sp, args);
            }

            // strict 이면 오류
            void warn(diag::Code code, Span sp, std::initializer_list<std::string_view> args = {}) {
                emit_(strict_ ? diag::Severity::kError : diag::Severity::kWarning, code, sp, args);
            }

            bool ok() const { return bag_.issue_count() == before_; }

        private:
            void emit_(diag::Severity sev, diag::Code code, Span sp, std::initializer_list<std::string_view> args) {
                diag::Diagnostic d(sev, code, sp);
                for (const auto a : args) d.add_arg(a);
                bag_.add(std::move(d));
            }

            diag::Bag& bag_;
            bool strict_ = true;
            uint32_t before_ = 0;
        };

        Span doc_start_(const Document& doc) {
            return Span{doc.file_id(), 0, 0};
        }

        // header 줄을 뺀 본문
        std::string_view body_of_(const Requirement& r) {
            const std::string_view raw = r.raw_text;
            const size_t nl = raw.find('\n');
            return (nl == std::string_view::npos) ? std::string_view{} : raw.substr(nl + 1);
        }

        /// @brief 잘못된 시나리오 표기가 있는 줄의 span
        std::optional<Span> find_malformed_scenario_(const Document& doc, const Requirement& r) {
            const std::string_view body = body_of_(r);
            const uint32_t body_lo = r.block_lo + static_cast<uint32_t>(r.raw_text.size() - body.size());

            size_t best = std::string_view::npos;
            for (const auto pat : kMalformedScenario) {
                const size_t at = body.find(pat);
                if (at < best) best = at;
            }
            if (best == std::string_view::npos) return std::nullopt;

            const uint32_t lo = body_lo + static_cast<uint32_t>(best);
            const size_t nl = body.find('\n', best);
            const uint32_t hi = (nl == std::string_view::npos) ? r.block_hi : body_lo + static_cast<uint32_t>(nl);
            return Span{doc.file_id(), lo, hi > lo ? hi : lo + 1};
        }

        void check_requirement_(const Document& doc, const Requirement& r, RuleSink& sink) {
            if (!contains_shall_or_must(body_of_(r))) {
                sink.warn(diag::Code::kReqMissingShallMust, r.header_span, {r.name});
            }
            if (!r.scenarios.empty()) return;

            sink.warn(diag::Code::kReqMissingScenario, r.header_span, {r.name});
            if (auto bad = find_malformed_scenario_(doc, r)) {
                sink.error(diag::Code::kReqMalformedScenario, *bad, {r.name});
            }
        }

        void check_duplicates_(const std::vector<Requirement>& reqs, DeltaSection sec, RuleSink& sink) {
            std::unordered_set<std::string> seen;
            for (const auto& r : reqs) {
                if (!seen.insert(normalize_requirement_name(r.name)).second) {
                    sink.error(diag::Code::kDeltaDuplicate, r.header_span, {r.name, delta_section_name(sec)});
                }
            }
        }

        struct NameEntry {
            std::string name;
            Span span{};
        };

        using NameSet = std::unordered_map<std::string, NameEntry>;

        void add_name_(NameSet& set, std::string_view name, Span sp) {
            set.emplace(normalize_requirement_name(name), NameEntry{std::string(name), sp});
        }

        // 뒤 section 의 항목 위치로 보고한다
        void check_conflict_(const NameSet& a,
                             std::string_view a_name,
                             const NameSet& b,
                             std::string_view b_name,
                             RuleSink& sink) {
            // 출력 순서를 고정하려고 정렬
            std::set<std::pair<uint32_t, std::string>> hits;
            for (const auto& [key, e] : b) {
                if (a.count(key) != 0) hits.insert({e.span.lo, key});
            }
            for (const auto& [lo, key] : hits) {
                const NameEntry& e = b.at(key);
                sink.error(diag::Code::kDeltaConflict, e.span, {e.name, a_name, b_name});
            }
        }

    } // namespace

    bool looks_like_delta(const Document& doc) {
        const ast::NodeId root = doc.root();
        if (root == ast::k_invalid_node) return false;

        for (const ast::NodeId c : doc.children(root)) {
            const ast::Node& n = doc.node(c);
            if (n.kind != ast::NodeKind::kHeader || n.level != 2) continue;
            if (classify_delta_header(doc.slice(n.text)) != DeltaSection::kNone) return true;
        }
        return false;
    }

    bool validate_spec(const Document& doc, diag::Bag& bag, bool strict) {
        RuleSink sink(bag, strict);

        const auto sec = find_section(doc, "Requirements");
        if (!sec) {
            sink.error(diag::Code::kSpecMissingRequirements, doc_start_(doc));
            return sink.ok();
        }

        std::unordered_set<std::string> seen;
        for (const auto& r : extract_requirements(doc)) {
            if (r.block_lo < sec->lo || r.block_lo >= sec->hi) continue;

            if (!seen.insert(normalize_requirement_name(r.name)).second) {
                sink.error(diag::Code::kSpecDuplicateRequirement, r.header_span, {r.name});
            }
            check_requirement_(doc, r, sink);
        }
        return sink.ok();
    }

    bool validate_delta(const Document& doc, diag::Bag& bag, bool strict) {
        RuleSink sink(bag, strict);
        const DeltaPlan plan = extract_delta(doc);

        if (!plan.has_deltas() && plan.incomplete_renames.empty()) {
            sink.error(diag::Code::kDeltaEmpty, doc_start_(doc));
            return sink.ok();
        }

        for (const auto& r : plan.added) check_requirement_(doc, r, sink);
        for (const auto& r : plan.modified) check_requirement_(doc, r, sink);

        check_duplicates_(plan.added, DeltaSection::kAdded, sink);
        check_duplicates_(plan.modified, DeltaSection::kModified, sink);

        NameSet added, modified, removed, from, to;
        for (const auto& r : plan.added) add_name_(added, r.name, r.header_span);
        for (const auto& r : plan.modified) add_name_(modified, r.name, r.header_span);
        for (size_t i = 0; i < plan.removed.size(); ++i) add_name_(removed, plan.removed[i], plan.removed_spans[i]);
        for (const auto& op : plan.renamed) {
            add_name_(from, op.from, op.span);
            add_name_(to, op.to, op.span);
        }

        check_conflict_(added, "ADDED", modified, "MODIFIED", sink);
        check_conflict_(added, "ADDED", removed, "REMOVED", sink);
        check_conflict_(added, "ADDED", to, "RENAMED TO", sink);
        check_conflict_(modified, "MODIFIED", removed, "REMOVED", sink);
        check_conflict_(modified, "MODIFIED", from, "RENAMED FROM", sink);
        check_conflict_(removed, "REMOVED", from, "RENAMED FROM", sink);

        for (const auto& op : plan.incomplete_renames) {
            sink.error(diag::Code::kDeltaRenameIncomplete, op.span, {op.from});
        }
        return sink.ok();
    }

    bool validate_pre_merge(const Document& base, const Document& delta_doc, const DeltaPlan& plan, diag::Bag& bag) {
        RuleSink sink(bag, true);
        const uint32_t fid = delta_doc.file_id();

        // 병합 순서대로 이름 집합을 흉내낸다
        std::unordered_set<std::string> names;
        for (const auto& r : extract_requirements(base)) names.insert(normalize_requirement_name(r.name));

        for (const auto& op : plan.renamed) {
            const std::string f = normalize_requirement_name(op.from);
            const std::string t = normalize_requirement_name(op.to);
            if (names.count(f) == 0) {
                sink.error(diag::Code::kMergeMissingBase, op.span, {op.from, "RENAMED FROM"});
                continue;
            }
            if (names.count(t) != 0) {
                sink.error(diag::Code::kMergeAlreadyExists, op.span, {op.to, "RENAMED TO"});
                continue;
            }
            names.erase(f);
            names.insert(t);
        }

        for (size_t i = 0; i < plan.removed.size(); ++i) {
            const std::string key = normalize_requirement_name(plan.removed[i]);
            if (names.erase(key) == 0) {
                sink.error(diag::Code::kMergeMissingBase, plan.removed_spans[i], {plan.removed[i], "REMOVED"});
            }
        }

        for (const auto& r : plan.modified) {
            if (names.count(normalize_requirement_name(r.name)) == 0) {
                sink.error(diag::Code::kMergeMissingBase, Span{fid, r.header_span.lo, r.header_span.hi}, {r.name, "MODIFIED"});
            }
        }

        for (const auto& r : plan.added) {
            if (names.count(normalize_requirement_name(r.name)) != 0) {
                sink.error(diag::Code::kMergeAlreadyExists, Span{fid, r.header_span.lo, r.header_span.hi}, {r.name, "ADDED"});
            }
        }
        return sink.ok();
    }

} // namespace specdoc::spec
