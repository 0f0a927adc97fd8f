// frontend/src/spec/extract.cpp
#include <specdoc/spec/Extract.hpp>
#include <specdoc/spec/Names.hpp>

#include <optional>


namespace specdoc::spec {

    using ast::NodeId;
    using ast::NodeKind;

    namespace {

        struct Walk {
            std::vector<Requirement> requirements;
            DeltaPlan plan;
        };

        /// @brief 최상위 block 을 한 번 훑어 requirement 와 delta 를 함께 모은다.
        class Extractor {
        public:
            explicit Extractor(const Document& doc) : doc_(doc) {}

            Walk run() {
                const NodeId root = doc_.root();
                if (root == ast::k_invalid_node) return std::move(out_);

                for (const NodeId c : doc_.children(root)) {
                    const ast::Node& n = doc_.node(c);
                    if (n.kind == NodeKind::kHeader) {
                        on_header_(c, n);
                        continue;
                    }
                    if (n.kind == NodeKind::kList && section_ == DeltaSection::kRenamed) {
                        scan_renames_(c);
                    }
                }

                flush_(doc_.size());
                if (pending_from_) {
                    out_.plan.incomplete_renames.push_back(std::move(*pending_from_));
                    pending_from_.reset();
                }
                return std::move(out_);
            }

        private:
            void on_header_(NodeId id, const ast::Node& n) {
                const std::string_view text = doc_.slice(n.text);

                if (n.level <= 3) flush_(n.span.lo);

                if (n.level <= 2) {
                    section_ = (n.level == 2) ? classify_delta_header(text) : DeltaSection::kNone;
                    return;
                }

                if (n.level == 3) {
                    auto name = match_requirement_header(text);
                    if (!name) return;

                    Requirement r;
                    r.name = std::move(*name);
                    r.section = section_;
                    r.header = doc_.handle(id);
                    r.header_span = Span{doc_.file_id(), n.span.lo, n.span.hi};
                    r.block_lo = n.span.lo;
                    open_ = std::move(r);
                    return;
                }

                if (n.level == 4 && open_) {
                    if (auto scen = match_scenario_header(text)) open_->scenarios.push_back(std::move(*scen));
                }
            }

            void flush_(uint32_t at) {
                if (!open_) return;

                Requirement r = std::move(*open_);
                open_.reset();

                r.block_hi = at;
                r.raw_text = doc_.print_range(r.block_lo, at);
                while (!r.raw_text.empty() && (r.raw_text.back() == '\n' || r.raw_text.back() == '\r')) {
                    r.raw_text.pop_back();
                }
                r.raw_text.push_back('\n');

                switch (r.section) {
                    case DeltaSection::kAdded:
                        out_.plan.added.push_back(r);
                        break;
                    case DeltaSection::kModified:
                        out_.plan.modified.push_back(r);
                        break;
                    case DeltaSection::kRemoved:
                        out_.plan.removed.push_back(r.name);
                        out_.plan.removed_spans.push_back(r.header_span);
                        break;
                    case DeltaSection::kNone:
                    case DeltaSection::kRenamed:
                        break;
                }
                out_.requirements.push_back(std::move(r));
            }

            // 목록 항목을 문서 순서로 (중첩 포함)
            void scan_renames_(NodeId list) {
                std::vector<NodeId> stack{list};
                while (!stack.empty()) {
                    const NodeId cur = stack.back();
                    stack.pop_back();

                    const ast::Node& n = doc_.node(cur);
                    if (n.kind == NodeKind::kListItem || n.kind == NodeKind::kTaskItem) {
                        on_rename_item_(n);
                    }

                    const auto kids = doc_.children(cur);
                    for (size_t i = kids.size(); i-- > 0;) {
                        const NodeKind k = doc_.node(kids[i]).kind;
                        if (k == NodeKind::kList || k == NodeKind::kListItem || k == NodeKind::kTaskItem) {
                            stack.push_back(kids[i]);
                        }
                    }
                }
            }

            void on_rename_item_(const ast::Node& item) {
                const std::string_view text = doc_.slice(item.text);
                const Span at{doc_.file_id(), item.span.lo, item.span.hi};

                if (auto from = match_renamed_from(text)) {
                    // 짝 없는 FROM 이 남아 있으면 미완성으로 넘긴다
                    if (pending_from_) out_.plan.incomplete_renames.push_back(std::move(*pending_from_));
                    pending_from_ = RenameOp{std::move(*from), {}, at};
                    return;
                }

                if (auto to = match_renamed_to(text)) {
                    if (!pending_from_) return;
                    RenameOp op = std::move(*pending_from_);
                    pending_from_.reset();
                    op.to = std::move(*to);
                    out_.plan.renamed.push_back(std::move(op));
                }
            }

            const Document& doc_;
            DeltaSection section_ = DeltaSection::kNone;
            std::optional<Requirement> open_;
            std::optional<RenameOp> pending_from_;
            Walk out_;
        };

        bool contains_(std::string_view hay, std::string_view needle) {
            return hay.find(needle) != std::string_view::npos;
        }

    } // namespace

    std::vector<Requirement> extract_requirements(const Document& doc) {
        return Extractor(doc).run().requirements;
    }

    DeltaPlan extract_delta(const Document& doc) {
        return Extractor(doc).run().plan;
    }

    DeltaSection classify_delta_header(std::string_view header_text) {
        if (contains_(header_text, "ADDED Requirements")) return DeltaSection::kAdded;
        if (contains_(header_text, "MODIFIED Requirements")) return DeltaSection::kModified;
        if (contains_(header_text, "REMOVED Requirements")) return DeltaSection::kRemoved;
        if (contains_(header_text, "RENAMED Requirements")) return DeltaSection::kRenamed;
        return DeltaSection::kNone;
    }

    DeltaCounts count_delta_changes(const DeltaPlan& plan) {
        DeltaCounts c;
        c.added = static_cast<uint32_t>(plan.added.size());
        c.modified = static_cast<uint32_t>(plan.modified.size());
        c.removed = static_cast<uint32_t>(plan.removed.size());
        c.renamed = static_cast<uint32_t>(plan.renamed.size());
        return c;
    }

    std::string delta_summary(const DeltaCounts& counts) {
        std::string out;
        out += "+" + std::to_string(counts.added);
        out += " ~" + std::to_string(counts.modified);
        out += " -" + std::to_string(counts.removed);
        out += " \xE2\x86\x92" + std::to_string(counts.renamed);
        return out;
    }

    std::optional<SectionRange> find_section(const Document& doc, std::string_view title) {
        const NodeId root = doc.root();
        if (root == ast::k_invalid_node) return std::nullopt;

        std::optional<SectionRange> found;
        for (const NodeId c : doc.children(root)) {
            const ast::Node& n = doc.node(c);
            if (n.kind != NodeKind::kHeader) continue;

            if (found) {
                if (n.level <= 2) {
                    found->hi = n.span.lo;
                    return found;
                }
                continue;
            }

            if (n.level == 2 && doc.slice(n.text) == title) {
                found = SectionRange{c, n.span.lo, n.span.hi, doc.size()};
            }
        }
        return found;
    }

} // namespace specdoc::spec
