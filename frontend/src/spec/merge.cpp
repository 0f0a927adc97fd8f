// frontend/src/spec/merge.cpp
#include <specdoc/spec/Merge.hpp>
#include <specdoc/spec/Extract.hpp>
#include <specdoc/spec/Names.hpp>


namespace specdoc::spec {

    namespace {

        struct Block {
            std::string key;   // normalize_requirement_name
            std::string raw;
            bool alive = true;
        };

        std::string trim_newlines_(std::string_view s) {
            while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.remove_suffix(1);
            return std::string(s);
        }

        bool is_blank_text_(std::string_view s) {
            for (const char c : s) {
                if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
            }
            return true;
        }

        // 첫 줄(header) 만 바꾸고 줄 끝 형식은 유지
        void rewrite_header_line_(std::string& raw, std::string_view new_name) {
            size_t end = raw.find('\n');
            if (end == std::string::npos) end = raw.size();
            if (end > 0 && raw[end - 1] == '\r') --end;
            raw.replace(0, end, "### Requirement: " + std::string(new_name));
        }

        Block* find_alive_(std::vector<Block>& blocks, const std::string& key) {
            for (auto& b : blocks) {
                if (b.alive && b.key == key) return &b;
            }
            return nullptr;
        }

        std::string new_spec_(const DeltaPlan& plan, std::string_view capability, DeltaCounts& counts) {
            std::string out = "# " + format_capability_name(capability) + " Specification\n\n";
            out += "## Requirements\n";
            if (plan.added.empty()) return out;

            out += "\n";
            for (const auto& r : plan.added) {
                out += trim_newlines_(r.raw_text);
                out += "\n\n";
            }
            counts.added = static_cast<uint32_t>(plan.added.size());
            return out;
        }

    } // namespace

    std::optional<MergeResult> merge_spec(const Document* base,
                                          const Document& delta_doc,
                                          std::string_view capability,
                                          diag::Bag& bag,
                                          const MergeOptions& opt) {
        const DeltaPlan plan = extract_delta(delta_doc);
        if (!plan.has_deltas()) {
            bag.add(diag::Diagnostic(diag::Severity::kError, diag::Code::kDeltaEmpty, Span{delta_doc.file_id(), 0, 0}));
            return std::nullopt;
        }

        MergeResult res;

        if (base == nullptr) {
            if (!plan.modified.empty() || !plan.removed.empty() || !plan.renamed.empty()) {
                bag.add(diag::Diagnostic(diag::Severity::kError, diag::Code::kMergeNewSpecOnlyAdded,
                                         Span{delta_doc.file_id(), 0, 0}));
                return std::nullopt;
            }
            res.text = new_spec_(plan, capability, res.counts);
            return res;
        }

        // preamble | requirements | after
        const auto sec = find_section(*base, "Requirements");
        std::string preamble;
        std::string after;
        std::vector<Block> blocks;

        if (sec) {
            uint32_t first_req = sec->hi;
            for (const auto& r : extract_requirements(*base)) {
                if (r.block_lo < sec->lo || r.block_lo >= sec->hi) continue;
                if (blocks.empty()) first_req = r.block_lo;
                blocks.push_back(Block{normalize_requirement_name(r.name), trim_newlines_(r.raw_text), true});
            }

            preamble = base->print_range(0, sec->body_lo);
            // header 와 첫 requirement 사이의 소개 문단은 남긴다
            const std::string intro = base->print_range(sec->body_lo, first_req);
            if (!is_blank_text_(intro)) {
                preamble += "\n";
                preamble += trim_newlines_(intro.substr(intro.find_first_not_of("\r\n")));
                preamble += "\n";
            }
            preamble += "\n";
            after = base->print_range(sec->hi, base->size());
        } else {
            preamble = trim_newlines_(base->print());
            if (!preamble.empty()) preamble += "\n\n";
            preamble += "## Requirements\n\n";
        }

        // RENAMED -> REMOVED -> MODIFIED -> ADDED
        for (const auto& op : plan.renamed) {
            Block* b = find_alive_(blocks, normalize_requirement_name(op.from));
            if (b == nullptr) continue;
            rewrite_header_line_(b->raw, op.to);
            b->key = normalize_requirement_name(op.to);
            ++res.counts.renamed;
        }

        for (const auto& name : plan.removed) {
            Block* b = find_alive_(blocks, normalize_requirement_name(name));
            if (b == nullptr) continue;
            b->alive = false;
            ++res.counts.removed;
        }

        for (const auto& r : plan.modified) {
            Block* b = find_alive_(blocks, normalize_requirement_name(r.name));
            if (b == nullptr) continue;
            b->raw = trim_newlines_(r.raw_text);
            ++res.counts.modified;
        }

        for (const auto& r : plan.added) {
            blocks.push_back(Block{normalize_requirement_name(r.name), trim_newlines_(r.raw_text), true});
        }
        res.counts.added = static_cast<uint32_t>(plan.added.size());

        std::string body;
        bool first = true;
        for (const auto& b : blocks) {
            if (!b.alive) continue;
            if (!first) body += "\n";
            body += b.raw;
            body += "\n";
            first = false;
        }

        std::string out = std::move(preamble);
        out += body;
        if (!after.empty()) {
            if (!body.empty()) out += "\n";
            out += after;
        }

        res.text = opt.collapse_blank_lines ? collapse_blank_lines(out) : std::move(out);
        return res;
    }

} // namespace specdoc::spec
