// frontend/src/tasks/task_line.cpp
#include <specdoc/tasks/TaskLine.hpp>
#include <specdoc/lex/Lexer.hpp>


namespace specdoc::tasks {

    using K = syntax::TokenKind;

    namespace {

        std::string_view trim_(std::string_view s) {
            while (!s.empty() && (is_blank_char(s.front()) || s.front() == '\r')) s.remove_prefix(1);
            while (!s.empty() && (is_blank_char(s.back()) || s.back() == '\r')) s.remove_suffix(1);
            return s;
        }

    } // namespace

    std::optional<TaskLine> match_task_line(std::string_view line) {
        const size_t nl = line.find('\n');
        if (nl != std::string_view::npos) line = line.substr(0, nl);

        diag::Bag bag;
        Lexer lex(line, 0, &bag);
        const auto toks = lex.lex_all();
        if (bag.has_fatal()) return std::nullopt;

        size_t i = 0;
        const auto at = [&](K k) { return i < toks.size() && toks[i].kind == k; };

        if (at(K::kIndent)) ++i;
        if (!at(K::kListMarker) || toks[i].lexeme != "-") return std::nullopt;
        ++i;
        if (at(K::kSpace)) ++i;

        if (!at(K::kCheckboxOpen)) return std::nullopt;
        ++i;
        if (!at(K::kCheckboxMark)) return std::nullopt;

        TaskLine out;
        const char mark = toks[i].lexeme.front();
        out.checked = (mark == 'x' || mark == 'X');
        ++i;
        if (!at(K::kCheckboxClose)) return std::nullopt;
        ++i;
        if (at(K::kSpace)) ++i;

        if (at(K::kTaskId)) {
            std::string_view id = toks[i].lexeme;
            if (!id.empty() && id.back() == '.') id.remove_suffix(1);
            out.id = std::string(id);
            ++i;
            if (at(K::kSpace)) ++i;
        }

        // 나머지 inline 토큰이 설명
        const uint32_t lo = (i < toks.size() && toks[i].kind != K::kEof) ? toks[i].span.lo
                                                                          : static_cast<uint32_t>(line.size());
        out.description = std::string(trim_(line.substr(lo)));
        return out;
    }

} // namespace specdoc::tasks
