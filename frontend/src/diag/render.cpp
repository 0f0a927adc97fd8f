// frontend/src/diag/render.cpp
#include <specdoc/diag/Render.hpp>
#include <specdoc/json/Json.hpp>

#include <sstream>


namespace specdoc::diag {

    static constexpr uint32_t digits10(uint32_t v) {
        uint32_t d = 1;
        while (v >= 10) { v /= 10; ++d; }
        return d;
    }

    static std::string replace_all(std::string s, std::string_view from, std::string_view to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }
        return s;
    }

    static std::string format_template(std::string templ, const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            std::string key = "{" + std::to_string(i) + "}";
            templ = replace_all(std::move(templ), key, args[i]);
        }
        return templ;
    }

    static const char* severity_name_(Severity sev) {
        return (sev == Severity::kWarning) ? "warning" :
               (sev == Severity::kFatal)   ? "fatal"   : "error";
    }

    static std::string_view code_name_sv_(Code c) {
        switch (c) {
            case Code::kInvalidUtf8: return "InvalidUtf8";
            case Code::kQuerySyntax: return "QuerySyntax";
            case Code::kQueryUnexpectedChar: return "QueryUnexpectedChar";
            case Code::kQueryUnterminatedString: return "QueryUnterminatedString";
            case Code::kQueryUnknownType: return "QueryUnknownType";
            case Code::kQueryUnknownAttr: return "QueryUnknownAttr";
            case Code::kQueryEmpty: return "QueryEmpty";
            case Code::kEditOutOfRange: return "EditOutOfRange";
            case Code::kFileReadFailed: return "FileReadFailed";
            case Code::kFileWriteFailed: return "FileWriteFailed";
            case Code::kTaskStoreSyntax: return "TaskStoreSyntax";
            case Code::kTaskStoreSchema: return "TaskStoreSchema";
            case Code::kTaskUnknownStatus: return "TaskUnknownStatus";
            case Code::kSpecMissingRequirements: return "SpecMissingRequirements";
            case Code::kSpecDuplicateRequirement: return "SpecDuplicateRequirement";
            case Code::kReqMissingShallMust: return "ReqMissingShallMust";
            case Code::kReqMissingScenario: return "ReqMissingScenario";
            case Code::kReqMalformedScenario: return "ReqMalformedScenario";
            case Code::kDeltaEmpty: return "DeltaEmpty";
            case Code::kDeltaDuplicate: return "DeltaDuplicate";
            case Code::kDeltaConflict: return "DeltaConflict";
            case Code::kDeltaRenameIncomplete: return "DeltaRenameIncomplete";
            case Code::kMergeMissingBase: return "MergeMissingBase";
            case Code::kMergeAlreadyExists: return "MergeAlreadyExists";
            case Code::kMergeNewSpecOnlyAdded: return "MergeNewSpecOnlyAdded";
        }
        return "Unknown";
    }

    static std::string template_en(Code c) {
        switch (c) {
            // args: {0}=byte offset, {1}=byte hex
            case Code::kInvalidUtf8: return "invalid UTF-8 sequence starting at byte offset {0} (byte=0x{1})";

            // args: {0}=detail
            case Code::kQuerySyntax: return "invalid selector: {0}";
            case Code::kQueryUnexpectedChar: return "unexpected character '{0}' in selector";
            case Code::kQueryUnterminatedString: return "unterminated string in selector";
            case Code::kQueryUnknownType: return "unknown node type '{0}' in selector";
            case Code::kQueryUnknownAttr: return "unknown attribute '{0}' in selector";
            case Code::kQueryEmpty: return "empty selector";

            // args: {0}=lo, {1}=hi, {2}=document size
            case Code::kEditOutOfRange: return "edit range [{0}, {1}) is outside the document (size {2})";

            // args: {0}=path, {1}=reason
            case Code::kFileReadFailed: return "failed to read '{0}': {1}";
            case Code::kFileWriteFailed: return "failed to write '{0}': {1}";

            case Code::kTaskStoreSyntax: return "malformed task status file (JSON syntax error)";
            // args: {0}=detail
            case Code::kTaskStoreSchema: return "task status file does not match the expected schema: {0}";
            // args: {0}=status, {1}=task id
            case Code::kTaskUnknownStatus: return "unknown task status '{0}' for task {1}";

            case Code::kSpecMissingRequirements: return "missing required '## Requirements' section";
            // args: {0}=requirement name
            case Code::kSpecDuplicateRequirement: return "duplicate requirement name '{0}'";
            case Code::kReqMissingShallMust: return "requirement '{0}' should contain SHALL or MUST to indicate a normative requirement";
            case Code::kReqMissingScenario: return "requirement '{0}' should have at least one scenario";
            case Code::kReqMalformedScenario: return "requirement '{0}': scenarios must use the '#### Scenario:' format (4 hashtags followed by 'Scenario:')";

            case Code::kDeltaEmpty: return "delta spec has no operations";
            // args: {0}=name, {1}=section
            case Code::kDeltaDuplicate: return "requirement '{0}' appears more than once in {1}";
            // args: {0}=name, {1}=section, {2}=section
            case Code::kDeltaConflict: return "requirement '{0}' appears in both {1} and {2}";
            // args: {0}=from name
            case Code::kDeltaRenameIncomplete: return "RENAMED entry 'FROM: {0}' has no matching 'TO:'";

            // args: {0}=name, {1}=section
            case Code::kMergeMissingBase: return "{1} requirement '{0}' does not exist in the base spec";
            case Code::kMergeAlreadyExists: return "{1} requirement '{0}' already exists in the base spec";
            case Code::kMergeNewSpecOnlyAdded: return "target spec does not exist; only ADDED requirements are allowed for new specs";
        }
        return "unknown diagnostic";
    }

    static std::string template_ko(Code c) {
        switch (c) {
            // args: {0}=byte offset, {1}=byte hex
            case Code::kInvalidUtf8: return "UTF-8 시퀀스가 바이트 오프셋 {0}에서 깨졌습니다 (바이트=0x{1})";

            case Code::kQuerySyntax: return "잘못된 셀렉터입니다: {0}";
            case Code::kQueryUnexpectedChar: return "셀렉터에 예상치 못한 문자 '{0}'가 있습니다";
            case Code::kQueryUnterminatedString: return "셀렉터의 문자열이 닫히지 않았습니다";
            case Code::kQueryUnknownType: return "셀렉터에 알 수 없는 노드 타입 '{0}'가 있습니다";
            case Code::kQueryUnknownAttr: return "셀렉터에 알 수 없는 속성 '{0}'가 있습니다";
            case Code::kQueryEmpty: return "셀렉터가 비어 있습니다";

            case Code::kEditOutOfRange: return "편집 범위 [{0}, {1})가 문서 범위(크기 {2})를 벗어났습니다";

            case Code::kFileReadFailed: return "'{0}' 파일을 읽지 못했습니다: {1}";
            case Code::kFileWriteFailed: return "'{0}' 파일을 쓰지 못했습니다: {1}";

            case Code::kTaskStoreSyntax: return "작업 상태 파일이 올바른 JSON이 아닙니다";
            case Code::kTaskStoreSchema: return "작업 상태 파일 형식이 올바르지 않습니다: {0}";
            case Code::kTaskUnknownStatus: return "작업 {1}의 상태 '{0}'를 알 수 없습니다";

            case Code::kSpecMissingRequirements: return "필수 '## Requirements' 섹션이 없습니다";
            case Code::kSpecDuplicateRequirement: return "요구사항 이름 '{0}'이(가) 중복되었습니다";
            case Code::kReqMissingShallMust: return "요구사항 '{0}'에 규범 표현(SHALL 또는 MUST)이 없습니다";
            case Code::kReqMissingScenario: return "요구사항 '{0}'에 시나리오가 최소 1개 필요합니다";
            case Code::kReqMalformedScenario: return "요구사항 '{0}': 시나리오는 '#### Scenario:' 형식(# 4개 + 'Scenario:')을 사용해야 합니다";

            case Code::kDeltaEmpty: return "델타 스펙에 변경 사항이 없습니다";
            case Code::kDeltaDuplicate: return "요구사항 '{0}'이(가) {1}에 두 번 이상 나옵니다";
            case Code::kDeltaConflict: return "요구사항 '{0}'이(가) {1}와 {2}에 동시에 나옵니다";
            case Code::kDeltaRenameIncomplete: return "RENAMED 항목 'FROM: {0}'에 대응하는 'TO:'가 없습니다";

            case Code::kMergeMissingBase: return "{1} 요구사항 '{0}'이(가) 기준 스펙에 없습니다";
            case Code::kMergeAlreadyExists: return "{1} 요구사항 '{0}'이(가) 기준 스펙에 이미 있습니다";
            case Code::kMergeNewSpecOnlyAdded: return "대상 스펙이 없으므로 ADDED 요구사항만 허용됩니다";
        }
        return "알 수 없는 진단";
    }

    std::string code_name(Code c) {
        return std::string(code_name_sv_(c));
    }

    std::string render_message(const Diagnostic& d, Language lang) {
        std::string msg = (lang == Language::kKo) ? template_ko(d.code()) : template_en(d.code());
        return format_template(std::move(msg), d.args());
    }

    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm) {
        const std::string msg = render_message(d, lang);

        const auto sp = d.span();
        const auto lc = sm.line_col(sp.file_id, sp.lo);
        const auto sn = sm.snippet_for_span(sp);

        std::ostringstream oss;
        oss << severity_name_(d.severity()) << "[" << code_name_sv_(d.code()) << "]: " << msg << "\n";
        oss << " --> " << sm.name(sp.file_id) << ":" << lc.line << ":" << lc.col << "\n";
        oss << "  |\n";
        oss << sn.line_no << " | " << sn.line_text << "\n";
        oss << "  | ";
        oss << std::string(sn.caret_cols_before, ' ');
        oss << std::string(sn.caret_cols_len, '^');
        return oss.str();
    }

    std::string render_one_context(const Diagnostic& d, Language lang, const SourceManager& sm, uint32_t context_lines) {
        const std::string msg = render_message(d, lang);

        const auto sp = d.span();
        const auto lc = sm.line_col(sp.file_id, sp.lo);

        // 컨텍스트 스니펫
        const auto blk = sm.snippet_block_for_span(sp, context_lines);

        const uint32_t last_line_no = blk.first_line_no + static_cast<uint32_t>(blk.lines.size()) - 1;
        const uint32_t w = digits10(last_line_no);

        std::ostringstream out;
        out << severity_name_(d.severity()) << "[" << code_name_sv_(d.code()) << "]: " << msg << "\n";
        out << " --> " << sm.name(sp.file_id) << ":" << lc.line << ":" << lc.col << "\n";
        out << "  |\n";

        for (uint32_t i = 0; i < blk.lines.size(); ++i) {
            const uint32_t line_no = blk.first_line_no + i;

            // "  12 | text..."
            out << std::string(2, ' ');
            {
                const std::string num = std::to_string(line_no);
                out << std::string(w - static_cast<uint32_t>(num.size()), ' ') << num;
            }
            out << " | " << blk.lines[i] << "\n";

            if (i == blk.caret_line_offset) {
                out << std::string(2, ' ');
                out << std::string(w, ' ') << " | ";
                out << std::string(blk.caret_cols_before, ' ');
                out << std::string(blk.caret_cols_len, '^') << "\n";
            }
        }

        return out.str();
    }

    std::string render_one_json(const Diagnostic& d, Language lang, const SourceManager& sm) {
        const auto sp = d.span();
        const auto lc = sm.line_col(sp.file_id, sp.lo);

        std::ostringstream out;
        out << "{\"severity\":\"" << severity_name_(d.severity()) << "\""
            << ",\"code\":\"" << code_name_sv_(d.code()) << "\""
            << ",\"file\":\"" << json::escape(sm.name(sp.file_id)) << "\""
            << ",\"line\":" << lc.line
            << ",\"col\":" << lc.col
            << ",\"lo\":" << sp.lo
            << ",\"hi\":" << sp.hi
            << ",\"message\":\"" << json::escape(render_message(d, lang)) << "\"}";
        return out.str();
    }

} // namespace specdoc::diag
