// frontend/include/specdoc/query/Selector.hpp
#pragma once
#include <specdoc/ast/Nodes.hpp>
#include <specdoc/diag/Diagnostic.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace specdoc::query {

    /*
      selector  := alt (',' alt)*
      alt       := compound (comb compound)*
      comb      := ws+ (descendant) | ws* '>' ws* (child)
      compound  := type? attr*     (type 또는 attr 중 하나는 있어야 함)
      type      := document | header | h1..h6 | paragraph | code | list | item | task
                 | text | wikilink | emphasis | codespan | blank | '*'
      attr      := '[' name (op value)? ']'
      op        := '=' | '^=' | '$=' | '*='
      value     := '"' ... '"' | '\'' ... '\'' | bare-word
    */

    enum class TypeTest : uint8_t {
        kAny,
        kDocument,
        kHeader,
        kParagraph,
        kCode,
        kList,
        kItem,      // ListItem + TaskItem
        kTask,
        kText,
        kWikiLink,
        kEmphasis,
        kCodeSpan,
        kBlank,
    };

    enum class AttrOp : uint8_t {
        kExists,
        kEquals,
        kPrefix,
        kSuffix,
        kContains,
    };

    enum class Attr : uint8_t {
        kText,
        kLevel,
        kLang,
        kId,
        kChecked,
        kTarget,
        kAlias,
        kAnchor,
        kOrdered,
    };

    struct AttrTest {
        Attr attr = Attr::kText;
        AttrOp op = AttrOp::kExists;
        std::string value{};
    };

    enum class Combinator : uint8_t {
        kNone,         // 첫 compound
        kDescendant,
        kChild,
    };

    struct Compound {
        TypeTest type = TypeTest::kAny;
        uint8_t level = 0;                 // h1..h6, 0 이면 무관
        std::vector<AttrTest> attrs{};
        Combinator comb = Combinator::kNone;  // 바로 앞 compound 와의 관계
    };

    struct Selector {
        std::vector<std::vector<Compound>> alternatives{};
        std::string source{};
    };

    /// @brief 선택자를 컴파일한다. 오류는 selector 내 위치(Span.lo/hi)와 함께 bag 에 보고.
    std::optional<Selector> compile_selector(std::string_view text, diag::Bag& bag);

    std::string_view type_test_name(TypeTest t);
    std::string_view attr_name(Attr a);

} // namespace specdoc::query
