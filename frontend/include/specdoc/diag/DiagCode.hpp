// frontend/include/specdoc/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace specdoc::diag {

    enum class Severity : uint8_t {
        kError,
        kWarning,
        kFatal,
    };

    enum class Language : uint8_t {
        kEn,
        kKo,
    };

    enum class Code : uint16_t {
        kInvalidUtf8,   // 올바른 UTF8 문자열이 아님

        // selector (query)
        kQuerySyntax,
        kQueryUnexpectedChar,
        kQueryUnterminatedString,
        kQueryUnknownType,
        kQueryUnknownAttr,
        kQueryEmpty,

        // incremental update
        kEditOutOfRange,

        // file io
        kFileReadFailed,
        kFileWriteFailed,

        // tasks.jsonc
        kTaskStoreSyntax,
        kTaskStoreSchema,
        kTaskUnknownStatus,

        // spec validation
        kSpecMissingRequirements,
        kSpecDuplicateRequirement,
        kReqMissingShallMust,
        kReqMissingScenario,
        kReqMalformedScenario,

        // delta validation
        kDeltaEmpty,
        kDeltaDuplicate,
        kDeltaConflict,
        kDeltaRenameIncomplete,

        // merge (archive)
        kMergeMissingBase,
        kMergeAlreadyExists,
        kMergeNewSpecOnlyAdded,
    };

} // namespace specdoc::diag
