// frontend/include/wgslink/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace wgslink::diag {

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
        kInvalidUtf8,           // 올바른 UTF8 문자열이 아님
        kUnterminatedComment,   // /* ... 가 닫히지 않음
        kTooManyErrors,

        // ---- export registry ----
        kNameConflict,          // 같은 이름으로 두 번 export
        kExportNameMissing,     // 이름 없는 fragment를 export하려 함

        // ---- stitch ----
        kUnresolvedExport,      // #name 이 어디에도 export되지 않음
        kExportNotVisible,      // export는 있으나 의존 관계 밖의 unit에 있음
        kImportCycle,           // a -> b -> a
        kImportDepthExceeded,   // import 중첩 한도 초과

        // ---- checker ----
        kCheckerError,          // args[0] = checker message
        kCheckerWarning,        // args[0] = checker message

        // ---- export index ----
        kExportIndexMissing,        // export index file missing
        kExportIndexSchema,         // export index parse/schema mismatch
        kExportIndexSourceMissing,  // 정의 원본 파일을 읽을 수 없어 위치 표시가 부정확함

        // ---- host(unit file) ----
        kHostExpectedToken,     // args[0] = expected, args[1] = found
        kHostUnexpectedEof,
        kUnknownUnit,           // requires 대상 unit 없음
        kUnitCycle,             // unit 의존 관계 순환
        kDuplicateUnit,
        kDuplicateConstant,     // 같은 fragment 상수 이름
    };

} // namespace wgslink::diag
