// tools/wgslc/include/wgslc/driver/Driver.hpp
#pragma once

#include <wgslc/cli/Options.hpp>


namespace wgslc::driver {

    /// @brief unit 파일들을 읽어 export 등록 -> 조각 확장 -> 출력까지 실행한다.
    /// @return 프로세스 종료 코드 (오류가 하나라도 있으면 1)
    int run(const cli::Options& opt);

} // namespace wgslc::driver
