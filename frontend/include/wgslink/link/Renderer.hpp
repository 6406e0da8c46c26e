// frontend/include/wgslink/link/Renderer.hpp
#pragma once
#include <wgslink/link/Stitcher.hpp>
#include <wgslink/text/Origin.hpp>

#include <cstdint>
#include <string>
#include <vector>


namespace wgslink::link {

    struct OriginRange {
        uint32_t lo = 0;   // inclusive
        uint32_t hi = 0;   // exclusive
        Origin origin{};
    };

    /// @brief 렌더링된 텍스트의 바이트 구간 -> origin 표.
    /// @details 구간들은 정렬돼 있고 빈틈/겹침 없이 [0, text.size())를 나눈다.
    class ByteRangeOriginTable {
    public:
        /// @brief 토큰 시작 위치를 순서대로 넣는다. 직전 구간의 끝은 이 위치로 닫힌다.
        void open_range(uint32_t start, Origin origin);

        /// @brief 마지막 구간을 total에서 닫고 첫 구간을 0부터 시작하게 만든다.
        void finish(uint32_t total);

        /// @brief offset을 포함하는 구간. 끝을 넘는 offset은 마지막 구간으로 본다.
        const OriginRange* lookup(uint32_t offset) const;

        const std::vector<OriginRange>& entries() const { return entries_; }
        bool empty() const { return entries_.empty(); }
        size_t size() const { return entries_.size(); }

    private:
        std::vector<OriginRange> entries_;
    };

    struct RenderedModule {
        std::string text{};
        ByteRangeOriginTable table{};
    };

    /// @brief closure 조각들(해석 순서) 다음에 루트를 이어 붙여 텍스트로 만든다.
    RenderedModule render(const StitchedModule& module);

    /// @brief 토큰열 하나만 렌더링한다.
    RenderedModule render_tokens(const std::vector<FragToken>& tokens);

} // namespace wgslink::link
