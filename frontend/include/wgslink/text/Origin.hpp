// frontend/include/wgslink/text/Origin.hpp
#pragma once
#include <wgslink/text/Span.hpp>


namespace wgslink {

    /// @brief 렌더링된 텍스트 조각이 만들어진 원래 소스 위치.
    /// @details direct: 현재 fragment 안의 토큰.
    ///          inherited: import로 끌려온 토큰. import_site는 기록용일 뿐이고
    ///          사용자에게 보이는 위치는 항상 def(실제 정의 위치)이다.
    class Origin {
    public:
        Origin() = default;

        static Origin direct(Span def) {
            Origin o;
            o.def_ = def;
            return o;
        }

        static Origin inherited(Span import_site, Span def) {
            Origin o;
            o.def_ = def;
            o.import_site_ = import_site;
            o.inherited_ = true;
            return o;
        }

        /// @brief 이미 inherited인 origin을 다시 import할 때도 def는 가장 안쪽 정의를 유지한다.
        Origin rewritten_for_import(Span import_site) const {
            return inherited(import_site, def_);
        }

        Span surfaced() const       {  return def_;          }
        Span import_site() const    {  return import_site_;  }
        bool is_inherited() const   {  return inherited_;    }

    private:
        Span def_{};
        Span import_site_{};
        bool inherited_ = false;
    };

    // 진단 그룹핑용: 사용자에게 보이는 위치 기준으로만 비교한다.
    inline bool operator==(const Origin& a, const Origin& b) {
        return a.surfaced() == b.surfaced();
    }

    inline bool operator!=(const Origin& a, const Origin& b) {
        return !(a == b);
    }

    inline bool operator<(const Origin& a, const Origin& b) {
        return a.surfaced() < b.surfaced();
    }

} // namespace wgslink
