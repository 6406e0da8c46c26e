// frontend/src/text/source_manager.cpp
#include <wgslink/text/SourceManager.hpp>

#include <algorithm>


namespace wgslink {

    namespace {

        /// @brief 바이트 구간 안의 코드 포인트 수 (연속 바이트 0b10xxxxxx는 세지 않는다).
        uint32_t code_points_(std::string_view s) {
            uint32_t n = 0;
            for (const char c : s) {
                if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
            }
            return n;
        }

        uint32_t line_index_(const std::vector<uint32_t>& starts, uint32_t off) {
            const auto it = std::upper_bound(starts.begin(), starts.end(), off);
            return static_cast<uint32_t>(it - starts.begin()) - 1;
        }

    } // namespace

    uint32_t SourceManager::add(std::string name, std::string content) {
        const auto id = static_cast<uint32_t>(files_.size());
        by_name_.emplace(name, id);

        File f{std::move(name), std::move(content), {0}};
        for (uint32_t i = 0; i < f.content.size(); ++i) {
            if (f.content[i] == '\n') f.line_starts.push_back(i + 1);
        }
        files_.push_back(std::move(f));
        return id;
    }

    std::optional<uint32_t> SourceManager::find(std::string_view name) const {
        const auto it = by_name_.find(std::string(name));
        if (it == by_name_.end()) return std::nullopt;
        return it->second;
    }

    const SourceManager::File* SourceManager::file_(uint32_t file_id) const {
        return (file_id < files_.size()) ? &files_[file_id] : nullptr;
    }

    std::string_view SourceManager::line_(const File& f, uint32_t index) const {
        const uint32_t lo = f.line_starts[index];
        uint32_t hi = static_cast<uint32_t>(f.content.size());
        if (index + 1 < f.line_starts.size()) hi = f.line_starts[index + 1] - 1;
        return std::string_view(f.content).substr(lo, hi - lo);
    }

    std::string_view SourceManager::name(uint32_t file_id) const {
        const auto* f = file_(file_id);
        return f ? std::string_view(f->name) : std::string_view("<unknown>");
    }

    std::string_view SourceManager::content(uint32_t file_id) const {
        const auto* f = file_(file_id);
        return f ? std::string_view(f->content) : std::string_view{};
    }

    LineCol SourceManager::line_col(uint32_t file_id, uint32_t byte_off) const {
        const auto* f = file_(file_id);
        if (f == nullptr) return LineCol{};

        const uint32_t off = std::min<uint32_t>(byte_off, static_cast<uint32_t>(f->content.size()));
        const uint32_t idx = line_index_(f->line_starts, off);
        return LineCol{idx + 1, off - f->line_starts[idx] + 1};
    }

    Excerpt SourceManager::excerpt(const Span& sp, uint32_t context) const {
        Excerpt ex{};
        const auto* f = file_(sp.file_id);
        if (f == nullptr) {
            ex.lines.push_back(std::string_view{});
            return ex;
        }

        const auto size = static_cast<uint32_t>(f->content.size());
        const uint32_t lo = std::min(sp.lo, size);
        const uint32_t hi = std::max(lo, std::min(sp.hi, size));

        const uint32_t caret = line_index_(f->line_starts, lo);
        const uint32_t first = (caret >= context) ? caret - context : 0;
        const uint32_t last = std::min<uint32_t>(caret + context, static_cast<uint32_t>(f->line_starts.size()) - 1);
        for (uint32_t i = first; i <= last; ++i) ex.lines.push_back(line_(*f, i));

        const std::string_view text = line_(*f, caret);
        const uint32_t col = lo - f->line_starts[caret];
        const uint32_t len = std::min<uint32_t>(hi - lo, static_cast<uint32_t>(text.size()) - col);

        ex.first_line = first + 1;
        ex.caret_line = caret - first;
        ex.caret_before = code_points_(text.substr(0, col));
        ex.caret_len = std::max<uint32_t>(1, code_points_(text.substr(col, len)));
        return ex;
    }

} // namespace wgslink
