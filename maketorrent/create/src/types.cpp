#include "../include/types.hpp"


namespace maketorrent::create {


    std::string defaultName(const std::filesystem::path& target) {
        auto p = target.lexically_normal();
        if (!p.has_filename() && p.has_parent_path()) p = p.parent_path();
        if (p.filename() == "." || p.filename() == ".." || p.filename().empty()) {
            std::error_code ec;
            auto abs = std::filesystem::weakly_canonical(target, ec);
            if (!ec && abs.has_filename()) return abs.filename().string();
        }
        return p.filename().string();
    }


} // namespace maketorrent::create
