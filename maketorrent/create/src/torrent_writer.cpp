#include <fstream>
#include <system_error>
#include "../include/torrent_writer.hpp"
#include "../include/types.hpp"


namespace maketorrent::create {

    namespace fs = std::filesystem;


    void writeTorrentFile(const fs::path& path, std::string_view bytes) {
        if (path.empty()) {
            throw OutputError("no output path");
        }

        fs::path tmp = path;
        tmp += ".part";

        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw OutputError("cannot open " + tmp.string() + " for writing");
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                out.close();
                std::error_code ignored;
                fs::remove(tmp, ignored);
                throw OutputError("failed writing " + tmp.string());
            }
        }

        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw OutputError("cannot rename " + tmp.string() + " to " + path.string() + ": " + ec.message());
        }
    }

} // namespace maketorrent::create
