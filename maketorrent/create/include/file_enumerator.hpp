#pragma once
#include <filesystem>
#include "types.hpp"
#include "../../logger/logger.hpp"


namespace maketorrent::create {

    /**
     * @brief Lists the files that make up a torrent, in stream order.
     *
     * - A regular file yields one entry named after its base name (single-file mode).
     * - A directory is walked recursively; siblings are visited in byte-wise order of
     *   their names, so the stream (and every piece hash) is reproducible on an
     *   unchanged tree. Paths are relative to the directory.
     * - Symlinks are followed. A link cycle, a dangling link or any stat/listing
     *   failure throws InputError; there are no partial results.
     * - Sockets, FIFOs and devices are skipped.
     */
    FileList enumerateFiles(const std::filesystem::path& target, const logger::LoggerPtr& log = nullptr);

} // namespace maketorrent::create
