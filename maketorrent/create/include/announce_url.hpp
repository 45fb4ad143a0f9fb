#pragma once
#include <string>
#include "expected.hpp"


namespace maketorrent::create {

    // Accepts absolute http, https and udp URLs with a host part.
    Expected<void> validateAnnounceUrl(const std::string& url);

} // namespace maketorrent::create
