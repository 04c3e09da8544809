#pragma once

#include <iosfwd>
#include <string_view>

namespace wlgen {
    /**
     * Asks a yes/no question on console and reads the answer from in. Only "y" or "Y"
     * count as yes; end of input counts as no.
     */
    auto confirm(std::ostream &console, std::istream &in, std::string_view question) -> bool;
}
