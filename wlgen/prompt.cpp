#include "prompt.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace wlgen {
    auto confirm(std::ostream &console, std::istream &in, std::string_view question) -> bool {
        console << question << " (y/N): " << std::flush;

        auto response = std::string{};
        if(!std::getline(in, response)) {
            return false;
        }

        return response == "y" || response == "Y";
    }
}
