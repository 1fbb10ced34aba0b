#pragma once

#include <string>

namespace helix::bus {

struct Message {
    std::string subject;
    std::string reply_to;
    std::string payload;
};

}  // namespace helix::bus
