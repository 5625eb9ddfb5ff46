#pragma once

#include <cstdint>
#include <map>
#include <vector>

namespace quay {

class IPortProber {
public:
    virtual ~IPortProber() = default;

    // Returns open/closed for every requested port. Timeouts and refusals
    // both report closed.
    virtual std::map<uint16_t, bool> probe(const std::vector<uint16_t>& ports) = 0;
};

} // namespace quay
