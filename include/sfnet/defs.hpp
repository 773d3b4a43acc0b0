#ifndef SFNET_DEFS_HPP
#define SFNET_DEFS_HPP

#include <cstdlib>
#include <cstdint>

namespace sfnet {

    using count = uint64_t;
    using signed_count = int64_t;

}

#endif //SFNET_DEFS_HPP
