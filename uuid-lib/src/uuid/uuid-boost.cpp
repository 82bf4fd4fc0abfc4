#include "uuid-boost.hpp"
#include <algorithm>

namespace UUID{
    Uuid from_boost(const boost::uuids::uuid& uuid){
        std::array<unsigned char, Uuid::size> octets{};
        std::copy(uuid.begin(), uuid.end(), octets.begin());
        return Uuid(octets);
    }

    boost::uuids::uuid to_boost(const Uuid& uuid){
        std::array<unsigned char, Uuid::size> octets = uuid.bytes();
        boost::uuids::uuid tmp{};
        std::copy(octets.begin(), octets.end(), tmp.begin());
        return tmp;
    }
}
