#ifndef UUID_BOOST_HPP
#define UUID_BOOST_HPP
#include "uuid.hpp"
#include <boost/uuid/uuid.hpp>
namespace UUID{
    // boost::uuids::uuid stores the same 16 octets in the same order,
    // so conversions are a plain copy in either direction.
    Uuid from_boost(const boost::uuids::uuid& uuid);
    boost::uuids::uuid to_boost(const Uuid& uuid);
}// UUID namespace
#endif
