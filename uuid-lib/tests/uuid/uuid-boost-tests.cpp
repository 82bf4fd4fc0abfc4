#include "uuid-boost-tests.hpp"
#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace tests{
    UuidBoostTests::UuidBoostTests(UuidBoostTests::RoundTrip)
      : passed_{false}
    {
        boost::uuids::random_generator gen;
        boost::uuids::uuid boost_uuid = gen();
        UUID::Uuid uuid = UUID::from_boost(boost_uuid);
        if(UUID::to_boost(uuid) != boost_uuid){
            return;
        }
        if(uuid.to_string() != boost::uuids::to_string(boost_uuid)){
            return;
        }
        if(uuid.version() != boost_uuid.version() || uuid.variant() != UUID::Variant::RFC4122){
            return;
        }

        UUID::Uuid ours = UUID::random_uuid();
        if(boost::uuids::to_string(UUID::to_boost(ours)) != ours.to_string()){
            return;
        }
        if(UUID::from_boost(UUID::to_boost(ours)) != ours){
            return;
        }
        if(!UUID::to_boost(UUID::Uuid()).is_nil()){
            return;
        }
        passed_ = true;
    }

    UuidBoostTests::UuidBoostTests(UuidBoostTests::NameSpaces)
      : passed_{false}
    {
        if(UUID::from_boost(boost::uuids::ns::dns()) != UUID::NameSpace_DNS
            || UUID::from_boost(boost::uuids::ns::url()) != UUID::NameSpace_URL
            || UUID::from_boost(boost::uuids::ns::oid()) != UUID::NameSpace_OID
            || UUID::from_boost(boost::uuids::ns::x500dn()) != UUID::NameSpace_X500)
        {
            return;
        }
        passed_ = true;
    }

    UuidBoostTests::UuidBoostTests(UuidBoostTests::NameGenerator)
      : passed_{false}
    {
        boost::uuids::name_generator_sha1 gen(boost::uuids::ns::url());
        boost::uuids::uuid expected = gen("https://cloudonix.io/uuid-test");
        if(UUID::to_boost(UUID::sha1_name_uuid(UUID::NameSpace_URL, "https://cloudonix.io/uuid-test")) != expected){
            return;
        }
        passed_ = true;
    }
}
