#include "uuid.hpp"
#include "uuid-digest.hpp"
#include "uuid-random.hpp"

namespace UUID{
    namespace {
        // Seconds from the start of the Gregorian calendar, 1582-10-15T00:00:00Z,
        // to the Unix epoch.
        constexpr std::int64_t GREGORIAN_OFFSET = 12219292800;

        std::vector<unsigned char> to_vector(const std::array<unsigned char, Uuid::size>& octets){
            return std::vector<unsigned char>(octets.begin(), octets.end());
        }

        // Name space octets followed by the name.
        std::vector<unsigned char> name_data(const Uuid& name_space, const std::vector<unsigned char>& name){
            std::vector<unsigned char> data = to_vector(name_space.bytes());
            data.insert(data.end(), name.begin(), name.end());
            return data;
        }
    }

    Uuid::Uuid(Uuid::Version4)
      : Uuid(Variant::RFC4122, 4, random::bytes(Uuid::size))
    {}

    Uuid::Uuid(Uuid::Version1)
      : Uuid(Uuid::v1, std::chrono::system_clock::now())
    {}

    Uuid Uuid::from_unix_time(std::int64_t seconds, std::int64_t nanoseconds){
        // Only 10000 ticks are counted per second while the sub second part is
        // in 100 ns units. Existing v1 UUIDs depend on this, keep it.
        const std::int64_t elapsed = seconds + GREGORIAN_OFFSET;
        std::uint64_t timestamp = static_cast<std::uint64_t>(elapsed * 10000 + nanoseconds / 100);
        const std::uint64_t time_low = timestamp & 0xffffffff;
        timestamp >>= 32;
        const std::uint64_t time_mid = timestamp & 0xffff;
        timestamp >>= 16;
        const std::uint64_t time_hi = timestamp & 0x0fff;

        const random::GenerationState& state = random::state();
        const Uuid fields(
            time_low << 32 | time_mid << 16 | time_hi,
            (state.clock_sequence & 0xffff) << 48 | (state.node & 0x0000ffffffffffffULL)
        );
        return Uuid(Variant::RFC4122, 1, to_vector(fields.bytes()));
    }

    Uuid::Uuid(Uuid::Version3, const Uuid& name_space, const std::vector<unsigned char>& name)
      : Uuid(Variant::RFC4122, 3, digest::md5(name_data(name_space, name)))
    {}

    Uuid::Uuid(Uuid::Version3, const Uuid& name_space, const std::string& name)
      : Uuid(Uuid::v3, name_space, std::vector<unsigned char>(name.begin(), name.end()))
    {}

    // The SHA1 digest is 20 bytes, only the first 16 are used.
    Uuid::Uuid(Uuid::Version5, const Uuid& name_space, const std::vector<unsigned char>& name)
      : Uuid(Variant::RFC4122, 5, digest::sha1(name_data(name_space, name)))
    {}

    Uuid::Uuid(Uuid::Version5, const Uuid& name_space, const std::string& name)
      : Uuid(Uuid::v5, name_space, std::vector<unsigned char>(name.begin(), name.end()))
    {}

    Uuid random_uuid(){
        return Uuid(Uuid::v4);
    }

    Uuid time_based_uuid(){
        return Uuid(Uuid::v1);
    }

    Uuid md5_name_uuid(const Uuid& name_space, const std::string& name){
        return Uuid(Uuid::v3, name_space, name);
    }

    Uuid md5_name_uuid(const Uuid& name_space, const std::vector<unsigned char>& name){
        return Uuid(Uuid::v3, name_space, name);
    }

    Uuid sha1_name_uuid(const Uuid& name_space, const std::string& name){
        return Uuid(Uuid::v5, name_space, name);
    }

    Uuid sha1_name_uuid(const Uuid& name_space, const std::vector<unsigned char>& name){
        return Uuid(Uuid::v5, name_space, name);
    }
}
